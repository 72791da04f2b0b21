/**
 * @file JsonBaselineStore.cpp
 * @brief Implementation of JsonBaselineStore.
 */

#include "infrastructure/JsonBaselineStore.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "infrastructure/JsonCodec.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace worldpulse::infrastructure {

JsonBaselineStore::JsonBaselineStore(const std::string& filePath, std::shared_ptr<PersistenceService> persistence)
    : m_filePath(filePath), m_persistence(std::move(persistence)) {}

domain::Baseline JsonBaselineStore::get(const std::string& metricKey) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_baselines.find(metricKey);
    if (it != m_baselines.end()) return it->second;
    domain::Baseline empty;
    empty.metricKey = metricKey;
    return empty;
}

void JsonBaselineStore::put(const domain::Baseline& baseline) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_baselines[baseline.metricKey] = baseline;
    persistLocked();
}

void JsonBaselineStore::putAll(const std::map<std::string, domain::Baseline>& baselines) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& [key, baseline] : baselines) {
        m_baselines[key] = baseline;
        m_baselines[key].metricKey = key;
    }
    persistLocked();
}

std::size_t JsonBaselineStore::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_baselines.size();
}

void JsonBaselineStore::persistLocked() {
    if (!m_persistence || m_filePath.empty()) return;
    json j = json::object();
    for (const auto& [key, baseline] : m_baselines) {
        j[key] = codec::BaselineToJson(baseline);
    }
    m_persistence->saveTextAsync(m_filePath, j.dump(2));
}

void JsonBaselineStore::load() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_baselines.clear();
    if (m_filePath.empty() || !fs::exists(m_filePath)) return;

    std::ifstream f(m_filePath);
    if (!f.is_open()) {
        std::cerr << "[JsonBaselineStore] Cannot open " << m_filePath << std::endl;
        return;
    }

    try {
        json j = json::parse(f);
        for (auto it = j.begin(); it != j.end(); ++it) {
            auto baseline = codec::BaselineFromJson(it.value());
            if (!baseline) {
                std::cerr << "[JsonBaselineStore] Skipping malformed baseline '" << it.key() << "'" << std::endl;
                continue;
            }
            baseline->metricKey = it.key();
            m_baselines[it.key()] = std::move(*baseline);
        }
        std::cout << "[JsonBaselineStore] Restored " << m_baselines.size() << " baselines." << std::endl;
    } catch (const json::exception& e) {
        std::cerr << "[JsonBaselineStore] Error reading " << m_filePath << ": " << e.what()
                  << ". Starting with empty baselines." << std::endl;
        m_baselines.clear();
    }
}

} // namespace worldpulse::infrastructure
