/**
 * @file JsonBaselineStore.hpp
 * @brief BaselineStore persisted as a single JSON document.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "domain/BaselineStore.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace worldpulse::infrastructure {

/**
 * @class JsonBaselineStore
 * @brief Keeps every baseline in memory and rewrites baselines.json through the PersistenceService.
 */
class JsonBaselineStore : public domain::BaselineStore {
public:
    JsonBaselineStore(const std::string& filePath, std::shared_ptr<PersistenceService> persistence);

    domain::Baseline get(const std::string& metricKey) const override;
    void put(const domain::Baseline& baseline) override;
    void putAll(const std::map<std::string, domain::Baseline>& baselines) override;

    /** @brief Replaces the in-memory map with the file contents. A missing file means first run. */
    void load();

    std::size_t size() const;
    const std::string& path() const { return m_filePath; }

private:
    void persistLocked();

    std::string m_filePath;
    std::shared_ptr<PersistenceService> m_persistence;
    mutable std::mutex m_mutex;
    std::map<std::string, domain::Baseline> m_baselines;
};

} // namespace worldpulse::infrastructure
