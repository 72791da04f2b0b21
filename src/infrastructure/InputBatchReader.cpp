/**
 * @file InputBatchReader.cpp
 * @brief Implementation of InputBatchReader.
 */

#include "infrastructure/InputBatchReader.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "infrastructure/JsonCodec.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace worldpulse::infrastructure {

namespace {

json ReadArray(const fs::path& path) {
    if (!fs::exists(path)) return json::array();
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[InputBatchReader] Cannot open " << path << std::endl;
        return json::array();
    }
    try {
        json j = json::parse(f);
        if (j.is_array()) return j;
        std::cerr << "[InputBatchReader] " << path << " does not hold an array, ignoring." << std::endl;
    } catch (const json::parse_error& e) {
        std::cerr << "[InputBatchReader] Error parsing " << path << ": " << e.what() << std::endl;
    }
    return json::array();
}

template<typename T, typename Decode>
std::vector<T> DecodeAll(const fs::path& path, Decode decode) {
    std::vector<T> out;
    int skipped = 0;
    for (const auto& entry : ReadArray(path)) {
        if (auto value = decode(entry)) {
            out.push_back(std::move(*value));
        } else {
            ++skipped;
        }
    }
    if (skipped > 0) {
        std::cerr << "[InputBatchReader] Skipped " << skipped << " malformed records in " << path << std::endl;
    }
    return out;
}

} // namespace

InputBatchReader::InputBatchReader(std::string inputDir, std::map<std::string, int> sourceTiers)
    : m_inputDir(std::move(inputDir)), m_sourceTiers(std::move(sourceTiers)) {}

application::CycleInput InputBatchReader::read(domain::Timestamp now) const {
    fs::path dir(m_inputDir);
    application::CycleInput input;
    input.now = now;

    input.news = DecodeAll<domain::NewsItem>(dir / "news.json", [this](const json& j) {
        auto item = codec::NewsItemFromJson(j);
        if (item && !j.contains("sourceTier")) {
            auto it = m_sourceTiers.find(item->sourceId);
            if (it != m_sourceTiers.end()) item->sourceTier = it->second;
        }
        return item;
    });
    input.quotes = DecodeAll<domain::MarketQuote>(dir / "markets.json", codec::MarketQuoteFromJson);
    input.geoEvents = DecodeAll<domain::GeoEvent>(dir / "geo.json", codec::GeoEventFromJson);
    input.upstreamDetections = DecodeAll<domain::Detection>(dir / "detections.json", codec::DetectionFromJson);
    return input;
}

} // namespace worldpulse::infrastructure
