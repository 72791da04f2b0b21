/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <type_traits>
#include <nlohmann/json.hpp>
#include "application/ConvergenceGrid.hpp"
#include "domain/MalformedConfiguration.hpp"
#include "infrastructure/JsonCodec.hpp"

namespace worldpulse::infrastructure {

using json = nlohmann::json;
using domain::MalformedConfiguration;

namespace {

// Integers are read without narrowing: 1e12 or 2.5 where an int is expected is malformed.
int IntValue(const json& value, const std::string& key) {
    if (value.is_number_unsigned()) {
        if (value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            return static_cast<int>(value.get<std::uint64_t>());
        }
    } else if (value.is_number_integer()) {
        auto wide = value.get<std::int64_t>();
        if (wide >= std::numeric_limits<int>::min() && wide <= std::numeric_limits<int>::max()) {
            return static_cast<int>(wide);
        }
    }
    throw MalformedConfiguration(key + " must be an integer in the int range");
}

std::map<std::string, int> IntMap(const json& value, const std::string& key) {
    if (!value.is_object()) throw MalformedConfiguration(key + " must be an object");
    std::map<std::string, int> out;
    for (auto it = value.begin(); it != value.end(); ++it) {
        out[it.key()] = IntValue(it.value(), key + "." + it.key());
    }
    return out;
}

template<typename T>
void Read(const json& j, const char* key, T& target) {
    if (!j.contains(key)) return;
    if constexpr (std::is_same_v<T, int>) {
        target = IntValue(j.at(key), key);
    } else {
        target = j.at(key).get<T>();
    }
}

std::string UpperCode(std::string code) {
    std::transform(code.begin(), code.end(), code.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return code;
}

void Validate(const application::AnalysisConfig& c) {
    if (c.similarityThreshold <= 0.0 || c.similarityThreshold > 1.0) {
        throw MalformedConfiguration("similarityThreshold must be in (0, 1]");
    }
    if (!(c.cellSizeDeg >= application::ConvergenceGrid::kMinCellSizeDeg &&
          c.cellSizeDeg <= application::ConvergenceGrid::kMaxCellSizeDeg)) {
        throw MalformedConfiguration("cellSizeDeg must be in [0.01, 90]");
    }
    if (c.convergenceWindowHours <= 0) throw MalformedConfiguration("convergenceWindowHours must be positive");
    if (c.baselineMinSamples < 2) throw MalformedConfiguration("baselineMinSamples must be at least 2");
    if (c.cycleTimeoutSeconds <= 0) throw MalformedConfiguration("cycleTimeoutSeconds must be positive");
    if (c.refreshIntervalSeconds <= 0) throw MalformedConfiguration("refreshIntervalSeconds must be positive");
    if (c.minSignalConfidence < 0.0 || c.minSignalConfidence > 1.0) {
        throw MalformedConfiguration("minSignalConfidence must be in [0, 1]");
    }
    if (c.newsVolumeDampingThreshold <= 0.0) throw MalformedConfiguration("newsVolumeDampingThreshold must be positive");
    for (const auto& [code, minimum] : c.countryFloors) {
        if (minimum < 0 || minimum > 100) throw MalformedConfiguration("floor of " + code + " must be in [0, 100]");
    }
}

} // namespace

AppSettings ConfigLoader::FromJsonText(const std::string& text) {
    AppSettings settings;
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw MalformedConfiguration(std::string("settings.json is not valid JSON: ") + e.what());
    }
    if (!j.is_object()) throw MalformedConfiguration("settings.json must hold an object");

    try {
        auto& a = settings.analysis;
        Read(j, "similarityThreshold", a.similarityThreshold);
        Read(j, "marketMoveThresholdPct", a.marketMoveThresholdPct);
        Read(j, "flowPriceThresholdPct", a.flowPriceThresholdPct);
        Read(j, "energySymbols", a.energySymbols);
        Read(j, "baselineMinSamples", a.baselineMinSamples);
        Read(j, "spikeZ", a.spikeZ);
        Read(j, "elevatedZ", a.elevatedZ);
        Read(j, "quietZ", a.quietZ);
        Read(j, "cellSizeDeg", a.cellSizeDeg);
        Read(j, "convergenceWindowHours", a.convergenceWindowHours);
        Read(j, "newsVolumeDampingThreshold", a.newsVolumeDampingThreshold);
        Read(j, "ciiChangeAlertThreshold", a.ciiChangeAlertThreshold);
        Read(j, "learningModeMinutes", a.learningModeMinutes);
        Read(j, "minSignalConfidence", a.minSignalConfidence);
        Read(j, "velocitySpikeThreshold", a.velocitySpikeThreshold);
        Read(j, "sourceConvergenceMinTypes", a.sourceConvergenceMinTypes);
        Read(j, "cycleTimeoutSeconds", a.cycleTimeoutSeconds);
        Read(j, "refreshIntervalSeconds", a.refreshIntervalSeconds);

        if (j.contains("monitoredCountries")) {
            a.monitoredCountries.clear();
            for (const auto& code : j.at("monitoredCountries").get<std::vector<std::string>>()) {
                a.monitoredCountries.push_back(UpperCode(code));
            }
        }
        if (j.contains("countryFloors")) {
            a.countryFloors.clear();
            for (const auto& [code, minimum] : IntMap(j.at("countryFloors"), "countryFloors")) {
                a.countryFloors[UpperCode(code)] = minimum;
            }
        }

        Read(j, "stateDir", settings.stateDir);
        Read(j, "inputDir", settings.inputDir);
        Read(j, "entityCatalog", settings.entityCatalog);
        if (j.contains("sourceTiers")) settings.sourceTiers = IntMap(j.at("sourceTiers"), "sourceTiers");
        if (j.contains("http")) {
            const auto& http = j.at("http");
            Read(http, "enabled", settings.http.enabled);
            Read(http, "host", settings.http.host);
            Read(http, "port", settings.http.port);
        }
    } catch (const json::exception& e) {
        throw MalformedConfiguration(std::string("settings.json has a wrongly typed value: ") + e.what());
    }

    Validate(settings.analysis);
    return settings;
}

AppSettings ConfigLoader::Load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        std::cout << "[ConfigLoader] " << path << " not found, using defaults." << std::endl;
        return AppSettings{};
    }

    std::ifstream f(path);
    if (!f.is_open()) throw MalformedConfiguration("cannot open " + path);
    std::stringstream buffer;
    buffer << f.rdbuf();
    AppSettings settings = FromJsonText(buffer.str());
    std::cout << "[ConfigLoader] Loaded " << path << std::endl;
    return settings;
}

std::vector<domain::EntityRecord> ConfigLoader::LoadEntityCatalog(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) throw MalformedConfiguration("entity catalogue " + path + " cannot be opened");

    json j;
    try {
        j = json::parse(f);
    } catch (const json::parse_error& e) {
        throw MalformedConfiguration("entity catalogue " + path + " is not valid JSON: " + e.what());
    }

    const json* entries = &j;
    if (j.is_object() && j.contains("entities")) entries = &j["entities"];
    if (!entries->is_array()) throw MalformedConfiguration("entity catalogue must hold an 'entities' array");

    std::vector<domain::EntityRecord> records;
    records.reserve(entries->size());
    for (const auto& entry : *entries) {
        records.push_back(codec::EntityRecordFromJson(entry));
    }
    std::cout << "[ConfigLoader] Loaded " << records.size() << " entities from " << path << std::endl;
    return records;
}

} // namespace worldpulse::infrastructure
