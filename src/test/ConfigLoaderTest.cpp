#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "domain/GeoEvent.hpp"
#include "domain/MalformedConfiguration.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/InputBatchReader.hpp"
#include "infrastructure/JsonCodec.hpp"

using namespace worldpulse::domain;
using namespace worldpulse::infrastructure;

namespace {

bool RejectsSettings(const std::string& text) {
    try {
        ConfigLoader::FromJsonText(text);
    } catch (const MalformedConfiguration& e) {
        std::cout << "  rejected: " << e.what() << std::endl;
        return true;
    }
    return false;
}

void WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Config Loader Test..." << std::endl;

    // 1. Defaults and overrides
    AppSettings defaults = ConfigLoader::FromJsonText("{}");
    assert(defaults.analysis.similarityThreshold == 0.5);
    assert(defaults.analysis.monitoredCountries.size() == 20);
    assert(defaults.analysis.countryFloors.at("UA") == 55);
    assert(!defaults.http.enabled);

    AppSettings custom = ConfigLoader::FromJsonText(R"({
        "similarityThreshold": 0.4,
        "monitoredCountries": ["ua", "ru"],
        "countryFloors": {"ua": 60},
        "http": {"enabled": true, "port": 9000},
        "sourceTiers": {"reuters": 1}
    })");
    assert(custom.analysis.similarityThreshold == 0.4);
    assert(custom.analysis.monitoredCountries == (std::vector<std::string>{"UA", "RU"}));
    assert(custom.analysis.countryFloors.size() == 1 && custom.analysis.countryFloors.at("UA") == 60);
    assert(custom.http.enabled && custom.http.port == 9000 && custom.http.host == "127.0.0.1");
    assert(custom.sourceTiers.at("reuters") == 1);
    std::cout << "[PASS] Settings parsed" << std::endl;

    // 2. Malformed settings are reported, never half-applied
    assert(RejectsSettings("{ not json"));
    assert(RejectsSettings("[1, 2]"));
    assert(RejectsSettings(R"({"similarityThreshold": "high"})"));
    assert(RejectsSettings(R"({"similarityThreshold": 1.5})"));
    assert(RejectsSettings(R"({"countryFloors": {"UA": 140}})"));
    assert(RejectsSettings(R"({"cycleTimeoutSeconds": 0})"));
    assert(RejectsSettings(R"({"cellSizeDeg": 0.0001})"));
    assert(RejectsSettings(R"({"cellSizeDeg": 0})"));
    assert(RejectsSettings(R"({"refreshIntervalSeconds": 1e12})"));
    assert(RejectsSettings(R"({"baselineMinSamples": 6.5})"));
    assert(RejectsSettings(R"({"sourceTiers": {"reuters": 9999999999}})"));
    assert(RejectsSettings(R"({"countryFloors": {"UA": 55.5}})"));
    std::cout << "[PASS] Malformed settings rejected" << std::endl;

    // 3. Timestamps
    const Timestamp t0 = FromEpochMillis(1760000000000);
    assert(codec::FormatTimestamp(t0) == "2025-10-09T08:53:20.000Z");
    assert(codec::ParseTimestamp(nlohmann::json("2025-10-09T08:53:20Z")) == t0);
    assert(codec::ParseTimestamp(nlohmann::json("2025-10-09T08:53:20.250Z")) == t0 + std::chrono::milliseconds(250));
    assert(codec::ParseTimestamp(nlohmann::json(1760000000000LL)) == t0);
    assert(!codec::ParseTimestamp(nlohmann::json("yesterday")));
    assert(codec::ParseTimestamp(nlohmann::json("2025-10-09T10:53:20+02:00")) == t0);
    assert(codec::ParseTimestamp(nlohmann::json("2025-10-09T03:23:20-0530")) == t0);
    assert(codec::ParseTimestamp(nlohmann::json("2025-10-09T08:53:20")) == t0);
    assert(!codec::ParseTimestamp(nlohmann::json("2025-10-09T08:53:20 CEST")));
    assert(!codec::ParseTimestamp(nlohmann::json("2025-10-09T08:53:20+2")));
    assert(!codec::ParseTimestamp(nlohmann::json(1e300)));
    assert(!codec::ParseTimestamp(nlohmann::json(-5.0)));
    std::cout << "[PASS] Timestamp codec" << std::endl;

    // 4. Input batches skip bad records and apply source tiers
    std::filesystem::path dir = "test_input_root";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    WriteFile(dir / "news.json", R"([
        {"id": "n1", "title": "Broadcom AI Revenue Beats Estimates", "source": "reuters", "publishedAt": "2025-10-09T08:00:00Z"},
        {"id": "n2", "title": "Fed Holds Interest Rates Steady", "source": "reuters", "sourceTier": 3, "publishedAt": 1760000000000},
        {"id": "n3", "source": "reuters", "publishedAt": 1760000000000},
        {"id": "n4", "title": "No timestamp"},
        {"id": "n5", "title": "Tier Out Of Range", "sourceTier": 1e15, "publishedAt": 1760000000000}
    ])");
    WriteFile(dir / "markets.json", R"([{"symbol": "AVGO", "price": 1710.0, "changePercent": 2.5}, {"symbol": "XOM"}])");
    WriteFile(dir / "geo.json", R"([
        {"kind": "military_flight", "lat": 25.5, "lon": 121.5, "occurredAt": 1760000000000, "countryCode": "TW"},
        {"kind": "ufo", "lat": 1, "lon": 1, "occurredAt": 1760000000000},
        {"kind": "protest", "lat": 50.4, "lon": 30.5, "occurredAt": 1760000000000, "countryCode": "UA", "fatalities": 1e12},
        {"kind": "protest", "lat": 950.0, "lon": 30.5, "occurredAt": 1760000000000, "countryCode": "UA"}
    ])");
    WriteFile(dir / "detections.json", "{ broken");

    InputBatchReader reader(dir.string(), {{"reuters", 1}});
    auto input = reader.read(t0);
    assert(input.now == t0);
    assert(input.news.size() == 3);
    assert(input.news[0].sourceTier == 1);
    assert(input.news[1].sourceTier == 3);
    assert(input.news[2].sourceTier == 4);
    assert(input.quotes.size() == 1 && input.quotes[0].symbol == "AVGO");
    assert(input.geoEvents.size() == 2 && input.geoEvents[0].kind == GeoEventKind::MilitaryFlight);
    assert(input.geoEvents[1].fatalities == kMaxFatalities);
    assert(input.upstreamDetections.empty());

    InputBatchReader missing((dir / "absent").string());
    auto nothing = missing.read(t0);
    assert(nothing.news.empty() && nothing.quotes.empty() && nothing.geoEvents.empty());
    std::filesystem::remove_all(dir);
    std::cout << "[PASS] Input batch reader" << std::endl;

    // 5. Entity catalogue files
    std::filesystem::create_directories(dir);
    WriteFile(dir / "entities.json", R"({"entities": [
        {"id": "AVGO", "name": "Broadcom", "type": "company", "aliases": ["Broadcom"], "sector": "semiconductors"}
    ]})");
    auto records = ConfigLoader::LoadEntityCatalog((dir / "entities.json").string());
    assert(records.size() == 1 && records[0].displayName == "Broadcom");
    WriteFile(dir / "bad.json", R"([{"id": "X", "type": "planet", "aliases": ["Xylo"]}])");
    bool rejected = false;
    try {
        ConfigLoader::LoadEntityCatalog((dir / "bad.json").string());
    } catch (const MalformedConfiguration&) {
        rejected = true;
    }
    assert(rejected);
    std::filesystem::remove_all(dir);
    std::cout << "[PASS] Entity catalogue loading" << std::endl;

    std::cout << "[Test] Config Loader Test Completed Successfully." << std::endl;
    return 0;
}
