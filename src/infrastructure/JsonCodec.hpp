/**
 * @file JsonCodec.hpp
 * @brief nlohmann::json encoding and decoding of the domain records.
 */

#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "application/AnalysisPipeline.hpp"
#include "domain/Baseline.hpp"
#include "domain/EntityRecord.hpp"
#include "domain/GeoEvent.hpp"
#include "domain/MarketQuote.hpp"
#include "domain/NewsItem.hpp"
#include "domain/Signal.hpp"

namespace worldpulse::infrastructure::codec {

using json = nlohmann::json;

/** @brief UTC ISO-8601 with milliseconds, e.g. "2026-03-01T12:00:00.000Z". */
std::string FormatTimestamp(domain::Timestamp t);

/** @brief Accepts epoch milliseconds or an ISO-8601 UTC string. */
std::optional<domain::Timestamp> ParseTimestamp(const json& value);

// Inbound records. Malformed input yields nullopt; the caller decides whether to log.
std::optional<domain::NewsItem> NewsItemFromJson(const json& j);
std::optional<domain::MarketQuote> MarketQuoteFromJson(const json& j);
std::optional<domain::GeoEvent> GeoEventFromJson(const json& j);
std::optional<domain::Detection> DetectionFromJson(const json& j);

/** @brief Throws domain::MalformedConfiguration: the catalogue is configuration, not data. */
domain::EntityRecord EntityRecordFromJson(const json& j);

json BaselineToJson(const domain::Baseline& baseline);
std::optional<domain::Baseline> BaselineFromJson(const json& j);

json ToJson(const domain::NewsCluster& cluster);
json ToJson(const domain::CorrelationResult& correlation);
json ToJson(const domain::ConvergenceAlert& alert);
json ToJson(const domain::CountryScore& score);
json ToJson(const domain::Signal& signal);
json ToJson(const domain::StrategicRiskOverview& overview);
json ToJson(const application::MetricDeviation& deviation);

/** @brief Whole cycle snapshot as served by the HTTP publisher and printed by --once. */
json ToJson(const application::CycleResult& result);

} // namespace worldpulse::infrastructure::codec
