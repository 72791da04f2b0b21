/**
 * @file JsonCodec.cpp
 * @brief Implementation of the JSON codec.
 */

#include "infrastructure/JsonCodec.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <limits>
#include <string>
#include <sstream>
#include "domain/MalformedConfiguration.hpp"

namespace worldpulse::infrastructure::codec {

using namespace worldpulse::domain;

namespace {

// 1970-01-01 to 9999-12-31, the range FormatTimestamp can print.
constexpr double kMinEpochMillis = 0.0;
constexpr double kMaxEpochMillis = 253402300799999.0;

std::tm ToUtc(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return tm;
}

std::time_t FromUtc(std::tm* tm) {
#if defined(_WIN32)
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

std::string StringOr(const json& j, const char* key, const std::string& fallback = "") {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

std::optional<double> NumberOf(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return std::nullopt;
    double value = it->get<double>();
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

// Inputs are clamped before narrowing; NumberOf already rejected non-finite values.
int ClampedInt(double value, int lo, int hi) {
    return static_cast<int>(std::clamp(value, static_cast<double>(lo), static_cast<double>(hi)));
}

std::set<std::string> StringSet(const json& j, const char* key, const std::string& owner) {
    std::set<std::string> out;
    auto it = j.find(key);
    if (it == j.end()) return out;
    if (!it->is_array()) {
        throw MalformedConfiguration("'" + std::string(key) + "' of entity '" + owner + "' must be an array");
    }
    for (const auto& v : *it) {
        if (!v.is_string()) {
            throw MalformedConfiguration("'" + std::string(key) + "' of entity '" + owner + "' must hold strings");
        }
        out.insert(v.get<std::string>());
    }
    return out;
}

json Details(const std::map<std::string, std::string>& details) {
    json j = json::object();
    for (const auto& [k, v] : details) j[k] = v;
    return j;
}

} // namespace

std::string FormatTimestamp(Timestamp t) {
    auto ms = ToEpochMillis(t);
    std::time_t seconds = static_cast<std::time_t>(ms / 1000);
    int millis = static_cast<int>(ms % 1000);
    if (millis < 0) {
        millis += 1000;
        seconds -= 1;
    }
    std::tm tm = ToUtc(seconds);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3) << std::setfill('0') << millis << "Z";
    return oss.str();
}

std::optional<Timestamp> ParseTimestamp(const json& value) {
    if (value.is_number()) {
        double ms = value.get<double>();
        if (!std::isfinite(ms) || ms < kMinEpochMillis || ms > kMaxEpochMillis) return std::nullopt;
        return FromEpochMillis(static_cast<std::int64_t>(ms));
    }
    if (!value.is_string()) return std::nullopt;

    std::string text = value.get<std::string>();
    std::tm tm = {};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) return std::nullopt;

    int millis = 0;
    if (iss.peek() == '.') {
        iss.get();
        std::string fraction;
        while (std::isdigit(iss.peek())) fraction.push_back(static_cast<char>(iss.get()));
        if (fraction.empty()) return std::nullopt;
        fraction = (fraction + "000").substr(0, 3);
        millis = std::stoi(fraction);
    }

    // Designator: Z, +HH:MM, -HH:MM, +HHMM or nothing (UTC). Anything else is rejected.
    int offsetMinutes = 0;
    int next = iss.peek();
    if (next == 'Z' || next == 'z') {
        iss.get();
    } else if (next == '+' || next == '-') {
        int sign = iss.get() == '-' ? -1 : 1;
        std::string digits;
        while (std::isdigit(iss.peek()) || iss.peek() == ':') {
            char c = static_cast<char>(iss.get());
            if (c != ':') digits.push_back(c);
        }
        if (digits.size() != 4) return std::nullopt;
        int hours = std::stoi(digits.substr(0, 2));
        int minutes = std::stoi(digits.substr(2, 2));
        if (hours > 14 || minutes > 59) return std::nullopt;
        offsetMinutes = sign * (hours * 60 + minutes);
    }
    if (iss.peek() != std::char_traits<char>::eof()) return std::nullopt;

    std::time_t seconds = FromUtc(&tm);
    if (seconds == static_cast<std::time_t>(-1)) return std::nullopt;
    std::int64_t ms = (static_cast<std::int64_t>(seconds) - offsetMinutes * 60LL) * 1000 + millis;
    if (ms < kMinEpochMillis || ms > kMaxEpochMillis) return std::nullopt;
    return FromEpochMillis(ms);
}

std::optional<NewsItem> NewsItemFromJson(const json& j) {
    if (!j.is_object()) return std::nullopt;
    NewsItem item;
    item.title = StringOr(j, "title");
    item.link = StringOr(j, "link");
    item.id = StringOr(j, "id", item.link);
    if (item.id.empty()) item.id = item.title;
    if (item.title.empty() || item.id.empty()) return std::nullopt;

    auto published = j.contains("publishedAt") ? ParseTimestamp(j["publishedAt"]) : std::nullopt;
    if (!published) return std::nullopt;
    item.publishedAt = *published;

    item.sourceId = StringOr(j, "source", StringOr(j, "sourceId"));
    item.category = StringOr(j, "category", "general");
    if (auto tier = NumberOf(j, "sourceTier")) {
        item.sourceTier = ClampedInt(*tier, 1, 4);
    }
    item.sourceType = SourceTypeFromString(StringOr(j, "sourceType", "other")).value_or(SourceType::Other);
    if (j.contains("isAlert") && j["isAlert"].is_boolean()) item.isAlert = j["isAlert"].get<bool>();
    return item;
}

std::optional<MarketQuote> MarketQuoteFromJson(const json& j) {
    if (!j.is_object()) return std::nullopt;
    MarketQuote quote;
    quote.symbol = StringOr(j, "symbol");
    auto change = NumberOf(j, "changePercent");
    if (quote.symbol.empty() || !change) return std::nullopt;
    quote.changePercent = *change;
    quote.name = StringOr(j, "name");
    quote.price = NumberOf(j, "price").value_or(0.0);
    if (j.contains("timestamp")) {
        if (auto ts = ParseTimestamp(j["timestamp"])) quote.timestamp = *ts;
    }
    return quote;
}

std::optional<GeoEvent> GeoEventFromJson(const json& j) {
    if (!j.is_object()) return std::nullopt;
    auto kind = GeoEventKindFromString(StringOr(j, "kind"));
    auto lat = NumberOf(j, "lat");
    auto lon = NumberOf(j, "lon");
    auto occurred = j.contains("occurredAt") ? ParseTimestamp(j["occurredAt"]) : std::nullopt;
    if (!kind || !lat || !lon || !occurred) return std::nullopt;
    if (std::fabs(*lat) > 90.0 || std::fabs(*lon) > 180.0) return std::nullopt;

    GeoEvent event;
    event.kind = *kind;
    event.lat = *lat;
    event.lon = *lon;
    event.occurredAt = *occurred;
    std::string country = StringOr(j, "countryCode");
    if (!country.empty()) event.countryCode = country;
    event.fatalities = ClampedInt(NumberOf(j, "fatalities").value_or(0.0), 0, kMaxFatalities);
    event.severity = EventSeverityFromString(StringOr(j, "severity", "low")).value_or(EventSeverity::Low);
    event.label = StringOr(j, "label");
    return event;
}

std::optional<Detection> DetectionFromJson(const json& j) {
    if (!j.is_object()) return std::nullopt;
    auto kind = SignalKindFromString(StringOr(j, "kind"));
    std::string subject = StringOr(j, "subjectKey");
    if (!kind || subject.empty()) return std::nullopt;

    Detection d;
    d.kind = *kind;
    d.subjectKey = subject;
    d.severity = SeverityFromString(StringOr(j, "severity", "medium")).value_or(Severity::Medium);
    d.confidence = NumberOf(j, "confidence");
    d.title = StringOr(j, "title");
    d.description = StringOr(j, "description");
    if (j.contains("details") && j["details"].is_object()) {
        for (auto it = j["details"].begin(); it != j["details"].end(); ++it) {
            d.details[it.key()] = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
        }
    }
    if (j.contains("occurredAt")) {
        if (auto ts = ParseTimestamp(j["occurredAt"])) d.occurredAt = *ts;
    }
    return d;
}

EntityRecord EntityRecordFromJson(const json& j) {
    if (!j.is_object()) throw MalformedConfiguration("entity entries must be objects");
    EntityRecord record;
    record.id = StringOr(j, "id");
    record.displayName = StringOr(j, "name", record.id);
    std::string type = StringOr(j, "type");
    auto parsed = EntityTypeFromString(type);
    if (!parsed) throw MalformedConfiguration("entity '" + record.id + "' has unknown type '" + type + "'");
    record.type = *parsed;
    record.aliases = StringSet(j, "aliases", record.id);
    record.keywords = StringSet(j, "keywords", record.id);
    record.sector = StringOr(j, "sector");
    record.relatedIds = StringSet(j, "related", record.id);
    return record;
}

json BaselineToJson(const Baseline& baseline) {
    json samples = json::array();
    for (const auto& s : baseline.samples) {
        samples.push_back({{"at", ToEpochMillis(s.at)}, {"value", s.value}});
    }
    auto stats = [](const RollingStats& r) {
        return json{{"mean", r.mean}, {"stddev", r.stddev}, {"sampleCount", r.sampleCount}};
    };
    return json{
        {"metricKey", baseline.metricKey},
        {"windowShort", stats(baseline.windowShort)},
        {"windowLong", stats(baseline.windowLong)},
        {"lastUpdated", ToEpochMillis(baseline.lastUpdated)},
        {"samples", samples}
    };
}

std::optional<Baseline> BaselineFromJson(const json& j) {
    if (!j.is_object() || !j.contains("samples") || !j["samples"].is_array()) return std::nullopt;
    Baseline baseline;
    baseline.metricKey = StringOr(j, "metricKey");
    for (const auto& s : j["samples"]) {
        if (!s.is_object()) continue;
        auto at = s.contains("at") ? ParseTimestamp(s["at"]) : std::nullopt;
        auto value = NumberOf(s, "value");
        if (at && value) baseline.samples.push_back(BaselineSample{*at, *value});
    }
    auto stats = [](const json& r) {
        RollingStats out;
        if (!r.is_object()) return out;
        out.mean = NumberOf(r, "mean").value_or(0.0);
        out.stddev = NumberOf(r, "stddev").value_or(0.0);
        out.sampleCount = ClampedInt(NumberOf(r, "sampleCount").value_or(0.0), 0, std::numeric_limits<int>::max());
        return out;
    };
    if (j.contains("windowShort")) baseline.windowShort = stats(j["windowShort"]);
    if (j.contains("windowLong")) baseline.windowLong = stats(j["windowLong"]);
    if (j.contains("lastUpdated")) {
        if (auto ts = ParseTimestamp(j["lastUpdated"])) baseline.lastUpdated = *ts;
    }
    return baseline;
}

json ToJson(const NewsCluster& cluster) {
    json members = json::array();
    for (const auto& m : cluster.members) {
        members.push_back({
            {"id", m.id},
            {"source", m.sourceId},
            {"title", m.title},
            {"link", m.link},
            {"tier", m.sourceTier},
            {"sourceType", SourceTypeToString(m.sourceType)},
            {"publishedAt", FormatTimestamp(m.publishedAt)}
        });
    }
    return json{
        {"id", cluster.id},
        {"primaryItemId", cluster.primaryItemId},
        {"primaryTitle", cluster.primaryTitle},
        {"primarySource", cluster.primarySource},
        {"primaryLink", cluster.primaryLink},
        {"sourceCount", cluster.members.size()},
        {"topSources", cluster.topSources},
        {"tokens", cluster.tokens},
        {"firstSeenAt", FormatTimestamp(cluster.firstSeenAt)},
        {"lastUpdatedAt", FormatTimestamp(cluster.lastUpdatedAt)},
        {"velocityPerHour", cluster.velocityPerHour},
        {"trend", ClusterTrendToString(cluster.trend)},
        {"isAlert", cluster.isAlert},
        {"members", members}
    };
}

json ToJson(const CorrelationResult& c) {
    json j{
        {"symbol", c.symbol},
        {"movePercent", c.movePercent},
        {"status", CorrelationStatusToString(c.status)},
        {"confidence", c.confidence}
    };
    if (c.entityId) j["entityId"] = *c.entityId;
    if (c.clusterId) j["clusterId"] = *c.clusterId;
    if (c.headline) j["headline"] = *c.headline;
    if (c.matchedTerm) j["matchedTerm"] = *c.matchedTerm;
    if (c.matchKind) j["matchKind"] = MatchKindToString(*c.matchKind);
    return j;
}

json ToJson(const ConvergenceAlert& alert) {
    json kinds = json::object();
    for (const auto& [kind, count] : alert.eventsByKind) kinds[GeoEventKindToString(kind)] = count;
    return json{
        {"cellId", alert.cellId},
        {"centerLat", alert.centerLat},
        {"centerLon", alert.centerLon},
        {"distinctKinds", alert.distinctKinds},
        {"totalEvents", alert.totalEvents},
        {"eventsByKind", kinds},
        {"score", alert.score},
        {"level", ConvergenceLevelToString(alert.level)},
        {"countries", alert.countries},
        {"windowStart", FormatTimestamp(alert.windowStart)},
        {"windowEnd", FormatTimestamp(alert.windowEnd)}
    };
}

json ToJson(const CountryScore& s) {
    return json{
        {"countryCode", s.countryCode},
        {"countryName", s.countryName},
        {"unrest", s.unrest},
        {"security", s.security},
        {"information", s.information},
        {"composite", s.composite},
        {"level", InstabilityLevelToString(s.level)},
        {"trend", ScoreTrendToString(s.trend)},
        {"change", s.change},
        {"computedAt", FormatTimestamp(s.computedAt)}
    };
}

json ToJson(const Signal& s) {
    return json{
        {"id", s.id},
        {"kind", SignalKindToString(s.kind)},
        {"subjectKey", s.subjectKey},
        {"confidence", s.confidence},
        {"severity", SeverityToString(s.severity)},
        {"firstFiredAt", FormatTimestamp(s.firstFiredAt)},
        {"title", s.title},
        {"description", s.description},
        {"details", Details(s.details)}
    };
}

json ToJson(const StrategicRiskOverview& o) {
    return json{
        {"compositeScore", o.compositeScore},
        {"trend", RiskTrendToString(o.trend)},
        {"convergenceAlerts", o.convergenceAlerts},
        {"infrastructureIncidents", o.infrastructureIncidents},
        {"topCountryScore", o.topCountryScore},
        {"unstableCountries", o.unstableCountries},
        {"topRisks", o.topRisks},
        {"topConvergenceZones", o.topConvergenceZones},
        {"computedAt", FormatTimestamp(o.computedAt)}
    };
}

json ToJson(const application::MetricDeviation& d) {
    json j{
        {"metricKey", d.metricKey},
        {"current", d.current},
        {"level", DeviationLevelToString(d.deviation.level)},
        {"mean", d.deviation.mean},
        {"stddev", d.deviation.stddev},
        {"sampleCount", d.deviation.sampleCount}
    };
    if (d.deviation.zScore) j["zScore"] = *d.deviation.zScore;
    return j;
}

json ToJson(const application::CycleResult& r) {
    auto list = [](const auto& items) {
        json arr = json::array();
        for (const auto& item : items) arr.push_back(ToJson(item));
        return arr;
    };
    json j{
        {"status", application::CycleStatusToString(r.status)},
        {"startedAt", FormatTimestamp(r.startedAt)},
        {"completedAt", FormatTimestamp(r.completedAt)},
        {"learningMode", r.learningMode},
        {"signals", list(r.signals)},
        {"countryScores", list(r.countryScores)},
        {"clusters", list(r.clusters)},
        {"correlations", list(r.correlations)},
        {"convergence", list(r.convergence)},
        {"deviations", list(r.deviations)},
        {"overview", ToJson(r.overview)}
    };
    if (!r.error.empty()) j["error"] = r.error;
    return j;
}

} // namespace worldpulse::infrastructure::codec
