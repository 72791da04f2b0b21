/**
 * @file GeoEvent.hpp
 * @brief Geolocated events and the derived convergence grid records.
 */

#pragma once

#include <string>
#include <map>
#include <set>
#include <vector>
#include <optional>
#include "domain/Clock.hpp"

namespace worldpulse::domain {

/**
 * @enum GeoEventKind
 * @brief Closed set of event kinds the grid can co-locate.
 */
enum class GeoEventKind {
    Protest,
    MilitaryFlight,
    MilitaryVessel,
    Earthquake,
    Outage
};

inline std::string GeoEventKindToString(GeoEventKind kind) {
    switch (kind) {
        case GeoEventKind::Protest: return "protest";
        case GeoEventKind::MilitaryFlight: return "military_flight";
        case GeoEventKind::MilitaryVessel: return "military_vessel";
        case GeoEventKind::Earthquake: return "earthquake";
        case GeoEventKind::Outage: return "outage";
    }
    return "protest";
}

inline std::optional<GeoEventKind> GeoEventKindFromString(const std::string& value) {
    if (value == "protest") return GeoEventKind::Protest;
    if (value == "military_flight") return GeoEventKind::MilitaryFlight;
    if (value == "military_vessel") return GeoEventKind::MilitaryVessel;
    if (value == "earthquake") return GeoEventKind::Earthquake;
    if (value == "outage") return GeoEventKind::Outage;
    return std::nullopt;
}

enum class EventSeverity {
    Low,
    Medium,
    High
};

inline std::string EventSeverityToString(EventSeverity severity) {
    switch (severity) {
        case EventSeverity::Low: return "low";
        case EventSeverity::Medium: return "medium";
        case EventSeverity::High: return "high";
    }
    return "low";
}

inline std::optional<EventSeverity> EventSeverityFromString(const std::string& value) {
    if (value == "low") return EventSeverity::Low;
    if (value == "medium") return EventSeverity::Medium;
    if (value == "high") return EventSeverity::High;
    return std::nullopt;
}

/** @brief Upper bound on fatalities carried by one event or summed per country. */
constexpr int kMaxFatalities = 1000000;

/**
 * @struct GeoEvent
 * @brief Upstream event with a position. Read-only to the analysis core.
 */
struct GeoEvent {
    GeoEventKind kind = GeoEventKind::Protest;
    double lat = 0.0;
    double lon = 0.0;
    Timestamp occurredAt{};
    std::optional<std::string> countryCode; ///< ISO 3166-1 alpha-2, when attributed.
    int fatalities = 0;                     ///< Unrest events only.
    EventSeverity severity = EventSeverity::Low;
    std::string label;                      ///< Free-text description for display.
};

/** @brief Integer grid coordinates of a cell. */
struct CellKey {
    int latIndex = 0;
    int lonIndex = 0;

    bool operator<(const CellKey& other) const {
        if (latIndex != other.latIndex) return latIndex < other.latIndex;
        return lonIndex < other.lonIndex;
    }
    bool operator==(const CellKey& other) const {
        return latIndex == other.latIndex && lonIndex == other.lonIndex;
    }
};

/**
 * @struct GeoCell
 * @brief Events that fell into one grid cell during the trailing window.
 */
struct GeoCell {
    CellKey key;
    std::map<GeoEventKind, int> eventsByKind;
    std::set<std::string> countries;
    Timestamp windowStart{};
    Timestamp windowEnd{};

    int totalEvents() const {
        int total = 0;
        for (const auto& [kind, count] : eventsByKind) total += count;
        return total;
    }
};

enum class ConvergenceLevel {
    Medium,
    High,
    Critical
};

inline std::string ConvergenceLevelToString(ConvergenceLevel level) {
    switch (level) {
        case ConvergenceLevel::Medium: return "medium";
        case ConvergenceLevel::High: return "high";
        case ConvergenceLevel::Critical: return "critical";
    }
    return "medium";
}

/**
 * @struct ConvergenceAlert
 * @brief A cell where at least three distinct event kinds co-occur.
 */
struct ConvergenceAlert {
    std::string cellId;                 ///< "<latIndex>:<lonIndex>", also the dedup subject key.
    CellKey cellKey;
    double centerLat = 0.0;
    double centerLon = 0.0;
    int distinctKinds = 0;
    int totalEvents = 0;
    std::map<GeoEventKind, int> eventsByKind;
    int score = 0;
    ConvergenceLevel level = ConvergenceLevel::Medium;
    std::set<std::string> countries;
    Timestamp windowStart{};
    Timestamp windowEnd{};
};

} // namespace worldpulse::domain
