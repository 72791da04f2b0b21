/**
 * @file CountryScore.hpp
 * @brief Country Instability Index (CII) result for one country.
 */

#pragma once

#include <string>
#include "domain/Clock.hpp"

namespace worldpulse::domain {

enum class InstabilityLevel {
    Low,
    Normal,
    Elevated,
    High,
    Critical
};

inline std::string InstabilityLevelToString(InstabilityLevel level) {
    switch (level) {
        case InstabilityLevel::Low: return "low";
        case InstabilityLevel::Normal: return "normal";
        case InstabilityLevel::Elevated: return "elevated";
        case InstabilityLevel::High: return "high";
        case InstabilityLevel::Critical: return "critical";
    }
    return "low";
}

/** @brief Band of a 0..100 composite: 81+ critical, 66+ high, 51+ elevated, 31+ normal. */
inline InstabilityLevel InstabilityLevelForScore(int score) {
    if (score >= 81) return InstabilityLevel::Critical;
    if (score >= 66) return InstabilityLevel::High;
    if (score >= 51) return InstabilityLevel::Elevated;
    if (score >= 31) return InstabilityLevel::Normal;
    return InstabilityLevel::Low;
}

enum class ScoreTrend {
    Rising,
    Stable,
    Falling
};

inline std::string ScoreTrendToString(ScoreTrend trend) {
    switch (trend) {
        case ScoreTrend::Rising: return "rising";
        case ScoreTrend::Stable: return "stable";
        case ScoreTrend::Falling: return "falling";
    }
    return "stable";
}

/**
 * @struct CountryScore
 * @brief Sub-scores are clamped to [0,100]; composite already has the floor applied.
 */
struct CountryScore {
    std::string countryCode;
    std::string countryName;
    int unrest = 0;
    int security = 0;
    int information = 0;
    int composite = 0;
    InstabilityLevel level = InstabilityLevel::Low;
    ScoreTrend trend = ScoreTrend::Stable;
    int change = 0;                     ///< Composite delta against the previous cycle.
    bool hasPrevious = false;
    Timestamp computedAt{};
};

} // namespace worldpulse::domain
