/**
 * @file StrategicRisk.hpp
 * @brief Global risk overview combining convergence, CII and infrastructure incidents.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/Clock.hpp"

namespace worldpulse::domain {

enum class RiskTrend {
    Escalating,
    Stable,
    DeEscalating
};

inline std::string RiskTrendToString(RiskTrend trend) {
    switch (trend) {
        case RiskTrend::Escalating: return "escalating";
        case RiskTrend::Stable: return "stable";
        case RiskTrend::DeEscalating: return "de-escalating";
    }
    return "stable";
}

struct StrategicRiskOverview {
    int compositeScore = 0;
    RiskTrend trend = RiskTrend::Stable;
    int convergenceAlerts = 0;
    int infrastructureIncidents = 0;
    int topCountryScore = 0;
    int unstableCountries = 0;          ///< Countries at elevated level or above.
    std::vector<std::string> topRisks;  ///< Human-readable, at most three.
    std::vector<std::string> topConvergenceZones;
    Timestamp computedAt{};
};

} // namespace worldpulse::domain
