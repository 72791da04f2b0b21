/**
 * @file StrategicRiskService.cpp
 * @brief Implementation of StrategicRiskService.
 */

#include "application/StrategicRiskService.hpp"
#include <algorithm>
#include <array>
#include <cmath>

namespace worldpulse::application {

using namespace worldpulse::domain;

namespace {

constexpr double kConvergenceWeight = 0.3;
constexpr double kCiiWeight = 0.5;
constexpr double kInfraWeight = 0.2;
constexpr std::array<double, 5> kTopWeights = {0.4, 0.25, 0.2, 0.1, 0.05};
constexpr std::size_t kMaxTopRisks = 3;

} // namespace

double StrategicRiskService::ciiComponent(const std::vector<CountryScore>& scores) {
    std::vector<int> composites;
    composites.reserve(scores.size());
    for (const auto& s : scores) composites.push_back(s.composite);
    std::sort(composites.rbegin(), composites.rend());

    double weighted = 0.0;
    for (std::size_t i = 0; i < composites.size() && i < kTopWeights.size(); ++i) {
        weighted += composites[i] * kTopWeights[i];
    }
    long elevated = std::count_if(composites.begin(), composites.end(), [](int c) { return c >= 50; });
    double bonus = std::min(20.0, elevated * 5.0);
    return std::min(100.0, weighted + bonus);
}

StrategicRiskOverview StrategicRiskService::compute(const std::vector<ConvergenceAlert>& alerts,
                                                    const std::vector<CountryScore>& scores,
                                                    const std::vector<GeoEvent>& events,
                                                    std::optional<int> previousComposite,
                                                    Timestamp now) const {
    StrategicRiskOverview overview;
    overview.computedAt = now;
    overview.convergenceAlerts = static_cast<int>(alerts.size());
    overview.infrastructureIncidents = static_cast<int>(std::count_if(
        events.begin(), events.end(), [](const GeoEvent& e) { return e.kind == GeoEventKind::Outage; }));

    double convergenceScore = std::min(100.0, overview.convergenceAlerts * 25.0);
    double ciiScore = ciiComponent(scores);
    double infraScore = std::min(100.0, overview.infrastructureIncidents * 25.0);
    overview.compositeScore = static_cast<int>(std::lround(
        convergenceScore * kConvergenceWeight + ciiScore * kCiiWeight + infraScore * kInfraWeight));

    if (previousComposite) {
        int delta = overview.compositeScore - *previousComposite;
        if (delta >= kTrendDelta) {
            overview.trend = RiskTrend::Escalating;
        } else if (delta <= -kTrendDelta) {
            overview.trend = RiskTrend::DeEscalating;
        }
    }

    std::vector<const CountryScore*> ranked;
    for (const auto& s : scores) ranked.push_back(&s);
    std::sort(ranked.begin(), ranked.end(), [](const CountryScore* a, const CountryScore* b) {
        if (a->composite != b->composite) return a->composite > b->composite;
        return a->countryCode < b->countryCode;
    });
    if (!ranked.empty()) overview.topCountryScore = ranked.front()->composite;
    overview.unstableCountries = static_cast<int>(std::count_if(scores.begin(), scores.end(), [](const CountryScore& s) {
        return s.composite >= 51;
    }));

    for (const auto& alert : alerts) {
        if (overview.topRisks.size() >= kMaxTopRisks) break;
        overview.topRisks.push_back("Convergence " + alert.cellId + ": " + std::to_string(alert.distinctKinds) +
                                    " event types (" + ConvergenceLevelToString(alert.level) + ")");
        overview.topConvergenceZones.push_back(alert.cellId);
    }
    for (const auto* s : ranked) {
        if (overview.topRisks.size() >= kMaxTopRisks || s->composite < 51) break;
        std::string name = s->countryName.empty() ? s->countryCode : s->countryName;
        overview.topRisks.push_back(name + ": CII " + std::to_string(s->composite) + " (" +
                                    InstabilityLevelToString(s->level) + ")");
    }
    return overview;
}

} // namespace worldpulse::application
