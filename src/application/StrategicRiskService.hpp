/**
 * @file StrategicRiskService.hpp
 * @brief Global risk overview blending convergence, country instability and infrastructure incidents.
 */

#pragma once

#include <optional>
#include <vector>
#include "domain/CountryScore.hpp"
#include "domain/GeoEvent.hpp"
#include "domain/StrategicRisk.hpp"

namespace worldpulse::application {

/**
 * @class StrategicRiskService
 * @brief Stateless calculator; the previous composite is supplied by the caller.
 */
class StrategicRiskService {
public:
    static constexpr int kTrendDelta = 3;

    domain::StrategicRiskOverview compute(const std::vector<domain::ConvergenceAlert>& alerts,
                                          const std::vector<domain::CountryScore>& scores,
                                          const std::vector<domain::GeoEvent>& events,
                                          std::optional<int> previousComposite,
                                          domain::Timestamp now) const;

    /** @brief Top-five weighted CII (0.4, 0.25, 0.2, 0.1, 0.05) plus up to 20 for countries at 50 or more. */
    static double ciiComponent(const std::vector<domain::CountryScore>& scores);
};

} // namespace worldpulse::application
