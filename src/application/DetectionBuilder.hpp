/**
 * @file DetectionBuilder.hpp
 * @brief Turns analyser outputs into pre-classified detections for the signal generator.
 */

#pragma once

#include <string>
#include <vector>
#include "application/AnalysisConfig.hpp"
#include "domain/Baseline.hpp"
#include "domain/CorrelationResult.hpp"
#include "domain/CountryScore.hpp"
#include "domain/GeoEvent.hpp"
#include "domain/MarketQuote.hpp"
#include "domain/NewsCluster.hpp"
#include "domain/Signal.hpp"

namespace worldpulse::application {

/** @brief Deviation of one volume metric in the current cycle. */
struct MetricDeviation {
    std::string metricKey;
    double current = 0.0;
    domain::Deviation deviation;
};

/**
 * @class DetectionBuilder
 * @brief Stateless detectors over one cycle's analysis results.
 *
 * Each detector emits Detection records with a subject key free of
 * magnitudes and a confidence derived from the strength of the evidence.
 */
class DetectionBuilder {
public:
    explicit DetectionBuilder(const AnalysisConfig& config);

    /** @brief Velocity spike, source convergence, triangulation and flow drop per cluster. */
    std::vector<domain::Detection> fromClusters(const std::vector<domain::NewsCluster>& clusters,
                                                domain::Timestamp now) const;

    /** @brief Explained moves and silent divergences. */
    std::vector<domain::Detection> fromCorrelations(const std::vector<domain::CorrelationResult>& correlations,
                                                    domain::Timestamp now) const;

    /** @brief Energy prices rising with no pipeline disruption in the news. */
    std::vector<domain::Detection> fromEnergyQuotes(const std::vector<domain::MarketQuote>& quotes,
                                                    const std::vector<domain::NewsCluster>& clusters,
                                                    domain::Timestamp now) const;

    std::vector<domain::Detection> fromDeviations(const std::vector<MetricDeviation>& deviations,
                                                  domain::Timestamp now) const;

    std::vector<domain::Detection> fromConvergence(const std::vector<domain::ConvergenceAlert>& alerts,
                                                   domain::Timestamp now) const;

    /** @brief Countries whose composite moved by at least the alert threshold since the last cycle. */
    std::vector<domain::Detection> fromCountryScores(const std::vector<domain::CountryScore>& scores,
                                                     domain::Timestamp now) const;

    /** @brief True when the cluster reports a pipeline disruption. */
    static bool isFlowDropCluster(const domain::NewsCluster& cluster);

    /** @brief CII alert priority: level first, then the size of the change. */
    static domain::Severity ciiPriority(const domain::CountryScore& score);

private:
    AnalysisConfig m_config;
};

} // namespace worldpulse::application
