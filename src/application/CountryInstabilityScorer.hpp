/**
 * @file CountryInstabilityScorer.hpp
 * @brief Country Instability Index: weighted, bias-corrected composite per country.
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "domain/Baseline.hpp"
#include "domain/CountryScore.hpp"
#include "domain/EntityRegistry.hpp"
#include "domain/GeoEvent.hpp"
#include "domain/NewsCluster.hpp"

namespace worldpulse::application {

/**
 * @struct CountrySignals
 * @brief Raw per-country counts one cycle contributes to the index.
 */
struct CountrySignals {
    std::string countryCode;
    int protests = 0;
    int fatalities = 0;
    int highSeverity = 0;
    int militaryFlights = 0;
    int navalVessels = 0;
    int newsCount = 0;          ///< Clusters mentioning the country.
    double avgVelocity = 0.0;   ///< Mean velocity of those clusters.
    bool anyAlert = false;
    double newsVolume = 0.0;    ///< Headlines mentioning the country.
};

/** @brief Composite of the last two committed cycles. */
struct TrendState {
    std::optional<int> previous;
    int current = 0;
};

struct ScorerSettings {
    double dampingThreshold = 10.0;
    std::set<std::string> monitoredCountries;
    std::map<std::string, int> floors;
    int trendDelta = 5;
};

/**
 * @class CountryInstabilityScorer
 * @brief Computes CountryScore values and owns the cross-cycle trend state.
 *
 * computeScores() is pure with respect to the scorer; commit() is the only
 * mutation, so an abandoned cycle leaves the trend history untouched. The
 * scorer never reports insufficient data: every monitored country gets a
 * best-effort score.
 */
class CountryInstabilityScorer {
public:
    CountryInstabilityScorer(std::shared_ptr<const domain::EntityRegistry> registry, ScorerSettings settings);

    /**
     * @brief Attributes clusters, events and convergence alerts to monitored countries.
     *
     * Events are attributed by their country code. Clusters are attributed by
     * matching the primary title against country entities of the registry.
     */
    std::map<std::string, CountrySignals> collectSignals(const std::vector<domain::NewsCluster>& clusters,
                                                         const std::vector<domain::GeoEvent>& events,
                                                         const std::vector<domain::ConvergenceAlert>& alerts) const;

    /** @brief Score of one country against the given damping threshold. */
    domain::CountryScore scoreCountry(const CountrySignals& signals, double dampingThreshold, domain::Timestamp now) const;

    /**
     * @brief Scores every monitored country.
     * @param thresholds Calibrated damping threshold per country; the configured one is used when absent.
     * @return Scores sorted by composite descending, then country code.
     */
    std::vector<domain::CountryScore> computeScores(const std::map<std::string, CountrySignals>& signals,
                                                    const std::map<std::string, double>& thresholds,
                                                    domain::Timestamp now) const;

    /** @brief Makes these scores the "previous" values of the next cycle. */
    void commit(const std::vector<domain::CountryScore>& scores);

    std::optional<TrendState> trendState(const std::string& countryCode) const;

    int floorFor(const std::string& countryCode) const;

    /**
     * @brief Damping threshold raised to the long-window mean of the country's news volume
     *        once that baseline holds enough samples.
     */
    static double calibratedThreshold(double configured, const domain::Baseline& volumeBaseline, int minSamples);

    /** @brief 1 / (1 + log10(volume / threshold)) above the threshold, 1 otherwise. */
    static double dampingFactor(double newsVolume, double threshold);

    static domain::ScoreTrend trendFor(std::optional<int> previous, int current, int delta = 5);

    const ScorerSettings& settings() const { return m_settings; }

private:
    std::shared_ptr<const domain::EntityRegistry> m_registry;
    ScorerSettings m_settings;
    std::map<std::string, TrendState> m_history;
};

} // namespace worldpulse::application
