/**
 * @file BaselineDetector.hpp
 * @brief Rolling per-metric baselines and standardized deviation.
 */

#pragma once

#include <memory>
#include <string>
#include "domain/Baseline.hpp"
#include "domain/BaselineStore.hpp"

namespace worldpulse::application {

/** @brief z-score bands and the minimum history required for a verdict. */
struct DeviationThresholds {
    int minSamples = 6;
    double spikeZ = 2.5;
    double elevatedZ = 1.5;
    double quietZ = -2.0;
};

/**
 * @class BaselineDetector
 * @brief Maintains 7-day and 30-day windows of each metric and judges new observations.
 *
 * Deviation is judged against the short window as it was before the
 * observation being judged is appended. Callers judging a stored baseline
 * refresh its windows first (refreshWindows).
 */
class BaselineDetector {
public:
    static constexpr auto kShortWindow = std::chrono::hours(24 * 7);
    static constexpr auto kLongWindow = std::chrono::hours(24 * 30);

    BaselineDetector(std::shared_ptr<domain::BaselineStore> store, DeviationThresholds thresholds = {});

    /**
     * @brief Reads, extends and writes back the baseline of a metric.
     * @return The updated baseline.
     */
    domain::Baseline updateBaseline(const std::string& metricKey, double currentCount, domain::Timestamp now);

    domain::Deviation deviation(double currentCount, const domain::Baseline& baseline) const;

    /** @brief Baseline as currently stored (empty on first run). */
    domain::Baseline load(const std::string& metricKey) const;

    /**
     * @brief Pure update: appends an observation, drops samples older than the long window
     *        and recomputes both windows.
     */
    static domain::Baseline applyObservation(domain::Baseline baseline, double value, domain::Timestamp now);

    /**
     * @brief Recomputes both windows as of now. A stored baseline keeps the windows of its
     *        last update, which go stale when the process was idle or restarted.
     */
    static void refreshWindows(domain::Baseline& baseline, domain::Timestamp now);

    /** @brief Mean and sample standard deviation of the samples inside [now - window, now]. */
    static domain::RollingStats computeWindow(const domain::Baseline& baseline,
                                              domain::Clock::duration window,
                                              domain::Timestamp now);

    const DeviationThresholds& thresholds() const { return m_thresholds; }

private:
    std::shared_ptr<domain::BaselineStore> m_store;
    DeviationThresholds m_thresholds;
};

} // namespace worldpulse::application
