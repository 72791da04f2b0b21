/**
 * @file BaselineStore.hpp
 * @brief Interface for persistence of rolling baselines across restarts.
 */

#pragma once

#include <map>
#include <string>
#include "domain/Baseline.hpp"

namespace worldpulse::domain {

/**
 * @class BaselineStore
 * @brief Abstract key-value store of baselines.
 */
class BaselineStore {
public:
    virtual ~BaselineStore() = default;

    /**
     * @brief Fetches the baseline of a metric.
     * @return An empty baseline carrying only the key when the metric was never stored.
     */
    virtual Baseline get(const std::string& metricKey) const = 0;

    /** @brief Replaces the stored baseline for baseline.metricKey. */
    virtual void put(const Baseline& baseline) = 0;

    /** @brief Replaces several baselines at once, keyed by metric. Persists once. */
    virtual void putAll(const std::map<std::string, Baseline>& baselines) = 0;
};

} // namespace worldpulse::domain
