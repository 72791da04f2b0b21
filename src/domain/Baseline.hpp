/**
 * @file Baseline.hpp
 * @brief Rolling statistics for a volume metric and the deviation verdict computed from them.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include "domain/Clock.hpp"

namespace worldpulse::domain {

/** @brief Mean and sample standard deviation of one rolling window. */
struct RollingStats {
    double mean = 0.0;
    double stddev = 0.0;
    int sampleCount = 0;
};

/** @brief One timestamped observation kept for window trimming. */
struct BaselineSample {
    Timestamp at{};
    double value = 0.0;
};

/**
 * @struct Baseline
 * @brief Per-metric history. Samples cover the long window; both windows are derived from them.
 */
struct Baseline {
    std::string metricKey;              ///< Opaque key, e.g. "news:politics".
    RollingStats windowShort;           ///< Trailing 7 days.
    RollingStats windowLong;            ///< Trailing 30 days.
    std::vector<BaselineSample> samples;
    Timestamp lastUpdated{};

    bool empty() const { return samples.empty(); }
};

enum class DeviationLevel {
    Spike,
    Elevated,
    Normal,
    Quiet,
    InsufficientData
};

inline std::string DeviationLevelToString(DeviationLevel level) {
    switch (level) {
        case DeviationLevel::Spike: return "spike";
        case DeviationLevel::Elevated: return "elevated";
        case DeviationLevel::Normal: return "normal";
        case DeviationLevel::Quiet: return "quiet";
        case DeviationLevel::InsufficientData: return "insufficient_data";
    }
    return "normal";
}

/**
 * @struct Deviation
 * @brief Verdict of one observation against its baseline. zScore is empty for InsufficientData.
 */
struct Deviation {
    DeviationLevel level = DeviationLevel::InsufficientData;
    std::optional<double> zScore;
    double mean = 0.0;
    double stddev = 0.0;
    int sampleCount = 0;
};

} // namespace worldpulse::domain
