/**
 * @file BaselineDetector.cpp
 * @brief Implementation of BaselineDetector.
 */

#include "application/BaselineDetector.hpp"
#include <algorithm>
#include <cmath>

namespace worldpulse::application {

using namespace worldpulse::domain;

BaselineDetector::BaselineDetector(std::shared_ptr<BaselineStore> store, DeviationThresholds thresholds)
    : m_store(std::move(store)), m_thresholds(thresholds) {}

Baseline BaselineDetector::load(const std::string& metricKey) const {
    if (!m_store) {
        Baseline empty;
        empty.metricKey = metricKey;
        return empty;
    }
    Baseline baseline = m_store->get(metricKey);
    baseline.metricKey = metricKey;
    return baseline;
}

Baseline BaselineDetector::updateBaseline(const std::string& metricKey, double currentCount, Timestamp now) {
    Baseline updated = applyObservation(load(metricKey), currentCount, now);
    if (m_store) m_store->put(updated);
    return updated;
}

Baseline BaselineDetector::applyObservation(Baseline baseline, double value, Timestamp now) {
    if (std::isfinite(value)) {
        baseline.samples.push_back(BaselineSample{now, value});
    }

    Timestamp cutoff = now - kLongWindow;
    baseline.samples.erase(
        std::remove_if(baseline.samples.begin(), baseline.samples.end(),
                       [cutoff](const BaselineSample& s) { return s.at < cutoff; }),
        baseline.samples.end());
    std::sort(baseline.samples.begin(), baseline.samples.end(),
              [](const BaselineSample& a, const BaselineSample& b) { return a.at < b.at; });

    refreshWindows(baseline, now);
    baseline.lastUpdated = now;
    return baseline;
}

void BaselineDetector::refreshWindows(Baseline& baseline, Timestamp now) {
    baseline.windowShort = computeWindow(baseline, kShortWindow, now);
    baseline.windowLong = computeWindow(baseline, kLongWindow, now);
}

RollingStats BaselineDetector::computeWindow(const Baseline& baseline, Clock::duration window, Timestamp now) {
    RollingStats stats;
    Timestamp cutoff = now - window;
    double sum = 0.0;
    for (const auto& sample : baseline.samples) {
        if (sample.at < cutoff || sample.at > now) continue;
        sum += sample.value;
        ++stats.sampleCount;
    }
    if (stats.sampleCount == 0) return stats;
    stats.mean = sum / stats.sampleCount;

    if (stats.sampleCount > 1) {
        double squares = 0.0;
        for (const auto& sample : baseline.samples) {
            if (sample.at < cutoff || sample.at > now) continue;
            double d = sample.value - stats.mean;
            squares += d * d;
        }
        stats.stddev = std::sqrt(squares / (stats.sampleCount - 1));
    }
    return stats;
}

Deviation BaselineDetector::deviation(double currentCount, const Baseline& baseline) const {
    const RollingStats& stats = baseline.windowShort;
    Deviation result;
    result.mean = stats.mean;
    result.stddev = stats.stddev;
    result.sampleCount = stats.sampleCount;

    if (stats.sampleCount < m_thresholds.minSamples || !std::isfinite(currentCount)) {
        result.level = DeviationLevel::InsufficientData;
        return result;
    }
    // A perfectly flat history cannot make anything anomalous.
    if (stats.stddev <= 0.0) {
        result.level = DeviationLevel::Normal;
        result.zScore = 0.0;
        return result;
    }

    double z = (currentCount - stats.mean) / stats.stddev;
    result.zScore = z;
    if (z > m_thresholds.spikeZ) {
        result.level = DeviationLevel::Spike;
    } else if (z > m_thresholds.elevatedZ) {
        result.level = DeviationLevel::Elevated;
    } else if (z < m_thresholds.quietZ) {
        result.level = DeviationLevel::Quiet;
    } else {
        result.level = DeviationLevel::Normal;
    }
    return result;
}

} // namespace worldpulse::application
