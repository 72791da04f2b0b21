#include <iostream>
#include <cassert>
#include <cmath>
#include <map>
#include <memory>
#include "application/BaselineDetector.hpp"
#include "domain/BaselineStore.hpp"

using namespace worldpulse::domain;
using namespace worldpulse::application;

// In-memory store
class MemoryBaselineStore : public BaselineStore {
public:
    Baseline get(const std::string& metricKey) const override {
        auto it = baselines.find(metricKey);
        if (it == baselines.end()) {
            Baseline empty;
            empty.metricKey = metricKey;
            return empty;
        }
        return it->second;
    }

    void put(const Baseline& baseline) override {
        baselines[baseline.metricKey] = baseline;
        ++puts;
    }

    void putAll(const std::map<std::string, Baseline>& batch) override {
        for (const auto& [key, baseline] : batch) baselines[key] = baseline;
        puts += static_cast<int>(batch.size());
    }

    std::map<std::string, Baseline> baselines;
    int puts = 0;
};

int main() {
    std::cout << "[Test] Starting Baseline Detector Test..." << std::endl;

    auto store = std::make_shared<MemoryBaselineStore>();
    BaselineDetector detector(store);
    const Timestamp t0 = FromEpochMillis(1760000000000);

    // 1. Three observations are not enough to judge
    for (int i = 0; i < 3; ++i) {
        detector.updateBaseline("news:politics", 10.0, t0 + std::chrono::hours(i));
    }
    Baseline thin = detector.load("news:politics");
    assert(thin.windowShort.sampleCount == 3);
    Deviation thinDev = detector.deviation(50.0, thin);
    assert(thinDev.level == DeviationLevel::InsufficientData);
    assert(!thinDev.zScore);
    assert(store->puts == 3);
    std::cout << "[PASS] Insufficient data" << std::endl;

    // 2. A flat history never flags
    for (int i = 3; i < 8; ++i) {
        detector.updateBaseline("news:politics", 10.0, t0 + std::chrono::hours(i));
    }
    Baseline flat = detector.load("news:politics");
    Deviation flatDev = detector.deviation(500.0, flat);
    assert(flatDev.level == DeviationLevel::Normal);
    assert(flatDev.zScore && *flatDev.zScore == 0.0);
    std::cout << "[PASS] Zero variance is normal" << std::endl;

    // 3. Z-score bands
    const double values[] = {10, 12, 8, 10, 12, 8};
    Timestamp now = t0;
    for (int i = 0; i < 6; ++i) {
        now = t0 + std::chrono::hours(i);
        detector.updateBaseline("protests:global", values[i], now);
    }
    Baseline varied = detector.load("protests:global");
    assert(varied.windowShort.sampleCount == 6);
    assert(std::fabs(varied.windowShort.mean - 10.0) < 1e-9);
    assert(std::fabs(varied.windowShort.stddev - std::sqrt(3.2)) < 1e-9);
    assert(detector.deviation(20.0, varied).level == DeviationLevel::Spike);
    assert(detector.deviation(13.0, varied).level == DeviationLevel::Elevated);
    assert(detector.deviation(10.0, varied).level == DeviationLevel::Normal);
    assert(detector.deviation(5.0, varied).level == DeviationLevel::Quiet);
    std::cout << "[PASS] Deviation bands" << std::endl;

    // 4. Samples age out of the windows
    Baseline aged = BaselineDetector::applyObservation(varied, 11.0, now + std::chrono::hours(24 * 8));
    assert(aged.windowShort.sampleCount == 1);
    assert(aged.windowLong.sampleCount == 7);
    Baseline expired = BaselineDetector::applyObservation(varied, 11.0, now + std::chrono::hours(24 * 31));
    assert(expired.samples.size() == 1);
    assert(expired.windowLong.sampleCount == 1);
    std::cout << "[PASS] Rolling windows" << std::endl;

    // 5. Non-finite observations are ignored
    Baseline unchanged = BaselineDetector::applyObservation(varied, std::nan(""), now);
    assert(unchanged.samples.size() == varied.samples.size());
    std::cout << "[PASS] Non-finite values ignored" << std::endl;

    // 6. A stored baseline judged after an idle gap uses the windows as of now
    Baseline stale = varied;
    assert(detector.deviation(20.0, stale).level == DeviationLevel::Spike);
    BaselineDetector::refreshWindows(stale, now + std::chrono::hours(24 * 10));
    assert(stale.windowShort.sampleCount == 0);
    assert(stale.windowLong.sampleCount == 6);
    Deviation staleDev = detector.deviation(20.0, stale);
    assert(staleDev.level == DeviationLevel::InsufficientData);
    assert(!staleDev.zScore);
    assert(stale.samples.size() == varied.samples.size());
    std::cout << "[PASS] Stale windows refreshed" << std::endl;

    std::cout << "[Test] Baseline Detector Test Completed Successfully." << std::endl;
    return 0;
}
