/**
 * @file AnalysisConfig.hpp
 * @brief Tunable thresholds of every analysis stage.
 *
 * Values are empirically tuned defaults; settings.json may override any of them.
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>

namespace worldpulse::application {

struct AnalysisConfig {
    // Clustering
    double similarityThreshold = 0.5;

    // Correlation
    double marketMoveThresholdPct = 2.0;
    double flowPriceThresholdPct = 1.5;
    std::vector<std::string> energySymbols = {"CL=F", "BZ=F", "NG=F", "USO", "XLE"};

    // Baselines
    int baselineMinSamples = 6;
    double spikeZ = 2.5;
    double elevatedZ = 1.5;
    double quietZ = -2.0;

    // Convergence grid
    double cellSizeDeg = 1.0;
    int convergenceWindowHours = 24;

    // Country instability
    double newsVolumeDampingThreshold = 10.0;
    std::vector<std::string> monitoredCountries = {
        "US", "RU", "CN", "UA", "IR", "IL", "TW", "KP", "SA", "TR",
        "PL", "DE", "FR", "GB", "IN", "PK", "SY", "YE", "MM", "VE"
    };
    std::map<std::string, int> countryFloors = {
        {"UA", 55}, {"SY", 50}, {"YE", 50}, {"MM", 45}, {"IL", 45}, {"RU", 40}
    };
    int ciiChangeAlertThreshold = 10;

    // Signals
    int learningModeMinutes = 15;
    double minSignalConfidence = 0.5;
    double velocitySpikeThreshold = 3.0;    ///< Sources per hour.
    int sourceConvergenceMinTypes = 3;

    // Orchestration
    int cycleTimeoutSeconds = 30;
    int refreshIntervalSeconds = 300;

    std::chrono::minutes learningMode() const { return std::chrono::minutes(learningModeMinutes); }
    std::chrono::hours convergenceWindow() const { return std::chrono::hours(convergenceWindowHours); }
    std::chrono::seconds cycleTimeout() const { return std::chrono::seconds(cycleTimeoutSeconds); }
};

} // namespace worldpulse::application
