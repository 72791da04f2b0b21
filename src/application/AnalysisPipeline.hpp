/**
 * @file AnalysisPipeline.hpp
 * @brief Orchestrates one refresh cycle across every analysis stage.
 */

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include "application/AnalysisConfig.hpp"
#include "application/AsyncTaskManager.hpp"
#include "application/DetectionBuilder.hpp"
#include "application/PipelineContext.hpp"
#include "domain/CorrelationResult.hpp"
#include "domain/CountryScore.hpp"
#include "domain/GeoEvent.hpp"
#include "domain/MarketQuote.hpp"
#include "domain/NewsCluster.hpp"
#include "domain/Signal.hpp"
#include "domain/StrategicRisk.hpp"

namespace worldpulse::application {

/** @brief Everything the collaborators delivered for one cycle. */
struct CycleInput {
    std::vector<domain::NewsItem> news;
    std::vector<domain::MarketQuote> quotes;
    std::vector<domain::GeoEvent> geoEvents;
    std::vector<domain::Detection> upstreamDetections;
    domain::Timestamp now{};
};

enum class CycleStatus {
    Completed,
    Skipped,    ///< A heavy stage of an earlier cycle was still running.
    TimedOut,   ///< The worker missed its deadline; nothing was committed.
    Failed      ///< A stage raised; nothing was committed.
};

inline std::string CycleStatusToString(CycleStatus status) {
    switch (status) {
        case CycleStatus::Completed: return "completed";
        case CycleStatus::Skipped: return "skipped";
        case CycleStatus::TimedOut: return "timed_out";
        case CycleStatus::Failed: return "failed";
    }
    return "failed";
}

struct CycleResult {
    CycleStatus status = CycleStatus::Skipped;
    domain::Timestamp startedAt{};
    domain::Timestamp completedAt{};
    std::vector<domain::NewsCluster> clusters;
    std::vector<domain::CorrelationResult> correlations;
    std::vector<MetricDeviation> deviations;
    std::vector<domain::ConvergenceAlert> convergence;
    std::vector<domain::CountryScore> countryScores;
    std::vector<domain::Signal> signals;
    domain::StrategicRiskOverview overview;
    bool learningMode = false;
    std::string error;
};

/** @brief Input and output of the worker-offloaded stage. */
struct HeavyStageInput {
    std::vector<domain::NewsItem> news;
    std::vector<domain::MarketQuote> quotes;
    std::shared_ptr<const domain::EntityRegistry> registry;
    double similarityThreshold = 0.5;
    double marketMoveThresholdPct = 2.0;
};

struct HeavyStageOutput {
    std::vector<domain::NewsCluster> clusters;
    std::vector<domain::CorrelationResult> correlations;
};

using HeavyStage = std::function<HeavyStageOutput(const HeavyStageInput&)>;

/**
 * @class AnalysisPipeline
 * @brief Single-active-cycle orchestrator with atomic commit.
 *
 * Clustering and correlation run on the task manager with a copy of the
 * input and are awaited with a deadline. Every cross-cycle mutation
 * (baselines, country trend history, dedup table, overview trend) is staged
 * and applied only when the whole cycle completes.
 */
class AnalysisPipeline {
public:
    AnalysisPipeline(AnalysisConfig config,
                     std::shared_ptr<PipelineContext> context,
                     std::shared_ptr<AsyncTaskManager> taskManager);

    CycleResult runCycle(const CycleInput& input);

    /** @brief Last completed cycle, safe to call from any thread. */
    std::optional<CycleResult> latest() const;

    /** @brief Replaces the clustering/correlation stage. */
    void setHeavyStage(HeavyStage stage);

    /** @brief Clusters the news and correlates the quotes; the default heavy stage. */
    static HeavyStageOutput RunHeavyStage(const HeavyStageInput& input);

    const AnalysisConfig& config() const { return m_config; }

private:
    CycleResult analyse(const CycleInput& input, HeavyStageOutput heavy,
                        std::map<std::string, domain::Baseline>& staged, DedupTable& dedup);

    AnalysisConfig m_config;
    std::shared_ptr<PipelineContext> m_context;
    std::shared_ptr<AsyncTaskManager> m_taskManager;
    HeavyStage m_heavyStage;

    std::mutex m_cycleMutex;
    mutable std::mutex m_resultMutex;
    std::optional<CycleResult> m_latest;
};

} // namespace worldpulse::application
