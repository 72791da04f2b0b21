/**
 * @file AnalysisPipeline.cpp
 * @brief Implementation of AnalysisPipeline.
 */

#include "application/AnalysisPipeline.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>
#include "application/BaselineDetector.hpp"
#include "application/ClusteringService.hpp"
#include "application/ConvergenceGrid.hpp"
#include "application/EntityCorrelator.hpp"
#include "application/StrategicRiskService.hpp"

namespace worldpulse::application {

using namespace worldpulse::domain;

namespace {

std::map<std::string, double> VolumeMetrics(const CycleInput& input) {
    std::map<std::string, double> metrics;
    if (!input.news.empty()) {
        for (const auto& item : input.news) {
            metrics["news:" + (item.category.empty() ? std::string("general") : item.category)] += 1.0;
        }
    }
    if (!input.geoEvents.empty()) {
        metrics["military_flights:global"] = 0.0;
        metrics["military_vessels:global"] = 0.0;
        metrics["protests:global"] = 0.0;
        metrics["outages:global"] = 0.0;
        for (const auto& event : input.geoEvents) {
            switch (event.kind) {
                case GeoEventKind::MilitaryFlight: metrics["military_flights:global"] += 1.0; break;
                case GeoEventKind::MilitaryVessel: metrics["military_vessels:global"] += 1.0; break;
                case GeoEventKind::Protest: metrics["protests:global"] += 1.0; break;
                case GeoEventKind::Outage: metrics["outages:global"] += 1.0; break;
                case GeoEventKind::Earthquake: break;
            }
        }
    }
    return metrics;
}

} // namespace

AnalysisPipeline::AnalysisPipeline(AnalysisConfig config,
                                   std::shared_ptr<PipelineContext> context,
                                   std::shared_ptr<AsyncTaskManager> taskManager)
    : m_config(std::move(config)),
      m_context(std::move(context)),
      m_taskManager(std::move(taskManager)),
      m_heavyStage(&AnalysisPipeline::RunHeavyStage) {
    if (!m_context) throw std::invalid_argument("AnalysisPipeline requires a context");
    if (!m_taskManager) throw std::invalid_argument("AnalysisPipeline requires a task manager");
}

void AnalysisPipeline::setHeavyStage(HeavyStage stage) {
    std::lock_guard<std::mutex> lock(m_cycleMutex);
    m_heavyStage = stage ? std::move(stage) : HeavyStage(&AnalysisPipeline::RunHeavyStage);
}

HeavyStageOutput AnalysisPipeline::RunHeavyStage(const HeavyStageInput& input) {
    HeavyStageOutput out;
    ClusteringService clustering(input.similarityThreshold);
    out.clusters = clustering.cluster(input.news);

    EntityCorrelator correlator(input.registry, input.marketMoveThresholdPct);
    out.correlations = correlator.correlateAll(input.quotes, out.clusters);
    return out;
}

std::optional<CycleResult> AnalysisPipeline::latest() const {
    std::lock_guard<std::mutex> lock(m_resultMutex);
    return m_latest;
}

CycleResult AnalysisPipeline::runCycle(const CycleInput& input) {
    CycleResult result;
    result.startedAt = input.now;

    std::unique_lock<std::mutex> cycleLock(m_cycleMutex, std::try_to_lock);
    if (!cycleLock.owns_lock() || m_taskManager->HasActiveTask(TaskType::Clustering)) {
        std::cout << "[AnalysisPipeline] Previous cycle still running, skipping." << std::endl;
        result.status = CycleStatus::Skipped;
        return result;
    }

    HeavyStageInput heavyInput;
    heavyInput.news = input.news;
    heavyInput.quotes = input.quotes;
    heavyInput.registry = m_context->registry;
    heavyInput.similarityThreshold = m_config.similarityThreshold;
    heavyInput.marketMoveThresholdPct = m_config.marketMoveThresholdPct;

    auto task = m_taskManager->SubmitTask(
        TaskType::Clustering, "Cluster and correlate " + std::to_string(input.news.size()) + " headlines",
        [stage = m_heavyStage](std::shared_ptr<TaskStatus>, HeavyStageInput in) { return stage(in); },
        std::move(heavyInput));

    if (task.result.wait_for(m_config.cycleTimeout()) != std::future_status::ready) {
        std::cerr << "[AnalysisPipeline] Clustering stage exceeded " << m_config.cycleTimeoutSeconds
                  << "s, abandoning cycle." << std::endl;
        result.status = CycleStatus::TimedOut;
        return result;
    }

    std::map<std::string, Baseline> stagedBaselines;
    DedupTable stagedDedup = m_context->dedup;
    try {
        HeavyStageOutput heavy = task.result.get();
        CycleResult analysed = analyse(input, std::move(heavy), stagedBaselines, stagedDedup);
        result = std::move(analysed);
    } catch (const std::exception& e) {
        std::cerr << "[AnalysisPipeline] Cycle failed: " << e.what() << std::endl;
        result.status = CycleStatus::Failed;
        result.error = e.what();
        return result;
    }

    // Commit. Nothing above touched the context.
    if (m_context->baselineStore && !stagedBaselines.empty()) {
        m_context->baselineStore->putAll(stagedBaselines);
    }
    m_context->scorer.commit(result.countryScores);
    m_context->dedup = std::move(stagedDedup);
    m_context->previousRiskComposite = result.overview.compositeScore;
    result.status = CycleStatus::Completed;
    result.completedAt = input.now;

    {
        std::lock_guard<std::mutex> lock(m_resultMutex);
        m_latest = result;
    }
    std::cout << "[AnalysisPipeline] Cycle completed: " << result.clusters.size() << " clusters, "
              << result.signals.size() << " signals, " << result.convergence.size() << " convergence alerts."
              << std::endl;
    return result;
}

CycleResult AnalysisPipeline::analyse(const CycleInput& input, HeavyStageOutput heavy,
                                      std::map<std::string, Baseline>& staged, DedupTable& dedup) {
    const Timestamp now = input.now;
    CycleResult result;
    result.startedAt = now;
    result.clusters = std::move(heavy.clusters);
    result.correlations = std::move(heavy.correlations);

    DeviationThresholds thresholds;
    thresholds.minSamples = m_config.baselineMinSamples;
    thresholds.spikeZ = m_config.spikeZ;
    thresholds.elevatedZ = m_config.elevatedZ;
    thresholds.quietZ = m_config.quietZ;
    BaselineDetector detector(m_context->baselineStore, thresholds);

    // Deviation is judged before the observation joins the baseline.
    for (const auto& [key, value] : VolumeMetrics(input)) {
        Baseline before = detector.load(key);
        BaselineDetector::refreshWindows(before, now);
        result.deviations.push_back(MetricDeviation{key, value, detector.deviation(value, before)});
        staged[key] = BaselineDetector::applyObservation(std::move(before), value, now);
    }

    ConvergenceGrid grid(m_config.cellSizeDeg, m_config.convergenceWindow());
    result.convergence = grid.detectConvergence(input.geoEvents, now);

    const CountryInstabilityScorer& scorer = m_context->scorer;
    auto countrySignals = scorer.collectSignals(result.clusters, input.geoEvents, result.convergence);
    std::map<std::string, double> dampingThresholds;
    for (const auto& [code, signals] : countrySignals) {
        std::string key = "news_volume:" + code;
        Baseline volume = detector.load(key);
        BaselineDetector::refreshWindows(volume, now);
        dampingThresholds[code] = CountryInstabilityScorer::calibratedThreshold(
            m_config.newsVolumeDampingThreshold, volume, m_config.baselineMinSamples);
        if (!input.news.empty()) {
            staged[key] = BaselineDetector::applyObservation(std::move(volume), signals.newsVolume, now);
        }
    }
    result.countryScores = scorer.computeScores(countrySignals, dampingThresholds, now);

    DetectionBuilder builder(m_config);
    std::vector<Detection> detections = input.upstreamDetections;
    auto append = [&detections](std::vector<Detection> more) {
        detections.insert(detections.end(), std::make_move_iterator(more.begin()), std::make_move_iterator(more.end()));
    };
    append(builder.fromClusters(result.clusters, now));
    append(builder.fromCorrelations(result.correlations, now));
    append(builder.fromEnergyQuotes(input.quotes, result.clusters, now));
    append(builder.fromDeviations(result.deviations, now));
    append(builder.fromConvergence(result.convergence, now));
    append(builder.fromCountryScores(result.countryScores, now));

    SignalSettings signalSettings;
    signalSettings.minConfidence = m_config.minSignalConfidence;
    signalSettings.learningMode = m_config.learningMode();
    SignalGenerator generator(signalSettings, m_context->startedAt);
    result.learningMode = generator.inLearningMode(now);

    result.signals = generator.generate(detections, dedup, now);

    StrategicRiskService risk;
    result.overview = risk.compute(result.convergence, result.countryScores, input.geoEvents,
                                   m_context->previousRiskComposite, now);
    return result;
}

} // namespace worldpulse::application
