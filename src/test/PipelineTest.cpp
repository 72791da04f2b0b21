#include <iostream>
#include <cassert>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include "application/AnalysisPipeline.hpp"
#include "application/BaselineDetector.hpp"
#include "domain/BaselineStore.hpp"
#include "infrastructure/EntityCatalog.hpp"

using namespace worldpulse::domain;
using namespace worldpulse::application;

// In-memory store counting written baselines and batch commits
class MemoryBaselineStore : public BaselineStore {
public:
    Baseline get(const std::string& metricKey) const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_baselines.find(metricKey);
        if (it == m_baselines.end()) {
            Baseline empty;
            empty.metricKey = metricKey;
            return empty;
        }
        return it->second;
    }

    void put(const Baseline& baseline) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_baselines[baseline.metricKey] = baseline;
        ++m_puts;
    }

    void putAll(const std::map<std::string, Baseline>& batch) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [key, baseline] : batch) m_baselines[key] = baseline;
        m_puts += static_cast<int>(batch.size());
        ++m_commits;
    }

    int puts() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_puts;
    }

    int commits() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_commits;
    }

private:
    mutable std::mutex m_mutex;
    std::map<std::string, Baseline> m_baselines;
    int m_puts = 0;
    int m_commits = 0;
};

namespace {

NewsItem Headline(const std::string& id, const std::string& title, Timestamp at) {
    NewsItem item;
    item.id = id;
    item.sourceId = "reuters";
    item.title = title;
    item.publishedAt = at;
    item.sourceTier = 1;
    item.sourceType = SourceType::Wire;
    return item;
}

GeoEvent Event(GeoEventKind kind, Timestamp at) {
    GeoEvent e;
    e.kind = kind;
    e.lat = 25.5;
    e.lon = 121.5;
    e.occurredAt = at;
    e.countryCode = "TW";
    return e;
}

bool HasSignal(const CycleResult& result, SignalKind kind) {
    for (const auto& s : result.signals) {
        if (s.kind == kind) return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Analysis Pipeline Test..." << std::endl;

    const Timestamp now = FromEpochMillis(1760000000000);
    AnalysisConfig config;
    config.cycleTimeoutSeconds = 1;

    auto registry = std::make_shared<const EntityRegistry>(worldpulse::infrastructure::DefaultEntityCatalog());
    auto store = std::make_shared<MemoryBaselineStore>();
    auto context = std::make_shared<PipelineContext>(registry, store, config, now - std::chrono::hours(1));
    auto tasks = std::make_shared<AsyncTaskManager>();
    AnalysisPipeline pipeline(config, context, tasks);

    // 1. An empty cycle completes and records nothing
    CycleInput empty;
    empty.now = now;
    CycleResult idle = pipeline.runCycle(empty);
    assert(idle.status == CycleStatus::Completed);
    assert(idle.clusters.empty());
    assert(idle.deviations.empty());
    assert(idle.convergence.empty());
    assert(idle.countryScores.size() == config.monitoredCountries.size());
    assert(store->puts() == 0);
    assert(store->commits() == 0);
    bool floorSeen = false;
    for (const auto& score : idle.countryScores) {
        if (score.countryCode == "UA") floorSeen = score.composite == 55;
    }
    assert(floorSeen);
    assert(pipeline.latest().has_value());
    std::cout << "[PASS] Empty cycle" << std::endl;

    // 2. A full cycle produces market and geographic signals
    CycleInput input;
    input.now = now + std::chrono::minutes(1);
    input.news = {
        Headline("a", "Broadcom AI Revenue Beats Estimates", now),
        Headline("b", "Broadcom Posts Strong AI Chip Revenue", now),
        Headline("c", "Fed Holds Interest Rates Steady", now),
    };
    MarketQuote avgo;
    avgo.symbol = "AVGO";
    avgo.price = 1710.0;
    avgo.changePercent = 2.5;
    input.quotes = {avgo};
    for (int i = 0; i < 3; ++i) input.geoEvents.push_back(Event(GeoEventKind::MilitaryFlight, now));
    for (int i = 0; i < 2; ++i) input.geoEvents.push_back(Event(GeoEventKind::MilitaryVessel, now));
    input.geoEvents.push_back(Event(GeoEventKind::Protest, now));

    CycleResult full = pipeline.runCycle(input);
    assert(full.status == CycleStatus::Completed);
    assert(full.clusters.size() == 2);
    assert(full.correlations.size() == 1);
    assert(full.correlations[0].status == CorrelationStatus::Explained);
    assert(full.convergence.size() == 1);
    assert(full.convergence[0].score == 87);
    assert(HasSignal(full, SignalKind::ExplainedMarketMove));
    assert(HasSignal(full, SignalKind::GeoConvergence));
    assert(!full.deviations.empty());
    assert(full.overview.convergenceAlerts == 1);
    int putsAfterFull = store->puts();
    assert(putsAfterFull > 1);
    assert(store->commits() == 1);
    std::size_t dedupAfterFull = context->dedup.size();
    assert(dedupAfterFull >= 2);
    std::cout << "[PASS] Full cycle" << std::endl;

    // 3. Committed dedup state suppresses repeats in the next cycle
    input.now = now + std::chrono::minutes(2);
    CycleResult repeat = pipeline.runCycle(input);
    assert(repeat.status == CycleStatus::Completed);
    assert(!HasSignal(repeat, SignalKind::ExplainedMarketMove));
    assert(!HasSignal(repeat, SignalKind::GeoConvergence));
    putsAfterFull = store->puts();
    std::cout << "[PASS] Dedup carried across cycles" << std::endl;

    // 4. A stage that misses its deadline commits nothing, and the next cycle skips
    pipeline.setHeavyStage([](const HeavyStageInput& in) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1800));
        return AnalysisPipeline::RunHeavyStage(in);
    });
    auto before = pipeline.latest();
    input.now = now + std::chrono::hours(3);
    CycleResult timedOut = pipeline.runCycle(input);
    assert(timedOut.status == CycleStatus::TimedOut);
    assert(store->puts() == putsAfterFull);
    assert(context->dedup.size() == dedupAfterFull);
    assert(pipeline.latest()->startedAt == before->startedAt);

    CycleResult skipped = pipeline.runCycle(input);
    assert(skipped.status == CycleStatus::Skipped);
    tasks->WaitIdle();
    std::cout << "[PASS] Timeout and skip" << std::endl;

    // 5. A failing stage commits nothing
    pipeline.setHeavyStage([](const HeavyStageInput&) -> HeavyStageOutput {
        throw std::runtime_error("clustering backend unavailable");
    });
    CycleResult failed = pipeline.runCycle(input);
    assert(failed.status == CycleStatus::Failed);
    assert(failed.error == "clustering backend unavailable");
    assert(store->puts() == putsAfterFull);
    tasks->WaitIdle();
    std::cout << "[PASS] Failure isolation" << std::endl;

    // 6. Recovery once the default stage is back
    pipeline.setHeavyStage(nullptr);
    input.now = now + std::chrono::hours(7);
    CycleResult recovered = pipeline.runCycle(input);
    assert(recovered.status == CycleStatus::Completed);
    assert(HasSignal(recovered, SignalKind::ExplainedMarketMove));
    assert(store->puts() > putsAfterFull);
    std::cout << "[PASS] Recovery" << std::endl;

    // 7. Baselines last updated before an idle gap hold no evidence for today
    {
        auto idleStore = std::make_shared<MemoryBaselineStore>();
        const Timestamp seeded = now - std::chrono::hours(24 * 10);
        Baseline general;
        general.metricKey = "news:general";
        const double history[] = {1, 2, 1, 2, 1, 2};
        for (int i = 0; i < 6; ++i) {
            general = BaselineDetector::applyObservation(general, history[i], seeded + std::chrono::minutes(i));
        }
        assert(general.windowShort.sampleCount == 6);
        idleStore->put(general);

        auto idleContext = std::make_shared<PipelineContext>(registry, idleStore, config, now - std::chrono::hours(1));
        AnalysisPipeline idlePipeline(config, idleContext, tasks);
        CycleInput burst;
        burst.now = now;
        const char* titles[] = {"Parliament Debates Budget", "Storm Hits Coastal Towns", "Court Rules On Merger",
                                "Rail Strike Enters Third Day", "Vaccine Trial Shows Results", "Wildfire Spreads North",
                                "Election Turnout Record High", "Port Congestion Eases"};
        for (int i = 0; i < 8; ++i) burst.news.push_back(Headline("g" + std::to_string(i), titles[i], now));

        CycleResult afterGap = idlePipeline.runCycle(burst);
        assert(afterGap.status == CycleStatus::Completed);
        bool judged = false;
        for (const auto& d : afterGap.deviations) {
            if (d.metricKey != "news:general") continue;
            judged = true;
            assert(d.deviation.level == DeviationLevel::InsufficientData);
            assert(d.deviation.sampleCount == 0);
        }
        assert(judged);
        assert(!HasSignal(afterGap, SignalKind::TemporalAnomaly));
        tasks->WaitIdle();
    }
    std::cout << "[PASS] Stale baselines after idle gap" << std::endl;

    tasks->WaitIdle();
    std::cout << "[Test] Analysis Pipeline Test Completed Successfully." << std::endl;
    return 0;
}
