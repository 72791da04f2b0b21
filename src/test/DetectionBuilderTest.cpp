#include <iostream>
#include <cassert>
#include <cmath>
#include "application/DetectionBuilder.hpp"
#include "application/StrategicRiskService.hpp"

using namespace worldpulse::domain;
using namespace worldpulse::application;

namespace {

NewsItem Item(const std::string& id, const std::string& title, SourceType type, Timestamp at) {
    NewsItem item;
    item.id = id;
    item.sourceId = id + "-source";
    item.title = title;
    item.sourceType = type;
    item.publishedAt = at;
    return item;
}

NewsCluster Cluster(const std::string& id, std::vector<NewsItem> members, double velocity) {
    NewsCluster c;
    c.id = id;
    c.primaryTitle = members.front().title;
    c.velocityPerHour = velocity;
    for (const auto& m : members) c.memberIds.insert(m.id);
    c.members = std::move(members);
    return c;
}

const Detection* Find(const std::vector<Detection>& detections, SignalKind kind) {
    for (const auto& d : detections) {
        if (d.kind == kind) return &d;
    }
    return nullptr;
}

bool Near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Detection Builder Test..." << std::endl;

    const Timestamp now = FromEpochMillis(1760000000000);
    AnalysisConfig config;
    DetectionBuilder builder(config);

    // 1. Cluster detectors
    const std::string title = "Strait Shipping Attack Confirmed";
    NewsCluster busy = Cluster("busy", {
        Item("w", title, SourceType::Wire, now - std::chrono::minutes(20)),
        Item("g", title, SourceType::Gov, now - std::chrono::minutes(10)),
        Item("i", title, SourceType::Intel, now - std::chrono::minutes(5)),
        Item("m", title, SourceType::Mainstream, now),
    }, 12.0);
    auto clusterDetections = builder.fromClusters({busy}, now);
    const Detection* spike = Find(clusterDetections, SignalKind::VelocitySpike);
    assert(spike && spike->severity == Severity::High && Near(*spike->confidence, 0.85));
    assert(spike->subjectKey == "busy");
    const Detection* convergence = Find(clusterDetections, SignalKind::SourceConvergence);
    assert(convergence && convergence->severity == Severity::High && Near(*convergence->confidence, 0.95));
    const Detection* triangulation = Find(clusterDetections, SignalKind::Triangulation);
    assert(triangulation && Near(*triangulation->confidence, 0.9));
    assert(!Find(clusterDetections, SignalKind::FlowDrop));

    NewsCluster pair = Cluster("pair", {
        Item("a", "Quiet Story", SourceType::Wire, now),
        Item("b", "Quiet Story", SourceType::Wire, now),
    }, 120.0);
    assert(builder.fromClusters({pair}, now).empty());

    // Unclassified sources do not count towards convergence
    NewsCluster mixed = Cluster("mixed", {
        Item("w2", "Refinery Fire Reported", SourceType::Wire, now),
        Item("m2", "Refinery Fire Reported", SourceType::Mainstream, now),
        Item("o2", "Refinery Fire Reported", SourceType::Other, now),
    }, 1.0);
    assert(!Find(builder.fromClusters({mixed}, now), SignalKind::SourceConvergence));
    mixed.members[2].sourceType = SourceType::Gov;
    assert(Find(builder.fromClusters({mixed}, now), SignalKind::SourceConvergence));

    // Three types need at least three recent reports behind them
    NewsCluster stale = Cluster("stale", {
        Item("w3", "Border Crossing Closed", SourceType::Wire, now),
        Item("g3", "Border Crossing Closed", SourceType::Gov, now - std::chrono::minutes(10)),
        Item("m3", "Border Crossing Closed", SourceType::Mainstream, now - std::chrono::hours(3)),
    }, 1.0);
    assert(!Find(builder.fromClusters({stale}, now), SignalKind::SourceConvergence));
    std::cout << "[PASS] Cluster detectors" << std::endl;

    // 2. Flow drop suppresses the energy divergence
    NewsCluster flow = Cluster("flow", {
        Item("f", "Druzhba pipeline flows halted after explosion", SourceType::Wire, now),
    }, 1.0);
    assert(DetectionBuilder::isFlowDropCluster(flow));
    auto flowDetections = builder.fromClusters({flow}, now);
    const Detection* drop = Find(flowDetections, SignalKind::FlowDrop);
    assert(drop && Near(*drop->confidence, 0.5));

    MarketQuote crude;
    crude.symbol = "CL=F";
    crude.changePercent = 3.0;
    MarketQuote tech;
    tech.symbol = "AAPL";
    tech.changePercent = 9.0;
    assert(builder.fromEnergyQuotes({crude, tech}, {flow}, now).empty());
    auto divergence = builder.fromEnergyQuotes({crude, tech}, {busy}, now);
    assert(divergence.size() == 1);
    assert(divergence[0].kind == SignalKind::FlowPriceDivergence && divergence[0].subjectKey == "CL=F");
    assert(Near(*divergence[0].confidence, 0.775));
    std::cout << "[PASS] Flow and price divergence" << std::endl;

    // 3. Market correlations
    CorrelationResult explained;
    explained.symbol = "AVGO";
    explained.movePercent = 6.0;
    explained.status = CorrelationStatus::Explained;
    explained.confidence = 0.95;
    explained.headline = "Broadcom AI Revenue Beats Estimates";
    CorrelationResult silent;
    silent.symbol = "XOM";
    silent.movePercent = -7.0;
    silent.status = CorrelationStatus::SilentDivergence;
    CorrelationResult skipped;
    skipped.symbol = "MSFT";
    skipped.movePercent = 0.5;
    auto market = builder.fromCorrelations({explained, silent, skipped}, now);
    assert(market.size() == 2);
    assert(market[0].kind == SignalKind::ExplainedMarketMove && market[0].severity == Severity::Medium);
    assert(Near(*market[0].confidence, 0.95));
    assert(market[1].kind == SignalKind::SilentDivergence && market[1].severity == Severity::High);
    assert(Near(*market[1].confidence, 0.8));
    assert(market[1].subjectKey == "XOM");
    std::cout << "[PASS] Correlation detections" << std::endl;

    // 4. Baseline deviations
    MetricDeviation hot{"protests:global", 40.0, {}};
    hot.deviation.level = DeviationLevel::Spike;
    hot.deviation.zScore = 3.0;
    MetricDeviation thin{"news:tech", 5.0, {}};
    MetricDeviation calm{"news:politics", 10.0, {}};
    calm.deviation.level = DeviationLevel::Normal;
    calm.deviation.zScore = 0.2;
    auto anomalies = builder.fromDeviations({hot, thin, calm}, now);
    assert(anomalies.size() == 1);
    assert(anomalies[0].kind == SignalKind::TemporalAnomaly && anomalies[0].severity == Severity::High);
    assert(Near(*anomalies[0].confidence, 0.8));
    std::cout << "[PASS] Deviation detections" << std::endl;

    // 5. Instability changes
    CountryScore ua;
    ua.countryCode = "UA";
    ua.countryName = "Ukraine";
    ua.composite = 70;
    ua.level = InstabilityLevelForScore(70);
    ua.hasPrevious = true;
    ua.change = 12;
    CountryScore de;
    de.countryCode = "DE";
    de.composite = 20;
    de.hasPrevious = true;
    de.change = 4;
    CountryScore fresh;
    fresh.countryCode = "PL";
    fresh.composite = 60;
    fresh.change = 60;
    auto cii = builder.fromCountryScores({ua, de, fresh}, now);
    assert(cii.size() == 1);
    assert(cii[0].subjectKey == "UA");
    assert(cii[0].severity == DetectionBuilder::ciiPriority(ua));
    assert(Near(*cii[0].confidence, 0.74));
    std::cout << "[PASS] Instability detections" << std::endl;

    // 6. Strategic overview
    ConvergenceAlert alert;
    alert.cellId = "25:121";
    alert.distinctKinds = 3;
    alert.score = 87;
    alert.level = ConvergenceLevel::Critical;
    auto geo = builder.fromConvergence({alert}, now);
    assert(geo.size() == 1 && geo[0].severity == Severity::Critical && Near(*geo[0].confidence, 0.87));

    CountryScore ru;
    ru.countryCode = "RU";
    ru.composite = 55;
    GeoEvent outage;
    outage.kind = GeoEventKind::Outage;
    StrategicRiskService risk;
    auto overview = risk.compute({alert}, {de, ua, ru}, {outage, outage}, 40, now);
    assert(overview.convergenceAlerts == 1);
    assert(overview.infrastructureIncidents == 2);
    assert(overview.compositeScore == 45);
    assert(overview.trend == RiskTrend::Escalating);
    assert(overview.topCountryScore == 70);
    assert(overview.unstableCountries == 2);
    assert(overview.topRisks.size() == 3);
    assert(overview.topConvergenceZones.size() == 1);
    auto steady = risk.compute({alert}, {de, ua, ru}, {outage, outage}, 44, now);
    assert(steady.trend == RiskTrend::Stable);
    std::cout << "[PASS] Strategic overview" << std::endl;

    std::cout << "[Test] Detection Builder Test Completed Successfully." << std::endl;
    return 0;
}
