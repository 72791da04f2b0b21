/**
 * @file DetectionBuilder.cpp
 * @brief Implementation of DetectionBuilder.
 */

#include "application/DetectionBuilder.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <set>
#include <sstream>
#include "domain/TextMatch.hpp"

namespace worldpulse::application {

using namespace worldpulse::domain;

namespace {

constexpr auto kConvergenceWindow = std::chrono::minutes(60);
constexpr int kMinVelocityMembers = 3;
constexpr int kMinConvergenceMembers = 3;

const std::set<std::string> kPipelineKeywords = {
    "pipeline", "nord stream", "druzhba", "keystone", "gas flow", "oil flow",
    "lng terminal", "gas transit", "refinery"
};

const std::set<std::string> kFlowDropKeywords = {
    "halt", "halted", "shut", "shutdown", "outage", "disruption", "disrupted",
    "sabotage", "explosion", "leak", "suspended", "stopped", "reduced", "cut off"
};

std::string Percent(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << (value >= 0 ? "+" : "") << value << "%";
    return oss.str();
}

std::string Number(double value, int precision = 1) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

bool MentionsFlowDrop(const std::string& title) {
    MatchText text = text::Prepare(title);
    return text::MatchesAnyKeyword(text, kPipelineKeywords) && text::MatchesAnyKeyword(text, kFlowDropKeywords);
}

Severity FromConvergenceLevel(ConvergenceLevel level) {
    switch (level) {
        case ConvergenceLevel::Medium: return Severity::Medium;
        case ConvergenceLevel::High: return Severity::High;
        case ConvergenceLevel::Critical: return Severity::Critical;
    }
    return Severity::Medium;
}

Detection ClusterDetection(SignalKind kind, const NewsCluster& cluster, Timestamp now) {
    Detection d;
    d.kind = kind;
    d.subjectKey = cluster.id;
    d.occurredAt = now;
    d.details["clusterId"] = cluster.id;
    d.details["headline"] = cluster.primaryTitle;
    d.details["sources"] = std::to_string(cluster.members.size());
    return d;
}

} // namespace

DetectionBuilder::DetectionBuilder(const AnalysisConfig& config) : m_config(config) {}

bool DetectionBuilder::isFlowDropCluster(const NewsCluster& cluster) {
    if (MentionsFlowDrop(cluster.primaryTitle)) return true;
    return std::any_of(cluster.members.begin(), cluster.members.end(),
                       [](const NewsItem& item) { return MentionsFlowDrop(item.title); });
}

std::vector<Detection> DetectionBuilder::fromClusters(const std::vector<NewsCluster>& clusters, Timestamp now) const {
    std::vector<Detection> out;
    for (const auto& cluster : clusters) {
        int members = static_cast<int>(cluster.members.size());

        if (members >= kMinVelocityMembers && cluster.velocityPerHour >= m_config.velocitySpikeThreshold) {
            Detection d = ClusterDetection(SignalKind::VelocitySpike, cluster, now);
            d.severity = cluster.velocityPerHour >= 10.0 ? Severity::High : Severity::Medium;
            d.confidence = std::min(0.85, 0.4 + cluster.velocityPerHour / 20.0);
            d.title = "News velocity spike";
            d.description = "\"" + cluster.primaryTitle + "\" is spreading at " +
                            Number(cluster.velocityPerHour) + " sources/hour";
            d.details["velocity"] = Number(cluster.velocityPerHour);
            d.details["trend"] = ClusterTrendToString(cluster.trend);
            out.push_back(std::move(d));
        }

        // Unclassified sources say nothing about independent confirmation.
        std::set<SourceType> recentTypes;
        std::set<SourceType> allTypes;
        int recentMembers = 0;
        for (const auto& item : cluster.members) {
            allTypes.insert(item.sourceType);
            if (item.publishedAt >= now - kConvergenceWindow && item.publishedAt <= now) {
                ++recentMembers;
                if (item.sourceType != SourceType::Other) recentTypes.insert(item.sourceType);
            }
        }

        int typeCount = static_cast<int>(recentTypes.size());
        if (recentMembers >= kMinConvergenceMembers && typeCount >= m_config.sourceConvergenceMinTypes) {
            Detection d = ClusterDetection(SignalKind::SourceConvergence, cluster, now);
            d.severity = typeCount >= 4 ? Severity::High : Severity::Medium;
            d.confidence = std::min(0.95, 0.6 + typeCount * 0.1);
            d.title = "Multi-source convergence";
            d.description = std::to_string(typeCount) + " source types reported \"" + cluster.primaryTitle + "\" within the hour";
            d.details["sourceTypes"] = std::to_string(typeCount);
            out.push_back(std::move(d));
        }

        if (allTypes.count(SourceType::Wire) && allTypes.count(SourceType::Gov) && allTypes.count(SourceType::Intel)) {
            Detection d = ClusterDetection(SignalKind::Triangulation, cluster, now);
            d.severity = Severity::High;
            d.confidence = 0.9;
            d.title = "Intel triangulation";
            d.description = "Wire, government and intelligence sources align on \"" + cluster.primaryTitle + "\"";
            out.push_back(std::move(d));
        }

        if (isFlowDropCluster(cluster)) {
            int matching = static_cast<int>(std::count_if(cluster.members.begin(), cluster.members.end(),
                                                          [](const NewsItem& item) { return MentionsFlowDrop(item.title); }));
            matching = std::max(matching, 1);
            Detection d = ClusterDetection(SignalKind::FlowDrop, cluster, now);
            d.severity = Severity::High;
            d.confidence = std::min(0.9, 0.4 + matching / 10.0);
            d.title = "Pipeline flow disruption";
            d.description = "\"" + cluster.primaryTitle + "\"";
            d.details["matchingReports"] = std::to_string(matching);
            out.push_back(std::move(d));
        }
    }
    return out;
}

std::vector<Detection> DetectionBuilder::fromCorrelations(const std::vector<CorrelationResult>& correlations,
                                                          Timestamp now) const {
    std::vector<Detection> out;
    for (const auto& c : correlations) {
        double magnitude = std::fabs(c.movePercent);
        Detection d;
        d.subjectKey = c.symbol;
        d.occurredAt = now;
        d.details["symbol"] = c.symbol;
        d.details["change"] = Percent(c.movePercent);
        if (c.entityId) d.details["entityId"] = *c.entityId;

        switch (c.status) {
            case CorrelationStatus::NotAttempted:
                continue;
            case CorrelationStatus::Explained:
                d.kind = SignalKind::ExplainedMarketMove;
                d.severity = magnitude >= 5.0 ? Severity::Medium : Severity::Low;
                d.confidence = c.confidence;
                d.title = c.symbol + " move explained by news";
                d.description = c.symbol + " " + Percent(c.movePercent) + ": " + c.headline.value_or("");
                d.details["headline"] = c.headline.value_or("");
                d.details["matchedTerm"] = c.matchedTerm.value_or("");
                if (c.matchKind) d.details["matchKind"] = MatchKindToString(*c.matchKind);
                if (c.clusterId) d.details["clusterId"] = *c.clusterId;
                break;
            case CorrelationStatus::SilentDivergence:
                d.kind = SignalKind::SilentDivergence;
                d.severity = magnitude >= 5.0 ? Severity::High : Severity::Medium;
                d.confidence = std::min(0.8, 0.4 + magnitude / 10.0);
                d.title = "Silent divergence: " + c.symbol;
                d.description = c.symbol + " moved " + Percent(c.movePercent) + " with no related news";
                break;
        }
        out.push_back(std::move(d));
    }
    return out;
}

std::vector<Detection> DetectionBuilder::fromEnergyQuotes(const std::vector<MarketQuote>& quotes,
                                                          const std::vector<NewsCluster>& clusters,
                                                          Timestamp now) const {
    std::vector<Detection> out;
    bool flowNews = std::any_of(clusters.begin(), clusters.end(), isFlowDropCluster);
    if (flowNews) return out;

    for (const auto& quote : quotes) {
        bool energy = std::find(m_config.energySymbols.begin(), m_config.energySymbols.end(), quote.symbol) !=
                      m_config.energySymbols.end();
        if (!energy || !std::isfinite(quote.changePercent) || quote.changePercent < m_config.flowPriceThresholdPct) continue;

        Detection d;
        d.kind = SignalKind::FlowPriceDivergence;
        d.subjectKey = quote.symbol;
        d.severity = Severity::Medium;
        d.confidence = std::min(0.85, 0.4 + quote.changePercent / 8.0);
        d.title = "Energy price move without flow news";
        d.description = quote.symbol + " " + Percent(quote.changePercent) + " with no pipeline disruption reported";
        d.details["symbol"] = quote.symbol;
        d.details["change"] = Percent(quote.changePercent);
        d.occurredAt = now;
        out.push_back(std::move(d));
    }
    return out;
}

std::vector<Detection> DetectionBuilder::fromDeviations(const std::vector<MetricDeviation>& deviations,
                                                        Timestamp now) const {
    std::vector<Detection> out;
    for (const auto& md : deviations) {
        const Deviation& dev = md.deviation;
        if (!dev.zScore) continue;
        double z = *dev.zScore;

        Detection d;
        d.kind = SignalKind::TemporalAnomaly;
        d.subjectKey = md.metricKey;
        d.occurredAt = now;
        d.details["metric"] = md.metricKey;
        d.details["current"] = Number(md.current, 0);
        d.details["mean"] = Number(dev.mean);
        d.details["zScore"] = Number(z, 2);
        d.details["level"] = DeviationLevelToString(dev.level);

        switch (dev.level) {
            case DeviationLevel::Spike:
                d.severity = Severity::High;
                d.confidence = std::min(0.9, 0.5 + z / 10.0);
                d.title = "Volume spike: " + md.metricKey;
                break;
            case DeviationLevel::Elevated:
                d.severity = Severity::Medium;
                d.confidence = std::min(0.75, 0.4 + z / 10.0);
                d.title = "Elevated volume: " + md.metricKey;
                break;
            case DeviationLevel::Quiet:
                d.severity = Severity::Low;
                d.confidence = std::min(0.7, 0.4 + std::fabs(z) / 10.0);
                d.title = "Unusual quiet: " + md.metricKey;
                break;
            case DeviationLevel::Normal:
            case DeviationLevel::InsufficientData:
                continue;
        }
        d.description = Number(md.current, 0) + " observed against a mean of " + Number(dev.mean) +
                        " (z=" + Number(z, 2) + ")";
        out.push_back(std::move(d));
    }
    return out;
}

std::vector<Detection> DetectionBuilder::fromConvergence(const std::vector<ConvergenceAlert>& alerts, Timestamp now) const {
    std::vector<Detection> out;
    for (const auto& alert : alerts) {
        Detection d;
        d.kind = SignalKind::GeoConvergence;
        d.subjectKey = alert.cellId;
        d.severity = FromConvergenceLevel(alert.level);
        d.confidence = std::min(0.95, alert.score / 100.0);
        d.title = "Geographic convergence";
        std::string kinds;
        for (const auto& [kind, count] : alert.eventsByKind) {
            if (!kinds.empty()) kinds += ", ";
            kinds += std::to_string(count) + " " + GeoEventKindToString(kind);
        }
        d.description = std::to_string(alert.distinctKinds) + " event types near " + Number(alert.centerLat) + ", " +
                        Number(alert.centerLon) + ": " + kinds;
        d.details["cellId"] = alert.cellId;
        d.details["score"] = std::to_string(alert.score);
        d.details["lat"] = Number(alert.centerLat);
        d.details["lon"] = Number(alert.centerLon);
        d.occurredAt = now;
        out.push_back(std::move(d));
    }
    return out;
}

Severity DetectionBuilder::ciiPriority(const CountryScore& score) {
    int magnitude = std::abs(score.change);
    if (score.level == InstabilityLevel::Critical) return Severity::Critical;
    if (score.level == InstabilityLevel::High || magnitude >= 30) return Severity::High;
    if (score.level == InstabilityLevel::Elevated || magnitude >= 15) return Severity::Medium;
    return Severity::Low;
}

std::vector<Detection> DetectionBuilder::fromCountryScores(const std::vector<CountryScore>& scores, Timestamp now) const {
    std::vector<Detection> out;
    for (const auto& score : scores) {
        if (!score.hasPrevious || std::abs(score.change) < m_config.ciiChangeAlertThreshold) continue;

        std::string name = score.countryName.empty() ? score.countryCode : score.countryName;
        Detection d;
        d.kind = SignalKind::CiiSpike;
        d.subjectKey = score.countryCode;
        d.severity = ciiPriority(score);
        d.confidence = std::min(0.9, 0.5 + std::abs(score.change) / 50.0);
        d.title = name + " instability " + (score.change > 0 ? "rising" : "falling");
        d.description = name + " CII " + std::to_string(score.composite) + " (" +
                        (score.change > 0 ? "+" : "") + std::to_string(score.change) + ", " +
                        InstabilityLevelToString(score.level) + ")";
        d.details["country"] = score.countryCode;
        d.details["composite"] = std::to_string(score.composite);
        d.details["change"] = std::to_string(score.change);
        d.occurredAt = now;
        out.push_back(std::move(d));
    }
    return out;
}

} // namespace worldpulse::application
