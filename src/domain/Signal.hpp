/**
 * @file Signal.hpp
 * @brief Detections (analyser output) and the deduplicated signals built from them.
 */

#pragma once

#include <string>
#include <map>
#include <optional>
#include "domain/Clock.hpp"

namespace worldpulse::domain {

/**
 * @enum SignalKind
 * @brief The twelve situations the generator can report.
 */
enum class SignalKind {
    PredictionLeadsNews,
    SilentDivergence,
    ExplainedMarketMove,
    FlowPriceDivergence,
    FlowDrop,
    VelocitySpike,
    TemporalAnomaly,
    SourceConvergence,
    Triangulation,
    GeoConvergence,
    CiiSpike,
    MilitarySurge
};

inline std::string SignalKindToString(SignalKind kind) {
    switch (kind) {
        case SignalKind::PredictionLeadsNews: return "prediction_leads_news";
        case SignalKind::SilentDivergence: return "silent_divergence";
        case SignalKind::ExplainedMarketMove: return "explained_market_move";
        case SignalKind::FlowPriceDivergence: return "flow_price_divergence";
        case SignalKind::FlowDrop: return "flow_drop";
        case SignalKind::VelocitySpike: return "velocity_spike";
        case SignalKind::TemporalAnomaly: return "temporal_anomaly";
        case SignalKind::SourceConvergence: return "source_convergence";
        case SignalKind::Triangulation: return "triangulation";
        case SignalKind::GeoConvergence: return "geo_convergence";
        case SignalKind::CiiSpike: return "cii_spike";
        case SignalKind::MilitarySurge: return "military_surge";
    }
    return "velocity_spike";
}

inline std::optional<SignalKind> SignalKindFromString(const std::string& value) {
    if (value == "prediction_leads_news") return SignalKind::PredictionLeadsNews;
    if (value == "silent_divergence") return SignalKind::SilentDivergence;
    if (value == "explained_market_move") return SignalKind::ExplainedMarketMove;
    if (value == "flow_price_divergence") return SignalKind::FlowPriceDivergence;
    if (value == "flow_drop") return SignalKind::FlowDrop;
    if (value == "velocity_spike") return SignalKind::VelocitySpike;
    if (value == "temporal_anomaly") return SignalKind::TemporalAnomaly;
    if (value == "source_convergence") return SignalKind::SourceConvergence;
    if (value == "triangulation") return SignalKind::Triangulation;
    if (value == "geo_convergence") return SignalKind::GeoConvergence;
    if (value == "cii_spike") return SignalKind::CiiSpike;
    if (value == "military_surge") return SignalKind::MilitarySurge;
    return std::nullopt;
}

/** @brief Ordered so that a larger value is more severe. */
enum class Severity {
    Low = 0,
    Medium = 1,
    High = 2,
    Critical = 3
};

inline std::string SeverityToString(Severity severity) {
    switch (severity) {
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
        case Severity::Critical: return "critical";
    }
    return "low";
}

inline std::optional<Severity> SeverityFromString(const std::string& value) {
    if (value == "low") return Severity::Low;
    if (value == "medium") return Severity::Medium;
    if (value == "high") return Severity::High;
    if (value == "critical") return Severity::Critical;
    return std::nullopt;
}

/**
 * @struct Detection
 * @brief Pre-classified finding handed to the signal generator.
 *
 * subjectKey identifies what the detection is about and must not contain
 * magnitudes (percentages, counts), so repeats collapse under deduplication.
 */
struct Detection {
    SignalKind kind = SignalKind::VelocitySpike;
    std::string subjectKey;
    Severity severity = Severity::Medium;
    std::optional<double> confidence;   ///< Empty: the generator applies the per-kind default.
    std::string title;
    std::string description;
    std::map<std::string, std::string> details;
    Timestamp occurredAt{};
};

/**
 * @struct Signal
 * @brief Emitted, deduplicated situation report.
 */
struct Signal {
    std::string id;
    SignalKind kind = SignalKind::VelocitySpike;
    std::string subjectKey;
    double confidence = 0.0;
    Severity severity = Severity::Medium;
    Timestamp firstFiredAt{};
    std::string title;
    std::string description;
    std::map<std::string, std::string> details;
};

} // namespace worldpulse::domain
