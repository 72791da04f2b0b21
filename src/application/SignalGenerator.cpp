/**
 * @file SignalGenerator.cpp
 * @brief Implementation of SignalGenerator and DedupTable.
 */

#include "application/SignalGenerator.hpp"
#include <algorithm>
#include <cmath>

namespace worldpulse::application {

using namespace worldpulse::domain;

namespace {

constexpr std::size_t kSweepAbove = 4096;

} // namespace

std::string DedupTable::keyFor(SignalKind kind, const std::string& subjectKey) {
    return SignalKindToString(kind) + "|" + subjectKey;
}

bool DedupTable::isSuppressed(const std::string& key, Timestamp now) {
    auto it = m_entries.find(key);
    if (it == m_entries.end()) return false;
    if (it->second > now) return true;
    m_entries.erase(it);
    return false;
}

void DedupTable::insert(const std::string& key, Timestamp expiresAt) {
    m_entries[key] = expiresAt;
}

void DedupTable::sweep(Timestamp now) {
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (it->second <= now) {
            it = m_entries.erase(it);
        } else {
            ++it;
        }
    }
}

SignalGenerator::SignalGenerator(SignalSettings settings, Timestamp startedAt)
    : m_settings(settings), m_startedAt(startedAt) {}

bool SignalGenerator::inLearningMode(Timestamp now) const {
    return now - m_startedAt < m_settings.learningMode;
}

Clock::duration SignalGenerator::ttlFor(SignalKind kind) {
    switch (kind) {
        case SignalKind::SilentDivergence:
        case SignalKind::FlowPriceDivergence:
        case SignalKind::ExplainedMarketMove:
            return std::chrono::hours(6);
        case SignalKind::PredictionLeadsNews:
            return std::chrono::hours(2);
        case SignalKind::FlowDrop:
        case SignalKind::VelocitySpike:
        case SignalKind::TemporalAnomaly:
        case SignalKind::SourceConvergence:
        case SignalKind::Triangulation:
        case SignalKind::GeoConvergence:
        case SignalKind::CiiSpike:
        case SignalKind::MilitarySurge:
            return std::chrono::minutes(30);
    }
    return std::chrono::minutes(30);
}

double SignalGenerator::defaultConfidence(SignalKind kind) {
    switch (kind) {
        case SignalKind::PredictionLeadsNews: return 0.7;
        case SignalKind::SilentDivergence: return 0.6;
        case SignalKind::ExplainedMarketMove: return 0.8;
        case SignalKind::FlowPriceDivergence: return 0.65;
        case SignalKind::FlowDrop: return 0.7;
        case SignalKind::VelocitySpike: return 0.6;
        case SignalKind::TemporalAnomaly: return 0.6;
        case SignalKind::SourceConvergence: return 0.7;
        case SignalKind::Triangulation: return 0.9;
        case SignalKind::GeoConvergence: return 0.75;
        case SignalKind::CiiSpike: return 0.7;
        case SignalKind::MilitarySurge: return 0.8;
    }
    return 0.5;
}

std::string SignalGenerator::signalId(SignalKind kind, const std::string& subjectKey, Timestamp at) {
    return SignalKindToString(kind) + ":" + subjectKey + "@" + std::to_string(ToEpochMillis(at));
}

std::vector<Signal> SignalGenerator::generate(const std::vector<Detection>& detections,
                                              DedupTable& dedup,
                                              Timestamp now) const {
    if (dedup.size() > kSweepAbove) dedup.sweep(now);

    struct Candidate {
        const Detection* detection;
        double confidence;
        Timestamp at;
    };
    std::vector<Candidate> candidates;
    bool learning = inLearningMode(now);
    for (const auto& d : detections) {
        if (learning && d.kind == SignalKind::CiiSpike) continue;
        double confidence = d.confidence.value_or(defaultConfidence(d.kind));
        if (!std::isfinite(confidence)) confidence = defaultConfidence(d.kind);
        confidence = std::max(0.0, std::min(1.0, confidence));
        if (confidence < m_settings.minConfidence) continue;
        Timestamp at = d.occurredAt == Timestamp{} ? now : d.occurredAt;
        candidates.push_back(Candidate{&d, confidence, at});
    }

    // Within a batch the strongest detection of a subject is the one that fires.
    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        const Detection& da = *a.detection;
        const Detection& db = *b.detection;
        if (da.severity != db.severity) return da.severity > db.severity;
        if (a.confidence != b.confidence) return a.confidence > b.confidence;
        if (a.at != b.at) return a.at > b.at;
        if (da.kind != db.kind) return da.kind < db.kind;
        return da.subjectKey < db.subjectKey;
    });

    std::vector<Signal> signals;
    for (const auto& c : candidates) {
        const Detection& d = *c.detection;
        std::string key = DedupTable::keyFor(d.kind, d.subjectKey);
        if (dedup.isSuppressed(key, now)) continue;
        dedup.insert(key, now + ttlFor(d.kind));

        Signal s;
        s.firstFiredAt = c.at;
        s.id = signalId(d.kind, d.subjectKey, s.firstFiredAt);
        s.kind = d.kind;
        s.subjectKey = d.subjectKey;
        s.confidence = c.confidence;
        s.severity = d.severity;
        s.title = d.title;
        s.description = d.description;
        s.details = d.details;
        signals.push_back(std::move(s));
    }
    return signals;
}

} // namespace worldpulse::application
