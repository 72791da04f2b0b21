/**
 * @file SignalGenerator.hpp
 * @brief Converts detections into deduplicated, ordered signals.
 */

#pragma once

#include <map>
#include <string>
#include <vector>
#include "domain/Signal.hpp"

namespace worldpulse::application {

/**
 * @class DedupTable
 * @brief (kind, subjectKey) → expiry. Expired entries are removed when looked up.
 */
class DedupTable {
public:
    static std::string keyFor(domain::SignalKind kind, const std::string& subjectKey);

    /** @brief True while an unexpired entry exists; drops the entry once it has expired. */
    bool isSuppressed(const std::string& key, domain::Timestamp now);

    void insert(const std::string& key, domain::Timestamp expiresAt);

    /** @brief Drops every expired entry. */
    void sweep(domain::Timestamp now);

    std::size_t size() const { return m_entries.size(); }

private:
    std::map<std::string, domain::Timestamp> m_entries;
};

struct SignalSettings {
    double minConfidence = 0.5;
    std::chrono::minutes learningMode{15};
};

/**
 * @class SignalGenerator
 * @brief Applies confidence defaults, the learning-mode gate and per-kind TTL deduplication.
 *
 * The dedup table is passed in so the orchestrator can generate against a
 * staged copy and commit it only when the whole cycle succeeds.
 */
class SignalGenerator {
public:
    SignalGenerator(SignalSettings settings, domain::Timestamp startedAt);

    /**
     * @brief Emits one signal per unsuppressed (kind, subjectKey).
     * @return Signals sorted by severity, confidence and recency, all descending.
     */
    std::vector<domain::Signal> generate(const std::vector<domain::Detection>& detections,
                                         DedupTable& dedup,
                                         domain::Timestamp now) const;

    /** @brief CII signals are withheld while this is true. */
    bool inLearningMode(domain::Timestamp now) const;

    static domain::Clock::duration ttlFor(domain::SignalKind kind);
    static double defaultConfidence(domain::SignalKind kind);
    static std::string signalId(domain::SignalKind kind, const std::string& subjectKey, domain::Timestamp at);

    domain::Timestamp startedAt() const { return m_startedAt; }

private:
    SignalSettings m_settings;
    domain::Timestamp m_startedAt;
};

} // namespace worldpulse::application
