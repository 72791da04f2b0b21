/**
 * @file CorrelationResult.hpp
 * @brief Outcome of matching a market mover against the current news clusters.
 */

#pragma once

#include <string>
#include <optional>

namespace worldpulse::domain {

enum class CorrelationStatus {
    NotAttempted,       ///< Move below the threshold.
    Explained,
    SilentDivergence
};

inline std::string CorrelationStatusToString(CorrelationStatus status) {
    switch (status) {
        case CorrelationStatus::NotAttempted: return "not_attempted";
        case CorrelationStatus::Explained: return "explained";
        case CorrelationStatus::SilentDivergence: return "silent_divergence";
    }
    return "not_attempted";
}

enum class MatchKind {
    Alias,
    Keyword,
    Related
};

inline std::string MatchKindToString(MatchKind kind) {
    switch (kind) {
        case MatchKind::Alias: return "alias";
        case MatchKind::Keyword: return "keyword";
        case MatchKind::Related: return "related";
    }
    return "alias";
}

struct CorrelationResult {
    std::string symbol;
    double movePercent = 0.0;
    CorrelationStatus status = CorrelationStatus::NotAttempted;
    std::optional<std::string> entityId;    ///< Empty when the symbol is not in the registry.
    std::optional<std::string> clusterId;
    std::optional<std::string> headline;    ///< Primary title of the explaining cluster.
    std::optional<std::string> matchedTerm;
    std::optional<MatchKind> matchKind;
    double confidence = 0.0;
};

} // namespace worldpulse::domain
