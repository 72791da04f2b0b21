/**
 * @file NewsItem.hpp
 * @brief A single headline delivered by the news collaborator.
 */

#pragma once

#include <string>
#include <optional>
#include "domain/Clock.hpp"

namespace worldpulse::domain {

/**
 * @enum SourceType
 * @brief Editorial class of the publishing source.
 */
enum class SourceType {
    Wire,
    Gov,
    Intel,
    Mainstream,
    Market,
    Tech,
    Other
};

inline std::string SourceTypeToString(SourceType type) {
    switch (type) {
        case SourceType::Wire: return "wire";
        case SourceType::Gov: return "gov";
        case SourceType::Intel: return "intel";
        case SourceType::Mainstream: return "mainstream";
        case SourceType::Market: return "market";
        case SourceType::Tech: return "tech";
        case SourceType::Other: return "other";
    }
    return "other";
}

inline std::optional<SourceType> SourceTypeFromString(const std::string& value) {
    if (value == "wire") return SourceType::Wire;
    if (value == "gov") return SourceType::Gov;
    if (value == "intel") return SourceType::Intel;
    if (value == "mainstream") return SourceType::Mainstream;
    if (value == "market") return SourceType::Market;
    if (value == "tech") return SourceType::Tech;
    if (value == "other") return SourceType::Other;
    return std::nullopt;
}

/**
 * @struct NewsItem
 * @brief Immutable headline record. Read-only to the analysis core.
 */
struct NewsItem {
    std::string id;                     ///< Stable item identity (usually the link).
    std::string sourceId;               ///< Publishing source name.
    std::string title;
    std::string link;
    std::string category = "general";   ///< Feed category, keys the volume baseline.
    Timestamp publishedAt{};
    int sourceTier = 4;                 ///< 1 = most authoritative, 4 = least.
    SourceType sourceType = SourceType::Other;
    bool isAlert = false;               ///< Breaking-news flag set by the collaborator.
};

} // namespace worldpulse::domain
