/**
 * @file NewsCluster.hpp
 * @brief Group of related headlines produced by the clustering stage.
 */

#pragma once

#include <string>
#include <vector>
#include <set>
#include "domain/NewsItem.hpp"

namespace worldpulse::domain {

enum class ClusterTrend {
    Rising,
    Stable,
    Falling
};

inline std::string ClusterTrendToString(ClusterTrend trend) {
    switch (trend) {
        case ClusterTrend::Rising: return "rising";
        case ClusterTrend::Stable: return "stable";
        case ClusterTrend::Falling: return "falling";
    }
    return "stable";
}

/**
 * @struct NewsCluster
 * @brief Connected component of headlines whose titles cross the similarity threshold.
 *
 * Members are connected through the union of similar pairs; two members need
 * not be similar to each other directly.
 */
struct NewsCluster {
    std::string id;
    std::set<std::string> memberIds;
    std::string primaryItemId;
    std::string primaryTitle;
    std::string primarySource;
    std::string primaryLink;
    std::set<std::string> tokens;       ///< Union of member title tokens.
    std::vector<NewsItem> members;      ///< Primary first, then tier/recency order.
    std::vector<std::string> topSources;
    Timestamp firstSeenAt{};
    Timestamp lastUpdatedAt{};
    double velocityPerHour = 0.0;
    ClusterTrend trend = ClusterTrend::Stable;
    bool isAlert = false;

    std::size_t sourceCount() const { return members.size(); }
};

} // namespace worldpulse::domain
