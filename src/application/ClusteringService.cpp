/**
 * @file ClusteringService.cpp
 * @brief Implementation of ClusteringService.
 */

#include "application/ClusteringService.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <numeric>
#include <set>

namespace worldpulse::application {

using namespace worldpulse::domain;

namespace {

constexpr std::size_t kIdTitlePrefix = 20;
constexpr std::size_t kTopSources = 3;

/** Path-halving union-find. The smaller index always becomes the root. */
class DisjointSet {
public:
    explicit DisjointSet(std::size_t n) : m_parent(n) {
        std::iota(m_parent.begin(), m_parent.end(), 0);
    }

    std::size_t find(std::size_t x) {
        while (m_parent[x] != x) {
            m_parent[x] = m_parent[m_parent[x]];
            x = m_parent[x];
        }
        return x;
    }

    void unite(std::size_t a, std::size_t b) {
        a = find(a);
        b = find(b);
        if (a == b) return;
        if (b < a) std::swap(a, b);
        m_parent[b] = a;
    }

private:
    std::vector<std::size_t> m_parent;
};

bool CanonicalLess(const NewsItem& a, const NewsItem& b) {
    if (a.id != b.id) return a.id < b.id;
    if (a.publishedAt != b.publishedAt) return a.publishedAt < b.publishedAt;
    if (a.title != b.title) return a.title < b.title;
    return a.sourceId < b.sourceId;
}

// Lowest tier first, then most recent, then smallest id.
bool PrimaryLess(const NewsItem& a, const NewsItem& b) {
    if (a.sourceTier != b.sourceTier) return a.sourceTier < b.sourceTier;
    if (a.publishedAt != b.publishedAt) return a.publishedAt > b.publishedAt;
    return CanonicalLess(a, b);
}

std::string TitleSlug(const std::string& title) {
    std::string slug;
    for (std::size_t i = 0; i < title.size() && i < kIdTitlePrefix; ++i) {
        unsigned char c = static_cast<unsigned char>(title[i]);
        if (std::isalnum(c) || c == '_') slug.push_back(static_cast<char>(c));
    }
    return slug;
}

ClusterTrend ComputeTrend(const std::vector<NewsItem>& members, Timestamp first, Timestamp last) {
    auto span = last - first;
    if (span < std::chrono::minutes(1)) return ClusterTrend::Stable;

    Timestamp midpoint = first + span / 2;
    int firstHalf = 0;
    int secondHalf = 0;
    for (const auto& item : members) {
        if (item.publishedAt < midpoint) {
            ++firstHalf;
        } else {
            ++secondHalf;
        }
    }
    if (secondHalf > firstHalf * 1.2) return ClusterTrend::Rising;
    if (secondHalf < firstHalf * 0.8) return ClusterTrend::Falling;
    return ClusterTrend::Stable;
}

} // namespace

ClusteringService::ClusteringService(double similarityThreshold) : m_threshold(similarityThreshold) {}

std::vector<NewsCluster> ClusteringService::cluster(const std::vector<NewsItem>& items) const {
    if (items.empty()) return {};

    // A canonical order makes component numbering and id collision handling independent of input order.
    std::vector<NewsItem> sorted = items;
    std::sort(sorted.begin(), sorted.end(), CanonicalLess);

    TokenCache cache;
    std::vector<TokenSet> tokens;
    tokens.reserve(sorted.size());
    for (const auto& item : sorted) tokens.push_back(cache.get(item.title));

    InvertedIndex index = Tokenizer::buildInvertedIndex(tokens);
    DisjointSet groups(sorted.size());

    for (std::size_t i = 0; i < sorted.size(); ++i) {
        std::set<std::size_t> candidates;
        for (const auto& token : tokens[i]) {
            const auto& holders = index[token];
            candidates.insert(holders.upper_bound(i), holders.end());
        }
        for (std::size_t j : candidates) {
            if (Tokenizer::jaccard(tokens[i], tokens[j]) >= m_threshold) {
                groups.unite(i, j);
            }
        }
    }

    std::map<std::size_t, std::vector<NewsItem>> components;
    for (std::size_t i = 0; i < sorted.size(); ++i) {
        components[groups.find(i)].push_back(sorted[i]);
    }

    std::vector<NewsCluster> clusters;
    clusters.reserve(components.size());
    std::set<std::string> usedIds;
    for (auto& [root, members] : components) {
        NewsCluster built = buildCluster(std::move(members), cache);
        std::string baseId = built.id;
        for (int suffix = 2; !usedIds.insert(built.id).second; ++suffix) {
            built.id = baseId + "-" + std::to_string(suffix);
        }
        clusters.push_back(std::move(built));
    }

    std::sort(clusters.begin(), clusters.end(), [](const NewsCluster& a, const NewsCluster& b) {
        if (a.lastUpdatedAt != b.lastUpdatedAt) return a.lastUpdatedAt > b.lastUpdatedAt;
        return a.id < b.id;
    });
    return clusters;
}

NewsCluster ClusteringService::buildCluster(std::vector<NewsItem> members, TokenCache& cache) const {
    std::sort(members.begin(), members.end(), PrimaryLess);

    NewsCluster cluster;
    const NewsItem& primary = members.front();
    cluster.primaryItemId = primary.id;
    cluster.primaryTitle = primary.title;
    cluster.primarySource = primary.sourceId;
    cluster.primaryLink = primary.link;

    const NewsItem* earliest = &members.front();
    cluster.firstSeenAt = primary.publishedAt;
    cluster.lastUpdatedAt = primary.publishedAt;
    for (const auto& item : members) {
        cluster.memberIds.insert(item.id);
        const auto& itemTokens = cache.get(item.title);
        cluster.tokens.insert(itemTokens.begin(), itemTokens.end());
        cluster.isAlert = cluster.isAlert || item.isAlert;
        cluster.lastUpdatedAt = std::max(cluster.lastUpdatedAt, item.publishedAt);
        if (item.publishedAt < earliest->publishedAt ||
            (item.publishedAt == earliest->publishedAt && CanonicalLess(item, *earliest))) {
            earliest = &item;
        }
        if (cluster.topSources.size() < kTopSources &&
            std::find(cluster.topSources.begin(), cluster.topSources.end(), item.sourceId) == cluster.topSources.end()) {
            cluster.topSources.push_back(item.sourceId);
        }
    }
    cluster.firstSeenAt = earliest->publishedAt;
    cluster.id = std::to_string(ToEpochMillis(earliest->publishedAt)) + "-" + TitleSlug(earliest->title);

    double spanHours = std::chrono::duration<double, std::ratio<3600>>(cluster.lastUpdatedAt - cluster.firstSeenAt).count();
    spanHours = std::max(spanHours, 1.0 / 60.0);
    cluster.velocityPerHour = static_cast<double>(members.size()) / spanHours;
    cluster.trend = ComputeTrend(members, cluster.firstSeenAt, cluster.lastUpdatedAt);

    cluster.members = std::move(members);
    return cluster;
}

} // namespace worldpulse::application
