/**
 * @file EntityCorrelator.cpp
 * @brief Implementation of EntityCorrelator.
 */

#include "application/EntityCorrelator.hpp"
#include <cmath>
#include <map>
#include <optional>

namespace worldpulse::application {

using namespace worldpulse::domain;

namespace {

struct ClusterHit {
    const NewsCluster* cluster = nullptr;
    const SearchTerm* term = nullptr;
};

// Best hit of the term set against one title: the strongest term, never a sum.
const SearchTerm* BestTerm(const MatchText& text, const std::vector<SearchTerm>& terms) {
    const SearchTerm* best = nullptr;
    for (const auto& term : terms) {
        bool hit = term.kind == MatchKind::Keyword ? text::MatchesKeyword(text, term.phrase)
                                                   : text::ContainsPhrase(text, term.phrase);
        if (hit && (!best || term.confidence > best->confidence)) {
            best = &term;
        }
    }
    return best;
}

bool BetterHit(const ClusterHit& a, const ClusterHit& b) {
    if (a.term->confidence != b.term->confidence) return a.term->confidence > b.term->confidence;
    if (a.cluster->members.size() != b.cluster->members.size()) return a.cluster->members.size() > b.cluster->members.size();
    if (a.cluster->lastUpdatedAt != b.cluster->lastUpdatedAt) return a.cluster->lastUpdatedAt > b.cluster->lastUpdatedAt;
    return a.cluster->id < b.cluster->id;
}

std::optional<ClusterHit> Scan(const std::vector<NewsCluster>& clusters,
                               const std::vector<SearchTerm>& terms,
                               bool memberTitles) {
    std::optional<ClusterHit> best;
    for (const auto& cluster : clusters) {
        const SearchTerm* term = nullptr;
        if (memberTitles) {
            for (const auto& member : cluster.members) {
                const SearchTerm* candidate = BestTerm(text::Prepare(member.title), terms);
                if (candidate && (!term || candidate->confidence > term->confidence)) term = candidate;
            }
        } else {
            term = BestTerm(text::Prepare(cluster.primaryTitle), terms);
        }
        if (!term) continue;

        ClusterHit hit{&cluster, term};
        if (!best || BetterHit(hit, *best)) best = hit;
    }
    return best;
}

} // namespace

EntityCorrelator::EntityCorrelator(std::shared_ptr<const EntityRegistry> registry, double moveThresholdPct)
    : m_registry(std::move(registry)), m_moveThresholdPct(moveThresholdPct) {}

std::vector<SearchTerm> EntityCorrelator::searchTerms(const std::string& symbol, const EntityRecord** resolved) const {
    const EntityRecord* entity = nullptr;
    if (m_registry) {
        entity = m_registry->byAlias(symbol);
        if (!entity) entity = m_registry->byId(symbol);
    }
    if (resolved) *resolved = entity;

    // Keeps the strongest confidence per phrase.
    std::map<std::string, SearchTerm> terms;
    auto add = [&terms](const std::string& phrase, MatchKind kind, double confidence) {
        std::string key = text::ToLower(text::Trim(phrase));
        if (key.empty()) return;
        auto it = terms.find(key);
        if (it == terms.end() || it->second.confidence < confidence) {
            terms[key] = SearchTerm{key, kind, confidence};
        }
    };

    if (!entity) {
        add(symbol, MatchKind::Alias, kAliasConfidence);
    } else {
        add(entity->displayName, MatchKind::Alias, kAliasConfidence);
        for (const auto& alias : entity->aliases) add(alias, MatchKind::Alias, kAliasConfidence);
        for (const auto& keyword : entity->keywords) add(keyword, MatchKind::Keyword, kKeywordConfidence);

        std::vector<const EntityRecord*> neighbours;
        if (!entity->sector.empty()) neighbours = m_registry->bySector(entity->sector);
        for (const auto& relatedId : entity->relatedIds) {
            if (const auto* related = m_registry->byId(relatedId)) neighbours.push_back(related);
        }
        for (const auto* neighbour : neighbours) {
            if (neighbour == entity) continue;
            for (const auto& alias : neighbour->aliases) add(alias, MatchKind::Related, kRelatedConfidence);
        }
    }

    std::vector<SearchTerm> out;
    out.reserve(terms.size());
    for (auto& [key, term] : terms) out.push_back(std::move(term));
    return out;
}

CorrelationResult EntityCorrelator::correlate(const std::string& symbol,
                                              double movePercent,
                                              const std::vector<NewsCluster>& clusters) const {
    CorrelationResult result;
    result.symbol = symbol;
    result.movePercent = movePercent;
    if (!std::isfinite(movePercent) || std::fabs(movePercent) < m_moveThresholdPct) {
        return result;
    }

    const EntityRecord* entity = nullptr;
    auto terms = searchTerms(symbol, &entity);
    if (entity) result.entityId = entity->id;

    auto hit = Scan(clusters, terms, false);
    if (!hit) hit = Scan(clusters, terms, true);

    if (!hit) {
        result.status = CorrelationStatus::SilentDivergence;
        return result;
    }

    result.status = CorrelationStatus::Explained;
    result.clusterId = hit->cluster->id;
    result.headline = hit->cluster->primaryTitle;
    result.matchedTerm = hit->term->phrase;
    result.matchKind = hit->term->kind;
    result.confidence = hit->term->confidence;
    return result;
}

std::vector<CorrelationResult> EntityCorrelator::correlateAll(const std::vector<MarketQuote>& quotes,
                                                              const std::vector<NewsCluster>& clusters) const {
    std::vector<CorrelationResult> results;
    results.reserve(quotes.size());
    for (const auto& quote : quotes) {
        results.push_back(correlate(quote.symbol, quote.changePercent, clusters));
    }
    return results;
}

} // namespace worldpulse::application
