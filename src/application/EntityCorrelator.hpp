/**
 * @file EntityCorrelator.hpp
 * @brief Explains market moves with news clusters via the entity registry.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "domain/CorrelationResult.hpp"
#include "domain/EntityRegistry.hpp"
#include "domain/MarketQuote.hpp"
#include "domain/NewsCluster.hpp"

namespace worldpulse::application {

/**
 * @struct SearchTerm
 * @brief A phrase to look for in headlines and the confidence a hit is worth.
 */
struct SearchTerm {
    std::string phrase;
    domain::MatchKind kind = domain::MatchKind::Alias;
    double confidence = 0.0;
};

/**
 * @class EntityCorrelator
 * @brief Matches a moved symbol against cluster headlines.
 *
 * The term set is one hop deep: the entity's own aliases and keywords, plus
 * the aliases of sector peers and related entities. It never recurses further.
 */
class EntityCorrelator {
public:
    static constexpr double kAliasConfidence = 0.95;
    static constexpr double kKeywordConfidence = 0.70;
    static constexpr double kRelatedConfidence = 0.60;

    EntityCorrelator(std::shared_ptr<const domain::EntityRegistry> registry, double moveThresholdPct = 2.0);

    domain::CorrelationResult correlate(const std::string& symbol,
                                        double movePercent,
                                        const std::vector<domain::NewsCluster>& clusters) const;

    /** @brief Correlates every quote of a batch, in input order. */
    std::vector<domain::CorrelationResult> correlateAll(const std::vector<domain::MarketQuote>& quotes,
                                                        const std::vector<domain::NewsCluster>& clusters) const;

    /** @brief Resolves a symbol (alias first, then id) to its search terms. */
    std::vector<SearchTerm> searchTerms(const std::string& symbol, const domain::EntityRecord** resolved) const;

private:
    std::shared_ptr<const domain::EntityRegistry> m_registry;
    double m_moveThresholdPct;
};

} // namespace worldpulse::application
