/**
 * @file ClusteringService.hpp
 * @brief Groups related headlines into clusters using token similarity.
 */

#pragma once

#include <vector>
#include "domain/NewsItem.hpp"
#include "domain/NewsCluster.hpp"
#include "domain/Tokenizer.hpp"

namespace worldpulse::application {

/**
 * @class ClusteringService
 * @brief Order-independent single-link clustering over index candidates.
 *
 * Only pairs sharing at least one token are compared. Pairs whose Jaccard
 * similarity reaches the threshold are unioned; each connected component
 * becomes one NewsCluster.
 */
class ClusteringService {
public:
    explicit ClusteringService(double similarityThreshold = 0.5);

    /**
     * @brief Clusters a batch of headlines.
     * @return Clusters sorted by lastUpdatedAt descending, then id.
     */
    std::vector<domain::NewsCluster> cluster(const std::vector<domain::NewsItem>& items) const;

    double threshold() const { return m_threshold; }

private:
    domain::NewsCluster buildCluster(std::vector<domain::NewsItem> members,
                                     domain::TokenCache& cache) const;

    double m_threshold;
};

} // namespace worldpulse::application
