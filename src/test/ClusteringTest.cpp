#include <iostream>
#include <cassert>
#include <algorithm>
#include <cmath>
#include <random>
#include <set>
#include <string>
#include <vector>
#include "application/ClusteringService.hpp"
#include "domain/Tokenizer.hpp"

using namespace worldpulse::domain;
using namespace worldpulse::application;

namespace {

NewsItem MakeItem(const std::string& id, const std::string& title, const std::string& source,
                  Timestamp at, int tier = 4) {
    NewsItem item;
    item.id = id;
    item.sourceId = source;
    item.title = title;
    item.link = "https://example.test/" + id;
    item.publishedAt = at;
    item.sourceTier = tier;
    return item;
}

const NewsCluster* FindContaining(const std::vector<NewsCluster>& clusters, const std::string& itemId) {
    for (const auto& c : clusters) {
        if (c.memberIds.count(itemId)) return &c;
    }
    return nullptr;
}

std::vector<std::set<std::string>> Partition(const std::vector<NewsCluster>& clusters) {
    std::vector<std::set<std::string>> out;
    for (const auto& c : clusters) out.push_back(c.memberIds);
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Clustering Test..." << std::endl;

    const Timestamp t0 = FromEpochMillis(1760000000000);
    ClusteringService service(0.5);

    // 1. Related headlines merge, unrelated one stands alone
    std::vector<NewsItem> items = {
        MakeItem("a", "Broadcom AI Revenue Beats Estimates", "reuters", t0, 1),
        MakeItem("b", "Broadcom Posts Strong AI Chip Revenue", "cnbc", t0, 3),
        MakeItem("c", "Fed Holds Interest Rates Steady", "bloomberg", t0, 2),
    };
    auto clusters = service.cluster(items);
    assert(clusters.size() == 2);
    const NewsCluster* broadcom = FindContaining(clusters, "a");
    assert(broadcom != nullptr);
    assert(broadcom->memberIds.count("b") == 1);
    assert(broadcom->members.size() == 2);
    assert(broadcom->primaryItemId == "a");
    assert(broadcom->primarySource == "reuters");
    const NewsCluster* fed = FindContaining(clusters, "c");
    assert(fed != nullptr && fed != broadcom);
    assert(fed->memberIds.size() == 1);
    std::cout << "[PASS] Broadcom headlines cluster together" << std::endl;

    // 2. Every item lands in exactly one cluster
    std::size_t total = 0;
    for (const auto& c : clusters) total += c.memberIds.size();
    assert(total == items.size());
    assert(service.cluster({}).empty());
    std::cout << "[PASS] Partition covers every item once" << std::endl;

    // 3. Input order does not change the partition or the ids
    std::vector<NewsItem> larger = items;
    larger.push_back(MakeItem("d", "Broadcom Chip Revenue Surges", "ap", t0 + std::chrono::minutes(20), 2));
    larger.push_back(MakeItem("e", "Fed Interest Rates Decision Looms", "wsj", t0 + std::chrono::minutes(5), 2));
    larger.push_back(MakeItem("f", "Earthquake Strikes Coastal Chile", "usgs", t0 + std::chrono::minutes(7), 1));
    auto reference = service.cluster(larger);

    std::mt19937 rng(42);
    for (int round = 0; round < 10; ++round) {
        auto shuffled = larger;
        std::shuffle(shuffled.begin(), shuffled.end(), rng);
        auto result = service.cluster(shuffled);
        assert(Partition(result) == Partition(reference));
        assert(result.size() == reference.size());
        for (std::size_t i = 0; i < result.size(); ++i) {
            assert(result[i].id == reference[i].id);
            assert(result[i].primaryItemId == reference[i].primaryItemId);
        }
    }
    std::cout << "[PASS] Order independence" << std::endl;

    // 4. Re-running on the same input is idempotent
    auto again = service.cluster(larger);
    assert(Partition(again) == Partition(reference));

    // Re-clustering two produced clusters together keeps them apart;
    // their primary titles never reach the threshold.
    assert(reference.size() >= 3);
    int pairsChecked = 0;
    for (std::size_t i = 0; i < reference.size(); ++i) {
        for (std::size_t j = i + 1; j < reference.size(); ++j) {
            std::vector<NewsItem> joined = reference[i].members;
            joined.insert(joined.end(), reference[j].members.begin(), reference[j].members.end());
            auto rejoined = service.cluster(joined);
            assert(rejoined.size() == 2);
            std::vector<std::set<std::string>> expected = {reference[i].memberIds, reference[j].memberIds};
            std::sort(expected.begin(), expected.end());
            assert(Partition(rejoined) == expected);
            assert(Tokenizer::jaccard(Tokenizer::tokenize(reference[i].primaryTitle),
                                      Tokenizer::tokenize(reference[j].primaryTitle)) < 0.5);
            ++pairsChecked;
        }
    }
    assert(pairsChecked >= 3);
    std::cout << "[PASS] Idempotence" << std::endl;

    // 5. Cluster metadata
    const NewsCluster* grown = FindContaining(reference, "d");
    assert(grown != nullptr);
    assert(grown->memberIds.count("a") == 1);
    assert(grown->firstSeenAt == t0);
    assert(grown->lastUpdatedAt == t0 + std::chrono::minutes(20));
    // Lowest tier wins the primary slot.
    assert(grown->primaryItemId == "a");
    // Three items over twenty minutes.
    assert(std::fabs(grown->velocityPerHour - 9.0) < 1e-6);
    assert(grown->topSources.size() <= 3);
    for (std::size_t i = 1; i < reference.size(); ++i) {
        assert(reference[i - 1].lastUpdatedAt >= reference[i].lastUpdatedAt);
    }
    std::cout << "[PASS] Cluster metadata" << std::endl;

    std::cout << "[Test] Clustering Test Completed Successfully." << std::endl;
    return 0;
}
