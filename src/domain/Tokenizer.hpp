/**
 * @file Tokenizer.hpp
 * @brief Headline normalization, Jaccard similarity and the token inverted index.
 */

#pragma once

#include <string>
#include <set>
#include <vector>
#include <map>
#include <unordered_map>

namespace worldpulse::domain {

using TokenSet = std::set<std::string>;
using InvertedIndex = std::map<std::string, std::set<std::size_t>>;

/**
 * @class Tokenizer
 * @brief Pure text helpers used by clustering.
 */
class Tokenizer {
public:
    /**
     * @brief Lowercases, splits on non-word characters and drops short tokens and stop words.
     * @param title Headline text.
     * @return Distinct tokens of at least three characters.
     */
    static TokenSet tokenize(const std::string& title);

    /** @brief |A∩B| / |A∪B|. Two empty sets have similarity 0. */
    static double jaccard(const TokenSet& a, const TokenSet& b);

    /** @brief Maps every token to the indices of the sets containing it. */
    static InvertedIndex buildInvertedIndex(const std::vector<TokenSet>& tokenSets);

    static bool isStopWord(const std::string& token);
};

/**
 * @class TokenCache
 * @brief Per-cycle memo of tokenize() keyed by exact title.
 */
class TokenCache {
public:
    const TokenSet& get(const std::string& title);
    std::size_t size() const { return m_cache.size(); }

private:
    std::unordered_map<std::string, TokenSet> m_cache;
};

} // namespace worldpulse::domain
