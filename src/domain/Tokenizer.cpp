/**
 * @file Tokenizer.cpp
 * @brief Implementation of Tokenizer.
 */

#include "domain/Tokenizer.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace worldpulse::domain {

namespace {

constexpr std::size_t kMinTokenLength = 3;

// English function words plus headline boilerplate that carries no topic.
const std::unordered_set<std::string>& StopWords() {
    static const std::unordered_set<std::string> words = {
        "the", "and", "for", "are", "but", "not", "you", "all", "any", "can",
        "had", "her", "was", "one", "our", "out", "has", "have", "his", "how",
        "its", "may", "new", "now", "old", "see", "two", "who", "did", "get",
        "him", "let", "say", "she", "too", "use", "with", "from", "this", "that",
        "they", "will", "would", "there", "their", "what", "about", "which",
        "when", "make", "like", "just", "over", "such", "into", "than", "them",
        "then", "some", "could", "other", "more", "after", "also", "been",
        "being", "were", "where", "while", "amid", "against", "between",
        "under", "again", "first", "last", "year", "years", "week", "today",
        "says", "said", "report", "reports", "reported", "posts", "posted",
        "beats", "misses", "strong", "weak", "estimates", "update", "updates",
        "live", "breaking", "news", "latest", "here", "why", "what's", "via",
        "amp", "quot"
    };
    return words;
}

bool IsWordChar(unsigned char c) {
    return std::isalnum(c) || c == '_';
}

} // namespace

bool Tokenizer::isStopWord(const std::string& token) {
    return StopWords().count(token) > 0;
}

TokenSet Tokenizer::tokenize(const std::string& title) {
    TokenSet tokens;
    std::string current;
    auto flush = [&]() {
        if (current.size() >= kMinTokenLength && !isStopWord(current)) {
            tokens.insert(current);
        }
        current.clear();
    };

    for (unsigned char c : title) {
        if (IsWordChar(c)) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else {
            flush();
        }
    }
    flush();
    return tokens;
}

double Tokenizer::jaccard(const TokenSet& a, const TokenSet& b) {
    if (a.empty() && b.empty()) return 0.0;

    std::size_t intersection = 0;
    const TokenSet& smaller = a.size() <= b.size() ? a : b;
    const TokenSet& larger = a.size() <= b.size() ? b : a;
    for (const auto& token : smaller) {
        if (larger.count(token)) ++intersection;
    }
    std::size_t unionSize = a.size() + b.size() - intersection;
    return unionSize == 0 ? 0.0 : static_cast<double>(intersection) / static_cast<double>(unionSize);
}

InvertedIndex Tokenizer::buildInvertedIndex(const std::vector<TokenSet>& tokenSets) {
    InvertedIndex index;
    for (std::size_t i = 0; i < tokenSets.size(); ++i) {
        for (const auto& token : tokenSets[i]) {
            index[token].insert(i);
        }
    }
    return index;
}

const TokenSet& TokenCache::get(const std::string& title) {
    auto it = m_cache.find(title);
    if (it != m_cache.end()) return it->second;
    return m_cache.emplace(title, Tokenizer::tokenize(title)).first->second;
}

} // namespace worldpulse::domain
