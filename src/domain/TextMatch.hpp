/**
 * @file TextMatch.hpp
 * @brief Matching of entity aliases and keywords against free text.
 */

#pragma once

#include <string>
#include <set>
#include <vector>

namespace worldpulse::domain {

/**
 * @struct MatchText
 * @brief Lowercased text split into words, prepared once and matched many times.
 */
struct MatchText {
    std::string lowered;
    std::set<std::string> words;        ///< Whitespace words, plus their alphanumeric parts.
    std::vector<std::string> ordered;   ///< Whitespace words in order, edge punctuation trimmed.
};

namespace text {

std::string ToLower(const std::string& value);

std::string Trim(const std::string& value);

MatchText Prepare(const std::string& text);

/**
 * @brief Case-insensitive phrase search that only accepts whole-word hits.
 *
 * "AI" never matches inside "RAID": the characters around the hit must not be
 * letters, digits or underscores.
 */
bool ContainsPhrase(const MatchText& text, const std::string& phrase);

/**
 * @brief Keyword match tolerant of simple inflections.
 *
 * Keywords of four or more characters also match the forms built with the
 * suffixes s, es, ian, ean, an, n, i, ish and ese ("iran" matches "iranian").
 * Multi-word keywords must match consecutive words.
 */
bool MatchesKeyword(const MatchText& text, const std::string& keyword);

bool MatchesAnyKeyword(const MatchText& text, const std::set<std::string>& keywords);

} // namespace text

} // namespace worldpulse::domain
