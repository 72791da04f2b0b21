/**
 * @file TextMatch.cpp
 * @brief Implementation of the text matching helpers.
 */

#include "domain/TextMatch.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>

namespace worldpulse::domain::text {

namespace {

constexpr std::size_t kMinSuffixKeywordLength = 4;
const std::array<const char*, 9> kInflectionSuffixes = {"s", "es", "ian", "ean", "an", "n", "i", "ish", "ese"};

bool IsWordChar(unsigned char c) {
    return std::isalnum(c) || c == '_';
}

bool IsAlnum(unsigned char c) {
    return std::isalnum(c) != 0;
}

bool IsInflectionSuffix(const std::string& suffix) {
    return std::find(kInflectionSuffixes.begin(), kInflectionSuffixes.end(), suffix) != kInflectionSuffixes.end();
}

bool StartsWith(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

bool HasInflectedForm(const std::string& word, const std::string& keyword) {
    if (word.size() <= keyword.size()) return false;
    if (StartsWith(word, keyword) && IsInflectionSuffix(word.substr(keyword.size()))) {
        return true;
    }
    if (!keyword.empty() && keyword.back() == 'e') {
        std::string stem = keyword.substr(0, keyword.size() - 1);
        if (word.size() > stem.size() && StartsWith(word, stem) && IsInflectionSuffix(word.substr(stem.size()))) {
            return true;
        }
    }
    return false;
}

bool WordMatches(const std::string& word, const std::string& part) {
    if (word == part) return true;
    return part.size() >= kMinSuffixKeywordLength && HasInflectedForm(word, part);
}

std::vector<std::string> SplitWhitespace(const std::string& value) {
    std::vector<std::string> parts;
    std::istringstream iss(value);
    std::string part;
    while (iss >> part) parts.push_back(part);
    return parts;
}

} // namespace

std::string ToLower(const std::string& value) {
    std::string out = value;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string Trim(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

MatchText Prepare(const std::string& input) {
    MatchText result;
    result.lowered = ToLower(input);

    for (const auto& raw : SplitWhitespace(result.lowered)) {
        std::size_t first = 0;
        std::size_t last = raw.size();
        while (first < last && !IsAlnum(static_cast<unsigned char>(raw[first]))) ++first;
        while (last > first && !IsAlnum(static_cast<unsigned char>(raw[last - 1]))) --last;
        if (first == last) continue;

        std::string cleaned = raw.substr(first, last - first);
        result.words.insert(cleaned);
        result.ordered.push_back(cleaned);

        std::string part;
        for (unsigned char c : cleaned) {
            if (IsAlnum(c)) {
                part.push_back(static_cast<char>(c));
            } else if (!part.empty()) {
                result.words.insert(part);
                part.clear();
            }
        }
        if (!part.empty()) result.words.insert(part);
    }
    return result;
}

bool ContainsPhrase(const MatchText& text, const std::string& phrase) {
    std::string needle = ToLower(Trim(phrase));
    if (needle.empty()) return false;

    const std::string& hay = text.lowered;
    std::size_t pos = hay.find(needle);
    while (pos != std::string::npos) {
        bool leftOk = pos == 0 || !IsWordChar(static_cast<unsigned char>(hay[pos - 1]));
        std::size_t end = pos + needle.size();
        bool rightOk = end >= hay.size() || !IsWordChar(static_cast<unsigned char>(hay[end]));
        if (leftOk && rightOk) return true;
        pos = hay.find(needle, pos + 1);
    }
    return false;
}

bool MatchesKeyword(const MatchText& text, const std::string& keyword) {
    auto parts = SplitWhitespace(ToLower(keyword));
    if (parts.empty()) return false;

    if (parts.size() == 1) {
        const std::string& kw = parts.front();
        if (text.words.count(kw)) return true;
        if (kw.size() < kMinSuffixKeywordLength) return false;
        for (const auto& word : text.words) {
            if (HasInflectedForm(word, kw)) return true;
        }
        return false;
    }

    const auto& ordered = text.ordered;
    if (ordered.size() < parts.size()) return false;
    for (std::size_t i = 0; i + parts.size() <= ordered.size(); ++i) {
        bool match = true;
        for (std::size_t j = 0; j < parts.size(); ++j) {
            if (!WordMatches(ordered[i + j], parts[j])) {
                match = false;
                break;
            }
        }
        if (match) return true;
    }
    return false;
}

bool MatchesAnyKeyword(const MatchText& text, const std::set<std::string>& keywords) {
    for (const auto& kw : keywords) {
        if (MatchesKeyword(text, kw)) return true;
    }
    return false;
}

} // namespace worldpulse::domain::text
