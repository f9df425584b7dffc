#pragma once
// Text: tokenization and matching primitives
//
// Tokens are lowercase alphanumeric runs; everything else (including '_')
// separates them, so "RLV_TRM_i3_TD.pdf" yields rlv, trm, i3, td, pdf.

#include "types.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace assetmind {

// Lowercase alphanumeric tokens of at least min_len chars
inline std::vector<std::string> tokenize(const std::string& text, size_t min_len = 1) {
    std::vector<std::string> tokens;
    std::string current;

    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            current += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else if (!current.empty()) {
            if (current.length() >= min_len) tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty() && current.length() >= min_len) {
        tokens.push_back(current);
    }
    return tokens;
}

inline bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

// Needle occurs in haystack with non-alphanumeric characters (or the ends)
// on both sides. Both arguments are expected lowercase.
inline bool contains_bounded(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return false;
    size_t pos = haystack.find(needle);
    while (pos != std::string::npos) {
        bool left_ok = pos == 0 || !is_word_char(haystack[pos - 1]);
        size_t end = pos + needle.size();
        bool right_ok = end >= haystack.size() || !is_word_char(haystack[end]);
        if (left_ok && right_ok) return true;
        pos = haystack.find(needle, pos + 1);
    }
    return false;
}

// Levenshtein distance, two-row
inline size_t edit_distance(const std::string& a, const std::string& b) {
    std::vector<size_t> prev(b.size() + 1), cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;
    for (size_t i = 1; i <= a.size(); ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

// 1 - distance / longer length
inline float edit_similarity(const std::string& a, const std::string& b) {
    size_t longest = std::max(a.size(), b.size());
    if (longest == 0) return 1.0f;
    return 1.0f - static_cast<float>(edit_distance(a, b)) / static_cast<float>(longest);
}

// Term-frequency cosine between two token lists
inline float token_cosine(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    if (a.empty() || b.empty()) return 0.0f;
    std::unordered_map<std::string, float> fa, fb;
    for (const auto& t : a) fa[t] += 1.0f;
    for (const auto& t : b) fb[t] += 1.0f;

    float dot = 0.0f, na = 0.0f, nb = 0.0f;
    for (const auto& [t, c] : fa) {
        na += c * c;
        auto it = fb.find(t);
        if (it != fb.end()) dot += c * it->second;
    }
    for (const auto& [_, c] : fb) nb += c * c;
    if (na == 0.0f || nb == 0.0f) return 0.0f;
    return dot / (std::sqrt(na) * std::sqrt(nb));
}

// Filename without directory and extension
inline std::string filename_stem(const std::string& filename) {
    std::string base = filename;
    auto slash = base.find_last_of("/\\");
    if (slash != std::string::npos) base = base.substr(slash + 1);
    auto dot = base.find_last_of('.');
    if (dot != std::string::npos && dot > 0) base = base.substr(0, dot);
    return base;
}

} // namespace assetmind
