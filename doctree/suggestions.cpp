/**
 * @file suggestions.cpp
 * @brief String similarity for "did you mean" hints on unresolved targets
 */

#include "suggestions.hpp"

#include <algorithm>
#include <cctype>

namespace doctree {

// ==================== Levenshtein Distance ====================

int levenshtein_distance(const std::string& s1, const std::string& s2) {
    size_t len1 = s1.size();
    size_t len2 = s2.size();

    // Quick checks
    if (len1 == 0) return (int)len2;
    if (len2 == 0) return (int)len1;

    // two rolling rows of the (len1+1) x (len2+1) matrix
    std::vector<int> prev(len2 + 1);
    std::vector<int> curr(len2 + 1);
    for (size_t j = 0; j <= len2; j++) {
        prev[j] = (int)j;
    }

    for (size_t i = 1; i <= len1; i++) {
        curr[0] = (int)i;
        for (size_t j = 1; j <= len2; j++) {
            int cost = (s1[i - 1] == s2[j - 1]) ? 0 : 1;

            int deletion = prev[j] + 1;
            int insertion = curr[j - 1] + 1;
            int substitution = prev[j - 1] + cost;

            curr[j] = std::min({deletion, insertion, substitution});
        }
        std::swap(prev, curr);
    }

    return prev[len2];
}

// ==================== Name Suggestions ====================

struct Suggestion {
    const std::string* name;
    int distance;
};

static std::string lower_copy(const std::string& s) {
    std::string out(s);
    for (char& c : out) c = (char)std::tolower((unsigned char)c);
    return out;
}

std::vector<std::string> suggest_similar(const std::string& input,
                                         const std::vector<std::string>& candidates,
                                         size_t max_count) {
    std::string needle = lower_copy(input);
    int max_distance = std::max(3, (int)needle.size() / 3);

    std::vector<Suggestion> suggestions;
    for (const std::string& candidate : candidates) {
        int distance = levenshtein_distance(needle, lower_copy(candidate));
        if (distance > max_distance) continue;

        bool duplicate = false;
        for (const Suggestion& s : suggestions) {
            if (*s.name == candidate) duplicate = true;
        }
        if (!duplicate) suggestions.push_back(Suggestion{&candidate, distance});
    }

    // Sort by distance, keeping document order for ties
    std::stable_sort(suggestions.begin(), suggestions.end(),
                     [](const Suggestion& a, const Suggestion& b) { return a.distance < b.distance; });

    std::vector<std::string> result;
    for (size_t i = 0; i < suggestions.size() && i < max_count; i++) {
        result.push_back(*suggestions[i].name);
    }
    return result;
}

} // namespace doctree
