#pragma once
#ifndef DOCTREE_SUGGESTIONS_HPP
#define DOCTREE_SUGGESTIONS_HPP

#include <string>
#include <vector>

namespace doctree {

// Edit distance (single-character insertions, deletions and substitutions)
int levenshtein_distance(const std::string& s1, const std::string& s2);

/**
 * Close matches for a mistyped name, best first.
 * Comparison is case-insensitive; a candidate qualifies when its distance is
 * within max(3, len/3) edits of the input.
 *
 * @param input the unresolved name
 * @param candidates available names
 * @param max_count maximum number of suggestions returned
 */
std::vector<std::string> suggest_similar(const std::string& input,
                                         const std::vector<std::string>& candidates,
                                         size_t max_count = 3);

} // namespace doctree

#endif // DOCTREE_SUGGESTIONS_HPP
