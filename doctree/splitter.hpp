// splitter.hpp - Partition a Document into self-contained parts
//
// Every strategy splits only between Document children, so a block node
// always lands wholly inside one part. Parts share the source document's
// metadata and source location.

#pragma once
#ifndef DOCTREE_SPLITTER_HPP
#define DOCTREE_SPLITTER_HPP

#include "ast_node.hpp"

#include <optional>
#include <string>
#include <vector>

namespace doctree {

struct SplitResult {
    DocumentPtr document;
    int index = 1;                      // 1-based position among the parts
    std::optional<std::string> title;   // heading text, "Preamble" or "Part n"
    size_t word_count = 0;
    Json::Value metadata = Json::Value(Json::objectValue);  // "reason", "strategy"

    // Filename-safe slug of the title, "" without a title
    std::string get_filename_slug() const;
};

using SplitResults = std::vector<SplitResult>;

// ============================================================================
// Split specifications
// ============================================================================

enum class SplitStrategy {
    HEADING,    // h1 .. h6
    LENGTH,     // length=N target words per part
    PARTS,      // parts=N
    DELIMITER,  // delimiter=TEXT
    BREAK,      // at ThematicBreak nodes
    PAGE,       // handled by paginated format readers
    CHAPTER,    // handled by chaptered format readers
    AUTO,
};

const char* split_strategy_name(SplitStrategy strategy);

struct SplitSpec {
    SplitStrategy strategy = SplitStrategy::AUTO;
    int value = 0;              // heading level, word count or part count
    std::string delimiter;      // escape sequences already decoded
};

/**
 * Parses a split specification: "h1".."h6", "length=N", "parts=N",
 * "delimiter=TEXT" (\n, \t, \xHH and similar escapes decoded), "break",
 * "page", "chapter" or "auto". Keywords are case-insensitive.
 * Throws DocError(INVALID_SPLIT_SPEC) naming the offending token.
 */
SplitSpec parse_split_spec(const std::string& spec);

struct SplitOptions {
    bool include_preamble = true;
    int target_words = 1500;    // used by auto
};

SplitOptions split_default_options();

// ============================================================================
// Strategies
// ============================================================================

// One part per heading of the given level. Headings above the level also
// start a part, so the parts cover the document exactly.
SplitResults split_by_heading_level(const Document& doc, int level, bool include_preamble = true);

// Greedy accumulation of whole sections up to target_words per part
SplitResults split_by_word_count(const Document& doc, int target_words);

// split_by_word_count() with target = total words / num_parts
SplitResults split_by_parts(const Document& doc, int num_parts);

// Blocks whose trimmed text equals the delimiter separate parts "Part 1", "Part 2", ...
// Rule-like delimiters ("---", "***", "___") also match ThematicBreak nodes.
SplitResults split_by_delimiter(const Document& doc, const std::string& delimiter);

// ThematicBreak nodes separate parts "Part 1", "Part 2", ...
SplitResults split_by_break(const Document& doc);

// Picks H1 sections, H2 sections or word-count splitting; records "auto:h1",
// "auto:h2" or "auto:word_count" in each part's metadata["strategy"]
SplitResults split_auto(const Document& doc, int target_words = 1500);

// Parses the spec and runs the matching strategy.
// "page" and "chapter" belong to format readers and raise DocError(INVALID_SPLIT_SPEC).
SplitResults split_document(const Document& doc, const SplitSpec& spec,
                            const SplitOptions& options = split_default_options());
SplitResults split_document(const Document& doc, const std::string& spec,
                            const SplitOptions& options = split_default_options());

} // namespace doctree

#endif // DOCTREE_SPLITTER_HPP
