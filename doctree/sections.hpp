// sections.hpp - Heading-bounded views over a Document and section editing
//
// A section is a heading plus everything after it up to the next heading of
// the same or a higher level (smaller number). Content under deeper
// sub-headings belongs to the enclosing section, so sections at different
// levels nest. Sections are derived on demand from Document children by
// position and never cached.
//
// Editing operations never mutate their input: each returns a new Document
// sharing the untouched child nodes.

#pragma once
#ifndef DOCTREE_SECTIONS_HPP
#define DOCTREE_SECTIONS_HPP

#include "ast_node.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace doctree {

struct Section {
    std::shared_ptr<const Heading> heading;
    int level = 1;
    NodeList content;           // nodes after the heading, up to end_index
    size_t start_index = 0;     // index of the heading in Document children
    size_t end_index = 0;       // exclusive end index

    // heading followed by content
    NodeList to_nodes() const;
    DocumentPtr to_document() const;
    std::string heading_text() const;
};

// Sections of every heading with min_level <= level <= max_level, in document order.
// Throws DocError(INVALID_ARGUMENT) unless 1 <= min_level <= max_level <= 6.
std::vector<Section> get_all_sections(const Document& doc, int min_level = 1, int max_level = 6);

// Children before the first heading
NodeList get_preamble(const Document& doc);

// Non-overlapping sections starting at every heading of level <= max_level.
// Together with partition_preamble() they cover the document children exactly.
std::vector<Section> partition_sections(const Document& doc, int max_level);

// Children before the first of the given parts; all children when parts is empty.
// Unlike get_preamble() this keeps headings that start no part (deeper levels,
// or unchecked levels above 6).
NodeList partition_preamble(const Document& doc, const std::vector<Section>& parts);

// ============================================================================
// Target resolution
// ============================================================================

// Heading text or a 0-based index into get_all_sections()
class SectionTarget {
public:
    SectionTarget(const char* text, bool case_sensitive = false)
        : text_(text ? text : ""), index_(-1), by_index_(false), case_sensitive_(case_sensitive) {}
    SectionTarget(const std::string& text, bool case_sensitive = false)
        : text_(text), index_(-1), by_index_(false), case_sensitive_(case_sensitive) {}
    SectionTarget(int index) : index_(index), by_index_(true), case_sensitive_(false) {}

    bool by_index() const { return by_index_; }
    int index() const { return index_; }
    const std::string& text() const { return text_; }
    bool case_sensitive() const { return case_sensitive_; }

    std::string describe() const;

private:
    std::string text_;
    int index_;
    bool by_index_;
    bool case_sensitive_;
};

/**
 * Resolves a target to exactly one section.
 * Throws DocError with TARGET_NOT_FOUND (with close heading names when any),
 * AMBIGUOUS_TARGET when several headings share the text, or
 * INDEX_OUT_OF_RANGE for a bad index.
 */
Section resolve_section(const Document& doc, const SectionTarget& target);

// ============================================================================
// Queries
// ============================================================================

struct SectionQuery {
    std::optional<std::string> pattern;     // heading text, '*' and '?' wildcards allowed
    bool case_sensitive = false;
    std::optional<int> level;               // exact level, overrides the range
    int min_level = 1;
    int max_level = 6;
    std::function<bool(const Section&)> predicate;
};

std::vector<Section> query_sections(const Document& doc, const SectionQuery& query = SectionQuery());

struct HeadingMatch {
    size_t index;
    std::shared_ptr<const Heading> heading;
};

// First heading whose text matches, optionally restricted to one level
std::optional<HeadingMatch> find_heading(const Document& doc, const std::string& text,
                                         std::optional<int> level = std::nullopt,
                                         bool case_sensitive = false);

size_t count_sections(const Document& doc, std::optional<int> level = std::nullopt);

// Parses 1-based ranges such as "1-3,5,8-" into sorted 0-based indices below total.
// Reversed ranges are swapped. Throws DocError(INVALID_ARGUMENT) on non-numeric parts.
std::vector<int> parse_section_ranges(const std::string& spec, int total);

// ============================================================================
// Editing
// ============================================================================

// New document holding only the target section (heading and content)
DocumentPtr extract_section(const Document& doc, const SectionTarget& target);

struct ExtractOptions {
    bool case_sensitive = false;
    bool combine = true;        // all matches separated by ThematicBreak, else the first only
};

// Sections selected by "#:1-3,5" style ranges or a heading pattern with wildcards
DocumentPtr extract_sections(const Document& doc, const std::string& spec,
                             const ExtractOptions& options = ExtractOptions());

DocumentPtr replace_section(const Document& doc, const SectionTarget& target, const NodeList& replacement);
DocumentPtr remove_section(const Document& doc, const SectionTarget& target);

enum class InsertPosition {
    START,          // right after the heading
    END,            // after the last node of the section
    AFTER_HEADING,  // same as START
};

DocumentPtr insert_into_section(const Document& doc, const SectionTarget& target,
                                const NodeList& nodes, InsertPosition position = InsertPosition::END);

DocumentPtr add_section_before(const Document& doc, const SectionTarget& target, const NodeList& section);
DocumentPtr add_section_after(const Document& doc, const SectionTarget& target, const NodeList& section);

// One document per top-level partition (every heading starts one), preceded by
// the preamble when include_preamble is set and the preamble is non-empty
std::vector<DocumentPtr> split_by_sections(const Document& doc, bool include_preamble = true);

// ============================================================================
// Table of contents
// ============================================================================

enum class TocStyle {
    MARKDOWN,   // "- [Title](#slug)" lines indented by level
    LIST,       // flat List node
    NESTED,     // List nodes nested by heading level
};

struct TableOfContents {
    TocStyle style;
    std::string markdown;               // MARKDOWN style only
    std::shared_ptr<const List> list;   // LIST and NESTED styles
};

// Throws DocError(INVALID_ARGUMENT) unless 1 <= max_level <= 6
TableOfContents generate_toc(const Document& doc, int max_level = 3, TocStyle style = TocStyle::MARKDOWN);

enum class TocPosition {
    START,
    AFTER_FIRST_HEADING,    // falls back to START without headings
};

// Markdown style inserts a "Table of Contents" heading and a list of anchor links
DocumentPtr insert_toc(const Document& doc, TocPosition position = TocPosition::START,
                       int max_level = 3, TocStyle style = TocStyle::MARKDOWN);

} // namespace doctree

#endif // DOCTREE_SECTIONS_HPP
