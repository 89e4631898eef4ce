#pragma once
#ifndef DOCTREE_DOC_BUILDER_HPP
#define DOCTREE_DOC_BUILDER_HPP

#include "ast_node.hpp"

#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

namespace doctree {

/**
 * DocumentBuilder - Fluent API for assembling a Document in format readers
 *
 * USAGE PATTERN:
 *   DocumentPtr doc = DocumentBuilder()
 *       .heading(1, "Title")
 *       .paragraph("Body text")
 *       .thematic_break()
 *       .build();
 *
 * Node constructors run as blocks are added, so structural errors surface
 * at the call that introduced them.
 */
class DocumentBuilder {
public:
    DocumentBuilder() = default;
    explicit DocumentBuilder(NodeAttrs attrs) : attrs_(std::move(attrs)) {}

    DocumentBuilder& node(NodePtr block);
    DocumentBuilder& nodes(const NodeList& blocks);

    DocumentBuilder& heading(int level, NodeList content);
    DocumentBuilder& heading(int level, const std::string& text);

    DocumentBuilder& paragraph(NodeList content);
    DocumentBuilder& paragraph(const std::string& text);

    DocumentBuilder& code_block(const std::string& content,
                                std::optional<std::string> language = std::nullopt);
    DocumentBuilder& thematic_break();

    DocumentPtr build() const;

private:
    NodeList children_;
    NodeAttrs attrs_;
};

/**
 * ListBuilder - Builds nested lists from a flat sequence of (level, item) pairs
 *
 * Readers that see list items one line at a time (indentation or numbering
 * gives the level) add them in order; the builder opens and closes nested
 * lists as the level changes. A change of ordered/unordered at the same level
 * starts a new sibling list. Jumping more than one level deeper inserts empty
 * items to hang the nested lists from.
 *
 *   ListBuilder lists;
 *   lists.add_item(1, false, {para("one")})
 *        .add_item(2, false, {para("nested")})
 *        .add_item(1, false, {para("two")});
 *   NodeList blocks = lists.build();   // one List with a nested List
 */
class ListBuilder {
public:
    ListBuilder();
    ~ListBuilder();

    ListBuilder(const ListBuilder&) = delete;
    ListBuilder& operator=(const ListBuilder&) = delete;

    // Throws DocError(INVALID_ARGUMENT) when level < 1
    ListBuilder& add_item(int level, bool ordered, NodeList content,
                          TaskStatus task_status = TaskStatus::NONE);

    // Top-level lists in the order they were opened
    NodeList build() const;

    // build() wrapped in a Document
    DocumentPtr document() const;

private:
    struct ListDraft;
    struct ItemDraft;

    std::vector<std::unique_ptr<ListDraft>> roots_;
    std::vector<std::pair<ListDraft*, int>> stack_;     // open lists with their level
};

/**
 * TableBuilder - Accumulates rows, header, alignments and caption
 *
 * With has_header set, the first row added becomes the header unless a
 * header row was added explicitly.
 */
class TableBuilder {
public:
    explicit TableBuilder(bool has_header = false) : has_header_(has_header) {}

    // alignments are only used for header rows
    TableBuilder& add_row(const std::vector<NodeList>& cells, bool is_header = false,
                          const std::vector<Alignment>& alignments = {});
    TableBuilder& add_row(std::initializer_list<std::string> cells, bool is_header = false);
    TableBuilder& add_text_row(const std::vector<std::string>& cells, bool is_header = false);

    TableBuilder& set_caption(const std::string& caption);

    // Grows the alignment list with NONE as needed
    TableBuilder& set_column_alignment(size_t column, Alignment alignment);

    std::shared_ptr<const Table> build() const;

private:
    bool has_header_;
    NodePtr header_;
    NodeList rows_;
    std::vector<Alignment> alignments_;
    std::optional<std::string> caption_;
};

} // namespace doctree

#endif // DOCTREE_DOC_BUILDER_HPP
