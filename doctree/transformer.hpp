#pragma once
#ifndef DOCTREE_TRANSFORMER_HPP
#define DOCTREE_TRANSFORMER_HPP

#include "node_visitor.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace re2 { class RE2; }

namespace doctree {

/**
 * Tree-rewriting visitor.
 *
 * transform(node) returns a replacement node, or nullptr to delete the node
 * from its parent's sequence. The default visit methods rebuild every node
 * from its transformed children, so a transformer that overrides nothing is
 * the identity transform. Overrides call set_result() with the replacement.
 *
 * Trees are immutable: a transform builds a new tree and never touches the
 * input. An exception thrown by a visit method propagates to the caller and
 * no partial tree is returned.
 */
class NodeTransformer : public NodeVisitor {
public:
    virtual NodePtr transform(const NodePtr& node);

    void visit_document(const Document& node) override;
    void visit_heading(const Heading& node) override;
    void visit_paragraph(const Paragraph& node) override;
    void visit_code_block(const CodeBlock& node) override;
    void visit_block_quote(const BlockQuote& node) override;
    void visit_list(const List& node) override;
    void visit_list_item(const ListItem& node) override;
    void visit_table(const Table& node) override;
    void visit_table_row(const TableRow& node) override;
    void visit_table_cell(const TableCell& node) override;
    void visit_thematic_break(const ThematicBreak& node) override;
    void visit_html_block(const HTMLBlock& node) override;
    void visit_comment(const Comment& node) override;
    void visit_footnote_definition(const FootnoteDefinition& node) override;
    void visit_definition_list(const DefinitionList& node) override;
    void visit_definition_term(const DefinitionTerm& node) override;
    void visit_definition_description(const DefinitionDescription& node) override;
    void visit_math_block(const MathBlock& node) override;

    void visit_text(const Text& node) override;
    void visit_emphasis(const Emphasis& node) override;
    void visit_strong(const Strong& node) override;
    void visit_code(const Code& node) override;
    void visit_link(const Link& node) override;
    void visit_image(const Image& node) override;
    void visit_line_break(const LineBreak& node) override;
    void visit_strikethrough(const Strikethrough& node) override;
    void visit_underline(const Underline& node) override;
    void visit_superscript(const Superscript& node) override;
    void visit_subscript(const Subscript& node) override;
    void visit_html_inline(const HTMLInline& node) override;
    void visit_comment_inline(const CommentInline& node) override;
    void visit_footnote_reference(const FootnoteReference& node) override;
    void visit_math_inline(const MathInline& node) override;

protected:
    // Transforms each child in order, dropping deleted (nullptr) results
    NodeList transform_children(const NodeList& children);

    // Replacement for the node being visited; nullptr deletes it
    void set_result(NodePtr node) { result_ = std::move(node); }

private:
    NodePtr result_;
};

// Applies transformer to a document; throws DocError if the root is deleted
// or replaced by something other than a Document
DocumentPtr transform_document(const DocumentPtr& doc, NodeTransformer& transformer);

// ============================================================================
// Built-in transformers
// ============================================================================

// Shifts heading levels by offset, clamped to [min_level, max_level]
class HeadingLevelTransformer : public NodeTransformer {
public:
    explicit HeadingLevelTransformer(int offset, int min_level = 1, int max_level = 6);
    void visit_heading(const Heading& node) override;

private:
    int offset_;
    int min_level_;
    int max_level_;
};

// Replaces a literal string or an RE2 pattern in every Text node.
// In regex mode the replacement may use \1..\9 group references.
class TextReplacer : public NodeTransformer {
public:
    // Throws DocError(INVALID_ARGUMENT) for an invalid regular expression
    TextReplacer(const std::string& pattern, const std::string& replacement, bool use_regex = false);
    ~TextReplacer() override;

    void visit_text(const Text& node) override;

private:
    std::string pattern_;
    std::string replacement_;
    std::unique_ptr<re2::RE2> regex_;
};

// Rewrites link and image URLs through a mapping function
class LinkRewriter : public NodeTransformer {
public:
    using UrlMapper = std::function<std::string(const std::string&)>;

    // With validate_urls, a mapped URL using a dangerous scheme throws DocError
    explicit LinkRewriter(UrlMapper mapper, bool validate_urls = true);

    void visit_link(const Link& node) override;
    void visit_image(const Image& node) override;

private:
    std::string map_url(const std::string& url, const char* context);

    UrlMapper mapper_;
    bool validate_urls_;
};

// ============================================================================
// Collection and document helpers
// ============================================================================

using NodePredicate = std::function<bool(const Node&)>;

// Collects every node of a subtree matching the predicate, in pre-order
class NodeCollector : public TreeWalker {
public:
    explicit NodeCollector(NodePredicate predicate = nullptr) : predicate_(std::move(predicate)) {}

    const std::vector<const Node*>& collected() const { return collected_; }

protected:
    void enter(const Node& node) override;

private:
    NodePredicate predicate_;
    std::vector<const Node*> collected_;
};

// Nodes of the given kind under root, in document order. The pointers stay
// valid while root is alive.
std::vector<const Node*> collect_nodes(const Node& root, NodeType type);
std::vector<const Node*> collect_nodes(const Node& root, const NodePredicate& predicate);

// Copy of doc without the nodes (and their subtrees) rejected by keep.
// The Document root is always kept.
DocumentPtr filter_nodes(const DocumentPtr& doc, const NodePredicate& keep);

enum class MetadataMerge {
    LAST_WRITE_WINS,    // later documents overwrite duplicate keys
    FIRST_WRITE_WINS,   // earlier values are preserved
    MERGE_LISTS,        // array values are concatenated, others last-write-wins
};

// Concatenates the children of docs into one Document and merges their metadata
DocumentPtr merge_documents(const std::vector<DocumentPtr>& docs,
                            MetadataMerge merge = MetadataMerge::LAST_WRITE_WINS);

} // namespace doctree

#endif // DOCTREE_TRANSFORMER_HPP
