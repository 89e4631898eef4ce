#pragma once
#ifndef DOCTREE_NODE_VISITOR_HPP
#define DOCTREE_NODE_VISITOR_HPP

#include "ast_node.hpp"

namespace doctree {

/**
 * Exhaustive visitor over every node kind.
 *
 * node.accept(v) calls v.visit_<kind>(node). Every visit method is pure
 * virtual, so a renderer that forgets a kind fails to compile. Visitors own
 * their recursion: nothing descends into children unless the visitor calls
 * visit_children() or accepts the children itself.
 */
class NodeVisitor {
public:
    virtual ~NodeVisitor() = default;

    // block nodes
    virtual void visit_document(const Document& node) = 0;
    virtual void visit_heading(const Heading& node) = 0;
    virtual void visit_paragraph(const Paragraph& node) = 0;
    virtual void visit_code_block(const CodeBlock& node) = 0;
    virtual void visit_block_quote(const BlockQuote& node) = 0;
    virtual void visit_list(const List& node) = 0;
    virtual void visit_list_item(const ListItem& node) = 0;
    virtual void visit_table(const Table& node) = 0;
    virtual void visit_table_row(const TableRow& node) = 0;
    virtual void visit_table_cell(const TableCell& node) = 0;
    virtual void visit_thematic_break(const ThematicBreak& node) = 0;
    virtual void visit_html_block(const HTMLBlock& node) = 0;
    virtual void visit_comment(const Comment& node) = 0;
    virtual void visit_footnote_definition(const FootnoteDefinition& node) = 0;
    virtual void visit_definition_list(const DefinitionList& node) = 0;
    virtual void visit_definition_term(const DefinitionTerm& node) = 0;
    virtual void visit_definition_description(const DefinitionDescription& node) = 0;
    virtual void visit_math_block(const MathBlock& node) = 0;

    // inline nodes
    virtual void visit_text(const Text& node) = 0;
    virtual void visit_emphasis(const Emphasis& node) = 0;
    virtual void visit_strong(const Strong& node) = 0;
    virtual void visit_code(const Code& node) = 0;
    virtual void visit_link(const Link& node) = 0;
    virtual void visit_image(const Image& node) = 0;
    virtual void visit_line_break(const LineBreak& node) = 0;
    virtual void visit_strikethrough(const Strikethrough& node) = 0;
    virtual void visit_underline(const Underline& node) = 0;
    virtual void visit_superscript(const Superscript& node) = 0;
    virtual void visit_subscript(const Subscript& node) = 0;
    virtual void visit_html_inline(const HTMLInline& node) = 0;
    virtual void visit_comment_inline(const CommentInline& node) = 0;
    virtual void visit_footnote_reference(const FootnoteReference& node) = 0;
    virtual void visit_math_inline(const MathInline& node) = 0;

    // Fallback for partial visitors; does not recurse
    virtual void generic_visit(const Node& node) { (void)node; }

protected:
    // Accepts each direct child of node in document order
    void visit_children(const Node& node);
};

/**
 * Partial visitor: every visit method forwards to generic_visit().
 * Subclasses override only the kinds they care about.
 */
class BaseVisitor : public NodeVisitor {
public:
    void visit_document(const Document& node) override { generic_visit(node); }
    void visit_heading(const Heading& node) override { generic_visit(node); }
    void visit_paragraph(const Paragraph& node) override { generic_visit(node); }
    void visit_code_block(const CodeBlock& node) override { generic_visit(node); }
    void visit_block_quote(const BlockQuote& node) override { generic_visit(node); }
    void visit_list(const List& node) override { generic_visit(node); }
    void visit_list_item(const ListItem& node) override { generic_visit(node); }
    void visit_table(const Table& node) override { generic_visit(node); }
    void visit_table_row(const TableRow& node) override { generic_visit(node); }
    void visit_table_cell(const TableCell& node) override { generic_visit(node); }
    void visit_thematic_break(const ThematicBreak& node) override { generic_visit(node); }
    void visit_html_block(const HTMLBlock& node) override { generic_visit(node); }
    void visit_comment(const Comment& node) override { generic_visit(node); }
    void visit_footnote_definition(const FootnoteDefinition& node) override { generic_visit(node); }
    void visit_definition_list(const DefinitionList& node) override { generic_visit(node); }
    void visit_definition_term(const DefinitionTerm& node) override { generic_visit(node); }
    void visit_definition_description(const DefinitionDescription& node) override { generic_visit(node); }
    void visit_math_block(const MathBlock& node) override { generic_visit(node); }

    void visit_text(const Text& node) override { generic_visit(node); }
    void visit_emphasis(const Emphasis& node) override { generic_visit(node); }
    void visit_strong(const Strong& node) override { generic_visit(node); }
    void visit_code(const Code& node) override { generic_visit(node); }
    void visit_link(const Link& node) override { generic_visit(node); }
    void visit_image(const Image& node) override { generic_visit(node); }
    void visit_line_break(const LineBreak& node) override { generic_visit(node); }
    void visit_strikethrough(const Strikethrough& node) override { generic_visit(node); }
    void visit_underline(const Underline& node) override { generic_visit(node); }
    void visit_superscript(const Superscript& node) override { generic_visit(node); }
    void visit_subscript(const Subscript& node) override { generic_visit(node); }
    void visit_html_inline(const HTMLInline& node) override { generic_visit(node); }
    void visit_comment_inline(const CommentInline& node) override { generic_visit(node); }
    void visit_footnote_reference(const FootnoteReference& node) override { generic_visit(node); }
    void visit_math_inline(const MathInline& node) override { generic_visit(node); }
};

// Pre-order walk of the whole subtree: generic_visit() on each node, then its children
class TreeWalker : public BaseVisitor {
public:
    void generic_visit(const Node& node) override {
        enter(node);
        visit_children(node);
    }

protected:
    virtual void enter(const Node& node) = 0;
};

} // namespace doctree

#endif // DOCTREE_NODE_VISITOR_HPP
