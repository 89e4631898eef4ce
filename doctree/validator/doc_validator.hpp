/**
 * @file doc_validator.hpp
 * @brief Semantic validation of document trees
 *
 * Constructors reject structurally impossible trees. ValidationVisitor
 * reports what is constructible but suspect: empty footnote identifiers,
 * non-positive table spans, heading levels built through the unchecked
 * factory, raw HTML, unsafe URLs and similar findings.
 */

#pragma once
#ifndef DOCTREE_DOC_VALIDATOR_HPP
#define DOCTREE_DOC_VALIDATOR_HPP

#include "../node_visitor.hpp"

#include <string>
#include <vector>

namespace doctree {

// Validation options
struct ValidationOptions {
    bool strict = true;             // throw DocError on the first finding; also enables containment and URL checks
    bool allow_raw_html = false;    // accept HTMLBlock/HTMLInline nodes
    int max_errors = 0;             // stop recording after N findings (0 = unlimited)
};

ValidationOptions validation_default_options();

// Outcome of a non-throwing validation run
struct ValidationReport {
    bool valid;
    std::vector<std::string> errors;
};

class ValidationVisitor : public NodeVisitor {
public:
    explicit ValidationVisitor(const ValidationOptions& options = validation_default_options());

    const std::vector<std::string>& errors() const { return errors_; }
    bool valid() const { return errors_.empty(); }
    void reset() { errors_.clear(); }

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

private:
    void add_error(const std::string& message);
    void check_inline_children(const NodeList& children, const char* context);
    void check_block_children(const NodeList& children, const char* context);
    void check_url(const std::string& url, const char* context, bool allow_data_uri);
    void check_math(const MathNode& node, const char* context);
    void check_styled(const ContainerNode& node, const char* context);

    ValidationOptions options_;
    std::vector<std::string> errors_;
};

// Runs a validation pass over root. With options.strict the first finding
// throws DocError(VALIDATION_FAILED); otherwise all findings are returned.
ValidationReport validate_tree(const Node& root,
                               const ValidationOptions& options = validation_default_options());

/**
 * Checks a link or image URL against the scheme policy.
 * @param url URL to check
 * @param context node kind used in the message, e.g. "Link"
 * @param allow_data_uri accept data:image/* URIs up to the asset size limit
 * @return empty string when the URL is acceptable, otherwise the finding
 */
std::string check_url_scheme(const std::string& url, const char* context, bool allow_data_uri);

} // namespace doctree

#endif // DOCTREE_DOC_VALIDATOR_HPP
