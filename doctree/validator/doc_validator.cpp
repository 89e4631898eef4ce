/**
 * @file doc_validator.cpp
 * @brief ValidationVisitor implementation and URL scheme policy
 */

#include "doc_validator.hpp"
#include "../doc_error.hpp"
#include "../../lib/log.h"

#include <cctype>
#include <cstring>

namespace doctree {

static log_category_t* validate_log() {
    return log_get_category("doctree.validate");
}

// ==================== URL scheme policy ====================

static const char* DANGEROUS_SCHEMES[] = {
    "javascript:", "vbscript:", "data:", "file:", "about:",
};

static const char* SAFE_LINK_SCHEMES[] = {
    "http", "https", "mailto", "ftp", "ftps", "tel", "sms",
};

// upper bound for inline data:image URIs
static const size_t MAX_DATA_URI_BYTES = 20 * 1024 * 1024;

static bool starts_with(const std::string& s, const char* prefix) {
    return s.compare(0, strlen(prefix), prefix) == 0;
}

static bool is_safe_scheme(const std::string& scheme) {
    for (const char* safe : SAFE_LINK_SCHEMES) {
        if (scheme == safe) return true;
    }
    return false;
}

// Lower-cased URL as a browser reads the scheme: leading control characters
// and spaces are skipped, tabs and newlines are ignored anywhere
static std::string normalize_for_scheme(const std::string& url) {
    std::string out;
    out.reserve(url.size());
    bool leading = true;
    for (unsigned char c : url) {
        if (c == '\t' || c == '\n' || c == '\r') continue;
        if (leading && c <= ' ') continue;
        leading = false;
        out.push_back((char)std::tolower(c));
    }
    return out;
}

std::string check_url_scheme(const std::string& url, const char* context, bool allow_data_uri) {
    if (url.empty()) return "";

    std::string lower = normalize_for_scheme(url);
    std::string excerpt = url.substr(0, 50);

    if (allow_data_uri && starts_with(lower, "data:")) {
        if (!starts_with(lower, "data:image/")) {
            return std::string(context) + " data URI must have image/* MIME type, got: " + excerpt;
        }
        if (url.size() > MAX_DATA_URI_BYTES) {
            return std::string(context) + " data URI exceeds maximum length (" +
                   std::to_string(url.size()) + " > " + std::to_string(MAX_DATA_URI_BYTES) + " bytes)";
        }
        return "";
    }

    for (const char* scheme : DANGEROUS_SCHEMES) {
        if (starts_with(lower, scheme)) {
            return std::string(context) + " URL uses dangerous scheme '" + scheme + "': " + excerpt;
        }
    }

    size_t sep = lower.find("://");
    if (sep != std::string::npos) {
        std::string scheme = lower.substr(0, sep);
        if (!is_safe_scheme(scheme)) {
            return std::string(context) + " URL has unrecognized scheme '" + scheme + "': " + excerpt;
        }
    }
    return "";
}

// ==================== ValidationVisitor ====================

ValidationOptions validation_default_options() {
    ValidationOptions opts = {};
    opts.strict = true;
    opts.allow_raw_html = false;
    opts.max_errors = 0;
    return opts;
}

ValidationVisitor::ValidationVisitor(const ValidationOptions& options) : options_(options) {}

void ValidationVisitor::add_error(const std::string& message) {
    if (options_.strict) {
        errors_.push_back(message);
        throw_doc_error(validate_log(), DocErrorCode::VALIDATION_FAILED, message);
    }
    if (options_.max_errors > 0 && (int)errors_.size() >= options_.max_errors) {
        return;
    }
    clog_warn(validate_log(), "%s", message.c_str());
    errors_.push_back(message);
}

void ValidationVisitor::check_inline_children(const NodeList& children, const char* context) {
    if (!options_.strict) return;
    for (size_t i = 0; i < children.size(); i++) {
        if (!children[i]->is_inline()) {
            add_error(std::string(context) + " can only contain inline nodes, but child " +
                      std::to_string(i) + " is " + children[i]->type_name());
        }
    }
}

void ValidationVisitor::check_block_children(const NodeList& children, const char* context) {
    if (!options_.strict) return;
    for (size_t i = 0; i < children.size(); i++) {
        if (children[i]->is_inline()) {
            add_error(std::string(context) + " can only contain block nodes, but child " +
                      std::to_string(i) + " is " + children[i]->type_name());
        }
    }
}

void ValidationVisitor::check_url(const std::string& url, const char* context, bool allow_data_uri) {
    if (!options_.strict || url.empty()) return;
    std::string finding = check_url_scheme(url, context, allow_data_uri);
    if (!finding.empty()) add_error(finding);
}

void ValidationVisitor::check_math(const MathNode& node, const char* context) {
    static const char* notations[] = {"latex", "mathml", "html"};
    auto known = [](const std::string& name) {
        for (const char* notation : notations) {
            if (name == notation) return true;
        }
        return false;
    };
    if (!known(node.notation())) {
        add_error(std::string(context) + " uses unsupported notation '" + node.notation() + "'");
    }
    for (const auto& entry : node.representations()) {
        if (!known(entry.first)) {
            add_error(std::string(context) + " has invalid representation key '" + entry.first + "'");
        }
    }
}

void ValidationVisitor::check_styled(const ContainerNode& node, const char* context) {
    check_inline_children(node.content(), context);
    visit_children(node);
}

void ValidationVisitor::visit_document(const Document& node) {
    visit_children(node);
}

void ValidationVisitor::visit_heading(const Heading& node) {
    if (node.level() < 1 || node.level() > 6) {
        add_error("Invalid heading level: " + std::to_string(node.level()));
    }
    check_styled(node, "Heading");
}

void ValidationVisitor::visit_paragraph(const Paragraph& node) {
    check_styled(node, "Paragraph");
}

void ValidationVisitor::visit_code_block(const CodeBlock& node) {
    if (node.fence_length() < 1) {
        add_error("CodeBlock fence_length must be >= 1, got " + std::to_string(node.fence_length()));
    }
    if (node.fence_char() != '`' && node.fence_char() != '~') {
        add_error(std::string("CodeBlock fence_char must be '`' or '~', got '") +
                  node.fence_char() + "'");
    }
}

void ValidationVisitor::visit_block_quote(const BlockQuote& node) {
    visit_children(node);
}

void ValidationVisitor::visit_list(const List& node) {
    if (node.ordered() && node.start() < 1) {
        add_error("Ordered list start must be >= 1, got " + std::to_string(node.start()));
    }
    if (node.items().empty()) {
        add_error("List must have at least one item");
    }
    visit_children(node);
}

void ValidationVisitor::visit_list_item(const ListItem& node) {
    check_block_children(node.content(), "ListItem");
    visit_children(node);
}

void ValidationVisitor::visit_table(const Table& node) {
    // expected column count comes from the header, else the first row
    int expected_cols = -1;
    if (node.header()) {
        expected_cols = (int)static_cast<const TableRow&>(*node.header()).cells().size();
        node.header()->accept(*this);
    } else if (!node.rows().empty()) {
        expected_cols = (int)static_cast<const TableRow&>(*node.rows()[0]).cells().size();
    }

    if (expected_cols >= 0) {
        for (size_t i = 0; i < node.rows().size(); i++) {
            int cols = (int)static_cast<const TableRow&>(*node.rows()[i]).cells().size();
            if (cols != expected_cols) {
                add_error("Table row " + std::to_string(i) + " has " + std::to_string(cols) +
                          " cells, expected " + std::to_string(expected_cols));
            }
        }
        if (!node.alignments().empty() && (int)node.alignments().size() != expected_cols) {
            add_error("Table has " + std::to_string(node.alignments().size()) +
                      " alignments but " + std::to_string(expected_cols) + " columns");
        }
    }

    for (const NodePtr& row : node.rows()) {
        row->accept(*this);
    }
}

void ValidationVisitor::visit_table_row(const TableRow& node) {
    visit_children(node);
}

void ValidationVisitor::visit_table_cell(const TableCell& node) {
    if (node.colspan() < 1) {
        add_error("TableCell colspan must be >= 1, got " + std::to_string(node.colspan()));
    }
    if (node.rowspan() < 1) {
        add_error("TableCell rowspan must be >= 1, got " + std::to_string(node.rowspan()));
    }
    check_styled(node, "TableCell");
}

void ValidationVisitor::visit_thematic_break(const ThematicBreak& node) {
    (void)node;
}

void ValidationVisitor::visit_html_block(const HTMLBlock& node) {
    (void)node;
    if (!options_.allow_raw_html) {
        add_error("Raw HTML content (HTMLBlock) is not allowed");
    }
}

void ValidationVisitor::visit_comment(const Comment& node) {
    if (node.content().empty()) {
        add_error("Comment node should have content");
    }
}

void ValidationVisitor::visit_footnote_definition(const FootnoteDefinition& node) {
    if (node.identifier().empty()) {
        add_error("FootnoteDefinition must have an identifier");
    }
    visit_children(node);
}

void ValidationVisitor::visit_definition_list(const DefinitionList& node) {
    visit_children(node);
}

void ValidationVisitor::visit_definition_term(const DefinitionTerm& node) {
    check_styled(node, "DefinitionTerm");
}

void ValidationVisitor::visit_definition_description(const DefinitionDescription& node) {
    check_block_children(node.content(), "DefinitionDescription");
    visit_children(node);
}

void ValidationVisitor::visit_math_block(const MathBlock& node) {
    check_math(node, "MathBlock");
}

void ValidationVisitor::visit_text(const Text& node) {
    (void)node;
}

void ValidationVisitor::visit_emphasis(const Emphasis& node) {
    check_styled(node, "Emphasis");
}

void ValidationVisitor::visit_strong(const Strong& node) {
    check_styled(node, "Strong");
}

void ValidationVisitor::visit_code(const Code& node) {
    (void)node;
}

void ValidationVisitor::visit_link(const Link& node) {
    if (node.url().empty()) {
        add_error("Link url must be non-empty");
    }
    check_url(node.url(), "Link", false);
    check_styled(node, "Link");
}

void ValidationVisitor::visit_image(const Image& node) {
    if (node.url().empty()) {
        add_error("Image url must be non-empty");
    }
    check_url(node.url(), "Image", true);
}

void ValidationVisitor::visit_line_break(const LineBreak& node) {
    (void)node;
}

void ValidationVisitor::visit_strikethrough(const Strikethrough& node) {
    check_styled(node, "Strikethrough");
}

void ValidationVisitor::visit_underline(const Underline& node) {
    check_styled(node, "Underline");
}

void ValidationVisitor::visit_superscript(const Superscript& node) {
    check_styled(node, "Superscript");
}

void ValidationVisitor::visit_subscript(const Subscript& node) {
    check_styled(node, "Subscript");
}

void ValidationVisitor::visit_html_inline(const HTMLInline& node) {
    (void)node;
    if (!options_.allow_raw_html) {
        add_error("Raw HTML content (HTMLInline) is not allowed");
    }
}

void ValidationVisitor::visit_comment_inline(const CommentInline& node) {
    if (node.content().empty()) {
        add_error("CommentInline node should have content");
    }
}

void ValidationVisitor::visit_footnote_reference(const FootnoteReference& node) {
    if (node.identifier().empty()) {
        add_error("FootnoteReference must have an identifier");
    }
}

void ValidationVisitor::visit_math_inline(const MathInline& node) {
    check_math(node, "MathInline");
}

ValidationReport validate_tree(const Node& root, const ValidationOptions& options) {
    ValidationVisitor validator(options);
    root.accept(validator);

    ValidationReport report;
    report.errors = validator.errors();
    report.valid = report.errors.empty();
    if (!report.valid) {
        clog_info(validate_log(), "validation found %zu issue(s)", report.errors.size());
    }
    return report;
}

} // namespace doctree
