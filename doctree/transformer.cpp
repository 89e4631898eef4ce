// transformer.cpp - NodeTransformer rebuild rules and built-in transformers

#include "transformer.hpp"
#include "doc_error.hpp"
#include "validator/doc_validator.hpp"
#include "../lib/log.h"

#include <algorithm>

#include <re2/re2.h>

namespace doctree {

static log_category_t* transform_log() {
    return log_get_category("doctree.transform");
}

// ============================================================================
// NodeTransformer
// ============================================================================

NodePtr NodeTransformer::transform(const NodePtr& node) {
    if (!node) return nullptr;
    result_.reset();
    node->accept(*this);
    NodePtr out = std::move(result_);
    result_.reset();
    return out;
}

NodeList NodeTransformer::transform_children(const NodeList& children) {
    NodeList out;
    out.reserve(children.size());
    for (const NodePtr& child : children) {
        NodePtr transformed = transform(child);
        if (transformed) out.push_back(std::move(transformed));
    }
    return out;
}

void NodeTransformer::visit_document(const Document& node) {
    set_result(make_node<Document>(transform_children(node.content()), node.attrs()));
}

void NodeTransformer::visit_heading(const Heading& node) {
    // unchecked so that malformed levels survive an identity pass
    set_result(Heading::make_unchecked(node.level(), transform_children(node.content()), node.attrs()));
}

void NodeTransformer::visit_paragraph(const Paragraph& node) {
    set_result(make_node<Paragraph>(transform_children(node.content()), node.attrs()));
}

void NodeTransformer::visit_code_block(const CodeBlock& node) {
    set_result(make_node<CodeBlock>(node));
}

void NodeTransformer::visit_block_quote(const BlockQuote& node) {
    set_result(make_node<BlockQuote>(transform_children(node.content()), node.attrs()));
}

void NodeTransformer::visit_list(const List& node) {
    set_result(make_node<List>(node.ordered(), transform_children(node.items()), node.start(),
                               node.tight(), node.attrs()));
}

void NodeTransformer::visit_list_item(const ListItem& node) {
    set_result(make_node<ListItem>(transform_children(node.content()), node.task_status(), node.attrs()));
}

void NodeTransformer::visit_table(const Table& node) {
    NodePtr header = node.header() ? transform(node.header()) : nullptr;
    NodeList rows = transform_children(node.rows());
    set_result(make_node<Table>(header, std::move(rows), node.alignments(), node.caption(), node.attrs()));
}

void NodeTransformer::visit_table_row(const TableRow& node) {
    set_result(make_node<TableRow>(transform_children(node.cells()), node.is_header(), node.attrs()));
}

void NodeTransformer::visit_table_cell(const TableCell& node) {
    set_result(make_node<TableCell>(transform_children(node.content()), node.colspan(),
                                    node.rowspan(), node.alignment(), node.attrs()));
}

void NodeTransformer::visit_thematic_break(const ThematicBreak& node) {
    set_result(make_node<ThematicBreak>(node));
}

void NodeTransformer::visit_html_block(const HTMLBlock& node) {
    set_result(make_node<HTMLBlock>(node));
}

void NodeTransformer::visit_comment(const Comment& node) {
    set_result(make_node<Comment>(node));
}

void NodeTransformer::visit_footnote_definition(const FootnoteDefinition& node) {
    set_result(make_node<FootnoteDefinition>(node.identifier(), transform_children(node.content()),
                                             node.attrs()));
}

void NodeTransformer::visit_definition_list(const DefinitionList& node) {
    std::vector<DefinitionItem> items;
    for (const DefinitionItem& item : node.items()) {
        NodePtr term = transform(item.term);
        // a deleted term takes its descriptions with it
        if (!term) continue;
        items.push_back(DefinitionItem{term, transform_children(item.descriptions)});
    }
    set_result(make_node<DefinitionList>(std::move(items), node.attrs()));
}

void NodeTransformer::visit_definition_term(const DefinitionTerm& node) {
    set_result(make_node<DefinitionTerm>(transform_children(node.content()), node.attrs()));
}

void NodeTransformer::visit_definition_description(const DefinitionDescription& node) {
    set_result(make_node<DefinitionDescription>(transform_children(node.content()), node.attrs()));
}

void NodeTransformer::visit_math_block(const MathBlock& node) {
    set_result(make_node<MathBlock>(node));
}

void NodeTransformer::visit_text(const Text& node) {
    set_result(make_node<Text>(node));
}

void NodeTransformer::visit_emphasis(const Emphasis& node) {
    set_result(make_node<Emphasis>(transform_children(node.content()), node.attrs()));
}

void NodeTransformer::visit_strong(const Strong& node) {
    set_result(make_node<Strong>(transform_children(node.content()), node.attrs()));
}

void NodeTransformer::visit_code(const Code& node) {
    set_result(make_node<Code>(node));
}

void NodeTransformer::visit_link(const Link& node) {
    set_result(make_node<Link>(node.url(), transform_children(node.content()), node.title(), node.attrs()));
}

void NodeTransformer::visit_image(const Image& node) {
    set_result(make_node<Image>(node));
}

void NodeTransformer::visit_line_break(const LineBreak& node) {
    set_result(make_node<LineBreak>(node));
}

void NodeTransformer::visit_strikethrough(const Strikethrough& node) {
    set_result(make_node<Strikethrough>(transform_children(node.content()), node.attrs()));
}

void NodeTransformer::visit_underline(const Underline& node) {
    set_result(make_node<Underline>(transform_children(node.content()), node.attrs()));
}

void NodeTransformer::visit_superscript(const Superscript& node) {
    set_result(make_node<Superscript>(transform_children(node.content()), node.attrs()));
}

void NodeTransformer::visit_subscript(const Subscript& node) {
    set_result(make_node<Subscript>(transform_children(node.content()), node.attrs()));
}

void NodeTransformer::visit_html_inline(const HTMLInline& node) {
    set_result(make_node<HTMLInline>(node));
}

void NodeTransformer::visit_comment_inline(const CommentInline& node) {
    set_result(make_node<CommentInline>(node));
}

void NodeTransformer::visit_footnote_reference(const FootnoteReference& node) {
    set_result(make_node<FootnoteReference>(node));
}

void NodeTransformer::visit_math_inline(const MathInline& node) {
    set_result(make_node<MathInline>(node));
}

DocumentPtr transform_document(const DocumentPtr& doc, NodeTransformer& transformer) {
    if (!doc) {
        throw_doc_error(transform_log(), DocErrorCode::INVALID_ARGUMENT, "cannot transform a null document");
    }
    NodePtr result = transformer.transform(doc);
    if (!result || result->type() != NodeType::DOCUMENT) {
        throw_doc_error(transform_log(), DocErrorCode::INVALID_NODE,
            std::string("transform must return a Document, got ") +
            (result ? result->type_name() : "nothing"));
    }
    clog_debug(transform_log(), "transformed document with %zu top-level nodes",
               result->children().size());
    return std::static_pointer_cast<const Document>(result);
}

// ============================================================================
// HeadingLevelTransformer
// ============================================================================

HeadingLevelTransformer::HeadingLevelTransformer(int offset, int min_level, int max_level)
    : offset_(offset), min_level_(min_level), max_level_(max_level) {
    if (min_level < 1 || max_level > 6 || min_level > max_level) {
        throw_doc_error(transform_log(), DocErrorCode::INVALID_ARGUMENT,
            "heading level bounds must satisfy 1 <= min_level <= max_level <= 6, got " +
            std::to_string(min_level) + ".." + std::to_string(max_level));
    }
}

void HeadingLevelTransformer::visit_heading(const Heading& node) {
    int level = std::max(min_level_, std::min(max_level_, node.level() + offset_));
    set_result(make_node<Heading>(level, transform_children(node.content()), node.attrs()));
}

// ============================================================================
// TextReplacer
// ============================================================================

TextReplacer::TextReplacer(const std::string& pattern, const std::string& replacement, bool use_regex)
    : pattern_(pattern), replacement_(replacement) {
    if (use_regex) {
        RE2::Options options;
        options.set_log_errors(false);
        regex_.reset(new RE2(pattern, options));
        if (!regex_->ok()) {
            std::string error = regex_->error();
            regex_.reset();
            throw_doc_error(transform_log(), DocErrorCode::INVALID_ARGUMENT,
                "Invalid regular expression pattern '" + pattern + "': " + error);
        }
        std::string rewrite_error;
        if (!regex_->CheckRewriteString(replacement, &rewrite_error)) {
            regex_.reset();
            throw_doc_error(transform_log(), DocErrorCode::INVALID_ARGUMENT,
                "Invalid replacement '" + replacement + "': " + rewrite_error);
        }
    }
}

TextReplacer::~TextReplacer() = default;

void TextReplacer::visit_text(const Text& node) {
    std::string content = node.content();
    if (regex_) {
        RE2::GlobalReplace(&content, *regex_, replacement_);
    } else if (!pattern_.empty()) {
        size_t pos = 0;
        while ((pos = content.find(pattern_, pos)) != std::string::npos) {
            content.replace(pos, pattern_.size(), replacement_);
            pos += replacement_.size();
        }
    }
    set_result(make_node<Text>(std::move(content), node.attrs()));
}

// ============================================================================
// LinkRewriter
// ============================================================================

LinkRewriter::LinkRewriter(UrlMapper mapper, bool validate_urls)
    : mapper_(std::move(mapper)), validate_urls_(validate_urls) {
    if (!mapper_) {
        throw_doc_error(transform_log(), DocErrorCode::INVALID_ARGUMENT, "LinkRewriter needs a URL mapper");
    }
}

std::string LinkRewriter::map_url(const std::string& url, const char* context) {
    std::string mapped = mapper_(url);
    if (validate_urls_) {
        std::string finding = check_url_scheme(mapped, context, false);
        if (!finding.empty()) {
            throw_doc_error(transform_log(), DocErrorCode::INVALID_ARGUMENT, finding);
        }
    }
    return mapped;
}

void LinkRewriter::visit_link(const Link& node) {
    std::string url = map_url(node.url(), "Link");
    set_result(make_node<Link>(url, transform_children(node.content()), node.title(), node.attrs()));
}

void LinkRewriter::visit_image(const Image& node) {
    std::string url = map_url(node.url(), "Image");
    set_result(make_node<Image>(url, node.alt_text(), node.title(), node.width(), node.height(),
                                node.attrs()));
}

// ============================================================================
// Collection and document helpers
// ============================================================================

void NodeCollector::enter(const Node& node) {
    if (!predicate_ || predicate_(node)) collected_.push_back(&node);
}

std::vector<const Node*> collect_nodes(const Node& root, NodeType type) {
    return collect_nodes(root, [type](const Node& node) { return node.type() == type; });
}

std::vector<const Node*> collect_nodes(const Node& root, const NodePredicate& predicate) {
    NodeCollector collector(predicate);
    root.accept(collector);
    return collector.collected();
}

namespace {

class FilterTransformer : public NodeTransformer {
public:
    explicit FilterTransformer(const NodePredicate& keep) : keep_(keep) {}

    NodePtr transform(const NodePtr& node) override {
        if (node && node->type() != NodeType::DOCUMENT && !keep_(*node)) return nullptr;
        return NodeTransformer::transform(node);
    }

private:
    const NodePredicate& keep_;
};

} // namespace

DocumentPtr filter_nodes(const DocumentPtr& doc, const NodePredicate& keep) {
    if (!keep) {
        throw_doc_error(transform_log(), DocErrorCode::INVALID_ARGUMENT, "filter_nodes needs a predicate");
    }
    FilterTransformer filter(keep);
    return transform_document(doc, filter);
}

static void merge_metadata(Json::Value& merged, const Json::Value& incoming, MetadataMerge merge) {
    if (!incoming.isObject()) return;
    for (const std::string& key : incoming.getMemberNames()) {
        const Json::Value& value = incoming[key];
        switch (merge) {
        case MetadataMerge::FIRST_WRITE_WINS:
            if (!merged.isMember(key)) merged[key] = value;
            break;
        case MetadataMerge::MERGE_LISTS:
            if (merged.isMember(key) && merged[key].isArray() && value.isArray()) {
                for (const Json::Value& element : value) merged[key].append(element);
            } else {
                merged[key] = value;
            }
            break;
        case MetadataMerge::LAST_WRITE_WINS:
            merged[key] = value;
            break;
        }
    }
}

DocumentPtr merge_documents(const std::vector<DocumentPtr>& docs, MetadataMerge merge) {
    NodeList children;
    Json::Value metadata(Json::objectValue);
    for (const DocumentPtr& doc : docs) {
        if (!doc) {
            throw_doc_error(transform_log(), DocErrorCode::INVALID_ARGUMENT, "cannot merge a null document");
        }
        children.insert(children.end(), doc->children().begin(), doc->children().end());
        merge_metadata(metadata, doc->metadata(), merge);
    }
    clog_debug(transform_log(), "merged %zu documents into %zu nodes", docs.size(), children.size());
    return make_node<Document>(std::move(children), NodeAttrs(metadata));
}

} // namespace doctree
