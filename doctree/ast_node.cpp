// ast_node.cpp - Node construction, invariants and structural equality

#include "ast_node.hpp"
#include "node_visitor.hpp"
#include "doc_error.hpp"
#include "../lib/log.h"

namespace doctree {

static log_category_t* node_log() {
    return log_get_category("doctree.node");
}

// ============================================================================
// Kind names
// ============================================================================

struct NodeTypeInfo {
    NodeType type;
    const char* name;
    bool is_inline;
};

static const NodeTypeInfo NODE_TYPE_TABLE[] = {
    {NodeType::DOCUMENT, "Document", false},
    {NodeType::HEADING, "Heading", false},
    {NodeType::PARAGRAPH, "Paragraph", false},
    {NodeType::CODE_BLOCK, "CodeBlock", false},
    {NodeType::BLOCK_QUOTE, "BlockQuote", false},
    {NodeType::LIST, "List", false},
    {NodeType::LIST_ITEM, "ListItem", false},
    {NodeType::TABLE, "Table", false},
    {NodeType::TABLE_ROW, "TableRow", false},
    {NodeType::TABLE_CELL, "TableCell", false},
    {NodeType::THEMATIC_BREAK, "ThematicBreak", false},
    {NodeType::HTML_BLOCK, "HTMLBlock", false},
    {NodeType::COMMENT, "Comment", false},
    {NodeType::FOOTNOTE_DEFINITION, "FootnoteDefinition", false},
    {NodeType::DEFINITION_LIST, "DefinitionList", false},
    {NodeType::DEFINITION_TERM, "DefinitionTerm", false},
    {NodeType::DEFINITION_DESCRIPTION, "DefinitionDescription", false},
    {NodeType::MATH_BLOCK, "MathBlock", false},
    {NodeType::TEXT, "Text", true},
    {NodeType::EMPHASIS, "Emphasis", true},
    {NodeType::STRONG, "Strong", true},
    {NodeType::CODE, "Code", true},
    {NodeType::LINK, "Link", true},
    {NodeType::IMAGE, "Image", true},
    {NodeType::LINE_BREAK, "LineBreak", true},
    {NodeType::STRIKETHROUGH, "Strikethrough", true},
    {NodeType::UNDERLINE, "Underline", true},
    {NodeType::SUPERSCRIPT, "Superscript", true},
    {NodeType::SUBSCRIPT, "Subscript", true},
    {NodeType::HTML_INLINE, "HTMLInline", true},
    {NodeType::COMMENT_INLINE, "CommentInline", true},
    {NodeType::FOOTNOTE_REFERENCE, "FootnoteReference", true},
    {NodeType::MATH_INLINE, "MathInline", true},
};

static const size_t NODE_TYPE_COUNT = sizeof(NODE_TYPE_TABLE) / sizeof(NODE_TYPE_TABLE[0]);

const char* node_type_name(NodeType type) {
    size_t index = static_cast<size_t>(type);
    if (index < NODE_TYPE_COUNT) return NODE_TYPE_TABLE[index].name;
    return "Unknown";
}

bool node_type_from_name(const std::string& name, NodeType* out) {
    for (size_t i = 0; i < NODE_TYPE_COUNT; i++) {
        if (name == NODE_TYPE_TABLE[i].name) {
            if (out) *out = NODE_TYPE_TABLE[i].type;
            return true;
        }
    }
    return false;
}

bool node_type_is_inline(NodeType type) {
    size_t index = static_cast<size_t>(type);
    return index < NODE_TYPE_COUNT && NODE_TYPE_TABLE[index].is_inline;
}

const char* alignment_name(Alignment alignment) {
    switch (alignment) {
    case Alignment::LEFT: return "left";
    case Alignment::CENTER: return "center";
    case Alignment::RIGHT: return "right";
    case Alignment::NONE: break;
    }
    return "none";
}

bool alignment_from_name(const std::string& name, Alignment* out) {
    Alignment value;
    if (name == "left") value = Alignment::LEFT;
    else if (name == "center") value = Alignment::CENTER;
    else if (name == "right") value = Alignment::RIGHT;
    else if (name == "none" || name.empty()) value = Alignment::NONE;
    else return false;
    if (out) *out = value;
    return true;
}

const char* task_status_name(TaskStatus status) {
    switch (status) {
    case TaskStatus::CHECKED: return "checked";
    case TaskStatus::UNCHECKED: return "unchecked";
    case TaskStatus::NONE: break;
    }
    return "none";
}

bool task_status_from_name(const std::string& name, TaskStatus* out) {
    TaskStatus value;
    if (name == "checked") value = TaskStatus::CHECKED;
    else if (name == "unchecked") value = TaskStatus::UNCHECKED;
    else if (name == "none" || name.empty()) value = TaskStatus::NONE;
    else return false;
    if (out) *out = value;
    return true;
}

bool SourceLocation::operator==(const SourceLocation& other) const {
    return format == other.format && page == other.page && line == other.line &&
           column == other.column && element_id == other.element_id &&
           metadata == other.metadata;
}

// ============================================================================
// Construction helpers
// ============================================================================

static void require_children(const NodeList& children, const char* owner) {
    for (size_t i = 0; i < children.size(); i++) {
        if (!children[i]) {
            throw_doc_error(node_log(), DocErrorCode::INVALID_NODE,
                std::string(owner) + " child " + std::to_string(i) + " is null");
        }
    }
}

static void require_kind(const NodeList& children, NodeType kind, const char* owner,
                         const char* what) {
    require_children(children, owner);
    for (size_t i = 0; i < children.size(); i++) {
        if (children[i]->type() != kind) {
            throw_doc_error(node_log(), DocErrorCode::INVALID_NODE,
                std::string(owner) + " " + what + " " + std::to_string(i) + " must be " +
                node_type_name(kind) + ", got " + children[i]->type_name());
        }
    }
}

static NodeAttrs normalize_attrs(NodeAttrs attrs) {
    if (attrs.metadata.isNull()) attrs.metadata = Json::Value(Json::objectValue);
    return attrs;
}

// ============================================================================
// Node base
// ============================================================================

Node::Node(NodeType type, NodeAttrs attrs)
    : type_(type), attrs_(normalize_attrs(std::move(attrs))) {}

const NodeList& Node::children() const {
    static const NodeList empty;
    return empty;
}

bool Node::fields_equal(const Node& other) const {
    (void)other;
    return true;
}

bool nodes_equal(const Node& a, const Node& b) {
    if (&a == &b) return true;
    if (a.type() != b.type()) return false;
    if (a.metadata() != b.metadata()) return false;
    if (a.source_location() != b.source_location()) return false;
    if (!a.fields_equal(b)) return false;
    return node_lists_equal(a.children(), b.children());
}

bool nodes_equal(const NodePtr& a, const NodePtr& b) {
    if (!a || !b) return !a && !b;
    return nodes_equal(*a, *b);
}

bool node_lists_equal(const NodeList& a, const NodeList& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (!nodes_equal(a[i], b[i])) return false;
    }
    return true;
}

ContainerNode::ContainerNode(NodeType type, NodeList content, NodeAttrs attrs)
    : Node(type, std::move(attrs)), content_(std::move(content)) {
    require_children(content_, node_type_name(type));
}

LiteralNode::LiteralNode(NodeType type, std::string content, NodeAttrs attrs)
    : Node(type, std::move(attrs)), content_(std::move(content)) {}

bool LiteralNode::fields_equal(const Node& other) const {
    return content_ == static_cast<const LiteralNode&>(other).content_;
}

// ============================================================================
// Block nodes
// ============================================================================

Document::Document(NodeList children, NodeAttrs attrs)
    : ContainerNode(NodeType::DOCUMENT, std::move(children), std::move(attrs)) {
    const NodeList& kids = content();
    for (size_t i = 0; i < kids.size(); i++) {
        if (kids[i]->is_inline() || kids[i]->type() == NodeType::DOCUMENT) {
            throw_doc_error(node_log(), DocErrorCode::INVALID_NODE,
                "Document child " + std::to_string(i) + " must be a block node, got " +
                kids[i]->type_name());
        }
    }
}

void Document::accept(NodeVisitor& visitor) const { visitor.visit_document(*this); }

Heading::Heading(int level, NodeList content, NodeAttrs attrs)
    : ContainerNode(NodeType::HEADING, std::move(content), std::move(attrs)), level_(level) {
    if (level < 1 || level > 6) {
        throw_doc_error(node_log(), DocErrorCode::INVALID_NODE,
            "Heading level must be between 1 and 6, got " + std::to_string(level));
    }
}

Heading::Heading(Unchecked, int level, NodeList content, NodeAttrs attrs)
    : ContainerNode(NodeType::HEADING, std::move(content), std::move(attrs)), level_(level) {}

std::shared_ptr<const Heading> Heading::make_unchecked(int level, NodeList content, NodeAttrs attrs) {
    if (level < 1 || level > 6) {
        clog_debug(node_log(), "building unchecked heading with level %d", level);
    }
    return std::shared_ptr<const Heading>(
        new Heading(Unchecked(), level, std::move(content), std::move(attrs)));
}

void Heading::accept(NodeVisitor& visitor) const { visitor.visit_heading(*this); }

bool Heading::fields_equal(const Node& other) const {
    return level_ == static_cast<const Heading&>(other).level_;
}

Paragraph::Paragraph(NodeList content, NodeAttrs attrs)
    : ContainerNode(NodeType::PARAGRAPH, std::move(content), std::move(attrs)) {}

void Paragraph::accept(NodeVisitor& visitor) const { visitor.visit_paragraph(*this); }

CodeBlock::CodeBlock(std::string content, std::optional<std::string> language,
                     char fence_char, int fence_length, NodeAttrs attrs)
    : Node(NodeType::CODE_BLOCK, std::move(attrs)), content_(std::move(content)),
      language_(std::move(language)), fence_char_(fence_char), fence_length_(fence_length) {}

void CodeBlock::accept(NodeVisitor& visitor) const { visitor.visit_code_block(*this); }

bool CodeBlock::fields_equal(const Node& other) const {
    const CodeBlock& o = static_cast<const CodeBlock&>(other);
    return content_ == o.content_ && language_ == o.language_ &&
           fence_char_ == o.fence_char_ && fence_length_ == o.fence_length_;
}

BlockQuote::BlockQuote(NodeList children, NodeAttrs attrs)
    : ContainerNode(NodeType::BLOCK_QUOTE, std::move(children), std::move(attrs)) {}

void BlockQuote::accept(NodeVisitor& visitor) const { visitor.visit_block_quote(*this); }

ListItem::ListItem(NodeList children, TaskStatus task_status, NodeAttrs attrs)
    : ContainerNode(NodeType::LIST_ITEM, std::move(children), std::move(attrs)),
      task_status_(task_status) {}

void ListItem::accept(NodeVisitor& visitor) const { visitor.visit_list_item(*this); }

bool ListItem::fields_equal(const Node& other) const {
    return task_status_ == static_cast<const ListItem&>(other).task_status_;
}

List::List(bool ordered, NodeList items, int start, bool tight, NodeAttrs attrs)
    : Node(NodeType::LIST, std::move(attrs)), ordered_(ordered), items_(std::move(items)),
      start_(start), tight_(tight) {
    require_kind(items_, NodeType::LIST_ITEM, "List", "item");
}

void List::accept(NodeVisitor& visitor) const { visitor.visit_list(*this); }

bool List::fields_equal(const Node& other) const {
    const List& o = static_cast<const List&>(other);
    return ordered_ == o.ordered_ && start_ == o.start_ && tight_ == o.tight_;
}

TableCell::TableCell(NodeList content, int colspan, int rowspan, Alignment alignment, NodeAttrs attrs)
    : ContainerNode(NodeType::TABLE_CELL, std::move(content), std::move(attrs)),
      colspan_(colspan), rowspan_(rowspan), alignment_(alignment) {}

void TableCell::accept(NodeVisitor& visitor) const { visitor.visit_table_cell(*this); }

bool TableCell::fields_equal(const Node& other) const {
    const TableCell& o = static_cast<const TableCell&>(other);
    return colspan_ == o.colspan_ && rowspan_ == o.rowspan_ && alignment_ == o.alignment_;
}

TableRow::TableRow(NodeList cells, bool is_header, NodeAttrs attrs)
    : Node(NodeType::TABLE_ROW, std::move(attrs)), cells_(std::move(cells)), is_header_(is_header) {
    require_kind(cells_, NodeType::TABLE_CELL, "TableRow", "cell");
}

void TableRow::accept(NodeVisitor& visitor) const { visitor.visit_table_row(*this); }

bool TableRow::fields_equal(const Node& other) const {
    return is_header_ == static_cast<const TableRow&>(other).is_header_;
}

Table::Table(NodePtr header, NodeList rows, std::vector<Alignment> alignments,
             std::optional<std::string> caption, NodeAttrs attrs)
    : Node(NodeType::TABLE, std::move(attrs)), header_(std::move(header)), rows_(std::move(rows)),
      alignments_(std::move(alignments)), caption_(std::move(caption)) {
    if (header_ && header_->type() != NodeType::TABLE_ROW) {
        throw_doc_error(node_log(), DocErrorCode::INVALID_NODE,
            std::string("Table header must be TableRow, got ") + header_->type_name());
    }
    require_kind(rows_, NodeType::TABLE_ROW, "Table", "row");

    if (header_) all_rows_.push_back(header_);
    all_rows_.insert(all_rows_.end(), rows_.begin(), rows_.end());
}

void Table::accept(NodeVisitor& visitor) const { visitor.visit_table(*this); }

bool Table::fields_equal(const Node& other) const {
    const Table& o = static_cast<const Table&>(other);
    return (header_ != nullptr) == (o.header_ != nullptr) &&
           alignments_ == o.alignments_ && caption_ == o.caption_;
}

ThematicBreak::ThematicBreak(NodeAttrs attrs) : Node(NodeType::THEMATIC_BREAK, std::move(attrs)) {}

void ThematicBreak::accept(NodeVisitor& visitor) const { visitor.visit_thematic_break(*this); }

HTMLBlock::HTMLBlock(std::string content, NodeAttrs attrs)
    : LiteralNode(NodeType::HTML_BLOCK, std::move(content), std::move(attrs)) {}

void HTMLBlock::accept(NodeVisitor& visitor) const { visitor.visit_html_block(*this); }

Comment::Comment(std::string content, NodeAttrs attrs)
    : LiteralNode(NodeType::COMMENT, std::move(content), std::move(attrs)) {}

void Comment::accept(NodeVisitor& visitor) const { visitor.visit_comment(*this); }

FootnoteDefinition::FootnoteDefinition(std::string identifier, NodeList content, NodeAttrs attrs)
    : ContainerNode(NodeType::FOOTNOTE_DEFINITION, std::move(content), std::move(attrs)),
      identifier_(std::move(identifier)) {}

void FootnoteDefinition::accept(NodeVisitor& visitor) const { visitor.visit_footnote_definition(*this); }

bool FootnoteDefinition::fields_equal(const Node& other) const {
    return identifier_ == static_cast<const FootnoteDefinition&>(other).identifier_;
}

DefinitionTerm::DefinitionTerm(NodeList content, NodeAttrs attrs)
    : ContainerNode(NodeType::DEFINITION_TERM, std::move(content), std::move(attrs)) {}

void DefinitionTerm::accept(NodeVisitor& visitor) const { visitor.visit_definition_term(*this); }

DefinitionDescription::DefinitionDescription(NodeList content, NodeAttrs attrs)
    : ContainerNode(NodeType::DEFINITION_DESCRIPTION, std::move(content), std::move(attrs)) {}

void DefinitionDescription::accept(NodeVisitor& visitor) const {
    visitor.visit_definition_description(*this);
}

DefinitionList::DefinitionList(std::vector<DefinitionItem> items, NodeAttrs attrs)
    : Node(NodeType::DEFINITION_LIST, std::move(attrs)), items_(std::move(items)) {
    for (size_t i = 0; i < items_.size(); i++) {
        const DefinitionItem& item = items_[i];
        if (!item.term || item.term->type() != NodeType::DEFINITION_TERM) {
            throw_doc_error(node_log(), DocErrorCode::INVALID_NODE,
                "DefinitionList item " + std::to_string(i) + " must start with a DefinitionTerm");
        }
        require_kind(item.descriptions, NodeType::DEFINITION_DESCRIPTION,
                     "DefinitionList", "description");
        flattened_.push_back(item.term);
        flattened_.insert(flattened_.end(), item.descriptions.begin(), item.descriptions.end());
    }
}

void DefinitionList::accept(NodeVisitor& visitor) const { visitor.visit_definition_list(*this); }

bool DefinitionList::fields_equal(const Node& other) const {
    const DefinitionList& o = static_cast<const DefinitionList&>(other);
    if (items_.size() != o.items_.size()) return false;
    for (size_t i = 0; i < items_.size(); i++) {
        if (items_[i].descriptions.size() != o.items_[i].descriptions.size()) return false;
    }
    return true;
}

MathNode::MathNode(NodeType type, std::string content, std::string notation,
                   MathRepresentations representations, NodeAttrs attrs)
    : Node(type, std::move(attrs)), content_(std::move(content)), notation_(std::move(notation)),
      representations_(std::move(representations)) {}

bool MathNode::fields_equal(const Node& other) const {
    const MathNode& o = static_cast<const MathNode&>(other);
    return content_ == o.content_ && notation_ == o.notation_ &&
           representations_ == o.representations_;
}

MathBlock::MathBlock(std::string content, std::string notation,
                     MathRepresentations representations, NodeAttrs attrs)
    : MathNode(NodeType::MATH_BLOCK, std::move(content), std::move(notation),
               std::move(representations), std::move(attrs)) {}

void MathBlock::accept(NodeVisitor& visitor) const { visitor.visit_math_block(*this); }

// ============================================================================
// Inline nodes
// ============================================================================

Text::Text(std::string content, NodeAttrs attrs)
    : LiteralNode(NodeType::TEXT, std::move(content), std::move(attrs)) {}

void Text::accept(NodeVisitor& visitor) const { visitor.visit_text(*this); }

Emphasis::Emphasis(NodeList content, NodeAttrs attrs)
    : ContainerNode(NodeType::EMPHASIS, std::move(content), std::move(attrs)) {}

void Emphasis::accept(NodeVisitor& visitor) const { visitor.visit_emphasis(*this); }

Strong::Strong(NodeList content, NodeAttrs attrs)
    : ContainerNode(NodeType::STRONG, std::move(content), std::move(attrs)) {}

void Strong::accept(NodeVisitor& visitor) const { visitor.visit_strong(*this); }

Code::Code(std::string content, NodeAttrs attrs)
    : LiteralNode(NodeType::CODE, std::move(content), std::move(attrs)) {}

void Code::accept(NodeVisitor& visitor) const { visitor.visit_code(*this); }

Link::Link(std::string url, NodeList content, std::optional<std::string> title, NodeAttrs attrs)
    : ContainerNode(NodeType::LINK, std::move(content), std::move(attrs)),
      url_(std::move(url)), title_(std::move(title)) {}

void Link::accept(NodeVisitor& visitor) const { visitor.visit_link(*this); }

bool Link::fields_equal(const Node& other) const {
    const Link& o = static_cast<const Link&>(other);
    return url_ == o.url_ && title_ == o.title_;
}

Image::Image(std::string url, std::string alt_text, std::optional<std::string> title,
             std::optional<int> width, std::optional<int> height, NodeAttrs attrs)
    : Node(NodeType::IMAGE, std::move(attrs)), url_(std::move(url)), alt_text_(std::move(alt_text)),
      title_(std::move(title)), width_(width), height_(height) {}

void Image::accept(NodeVisitor& visitor) const { visitor.visit_image(*this); }

bool Image::fields_equal(const Node& other) const {
    const Image& o = static_cast<const Image&>(other);
    return url_ == o.url_ && alt_text_ == o.alt_text_ && title_ == o.title_ &&
           width_ == o.width_ && height_ == o.height_;
}

LineBreak::LineBreak(bool soft, NodeAttrs attrs)
    : Node(NodeType::LINE_BREAK, std::move(attrs)), soft_(soft) {}

void LineBreak::accept(NodeVisitor& visitor) const { visitor.visit_line_break(*this); }

bool LineBreak::fields_equal(const Node& other) const {
    return soft_ == static_cast<const LineBreak&>(other).soft_;
}

Strikethrough::Strikethrough(NodeList content, NodeAttrs attrs)
    : ContainerNode(NodeType::STRIKETHROUGH, std::move(content), std::move(attrs)) {}

void Strikethrough::accept(NodeVisitor& visitor) const { visitor.visit_strikethrough(*this); }

Underline::Underline(NodeList content, NodeAttrs attrs)
    : ContainerNode(NodeType::UNDERLINE, std::move(content), std::move(attrs)) {}

void Underline::accept(NodeVisitor& visitor) const { visitor.visit_underline(*this); }

Superscript::Superscript(NodeList content, NodeAttrs attrs)
    : ContainerNode(NodeType::SUPERSCRIPT, std::move(content), std::move(attrs)) {}

void Superscript::accept(NodeVisitor& visitor) const { visitor.visit_superscript(*this); }

Subscript::Subscript(NodeList content, NodeAttrs attrs)
    : ContainerNode(NodeType::SUBSCRIPT, std::move(content), std::move(attrs)) {}

void Subscript::accept(NodeVisitor& visitor) const { visitor.visit_subscript(*this); }

HTMLInline::HTMLInline(std::string content, NodeAttrs attrs)
    : LiteralNode(NodeType::HTML_INLINE, std::move(content), std::move(attrs)) {}

void HTMLInline::accept(NodeVisitor& visitor) const { visitor.visit_html_inline(*this); }

CommentInline::CommentInline(std::string content, NodeAttrs attrs)
    : LiteralNode(NodeType::COMMENT_INLINE, std::move(content), std::move(attrs)) {}

void CommentInline::accept(NodeVisitor& visitor) const { visitor.visit_comment_inline(*this); }

FootnoteReference::FootnoteReference(std::string identifier, NodeAttrs attrs)
    : Node(NodeType::FOOTNOTE_REFERENCE, std::move(attrs)), identifier_(std::move(identifier)) {}

void FootnoteReference::accept(NodeVisitor& visitor) const { visitor.visit_footnote_reference(*this); }

bool FootnoteReference::fields_equal(const Node& other) const {
    return identifier_ == static_cast<const FootnoteReference&>(other).identifier_;
}

MathInline::MathInline(std::string content, std::string notation,
                       MathRepresentations representations, NodeAttrs attrs)
    : MathNode(NodeType::MATH_INLINE, std::move(content), std::move(notation),
               std::move(representations), std::move(attrs)) {}

void MathInline::accept(NodeVisitor& visitor) const { visitor.visit_math_inline(*this); }

// ============================================================================
// NodeVisitor
// ============================================================================

void NodeVisitor::visit_children(const Node& node) {
    for (const NodePtr& child : node.children()) {
        child->accept(*this);
    }
}

} // namespace doctree
