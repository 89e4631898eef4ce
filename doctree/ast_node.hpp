// ast_node.hpp - Document tree node model
//
// The canonical in-memory document representation shared by format readers
// and writers. Readers build a tree of immutable nodes, writers walk it with
// a NodeVisitor, and editing operations (sections, splitting, transformers)
// derive new trees from old ones.
//
// Structure:
//   Document
//     +-- block nodes (Heading, Paragraph, List, Table, BlockQuote, ...)
//           +-- inline nodes (Text, Emphasis, Link, Code, ...)
//
// Constructors enforce structural invariants (heading level range, block-only
// document children, typed list/table/definition containers) and throw
// DocError(INVALID_NODE). Semantic checks such as empty footnote identifiers
// are left to ValidationVisitor.

#pragma once
#ifndef DOCTREE_AST_NODE_HPP
#define DOCTREE_AST_NODE_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

namespace doctree {

class Node;
class NodeVisitor;

using NodePtr = std::shared_ptr<const Node>;
using NodeList = std::vector<NodePtr>;

// ============================================================================
// Node Types
// ============================================================================

enum class NodeType : uint8_t {
    // Block-level nodes
    DOCUMENT,               // Root node
    HEADING,                // Heading, level 1..6
    PARAGRAPH,              // Paragraph of inline content
    CODE_BLOCK,             // Fenced or indented code
    BLOCK_QUOTE,            // Quoted block content
    LIST,                   // Ordered or unordered list
    LIST_ITEM,              // Single list item
    TABLE,                  // Table with optional header
    TABLE_ROW,              // Table row
    TABLE_CELL,             // Table cell
    THEMATIC_BREAK,         // Horizontal rule
    HTML_BLOCK,             // Raw HTML block
    COMMENT,                // Block comment
    FOOTNOTE_DEFINITION,    // Footnote body
    DEFINITION_LIST,        // Term/description list
    DEFINITION_TERM,        // Definition list term
    DEFINITION_DESCRIPTION, // Definition list description
    MATH_BLOCK,             // Display math

    // Inline nodes
    TEXT,                   // Plain text run
    EMPHASIS,               // Emphasized content
    STRONG,                 // Strong content
    CODE,                   // Inline code span
    LINK,                   // Hyperlink
    IMAGE,                  // Image reference
    LINE_BREAK,             // Hard or soft line break
    STRIKETHROUGH,          // Struck-through content
    UNDERLINE,              // Underlined content
    SUPERSCRIPT,            // Superscript content
    SUBSCRIPT,              // Subscript content
    HTML_INLINE,            // Raw inline HTML
    COMMENT_INLINE,         // Inline comment
    FOOTNOTE_REFERENCE,     // Reference to a footnote definition
    MATH_INLINE,            // Inline math
};

// Class name of the node kind, e.g. "Heading"
const char* node_type_name(NodeType type);

// Parses a class name produced by node_type_name(); returns false if unknown
bool node_type_from_name(const std::string& name, NodeType* out);

bool node_type_is_inline(NodeType type);

// ============================================================================
// Shared field types
// ============================================================================

enum class Alignment : uint8_t {
    NONE,
    LEFT,
    CENTER,
    RIGHT,
};

const char* alignment_name(Alignment alignment);
bool alignment_from_name(const std::string& name, Alignment* out);

enum class TaskStatus : uint8_t {
    NONE,           // regular list item
    CHECKED,        // [x]
    UNCHECKED,      // [ ]
};

const char* task_status_name(TaskStatus status);
bool task_status_from_name(const std::string& name, TaskStatus* out);

// Where a node came from in its source document
struct SourceLocation {
    std::string format;                     // e.g. "pdf", "docx", "markdown"
    std::optional<int> page;
    std::optional<int> line;
    std::optional<int> column;
    std::optional<std::string> element_id;
    Json::Value metadata{Json::objectValue};

    bool operator==(const SourceLocation& other) const;
    bool operator!=(const SourceLocation& other) const { return !(*this == other); }
};

// Annotations carried by every node kind
struct NodeAttrs {
    Json::Value metadata{Json::objectValue};
    std::optional<SourceLocation> source_location;

    NodeAttrs() = default;
    explicit NodeAttrs(Json::Value meta) : metadata(std::move(meta)) {}
    NodeAttrs(Json::Value meta, SourceLocation location)
        : metadata(std::move(meta)), source_location(std::move(location)) {}
};

// ============================================================================
// Node base
// ============================================================================

class Node {
public:
    virtual ~Node() = default;

    NodeType type() const { return type_; }
    const char* type_name() const { return node_type_name(type_); }
    bool is_inline() const { return node_type_is_inline(type_); }
    bool is_block() const { return !node_type_is_inline(type_); }

    const Json::Value& metadata() const { return attrs_.metadata; }
    const std::optional<SourceLocation>& source_location() const { return attrs_.source_location; }
    const NodeAttrs& attrs() const { return attrs_; }

    // Double dispatch: calls visitor.visit_<kind>(*this)
    virtual void accept(NodeVisitor& visitor) const = 0;

    // Direct children in document order; leaf kinds return an empty list
    virtual const NodeList& children() const;

    // Compares kind-specific fields of two nodes of the same kind, not children
    virtual bool fields_equal(const Node& other) const;

protected:
    Node(NodeType type, NodeAttrs attrs);

private:
    NodeType type_;
    NodeAttrs attrs_;
};

// Recursive structural equality: kind, fields, metadata, source location and
// children compared by position
bool nodes_equal(const Node& a, const Node& b);
bool nodes_equal(const NodePtr& a, const NodePtr& b);
bool node_lists_equal(const NodeList& a, const NodeList& b);

template <typename T, typename... Args>
std::shared_ptr<const T> make_node(Args&&... args) {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

// Base for kinds whose only structure is a sequence of child nodes
class ContainerNode : public Node {
public:
    const NodeList& content() const { return content_; }
    const NodeList& children() const override { return content_; }

protected:
    ContainerNode(NodeType type, NodeList content, NodeAttrs attrs);

private:
    NodeList content_;
};

// Base for kinds holding a literal string
class LiteralNode : public Node {
public:
    const std::string& content() const { return content_; }
    bool fields_equal(const Node& other) const override;

protected:
    LiteralNode(NodeType type, std::string content, NodeAttrs attrs);

private:
    std::string content_;
};

// ============================================================================
// Block nodes
// ============================================================================

class Document : public ContainerNode {
public:
    // Throws DocError when a child is inline or another Document
    explicit Document(NodeList children, NodeAttrs attrs = NodeAttrs());
    void accept(NodeVisitor& visitor) const override;
};

using DocumentPtr = std::shared_ptr<const Document>;

class Heading : public ContainerNode {
public:
    // Throws DocError unless 1 <= level <= 6
    Heading(int level, NodeList content, NodeAttrs attrs = NodeAttrs());

    // Builds a heading without the level check, to preserve malformed input.
    // ValidationVisitor reports the bad level.
    static std::shared_ptr<const Heading> make_unchecked(int level, NodeList content,
                                                         NodeAttrs attrs = NodeAttrs());

    int level() const { return level_; }
    void accept(NodeVisitor& visitor) const override;
    bool fields_equal(const Node& other) const override;

private:
    struct Unchecked {};
    Heading(Unchecked, int level, NodeList content, NodeAttrs attrs);

    int level_;
};

class Paragraph : public ContainerNode {
public:
    explicit Paragraph(NodeList content, NodeAttrs attrs = NodeAttrs());
    void accept(NodeVisitor& visitor) const override;
};

class CodeBlock : public Node {
public:
    CodeBlock(std::string content, std::optional<std::string> language = std::nullopt,
              char fence_char = '`', int fence_length = 3, NodeAttrs attrs = NodeAttrs());

    const std::string& content() const { return content_; }
    const std::optional<std::string>& language() const { return language_; }
    char fence_char() const { return fence_char_; }
    int fence_length() const { return fence_length_; }

    void accept(NodeVisitor& visitor) const override;
    bool fields_equal(const Node& other) const override;

private:
    std::string content_;
    std::optional<std::string> language_;
    char fence_char_;
    int fence_length_;
};

class BlockQuote : public ContainerNode {
public:
    explicit BlockQuote(NodeList children, NodeAttrs attrs = NodeAttrs());
    void accept(NodeVisitor& visitor) const override;
};

class ListItem : public ContainerNode {
public:
    explicit ListItem(NodeList children, TaskStatus task_status = TaskStatus::NONE,
                      NodeAttrs attrs = NodeAttrs());

    TaskStatus task_status() const { return task_status_; }
    void accept(NodeVisitor& visitor) const override;
    bool fields_equal(const Node& other) const override;

private:
    TaskStatus task_status_;
};

class List : public Node {
public:
    // Throws DocError when an item is not a ListItem
    List(bool ordered, NodeList items, int start = 1, bool tight = true,
         NodeAttrs attrs = NodeAttrs());

    bool ordered() const { return ordered_; }
    const NodeList& items() const { return items_; }
    int start() const { return start_; }
    bool tight() const { return tight_; }

    const NodeList& children() const override { return items_; }
    void accept(NodeVisitor& visitor) const override;
    bool fields_equal(const Node& other) const override;

private:
    bool ordered_;
    NodeList items_;
    int start_;
    bool tight_;
};

class TableCell : public ContainerNode {
public:
    explicit TableCell(NodeList content, int colspan = 1, int rowspan = 1,
                       Alignment alignment = Alignment::NONE, NodeAttrs attrs = NodeAttrs());

    int colspan() const { return colspan_; }
    int rowspan() const { return rowspan_; }
    Alignment alignment() const { return alignment_; }

    void accept(NodeVisitor& visitor) const override;
    bool fields_equal(const Node& other) const override;

private:
    int colspan_;
    int rowspan_;
    Alignment alignment_;
};

class TableRow : public Node {
public:
    // Throws DocError when a cell is not a TableCell
    explicit TableRow(NodeList cells, bool is_header = false, NodeAttrs attrs = NodeAttrs());

    const NodeList& cells() const { return cells_; }
    bool is_header() const { return is_header_; }

    const NodeList& children() const override { return cells_; }
    void accept(NodeVisitor& visitor) const override;
    bool fields_equal(const Node& other) const override;

private:
    NodeList cells_;
    bool is_header_;
};

class Table : public Node {
public:
    // header may be null; throws DocError when header or rows are not TableRow
    Table(NodePtr header, NodeList rows, std::vector<Alignment> alignments = {},
          std::optional<std::string> caption = std::nullopt, NodeAttrs attrs = NodeAttrs());

    const NodePtr& header() const { return header_; }
    const NodeList& rows() const { return rows_; }
    const std::vector<Alignment>& alignments() const { return alignments_; }
    const std::optional<std::string>& caption() const { return caption_; }

    // header (when present) followed by rows
    const NodeList& children() const override { return all_rows_; }
    void accept(NodeVisitor& visitor) const override;
    bool fields_equal(const Node& other) const override;

private:
    NodePtr header_;
    NodeList rows_;
    std::vector<Alignment> alignments_;
    std::optional<std::string> caption_;
    NodeList all_rows_;
};

class ThematicBreak : public Node {
public:
    explicit ThematicBreak(NodeAttrs attrs = NodeAttrs());
    void accept(NodeVisitor& visitor) const override;
};

class HTMLBlock : public LiteralNode {
public:
    explicit HTMLBlock(std::string content, NodeAttrs attrs = NodeAttrs());
    void accept(NodeVisitor& visitor) const override;
};

class Comment : public LiteralNode {
public:
    explicit Comment(std::string content, NodeAttrs attrs = NodeAttrs());
    void accept(NodeVisitor& visitor) const override;
};

class FootnoteDefinition : public ContainerNode {
public:
    // An empty identifier is accepted here and reported by validation
    FootnoteDefinition(std::string identifier, NodeList content, NodeAttrs attrs = NodeAttrs());

    const std::string& identifier() const { return identifier_; }
    void accept(NodeVisitor& visitor) const override;
    bool fields_equal(const Node& other) const override;

private:
    std::string identifier_;
};

class DefinitionTerm : public ContainerNode {
public:
    explicit DefinitionTerm(NodeList content, NodeAttrs attrs = NodeAttrs());
    void accept(NodeVisitor& visitor) const override;
};

class DefinitionDescription : public ContainerNode {
public:
    explicit DefinitionDescription(NodeList content, NodeAttrs attrs = NodeAttrs());
    void accept(NodeVisitor& visitor) const override;
};

// One term with its descriptions
struct DefinitionItem {
    NodePtr term;
    NodeList descriptions;
};

class DefinitionList : public Node {
public:
    // Throws DocError unless every item pairs a DefinitionTerm with DefinitionDescriptions
    explicit DefinitionList(std::vector<DefinitionItem> items, NodeAttrs attrs = NodeAttrs());

    const std::vector<DefinitionItem>& items() const { return items_; }

    // term, descriptions, next term, ...
    const NodeList& children() const override { return flattened_; }
    void accept(NodeVisitor& visitor) const override;
    bool fields_equal(const Node& other) const override;

private:
    std::vector<DefinitionItem> items_;
    NodeList flattened_;
};

using MathRepresentations = std::map<std::string, std::string>;

// Base for MathInline and MathBlock
class MathNode : public Node {
public:
    const std::string& content() const { return content_; }
    const std::string& notation() const { return notation_; }
    const MathRepresentations& representations() const { return representations_; }
    bool fields_equal(const Node& other) const override;

protected:
    MathNode(NodeType type, std::string content, std::string notation,
             MathRepresentations representations, NodeAttrs attrs);

private:
    std::string content_;
    std::string notation_;
    MathRepresentations representations_;
};

class MathBlock : public MathNode {
public:
    explicit MathBlock(std::string content, std::string notation = "latex",
                       MathRepresentations representations = {}, NodeAttrs attrs = NodeAttrs());
    void accept(NodeVisitor& visitor) const override;
};

// ============================================================================
// Inline nodes
// ============================================================================

class Text : public LiteralNode {
public:
    explicit Text(std::string content, NodeAttrs attrs = NodeAttrs());
    void accept(NodeVisitor& visitor) const override;
};

class Emphasis : public ContainerNode {
public:
    explicit Emphasis(NodeList content, NodeAttrs attrs = NodeAttrs());
    void accept(NodeVisitor& visitor) const override;
};

class Strong : public ContainerNode {
public:
    explicit Strong(NodeList content, NodeAttrs attrs = NodeAttrs());
    void accept(NodeVisitor& visitor) const override;
};

class Code : public LiteralNode {
public:
    explicit Code(std::string content, NodeAttrs attrs = NodeAttrs());
    void accept(NodeVisitor& visitor) const override;
};

class Link : public ContainerNode {
public:
    Link(std::string url, NodeList content, std::optional<std::string> title = std::nullopt,
         NodeAttrs attrs = NodeAttrs());

    const std::string& url() const { return url_; }
    const std::optional<std::string>& title() const { return title_; }
    void accept(NodeVisitor& visitor) const override;
    bool fields_equal(const Node& other) const override;

private:
    std::string url_;
    std::optional<std::string> title_;
};

class Image : public Node {
public:
    Image(std::string url, std::string alt_text = "", std::optional<std::string> title = std::nullopt,
          std::optional<int> width = std::nullopt, std::optional<int> height = std::nullopt,
          NodeAttrs attrs = NodeAttrs());

    const std::string& url() const { return url_; }
    const std::string& alt_text() const { return alt_text_; }
    const std::optional<std::string>& title() const { return title_; }
    std::optional<int> width() const { return width_; }
    std::optional<int> height() const { return height_; }

    void accept(NodeVisitor& visitor) const override;
    bool fields_equal(const Node& other) const override;

private:
    std::string url_;
    std::string alt_text_;
    std::optional<std::string> title_;
    std::optional<int> width_;
    std::optional<int> height_;
};

class LineBreak : public Node {
public:
    explicit LineBreak(bool soft = false, NodeAttrs attrs = NodeAttrs());

    bool soft() const { return soft_; }
    void accept(NodeVisitor& visitor) const override;
    bool fields_equal(const Node& other) const override;

private:
    bool soft_;
};

class Strikethrough : public ContainerNode {
public:
    explicit Strikethrough(NodeList content, NodeAttrs attrs = NodeAttrs());
    void accept(NodeVisitor& visitor) const override;
};

class Underline : public ContainerNode {
public:
    explicit Underline(NodeList content, NodeAttrs attrs = NodeAttrs());
    void accept(NodeVisitor& visitor) const override;
};

class Superscript : public ContainerNode {
public:
    explicit Superscript(NodeList content, NodeAttrs attrs = NodeAttrs());
    void accept(NodeVisitor& visitor) const override;
};

class Subscript : public ContainerNode {
public:
    explicit Subscript(NodeList content, NodeAttrs attrs = NodeAttrs());
    void accept(NodeVisitor& visitor) const override;
};

class HTMLInline : public LiteralNode {
public:
    explicit HTMLInline(std::string content, NodeAttrs attrs = NodeAttrs());
    void accept(NodeVisitor& visitor) const override;
};

class CommentInline : public LiteralNode {
public:
    explicit CommentInline(std::string content, NodeAttrs attrs = NodeAttrs());
    void accept(NodeVisitor& visitor) const override;
};

class FootnoteReference : public Node {
public:
    // An empty identifier is accepted here and reported by validation
    explicit FootnoteReference(std::string identifier, NodeAttrs attrs = NodeAttrs());

    const std::string& identifier() const { return identifier_; }
    void accept(NodeVisitor& visitor) const override;
    bool fields_equal(const Node& other) const override;

private:
    std::string identifier_;
};

class MathInline : public MathNode {
public:
    explicit MathInline(std::string content, std::string notation = "latex",
                        MathRepresentations representations = {}, NodeAttrs attrs = NodeAttrs());
    void accept(NodeVisitor& visitor) const override;
};

} // namespace doctree

#endif // DOCTREE_AST_NODE_HPP
