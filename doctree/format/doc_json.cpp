#include "doc_json.hpp"
#include "../doc_error.hpp"
#include "../node_visitor.hpp"

#include <memory>

namespace doctree {

static log_category_t* json_log() {
    return log_get_category("doctree.json");
}

[[noreturn]] static void json_error(const std::string& message) {
    throw_doc_error(json_log(), DocErrorCode::SERIALIZATION_ERROR, message);
}

// ==================== writing ====================

Json::Value source_location_to_json(const SourceLocation& location) {
    Json::Value out(Json::objectValue);
    out["node_type"] = "SourceLocation";
    out["format"] = location.format;
    if (location.page) out["page"] = *location.page;
    if (location.line) out["line"] = *location.line;
    if (location.column) out["column"] = *location.column;
    if (location.element_id) out["element_id"] = *location.element_id;
    if (location.metadata.isObject() && !location.metadata.empty()) {
        out["metadata"] = location.metadata;
    }
    return out;
}

namespace {

class JsonWriter : public NodeVisitor {
public:
    Json::Value take() { return std::move(result_); }

    void visit_document(const Document& node) override {
        begin(node);
        result_["children"] = list(node.children());
        finish(node);
    }

    void visit_heading(const Heading& node) override {
        begin(node);
        result_["level"] = node.level();
        result_["content"] = list(node.content());
        finish(node);
    }

    void visit_paragraph(const Paragraph& node) override { container(node, "content"); }

    void visit_code_block(const CodeBlock& node) override {
        begin(node);
        result_["content"] = node.content();
        if (node.language()) result_["language"] = *node.language();
        result_["fence_char"] = std::string(1, node.fence_char());
        result_["fence_length"] = node.fence_length();
        finish(node);
    }

    void visit_block_quote(const BlockQuote& node) override { container(node, "children"); }

    void visit_list(const List& node) override {
        begin(node);
        result_["ordered"] = node.ordered();
        result_["items"] = list(node.items());
        result_["start"] = node.start();
        result_["tight"] = node.tight();
        finish(node);
    }

    void visit_list_item(const ListItem& node) override {
        begin(node);
        result_["children"] = list(node.content());
        if (node.task_status() != TaskStatus::NONE) {
            result_["task_status"] = task_status_name(node.task_status());
        }
        finish(node);
    }

    void visit_table(const Table& node) override {
        begin(node);
        result_["rows"] = list(node.rows());
        if (node.header()) result_["header"] = node_to_json(*node.header());
        if (!node.alignments().empty()) {
            Json::Value alignments(Json::arrayValue);
            for (Alignment alignment : node.alignments()) alignments.append(alignment_name(alignment));
            result_["alignments"] = alignments;
        }
        if (node.caption()) result_["caption"] = *node.caption();
        finish(node);
    }

    void visit_table_row(const TableRow& node) override {
        begin(node);
        result_["cells"] = list(node.cells());
        result_["is_header"] = node.is_header();
        finish(node);
    }

    void visit_table_cell(const TableCell& node) override {
        begin(node);
        result_["content"] = list(node.content());
        result_["colspan"] = node.colspan();
        result_["rowspan"] = node.rowspan();
        if (node.alignment() != Alignment::NONE) result_["alignment"] = alignment_name(node.alignment());
        finish(node);
    }

    void visit_thematic_break(const ThematicBreak& node) override {
        begin(node);
        finish(node);
    }

    void visit_html_block(const HTMLBlock& node) override { literal(node); }
    void visit_comment(const Comment& node) override { literal(node); }

    void visit_footnote_definition(const FootnoteDefinition& node) override {
        begin(node);
        result_["identifier"] = node.identifier();
        result_["content"] = list(node.content());
        finish(node);
    }

    void visit_definition_list(const DefinitionList& node) override {
        begin(node);
        Json::Value items(Json::arrayValue);
        for (const DefinitionItem& item : node.items()) {
            Json::Value entry(Json::objectValue);
            entry["term"] = node_to_json(*item.term);
            entry["descriptions"] = list(item.descriptions);
            items.append(entry);
        }
        result_["items"] = items;
        finish(node);
    }

    void visit_definition_term(const DefinitionTerm& node) override { container(node, "content"); }
    void visit_definition_description(const DefinitionDescription& node) override { container(node, "content"); }
    void visit_math_block(const MathBlock& node) override { math(node); }

    void visit_text(const Text& node) override { literal(node); }
    void visit_emphasis(const Emphasis& node) override { container(node, "content"); }
    void visit_strong(const Strong& node) override { container(node, "content"); }
    void visit_code(const Code& node) override { literal(node); }

    void visit_link(const Link& node) override {
        begin(node);
        result_["url"] = node.url();
        result_["content"] = list(node.content());
        if (node.title()) result_["title"] = *node.title();
        finish(node);
    }

    void visit_image(const Image& node) override {
        begin(node);
        result_["url"] = node.url();
        result_["alt_text"] = node.alt_text();
        if (node.title()) result_["title"] = *node.title();
        if (node.width()) result_["width"] = *node.width();
        if (node.height()) result_["height"] = *node.height();
        finish(node);
    }

    void visit_line_break(const LineBreak& node) override {
        begin(node);
        result_["soft"] = node.soft();
        finish(node);
    }

    void visit_strikethrough(const Strikethrough& node) override { container(node, "content"); }
    void visit_underline(const Underline& node) override { container(node, "content"); }
    void visit_superscript(const Superscript& node) override { container(node, "content"); }
    void visit_subscript(const Subscript& node) override { container(node, "content"); }
    void visit_html_inline(const HTMLInline& node) override { literal(node); }
    void visit_comment_inline(const CommentInline& node) override { literal(node); }

    void visit_footnote_reference(const FootnoteReference& node) override {
        begin(node);
        result_["identifier"] = node.identifier();
        finish(node);
    }

    void visit_math_inline(const MathInline& node) override { math(node); }

private:
    void begin(const Node& node) {
        result_ = Json::Value(Json::objectValue);
        result_["node_type"] = node.type_name();
    }

    void finish(const Node& node) {
        result_["metadata"] = node.metadata();
        if (node.source_location()) {
            result_["source_location"] = source_location_to_json(*node.source_location());
        }
    }

    static Json::Value list(const NodeList& nodes) {
        Json::Value out(Json::arrayValue);
        for (const NodePtr& node : nodes) out.append(node_to_json(*node));
        return out;
    }

    void container(const ContainerNode& node, const char* field) {
        begin(node);
        result_[field] = list(node.content());
        finish(node);
    }

    void literal(const LiteralNode& node) {
        begin(node);
        result_["content"] = node.content();
        finish(node);
    }

    void math(const MathNode& node) {
        begin(node);
        result_["content"] = node.content();
        result_["notation"] = node.notation();
        if (!node.representations().empty()) {
            Json::Value reps(Json::objectValue);
            for (const auto& entry : node.representations()) reps[entry.first] = entry.second;
            result_["representations"] = reps;
        }
        finish(node);
    }

    Json::Value result_;
};

} // namespace

Json::Value node_to_json(const Node& node) {
    JsonWriter writer;
    node.accept(writer);
    return writer.take();
}

// ==================== reading ====================

namespace {

// Typed field access for one record; errors name the record kind and field
class RecordReader {
public:
    RecordReader(const Json::Value& value, const std::string& kind) : value_(value), kind_(kind) {}

    const Json::Value& field(const char* name) const {
        if (!value_.isMember(name)) fail(std::string("missing field '") + name + "'");
        return value_[name];
    }

    std::string get_string(const char* name) const {
        const Json::Value& v = field(name);
        if (!v.isString()) fail(std::string("field '") + name + "' must be a string");
        return v.asString();
    }

    std::optional<std::string> opt_string(const char* name) const {
        if (!value_.isMember(name) || value_[name].isNull()) return std::nullopt;
        return get_string(name);
    }

    int get_int(const char* name) const {
        const Json::Value& v = field(name);
        if (!v.isInt()) fail(std::string("field '") + name + "' must be an integer");
        return v.asInt();
    }

    int int_or(const char* name, int fallback) const {
        if (!value_.isMember(name) || value_[name].isNull()) return fallback;
        return get_int(name);
    }

    std::optional<int> opt_int(const char* name) const {
        if (!value_.isMember(name) || value_[name].isNull()) return std::nullopt;
        return get_int(name);
    }

    bool bool_or(const char* name, bool fallback) const {
        if (!value_.isMember(name) || value_[name].isNull()) return fallback;
        const Json::Value& v = value_[name];
        if (!v.isBool()) fail(std::string("field '") + name + "' must be a boolean");
        return v.asBool();
    }

    NodeList get_nodes(const char* name) const {
        const Json::Value& v = field(name);
        if (!v.isArray()) fail(std::string("field '") + name + "' must be an array");
        NodeList nodes;
        nodes.reserve(v.size());
        for (const Json::Value& item : v) nodes.push_back(node_from_json(item));
        return nodes;
    }

    NodeAttrs attrs() const {
        NodeAttrs attrs;
        if (value_.isMember("metadata") && !value_["metadata"].isNull()) {
            if (!value_["metadata"].isObject()) fail("field 'metadata' must be an object");
            attrs.metadata = value_["metadata"];
        }
        if (value_.isMember("source_location") && !value_["source_location"].isNull()) {
            attrs.source_location = source_location_from_json(value_["source_location"]);
        }
        return attrs;
    }

    [[noreturn]] void fail(const std::string& message) const {
        json_error(kind_ + ": " + message);
    }

private:
    const Json::Value& value_;
    const std::string& kind_;
};

MathRepresentations read_representations(const RecordReader& reader, const Json::Value& value) {
    MathRepresentations reps;
    if (!value.isMember("representations") || value["representations"].isNull()) return reps;
    const Json::Value& obj = value["representations"];
    if (!obj.isObject()) reader.fail("field 'representations' must be an object");
    for (const std::string& key : obj.getMemberNames()) {
        if (!obj[key].isString()) reader.fail("representation '" + key + "' must be a string");
        reps[key] = obj[key].asString();
    }
    return reps;
}

NodePtr read_record(const Json::Value& value, NodeType type, const std::string& kind) {
    RecordReader r(value, kind);

    switch (type) {
    case NodeType::DOCUMENT:
        return make_node<Document>(r.get_nodes("children"), r.attrs());
    case NodeType::HEADING: {
        int level = r.get_int("level");
        if (level < 1 || level > 6) {
            // kept as read; ValidationVisitor reports the level
            clog_warn(json_log(), "Heading record has out-of-range level %d", level);
            return Heading::make_unchecked(level, r.get_nodes("content"), r.attrs());
        }
        return make_node<Heading>(level, r.get_nodes("content"), r.attrs());
    }
    case NodeType::PARAGRAPH:
        return make_node<Paragraph>(r.get_nodes("content"), r.attrs());
    case NodeType::CODE_BLOCK: {
        std::string fence = value.isMember("fence_char") ? r.get_string("fence_char") : "`";
        if (fence.size() != 1) r.fail("field 'fence_char' must be a single character");
        return make_node<CodeBlock>(r.get_string("content"), r.opt_string("language"), fence[0],
                                    r.int_or("fence_length", 3), r.attrs());
    }
    case NodeType::BLOCK_QUOTE:
        return make_node<BlockQuote>(r.get_nodes("children"), r.attrs());
    case NodeType::LIST:
        return make_node<List>(r.bool_or("ordered", false), r.get_nodes("items"), r.int_or("start", 1),
                               r.bool_or("tight", true), r.attrs());
    case NodeType::LIST_ITEM: {
        TaskStatus status = TaskStatus::NONE;
        std::optional<std::string> name = r.opt_string("task_status");
        if (name && !task_status_from_name(*name, &status)) {
            r.fail("unknown task_status '" + *name + "'");
        }
        return make_node<ListItem>(r.get_nodes("children"), status, r.attrs());
    }
    case NodeType::TABLE: {
        NodePtr header;
        if (value.isMember("header") && !value["header"].isNull()) header = node_from_json(value["header"]);
        std::vector<Alignment> alignments;
        if (value.isMember("alignments") && !value["alignments"].isNull()) {
            const Json::Value& list = value["alignments"];
            if (!list.isArray()) r.fail("field 'alignments' must be an array");
            for (const Json::Value& item : list) {
                Alignment alignment;
                std::string name = item.isNull() ? "none" : (item.isString() ? item.asString() : "");
                if (!alignment_from_name(name, &alignment)) r.fail("unknown alignment '" + name + "'");
                alignments.push_back(alignment);
            }
        }
        return make_node<Table>(header, r.get_nodes("rows"), alignments, r.opt_string("caption"), r.attrs());
    }
    case NodeType::TABLE_ROW:
        return make_node<TableRow>(r.get_nodes("cells"), r.bool_or("is_header", false), r.attrs());
    case NodeType::TABLE_CELL: {
        Alignment alignment = Alignment::NONE;
        std::optional<std::string> name = r.opt_string("alignment");
        if (name && !alignment_from_name(*name, &alignment)) r.fail("unknown alignment '" + *name + "'");
        return make_node<TableCell>(r.get_nodes("content"), r.int_or("colspan", 1), r.int_or("rowspan", 1),
                                    alignment, r.attrs());
    }
    case NodeType::THEMATIC_BREAK:
        return make_node<ThematicBreak>(r.attrs());
    case NodeType::HTML_BLOCK:
        return make_node<HTMLBlock>(r.get_string("content"), r.attrs());
    case NodeType::COMMENT:
        return make_node<Comment>(r.get_string("content"), r.attrs());
    case NodeType::FOOTNOTE_DEFINITION:
        return make_node<FootnoteDefinition>(r.get_string("identifier"), r.get_nodes("content"), r.attrs());
    case NodeType::DEFINITION_LIST: {
        const Json::Value& list = r.field("items");
        if (!list.isArray()) r.fail("field 'items' must be an array");
        std::vector<DefinitionItem> items;
        for (const Json::Value& entry : list) {
            if (!entry.isObject()) r.fail("definition items must be objects");
            RecordReader item_reader(entry, kind);
            DefinitionItem item;
            item.term = node_from_json(item_reader.field("term"));
            item.descriptions = item_reader.get_nodes("descriptions");
            items.push_back(std::move(item));
        }
        return make_node<DefinitionList>(std::move(items), r.attrs());
    }
    case NodeType::DEFINITION_TERM:
        return make_node<DefinitionTerm>(r.get_nodes("content"), r.attrs());
    case NodeType::DEFINITION_DESCRIPTION:
        return make_node<DefinitionDescription>(r.get_nodes("content"), r.attrs());
    case NodeType::MATH_BLOCK:
        return make_node<MathBlock>(r.get_string("content"), r.opt_string("notation").value_or("latex"),
                                    read_representations(r, value), r.attrs());
    case NodeType::TEXT:
        return make_node<Text>(r.get_string("content"), r.attrs());
    case NodeType::EMPHASIS:
        return make_node<Emphasis>(r.get_nodes("content"), r.attrs());
    case NodeType::STRONG:
        return make_node<Strong>(r.get_nodes("content"), r.attrs());
    case NodeType::CODE:
        return make_node<Code>(r.get_string("content"), r.attrs());
    case NodeType::LINK:
        return make_node<Link>(r.get_string("url"), r.get_nodes("content"), r.opt_string("title"), r.attrs());
    case NodeType::IMAGE:
        return make_node<Image>(r.get_string("url"), r.opt_string("alt_text").value_or(""),
                                r.opt_string("title"), r.opt_int("width"), r.opt_int("height"), r.attrs());
    case NodeType::LINE_BREAK:
        return make_node<LineBreak>(r.bool_or("soft", false), r.attrs());
    case NodeType::STRIKETHROUGH:
        return make_node<Strikethrough>(r.get_nodes("content"), r.attrs());
    case NodeType::UNDERLINE:
        return make_node<Underline>(r.get_nodes("content"), r.attrs());
    case NodeType::SUPERSCRIPT:
        return make_node<Superscript>(r.get_nodes("content"), r.attrs());
    case NodeType::SUBSCRIPT:
        return make_node<Subscript>(r.get_nodes("content"), r.attrs());
    case NodeType::HTML_INLINE:
        return make_node<HTMLInline>(r.get_string("content"), r.attrs());
    case NodeType::COMMENT_INLINE:
        return make_node<CommentInline>(r.get_string("content"), r.attrs());
    case NodeType::FOOTNOTE_REFERENCE:
        return make_node<FootnoteReference>(r.get_string("identifier"), r.attrs());
    case NodeType::MATH_INLINE:
        return make_node<MathInline>(r.get_string("content"), r.opt_string("notation").value_or("latex"),
                                     read_representations(r, value), r.attrs());
    }
    r.fail("unhandled node type");
}

} // namespace

SourceLocation source_location_from_json(const Json::Value& value) {
    if (!value.isObject()) json_error("source_location must be an object");
    std::string kind = "SourceLocation";
    RecordReader r(value, kind);

    SourceLocation location;
    location.format = r.get_string("format");
    location.page = r.opt_int("page");
    location.line = r.opt_int("line");
    location.column = r.opt_int("column");
    location.element_id = r.opt_string("element_id");
    if (value.isMember("metadata") && !value["metadata"].isNull()) {
        if (!value["metadata"].isObject()) r.fail("field 'metadata' must be an object");
        location.metadata = value["metadata"];
    }
    return location;
}

NodePtr node_from_json(const Json::Value& value) {
    if (!value.isObject()) json_error("node record must be an object");
    if (!value.isMember("node_type") || !value["node_type"].isString()) {
        json_error("node record must contain a 'node_type' string");
    }
    std::string kind = value["node_type"].asString();
    NodeType type;
    if (!node_type_from_name(kind, &type)) json_error("Unknown node type: " + kind);

    try {
        return read_record(value, type, kind);
    } catch (const DocError& e) {
        if (e.code() != DocErrorCode::INVALID_NODE) throw;
        json_error(kind + ": " + e.what());
    }
}

DocumentPtr document_from_json(const Json::Value& value) {
    NodePtr node = node_from_json(value);
    if (node->type() != NodeType::DOCUMENT) {
        json_error(std::string("expected a Document record, got ") + node->type_name());
    }
    return std::static_pointer_cast<const Document>(node);
}

std::string document_to_json_string(const Document& doc, bool pretty) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = pretty ? "  " : "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, node_to_json(doc));
}

DocumentPtr document_from_json_string(const std::string& text) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        json_error("Failed to parse JSON: " + errors);
    }
    clog_debug(json_log(), "parsed %zu bytes of JSON", text.size());
    return document_from_json(root);
}

} // namespace doctree
