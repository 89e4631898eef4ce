#include "doc_builder.hpp"
#include "doc_error.hpp"

namespace doctree {

static log_category_t* node_log() {
    return log_get_category("doctree.node");
}

// ============================================================================
// DocumentBuilder
// ============================================================================

DocumentBuilder& DocumentBuilder::node(NodePtr block) {
    children_.push_back(std::move(block));
    return *this;
}

DocumentBuilder& DocumentBuilder::nodes(const NodeList& blocks) {
    children_.insert(children_.end(), blocks.begin(), blocks.end());
    return *this;
}

DocumentBuilder& DocumentBuilder::heading(int level, NodeList content) {
    return node(make_node<Heading>(level, std::move(content)));
}

DocumentBuilder& DocumentBuilder::heading(int level, const std::string& text) {
    return heading(level, NodeList{make_node<Text>(text)});
}

DocumentBuilder& DocumentBuilder::paragraph(NodeList content) {
    return node(make_node<Paragraph>(std::move(content)));
}

DocumentBuilder& DocumentBuilder::paragraph(const std::string& text) {
    return paragraph(NodeList{make_node<Text>(text)});
}

DocumentBuilder& DocumentBuilder::code_block(const std::string& content, std::optional<std::string> language) {
    return node(make_node<CodeBlock>(content, std::move(language)));
}

DocumentBuilder& DocumentBuilder::thematic_break() {
    return node(make_node<ThematicBreak>());
}

DocumentPtr DocumentBuilder::build() const {
    return make_node<Document>(children_, attrs_);
}

// ============================================================================
// ListBuilder
// ============================================================================

// Drafts stay mutable until build(); an item holds its blocks followed by
// the lists nested under it
struct ListBuilder::ItemDraft {
    NodeList content;
    TaskStatus task_status = TaskStatus::NONE;
    std::vector<std::unique_ptr<ListDraft>> nested;
};

struct ListBuilder::ListDraft {
    bool ordered = false;
    std::vector<ItemDraft> items;

    std::shared_ptr<const List> freeze() const {
        NodeList frozen;
        for (const ItemDraft& item : items) {
            NodeList blocks(item.content);
            for (const auto& list : item.nested) blocks.push_back(list->freeze());
            frozen.push_back(make_node<ListItem>(std::move(blocks), item.task_status));
        }
        return make_node<List>(ordered, std::move(frozen));
    }
};

ListBuilder::ListBuilder() {}

ListBuilder::~ListBuilder() {}

ListBuilder& ListBuilder::add_item(int level, bool ordered, NodeList content, TaskStatus task_status) {
    if (level < 1) {
        throw_doc_error(node_log(), DocErrorCode::INVALID_ARGUMENT,
                        "List level must be >= 1, got " + std::to_string(level));
    }

    while (!stack_.empty() && stack_.back().second > level) {
        stack_.pop_back();
    }

    // attaches a new list at the given level under the innermost open item
    auto open_list = [this](bool is_ordered, int at_level) {
        std::unique_ptr<ListDraft> draft(new ListDraft());
        draft->ordered = is_ordered;
        ListDraft* list = draft.get();
        if (stack_.empty()) {
            roots_.push_back(std::move(draft));
        } else {
            ListDraft* parent = stack_.back().first;
            if (parent->items.empty()) parent->items.push_back(ItemDraft());
            parent->items.back().nested.push_back(std::move(draft));
        }
        stack_.push_back(std::make_pair(list, at_level));
    };

    int current = stack_.empty() ? 0 : stack_.back().second;
    if (current == level && stack_.back().first->ordered != ordered) {
        stack_.pop_back();
        open_list(ordered, level);
    }
    while (current < level) {
        current++;
        open_list(ordered, current);
    }

    ItemDraft item;
    item.content = std::move(content);
    item.task_status = task_status;
    stack_.back().first->items.push_back(std::move(item));
    return *this;
}

NodeList ListBuilder::build() const {
    NodeList lists;
    for (const auto& list : roots_) lists.push_back(list->freeze());
    return lists;
}

DocumentPtr ListBuilder::document() const {
    return make_node<Document>(build());
}

// ============================================================================
// TableBuilder
// ============================================================================

TableBuilder& TableBuilder::add_row(const std::vector<NodeList>& cells, bool is_header,
                                    const std::vector<Alignment>& alignments) {
    if (has_header_ && !header_ && !is_header) is_header = true;

    NodeList row_cells;
    for (const NodeList& content : cells) {
        row_cells.push_back(make_node<TableCell>(content));
    }
    NodePtr row = make_node<TableRow>(std::move(row_cells), is_header);

    if (is_header) {
        header_ = row;
        if (!alignments.empty()) {
            alignments_ = alignments;
        } else if (alignments_.empty()) {
            alignments_.assign(cells.size(), Alignment::NONE);
        }
    } else {
        rows_.push_back(row);
    }
    return *this;
}

TableBuilder& TableBuilder::add_row(std::initializer_list<std::string> cells, bool is_header) {
    return add_text_row(std::vector<std::string>(cells), is_header);
}

TableBuilder& TableBuilder::add_text_row(const std::vector<std::string>& cells, bool is_header) {
    std::vector<NodeList> contents;
    for (const std::string& text : cells) {
        contents.push_back(NodeList{make_node<Text>(text)});
    }
    return add_row(contents, is_header);
}

TableBuilder& TableBuilder::set_caption(const std::string& caption) {
    caption_ = caption;
    return *this;
}

TableBuilder& TableBuilder::set_column_alignment(size_t column, Alignment alignment) {
    if (alignments_.size() <= column) alignments_.resize(column + 1, Alignment::NONE);
    alignments_[column] = alignment;
    return *this;
}

std::shared_ptr<const Table> TableBuilder::build() const {
    return make_node<Table>(header_, rows_, alignments_, caption_);
}

} // namespace doctree
