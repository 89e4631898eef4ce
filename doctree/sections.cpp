#include "sections.hpp"
#include "doc_error.hpp"
#include "doc_text.hpp"
#include "suggestions.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <set>

#include <re2/re2.h>

namespace doctree {

static log_category_t* section_log() {
    return log_get_category("doctree.section");
}

static std::string lower_copy(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return out;
}

static std::string trim_copy(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

static std::string heading_text_of(const Heading& heading) {
    return trim_copy(extract_text(heading));
}

static bool text_matches(const std::string& heading_text, const std::string& wanted, bool case_sensitive) {
    if (case_sensitive) return heading_text == trim_copy(wanted);
    return lower_copy(heading_text) == lower_copy(trim_copy(wanted));
}

static bool has_wildcards(const std::string& pattern) {
    return pattern.find_first_of("*?") != std::string::npos;
}

// Translates a '*' / '?' pattern into an anchored RE2 expression
static std::string glob_to_regex(const std::string& pattern) {
    std::string re;
    for (char c : pattern) {
        if (c == '*') {
            re += ".*";
        } else if (c == '?') {
            re += ".";
        } else {
            re += RE2::QuoteMeta(std::string(1, c));
        }
    }
    return re;
}

static DocumentPtr rebuild(const Document& doc, NodeList children) {
    return make_node<Document>(std::move(children), doc.attrs());
}

// ============================================================================
// Section
// ============================================================================

NodeList Section::to_nodes() const {
    NodeList nodes;
    nodes.reserve(content.size() + 1);
    nodes.push_back(heading);
    nodes.insert(nodes.end(), content.begin(), content.end());
    return nodes;
}

DocumentPtr Section::to_document() const {
    return make_node<Document>(to_nodes());
}

std::string Section::heading_text() const {
    return heading ? heading_text_of(*heading) : "";
}

static Section make_section(const NodeList& children, size_t start, size_t end) {
    Section section;
    section.heading = std::static_pointer_cast<const Heading>(children[start]);
    section.level = section.heading->level();
    section.start_index = start;
    section.end_index = end;
    section.content.assign(children.begin() + start + 1, children.begin() + end);
    return section;
}

static const Heading* as_heading(const NodePtr& node) {
    if (node->type() != NodeType::HEADING) return nullptr;
    return static_cast<const Heading*>(node.get());
}

std::vector<Section> get_all_sections(const Document& doc, int min_level, int max_level) {
    if (min_level < 1 || max_level > 6 || min_level > max_level) {
        throw_doc_error(section_log(), DocErrorCode::INVALID_ARGUMENT,
                        "Invalid heading level range: " + std::to_string(min_level) + "-" +
                            std::to_string(max_level));
    }

    const NodeList& children = doc.children();
    std::vector<Section> sections;
    for (size_t i = 0; i < children.size(); i++) {
        const Heading* heading = as_heading(children[i]);
        if (!heading || heading->level() < min_level || heading->level() > max_level) continue;

        // section runs until the next heading at the same or a higher level
        size_t end = i + 1;
        while (end < children.size()) {
            const Heading* next = as_heading(children[end]);
            if (next && next->level() <= heading->level()) break;
            end++;
        }
        sections.push_back(make_section(children, i, end));
    }
    return sections;
}

NodeList get_preamble(const Document& doc) {
    NodeList preamble;
    for (const NodePtr& child : doc.children()) {
        if (child->type() == NodeType::HEADING) break;
        preamble.push_back(child);
    }
    return preamble;
}

std::vector<Section> partition_sections(const Document& doc, int max_level) {
    const NodeList& children = doc.children();
    std::vector<Section> parts;
    size_t i = 0;
    while (i < children.size()) {
        const Heading* heading = as_heading(children[i]);
        if (!heading || heading->level() > max_level) {
            i++;
            continue;
        }
        size_t end = i + 1;
        while (end < children.size()) {
            const Heading* next = as_heading(children[end]);
            if (next && next->level() <= max_level) break;
            end++;
        }
        parts.push_back(make_section(children, i, end));
        i = end;
    }
    return parts;
}

NodeList partition_preamble(const Document& doc, const std::vector<Section>& parts) {
    const NodeList& children = doc.children();
    size_t end = parts.empty() ? children.size() : parts.front().start_index;
    return NodeList(children.begin(), children.begin() + end);
}

// ============================================================================
// Target resolution
// ============================================================================

std::string SectionTarget::describe() const {
    if (by_index_) return "section index " + std::to_string(index_);
    return "section '" + text_ + "'";
}

Section resolve_section(const Document& doc, const SectionTarget& target) {
    std::vector<Section> sections = get_all_sections(doc);

    if (target.by_index()) {
        if (target.index() < 0 || target.index() >= (int)sections.size()) {
            std::string range = sections.empty() ? "document has no sections"
                                                 : "0-" + std::to_string(sections.size() - 1);
            throw_doc_error(section_log(), DocErrorCode::INDEX_OUT_OF_RANGE,
                            "Section index " + std::to_string(target.index()) + " out of range (" +
                                range + ")");
        }
        return sections[target.index()];
    }

    std::vector<size_t> matches;
    for (size_t i = 0; i < sections.size(); i++) {
        if (text_matches(sections[i].heading_text(), target.text(), target.case_sensitive())) {
            matches.push_back(i);
        }
    }

    if (matches.empty()) {
        std::vector<std::string> names;
        for (const Section& section : sections) names.push_back(section.heading_text());
        std::string message = "Section not found: '" + target.text() + "'";
        std::vector<std::string> similar = suggest_similar(target.text(), names);
        if (!similar.empty()) {
            message += ". Did you mean: ";
            for (size_t i = 0; i < similar.size(); i++) {
                if (i > 0) message += ", ";
                message += similar[i];
            }
            message += "?";
        }
        throw_doc_error(section_log(), DocErrorCode::TARGET_NOT_FOUND, message);
    }
    if (matches.size() > 1) {
        throw_doc_error(section_log(), DocErrorCode::AMBIGUOUS_TARGET,
                        "Section '" + target.text() + "' matches " + std::to_string(matches.size()) +
                            " headings; use an index to disambiguate");
    }
    return sections[matches[0]];
}

// ============================================================================
// Queries
// ============================================================================

std::vector<Section> query_sections(const Document& doc, const SectionQuery& query) {
    int min_level = query.level ? *query.level : query.min_level;
    int max_level = query.level ? *query.level : query.max_level;
    std::vector<Section> candidates = get_all_sections(doc, min_level, max_level);

    std::unique_ptr<RE2> glob;
    if (query.pattern && has_wildcards(*query.pattern)) {
        RE2::Options options;
        options.set_case_sensitive(query.case_sensitive);
        options.set_log_errors(false);
        glob.reset(new RE2(glob_to_regex(trim_copy(*query.pattern)), options));
        if (!glob->ok()) {
            throw_doc_error(section_log(), DocErrorCode::INVALID_ARGUMENT,
                            "Invalid section pattern '" + *query.pattern + "': " + glob->error());
        }
    }

    std::vector<Section> result;
    for (Section& section : candidates) {
        if (query.pattern) {
            std::string text = section.heading_text();
            bool hit = glob ? RE2::FullMatch(text, *glob)
                            : text_matches(text, *query.pattern, query.case_sensitive);
            if (!hit) continue;
        }
        if (query.predicate && !query.predicate(section)) continue;
        result.push_back(std::move(section));
    }
    clog_debug(section_log(), "query matched %zu of %zu sections", result.size(), candidates.size());
    return result;
}

std::optional<HeadingMatch> find_heading(const Document& doc, const std::string& text,
                                         std::optional<int> level, bool case_sensitive) {
    const NodeList& children = doc.children();
    for (size_t i = 0; i < children.size(); i++) {
        const Heading* heading = as_heading(children[i]);
        if (!heading) continue;
        if (level && heading->level() != *level) continue;
        if (text_matches(heading_text_of(*heading), text, case_sensitive)) {
            HeadingMatch match;
            match.index = i;
            match.heading = std::static_pointer_cast<const Heading>(children[i]);
            return match;
        }
    }
    return std::nullopt;
}

size_t count_sections(const Document& doc, std::optional<int> level) {
    size_t count = 0;
    for (const NodePtr& child : doc.children()) {
        const Heading* heading = as_heading(child);
        if (heading && (!level || heading->level() == *level)) count++;
    }
    return count;
}

static int parse_range_number(const std::string& text, const std::string& spec) {
    std::string trimmed = trim_copy(text);
    char* end = nullptr;
    errno = 0;
    long value = strtol(trimmed.c_str(), &end, 10);
    if (trimmed.empty() || *end != '\0') {
        throw_doc_error(section_log(), DocErrorCode::INVALID_ARGUMENT,
                        "Invalid section range '" + spec + "': '" + trimmed + "' is not a number");
    }
    if (errno == ERANGE || value > INT_MAX || value < INT_MIN) {
        throw_doc_error(section_log(), DocErrorCode::INVALID_ARGUMENT,
                        "Invalid section range '" + spec + "': '" + trimmed + "' is out of range");
    }
    return (int)value;
}

std::vector<int> parse_section_ranges(const std::string& spec, int total) {
    std::set<int> indices;
    size_t pos = 0;
    while (pos <= spec.size()) {
        size_t comma = spec.find(',', pos);
        if (comma == std::string::npos) comma = spec.size();
        std::string part = trim_copy(spec.substr(pos, comma - pos));
        pos = comma + 1;
        if (part.empty()) continue;

        int first, last;
        size_t dash = part.find('-');
        if (dash != std::string::npos) {
            std::string lo = trim_copy(part.substr(0, dash));
            std::string hi = trim_copy(part.substr(dash + 1));
            first = lo.empty() ? 0 : parse_range_number(lo, spec) - 1;
            last = hi.empty() ? total - 1 : parse_range_number(hi, spec) - 1;
            if (first > last) std::swap(first, last);
        } else {
            first = last = parse_range_number(part, spec) - 1;
        }
        for (int i = std::max(first, 0); i <= last && i < total; i++) {
            indices.insert(i);
        }
    }
    return std::vector<int>(indices.begin(), indices.end());
}

// ============================================================================
// Editing
// ============================================================================

DocumentPtr extract_section(const Document& doc, const SectionTarget& target) {
    Section section = resolve_section(doc, target);
    return make_node<Document>(section.to_nodes(), NodeAttrs(doc.metadata()));
}

DocumentPtr extract_sections(const Document& doc, const std::string& spec, const ExtractOptions& options) {
    std::vector<Section> selected;
    std::string trimmed = trim_copy(spec);

    if (trimmed.compare(0, 2, "#:") == 0) {
        std::vector<Section> all = get_all_sections(doc);
        for (int index : parse_section_ranges(trimmed.substr(2), (int)all.size())) {
            selected.push_back(all[index]);
        }
        if (selected.empty()) {
            throw_doc_error(section_log(), DocErrorCode::TARGET_NOT_FOUND,
                            "No sections match range '" + trimmed + "' (document has " +
                                std::to_string(all.size()) + " sections)");
        }
    } else {
        SectionQuery query;
        query.pattern = trimmed;
        query.case_sensitive = options.case_sensitive;
        selected = query_sections(doc, query);
        if (selected.empty()) {
            std::vector<std::string> names;
            for (const Section& section : get_all_sections(doc)) names.push_back(section.heading_text());
            std::string message = "No sections match pattern '" + trimmed + "'";
            std::vector<std::string> similar = suggest_similar(trimmed, names);
            if (!similar.empty()) {
                message += ". Did you mean: ";
                for (size_t i = 0; i < similar.size(); i++) {
                    if (i > 0) message += ", ";
                    message += similar[i];
                }
                message += "?";
            }
            throw_doc_error(section_log(), DocErrorCode::TARGET_NOT_FOUND, message);
        }
    }

    NodeList children;
    if (!options.combine) {
        children = selected[0].to_nodes();
    } else {
        for (size_t i = 0; i < selected.size(); i++) {
            if (i > 0) children.push_back(make_node<ThematicBreak>());
            NodeList nodes = selected[i].to_nodes();
            children.insert(children.end(), nodes.begin(), nodes.end());
        }
    }
    return make_node<Document>(std::move(children), NodeAttrs(doc.metadata()));
}

DocumentPtr replace_section(const Document& doc, const SectionTarget& target, const NodeList& replacement) {
    Section section = resolve_section(doc, target);
    const NodeList& children = doc.children();

    NodeList result(children.begin(), children.begin() + section.start_index);
    result.insert(result.end(), replacement.begin(), replacement.end());
    result.insert(result.end(), children.begin() + section.end_index, children.end());
    clog_debug(section_log(), "replaced %s (%zu nodes) with %zu nodes", target.describe().c_str(),
               section.end_index - section.start_index, replacement.size());
    return rebuild(doc, std::move(result));
}

DocumentPtr remove_section(const Document& doc, const SectionTarget& target) {
    return replace_section(doc, target, NodeList());
}

DocumentPtr insert_into_section(const Document& doc, const SectionTarget& target,
                                const NodeList& nodes, InsertPosition position) {
    Section section = resolve_section(doc, target);
    size_t at = position == InsertPosition::END ? section.end_index : section.start_index + 1;

    NodeList result(doc.children());
    result.insert(result.begin() + at, nodes.begin(), nodes.end());
    return rebuild(doc, std::move(result));
}

static DocumentPtr insert_at(const Document& doc, size_t at, const NodeList& nodes) {
    NodeList result(doc.children());
    result.insert(result.begin() + at, nodes.begin(), nodes.end());
    return rebuild(doc, std::move(result));
}

DocumentPtr add_section_before(const Document& doc, const SectionTarget& target, const NodeList& section) {
    return insert_at(doc, resolve_section(doc, target).start_index, section);
}

DocumentPtr add_section_after(const Document& doc, const SectionTarget& target, const NodeList& section) {
    return insert_at(doc, resolve_section(doc, target).end_index, section);
}

std::vector<DocumentPtr> split_by_sections(const Document& doc, bool include_preamble) {
    std::vector<DocumentPtr> docs;
    std::vector<Section> parts = partition_sections(doc, 6);
    if (include_preamble) {
        NodeList preamble = partition_preamble(doc, parts);
        if (!preamble.empty()) docs.push_back(make_node<Document>(std::move(preamble), NodeAttrs(doc.metadata())));
    }
    for (const Section& section : parts) {
        docs.push_back(make_node<Document>(section.to_nodes(), NodeAttrs(doc.metadata())));
    }
    return docs;
}

// ============================================================================
// Table of contents
// ============================================================================

namespace {

struct TocEntry {
    int level;
    std::string text;
    std::string slug;
};

struct TocItem {
    std::string text;
    std::vector<TocItem> children;
};

// Items at `level` own the deeper entries that follow them. Deeper entries
// with no owner at this level are hoisted into this list.
std::vector<TocItem> build_toc_tree(const std::vector<TocEntry>& entries, size_t& pos, int level) {
    std::vector<TocItem> items;
    while (pos < entries.size() && entries[pos].level >= level) {
        if (entries[pos].level == level) {
            TocItem item;
            item.text = entries[pos].text;
            pos++;
            item.children = build_toc_tree(entries, pos, level + 1);
            items.push_back(std::move(item));
        } else {
            std::vector<TocItem> deeper = build_toc_tree(entries, pos, level + 1);
            for (TocItem& item : deeper) items.push_back(std::move(item));
        }
    }
    return items;
}

NodePtr toc_paragraph(const std::string& text) {
    return make_node<Paragraph>(NodeList{make_node<Text>(text)});
}

std::shared_ptr<const List> toc_list_node(const std::vector<TocItem>& items) {
    NodeList list_items;
    for (const TocItem& item : items) {
        NodeList content{toc_paragraph(item.text)};
        if (!item.children.empty()) content.push_back(toc_list_node(item.children));
        list_items.push_back(make_node<ListItem>(std::move(content)));
    }
    return make_node<List>(false, std::move(list_items));
}

std::vector<TocEntry> collect_toc_entries(const Document& doc, int max_level) {
    std::vector<TocEntry> entries;
    std::set<std::string> seen;
    for (const Section& section : get_all_sections(doc, 1, max_level)) {
        TocEntry entry;
        entry.level = section.level;
        entry.text = section.heading_text();
        entry.slug = unique_slug(entry.text, seen);
        entries.push_back(std::move(entry));
    }
    return entries;
}

} // namespace

TableOfContents generate_toc(const Document& doc, int max_level, TocStyle style) {
    if (max_level < 1 || max_level > 6) {
        throw_doc_error(section_log(), DocErrorCode::INVALID_ARGUMENT,
                        "max_level must be between 1 and 6, got " + std::to_string(max_level));
    }
    std::vector<TocEntry> entries = collect_toc_entries(doc, max_level);

    TableOfContents toc;
    toc.style = style;
    if (entries.empty()) return toc;

    switch (style) {
    case TocStyle::MARKDOWN: {
        std::string out = "# Table of Contents\n";
        for (const TocEntry& entry : entries) {
            out += "\n";
            out += std::string(2 * (entry.level - 1), ' ');
            out += "- [" + entry.text + "](#" + entry.slug + ")";
        }
        toc.markdown = std::move(out);
        break;
    }
    case TocStyle::LIST: {
        std::vector<TocItem> items;
        for (const TocEntry& entry : entries) {
            TocItem item;
            item.text = entry.text;
            items.push_back(std::move(item));
        }
        toc.list = toc_list_node(items);
        break;
    }
    case TocStyle::NESTED: {
        int base = entries[0].level;
        for (const TocEntry& entry : entries) base = std::min(base, entry.level);
        size_t pos = 0;
        toc.list = toc_list_node(build_toc_tree(entries, pos, base));
        break;
    }
    }
    return toc;
}

DocumentPtr insert_toc(const Document& doc, TocPosition position, int max_level, TocStyle style) {
    NodeList toc_nodes;
    if (style == TocStyle::MARKDOWN) {
        if (max_level < 1 || max_level > 6) {
            throw_doc_error(section_log(), DocErrorCode::INVALID_ARGUMENT,
                            "max_level must be between 1 and 6, got " + std::to_string(max_level));
        }
        std::vector<TocEntry> entries = collect_toc_entries(doc, max_level);
        if (!entries.empty()) {
            NodeList items;
            for (const TocEntry& entry : entries) {
                NodePtr link = make_node<Link>("#" + entry.slug, NodeList{make_node<Text>(entry.text)});
                items.push_back(make_node<ListItem>(NodeList{make_node<Paragraph>(NodeList{link})}));
            }
            toc_nodes.push_back(make_node<Heading>(1, NodeList{make_node<Text>("Table of Contents")}));
            toc_nodes.push_back(make_node<List>(false, std::move(items), 1, true));
        }
    } else {
        TableOfContents toc = generate_toc(doc, max_level, style);
        if (toc.list) toc_nodes.push_back(toc.list);
    }

    size_t at = 0;
    if (position == TocPosition::AFTER_FIRST_HEADING) {
        const NodeList& children = doc.children();
        for (size_t i = 0; i < children.size(); i++) {
            if (children[i]->type() == NodeType::HEADING) {
                at = i + 1;
                break;
            }
        }
    }
    clog_debug(section_log(), "inserting %zu toc node(s) at %zu", toc_nodes.size(), at);
    return insert_at(doc, at, toc_nodes);
}

} // namespace doctree
