#include "doc_text.hpp"
#include "node_visitor.hpp"

#include <cctype>

#include <re2/re2.h>

namespace doctree {

namespace {

// Collects the text of one node; containers recurse through their children
class TextExtractor : public BaseVisitor {
public:
    explicit TextExtractor(const std::string& joiner) : joiner_(joiner) {}

    std::string take() { return std::move(text_); }

    void visit_text(const Text& node) override { text_ = node.content(); }
    void visit_code(const Code& node) override { text_ = node.content(); }
    void visit_code_block(const CodeBlock& node) override { text_ = node.content(); }
    void visit_math_inline(const MathInline& node) override { text_ = node.content(); }
    void visit_math_block(const MathBlock& node) override { text_ = node.content(); }
    void visit_line_break(const LineBreak& node) override { (void)node; text_ = " "; }

    void generic_visit(const Node& node) override {
        bool inline_content = node.is_inline() || node.type() == NodeType::HEADING ||
                              node.type() == NodeType::PARAGRAPH ||
                              node.type() == NodeType::TABLE_CELL ||
                              node.type() == NodeType::DEFINITION_TERM;
        std::string out;
        bool first = true;
        for (const NodePtr& child : node.children()) {
            TextExtractor inner(joiner_);
            child->accept(inner);
            std::string piece = inner.take();
            if (inline_content) {
                out += piece;
            } else if (!piece.empty()) {
                if (!first) out += joiner_;
                out += piece;
                first = false;
            }
        }
        text_ = std::move(out);
    }

private:
    const std::string& joiner_;
    std::string text_;
};

} // namespace

std::string extract_text(const Node& node, const std::string& joiner) {
    TextExtractor extractor(joiner);
    node.accept(extractor);
    return extractor.take();
}

std::string extract_text(const NodeList& nodes, const std::string& joiner) {
    std::string out;
    bool first = true;
    for (const NodePtr& node : nodes) {
        if (!node) continue;
        std::string piece = extract_text(*node, joiner);
        if (piece.empty()) continue;
        if (!first) out += joiner;
        out += piece;
        first = false;
    }
    return out;
}

size_t count_words(const std::string& text) {
    size_t count = 0;
    bool in_word = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            count++;
        }
    }
    return count;
}

size_t count_words(const NodeList& nodes) {
    size_t total = 0;
    for (const NodePtr& node : nodes) {
        if (node) total += count_words(extract_text(*node));
    }
    return total;
}

static RE2::Options latin1_options() {
    // byte-wise matching: every non-ASCII byte is simply dropped
    RE2::Options options;
    options.set_encoding(RE2::Options::EncodingLatin1);
    return options;
}

static void trim_hyphens(std::string& s) {
    size_t start = s.find_first_not_of('-');
    if (start == std::string::npos) {
        s.clear();
        return;
    }
    size_t end = s.find_last_not_of('-');
    s = s.substr(start, end - start + 1);
}

std::string slugify(const std::string& text, size_t max_length) {
    static const RE2 invalid_chars("[^a-z0-9\\s-]", latin1_options());
    static const RE2 separators("[\\s-]+", latin1_options());

    std::string slug;
    slug.reserve(text.size());
    for (unsigned char c : text) {
        slug.push_back((char)std::tolower(c));
    }

    RE2::GlobalReplace(&slug, invalid_chars, "");
    RE2::GlobalReplace(&slug, separators, "-");
    trim_hyphens(slug);

    if (slug.size() > max_length) {
        slug.resize(max_length);
        trim_hyphens(slug);
    }
    return slug;
}

std::string unique_slug(const std::string& text, std::set<std::string>& seen) {
    std::string base = slugify(text);
    if (base.empty()) base = "section";

    std::string slug = base;
    for (int suffix = 1; seen.count(slug); suffix++) {
        slug = base + "-" + std::to_string(suffix);
    }
    seen.insert(slug);
    return slug;
}

} // namespace doctree
