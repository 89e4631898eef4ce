#include "splitter.hpp"
#include "doc_error.hpp"
#include "doc_text.hpp"
#include "sections.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>

#include <re2/re2.h>

namespace doctree {

static log_category_t* split_log() {
    return log_get_category("doctree.split");
}

std::string SplitResult::get_filename_slug() const {
    if (!title || title->empty()) return "";
    return slugify(*title, 100);
}

// ============================================================================
// Split specifications
// ============================================================================

const char* split_strategy_name(SplitStrategy strategy) {
    switch (strategy) {
    case SplitStrategy::HEADING:   return "heading";
    case SplitStrategy::LENGTH:    return "length";
    case SplitStrategy::PARTS:     return "parts";
    case SplitStrategy::DELIMITER: return "delimiter";
    case SplitStrategy::BREAK:     return "break";
    case SplitStrategy::PAGE:      return "page";
    case SplitStrategy::CHAPTER:   return "chapter";
    case SplitStrategy::AUTO:      return "auto";
    }
    return "unknown";
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

[[noreturn]] static void spec_error(const std::string& message) {
    throw_doc_error(split_log(), DocErrorCode::INVALID_SPLIT_SPEC, message);
}

static int parse_positive(const std::string& key, const std::string& value) {
    char* end = nullptr;
    errno = 0;
    long n = strtol(value.c_str(), &end, 10);
    if (value.empty() || *end != '\0') {
        spec_error("Invalid " + key + " value: '" + value + "'");
    }
    if ((errno == ERANGE && n > 0) || n > INT_MAX) {
        spec_error("Invalid " + key + " value: '" + value + "' (" + key + " must be at most " +
                   std::to_string(INT_MAX) + ")");
    }
    if (n < 1) {
        spec_error("Invalid " + key + " value: '" + value + "' (" + key + " must be at least 1)");
    }
    return (int)n;
}

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Decodes backslash escapes; unknown escapes are kept verbatim
static std::string decode_escapes(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); i++) {
        char c = value[i];
        if (c != '\\' || i + 1 >= value.size()) {
            out.push_back(c);
            continue;
        }
        char next = value[++i];
        switch (next) {
        case 'n':  out.push_back('\n'); break;
        case 't':  out.push_back('\t'); break;
        case 'r':  out.push_back('\r'); break;
        case 'a':  out.push_back('\a'); break;
        case 'b':  out.push_back('\b'); break;
        case 'f':  out.push_back('\f'); break;
        case 'v':  out.push_back('\v'); break;
        case '0':  out.push_back('\0'); break;
        case '\\': out.push_back('\\'); break;
        case '\'': out.push_back('\''); break;
        case '"':  out.push_back('"'); break;
        case 'x':
            if (i + 2 < value.size() && hex_digit(value[i + 1]) >= 0 && hex_digit(value[i + 2]) >= 0) {
                out.push_back((char)(hex_digit(value[i + 1]) * 16 + hex_digit(value[i + 2])));
                i += 2;
                break;
            }
            out.push_back('\\');
            out.push_back(next);
            break;
        default:
            out.push_back('\\');
            out.push_back(next);
            break;
        }
    }
    return out;
}

SplitSpec parse_split_spec(const std::string& input) {
    std::string spec = trim_copy(input);
    std::string lower = lower_copy(spec);
    SplitSpec result;

    if (lower.size() == 2 && lower[0] == 'h' && std::isdigit((unsigned char)lower[1])) {
        int level = lower[1] - '0';
        if (level < 1 || level > 6) {
            spec_error("Heading level must be between 1 and 6, got " + std::to_string(level) +
                       " in '" + spec + "'");
        }
        result.strategy = SplitStrategy::HEADING;
        result.value = level;
        return result;
    }

    size_t eq = spec.find('=');
    if (eq != std::string::npos) {
        std::string key = lower_copy(trim_copy(spec.substr(0, eq)));
        std::string value = trim_copy(spec.substr(eq + 1));

        if (key == "length") {
            result.strategy = SplitStrategy::LENGTH;
            result.value = parse_positive(key, value);
            return result;
        }
        if (key == "parts") {
            result.strategy = SplitStrategy::PARTS;
            result.value = parse_positive(key, value);
            return result;
        }
        if (key == "delimiter") {
            if (value.empty()) spec_error("Delimiter value cannot be empty");
            result.strategy = SplitStrategy::DELIMITER;
            result.delimiter = decode_escapes(value);
            return result;
        }
        spec_error("Unknown split strategy: '" + key + "'");
    }

    if (lower == "auto") result.strategy = SplitStrategy::AUTO;
    else if (lower == "break") result.strategy = SplitStrategy::BREAK;
    else if (lower == "page") result.strategy = SplitStrategy::PAGE;
    else if (lower == "chapter") result.strategy = SplitStrategy::CHAPTER;
    else {
        spec_error("Invalid split specification: '" + spec +
                   "'. Expected: h1-h6, length=N, parts=N, delimiter=TEXT, break, page, chapter, or auto");
    }
    return result;
}

SplitOptions split_default_options() {
    SplitOptions opts = {};
    opts.include_preamble = true;
    opts.target_words = 1500;
    return opts;
}

// ============================================================================
// Strategies
// ============================================================================

static SplitResult make_part(const Document& doc, NodeList children, int index,
                             std::optional<std::string> title) {
    SplitResult part;
    part.word_count = count_words(extract_text(children));
    part.document = make_node<Document>(std::move(children), doc.attrs());
    part.index = index;
    part.title = std::move(title);
    return part;
}

// Whole document as the only part, tagged with why nothing was split
static SplitResults single_part(const Document& doc, std::optional<std::string> title, const char* reason) {
    SplitResults results;
    results.push_back(make_part(doc, doc.children(), 1, std::move(title)));
    if (reason) {
        results.back().metadata["reason"] = reason;
        clog_debug(split_log(), "document kept whole: %s", reason);
    }
    return results;
}

static bool has_heading_at(const Document& doc, int level) {
    for (const NodePtr& child : doc.children()) {
        if (child->type() == NodeType::HEADING &&
            static_cast<const Heading&>(*child).level() == level) {
            return true;
        }
    }
    return false;
}

SplitResults split_by_heading_level(const Document& doc, int level, bool include_preamble) {
    if (level < 1 || level > 6) {
        throw_doc_error(split_log(), DocErrorCode::INVALID_ARGUMENT,
                        "Heading level must be between 1 and 6, got " + std::to_string(level));
    }
    if (!has_heading_at(doc, level)) {
        return single_part(doc, std::nullopt, "no_headings_found");
    }

    std::vector<Section> sections = partition_sections(doc, level);
    SplitResults results;
    int index = 1;
    if (include_preamble) {
        NodeList preamble = partition_preamble(doc, sections);
        if (!preamble.empty()) {
            results.push_back(make_part(doc, std::move(preamble), index++, std::string("Preamble")));
        }
    }
    for (const Section& section : sections) {
        results.push_back(make_part(doc, section.to_nodes(), index++, section.heading_text()));
    }
    clog_debug(split_log(), "split at h%d into %zu parts", level, results.size());
    return results;
}

SplitResults split_by_word_count(const Document& doc, int target_words) {
    if (target_words < 1) {
        throw_doc_error(split_log(), DocErrorCode::INVALID_ARGUMENT,
                        "target_words must be at least 1, got " + std::to_string(target_words));
    }
    std::vector<Section> sections = partition_sections(doc, 6);
    if (sections.empty()) {
        return single_part(doc, std::nullopt, "no_sections");
    }

    SplitResults results;
    NodeList current = partition_preamble(doc, sections);
    size_t current_words = count_words(extract_text(current));
    std::optional<std::string> current_title;
    if (!current.empty()) current_title = std::string("Preamble");

    for (const Section& section : sections) {
        NodeList nodes = section.to_nodes();
        size_t words = count_words(extract_text(nodes));

        if (!current.empty() && current_words + words > (size_t)target_words) {
            results.push_back(make_part(doc, std::move(current), (int)results.size() + 1, current_title));
            current.clear();
            current_words = 0;
            current_title.reset();
        }
        current.insert(current.end(), nodes.begin(), nodes.end());
        current_words += words;
        if (!current_title) current_title = section.heading_text();
    }
    if (!current.empty()) {
        results.push_back(make_part(doc, std::move(current), (int)results.size() + 1, current_title));
    }
    clog_debug(split_log(), "split at %d words into %zu parts", target_words, results.size());
    return results;
}

SplitResults split_by_parts(const Document& doc, int num_parts) {
    if (num_parts < 1) {
        throw_doc_error(split_log(), DocErrorCode::INVALID_ARGUMENT,
                        "num_parts must be at least 1, got " + std::to_string(num_parts));
    }
    size_t total_words = count_words(extract_text(doc.children()));
    if (total_words == 0) {
        return single_part(doc, std::nullopt, nullptr);
    }
    int target = std::max(1, (int)(total_words / num_parts));
    return split_by_word_count(doc, target);
}

// Splits at every child for which is_separator() holds; separators are dropped
template <typename Pred>
static SplitResults split_at_separators(const Document& doc, Pred is_separator, const char* reason) {
    SplitResults results;
    NodeList current;
    bool found = false;
    auto flush = [&]() {
        if (current.empty()) return;
        int index = (int)results.size() + 1;
        results.push_back(make_part(doc, std::move(current), index, "Part " + std::to_string(index)));
        current.clear();
    };

    for (const NodePtr& child : doc.children()) {
        if (is_separator(*child)) {
            found = true;
            flush();
        } else {
            current.push_back(child);
        }
    }
    flush();

    if (!found || results.empty()) {
        return single_part(doc, std::string("Part 1"), reason);
    }
    clog_debug(split_log(), "separators produced %zu parts", results.size());
    return results;
}

SplitResults split_by_delimiter(const Document& doc, const std::string& delimiter) {
    std::string wanted = trim_copy(delimiter);
    if (wanted.empty()) {
        throw_doc_error(split_log(), DocErrorCode::INVALID_ARGUMENT,
                        delimiter.empty() ? "Delimiter cannot be empty"
                                          : "Delimiter cannot be only whitespace");
    }
    static const RE2 rule_pattern("-{3,}|\\*{3,}|_{3,}");
    bool rule_like = RE2::FullMatch(wanted, rule_pattern);

    return split_at_separators(doc, [&](const Node& node) {
        if (node.type() == NodeType::THEMATIC_BREAK) return rule_like;
        if (node.type() == NodeType::PARAGRAPH) return trim_copy(extract_text(node, "")) == wanted;
        return false;
    }, "no_delimiters_found");
}

SplitResults split_by_break(const Document& doc) {
    return split_at_separators(doc, [](const Node& node) {
        return node.type() == NodeType::THEMATIC_BREAK;
    }, "no_breaks_found");
}

static SplitResults tag_strategy(SplitResults results, const char* strategy) {
    for (SplitResult& part : results) {
        part.metadata["strategy"] = strategy;
    }
    clog_info(split_log(), "auto split chose %s (%zu parts)", strategy, results.size());
    return results;
}

SplitResults split_auto(const Document& doc, int target_words) {
    if (target_words < 1) {
        throw_doc_error(split_log(), DocErrorCode::INVALID_ARGUMENT,
                        "target_words must be at least 1, got " + std::to_string(target_words));
    }

    std::vector<Section> h1 = get_all_sections(doc, 1, 1);
    if (!h1.empty()) {
        size_t largest = 0;
        for (const Section& section : h1) {
            largest = std::max(largest, count_words(extract_text(section.to_nodes())));
        }
        clog_debug(split_log(), "auto: %zu h1 sections, largest %zu words", h1.size(), largest);
        if (largest <= (size_t)target_words * 2) {
            return tag_strategy(split_by_heading_level(doc, 1), "auto:h1");
        }
    }

    std::vector<Section> h2 = get_all_sections(doc, 2, 2);
    if (!h2.empty()) {
        size_t total = 0;
        for (const Section& section : h2) {
            total += count_words(extract_text(section.to_nodes()));
        }
        double average = (double)total / (double)h2.size();
        clog_debug(split_log(), "auto: %zu h2 sections, average %.1f words", h2.size(), average);
        if (average <= target_words * 1.5) {
            return tag_strategy(split_by_heading_level(doc, 2), "auto:h2");
        }
    }

    return tag_strategy(split_by_word_count(doc, target_words), "auto:word_count");
}

SplitResults split_document(const Document& doc, const SplitSpec& spec, const SplitOptions& options) {
    switch (spec.strategy) {
    case SplitStrategy::HEADING:
        return split_by_heading_level(doc, spec.value, options.include_preamble);
    case SplitStrategy::LENGTH:
        return split_by_word_count(doc, spec.value);
    case SplitStrategy::PARTS:
        return split_by_parts(doc, spec.value);
    case SplitStrategy::DELIMITER:
        return split_by_delimiter(doc, spec.delimiter);
    case SplitStrategy::BREAK:
        return split_by_break(doc);
    case SplitStrategy::AUTO:
        return split_auto(doc, options.target_words);
    case SplitStrategy::PAGE:
    case SplitStrategy::CHAPTER:
        break;
    }
    spec_error(std::string("'") + split_strategy_name(spec.strategy) +
               "' splitting is performed by the format reader, not on a document tree");
}

SplitResults split_document(const Document& doc, const std::string& spec, const SplitOptions& options) {
    return split_document(doc, parse_split_spec(spec), options);
}

} // namespace doctree
