#include <gtest/gtest.h>

#include "../doctree/ast_node.hpp"
#include "../doctree/doc_error.hpp"
#include "../doctree/doc_text.hpp"
#include "../doctree/sections.hpp"
#include "../lib/log.h"

using namespace doctree;

static NodePtr text(const std::string& s) { return make_node<Text>(s); }
static NodePtr para(const std::string& s) { return make_node<Paragraph>(NodeList{text(s)}); }
static NodePtr heading(int level, const std::string& s) {
    return make_node<Heading>(level, NodeList{text(s)});
}

static std::string text_of(const NodePtr& node) {
    return extract_text(*node);
}

class SectionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_init(nullptr);

        Json::Value meta(Json::objectValue);
        meta["title"] = "Report";
        // 0 pre | 1 Intro | 3 Background | 5 Methods | 7 Setup | 9 Details
        doc = make_node<Document>(NodeList{
            para("pre"),
            heading(1, "Intro"),
            para("intro text"),
            heading(2, "Background"),
            para("bg text"),
            heading(1, "Methods"),
            para("m"),
            heading(2, "Setup"),
            para("s"),
            heading(3, "Details"),
            para("d"),
        }, NodeAttrs(meta));
    }

    DocumentPtr doc;
};

// ==== Section discovery ====

TEST_F(SectionsTest, SectionsNestByLevel) {
    std::vector<Section> sections = get_all_sections(*doc);
    ASSERT_EQ(sections.size(), 5u);

    EXPECT_EQ(sections[0].heading_text(), "Intro");
    EXPECT_EQ(sections[0].start_index, 1u);
    EXPECT_EQ(sections[0].end_index, 5u);
    EXPECT_EQ(sections[0].content.size(), 3u);

    EXPECT_EQ(sections[1].heading_text(), "Background");
    EXPECT_EQ(sections[1].level, 2);
    EXPECT_EQ(sections[1].end_index, 5u);

    EXPECT_EQ(sections[2].heading_text(), "Methods");
    EXPECT_EQ(sections[2].end_index, 11u);
    EXPECT_EQ(sections[4].heading_text(), "Details");
    EXPECT_EQ(sections[4].start_index, 9u);
}

TEST_F(SectionsTest, LevelRangeFilters) {
    std::vector<Section> h2 = get_all_sections(*doc, 2, 2);
    ASSERT_EQ(h2.size(), 2u);
    EXPECT_EQ(h2[0].heading_text(), "Background");
    EXPECT_EQ(h2[1].heading_text(), "Setup");
    // Setup owns its H3
    EXPECT_EQ(h2[1].content.size(), 3u);
}

TEST_F(SectionsTest, InvalidLevelRangeThrows) {
    try {
        get_all_sections(*doc, 3, 2);
        FAIL() << "reversed range accepted";
    } catch (const DocError& e) {
        EXPECT_EQ(e.code(), DocErrorCode::INVALID_ARGUMENT);
    }
    EXPECT_THROW(get_all_sections(*doc, 0, 6), DocError);
    EXPECT_THROW(get_all_sections(*doc, 1, 7), DocError);
}

TEST_F(SectionsTest, SectionToDocument) {
    Section section = get_all_sections(*doc)[1];
    NodeList nodes = section.to_nodes();
    ASSERT_EQ(nodes.size(), 2u);
    EXPECT_EQ(nodes[0].get(), section.heading.get());
    DocumentPtr part = section.to_document();
    EXPECT_EQ(part->children().size(), 2u);
}

TEST_F(SectionsTest, Preamble) {
    NodeList preamble = get_preamble(*doc);
    ASSERT_EQ(preamble.size(), 1u);
    EXPECT_EQ(text_of(preamble[0]), "pre");

    auto no_preamble = make_node<Document>(NodeList{heading(1, "A")});
    EXPECT_TRUE(get_preamble(*no_preamble).empty());
}

TEST_F(SectionsTest, PartitionsAreFlatAndCoverTheRest) {
    std::vector<Section> top = partition_sections(*doc, 1);
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0].start_index, 1u);
    EXPECT_EQ(top[0].end_index, 5u);
    EXPECT_EQ(top[1].end_index, 11u);

    std::vector<Section> all = partition_sections(*doc, 6);
    ASSERT_EQ(all.size(), 5u);
    size_t next = 1;
    for (const Section& section : all) {
        EXPECT_EQ(section.start_index, next);
        EXPECT_EQ(section.end_index, section.start_index + 2);
        next = section.end_index;
    }
    EXPECT_EQ(next, doc->children().size());
}

// ==== Target resolution ====

TEST_F(SectionsTest, ResolveByTextIsCaseInsensitiveByDefault) {
    Section section = resolve_section(*doc, "  methods ");
    EXPECT_EQ(section.start_index, 5u);
}

TEST_F(SectionsTest, ResolveCaseSensitive) {
    EXPECT_NO_THROW(resolve_section(*doc, SectionTarget("Methods", true)));
    EXPECT_THROW(resolve_section(*doc, SectionTarget("methods", true)), DocError);
}

TEST_F(SectionsTest, ResolveByIndex) {
    Section section = resolve_section(*doc, 3);
    EXPECT_EQ(section.heading_text(), "Setup");
}

TEST_F(SectionsTest, NotFoundSuggestsCloseHeadings) {
    try {
        resolve_section(*doc, "Methds");
        FAIL() << "unknown section resolved";
    } catch (const DocError& e) {
        EXPECT_EQ(e.code(), DocErrorCode::TARGET_NOT_FOUND);
        std::string message = e.what();
        EXPECT_EQ(message.find("Section not found: 'Methds'"), 0u);
        EXPECT_NE(message.find("Did you mean: Methods"), std::string::npos);
    }
}

TEST_F(SectionsTest, AmbiguousTextIsRejected) {
    auto dup = make_node<Document>(NodeList{
        heading(2, "Notes"), para("a"),
        heading(2, "Notes"), para("b"),
    });
    try {
        resolve_section(*dup, "notes");
        FAIL() << "ambiguous target resolved";
    } catch (const DocError& e) {
        EXPECT_EQ(e.code(), DocErrorCode::AMBIGUOUS_TARGET);
        EXPECT_NE(std::string(e.what()).find("matches 2 headings"), std::string::npos);
    }
    EXPECT_EQ(text_of(resolve_section(*dup, 1).content[0]), "b");
}

TEST_F(SectionsTest, IndexOutOfRange) {
    try {
        resolve_section(*doc, 5);
        FAIL() << "index 5 resolved";
    } catch (const DocError& e) {
        EXPECT_EQ(e.code(), DocErrorCode::INDEX_OUT_OF_RANGE);
        EXPECT_STREQ(e.what(), "Section index 5 out of range (0-4)");
    }
    EXPECT_THROW(resolve_section(*doc, -1), DocError);

    auto empty = make_node<Document>(NodeList{para("x")});
    try {
        resolve_section(*empty, 0);
        FAIL() << "index resolved without sections";
    } catch (const DocError& e) {
        EXPECT_STREQ(e.what(), "Section index 0 out of range (document has no sections)");
    }
}

// ==== Queries ====

TEST_F(SectionsTest, QueryByWildcardPattern) {
    SectionQuery query;
    query.pattern = std::string("Set*");
    std::vector<Section> found = query_sections(*doc, query);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].heading_text(), "Setup");

    query.pattern = std::string("?NTRO");
    found = query_sections(*doc, query);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].heading_text(), "Intro");

    query.case_sensitive = true;
    EXPECT_TRUE(query_sections(*doc, query).empty());
}

TEST_F(SectionsTest, QueryByLevelAndPredicate) {
    SectionQuery by_level;
    by_level.level = 2;
    EXPECT_EQ(query_sections(*doc, by_level).size(), 2u);

    SectionQuery by_content;
    by_content.predicate = [](const Section& section) { return section.content.size() > 1; };
    std::vector<Section> found = query_sections(*doc, by_content);
    ASSERT_EQ(found.size(), 3u);
    EXPECT_EQ(found[0].heading_text(), "Intro");
    EXPECT_EQ(found[1].heading_text(), "Methods");
    EXPECT_EQ(found[2].heading_text(), "Setup");

    EXPECT_EQ(query_sections(*doc).size(), 5u);
}

TEST_F(SectionsTest, FindHeading) {
    std::optional<HeadingMatch> match = find_heading(*doc, "setup");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->index, 7u);
    EXPECT_EQ(match->heading->level(), 2);

    EXPECT_FALSE(find_heading(*doc, "setup", 3).has_value());
    EXPECT_FALSE(find_heading(*doc, "setup", std::nullopt, true).has_value());
}

TEST_F(SectionsTest, CountSections) {
    EXPECT_EQ(count_sections(*doc), 5u);
    EXPECT_EQ(count_sections(*doc, 1), 2u);
    EXPECT_EQ(count_sections(*doc, 4), 0u);
}

TEST_F(SectionsTest, ParseSectionRanges) {
    EXPECT_EQ(parse_section_ranges("1-3,5", 10), (std::vector<int>{0, 1, 2, 4}));
    EXPECT_EQ(parse_section_ranges("3-1", 10), (std::vector<int>{0, 1, 2}));
    EXPECT_EQ(parse_section_ranges("8-", 10), (std::vector<int>{7, 8, 9}));
    EXPECT_EQ(parse_section_ranges(" 2 , 2, 1 ", 10), (std::vector<int>{0, 1}));
    EXPECT_TRUE(parse_section_ranges("12", 5).empty());

    try {
        parse_section_ranges("a-2", 5);
        FAIL() << "non-numeric range accepted";
    } catch (const DocError& e) {
        EXPECT_EQ(e.code(), DocErrorCode::INVALID_ARGUMENT);
    }
}

TEST_F(SectionsTest, RangeNumbersBeyondIntAreRejected) {
    for (const char* spec : {"4294967297", "1-4294967297", "99999999999999999999999"}) {
        try {
            parse_section_ranges(spec, 5);
            FAIL() << "'" << spec << "' accepted";
        } catch (const DocError& e) {
            EXPECT_EQ(e.code(), DocErrorCode::INVALID_ARGUMENT);
            EXPECT_NE(std::string(e.what()).find("out of range"), std::string::npos) << e.what();
        }
    }
    EXPECT_THROW(extract_sections(*doc, "#:4294967297"), DocError);
}

// ==== Editing ====

TEST_F(SectionsTest, ExtractSection) {
    DocumentPtr part = extract_section(*doc, "Methods");
    ASSERT_EQ(part->children().size(), 6u);
    EXPECT_EQ(text_of(part->children()[0]), "Methods");
    EXPECT_EQ(text_of(part->children()[5]), "d");
    EXPECT_EQ(part->metadata()["title"].asString(), "Report");
}

TEST_F(SectionsTest, ExtractSectionsByRange) {
    DocumentPtr combined = extract_sections(*doc, "#:1,3");
    // Intro (4 nodes), break, Methods (6 nodes)
    ASSERT_EQ(combined->children().size(), 11u);
    EXPECT_EQ(combined->children()[4]->type(), NodeType::THEMATIC_BREAK);
    EXPECT_EQ(text_of(combined->children()[5]), "Methods");

    ExtractOptions first_only;
    first_only.combine = false;
    DocumentPtr first = extract_sections(*doc, "#:1,3", first_only);
    EXPECT_EQ(first->children().size(), 4u);
}

TEST_F(SectionsTest, ExtractSectionsByPattern) {
    DocumentPtr part = extract_sections(*doc, "Meth*");
    EXPECT_EQ(text_of(part->children()[0]), "Methods");
}

TEST_F(SectionsTest, ExtractSectionsReportsMisses) {
    try {
        extract_sections(*doc, "#:9");
        FAIL() << "empty range accepted";
    } catch (const DocError& e) {
        EXPECT_EQ(e.code(), DocErrorCode::TARGET_NOT_FOUND);
        EXPECT_NE(std::string(e.what()).find("document has 5 sections"), std::string::npos);
    }
    try {
        extract_sections(*doc, "Setpu");
        FAIL() << "unknown pattern accepted";
    } catch (const DocError& e) {
        EXPECT_NE(std::string(e.what()).find("No sections match pattern 'Setpu'"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("Setup"), std::string::npos);
    }
}

TEST_F(SectionsTest, ReplaceSectionLeavesInputUntouched) {
    DocumentPtr out = replace_section(*doc, "Background", NodeList{para("replacement")});
    ASSERT_EQ(out->children().size(), 10u);
    EXPECT_EQ(text_of(out->children()[3]), "replacement");
    EXPECT_EQ(text_of(out->children()[4]), "Methods");
    EXPECT_EQ(out->metadata()["title"].asString(), "Report");

    EXPECT_EQ(doc->children().size(), 11u);
    EXPECT_EQ(text_of(doc->children()[3]), "Background");
}

TEST_F(SectionsTest, RemoveSectionTakesSubsections) {
    DocumentPtr out = remove_section(*doc, "Methods");
    EXPECT_EQ(out->children().size(), 5u);
    EXPECT_EQ(count_sections(*out), 2u);
}

TEST_F(SectionsTest, InsertIntoSection) {
    DocumentPtr at_start = insert_into_section(*doc, "Intro", NodeList{para("new")}, InsertPosition::START);
    EXPECT_EQ(text_of(at_start->children()[2]), "new");

    DocumentPtr after_heading =
        insert_into_section(*doc, "Intro", NodeList{para("new")}, InsertPosition::AFTER_HEADING);
    EXPECT_TRUE(nodes_equal(at_start, after_heading));

    // end of Intro includes its Background subsection
    DocumentPtr at_end = insert_into_section(*doc, "Intro", NodeList{para("new")});
    EXPECT_EQ(text_of(at_end->children()[5]), "new");
    EXPECT_EQ(text_of(at_end->children()[6]), "Methods");
}

TEST_F(SectionsTest, AddSectionBeforeAndAfter) {
    NodeList extra{heading(1, "Extra"), para("x")};

    DocumentPtr before = add_section_before(*doc, "Methods", extra);
    EXPECT_EQ(text_of(before->children()[5]), "Extra");
    EXPECT_EQ(text_of(before->children()[7]), "Methods");

    DocumentPtr after = add_section_after(*doc, "Methods", extra);
    ASSERT_EQ(after->children().size(), 13u);
    EXPECT_EQ(text_of(after->children()[11]), "Extra");
}

TEST_F(SectionsTest, EditingUnknownTargetThrows) {
    EXPECT_THROW(remove_section(*doc, "Nowhere"), DocError);
    EXPECT_THROW(insert_into_section(*doc, 42, NodeList{para("x")}), DocError);
}

TEST_F(SectionsTest, SplitBySections) {
    std::vector<DocumentPtr> parts = split_by_sections(*doc);
    ASSERT_EQ(parts.size(), 6u);
    EXPECT_EQ(text_of(parts[0]->children()[0]), "pre");
    EXPECT_EQ(text_of(parts[2]->children()[0]), "Background");

    size_t total = 0;
    for (const DocumentPtr& part : parts) total += part->children().size();
    EXPECT_EQ(total, doc->children().size());

    EXPECT_EQ(split_by_sections(*doc, false).size(), 5u);
}

TEST_F(SectionsTest, SplitBySectionsKeepsUncheckedHeadingContent) {
    auto odd = make_node<Document>(NodeList{
        para("a"),
        Heading::make_unchecked(7, NodeList{text("odd")}),
        para("b"),
        heading(1, "Real"),
        para("c"),
    });
    std::vector<DocumentPtr> parts = split_by_sections(*odd);
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0]->children().size(), 3u);
    EXPECT_EQ(parts[1]->children().size(), 2u);

    std::vector<Section> sections = partition_sections(*odd, 6);
    NodeList preamble = partition_preamble(*odd, sections);
    ASSERT_EQ(preamble.size(), 3u);
    EXPECT_EQ(preamble[1]->type(), NodeType::HEADING);
    EXPECT_EQ(partition_preamble(*odd, std::vector<Section>()).size(), 5u);
}

// ==== Table of contents ====

TEST_F(SectionsTest, MarkdownToc) {
    TableOfContents toc = generate_toc(*doc, 2);
    EXPECT_EQ(toc.style, TocStyle::MARKDOWN);
    EXPECT_EQ(toc.markdown,
              "# Table of Contents\n"
              "\n- [Intro](#intro)"
              "\n  - [Background](#background)"
              "\n- [Methods](#methods)"
              "\n  - [Setup](#setup)");
    EXPECT_FALSE(toc.list);
}

TEST_F(SectionsTest, TocSlugsAreUnique) {
    auto dup = make_node<Document>(NodeList{heading(1, "Notes"), heading(1, "Notes")});
    TableOfContents toc = generate_toc(*dup);
    EXPECT_NE(toc.markdown.find("(#notes)"), std::string::npos);
    EXPECT_NE(toc.markdown.find("(#notes-1)"), std::string::npos);
}

TEST_F(SectionsTest, FlatListToc) {
    TableOfContents toc = generate_toc(*doc, 6, TocStyle::LIST);
    ASSERT_TRUE(toc.list);
    ASSERT_EQ(toc.list->items().size(), 5u);
    const NodePtr& item = toc.list->items()[4];
    ASSERT_EQ(item->children().size(), 1u);
    EXPECT_EQ(item->children()[0]->type(), NodeType::PARAGRAPH);
    EXPECT_EQ(text_of(item), "Details");
}

TEST_F(SectionsTest, NestedToc) {
    TableOfContents toc = generate_toc(*doc, 3, TocStyle::NESTED);
    ASSERT_TRUE(toc.list);
    ASSERT_EQ(toc.list->items().size(), 2u);

    const NodePtr& methods = toc.list->items()[1];
    ASSERT_EQ(methods->children().size(), 2u);
    EXPECT_EQ(text_of(methods->children()[0]), "Methods");
    const List& sub = static_cast<const List&>(*methods->children()[1]);
    ASSERT_EQ(sub.items().size(), 1u);
    // Setup -> Details
    EXPECT_EQ(sub.items()[0]->children().size(), 2u);
}

TEST_F(SectionsTest, NestedTocHoistsOrphanedDeepHeadings) {
    auto skewed = make_node<Document>(NodeList{heading(3, "Deep"), heading(1, "Top")});
    TableOfContents toc = generate_toc(*skewed, 3, TocStyle::NESTED);
    ASSERT_TRUE(toc.list);
    ASSERT_EQ(toc.list->items().size(), 2u);
    EXPECT_EQ(text_of(toc.list->items()[0]), "Deep");
    EXPECT_EQ(text_of(toc.list->items()[1]), "Top");
}

TEST_F(SectionsTest, EmptyToc) {
    auto plain = make_node<Document>(NodeList{para("no headings")});
    TableOfContents toc = generate_toc(*plain);
    EXPECT_EQ(toc.markdown, "");
    EXPECT_FALSE(toc.list);
    EXPECT_FALSE(generate_toc(*plain, 3, TocStyle::NESTED).list);
}

TEST_F(SectionsTest, TocLevelIsChecked) {
    try {
        generate_toc(*doc, 0);
        FAIL() << "max_level 0 accepted";
    } catch (const DocError& e) {
        EXPECT_STREQ(e.what(), "max_level must be between 1 and 6, got 0");
    }
    EXPECT_THROW(insert_toc(*doc, TocPosition::START, 7), DocError);
}

TEST_F(SectionsTest, InsertTocAtStart) {
    DocumentPtr out = insert_toc(*doc);
    ASSERT_EQ(out->children().size(), 13u);
    EXPECT_EQ(text_of(out->children()[0]), "Table of Contents");

    const List& list = static_cast<const List&>(*out->children()[1]);
    ASSERT_EQ(list.items().size(), 5u);
    const NodePtr& para_node = list.items()[0]->children()[0];
    const Link& link = static_cast<const Link&>(*para_node->children()[0]);
    EXPECT_EQ(link.url(), "#intro");
    EXPECT_EQ(text_of(para_node), "Intro");
}

TEST_F(SectionsTest, InsertTocAfterFirstHeading) {
    DocumentPtr out = insert_toc(*doc, TocPosition::AFTER_FIRST_HEADING, 1, TocStyle::NESTED);
    ASSERT_EQ(out->children().size(), 12u);
    EXPECT_EQ(out->children()[2]->type(), NodeType::LIST);
    EXPECT_EQ(text_of(out->children()[1]), "Intro");
}

TEST_F(SectionsTest, InsertTocWithoutHeadingsInsertsNothing) {
    auto plain = make_node<Document>(NodeList{para("no headings")});
    DocumentPtr out = insert_toc(*plain, TocPosition::AFTER_FIRST_HEADING);
    EXPECT_TRUE(nodes_equal(out, plain));
}
