#include <gtest/gtest.h>

#include "../doctree/ast_node.hpp"
#include "../doctree/doc_text.hpp"
#include "../doctree/suggestions.hpp"
#include "../lib/log.h"

#include <re2/re2.h>

using namespace doctree;

static NodePtr text(const std::string& s) { return make_node<Text>(s); }
static NodePtr para(const std::string& s) { return make_node<Paragraph>(NodeList{text(s)}); }

class DocTextTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_init(nullptr);
    }
};

// ==== extract_text ====

TEST_F(DocTextTest, InlineContentConcatenates) {
    auto p = make_node<Paragraph>(NodeList{
        text("Hello "),
        make_node<Strong>(NodeList{text("bold")}),
        text(" and "),
        make_node<Code>("code"),
        make_node<LineBreak>(),
        make_node<MathInline>("x^2"),
    });
    EXPECT_EQ(extract_text(*p), "Hello bold and code x^2");
}

TEST_F(DocTextTest, BlocksUseJoiner) {
    auto doc = make_node<Document>(NodeList{
        make_node<Heading>(1, NodeList{text("Title")}),
        para("first"),
        make_node<CodeBlock>("int x;"),
        make_node<ThematicBreak>(),
        para("last"),
    });
    EXPECT_EQ(extract_text(*doc), "Title first int x; last");
    EXPECT_EQ(extract_text(*doc, "\n\n"), "Title\n\nfirst\n\nint x;\n\nlast");
}

TEST_F(DocTextTest, HtmlCommentsAndImagesContributeNothing) {
    auto p = make_node<Paragraph>(NodeList{
        text("a"),
        make_node<HTMLInline>("<b>"),
        make_node<CommentInline>("hidden"),
        make_node<Image>("x.png", "alt text"),
        text("b"),
    });
    EXPECT_EQ(extract_text(*p), "ab");
}

TEST_F(DocTextTest, NodeListExtraction) {
    NodeList nodes{para("one"), para(""), para("two")};
    EXPECT_EQ(extract_text(nodes), "one two");
    EXPECT_EQ(extract_text(nodes, "|"), "one|two");
}

TEST_F(DocTextTest, TableCellsAreSeparated) {
    auto cell = [](const std::string& s) { return make_node<TableCell>(NodeList{text(s)}); };
    auto row = make_node<TableRow>(NodeList{cell("a"), cell("b")});
    auto table = make_node<Table>(nullptr, NodeList{row});
    EXPECT_EQ(extract_text(*table), "a b");
}

// ==== count_words ====

TEST_F(DocTextTest, CountWordsOnStrings) {
    EXPECT_EQ(count_words(""), 0u);
    EXPECT_EQ(count_words("   \t\n "), 0u);
    EXPECT_EQ(count_words("one"), 1u);
    EXPECT_EQ(count_words("  one  two\tthree\nfour "), 4u);
}

TEST_F(DocTextTest, CountWordsOnNodes) {
    NodeList nodes{
        make_node<Heading>(2, NodeList{text("Two words")}),
        para("three more words"),
    };
    EXPECT_EQ(count_words(nodes), 5u);
}

// ==== slugify ====

TEST_F(DocTextTest, SlugifyBasics) {
    EXPECT_EQ(slugify("Hello World"), "hello-world");
    EXPECT_EQ(slugify("  Getting Started: Part 1!  "), "getting-started-part-1");
    EXPECT_EQ(slugify("a -- b__c"), "a-bc");
    EXPECT_EQ(slugify("---"), "");
    EXPECT_EQ(slugify(""), "");
}

TEST_F(DocTextTest, SlugifyDropsNonAscii) {
    EXPECT_EQ(slugify("Caf\xC3\xA9 Menu"), "caf-menu");
}

TEST_F(DocTextTest, SlugifyBoundsLength) {
    std::string slug = slugify("alpha beta gamma delta", 11);
    EXPECT_EQ(slug, "alpha-beta");
    EXPECT_LE(slug.size(), 11u);
}

TEST_F(DocTextTest, SlugifyAlwaysMatchesSlugShape) {
    const RE2 shape("([a-z0-9]+(-[a-z0-9]+)*)?");
    for (const char* input : {"Intro", "  -x- ", "\xE2\x9C\x93 Done", "A/B Testing", "Ends with -",
                              "tabs\tand\nnewlines", "100% sure", "-leading"}) {
        std::string slug = slugify(input);
        EXPECT_TRUE(RE2::FullMatch(slug, shape)) << "'" << input << "' -> '" << slug << "'";
    }
}

TEST_F(DocTextTest, UniqueSlugAddsSuffixes) {
    std::set<std::string> seen;
    EXPECT_EQ(unique_slug("Overview", seen), "overview");
    EXPECT_EQ(unique_slug("Overview", seen), "overview-1");
    EXPECT_EQ(unique_slug("overview", seen), "overview-2");
    EXPECT_EQ(unique_slug("!!!", seen), "section");
    EXPECT_EQ(unique_slug("", seen), "section-1");
    EXPECT_EQ(seen.size(), 5u);
}

// ==== Suggestions ====

TEST_F(DocTextTest, LevenshteinDistance) {
    EXPECT_EQ(levenshtein_distance("", ""), 0);
    EXPECT_EQ(levenshtein_distance("abc", ""), 3);
    EXPECT_EQ(levenshtein_distance("kitten", "sitting"), 3);
    EXPECT_EQ(levenshtein_distance("flaw", "lawn"), 2);
}

TEST_F(DocTextTest, SuggestSimilarRanksByDistance) {
    std::vector<std::string> candidates{"Introduction", "Installation", "Usage", "Intro"};
    std::vector<std::string> result = suggest_similar("intro", candidates);
    ASSERT_FALSE(result.empty());
    EXPECT_EQ(result[0], "Intro");
}

TEST_F(DocTextTest, SuggestSimilarFiltersDistantNames) {
    std::vector<std::string> candidates{"Usage", "Configuration"};
    EXPECT_TRUE(suggest_similar("xyzzy-plugh", candidates).empty());
}

TEST_F(DocTextTest, SuggestSimilarLimitsAndDeduplicates) {
    std::vector<std::string> candidates{"abc", "abd", "abc", "abe", "abf"};
    std::vector<std::string> result = suggest_similar("abc", candidates, 2);
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0], "abc");
    EXPECT_EQ(result[1], "abd");
}
