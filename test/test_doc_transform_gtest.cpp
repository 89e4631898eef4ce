#include <gtest/gtest.h>

#include "../doctree/ast_node.hpp"
#include "../doctree/doc_error.hpp"
#include "../doctree/doc_text.hpp"
#include "../doctree/transformer.hpp"
#include "../lib/log.h"

using namespace doctree;

static NodePtr text(const std::string& s) { return make_node<Text>(s); }
static NodePtr para(const std::string& s) { return make_node<Paragraph>(NodeList{text(s)}); }
static NodePtr heading(int level, const std::string& s) {
    return make_node<Heading>(level, NodeList{text(s)});
}

// A document touching most node kinds
static DocumentPtr sample_document() {
    Json::Value meta(Json::objectValue);
    meta["title"] = "Sample";

    auto cell = [](const std::string& s) { return make_node<TableCell>(NodeList{text(s)}); };
    auto header = make_node<TableRow>(NodeList{cell("A"), cell("B")}, true);
    auto row = make_node<TableRow>(NodeList{cell("1"), cell("2")});

    DefinitionItem item;
    item.term = make_node<DefinitionTerm>(NodeList{text("term")});
    item.descriptions.push_back(make_node<DefinitionDescription>(NodeList{para("meaning")}));

    return make_node<Document>(NodeList{
        heading(1, "Intro"),
        make_node<Paragraph>(NodeList{
            text("Visit "),
            make_node<Link>("http://old.example.com/a", NodeList{text("site")}, std::string("t")),
            text(" and "),
            make_node<Strong>(NodeList{make_node<Emphasis>(NodeList{text("styled")})}),
            make_node<Image>("http://old.example.com/i.png", "alt"),
            make_node<FootnoteReference>("1"),
        }),
        make_node<CodeBlock>("print(1)", std::string("python"), '~', 4),
        make_node<List>(true, NodeList{
            make_node<ListItem>(NodeList{para("one")}, TaskStatus::CHECKED),
            make_node<ListItem>(NodeList{para("two")}),
        }, 3, false),
        make_node<Table>(header, NodeList{row},
                         std::vector<Alignment>{Alignment::LEFT, Alignment::RIGHT}, std::string("cap")),
        make_node<DefinitionList>(std::vector<DefinitionItem>{item}),
        heading(2, "Details"),
        make_node<BlockQuote>(NodeList{para("quoted")}),
        make_node<ThematicBreak>(),
        make_node<MathBlock>("E=mc^2"),
        make_node<FootnoteDefinition>("1", NodeList{para("note")}),
    }, NodeAttrs(meta));
}

class TransformTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_init(nullptr);
    }
};

// ==== Identity ====

TEST_F(TransformTest, IdentityTransformIsStructurallyEqual) {
    DocumentPtr doc = sample_document();
    NodeTransformer identity;
    DocumentPtr copy = transform_document(doc, identity);
    EXPECT_NE(copy.get(), doc.get());
    EXPECT_TRUE(nodes_equal(copy, doc));
}

TEST_F(TransformTest, IdentityPreservesMalformedHeading) {
    auto doc = make_node<Document>(NodeList{Heading::make_unchecked(0, NodeList{text("bad")})});
    NodeTransformer identity;
    DocumentPtr copy = transform_document(doc, identity);
    EXPECT_TRUE(nodes_equal(copy, doc));
}

TEST_F(TransformTest, InputIsNotModified) {
    DocumentPtr doc = sample_document();
    std::string before = extract_text(*doc);
    TextReplacer replacer("Intro", "Opening");
    DocumentPtr out = transform_document(doc, replacer);
    EXPECT_EQ(extract_text(*doc), before);
    EXPECT_NE(extract_text(*out), before);
}

// ==== Deletion ====

namespace {

class DropImages : public NodeTransformer {
public:
    void visit_image(const Image& node) override {
        (void)node;
        set_result(nullptr);
    }
};

class DropEverything : public NodeTransformer {
public:
    void visit_document(const Document& node) override {
        (void)node;
        set_result(nullptr);
    }
};

class DropTerms : public NodeTransformer {
public:
    void visit_definition_term(const DefinitionTerm& node) override {
        (void)node;
        set_result(nullptr);
    }
};

} // namespace

TEST_F(TransformTest, NullResultRemovesNodeFromParent) {
    DocumentPtr doc = sample_document();
    DropImages dropper;
    DocumentPtr out = transform_document(doc, dropper);
    EXPECT_EQ(collect_nodes(*doc, NodeType::IMAGE).size(), 1u);
    EXPECT_TRUE(collect_nodes(*out, NodeType::IMAGE).empty());
    EXPECT_EQ(out->children().size(), doc->children().size());
}

TEST_F(TransformTest, DeletingRootThrows) {
    DocumentPtr doc = sample_document();
    DropEverything dropper;
    try {
        transform_document(doc, dropper);
        FAIL() << "deleted root accepted";
    } catch (const DocError& e) {
        EXPECT_EQ(e.code(), DocErrorCode::INVALID_NODE);
    }
}

TEST_F(TransformTest, DeletedTermDropsItsDescriptions) {
    DocumentPtr doc = sample_document();
    DropTerms dropper;
    DocumentPtr out = transform_document(doc, dropper);
    auto lists = collect_nodes(*out, NodeType::DEFINITION_LIST);
    ASSERT_EQ(lists.size(), 1u);
    EXPECT_TRUE(static_cast<const DefinitionList*>(lists[0])->items().empty());
    EXPECT_TRUE(collect_nodes(*out, NodeType::DEFINITION_DESCRIPTION).empty());
}

// ==== HeadingLevelTransformer ====

TEST_F(TransformTest, HeadingOffsetClamps) {
    auto doc = make_node<Document>(NodeList{heading(1, "a"), heading(5, "b"), heading(6, "c")});
    HeadingLevelTransformer shift(2);
    DocumentPtr out = transform_document(doc, shift);
    auto headings = collect_nodes(*out, NodeType::HEADING);
    ASSERT_EQ(headings.size(), 3u);
    EXPECT_EQ(static_cast<const Heading*>(headings[0])->level(), 3);
    EXPECT_EQ(static_cast<const Heading*>(headings[1])->level(), 6);
    EXPECT_EQ(static_cast<const Heading*>(headings[2])->level(), 6);
}

TEST_F(TransformTest, HeadingNegativeOffsetRespectsMinimum) {
    auto doc = make_node<Document>(NodeList{heading(1, "a"), heading(4, "b")});
    HeadingLevelTransformer shift(-2, 2);
    DocumentPtr out = transform_document(doc, shift);
    auto headings = collect_nodes(*out, NodeType::HEADING);
    EXPECT_EQ(static_cast<const Heading*>(headings[0])->level(), 2);
    EXPECT_EQ(static_cast<const Heading*>(headings[1])->level(), 2);
}

TEST_F(TransformTest, HeadingBoundsAreChecked) {
    EXPECT_THROW(HeadingLevelTransformer(1, 0, 6), DocError);
    EXPECT_THROW(HeadingLevelTransformer(1, 4, 3), DocError);
    EXPECT_THROW(HeadingLevelTransformer(1, 1, 7), DocError);
}

// ==== TextReplacer ====

TEST_F(TransformTest, LiteralReplacement) {
    auto doc = make_node<Document>(NodeList{para("a.b a.b"), heading(1, "a.b")});
    TextReplacer replacer("a.b", "x");
    DocumentPtr out = transform_document(doc, replacer);
    EXPECT_EQ(extract_text(*out->children()[0]), "x x");
    EXPECT_EQ(extract_text(*out->children()[1]), "x");
}

TEST_F(TransformTest, LiteralReplacementDoesNotRescan) {
    auto doc = make_node<Document>(NodeList{para("aaa")});
    TextReplacer replacer("a", "aa");
    DocumentPtr out = transform_document(doc, replacer);
    EXPECT_EQ(extract_text(*out), "aaaaaa");
}

TEST_F(TransformTest, RegexReplacementWithGroups) {
    auto doc = make_node<Document>(NodeList{para("2024-01-15 and 2025-12-31")});
    TextReplacer replacer("(\\d{4})-(\\d{2})-(\\d{2})", "\\3/\\2/\\1", true);
    DocumentPtr out = transform_document(doc, replacer);
    EXPECT_EQ(extract_text(*out), "15/01/2024 and 31/12/2025");
}

TEST_F(TransformTest, InvalidRegexThrows) {
    try {
        TextReplacer replacer("(unclosed", "x", true);
        FAIL() << "invalid pattern accepted";
    } catch (const DocError& e) {
        EXPECT_EQ(e.code(), DocErrorCode::INVALID_ARGUMENT);
        EXPECT_NE(std::string(e.what()).find("(unclosed"), std::string::npos);
    }
    EXPECT_THROW(TextReplacer("(a)", "\\2", true), DocError);
}

TEST_F(TransformTest, CodeIsNotReplaced) {
    auto doc = make_node<Document>(NodeList{
        make_node<Paragraph>(NodeList{make_node<Code>("foo"), text("foo")}),
    });
    TextReplacer replacer("foo", "bar");
    DocumentPtr out = transform_document(doc, replacer);
    EXPECT_EQ(extract_text(*out), "foobar");
}

// ==== LinkRewriter ====

TEST_F(TransformTest, RewritesLinksAndImages) {
    DocumentPtr doc = sample_document();
    LinkRewriter rewriter([](const std::string& url) {
        std::string from = "http://old.example.com";
        if (url.compare(0, from.size(), from) == 0) return "https://new.example.com" + url.substr(from.size());
        return url;
    });
    DocumentPtr out = transform_document(doc, rewriter);

    auto links = collect_nodes(*out, NodeType::LINK);
    ASSERT_EQ(links.size(), 1u);
    const Link* link = static_cast<const Link*>(links[0]);
    EXPECT_EQ(link->url(), "https://new.example.com/a");
    EXPECT_EQ(link->title().value(), "t");

    auto images = collect_nodes(*out, NodeType::IMAGE);
    ASSERT_EQ(images.size(), 1u);
    const Image* image = static_cast<const Image*>(images[0]);
    EXPECT_EQ(image->url(), "https://new.example.com/i.png");
    EXPECT_EQ(image->alt_text(), "alt");
}

TEST_F(TransformTest, RewriterRejectsDangerousTargets) {
    DocumentPtr doc = sample_document();
    LinkRewriter rewriter([](const std::string&) { return std::string("javascript:alert(1)"); });
    EXPECT_THROW(transform_document(doc, rewriter), DocError);

    LinkRewriter unchecked([](const std::string&) { return std::string("javascript:alert(1)"); }, false);
    EXPECT_NO_THROW(transform_document(doc, unchecked));
}

TEST_F(TransformTest, RewriterNeedsMapper) {
    EXPECT_THROW(LinkRewriter(nullptr), DocError);
}

// ==== Collection and filtering ====

TEST_F(TransformTest, CollectNodesInDocumentOrder) {
    DocumentPtr doc = sample_document();
    auto headings = collect_nodes(*doc, NodeType::HEADING);
    ASSERT_EQ(headings.size(), 2u);
    EXPECT_EQ(extract_text(*headings[0]), "Intro");
    EXPECT_EQ(extract_text(*headings[1]), "Details");

    auto texts = collect_nodes(*doc, [](const Node& node) {
        return node.type() == NodeType::TEXT &&
               static_cast<const Text&>(node).content().find("o") != std::string::npos;
    });
    ASSERT_FALSE(texts.empty());
    EXPECT_EQ(static_cast<const Text*>(texts[0])->content(), "Intro");
}

TEST_F(TransformTest, NodeCollectorWithoutPredicateCollectsAll) {
    auto doc = make_node<Document>(NodeList{para("x")});
    NodeCollector collector;
    doc->accept(collector);
    EXPECT_EQ(collector.collected().size(), 3u);
}

TEST_F(TransformTest, FilterNodesDropsSubtrees) {
    DocumentPtr doc = sample_document();
    DocumentPtr out = filter_nodes(doc, [](const Node& node) {
        return node.type() != NodeType::BLOCK_QUOTE && node.type() != NodeType::STRONG;
    });
    EXPECT_TRUE(collect_nodes(*out, NodeType::BLOCK_QUOTE).empty());
    EXPECT_TRUE(collect_nodes(*out, NodeType::EMPHASIS).empty());
    EXPECT_EQ(out->children().size(), doc->children().size() - 1);
    EXPECT_EQ(out->metadata()["title"].asString(), "Sample");
}

TEST_F(TransformTest, FilterKeepsRootEvenWhenRejected) {
    DocumentPtr doc = sample_document();
    DocumentPtr out = filter_nodes(doc, [](const Node&) { return false; });
    EXPECT_TRUE(out->children().empty());
}

TEST_F(TransformTest, FilterNeedsPredicate) {
    EXPECT_THROW(filter_nodes(sample_document(), NodePredicate()), DocError);
}

// ==== Merging ====

TEST_F(TransformTest, MergeConcatenatesChildren) {
    auto a = make_node<Document>(NodeList{para("a1"), para("a2")});
    auto b = make_node<Document>(NodeList{para("b1")});
    DocumentPtr merged = merge_documents({a, b});
    ASSERT_EQ(merged->children().size(), 3u);
    EXPECT_EQ(extract_text(*merged->children()[2]), "b1");
}

TEST_F(TransformTest, MergeMetadataPolicies) {
    Json::Value m1(Json::objectValue);
    m1["title"] = "First";
    m1["tags"].append("x");
    Json::Value m2(Json::objectValue);
    m2["title"] = "Second";
    m2["tags"].append("y");
    m2["author"] = "Ada";
    auto a = make_node<Document>(NodeList{}, NodeAttrs(m1));
    auto b = make_node<Document>(NodeList{}, NodeAttrs(m2));

    DocumentPtr last = merge_documents({a, b});
    EXPECT_EQ(last->metadata()["title"].asString(), "Second");
    EXPECT_EQ(last->metadata()["tags"].size(), 1u);
    EXPECT_EQ(last->metadata()["author"].asString(), "Ada");

    DocumentPtr first = merge_documents({a, b}, MetadataMerge::FIRST_WRITE_WINS);
    EXPECT_EQ(first->metadata()["title"].asString(), "First");
    EXPECT_EQ(first->metadata()["tags"][0].asString(), "x");
    EXPECT_EQ(first->metadata()["author"].asString(), "Ada");

    DocumentPtr lists = merge_documents({a, b}, MetadataMerge::MERGE_LISTS);
    ASSERT_EQ(lists->metadata()["tags"].size(), 2u);
    EXPECT_EQ(lists->metadata()["tags"][1].asString(), "y");
    EXPECT_EQ(lists->metadata()["title"].asString(), "Second");
}

TEST_F(TransformTest, MergeRejectsNullDocument) {
    EXPECT_THROW(merge_documents({sample_document(), nullptr}), DocError);
}
