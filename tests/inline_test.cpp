#include <litedoc-cpp/ast.hpp>

#include "inline_parser.hpp"
#include "source_text.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>

using namespace litedoc_cpp;
using namespace litedoc_cpp::detail;

namespace {

auto parse_in(std::string_view text, Profile profile = Profile::litedoc) -> Inlines {
    return parse_inlines(SourceText::from(text, 0), InlineOptions::for_profile(profile, 64));
}

auto text_of(const Inline& node) -> std::string {
    const auto* text = node.as<Text>();
    return text ? text->content : std::string{"<not text>"};
}

}  // namespace

// =============================================================================
// Text and emphasis
// =============================================================================

TEST(Inline, plain_text_is_one_node) {
    const auto nodes = parse_in("plain text");
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(text_of(nodes[0]), "plain text");
    EXPECT_EQ(nodes[0].span(), (Span{0, 10}));
}

TEST(Inline, emphasis_and_strong) {
    const auto nodes = parse_in("This is *emphasis* and **strong**.");
    ASSERT_EQ(nodes.size(), 5u);
    EXPECT_EQ(text_of(nodes[0]), "This is ");

    const auto* em = nodes[1].as<Emphasis>();
    ASSERT_NE(em, nullptr);
    EXPECT_EQ(em->span, (Span{8, 18}));
    ASSERT_EQ(em->children.size(), 1u);
    EXPECT_EQ(text_of(em->children[0]), "emphasis");
    EXPECT_EQ(em->children[0].span(), (Span{9, 17}));

    EXPECT_EQ(text_of(nodes[2]), " and ");

    const auto* strong = nodes[3].as<Strong>();
    ASSERT_NE(strong, nullptr);
    EXPECT_EQ(strong->span, (Span{23, 33}));
    EXPECT_EQ(plain_text(strong->children), "strong");

    EXPECT_EQ(text_of(nodes[4]), ".");
}

TEST(Inline, nested_emphasis_inside_strong) {
    const auto nodes = parse_in("**a *b* c**");
    ASSERT_EQ(nodes.size(), 1u);
    const auto* strong = nodes[0].as<Strong>();
    ASSERT_NE(strong, nullptr);
    EXPECT_EQ(strong->span, (Span{0, 11}));
    ASSERT_EQ(strong->children.size(), 3u);
    EXPECT_EQ(text_of(strong->children[0]), "a ");
    EXPECT_TRUE(strong->children[1].is<Emphasis>());
    EXPECT_EQ(text_of(strong->children[2]), " c");
}

TEST(Inline, triple_run_opens_strong_then_emphasis) {
    const auto nodes = parse_in("***both***");
    ASSERT_EQ(nodes.size(), 1u);
    const auto* strong = nodes[0].as<Strong>();
    ASSERT_NE(strong, nullptr);
    EXPECT_EQ(strong->span, (Span{0, 10}));
    ASSERT_EQ(strong->children.size(), 1u);
    const auto* em = strong->children[0].as<Emphasis>();
    ASSERT_NE(em, nullptr);
    EXPECT_EQ(em->span, (Span{2, 8}));
}

TEST(Inline, unmatched_delimiters_are_literal) {
    auto nodes = parse_in("*open");
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(text_of(nodes[0]), "*open");
    EXPECT_EQ(nodes[0].span(), (Span{0, 5}));

    nodes = parse_in("a * b");
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(text_of(nodes[0]), "a * b");
}

TEST(Inline, openers_between_a_match_degrade_to_text) {
    const auto nodes = parse_in("*a ~~b*");
    ASSERT_EQ(nodes.size(), 1u);
    const auto* em = nodes[0].as<Emphasis>();
    ASSERT_NE(em, nullptr);
    ASSERT_EQ(em->children.size(), 1u);
    EXPECT_EQ(text_of(em->children[0]), "a ~~b");
}

TEST(Inline, strikethrough_under_every_profile) {
    for (auto profile : {Profile::litedoc, Profile::md, Profile::md_strict}) {
        auto nodes = parse_in("~~gone~~", profile);
        ASSERT_EQ(nodes.size(), 1u) << to_string_view(profile);
        EXPECT_TRUE(nodes[0].is<Strikethrough>()) << to_string_view(profile);
        EXPECT_EQ(nodes[0].span(), (Span{0, 8}));
    }

    auto nodes = parse_in("~single~");
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(text_of(nodes[0]), "~single~");
}

// =============================================================================
// Code spans and escapes
// =============================================================================

TEST(Inline, code_span_content_is_raw) {
    const auto nodes = parse_in("use `a*b` here");
    ASSERT_EQ(nodes.size(), 3u);
    const auto* code = nodes[1].as<CodeSpan>();
    ASSERT_NE(code, nullptr);
    EXPECT_EQ(code->content, "a*b");
    EXPECT_EQ(code->span, (Span{4, 9}));
}

TEST(Inline, code_span_needs_equal_backtick_runs) {
    auto nodes = parse_in("``a ` b``");
    ASSERT_EQ(nodes.size(), 1u);
    ASSERT_TRUE(nodes[0].is<CodeSpan>());
    EXPECT_EQ(nodes[0].as<CodeSpan>()->content, "a ` b");

    nodes = parse_in("` x `");
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(nodes[0].as<CodeSpan>()->content, "x");

    nodes = parse_in("`oops");
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(text_of(nodes[0]), "`oops");
}

TEST(Inline, unmatched_run_does_not_hide_other_lengths) {
    const auto nodes = parse_in("```a ``b`` c");
    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_EQ(text_of(nodes[0]), "```a ");
    const auto* code = nodes[1].as<CodeSpan>();
    ASSERT_NE(code, nullptr);
    EXPECT_EQ(code->content, "b");
    EXPECT_EQ(code->span, (Span{5, 10}));
    EXPECT_EQ(text_of(nodes[2]), " c");
}

TEST(Inline, backslash_escapes_punctuation) {
    auto nodes = parse_in("\\*not\\*");
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(text_of(nodes[0]), "*not*");
    EXPECT_EQ(nodes[0].span(), (Span{0, 7}));

    nodes = parse_in("\\a");
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(text_of(nodes[0]), "\\a");
}

// =============================================================================
// Breaks
// =============================================================================

TEST(Inline, newline_is_a_soft_break) {
    const auto nodes = parse_in("one\ntwo");
    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_EQ(text_of(nodes[0]), "one");
    EXPECT_TRUE(nodes[1].is<SoftBreak>());
    EXPECT_EQ(nodes[1].span(), (Span{3, 4}));
    EXPECT_EQ(nodes[2].span(), (Span{4, 7}));
}

TEST(Inline, two_trailing_spaces_make_a_hard_break) {
    const auto nodes = parse_in("one  \ntwo");
    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_EQ(text_of(nodes[0]), "one");
    EXPECT_EQ(nodes[0].span(), (Span{0, 3}));
    EXPECT_TRUE(nodes[1].is<HardBreak>());
    EXPECT_EQ(nodes[1].span(), (Span{3, 6}));
    EXPECT_EQ(text_of(nodes[2]), "two");
}

TEST(Inline, backslash_newline_is_a_hard_break) {
    const auto nodes = parse_in("one\\\ntwo");
    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_TRUE(nodes[1].is<HardBreak>());
    EXPECT_EQ(nodes[1].span(), (Span{3, 5}));
}

// =============================================================================
// Links and references
// =============================================================================

TEST(Inline, wiki_link_with_label) {
    const auto nodes = parse_in("see [[Home Page|home]]");
    ASSERT_EQ(nodes.size(), 2u);
    const auto* link = nodes[1].as<Link>();
    ASSERT_NE(link, nullptr);
    EXPECT_EQ(link->destination, "home");
    EXPECT_EQ(link->span, (Span{4, 22}));
    ASSERT_EQ(link->label.size(), 1u);
    EXPECT_EQ(text_of(link->label[0]), "Home Page");
    EXPECT_EQ(link->label[0].span(), (Span{6, 15}));
}

TEST(Inline, wiki_link_without_label_uses_destination) {
    const auto nodes = parse_in("[[target]]");
    ASSERT_EQ(nodes.size(), 1u);
    const auto* link = nodes[0].as<Link>();
    ASSERT_NE(link, nullptr);
    EXPECT_EQ(link->destination, "target");
    EXPECT_EQ(plain_text(link->label), "target");
}

TEST(Inline, wiki_links_are_text_under_markdown) {
    const auto nodes = parse_in("[[x]]", Profile::md);
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(text_of(nodes[0]), "[[x]]");
}

TEST(Inline, markdown_link) {
    const auto nodes = parse_in("[click](https://x.y)");
    ASSERT_EQ(nodes.size(), 1u);
    const auto* link = nodes[0].as<Link>();
    ASSERT_NE(link, nullptr);
    EXPECT_EQ(link->destination, "https://x.y");
    EXPECT_EQ(link->span, (Span{0, 20}));
    EXPECT_EQ(plain_text(link->label), "click");
}

TEST(Inline, markdown_link_destination_may_be_padded) {
    const auto nodes = parse_in("[a]( u )");
    ASSERT_EQ(nodes.size(), 1u);
    const auto* link = nodes[0].as<Link>();
    ASSERT_NE(link, nullptr);
    EXPECT_EQ(link->destination, "u");
    EXPECT_EQ(link->span, (Span{0, 8}));

    EXPECT_EQ(text_of(parse_in("[a](u v)")[0]), "[a](u v)");
    EXPECT_EQ(text_of(parse_in("[a](u\n)")[0]), "[a](u");
}

TEST(Inline, overlong_link_label_is_text) {
    const auto text = "[" + std::string(1200, 'a') + "](u)";
    const auto nodes = parse_in(text);
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(text_of(nodes[0]), text);
}

TEST(Inline, link_label_is_inline_parsed) {
    const auto nodes = parse_in("[*a*](u)", Profile::md);
    ASSERT_EQ(nodes.size(), 1u);
    const auto* link = nodes[0].as<Link>();
    ASSERT_NE(link, nullptr);
    ASSERT_EQ(link->label.size(), 1u);
    EXPECT_TRUE(link->label[0].is<Emphasis>());
}

TEST(Inline, broken_link_syntax_is_text) {
    const auto nodes = parse_in("[text] (x)");
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(text_of(nodes[0]), "[text] (x)");
}

TEST(Inline, footnote_reference) {
    auto nodes = parse_in("Fact[^1].");
    ASSERT_EQ(nodes.size(), 3u);
    const auto* ref = nodes[1].as<FootnoteRef>();
    ASSERT_NE(ref, nullptr);
    EXPECT_EQ(ref->id, "1");
    EXPECT_EQ(ref->span, (Span{4, 8}));

    nodes = parse_in("Fact[^1].", Profile::md);
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(text_of(nodes[0]), "Fact[^1].");
}

TEST(Inline, angle_autolink) {
    auto nodes = parse_in("<https://example.com>");
    ASSERT_EQ(nodes.size(), 1u);
    const auto* link = nodes[0].as<AutoLink>();
    ASSERT_NE(link, nullptr);
    EXPECT_EQ(link->destination, "https://example.com");
    EXPECT_EQ(link->span, (Span{0, 21}));

    nodes = parse_in("<not a link>");
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(text_of(nodes[0]), "<not a link>");
}

TEST(Inline, bare_autolink_strips_trailing_punctuation) {
    auto nodes = parse_in("visit https://example.com/a.");
    ASSERT_EQ(nodes.size(), 3u);
    const auto* link = nodes[1].as<AutoLink>();
    ASSERT_NE(link, nullptr);
    EXPECT_EQ(link->destination, "https://example.com/a");
    EXPECT_EQ(link->span, (Span{6, 27}));
    EXPECT_EQ(text_of(nodes[2]), ".");

    nodes = parse_in("(https://x.org)");
    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_EQ(nodes[1].as<AutoLink>()->destination, "https://x.org");

    nodes = parse_in("visit https://example.com", Profile::md_strict);
    ASSERT_EQ(nodes.size(), 2u);
    ASSERT_NE(nodes[1].as<AutoLink>(), nullptr);
    EXPECT_EQ(nodes[1].as<AutoLink>()->destination, "https://example.com");
}

// =============================================================================
// Limits and helpers
// =============================================================================

TEST(Inline, label_depth_bound_degrades_to_text) {
    auto options = InlineOptions::for_profile(Profile::md, 1);
    const auto nodes = parse_inlines(SourceText::from("[*a*](u)", 0), options);
    ASSERT_EQ(nodes.size(), 1u);
    const auto* link = nodes[0].as<Link>();
    ASSERT_NE(link, nullptr);
    ASSERT_EQ(link->label.size(), 1u);
    EXPECT_EQ(text_of(link->label[0]), "*a*");
}

TEST(Inline, spans_are_shifted_by_source_offset) {
    const auto nodes = parse_inlines(SourceText::from("*x*", 100),
                                     InlineOptions::for_profile(Profile::litedoc, 64));
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(nodes[0].span(), (Span{100, 103}));
}

TEST(Inline, children_and_plain_text) {
    const auto nodes = parse_in("a *b* `c`\nd");
    EXPECT_EQ(plain_text(nodes), "a b c d");
    EXPECT_NE(nodes[1].children(), nullptr);
    EXPECT_EQ(nodes[0].children(), nullptr);
    EXPECT_EQ(nodes[1].kind(), InlineKind::emphasis);
    EXPECT_EQ(to_string_view(nodes[1].kind()), "Emphasis");
}

TEST(Inline, many_unclosed_openers_stay_literal) {
    auto repeat = [](std::string_view unit, std::size_t n) {
        auto out = std::string{};
        for (std::size_t i = 0; i < n; ++i) out += unit;
        return out;
    };
    for (const auto& text : {repeat("[a", 5000), repeat("<a", 5000), repeat("[[a", 3000)}) {
        const auto nodes = parse_in(text);
        ASSERT_EQ(nodes.size(), 1u);
        EXPECT_EQ(text_of(nodes[0]), text);
    }
}

TEST(Inline, empty_input_has_no_nodes) {
    EXPECT_TRUE(parse_in("").empty());
}
