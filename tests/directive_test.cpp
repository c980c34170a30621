#include <litedoc-cpp/ast.hpp>
#include <litedoc-cpp/parser.hpp>

#include "block_parser.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <string_view>

using namespace litedoc_cpp;

namespace {

auto paragraph_text(const Block& block) -> std::string {
    const auto* p = block.as<Paragraph>();
    return p ? plain_text(p->content) : std::string{"<not a paragraph>"};
}

}  // namespace

// =============================================================================
// Directive head
// =============================================================================

TEST(DirectiveHead, name_attributes_and_flags) {
    const auto text = std::string_view{"::figure src=a.png alt=\"two words\" flag"};
    const auto head = detail::parse_directive_head(detail::Line{text, 0});
    ASSERT_TRUE(head.has_value());
    EXPECT_EQ(head->name, "figure");
    ASSERT_EQ(head->attributes.size(), 3u);
    EXPECT_EQ(head->span, (Span{0, static_cast<std::uint32_t>(text.size())}));

    const auto* src = head->find("src");
    ASSERT_NE(src, nullptr);
    EXPECT_EQ(src->value, "a.png");

    const auto* alt = head->find("alt");
    ASSERT_NE(alt, nullptr);
    EXPECT_EQ(alt->value, "two words");
    EXPECT_EQ(alt->value_offset, 24u);

    EXPECT_TRUE(head->has_flag("flag"));
    EXPECT_FALSE(head->has_flag("src"));
    EXPECT_EQ(head->find("flag"), nullptr);
}

TEST(DirectiveHead, rejects_non_directive_lines) {
    using detail::Line;
    EXPECT_FALSE(detail::parse_directive_head(Line{"not a directive", 0}));
    EXPECT_FALSE(detail::parse_directive_head(Line{"::", 0}));
    EXPECT_FALSE(detail::parse_directive_head(Line{"::9x", 0}));
    EXPECT_FALSE(detail::parse_directive_head(Line{"::name:", 0}));
    EXPECT_TRUE(detail::parse_directive_head(Line{"  ::note-2 ", 0}));
}

// =============================================================================
// ::list
// =============================================================================

TEST(ListDirective, items_become_a_list) {
    const auto result = parse_with_recovery("::list\n- One\n- Two\n- Three\n::");
    EXPECT_TRUE(result.ok);
    ASSERT_EQ(result.document.blocks.size(), 1u);
    const auto* list = result.document.blocks[0].as<List>();
    ASSERT_NE(list, nullptr);
    EXPECT_EQ(list->kind, ListKind::unordered);
    ASSERT_EQ(list->items.size(), 3u);
    EXPECT_EQ(list->span, (Span{0, 29}));
    EXPECT_EQ(paragraph_text(list->items[1].blocks[0]), "Two");
    EXPECT_EQ(list->items[1].span, (Span{13, 18}));
}

TEST(ListDirective, ordered_flag_and_start) {
    auto doc = parse("::list ordered start=5\n- a\n- b\n::");
    auto* list = doc.blocks[0].as<List>();
    ASSERT_NE(list, nullptr);
    EXPECT_EQ(list->kind, ListKind::ordered);
    EXPECT_EQ(list->start, 5u);

    doc = parse("::list\n1. a\n2. b\n::");
    list = doc.blocks[0].as<List>();
    ASSERT_NE(list, nullptr);
    EXPECT_EQ(list->kind, ListKind::ordered);
    EXPECT_EQ(list->start, 1u);
}

TEST(ListDirective, non_item_line_is_reported_and_kept) {
    const auto result = parse_with_recovery("::list\n- a\nstray\n::");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, ParseErrorKind::invalid_list_marker);
    EXPECT_EQ(result.errors[0].span, (Span{11, 16}));

    const auto* list = result.document.blocks[0].as<List>();
    ASSERT_NE(list, nullptr);
    ASSERT_EQ(list->items.size(), 1u);
    EXPECT_EQ(paragraph_text(list->items[0].blocks[0]), "a stray");
}

TEST(ListDirective, pipe_line_continues_the_current_item) {
    const auto result = parse_with_recovery("::list\n- first item\n| continued text\n- second\n::");
    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(result.errors.empty());

    const auto* list = result.document.blocks[0].as<List>();
    ASSERT_NE(list, nullptr);
    ASSERT_EQ(list->items.size(), 2u);
    EXPECT_EQ(list->items[0].span, (Span{7, 36}));
    ASSERT_EQ(list->items[0].blocks.size(), 1u);
    EXPECT_EQ(paragraph_text(list->items[0].blocks[0]), "first item continued text");
    const auto& content = list->items[0].blocks[0].as<Paragraph>()->content;
    EXPECT_EQ(content.back().span(), (Span{22, 36}));
    EXPECT_EQ(paragraph_text(list->items[1].blocks[0]), "second");
}

TEST(ListDirective, pipe_line_before_any_item_is_reported) {
    const auto result = parse_with_recovery("::list\n| orphan\n::");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, ParseErrorKind::invalid_list_marker);
}

TEST(ListDirective, unterminated_list_closes_at_end_of_input) {
    const auto result = parse_with_recovery("::list\n- item");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, ParseErrorKind::unterminated_container);
    EXPECT_EQ(result.errors[0].span, (Span{0, 13}));
    EXPECT_EQ(result.errors[0].message, "directive `::list` is never closed");

    ASSERT_EQ(result.document.blocks.size(), 1u);
    const auto* list = result.document.blocks[0].as<List>();
    ASSERT_NE(list, nullptr);
    EXPECT_EQ(list->items.size(), 1u);
    EXPECT_EQ(list->span, (Span{0, 13}));
}

// =============================================================================
// Unknown and rejected directives
// =============================================================================

TEST(UnknownDirective, body_is_kept_raw) {
    const auto text = std::string_view{"::widget size=3\nbody text\n::"};
    const auto result = parse_with_recovery(text);
    EXPECT_FALSE(result.ok);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, ParseErrorKind::unknown_directive);
    EXPECT_EQ(result.errors[0].span, (Span{0, 15}));

    ASSERT_EQ(result.document.blocks.size(), 1u);
    const auto* raw = result.document.blocks[0].as<RawBlock>();
    ASSERT_NE(raw, nullptr);
    EXPECT_EQ(raw->name, "widget");
    EXPECT_EQ(raw->content, "body text");
    EXPECT_EQ(raw->span, (Span{0, 28}));

    EXPECT_NO_THROW(parse(text));
}

TEST(UnknownDirective, markdown_passes_directives_through_silently) {
    const auto result = parse_with_recovery("::callout\nhi\n::", Profile::md);
    EXPECT_TRUE(result.ok);
    ASSERT_EQ(result.document.blocks.size(), 1u);
    const auto* raw = result.document.blocks[0].as<RawBlock>();
    ASSERT_NE(raw, nullptr);
    EXPECT_EQ(raw->name, "callout");
    EXPECT_EQ(raw->content, "hi");
}

TEST(UnknownDirective, strict_markdown_rejects_directives) {
    const auto text = std::string_view{"::note\nx\n::"};
    const auto result = parse_with_recovery(text, Profile::md_strict);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, ParseErrorKind::unknown_directive);
    EXPECT_TRUE(result.has_fatal_errors());
    EXPECT_TRUE(result.document.blocks[0].is<RawBlock>());

    try {
        parse(text, Profile::md_strict);
        FAIL() << "expected ParseFailure";
    } catch (const ParseFailure& e) {
        EXPECT_EQ(e.kind(), ParseErrorKind::unknown_directive);
        EXPECT_EQ(e.span(), (Span{0, 6}));
    }
}

TEST(UnknownDirective, stray_close_is_reported) {
    auto result = parse_with_recovery("para\n\n::");
    ASSERT_EQ(result.document.blocks.size(), 2u);
    const auto* raw = result.document.blocks[1].as<RawBlock>();
    ASSERT_NE(raw, nullptr);
    EXPECT_TRUE(raw->name.empty());
    EXPECT_EQ(raw->span, (Span{6, 8}));
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, ParseErrorKind::unknown_directive);

    result = parse_with_recovery("para\n\n::", Profile::md);
    EXPECT_TRUE(result.ok);
}

// =============================================================================
// Container directives
// =============================================================================

TEST(CalloutDirective, type_and_title) {
    const auto doc = parse("::callout type=warning title=\"Be careful\"\nBody *text*.\n::");
    ASSERT_EQ(doc.blocks.size(), 1u);
    const auto* callout = doc.blocks[0].as<Callout>();
    ASSERT_NE(callout, nullptr);
    EXPECT_EQ(callout->kind, "warning");
    EXPECT_EQ(callout->title, "Be careful");
    ASSERT_EQ(callout->blocks.size(), 1u);
    EXPECT_EQ(paragraph_text(callout->blocks[0]), "Body text.");
}

TEST(CalloutDirective, defaults_to_note_without_title) {
    const auto doc = parse("::callout\nx\n::");
    const auto* callout = doc.blocks[0].as<Callout>();
    ASSERT_NE(callout, nullptr);
    EXPECT_EQ(callout->kind, "note");
    EXPECT_FALSE(callout->title.has_value());
}

TEST(FigureDirective, attributes_and_caption) {
    const auto doc = parse("::figure src=cat.png alt=\"A cat\" caption=\"The *cat*\"\n::");
    ASSERT_EQ(doc.blocks.size(), 1u);
    const auto* figure = doc.blocks[0].as<Figure>();
    ASSERT_NE(figure, nullptr);
    EXPECT_EQ(figure->src, "cat.png");
    EXPECT_EQ(figure->alt, "A cat");
    EXPECT_TRUE(figure->blocks.empty());

    ASSERT_TRUE(figure->caption.has_value());
    ASSERT_EQ(figure->caption->size(), 2u);
    EXPECT_EQ((*figure->caption)[0].span(), (Span{42, 46}));
    EXPECT_TRUE((*figure->caption)[1].is<Emphasis>());
    EXPECT_EQ(plain_text(*figure->caption), "The cat");
}

TEST(QuoteDirective, body_blocks) {
    const auto doc = parse("::quote\n# Title\n\ntext\n::");
    const auto* quote = doc.blocks[0].as<Quote>();
    ASSERT_NE(quote, nullptr);
    ASSERT_EQ(quote->blocks.size(), 2u);
    EXPECT_TRUE(quote->blocks[0].is<Heading>());
}

TEST(MathDirective, display_flag) {
    auto doc = parse("::math\nE = mc^2\n::");
    auto* math = doc.blocks[0].as<MathBlock>();
    ASSERT_NE(math, nullptr);
    EXPECT_EQ(math->content, "E = mc^2");
    EXPECT_FALSE(math->display);

    doc = parse("::math display\nx\n::");
    math = doc.blocks[0].as<MathBlock>();
    ASSERT_NE(math, nullptr);
    EXPECT_TRUE(math->display);
}

TEST(HtmlDirective, body_is_verbatim_with_html_module) {
    const auto doc = parse("@modules html\n::html\n<b>*x*</b>\n::");
    ASSERT_EQ(doc.blocks.size(), 1u);
    const auto* html = doc.blocks[0].as<HtmlBlock>();
    ASSERT_NE(html, nullptr);
    EXPECT_EQ(html->content, "<b>*x*</b>");
    EXPECT_EQ(html->span, (Span{14, 34}));
}

TEST(HtmlDirective, raw_block_without_html_module) {
    const auto result = parse_with_recovery("::html\n<b>x</b>\n::");
    EXPECT_TRUE(result.ok);
    ASSERT_EQ(result.document.blocks.size(), 1u);
    const auto* raw = result.document.blocks[0].as<RawBlock>();
    ASSERT_NE(raw, nullptr);
    EXPECT_EQ(raw->name, "html");
    EXPECT_EQ(raw->content, "<b>x</b>");
}

TEST(TableDirective, rows_with_separator) {
    const auto doc = parse("::table\n| a | b |\n|---|---|\n| 1 | 2 |\n::");
    const auto* table = doc.blocks[0].as<Table>();
    ASSERT_NE(table, nullptr);
    ASSERT_EQ(table->rows.size(), 2u);
    EXPECT_TRUE(table->rows[0].header);
    EXPECT_EQ(table->column_count(), 2u);
}

TEST(TableDirective, missing_separator_is_reported) {
    const auto result = parse_with_recovery("::table\n| a |\n| b |\n::");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, ParseErrorKind::malformed_table);
    EXPECT_EQ(result.errors[0].message, "table has no separator row after its header");
    EXPECT_EQ(result.document.blocks[0].as<Table>()->rows.size(), 2u);
}

TEST(TableDirective, non_row_lines_are_skipped) {
    const auto result = parse_with_recovery("::table\n| a |\n|---|\nnope\n| 1 |\n::");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, ParseErrorKind::malformed_table);
    EXPECT_EQ(result.document.blocks[0].as<Table>()->rows.size(), 2u);
}

TEST(FootnotesDirective, definitions_with_continuations) {
    const auto doc = parse(
        "Text[^1].\n"
        "\n"
        "::footnotes\n"
        "[^1]: The note.\n"
        "[^2]: Another\n"
        "    continued.\n"
        "::");
    ASSERT_EQ(doc.blocks.size(), 2u);
    const auto* notes = doc.blocks[1].as<Footnotes>();
    ASSERT_NE(notes, nullptr);
    ASSERT_EQ(notes->defs.size(), 2u);
    EXPECT_EQ(notes->defs[0].id, "1");
    EXPECT_EQ(notes->defs[1].id, "2");
    EXPECT_EQ(paragraph_text(notes->defs[0].blocks[0]), "The note.");
    EXPECT_EQ(paragraph_text(notes->defs[1].blocks[0]), "Another continued.");
}

TEST(FootnotesDirective, line_before_any_definition_is_skipped) {
    const auto result = parse_with_recovery("::footnotes\nstray\n[^a]: x\n::");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, ParseErrorKind::malformed_footnote);
    EXPECT_EQ(result.document.blocks[0].as<Footnotes>()->defs.size(), 1u);
}

TEST(FootnotesDirective, dangling_reference_is_not_an_error) {
    const auto result = parse_with_recovery("See[^missing].");
    EXPECT_TRUE(result.ok);
}

// =============================================================================
// Nesting
// =============================================================================

TEST(Directive, nested_directives_close_innermost_first) {
    const auto doc = parse("::callout\n::quote\ninner\n::\n::");
    ASSERT_EQ(doc.blocks.size(), 1u);
    const auto* callout = doc.blocks[0].as<Callout>();
    ASSERT_NE(callout, nullptr);
    ASSERT_EQ(callout->blocks.size(), 1u);
    const auto* quote = callout->blocks[0].as<Quote>();
    ASSERT_NE(quote, nullptr);
    EXPECT_EQ(paragraph_text(quote->blocks[0]), "inner");
}

TEST(Directive, close_marker_inside_code_fence_is_content) {
    const auto doc = parse("::callout\n```\n::\n```\n::");
    const auto* callout = doc.blocks[0].as<Callout>();
    ASSERT_NE(callout, nullptr);
    ASSERT_EQ(callout->blocks.size(), 1u);
    EXPECT_EQ(callout->blocks[0].as<CodeBlock>()->content, "::");
}

TEST(Directive, indented_directive_body_is_dedented) {
    const auto doc = parse("  ::callout\n  text\n  ::");
    const auto* callout = doc.blocks[0].as<Callout>();
    ASSERT_NE(callout, nullptr);
    ASSERT_EQ(callout->blocks.size(), 1u);
    EXPECT_EQ(paragraph_text(callout->blocks[0]), "text");
    EXPECT_EQ(callout->span, (Span{2, 23}));
}
