/// @file ast.hpp
/// @brief Document tree: Block and Inline node variants, Document.

#pragma once

#include <litedoc-cpp/metadata.hpp>
#include <litedoc-cpp/profile.hpp>
#include <litedoc-cpp/span.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace litedoc_cpp {

// -- Inline nodes -------------------------------------------------------------

struct Inline;

/// An ordered sequence of inline nodes.
using Inlines = std::vector<Inline>;

/// Literal text. Escapes are already resolved.
struct Text {
    std::string content;
    Span span;

    auto operator==(const Text&) const -> bool = default;
};

/// `*text*`
struct Emphasis {
    Inlines children;
    Span span;

    auto operator==(const Emphasis&) const -> bool = default;
};

/// `**text**`
struct Strong {
    Inlines children;
    Span span;

    auto operator==(const Strong&) const -> bool = default;
};

/// `~~text~~`
struct Strikethrough {
    Inlines children;
    Span span;

    auto operator==(const Strikethrough&) const -> bool = default;
};

/// `` `code` `` -- content is never inline-parsed.
struct CodeSpan {
    std::string content;
    Span span;

    auto operator==(const CodeSpan&) const -> bool = default;
};

/// `[[label|destination]]` or `[label](destination)`.
struct Link {
    Inlines label;
    std::string destination;
    Span span;

    auto operator==(const Link&) const -> bool = default;
};

/// `<scheme://...>` or a bare URI.
struct AutoLink {
    std::string destination;
    Span span;

    auto operator==(const AutoLink&) const -> bool = default;
};

/// `[^id]`. The definition does not have to exist.
struct FootnoteRef {
    std::string id;
    Span span;

    auto operator==(const FootnoteRef&) const -> bool = default;
};

/// Explicit line break: two trailing spaces or a backslash before a newline.
struct HardBreak {
    Span span;

    auto operator==(const HardBreak&) const -> bool = default;
};

/// A newline inside a paragraph.
struct SoftBreak {
    Span span;

    auto operator==(const SoftBreak&) const -> bool = default;
};

/// Discriminator for Inline, in variant order.
enum class InlineKind : std::uint8_t {
    text,
    emphasis,
    strong,
    strikethrough,
    code_span,
    link,
    autolink,
    footnote_ref,
    hard_break,
    soft_break,
};

constexpr auto to_string_view(InlineKind kind) noexcept -> std::string_view {
    switch (kind) {
        case InlineKind::text:          return "Text";
        case InlineKind::emphasis:      return "Emphasis";
        case InlineKind::strong:        return "Strong";
        case InlineKind::strikethrough: return "Strikethrough";
        case InlineKind::code_span:     return "CodeSpan";
        case InlineKind::link:          return "Link";
        case InlineKind::autolink:      return "AutoLink";
        case InlineKind::footnote_ref:  return "FootnoteRef";
        case InlineKind::hard_break:    return "HardBreak";
        case InlineKind::soft_break:    return "SoftBreak";
    }
    return "unknown";
}

/// An inline node: exactly one of the inline alternatives.
///
/// @code
/// for (const auto& node : paragraph.content) {
///     if (const auto* strong = node.as<Strong>()) { ... }
/// }
/// @endcode
struct Inline {
    std::variant<Text, Emphasis, Strong, Strikethrough, CodeSpan,
                 Link, AutoLink, FootnoteRef, HardBreak, SoftBreak> inner;

    auto kind() const noexcept -> InlineKind {
        return static_cast<InlineKind>(inner.index());
    }

    /// Source range of the node.
    auto span() const -> Span {
        return std::visit([](const auto& n) { return n.span; }, inner);
    }

    /// Child inlines of a container node, or nullptr for leaves.
    auto children() const -> const Inlines*;

    template <typename T>
    auto is() const -> bool { return std::holds_alternative<T>(inner); }

    template <typename T>
    auto as() const -> const T* { return std::get_if<T>(&inner); }

    auto operator==(const Inline&) const -> bool = default;
};

/// Concatenated text of an inline sequence; breaks become spaces/newlines.
auto plain_text(const Inlines& inlines) -> std::string;

// -- Block nodes --------------------------------------------------------------

struct Block;

/// An ordered sequence of block nodes.
using Blocks = std::vector<Block>;

/// `# text` through `###### text`.
struct Heading {
    std::uint8_t level{1};
    Inlines content;
    Span span;

    auto operator==(const Heading&) const -> bool = default;
};

struct Paragraph {
    Inlines content;
    Span span;

    auto operator==(const Paragraph&) const -> bool = default;
};

/// List ordering style.
enum class ListKind : std::uint8_t {
    ordered,    ///< `1.` `2)` ...
    unordered,  ///< `-` `*` `+`
};

constexpr auto to_string_view(ListKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ListKind::ordered:   return "ordered";
        case ListKind::unordered: return "unordered";
    }
    return "unknown";
}

/// One list item; its body is a nested block sequence.
struct ListItem {
    Blocks blocks;
    Span span;

    auto operator==(const ListItem&) const -> bool = default;
};

struct List {
    ListKind kind{ListKind::unordered};
    std::optional<std::uint64_t> start;  ///< First number of an ordered list.
    std::vector<ListItem> items;
    Span span;

    auto operator==(const List&) const -> bool = default;
};

/// Fenced code. Content is verbatim, without the fence lines.
struct CodeBlock {
    std::optional<std::string> lang;
    std::string content;
    Span span;

    auto operator==(const CodeBlock&) const -> bool = default;
};

/// `::callout type=... title=...`
struct Callout {
    std::string kind{"note"};
    std::optional<std::string> title;
    Blocks blocks;
    Span span;

    auto operator==(const Callout&) const -> bool = default;
};

struct Quote {
    Blocks blocks;
    Span span;

    auto operator==(const Quote&) const -> bool = default;
};

/// `::figure src=... alt=... caption=...`
struct Figure {
    std::string src;
    std::string alt;
    std::optional<Inlines> caption;
    Blocks blocks;
    Span span;

    auto operator==(const Figure&) const -> bool = default;
};

struct TableCell {
    Inlines content;
    Span span;

    auto operator==(const TableCell&) const -> bool = default;
};

struct TableRow {
    std::vector<TableCell> cells;
    bool header{false};
    Span span;

    auto operator==(const TableRow&) const -> bool = default;
};

/// All rows, header first. Every row has the header's column count.
struct Table {
    std::vector<TableRow> rows;
    Span span;

    auto column_count() const noexcept -> std::size_t {
        return rows.empty() ? 0 : rows.front().cells.size();
    }

    auto operator==(const Table&) const -> bool = default;
};

struct FootnoteDef {
    std::string id;
    Blocks blocks;
    Span span;

    auto operator==(const FootnoteDef&) const -> bool = default;
};

struct Footnotes {
    std::vector<FootnoteDef> defs;
    Span span;

    auto operator==(const Footnotes&) const -> bool = default;
};

/// `$$ ... $$` or `::math`. Content is verbatim.
struct MathBlock {
    std::string content;
    bool display{true};
    Span span;

    auto operator==(const MathBlock&) const -> bool = default;
};

struct ThematicBreak {
    Span span;

    auto operator==(const ThematicBreak&) const -> bool = default;
};

/// Raw HTML, passed through unparsed.
struct HtmlBlock {
    std::string content;
    Span span;

    auto operator==(const HtmlBlock&) const -> bool = default;
};

/// Uninterpreted directive body (unknown or pass-through directives).
struct RawBlock {
    std::string name;  ///< Directive name, empty for a stray close.
    std::string content;
    Span span;

    auto operator==(const RawBlock&) const -> bool = default;
};

/// Discriminator for Block, in variant order.
enum class BlockKind : std::uint8_t {
    heading,
    paragraph,
    list,
    code_block,
    callout,
    quote,
    figure,
    table,
    footnotes,
    math_block,
    thematic_break,
    html_block,
    raw_block,
};

constexpr auto to_string_view(BlockKind kind) noexcept -> std::string_view {
    switch (kind) {
        case BlockKind::heading:        return "Heading";
        case BlockKind::paragraph:      return "Paragraph";
        case BlockKind::list:           return "List";
        case BlockKind::code_block:     return "CodeBlock";
        case BlockKind::callout:        return "Callout";
        case BlockKind::quote:          return "Quote";
        case BlockKind::figure:         return "Figure";
        case BlockKind::table:          return "Table";
        case BlockKind::footnotes:      return "Footnotes";
        case BlockKind::math_block:     return "MathBlock";
        case BlockKind::thematic_break: return "ThematicBreak";
        case BlockKind::html_block:     return "HtmlBlock";
        case BlockKind::raw_block:      return "RawBlock";
    }
    return "unknown";
}

/// A block node: exactly one of the block alternatives.
struct Block {
    std::variant<Heading, Paragraph, List, CodeBlock, Callout, Quote, Figure,
                 Table, Footnotes, MathBlock, ThematicBreak, HtmlBlock, RawBlock> inner;

    auto kind() const noexcept -> BlockKind {
        return static_cast<BlockKind>(inner.index());
    }

    /// Source range of the node.
    auto span() const -> Span {
        return std::visit([](const auto& n) { return n.span; }, inner);
    }

    template <typename T>
    auto is() const -> bool { return std::holds_alternative<T>(inner); }

    template <typename T>
    auto as() const -> const T* { return std::get_if<T>(&inner); }

    auto operator==(const Block&) const -> bool = default;
};

// -- Document -----------------------------------------------------------------

/// The root of a parsed tree. Immutable once returned to the caller.
struct Document {
    Profile profile{Profile::litedoc};  ///< The profile actually used.
    std::vector<Module> modules;        ///< Enabled modules, in order of first mention.
    std::optional<Metadata> metadata;   ///< Front matter, if present.
    Blocks blocks;                      ///< Top-level blocks in source order.
    Span span;                          ///< The whole buffer.

    auto operator==(const Document&) const -> bool = default;
};

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const Heading& h) { ... },
///     [](const auto&) { ... },
/// }, block.inner);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace litedoc_cpp
