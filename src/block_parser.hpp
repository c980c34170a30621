#pragma once

// Block structure: headings, paragraphs, lists, fences, quotes, tables,
// HTML lines and `::name ... ::` container directives.
// Internal header -- not installed.

#include "diagnostics.hpp"
#include "inline_parser.hpp"
#include "lexer.hpp"

#include <litedoc-cpp/ast.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace litedoc_cpp::detail {

/// One `key=value`, `key="quoted value"` or bare `flag` on a directive line.
struct DirectiveAttribute {
    std::string_view key;
    std::string_view value;        ///< Empty for flags.
    std::uint32_t value_offset{0}; ///< Buffer offset of value[0].
    bool flag{false};
};

/// The opening line of a container directive.
struct DirectiveHead {
    std::string_view name;
    std::vector<DirectiveAttribute> attributes;
    std::size_t indent{0};
    Span span;

    auto find(std::string_view key) const -> const DirectiveAttribute*;
    auto has_flag(std::string_view name) const -> bool;
};

/// Parse `::name attrs...`. nullopt if the line does not open a directive.
auto parse_directive_head(const Line& line) -> std::optional<DirectiveHead>;

class BlockParser {
public:
    BlockParser(Diagnostics& diag, const InlineOptions& inline_options,
                std::vector<Module> modules = {})
        : diag_{diag}, profile_{diag.profile()}, inline_options_{inline_options},
          modules_{std::move(modules)} {}

    /// Parse a run of lines into blocks. Recoverable problems are reported
    /// to the diagnostics collector.
    /// @throws NestingDepthExceeded
    auto parse(std::span<const Line> lines) -> Blocks { return parse_blocks(lines); }

private:
    struct Extent {
        std::size_t end;  ///< Index of the close line, or of the first line after the body.
        bool closed;
    };

    struct ItemLines {
        std::vector<Line> lines;
        std::uint32_t start{0};
        std::uint32_t end{0};
        std::size_t next{0};
    };

    auto parse_blocks(std::span<const Line> lines) -> Blocks;
    auto parse_block(std::span<const Line> lines, std::size_t i, Blocks& out) -> std::size_t;

    auto interrupts_paragraph(std::span<const Line> lines, std::size_t i) const -> bool;
    auto starts_table(std::span<const Line> lines, std::size_t i) const -> bool;

    auto parse_paragraph(std::span<const Line> lines, std::size_t i, Blocks& out) -> std::size_t;
    void parse_heading(const Line& line, std::size_t hashes, Blocks& out);
    auto parse_code_fence(std::span<const Line> lines, std::size_t i, Blocks& out) -> std::size_t;
    auto parse_math_fence(std::span<const Line> lines, std::size_t i, Blocks& out) -> std::size_t;
    auto parse_html(std::span<const Line> lines, std::size_t i, Blocks& out) -> std::size_t;
    auto parse_quote(std::span<const Line> lines, std::size_t i, Blocks& out) -> std::size_t;
    auto parse_list(std::span<const Line> lines, std::size_t i, Blocks& out) -> std::size_t;
    auto parse_pipe_table(std::span<const Line> lines, std::size_t i, Blocks& out) -> std::size_t;

    auto collect_item(std::span<const Line> lines, std::size_t i, bool allow_lazy) const
        -> ItemLines;
    auto finish_item(const ItemLines& item) -> ListItem;

    auto find_close(std::span<const Line> lines, std::size_t open, std::size_t indent) const
        -> Extent;
    auto parse_directive(std::span<const Line> lines, std::size_t i, Blocks& out) -> std::size_t;
    auto build_directive(const DirectiveHead& head, std::span<const Line> body, Span span)
        -> Block;
    auto build_list(const DirectiveHead& head, std::span<const Line> body, Span span) -> Block;
    auto build_table(std::span<const Line> body, Span span) -> Block;
    auto build_footnotes(std::span<const Line> body, Span span) -> Block;

    auto table_row(const Line& line, std::size_t columns, bool header) -> TableRow;
    auto inlines(const SourceText& src) const -> Inlines {
        return parse_inlines(src, inline_options_);
    }

    auto enabled(Module m) const -> bool;

    Diagnostics& diag_;
    Profile profile_;
    InlineOptions inline_options_;
    std::vector<Module> modules_;
};

}  // namespace litedoc_cpp::detail
