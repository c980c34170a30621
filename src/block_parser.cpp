#include "block_parser.hpp"

#include <algorithm>
#include <charconv>
#include <string>
#include <utility>

namespace litedoc_cpp::detail {

namespace {

// =============================================================================
// Line classification
// =============================================================================

auto trimmed_span(const Line& line) -> Span {
    return line.trim_start().trim_end().span();
}

auto count_run(std::string_view text, char c) -> std::size_t {
    auto n = std::size_t{0};
    while (n < text.size() && text[n] == c) ++n;
    return n;
}

struct Fence {
    std::size_t ticks;
    std::string_view lang;
};

// ```lang
auto code_fence(std::string_view t) -> std::optional<Fence> {
    auto ticks = count_run(t, '`');
    if (ticks < 3) return std::nullopt;
    auto info = trim(t.substr(ticks));
    if (info.find('`') != std::string_view::npos) return std::nullopt;
    auto word_end = std::ranges::find_if(info, [](char c) { return is_space(c); }) - info.begin();
    return Fence{ticks, info.substr(0, static_cast<std::size_t>(word_end))};
}

auto closes_fence(std::string_view t, std::size_t ticks) -> bool {
    t = trim(t);
    return t.size() >= ticks && count_run(t, '`') == t.size();
}

// `$$` alone, or `$$ content $$` on one line.
auto math_fence(std::string_view t) -> bool {
    t = trim(t);
    return t == "$$" || (t.size() >= 4 && t.starts_with("$$") && t.ends_with("$$"));
}

auto is_name_char(char c) -> bool {
    return is_ascii_alnum(c) || c == '_' || c == '-';
}

// End of the name in `::name ...`, or 0 if `t` is not a directive opener.
auto directive_name_end(std::string_view t) -> std::size_t {
    if (t.size() < 3 || !t.starts_with("::") || !is_ascii_alpha(t[2])) return 0;
    auto k = std::size_t{3};
    while (k < t.size() && is_name_char(t[k])) ++k;
    if (k < t.size() && !is_space(t[k])) return 0;
    return k;
}

auto is_directive_open(std::string_view t) -> bool { return directive_name_end(t) != 0; }

auto is_directive_close(std::string_view t) -> bool { return trim(t) == "::"; }

// Number of leading '#' if the line is an ATX heading, else 0.
auto heading_hashes(std::string_view t) -> std::size_t {
    auto n = count_run(t, '#');
    if (n == 0) return 0;
    if (n < t.size() && !is_space(t[n])) return 0;
    return n;
}

auto is_thematic_break(std::string_view t) -> bool {
    t = trim(t);
    if (t.empty() || (t[0] != '-' && t[0] != '*' && t[0] != '_')) return false;
    auto marker = t[0];
    auto count = std::size_t{0};
    for (auto c : t) {
        if (c == marker) {
            ++count;
        } else if (!is_space(c)) {
            return false;
        }
    }
    return count >= 3;
}

struct ListMarker {
    ListKind kind;
    std::optional<std::uint64_t> number;
    std::size_t content_column;  ///< Column of the item's text within the line.
    bool overlong;               ///< More than nine digits.
};

auto list_marker(const Line& line) -> std::optional<ListMarker> {
    auto indent = line.indent();
    auto t = line.text.substr(indent);
    if (t.empty()) return std::nullopt;

    auto marker = ListMarker{ListKind::unordered, std::nullopt, 0, false};
    auto width = std::size_t{0};
    if (t[0] == '-' || t[0] == '*' || t[0] == '+') {
        width = 1;
    } else {
        auto digits = std::size_t{0};
        while (digits < t.size() && is_ascii_digit(t[digits])) ++digits;
        if (digits == 0 || digits >= t.size() || (t[digits] != '.' && t[digits] != ')')) {
            return std::nullopt;
        }
        marker.kind = ListKind::ordered;
        marker.overlong = digits > 9;
        if (!marker.overlong) {
            auto number = std::uint64_t{0};
            auto [ptr, ec] = std::from_chars(t.data(), t.data() + digits, number);
            if (ec == std::errc{}) marker.number = number;
        }
        width = digits + 1;
    }

    auto after = t.substr(width);
    if (!after.empty() && !is_space(after[0])) return std::nullopt;
    auto spaces = after.size() - trim_start(after).size();
    if (trim_start(after).empty() || spaces > 4) spaces = 1;
    marker.content_column = indent + width + spaces;
    return marker;
}

auto is_table_row(std::string_view t) -> bool { return trim(t).starts_with('|'); }

auto is_separator_row(std::string_view t) -> bool {
    t = trim(t);
    if (!t.starts_with('|')) return false;
    t.remove_prefix(1);
    if (t.ends_with('|')) t.remove_suffix(1);
    if (t.empty()) return false;
    auto start = std::size_t{0};
    while (start <= t.size()) {
        auto bar = t.find('|', start);
        auto cell = trim(t.substr(start, bar == std::string_view::npos ? t.npos : bar - start));
        if (cell.starts_with(':')) cell.remove_prefix(1);
        if (cell.ends_with(':')) cell.remove_suffix(1);
        if (cell.empty() || count_run(cell, '-') != cell.size()) return false;
        if (bar == std::string_view::npos) break;
        start = bar + 1;
    }
    return true;
}

// `<tag`, `</tag`, `<!--`, `<?`. Autolinks such as `<https://...>` do not count.
auto html_start(std::string_view t) -> bool {
    if (t.size() < 2 || t[0] != '<') return false;
    if (t[1] == '!' || t[1] == '?') return true;
    auto k = std::size_t{t[1] == '/' ? 2u : 1u};
    if (k >= t.size() || !is_ascii_alpha(t[k])) return false;
    while (k < t.size() && (is_ascii_alnum(t[k]) || t[k] == '-')) ++k;
    return k == t.size() || is_space(t[k]) || t[k] == '>' || t[k] == '/';
}

auto quote_content(const Line& line) -> Line {
    auto content = line.trim_start().drop(1);
    if (!content.text.empty() && content.text[0] == ' ') content = content.drop(1);
    return content;
}

// `[^id]: text` -> (id, text line)
auto footnote_def(const Line& t) -> std::optional<std::pair<std::string_view, Line>> {
    if (!t.text.starts_with("[^")) return std::nullopt;
    auto close = t.text.find("]:");
    if (close == std::string_view::npos || close == 2) return std::nullopt;
    auto id = t.text.substr(2, close - 2);
    if (std::ranges::any_of(id, [](char c) { return is_space(c) || c == '[' || c == ']'; })) {
        return std::nullopt;
    }
    return std::pair{id, t.drop(close + 2).trim_start()};
}

// Cells of a pipe row, each trimmed, with buffer offsets.
auto split_cells(const Line& line) -> std::vector<Line> {
    auto row = line.trim_start().trim_end();
    if (row.text.starts_with('|')) row = row.drop(1);
    auto n = row.text.size();
    if (n > 0 && row.text[n - 1] == '|' && !(n >= 2 && row.text[n - 2] == '\\')) {
        row = Line{row.text.substr(0, n - 1), row.offset};
    }

    auto cells = std::vector<Line>{};
    auto start = std::size_t{0};
    auto in_code = false;
    for (std::size_t k = 0; k < row.text.size(); ++k) {
        auto c = row.text[k];
        if (c == '\\') {
            ++k;
        } else if (c == '`') {
            in_code = !in_code;
        } else if (c == '|' && !in_code) {
            cells.push_back(Line{row.text.substr(start, k - start),
                                 row.offset + static_cast<std::uint32_t>(start)}
                                .trim_start().trim_end());
            start = k + 1;
        }
    }
    cells.push_back(Line{row.text.substr(std::min(start, row.text.size())),
                         row.offset + static_cast<std::uint32_t>(start)}
                        .trim_start().trim_end());
    return cells;
}

auto dedent_all(std::span<const Line> lines, std::size_t n) -> std::vector<Line> {
    auto out = std::vector<Line>{};
    out.reserve(lines.size());
    for (const auto& line : lines) out.push_back(line.dedent(n));
    return out;
}

auto join_lines(std::span<const Line> lines) -> std::string {
    auto out = std::string{};
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out.push_back('\n');
        out.append(lines[i].text);
    }
    return out;
}

// End offset of the last non-blank line in lines[begin, end), or `fallback`.
auto last_content_end(std::span<const Line> lines, std::size_t begin, std::size_t end,
                      std::uint32_t fallback) -> std::uint32_t {
    for (auto k = end; k > begin; --k) {
        if (!lines[k - 1].is_blank()) return lines[k - 1].trim_end().end();
    }
    return fallback;
}

}  // namespace

// =============================================================================
// DirectiveHead
// =============================================================================

auto DirectiveHead::find(std::string_view key) const -> const DirectiveAttribute* {
    auto it = std::ranges::find_if(attributes, [&](const DirectiveAttribute& a) {
        return !a.flag && a.key == key;
    });
    return it == attributes.end() ? nullptr : &*it;
}

auto DirectiveHead::has_flag(std::string_view flag_name) const -> bool {
    return std::ranges::any_of(attributes, [&](const DirectiveAttribute& a) {
        return a.flag && a.key == flag_name;
    });
}

auto parse_directive_head(const Line& line) -> std::optional<DirectiveHead> {
    auto t = line.trim_start().trim_end();
    auto text = t.text;
    auto k = directive_name_end(text);
    if (k == 0) return std::nullopt;

    auto head = DirectiveHead{text.substr(2, k - 2), {}, line.indent(), t.span()};
    while (k < text.size()) {
        while (k < text.size() && is_space(text[k])) ++k;
        if (k == text.size()) break;

        auto key_start = k;
        while (k < text.size() && !is_space(text[k]) && text[k] != '=') ++k;
        auto key = text.substr(key_start, k - key_start);
        if (k == text.size() || text[k] != '=') {
            head.attributes.push_back(DirectiveAttribute{key, {}, 0, true});
            continue;
        }

        ++k;
        auto value_start = k;
        auto value_end = k;
        if (k < text.size() && text[k] == '"') {
            value_start = k + 1;
            auto close = text.find('"', value_start);
            value_end = close == std::string_view::npos ? text.size() : close;
            k = close == std::string_view::npos ? text.size() : close + 1;
        } else {
            while (k < text.size() && !is_space(text[k])) ++k;
            value_end = k;
        }
        head.attributes.push_back(DirectiveAttribute{
            key, text.substr(value_start, value_end - value_start),
            t.offset + static_cast<std::uint32_t>(value_start), false});
    }
    return head;
}

// =============================================================================
// Block dispatch
// =============================================================================

auto BlockParser::parse_blocks(std::span<const Line> lines) -> Blocks {
    auto out = Blocks{};
    auto i = std::size_t{0};
    while (i < lines.size()) {
        if (lines[i].is_blank()) {
            ++i;
            continue;
        }
        i = parse_block(lines, i, out);
    }
    return out;
}

auto BlockParser::parse_block(std::span<const Line> lines, std::size_t i, Blocks& out)
    -> std::size_t {
    const auto& line = lines[i];
    auto t = line.trim_start().text;

    if (code_fence(t)) return parse_code_fence(lines, i, out);
    if (recognizes(profile_, Construct::math_fence) && math_fence(t)) {
        return parse_math_fence(lines, i, out);
    }
    if (is_directive_open(t)) return parse_directive(lines, i, out);
    if (is_directive_close(t)) {
        auto span = trimmed_span(line);
        if (support(profile_, Construct::directive) != Support::raw) {
            diag_.report(ParseErrorKind::unknown_directive, span,
                         "`::` does not close any open directive");
        }
        out.push_back(Block{RawBlock{{}, {}, span}});
        return i + 1;
    }
    if (auto hashes = heading_hashes(t)) {
        parse_heading(line, hashes, out);
        return i + 1;
    }
    if (is_thematic_break(t)) {
        out.push_back(Block{ThematicBreak{trimmed_span(line)}});
        return i + 1;
    }
    if (t.starts_with('>')) return parse_quote(lines, i, out);
    if (auto marker = list_marker(line)) {
        if (!marker->overlong) return parse_list(lines, i, out);
        diag_.report(ParseErrorKind::invalid_list_marker, trimmed_span(line),
                     "ordered list marker has more than nine digits");
        return parse_paragraph(lines, i, out);
    }
    if (starts_table(lines, i)) return parse_pipe_table(lines, i, out);
    if (recognizes(profile_, Construct::html_block) && html_start(t)) {
        return parse_html(lines, i, out);
    }
    return parse_paragraph(lines, i, out);
}

auto BlockParser::starts_table(std::span<const Line> lines, std::size_t i) const -> bool {
    return i + 1 < lines.size() && is_table_row(lines[i].text) &&
           is_separator_row(lines[i + 1].text);
}

auto BlockParser::interrupts_paragraph(std::span<const Line> lines, std::size_t i) const
    -> bool {
    auto t = lines[i].trim_start().text;
    if (code_fence(t) || is_directive_open(t) || is_directive_close(t) ||
        heading_hashes(t) != 0 || is_thematic_break(t) || t.starts_with('>')) {
        return true;
    }
    if (recognizes(profile_, Construct::math_fence) && math_fence(t)) return true;
    if (auto marker = list_marker(lines[i]); marker && !marker->overlong) return true;
    if (starts_table(lines, i)) return true;
    return recognizes(profile_, Construct::html_block) && html_start(t);
}

// =============================================================================
// Leaf blocks
// =============================================================================

auto BlockParser::parse_paragraph(std::span<const Line> lines, std::size_t i, Blocks& out)
    -> std::size_t {
    auto j = i + 1;
    while (j < lines.size() && !lines[j].is_blank() && !interrupts_paragraph(lines, j)) ++j;

    auto body = lines.subspan(i, j - i);
    auto span = Span{body.front().trim_start().offset, body.back().trim_end().end()};
    out.push_back(Block{Paragraph{inlines(SourceText::from_lines(body)), span}});
    return j;
}

void BlockParser::parse_heading(const Line& line, std::size_t hashes, Blocks& out) {
    auto span = trimmed_span(line);
    auto body = line.trim_start().drop(hashes).trim_start().trim_end();

    // Optional closing sequence: `## Title ##`
    auto text = body.text;
    auto k = text.size();
    while (k > 0 && text[k - 1] == '#') --k;
    if (k < text.size() && (k == 0 || is_space(text[k - 1]))) {
        body = Line{trim_end(text.substr(0, k)), body.offset};
    }

    auto level = hashes;
    if (level > 6) {
        diag_.report(ParseErrorKind::invalid_heading_level, span,
                     "heading level " + std::to_string(level) + " exceeds the maximum of 6");
        level = 6;
    }
    out.push_back(Block{Heading{static_cast<std::uint8_t>(level),
                                inlines(SourceText::from(body.text, body.offset)), span}});
}

auto BlockParser::parse_code_fence(std::span<const Line> lines, std::size_t i, Blocks& out)
    -> std::size_t {
    const auto& open = lines[i];
    auto fence = *code_fence(open.trim_start().text);

    auto j = i + 1;
    while (j < lines.size() && !closes_fence(lines[j].text, fence.ticks)) ++j;
    auto closed = j < lines.size();

    auto body = dedent_all(lines.subspan(i + 1, j - i - 1), open.indent());
    auto end = closed ? lines[j].trim_end().end()
                      : last_content_end(lines, i + 1, j, open.trim_end().end());
    auto span = Span{open.trim_start().offset, end};
    if (!closed) {
        diag_.report(ParseErrorKind::unterminated_container, span, "code fence is never closed");
    }

    auto lang = fence.lang.empty() ? std::nullopt : std::optional<std::string>{fence.lang};
    out.push_back(Block{CodeBlock{std::move(lang), join_lines(body), span}});
    return closed ? j + 1 : j;
}

auto BlockParser::parse_math_fence(std::span<const Line> lines, std::size_t i, Blocks& out)
    -> std::size_t {
    const auto& open = lines[i];
    auto t = open.trimmed();
    if (t != "$$") {
        auto content = trim(t.substr(2, t.size() - 4));
        out.push_back(Block{MathBlock{std::string{content}, true, trimmed_span(open)}});
        return i + 1;
    }

    auto j = i + 1;
    while (j < lines.size() && lines[j].trimmed() != "$$") ++j;
    auto closed = j < lines.size();

    auto body = dedent_all(lines.subspan(i + 1, j - i - 1), open.indent());
    auto end = closed ? lines[j].trim_end().end()
                      : last_content_end(lines, i + 1, j, open.trim_end().end());
    auto span = Span{open.trim_start().offset, end};
    if (!closed) {
        diag_.report(ParseErrorKind::unterminated_container, span, "math fence is never closed");
    }
    out.push_back(Block{MathBlock{join_lines(body), true, span}});
    return closed ? j + 1 : j;
}

auto BlockParser::parse_html(std::span<const Line> lines, std::size_t i, Blocks& out)
    -> std::size_t {
    auto j = i;
    while (j < lines.size() && !lines[j].is_blank()) ++j;
    auto body = lines.subspan(i, j - i);
    auto span = Span{body.front().trim_start().offset, body.back().trim_end().end()};
    out.push_back(Block{HtmlBlock{join_lines(body), span}});
    return j;
}

auto BlockParser::parse_pipe_table(std::span<const Line> lines, std::size_t i, Blocks& out)
    -> std::size_t {
    auto columns = split_cells(lines[i]).size();
    auto table = Table{};
    table.rows.push_back(table_row(lines[i], columns, true));

    auto j = i + 2;
    while (j < lines.size() && is_table_row(lines[j].text)) {
        table.rows.push_back(table_row(lines[j], columns, false));
        ++j;
    }
    table.span = Span{lines[i].trim_start().offset, lines[j - 1].trim_end().end()};
    out.push_back(Block{std::move(table)});
    return j;
}

auto BlockParser::table_row(const Line& line, std::size_t columns, bool header) -> TableRow {
    auto cells = split_cells(line);
    auto span = trimmed_span(line);
    if (cells.size() != columns) {
        diag_.report_if_strict(ParseErrorKind::malformed_table, span,
                               "table row has " + std::to_string(cells.size()) +
                               " cells, expected " + std::to_string(columns));
    }

    auto row = TableRow{{}, header, span};
    for (std::size_t k = 0; k < cells.size() && k < columns; ++k) {
        row.cells.push_back(TableCell{inlines(SourceText::from(cells[k].text, cells[k].offset)),
                                      cells[k].span()});
    }
    while (row.cells.size() < columns) {
        row.cells.push_back(TableCell{{}, Span{span.end, span.end}});
    }
    return row;
}

// =============================================================================
// Containers
// =============================================================================

auto BlockParser::parse_quote(std::span<const Line> lines, std::size_t i, Blocks& out)
    -> std::size_t {
    auto body = std::vector<Line>{};
    auto j = i;
    while (j < lines.size()) {
        const auto& line = lines[j];
        if (line.trim_start().text.starts_with('>')) {
            body.push_back(quote_content(line));
            ++j;
            continue;
        }
        // Lazy continuation of a quoted paragraph.
        if (!line.is_blank() && !body.back().is_blank() && !interrupts_paragraph(lines, j)) {
            body.push_back(line.trim_start());
            ++j;
            continue;
        }
        break;
    }

    auto span = Span{lines[i].trim_start().offset, lines[j - 1].trim_end().end()};
    auto guard = diag_.enter(span);
    out.push_back(Block{Quote{parse_blocks(body), span}});
    return j;
}

auto BlockParser::collect_item(std::span<const Line> lines, std::size_t i,
                               bool allow_lazy) const -> ItemLines {
    const auto& line = lines[i];
    auto marker = *list_marker(line);

    auto item = ItemLines{};
    item.start = line.trim_start().offset;
    item.lines.push_back(line.drop(marker.content_column));

    auto last = i;
    auto j = i + 1;
    while (j < lines.size()) {
        const auto& next = lines[j];
        if (next.is_blank()) {
            ++j;
            continue;
        }
        if (next.indent() >= marker.content_column) {
            for (auto k = last + 1; k < j; ++k) {
                item.lines.push_back(lines[k].dedent(marker.content_column));
            }
            item.lines.push_back(next.dedent(marker.content_column));
            last = j++;
            continue;
        }
        if (allow_lazy && last + 1 == j && !item.lines.back().is_blank() &&
            !interrupts_paragraph(lines, j)) {
            item.lines.push_back(next.trim_start());
            last = j++;
            continue;
        }
        break;
    }

    item.end = lines[last].trim_end().end();
    item.next = last + 1;
    return item;
}

auto BlockParser::finish_item(const ItemLines& item) -> ListItem {
    auto span = Span{item.start, item.end};
    auto guard = diag_.enter(span);
    return ListItem{parse_blocks(item.lines), span};
}

auto BlockParser::parse_list(std::span<const Line> lines, std::size_t i, Blocks& out)
    -> std::size_t {
    auto first = *list_marker(lines[i]);
    auto list = List{first.kind, first.kind == ListKind::ordered ? first.number : std::nullopt,
                     {}, {}};

    auto j = i;
    while (true) {
        auto item = collect_item(lines, j, true);
        list.items.push_back(finish_item(item));
        j = item.next;

        // Blank lines between items do not end the list.
        auto k = j;
        while (k < lines.size() && lines[k].is_blank()) ++k;
        if (k == lines.size() || is_thematic_break(lines[k].text)) break;
        auto marker = list_marker(lines[k]);
        if (!marker || marker->overlong || marker->kind != first.kind) break;
        j = k;
    }

    list.span = Span{list.items.front().span.start, list.items.back().span.end};
    out.push_back(Block{std::move(list)});
    return j;
}

// =============================================================================
// Directives
// =============================================================================

auto BlockParser::find_close(std::span<const Line> lines, std::size_t open,
                             std::size_t indent) const -> Extent {
    auto depth = std::size_t{0};
    auto fence_ticks = std::optional<std::size_t>{};
    auto in_math = false;
    auto math = recognizes(profile_, Construct::math_fence);

    for (auto j = open + 1; j < lines.size(); ++j) {
        const auto& line = lines[j];
        if (line.is_blank()) continue;

        auto t = line.trim_start().text;
        if (!fence_ticks && !in_math && depth == 0 && is_directive_close(t)) {
            return Extent{j, true};
        }
        if (line.indent() < indent) return Extent{j, false};
        if (fence_ticks) {
            if (closes_fence(t, *fence_ticks)) fence_ticks.reset();
            continue;
        }
        if (in_math) {
            if (trim(t) == "$$") in_math = false;
            continue;
        }
        if (auto fence = code_fence(t)) {
            fence_ticks = fence->ticks;
        } else if (math && trim(t) == "$$") {
            in_math = true;
        } else if (is_directive_close(t)) {
            if (depth == 0) return Extent{j, true};
            --depth;
        } else if (is_directive_open(t)) {
            ++depth;
        }
    }
    return Extent{lines.size(), false};
}

auto BlockParser::parse_directive(std::span<const Line> lines, std::size_t i, Blocks& out)
    -> std::size_t {
    auto head = *parse_directive_head(lines[i]);
    auto extent = find_close(lines, i, head.indent);

    auto body = dedent_all(lines.subspan(i + 1, extent.end - i - 1), head.indent);
    auto end = extent.closed ? lines[extent.end].trim_end().end()
                             : last_content_end(lines, i + 1, extent.end, head.span.end);
    auto span = Span{head.span.start, end};
    if (!extent.closed) {
        diag_.report(ParseErrorKind::unterminated_container, span,
                     "directive `::" + std::string{head.name} + "` is never closed");
    }

    auto guard = diag_.enter(span);
    out.push_back(build_directive(head, body, span));
    return extent.closed ? extent.end + 1 : extent.end;
}

auto BlockParser::build_directive(const DirectiveHead& head, std::span<const Line> body,
                                  Span span) -> Block {
    auto name = std::string{head.name};
    auto mode = support(profile_, Construct::directive);
    if (mode == Support::raw) {
        return Block{RawBlock{std::move(name), join_lines(body), span}};
    }
    if (mode != Support::native) {
        diag_.report(ParseErrorKind::unknown_directive, head.span,
                     "directive `::" + name + "` is not allowed under the " +
                     std::string{to_string_view(profile_)} + " profile");
        return Block{RawBlock{std::move(name), join_lines(body), span}};
    }

    if (name == "list") return build_list(head, body, span);
    if (name == "table") return build_table(body, span);
    if (name == "footnotes") return build_footnotes(body, span);
    if (name == "callout") {
        const auto* type = head.find("type");
        const auto* title = head.find("title");
        return Block{Callout{
            type ? std::string{type->value} : std::string{"note"},
            title ? std::optional<std::string>{title->value} : std::nullopt,
            parse_blocks(body), span}};
    }
    if (name == "quote") return Block{Quote{parse_blocks(body), span}};
    if (name == "figure") {
        const auto* src = head.find("src");
        const auto* alt = head.find("alt");
        const auto* caption = head.find("caption");
        auto figure = Figure{};
        figure.src = src ? std::string{src->value} : std::string{};
        figure.alt = alt ? std::string{alt->value} : std::string{};
        if (caption) figure.caption = inlines(SourceText::from(caption->value, caption->value_offset));
        figure.blocks = parse_blocks(body);
        figure.span = span;
        return Block{std::move(figure)};
    }
    if (name == "math") {
        auto display = head.has_flag("display") || head.has_flag("block");
        return Block{MathBlock{join_lines(body), display, span}};
    }
    if (name == "html") {
        if (!enabled(Module::html)) {
            return Block{RawBlock{std::move(name), join_lines(body), span}};
        }
        return Block{HtmlBlock{join_lines(body), span}};
    }

    diag_.report(ParseErrorKind::unknown_directive, head.span,
                 "unknown directive `::" + name + "`");
    return Block{RawBlock{std::move(name), join_lines(body), span}};
}

auto BlockParser::enabled(Module m) const -> bool {
    return std::ranges::find(modules_, m) != modules_.end();
}

auto BlockParser::build_list(const DirectiveHead& head, std::span<const Line> body, Span span)
    -> Block {
    auto kind = std::optional<ListKind>{};
    if (head.has_flag("ordered")) {
        kind = ListKind::ordered;
    } else if (head.has_flag("unordered")) {
        kind = ListKind::unordered;
    }
    auto start = std::optional<std::uint64_t>{};
    if (const auto* attr = head.find("start")) {
        auto value = std::uint64_t{0};
        auto [ptr, ec] = std::from_chars(attr->value.data(),
                                         attr->value.data() + attr->value.size(), value);
        if (ec == std::errc{} && ptr == attr->value.data() + attr->value.size()) start = value;
    }

    auto list = List{};
    auto current = std::optional<ItemLines>{};
    auto flush = [&] {
        if (!current) return;
        list.items.push_back(finish_item(*current));
        current.reset();
    };

    auto i = std::size_t{0};
    while (i < body.size()) {
        const auto& line = body[i];
        if (line.is_blank()) {
            if (current) current->lines.push_back(line);
            ++i;
            continue;
        }
        auto marker = list_marker(line);
        if (marker && !marker->overlong && !is_thematic_break(line.text)) {
            flush();
            if (!kind) kind = marker->kind;
            if (list.items.empty() && !start) start = marker->number;
            current = collect_item(body, i, false);
            i = current->next;
            continue;
        }

        auto content = line.trim_start();
        // `| text` continues the current item.
        if (current && content.text.starts_with("| ")) {
            current->lines.push_back(content.drop(2));
            current->end = line.trim_end().end();
            ++i;
            continue;
        }

        diag_.report(ParseErrorKind::invalid_list_marker, trimmed_span(line),
                     "line inside `::list` is not a list item");
        if (!current) current = ItemLines{{}, content.offset, content.end(), 0};
        current->lines.push_back(content);
        current->end = line.trim_end().end();
        ++i;
    }
    flush();

    list.kind = kind.value_or(ListKind::unordered);
    list.start = list.kind == ListKind::ordered ? start : std::nullopt;
    list.span = span;
    return Block{std::move(list)};
}

auto BlockParser::build_table(std::span<const Line> body, Span span) -> Block {
    auto table = Table{{}, span};
    auto columns = std::size_t{0};
    auto have_separator = false;

    for (const auto& line : body) {
        if (line.is_blank()) continue;
        if (!is_table_row(line.text)) {
            diag_.report(ParseErrorKind::malformed_table, trimmed_span(line),
                         "line inside `::table` is not a table row");
            continue;
        }
        if (table.rows.empty()) {
            columns = split_cells(line).size();
            table.rows.push_back(table_row(line, columns, true));
            continue;
        }
        if (is_separator_row(line.text)) {
            have_separator = true;
            continue;
        }
        table.rows.push_back(table_row(line, columns, false));
    }

    if (!table.rows.empty() && !have_separator) {
        diag_.report(ParseErrorKind::malformed_table, table.rows.front().span,
                     "table has no separator row after its header");
    }
    return Block{std::move(table)};
}

auto BlockParser::build_footnotes(std::span<const Line> body, Span span) -> Block {
    struct Pending {
        std::string id;
        std::vector<Line> lines;
        std::uint32_t start;
        std::uint32_t end;
    };

    auto footnotes = Footnotes{{}, span};
    auto current = std::optional<Pending>{};
    auto flush = [&] {
        if (!current) return;
        auto def_span = Span{current->start, current->end};
        auto guard = diag_.enter(def_span);
        footnotes.defs.push_back(FootnoteDef{std::move(current->id),
                                             parse_blocks(current->lines), def_span});
        current.reset();
    };

    for (const auto& line : body) {
        if (line.is_blank()) {
            if (current) current->lines.push_back(line);
            continue;
        }
        auto t = line.trim_start();
        if (auto def = footnote_def(t)) {
            flush();
            current = Pending{std::string{def->first}, {def->second}, t.offset,
                              t.trim_end().end()};
            continue;
        }
        if (!current) {
            diag_.report(ParseErrorKind::malformed_footnote, trimmed_span(line),
                         "line inside `::footnotes` is not a footnote definition");
            continue;
        }
        current->lines.push_back(line.dedent(4));
        current->end = line.trim_end().end();
    }
    flush();
    return Block{std::move(footnotes)};
}

}  // namespace litedoc_cpp::detail
