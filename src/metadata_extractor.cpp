#include "metadata_extractor.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace litedoc_cpp::detail {

namespace {

constexpr auto open_delimiter = std::string_view{"--- meta ---"};
constexpr auto close_delimiter = std::string_view{"---"};

auto is_key_char(char c) -> bool {
    return is_ascii_alnum(c) || c == '_' || c == '-' || c == '.';
}

auto looks_like_entry(std::string_view text) -> bool {
    auto colon = text.find(':');
    if (colon == std::string_view::npos) return false;
    auto key = trim(text.substr(0, colon));
    return !key.empty() && std::ranges::all_of(key, is_key_char);
}

// Split a list body on top-level commas. Quotes and nested brackets are
// respected; nullopt if either is left open.
auto split_list(std::string_view body) -> std::optional<std::vector<std::string_view>> {
    auto items = std::vector<std::string_view>{};
    auto depth = std::size_t{0};
    auto quote = '\0';
    auto start = std::size_t{0};
    for (std::size_t i = 0; i < body.size(); ++i) {
        auto c = body[i];
        if (quote != '\0') {
            if (c == quote) quote = '\0';
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '[') {
            ++depth;
        } else if (c == ']') {
            if (depth == 0) return std::nullopt;
            --depth;
        } else if (c == ',' && depth == 0) {
            items.push_back(body.substr(start, i - start));
            start = i + 1;
        }
    }
    if (quote != '\0' || depth != 0) return std::nullopt;
    items.push_back(body.substr(start));
    return items;
}

auto all_digits(std::string_view s) -> bool {
    return !s.empty() && std::ranges::all_of(s, [](char c) { return is_ascii_digit(c); });
}

auto parse_integer(std::string_view s) -> std::optional<std::int64_t> {
    if (!s.empty() && s.front() == '+') s.remove_prefix(1);
    auto digits = (!s.empty() && s.front() == '-') ? s.substr(1) : s;
    if (!all_digits(digits)) return std::nullopt;
    auto value = std::int64_t{0};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

auto parse_float(std::string_view s) -> std::optional<double> {
    if (!s.empty() && s.front() == '+') s.remove_prefix(1);
    auto unsigned_part = (!s.empty() && s.front() == '-') ? s.substr(1) : s;
    auto dot = unsigned_part.find('.');
    if (dot == std::string_view::npos) return std::nullopt;
    if (!all_digits(unsigned_part.substr(0, dot)) || !all_digits(unsigned_part.substr(dot + 1))) {
        return std::nullopt;
    }
    auto value = 0.0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

void read_entry(const Line& line, Metadata& metadata, Diagnostics& diag) {
    auto colon = line.text.find(':');
    if (colon == std::string_view::npos) {
        diag.report(ParseErrorKind::malformed_metadata, line.trim_start().trim_end().span(),
                    "metadata line is not of the form `key: value`");
        return;
    }
    auto key = trim(line.text.substr(0, colon));
    if (key.empty()) {
        diag.report(ParseErrorKind::malformed_metadata, line.trim_start().trim_end().span(),
                    "metadata entry has an empty key");
        return;
    }

    auto raw = line.drop(colon + 1).trim_start().trim_end();
    auto value = parse_meta_value(raw.text);
    if (!value) {
        auto span = raw.text.empty() ? line.trim_start().trim_end().span() : raw.span();
        diag.report(ParseErrorKind::malformed_metadata, span,
                    "metadata value for `" + std::string{key} + "` does not parse");
        value = MetaValue{std::string{raw.text}};
    }
    metadata.set(std::string{key}, std::move(*value));
}

}  // namespace

auto parse_meta_value(std::string_view raw) -> std::optional<MetaValue> {
    auto v = trim(raw);
    if (v.empty()) return std::nullopt;

    auto front = v.front();
    if (front == '"' || front == '\'') {
        if (v.size() < 2 || v.back() != front) return std::nullopt;
        auto inner = v.substr(1, v.size() - 2);
        if (inner.find(front) != std::string_view::npos) return std::nullopt;
        return MetaValue{std::string{inner}};
    }

    if (front == '[') {
        if (v.back() != ']') return std::nullopt;
        auto body = trim(v.substr(1, v.size() - 2));
        auto list = MetaList{};
        if (body.empty()) return MetaValue{std::move(list)};
        auto items = split_list(body);
        if (!items) return std::nullopt;
        for (auto item : *items) {
            auto parsed = parse_meta_value(item);
            if (!parsed) return std::nullopt;
            list.push_back(std::move(*parsed));
        }
        return MetaValue{std::move(list)};
    }

    if (v == "true") return MetaValue{true};
    if (v == "false") return MetaValue{false};
    if (auto i = parse_integer(v)) return MetaValue{*i};
    if (auto d = parse_float(v)) return MetaValue{*d};
    return MetaValue{std::string{v}};
}

auto extract_metadata(std::span<const Line> lines, std::size_t first,
                      Diagnostics& diag) -> std::optional<MetadataSection> {
    if (first >= lines.size()) return std::nullopt;
    const auto& open = lines[first];
    if (trim_end(open.text) != open_delimiter) return std::nullopt;

    auto section = MetadataSection{Metadata{}, lines.size()};
    auto last_end = open.end();
    auto closed = false;
    auto i = first + 1;
    for (; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (line.trimmed() == close_delimiter) {
            last_end = line.end();
            closed = true;
            ++i;
            break;
        }
        if (line.is_blank()) {
            // Blank lines are skipped only while more front matter follows.
            auto j = i + 1;
            while (j < lines.size() && lines[j].is_blank()) ++j;
            if (j < lines.size() &&
                (lines[j].trimmed() == close_delimiter || looks_like_entry(lines[j].text))) {
                continue;
            }
            break;
        }
        last_end = line.end();
        read_entry(line, section.metadata, diag);
    }

    if (!closed) {
        diag.report(ParseErrorKind::malformed_metadata, Span{open.offset, last_end},
                    "front matter is missing its closing `---`");
    }
    section.metadata.span = Span{open.offset, last_end};
    section.next_line = i;
    return section;
}

}  // namespace litedoc_cpp::detail
