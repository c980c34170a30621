#pragma once

// Line lexer shared by the metadata extractor and the block parser.
// Internal header -- not installed.

#include <litedoc-cpp/span.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace litedoc_cpp::detail {

constexpr auto is_space(char c) noexcept -> bool { return c == ' ' || c == '\t'; }

constexpr auto is_ascii_digit(char c) noexcept -> bool { return c >= '0' && c <= '9'; }

constexpr auto is_ascii_alpha(char c) noexcept -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

constexpr auto is_ascii_alnum(char c) noexcept -> bool {
    return is_ascii_alpha(c) || is_ascii_digit(c);
}

constexpr auto is_ascii_punct(char c) noexcept -> bool {
    return (c >= '!' && c <= '/') || (c >= ':' && c <= '@') ||
           (c >= '[' && c <= '`') || (c >= '{' && c <= '~');
}

constexpr auto trim_start(std::string_view s) noexcept -> std::string_view {
    auto i = std::size_t{0};
    while (i < s.size() && is_space(s[i])) ++i;
    return s.substr(i);
}

constexpr auto trim_end(std::string_view s) noexcept -> std::string_view {
    auto n = s.size();
    while (n > 0 && is_space(s[n - 1])) --n;
    return s.substr(0, n);
}

constexpr auto trim(std::string_view s) noexcept -> std::string_view {
    return trim_end(trim_start(s));
}

/// One source line, without its line terminator.
///
/// `offset` is the buffer offset of `text[0]`. Derived lines (dedented,
/// prefix-stripped) keep pointing into the original buffer, so spans
/// computed from them stay byte-accurate.
struct Line {
    std::string_view text;
    std::uint32_t offset{0};

    auto end() const noexcept -> std::uint32_t {
        return offset + static_cast<std::uint32_t>(text.size());
    }

    auto span() const noexcept -> Span { return Span{offset, end()}; }

    auto is_blank() const noexcept -> bool { return detail::trim_start(text).empty(); }

    /// Number of leading space/tab bytes.
    auto indent() const noexcept -> std::size_t {
        return text.size() - detail::trim_start(text).size();
    }

    auto trimmed() const noexcept -> std::string_view { return trim(text); }

    /// Drop the first `n` bytes.
    auto drop(std::size_t n) const noexcept -> Line {
        if (n > text.size()) n = text.size();
        return Line{text.substr(n), offset + static_cast<std::uint32_t>(n)};
    }

    /// Drop up to `n` leading whitespace bytes.
    auto dedent(std::size_t n) const noexcept -> Line {
        auto ws = indent();
        return drop(ws < n ? ws : n);
    }

    /// Drop all leading whitespace.
    auto trim_start() const noexcept -> Line { return drop(indent()); }

    /// Drop trailing whitespace.
    auto trim_end() const noexcept -> Line {
        return Line{detail::trim_end(text), offset};
    }
};

/// Split `text` into lines. Handles LF and CRLF; a trailing newline does
/// not produce an empty final line.
inline auto split_lines(std::string_view text) -> std::vector<Line> {
    auto lines = std::vector<Line>{};
    auto pos = std::size_t{0};
    while (pos < text.size()) {
        auto nl = text.find('\n', pos);
        auto end = (nl == std::string_view::npos) ? text.size() : nl;
        auto content_end = end;
        if (content_end > pos && text[content_end - 1] == '\r') --content_end;
        lines.push_back(Line{text.substr(pos, content_end - pos),
                             static_cast<std::uint32_t>(pos)});
        pos = (nl == std::string_view::npos) ? text.size() : nl + 1;
    }
    return lines;
}

}  // namespace litedoc_cpp::detail
