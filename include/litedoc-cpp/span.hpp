/// @file span.hpp
/// @brief Byte-offset spans and offset-to-location mapping.

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace litedoc_cpp {

/// A half-open byte range `[start, end)` in the source buffer.
///
/// Spans are plain integers: they do not reference the buffer they were
/// produced from, so a parsed tree can outlive its input.
struct Span {
    std::uint32_t start{0};  ///< First byte covered (inclusive).
    std::uint32_t end{0};    ///< One past the last byte covered.

    constexpr Span() = default;

    /// Construct from byte offsets. `end` is clamped up to `start`.
    constexpr Span(std::uint32_t s, std::uint32_t e)
        : start{s}, end{e < s ? s : e} {}

    /// Length of the span in bytes.
    constexpr auto len() const noexcept -> std::uint32_t { return end - start; }

    constexpr auto empty() const noexcept -> bool { return start == end; }

    /// Check if a byte offset falls inside the span.
    constexpr auto contains(std::uint32_t offset) const noexcept -> bool {
        return offset >= start && offset < end;
    }

    /// Check if `other` lies entirely inside the span.
    constexpr auto contains(Span other) const noexcept -> bool {
        return other.start >= start && other.end <= end;
    }

    /// The bytes of `source` covered by the span.
    constexpr auto slice(std::string_view source) const noexcept -> std::string_view {
        auto from = std::min<std::size_t>(start, source.size());
        return source.substr(from, len());
    }

    /// Smallest span covering both this span and `other`.
    constexpr auto merge(Span other) const noexcept -> Span {
        return Span{std::min(start, other.start), std::max(end, other.end)};
    }

    auto operator==(const Span&) const -> bool = default;
};

/// Build a span from `std::size_t` offsets.
constexpr auto make_span(std::size_t start, std::size_t end) noexcept -> Span {
    return Span{static_cast<std::uint32_t>(start), static_cast<std::uint32_t>(end)};
}

/// A 1-based line/column position.
struct SourceLocation {
    std::size_t line{1};    ///< 1-based line number.
    std::size_t column{1};  ///< 1-based byte column.

    auto operator==(const SourceLocation&) const -> bool = default;
};

/// Maps byte offsets of a buffer to line/column locations.
///
/// The index records where every line begins; lookups are a binary
/// search. Only the line starts are stored, not the text.
///
/// @code
/// auto index = LineIndex{"a\nbc"};
/// auto loc = index.locate(3);  // {line 2, column 2}
/// @endcode
class LineIndex {
public:
    explicit LineIndex(std::string_view text);

    /// Location of a byte offset. Offsets past the end map to the end.
    auto locate(std::uint32_t offset) const -> SourceLocation;

    /// Location of the start of a span.
    auto locate(Span span) const -> SourceLocation { return locate(span.start); }

    /// Number of lines (a trailing newline does not open a new line).
    auto line_count() const noexcept -> std::size_t { return line_starts_.size(); }

    /// Byte offset at which a 1-based line begins.
    auto line_start(std::size_t line) const -> std::uint32_t;

private:
    std::vector<std::uint32_t> line_starts_;
    std::uint32_t size_;
};

}  // namespace litedoc_cpp
