#pragma once

// Logical text assembled from one or more source lines, with a map back
// to buffer offsets. Leaf blocks hand one of these to the inline parser
// so that inline spans stay byte-accurate even when the text was
// stitched together from dedented or prefix-stripped lines.
// Internal header -- not installed.

#include "lexer.hpp"

#include <litedoc-cpp/span.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace litedoc_cpp::detail {

class SourceText {
public:
    SourceText() = default;

    /// A single contiguous slice of the buffer.
    static auto from(std::string_view text, std::uint32_t offset) -> SourceText {
        auto src = SourceText{};
        src.append(text, offset);
        return src;
    }

    /// Lines joined by '\n'. Continuation lines lose their indentation and
    /// the last line loses trailing whitespace; inner trailing whitespace
    /// is kept so the inline parser can detect hard breaks.
    static auto from_lines(std::span<const Line> lines) -> SourceText {
        auto src = SourceText{};
        for (std::size_t i = 0; i < lines.size(); ++i) {
            auto line = lines[i].trim_start();
            if (i + 1 == lines.size()) line = line.trim_end();
            if (i > 0) src.append_newline(lines[i - 1].end());
            src.append(line.text, line.offset);
        }
        return src;
    }

    void append(std::string_view text, std::uint32_t offset) {
        if (text.empty()) {
            if (pieces_.empty()) end_offset_ = offset;
            return;
        }
        pieces_.push_back(Piece{text_.size(), offset});
        text_.append(text);
        end_offset_ = offset + static_cast<std::uint32_t>(text.size());
    }

    /// Append a '\n' that stands for the line terminator at `offset`.
    void append_newline(std::uint32_t offset) {
        pieces_.push_back(Piece{text_.size(), offset});
        text_.push_back('\n');
        end_offset_ = offset + 1;
    }

    auto text() const noexcept -> std::string_view { return text_; }
    auto size() const noexcept -> std::size_t { return text_.size(); }
    auto empty() const noexcept -> bool { return text_.empty(); }

    /// Buffer offset of logical index `i` (`i == size()` maps past the end).
    auto offset_of(std::size_t i) const -> std::uint32_t {
        if (i >= text_.size() || pieces_.empty()) return end_offset_;
        auto it = std::upper_bound(pieces_.begin(), pieces_.end(), i,
            [](std::size_t idx, const Piece& p) { return idx < p.logical; });
        --it;
        return it->source + static_cast<std::uint32_t>(i - it->logical);
    }

    /// Buffer span of the logical range `[begin, end)`.
    auto span_of(std::size_t begin, std::size_t end) const -> Span {
        auto start = offset_of(begin);
        if (end <= begin) return Span{start, start};
        return Span{start, offset_of(end - 1) + 1};
    }

private:
    struct Piece {
        std::size_t logical;   // index into text_
        std::uint32_t source;  // buffer offset of text_[logical]
    };

    std::string text_;
    std::vector<Piece> pieces_;
    std::uint32_t end_offset_{0};
};

}  // namespace litedoc_cpp::detail
