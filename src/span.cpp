#include <litedoc-cpp/span.hpp>

#include <stdexcept>
#include <string>

namespace litedoc_cpp {

LineIndex::LineIndex(std::string_view text)
    : size_{static_cast<std::uint32_t>(text.size())} {
    line_starts_.push_back(0);
    for (std::size_t i = 0; i + 1 < text.size(); ++i) {
        if (text[i] == '\n') line_starts_.push_back(static_cast<std::uint32_t>(i + 1));
    }
}

auto LineIndex::locate(std::uint32_t offset) const -> SourceLocation {
    offset = std::min(offset, size_);
    auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
    --it;
    return SourceLocation{static_cast<std::size_t>(it - line_starts_.begin()) + 1,
                          static_cast<std::size_t>(offset - *it) + 1};
}

auto LineIndex::line_start(std::size_t line) const -> std::uint32_t {
    if (line == 0 || line > line_starts_.size()) {
        throw std::out_of_range{"line " + std::to_string(line) + " is out of range"};
    }
    return line_starts_[line - 1];
}

}  // namespace litedoc_cpp
