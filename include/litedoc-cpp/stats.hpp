/// @file stats.hpp
/// @brief Summary statistics over a parsed document.

#pragma once

#include <litedoc-cpp/ast.hpp>

#include <array>
#include <cstddef>
#include <string_view>

namespace litedoc_cpp {

/// Node counts and source size figures for one document.
///
/// Block and inline counts include nested nodes (list items, container
/// bodies, link labels).
struct DocumentStats {
    std::size_t total_blocks{0};
    std::array<std::size_t, 13> blocks_by_kind{};  ///< Indexed by BlockKind.
    std::size_t total_inlines{0};
    std::array<std::size_t, 10> inlines_by_kind{};  ///< Indexed by InlineKind.
    std::size_t list_items{0};
    std::size_t table_rows{0};
    std::size_t footnote_defs{0};
    std::size_t max_depth{0};        ///< Deepest block nesting; top level is 1.
    std::size_t metadata_entries{0};

    std::size_t bytes{0};
    std::size_t words{0};  ///< Whitespace-separated runs in the source.
    std::size_t lines{0};

    auto count(BlockKind kind) const -> std::size_t {
        return blocks_by_kind[static_cast<std::size_t>(kind)];
    }
    auto count(InlineKind kind) const -> std::size_t {
        return inlines_by_kind[static_cast<std::size_t>(kind)];
    }
};

/// Collect statistics for `doc`, parsed from `source`.
auto compute_stats(const Document& doc, std::string_view source) -> DocumentStats;

}  // namespace litedoc_cpp
