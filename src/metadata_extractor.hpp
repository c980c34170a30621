#pragma once

// Front matter: `--- meta ---`, `key: value` lines, `---`.
// Internal header -- not installed.

#include "diagnostics.hpp"
#include "lexer.hpp"

#include <litedoc-cpp/metadata.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>

namespace litedoc_cpp::detail {

struct MetadataSection {
    Metadata metadata;
    std::size_t next_line;  ///< Index of the first line after the section.
};

/// Parse a scalar or list value. nullopt means the value is malformed.
auto parse_meta_value(std::string_view raw) -> std::optional<MetaValue>;

/// Extract front matter starting at `lines[first]`. Returns nullopt,
/// without consuming anything, if that line is not the opening delimiter.
auto extract_metadata(std::span<const Line> lines, std::size_t first,
                      Diagnostics& diag) -> std::optional<MetadataSection>;

}  // namespace litedoc_cpp::detail
