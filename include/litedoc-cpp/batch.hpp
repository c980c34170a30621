/// @file batch.hpp
/// @brief Parse many independent buffers concurrently.

#pragma once

#include <litedoc-cpp/parser.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace litedoc_cpp {

/// Parse every buffer with recovery, in parallel.
///
/// Work runs on the library's process-global executor. Results are in
/// input order. If any item throws (NestingDepthExceeded), all items
/// still run and the first exception in input order is rethrown.
/// @param texts Buffers to parse. They must outlive the call.
/// @param options Options applied to every buffer.
auto parse_batch(std::span<const std::string_view> texts,
                 const ParseOptions& options = {}) -> std::vector<ParseResult>;

/// Convenience overload for owned strings.
auto parse_batch(const std::vector<std::string>& texts,
                 const ParseOptions& options = {}) -> std::vector<ParseResult>;

}  // namespace litedoc_cpp
