#include <litedoc-cpp/batch.hpp>

#include "executor.hpp"

#include <cstddef>
#include <utility>

namespace litedoc_cpp {

auto parse_batch(std::span<const std::string_view> texts,
                 const ParseOptions& options) -> std::vector<ParseResult> {
    auto parser = Parser{options};
    auto results = std::vector<ParseResult>(texts.size());
    detail::for_each_index(texts.size(), [&](std::size_t i) {
        results[i] = parser.parse_with_recovery(texts[i]);
    });
    return results;
}

auto parse_batch(const std::vector<std::string>& texts,
                 const ParseOptions& options) -> std::vector<ParseResult> {
    auto views = std::vector<std::string_view>{texts.begin(), texts.end()};
    return parse_batch(std::span<const std::string_view>{views}, options);
}

}  // namespace litedoc_cpp
