// Fuzz target for the front-matter extractor. The input is wrapped in a
// `--- meta ---` section so that every run reaches the entry parser.

#include "diagnostics.hpp"
#include "lexer.hpp"
#include "metadata_extractor.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    auto text = std::string{"--- meta ---\n"};
    text.append(reinterpret_cast<const char*>(data), size);

    const auto lines = litedoc_cpp::detail::split_lines(text);
    auto diag = litedoc_cpp::detail::Diagnostics{litedoc_cpp::Profile::litedoc, 8};
    auto section = litedoc_cpp::detail::extract_metadata(lines, 0, diag);
    if (!section || section->next_line > lines.size()) std::abort();

    for (const auto& error : diag.take()) {
        if (error.span.end > text.size()) std::abort();
    }

    // Single values go through the same parser on their own.
    (void)litedoc_cpp::detail::parse_meta_value(
        std::string_view{reinterpret_cast<const char*>(data), size});
    return 0;
}
