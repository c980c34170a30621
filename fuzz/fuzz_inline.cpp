// Fuzz target for the inline tokenizer - any byte sequence must produce a
// node list whose spans are ordered and inside the input.

#include "inline_parser.hpp"
#include "source_text.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};
    const auto src = litedoc_cpp::detail::SourceText::from(text, 0);

    for (auto profile : {litedoc_cpp::Profile::litedoc, litedoc_cpp::Profile::md_strict}) {
        auto options = litedoc_cpp::detail::InlineOptions::for_profile(profile, 16);
        auto nodes = litedoc_cpp::detail::parse_inlines(src, options);

        auto previous_end = std::uint32_t{0};
        for (const auto& node : nodes) {
            auto span = node.span();
            if (span.start < previous_end || span.end > size) std::abort();
            previous_end = span.end;
        }
    }
    return 0;
}
