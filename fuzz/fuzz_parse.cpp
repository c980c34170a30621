// Fuzz target for parse_with_recovery() - exercises the whole pipeline under
// every profile. Recovery must never throw anything but NestingDepthExceeded,
// and every span it reports must stay inside the input.

#include <litedoc-cpp/json.hpp>
#include <litedoc-cpp/litedoc.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <string_view>

namespace {

void check_spans(const litedoc_cpp::Blocks& blocks, litedoc_cpp::Span bounds) {
    for (const auto& block : blocks) {
        if (!bounds.contains(block.span())) std::abort();
    }
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    for (auto profile : {litedoc_cpp::Profile::litedoc, litedoc_cpp::Profile::md,
                         litedoc_cpp::Profile::md_strict}) {
        const auto parser = litedoc_cpp::Parser{litedoc_cpp::ParseOptions{profile, 32}};
        try {
            auto result = parser.parse_with_recovery(text);
            check_spans(result.document.blocks, result.document.span);
            for (const auto& error : result.errors) {
                if (!result.document.span.contains(error.span)) std::abort();
            }
            if (result.ok != result.errors.empty()) std::abort();

            auto stats = litedoc_cpp::compute_stats(result.document, text);
            (void)stats;
            auto json = litedoc_cpp::export_json(result.document);
            (void)json;
        } catch (const litedoc_cpp::NestingDepthExceeded&) {
            // The nesting bound may reject the input outright.
        }
    }
    return 0;
}
