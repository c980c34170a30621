#pragma once

// Inline tokenizer for leaf text (paragraphs, headings, cells, captions).
// Internal header -- not installed.

#include "source_text.hpp"

#include <litedoc-cpp/ast.hpp>
#include <litedoc-cpp/profile.hpp>

#include <cstddef>

namespace litedoc_cpp::detail {

/// Which inline constructs are recognized. Derived from the profile.
struct InlineOptions {
    bool wiki_links{true};
    bool footnote_refs{true};
    bool strikethrough{true};
    bool bare_autolinks{true};
    std::size_t max_depth{64};

    static auto for_profile(Profile profile, std::size_t max_depth) -> InlineOptions {
        return InlineOptions{
            recognizes(profile, Construct::wiki_link),
            recognizes(profile, Construct::footnote_ref),
            recognizes(profile, Construct::strikethrough),
            recognizes(profile, Construct::bare_autolink),
            max_depth,
        };
    }
};

/// Parse the whole of `src` into inline nodes. Never fails: anything that
/// does not form a construct is literal text.
auto parse_inlines(const SourceText& src, const InlineOptions& options) -> Inlines;

/// Merge adjacent Text nodes whose spans touch.
void merge_adjacent_text(Inlines& nodes);

}  // namespace litedoc_cpp::detail
