// basic_usage - demonstrates the core litedoc-cpp API
//
// Parses a small document, walks the tree, reads front matter, shows
// recovery diagnostics with line:column positions and exports JSON.
//
// Build: cmake --build build
// Run:   ./build/basic_usage

#include <litedoc-cpp/json.hpp>
#include <litedoc-cpp/litedoc.hpp>

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <variant>

namespace ld = litedoc_cpp;

static constexpr auto source = std::string_view{
    "--- meta ---\n"
    "title: \"Release notes\"\n"
    "version: 3\n"
    "tags: [parser, docs]\n"
    "---\n"
    "# Release *notes*\n"
    "\n"
    "Highlights for this release[^1]:\n"
    "\n"
    "::list\n"
    "- Faster tables\n"
    "- Wiki links like [[Home|index]]\n"
    "::\n"
    "\n"
    "::callout type=warning title=\"Heads up\"\n"
    "The `::figure` caption syntax changed.\n"
    "::\n"
    "\n"
    "::footnotes\n"
    "[^1]: See the changelog.\n"
    "::\n"};

static void print_blocks(const ld::Blocks& blocks, int indent) {
    for (const auto& block : blocks) {
        const auto span = block.span();
        std::printf("%*s%s [%u..%u]", indent, "",
                    std::string{ld::to_string_view(block.kind())}.c_str(),
                    span.start, span.end);

        std::visit(ld::overload{
            [](const ld::Heading& h) {
                std::printf(" level=%d \"%s\"\n", h.level, ld::plain_text(h.content).c_str());
            },
            [](const ld::Paragraph& p) {
                std::printf(" \"%s\"\n", ld::plain_text(p.content).c_str());
            },
            [&](const ld::List& l) {
                std::printf(" %zu items\n", l.items.size());
                for (const auto& item : l.items) print_blocks(item.blocks, indent + 4);
            },
            [&](const ld::Callout& c) {
                std::printf(" kind=%s\n", c.kind.c_str());
                print_blocks(c.blocks, indent + 2);
            },
            [&](const ld::Footnotes& f) {
                std::printf(" %zu defs\n", f.defs.size());
                for (const auto& def : f.defs) print_blocks(def.blocks, indent + 4);
            },
            [](const auto&) { std::printf("\n"); },
        }, block.inner);
    }
}

int main() {
    // -- Strict parse ---------------------------------------------------------
    auto doc = ld::parse(source);
    std::printf("Profile: %s\n", std::string{ld::to_string_view(doc.profile)}.c_str());

    // -- Front matter ---------------------------------------------------------
    if (doc.metadata) {
        if (auto title = doc.metadata->get<std::string>("title")) {
            std::printf("Title: %s\n", title->c_str());
        }
        if (auto version = doc.metadata->get<std::int64_t>("version")) {
            std::printf("Version: %ld\n", static_cast<long>(*version));
        }
        std::printf("Tags: %s\n", ld::to_string(doc.metadata->at("tags")).c_str());
    }

    // -- Tree walk ------------------------------------------------------------
    print_blocks(doc.blocks, 0);

    // -- Recovery mode --------------------------------------------------------
    const auto broken = std::string_view{"# Title\n\n::widget\nbody\n::\n\n::list\n- open"};
    auto result = ld::parse_with_recovery(broken);
    auto index = ld::LineIndex{broken};
    std::printf("Recovered %zu blocks, %zu diagnostics\n",
                result.document.blocks.size(), result.errors.size());
    for (const auto& error : result.errors) {
        auto loc = index.locate(error.span);
        std::printf("  %zu:%zu %s: %s\n", loc.line, loc.column,
                    std::string{ld::to_string_view(error.kind)}.c_str(), error.message.c_str());
    }

    // -- Strict failure -------------------------------------------------------
    try {
        ld::parse("::note\ntext\n::", ld::Profile::md_strict);
    } catch (const ld::ParseFailure& e) {
        std::printf("md-strict rejected the input: %s\n", e.what());
    }

    // -- Statistics and JSON --------------------------------------------------
    auto stats = ld::compute_stats(doc, source);
    std::printf("Blocks: %zu, inlines: %zu, words: %zu\n",
                stats.total_blocks, stats.total_inlines, stats.words);

    auto json = ld::export_json(doc, false);
    std::printf("JSON: %zu bytes\n", json.dump().size());

    std::printf("Done.\n");
    return 0;
}
