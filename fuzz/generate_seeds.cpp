// Helper to generate seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself - just a corpus generator.

#include <litedoc-cpp/litedoc.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

static void write_seed(const std::string& path, std::string_view text) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(text.data(), static_cast<std::streamsize>(text.size()));
}

int main() {
    namespace fs = std::filesystem;
    const auto dir = std::string{"fuzz/corpus"};
    fs::create_directories(dir);

    struct Seed {
        const char* name;
        std::string_view text;
    };
    static constexpr Seed seeds[] = {
        {"empty", ""},
        {"heading", "# Title\n\n####### Seven\n"},
        {"inline", "*a* **b** ~~c~~ `d` [e](f) [[g|h]] [^i] <https://j> https://k.\n"},
        {"list", "- a\n  - b\n- c\n\n3. x\n4. y\n"},
        {"quote", "> a\n> > b\nlazy\n"},
        {"table", "| a | b |\n|---|:-:|\n| 1 |\n| 1 | 2 | 3 |\n"},
        {"code", "```cpp\n::\n```\n\n$$\nx^2\n$$\n"},
        {"directives",
         "::callout type=tip title=\"T\"\n::list ordered start=3\n- a\n::\n::\n\n"
         "::figure src=a.png caption=\"*c*\"\n::\n\n::footnotes\n[^1]: x\n    y\n::\n"},
        {"broken", "::widget\n::table\n| a |\nnope\n::\n\n::\n\n::list\n- open"},
        {"metadata", "--- meta ---\ntitle: \"T\"\nn: 3\nf: 2.5\nb: true\nl: [a, \"b, c\"]\nbad: \"x\n---\n"},
        {"profile_md", "@profile md\n<div>\nhi\n</div>\n\n::x\nraw\n::\n"},
        {"profile_strict", "@profile md-strict\n| a |\n|---|\n| 1 | 2 |\n"},
    };

    for (const auto& seed : seeds) {
        write_seed(dir + "/seed_" + seed.name + ".ld", seed.text);

        // Every seed must at least survive a recovering parse.
        auto result = litedoc_cpp::parse_with_recovery(seed.text);
        std::printf("%-16s %zu blocks, %zu diagnostics\n", seed.name,
                    result.document.blocks.size(), result.errors.size());
    }

    std::printf("Seeds written to %s/\n", dir.c_str());
    return 0;
}
