// litedoc-cpp benchmarks - measures parse throughput per construct family.

#include <litedoc-cpp/batch.hpp>
#include <litedoc-cpp/json.hpp>
#include <litedoc-cpp/litedoc.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace litedoc_cpp;

// =============================================================================
// Input generators
// =============================================================================

static auto make_prose(std::size_t paragraphs) -> std::string {
    auto text = std::string{};
    for (std::size_t i = 0; i < paragraphs; ++i) {
        text += "## Section " + std::to_string(i) + "\n\n";
        text += "Some *emphasis*, some **strong text**, a `code span`, a [link](https://example.com)\n";
        text += "and a [[Wiki Page|wiki]] reference with a footnote[^" + std::to_string(i) + "].\n\n";
    }
    return text;
}

static auto make_structured(std::size_t sections) -> std::string {
    auto text = std::string{"--- meta ---\ntitle: \"Bench\"\ntags: [a, b, c]\n---\n"};
    for (std::size_t i = 0; i < sections; ++i) {
        text += "::callout type=tip\n";
        text += "- item one\n- item two\n  continued\n- item three\n";
        text += "::\n\n";
        text += "| a | b | c |\n|---|---|---|\n| 1 | 2 | 3 |\n| 4 | 5 | 6 |\n\n";
        text += "```cpp\nint main() { return 0; }\n```\n\n";
        text += "> quoted *text*\n> continues\n\n";
    }
    return text;
}

static auto make_broken(std::size_t sections) -> std::string {
    auto text = std::string{};
    for (std::size_t i = 0; i < sections; ++i) {
        text += "####### too deep\n\n::widget size=3\nbody\n::\n\n::table\n| a |\n| b |\n::\n\n";
    }
    text += "::list\n- never closed\n";
    return text;
}

// =============================================================================
// Parsing
// =============================================================================

static void bm_parse_prose(benchmark::State& state) {
    const auto text = make_prose(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto doc = parse(text);
        benchmark::DoNotOptimize(doc);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_parse_prose)->Range(8, 512);

static void bm_parse_structured(benchmark::State& state) {
    const auto text = make_structured(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto doc = parse(text);
        benchmark::DoNotOptimize(doc);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_parse_structured)->Range(8, 512);

static void bm_parse_markdown_profile(benchmark::State& state) {
    const auto text = make_structured(64);
    const auto parser = Parser{Profile::md};
    for (auto _ : state) {
        auto doc = parser.parse(text);
        benchmark::DoNotOptimize(doc);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_parse_markdown_profile);

static void bm_parse_with_recovery(benchmark::State& state) {
    const auto text = make_broken(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto result = parse_with_recovery(text);
        benchmark::DoNotOptimize(result);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_parse_with_recovery)->Range(8, 512);

// =============================================================================
// Batch
// =============================================================================

static void bm_parse_batch(benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    auto texts = std::vector<std::string>(count, make_structured(16));
    for (auto _ : state) {
        auto results = parse_batch(texts);
        benchmark::DoNotOptimize(results);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * count));
}
BENCHMARK(bm_parse_batch)->Range(1, 256)->UseRealTime();

static void bm_parse_serial(benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    auto texts = std::vector<std::string>(count, make_structured(16));
    const auto parser = Parser{};
    for (auto _ : state) {
        for (const auto& text : texts) {
            auto result = parser.parse_with_recovery(text);
            benchmark::DoNotOptimize(result);
        }
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * count));
}
BENCHMARK(bm_parse_serial)->Range(1, 256);

// =============================================================================
// Post-processing
// =============================================================================

static void bm_export_json(benchmark::State& state) {
    const auto text = make_structured(64);
    const auto doc = parse(text);
    for (auto _ : state) {
        auto j = export_json(doc);
        benchmark::DoNotOptimize(j);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_export_json);

static void bm_compute_stats(benchmark::State& state) {
    const auto text = make_structured(64);
    const auto doc = parse(text);
    for (auto _ : state) {
        auto stats = compute_stats(doc, text);
        benchmark::DoNotOptimize(stats);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_compute_stats);

static void bm_line_index(benchmark::State& state) {
    const auto text = make_prose(512);
    for (auto _ : state) {
        auto index = LineIndex{text};
        benchmark::DoNotOptimize(index.locate(static_cast<std::uint32_t>(text.size() / 2)));
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_line_index);
