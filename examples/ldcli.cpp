// ldcli - parse, validate and summarize Litedoc files from the command line
//
// Commands:
//   parse     print the document tree (outline, or JSON with --json)
//   validate  print diagnostics as FILE:LINE:COL; exit status 1 if any
//   stats     print node counts and size figures
//
// Files ending in .md default to the md profile, everything else to
// litedoc; --profile overrides both. An `@profile` line inside a file
// still wins over either.
//
// Build: cmake --build build
// Run:   ./build/ldcli validate notes.ld README.md

#include <litedoc-cpp/batch.hpp>
#include <litedoc-cpp/json.hpp>
#include <litedoc-cpp/litedoc.hpp>

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ld = litedoc_cpp;
using json = nlohmann::json;

namespace {

enum class Command { parse, validate, stats };

struct Input {
    std::string path;
    std::string text;
    ld::Profile profile;
};

struct Settings {
    Command command;
    bool as_json;
    bool spans;
    std::size_t max_depth;
};

auto parse_command(std::string_view name) -> std::optional<Command> {
    if (name == "parse") return Command::parse;
    if (name == "validate") return Command::validate;
    if (name == "stats") return Command::stats;
    return std::nullopt;
}

auto read_file(const std::string& path) -> std::optional<std::string> {
    auto in = std::ifstream{path, std::ios::binary};
    if (!in) return std::nullopt;
    return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

auto profile_for(const std::string& path, std::optional<ld::Profile> forced) -> ld::Profile {
    if (forced) return *forced;
    auto ext = std::filesystem::path{path}.extension();
    return (ext == ".md" || ext == ".markdown") ? ld::Profile::md : ld::Profile::litedoc;
}

// Parse every input, one batch per profile. Results line up with `inputs`.
auto parse_all(const std::vector<Input>& inputs, std::size_t max_depth)
    -> std::vector<ld::ParseResult> {
    auto results = std::vector<ld::ParseResult>(inputs.size());
    for (auto profile : {ld::Profile::litedoc, ld::Profile::md, ld::Profile::md_strict}) {
        auto indices = std::vector<std::size_t>{};
        auto texts = std::vector<std::string_view>{};
        for (std::size_t i = 0; i < inputs.size(); ++i) {
            if (inputs[i].profile != profile) continue;
            indices.push_back(i);
            texts.push_back(inputs[i].text);
        }
        if (texts.empty()) continue;

        auto batch = ld::parse_batch(texts, ld::ParseOptions{profile, max_depth});
        for (std::size_t k = 0; k < indices.size(); ++k) {
            results[indices[k]] = std::move(batch[k]);
        }
    }
    return results;
}

// -- Text output --------------------------------------------------------------

void print_outline(const ld::Blocks& blocks, const ld::LineIndex& index, int indent) {
    for (const auto& block : blocks) {
        auto loc = index.locate(block.span());
        std::printf("%*s%s %zu:%zu", indent, "",
                    std::string{ld::to_string_view(block.kind())}.c_str(), loc.line, loc.column);

        std::visit(ld::overload{
            [](const ld::Heading& n) {
                std::printf(" h%d %s\n", n.level, ld::plain_text(n.content).c_str());
            },
            [&](const ld::List& n) {
                std::printf(" %s, %zu items\n",
                            std::string{ld::to_string_view(n.kind)}.c_str(), n.items.size());
                for (const auto& item : n.items) print_outline(item.blocks, index, indent + 4);
            },
            [](const ld::CodeBlock& n) {
                std::printf(" %s\n", n.lang ? n.lang->c_str() : "-");
            },
            [&](const ld::Callout& n) {
                std::printf(" %s\n", n.kind.c_str());
                print_outline(n.blocks, index, indent + 2);
            },
            [&](const ld::Quote& n) {
                std::printf("\n");
                print_outline(n.blocks, index, indent + 2);
            },
            [&](const ld::Figure& n) {
                std::printf(" %s\n", n.src.c_str());
                print_outline(n.blocks, index, indent + 2);
            },
            [](const ld::Table& n) {
                std::printf(" %zux%zu\n", n.rows.size(), n.column_count());
            },
            [&](const ld::Footnotes& n) {
                std::printf(" %zu defs\n", n.defs.size());
                for (const auto& def : n.defs) print_outline(def.blocks, index, indent + 4);
            },
            [](const ld::RawBlock& n) { std::printf(" ::%s\n", n.name.c_str()); },
            [](const auto&) { std::printf("\n"); },
        }, block.inner);
    }
}

void print_diagnostics(const Input& input, const ld::ParseResult& result) {
    auto index = ld::LineIndex{input.text};
    for (const auto& error : result.errors) {
        auto loc = index.locate(error.span);
        std::printf("%s:%zu:%zu: %s: %s\n", input.path.c_str(), loc.line, loc.column,
                    std::string{ld::to_string_view(error.kind)}.c_str(), error.message.c_str());
    }
}

void print_stats(const Input& input, const ld::DocumentStats& stats) {
    std::printf("%s\n", input.path.c_str());
    std::printf("  bytes %zu, lines %zu, words %zu\n", stats.bytes, stats.lines, stats.words);
    std::printf("  blocks %zu, inlines %zu, max depth %zu\n",
                stats.total_blocks, stats.total_inlines, stats.max_depth);
    for (std::size_t k = 0; k < stats.blocks_by_kind.size(); ++k) {
        if (stats.blocks_by_kind[k] == 0) continue;
        std::printf("    %-14s %zu\n",
                    std::string{ld::to_string_view(static_cast<ld::BlockKind>(k))}.c_str(),
                    stats.blocks_by_kind[k]);
    }
    if (stats.metadata_entries > 0) {
        std::printf("  metadata entries %zu\n", stats.metadata_entries);
    }
}

// -- Commands -----------------------------------------------------------------

auto run(const Settings& settings, const std::vector<Input>& inputs) -> int {
    auto results = parse_all(inputs, settings.max_depth);
    auto status = 0;
    auto out = json::array();

    for (std::size_t i = 0; i < inputs.size(); ++i) {
        const auto& input = inputs[i];
        const auto& result = results[i];
        if (!result.ok) {
            spdlog::warn("{}: {} diagnostic(s) under the {} profile", input.path,
                         result.errors.size(), ld::to_string_view(result.document.profile));
        }

        switch (settings.command) {
            case Command::parse:
                if (settings.as_json) {
                    out.push_back(json{{"file", input.path},
                                       {"document", ld::export_json(result.document, settings.spans)},
                                       {"errors", result.errors}});
                } else {
                    std::printf("%s (%s)\n", input.path.c_str(),
                                std::string{ld::to_string_view(result.document.profile)}.c_str());
                    print_outline(result.document.blocks, ld::LineIndex{input.text}, 2);
                }
                break;

            case Command::validate:
                if (!result.ok) status = 1;
                if (settings.as_json) {
                    out.push_back(json{{"file", input.path}, {"ok", result.ok},
                                       {"fatal", result.has_fatal_errors()},
                                       {"errors", result.errors}});
                } else {
                    print_diagnostics(input, result);
                }
                break;

            case Command::stats: {
                auto stats = ld::compute_stats(result.document, input.text);
                if (settings.as_json) {
                    out.push_back(json{{"file", input.path}, {"stats", stats}});
                } else {
                    print_stats(input, stats);
                }
                break;
            }
        }
    }

    if (settings.as_json) std::printf("%s\n", out.dump(2).c_str());
    return status;
}

}  // namespace

int main(int argc, char** argv) {
    auto options = cxxopts::Options{"ldcli", "Parse, validate and summarize Litedoc documents."};
    options.positional_help("<parse|validate|stats> FILE...").show_positional_help();
    options.add_options()
        ("p,profile", "Dialect: litedoc, md or md-strict", cxxopts::value<std::string>())
        ("j,json", "Write JSON instead of text")
        ("no-spans", "Leave spans out of JSON trees")
        ("d,max-depth", "Maximum container nesting",
         cxxopts::value<std::size_t>()->default_value("64"))
        ("v,verbose", "Log every recovered diagnostic")
        ("h,help", "Print this help message")
        ("command", "parse, validate or stats", cxxopts::value<std::string>())
        ("files", "Input files", cxxopts::value<std::vector<std::string>>());
    options.parse_positional({"command", "files"});

    auto settings = Settings{};
    auto forced = std::optional<ld::Profile>{};
    auto files = std::vector<std::string>{};
    try {
        auto args = options.parse(argc, argv);
        if (args.count("help") || !args.count("command") || !args.count("files")) {
            std::printf("%s\n", options.help().c_str());
            return args.count("help") ? 0 : 2;
        }

        auto command = parse_command(args["command"].as<std::string>());
        if (!command) {
            spdlog::error("unknown command '{}'", args["command"].as<std::string>());
            return 2;
        }
        if (args.count("profile")) {
            auto name = args["profile"].as<std::string>();
            forced = ld::parse_profile(name);
            if (!forced) {
                spdlog::error("unknown profile '{}'", name);
                return 2;
            }
        }

        settings = Settings{*command, args.count("json") > 0, args.count("no-spans") == 0,
                            args["max-depth"].as<std::size_t>()};
        files = args["files"].as<std::vector<std::string>>();
        if (args.count("verbose")) spdlog::set_level(spdlog::level::debug);
    } catch (const cxxopts::exceptions::exception& e) {
        spdlog::error("{}", e.what());
        return 2;
    }

    auto inputs = std::vector<Input>{};
    for (const auto& path : files) {
        auto text = read_file(path);
        if (!text) {
            spdlog::error("cannot read '{}'", path);
            return 2;
        }
        inputs.push_back(Input{path, std::move(*text), profile_for(path, forced)});
    }

    try {
        return run(settings, inputs);
    } catch (const ld::NestingDepthExceeded& e) {
        spdlog::error("{}", e.what());
        return 2;
    } catch (const std::length_error& e) {
        spdlog::error("{}", e.what());
        return 2;
    }
}
