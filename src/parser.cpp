#include <litedoc-cpp/parser.hpp>
#include <litedoc-cpp/recovery.hpp>

#include "block_parser.hpp"
#include "diagnostics.hpp"
#include "inline_parser.hpp"
#include "lexer.hpp"
#include "metadata_extractor.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

namespace litedoc_cpp {

namespace {

// `@profile name` on the first non-blank line.
auto profile_override(const detail::Line& line) -> std::optional<Profile> {
    auto t = line.trimmed();
    constexpr auto keyword = std::string_view{"@profile"};
    if (!t.starts_with(keyword) || t.size() == keyword.size() ||
        !detail::is_space(t[keyword.size()])) {
        return std::nullopt;
    }
    return parse_profile(detail::trim(t.substr(keyword.size())));
}

// `@modules a, b, ...` right after the profile line. Unknown names are skipped.
auto modules_line(const detail::Line& line) -> std::optional<std::vector<Module>> {
    auto t = line.trimmed();
    constexpr auto keyword = std::string_view{"@modules"};
    if (!t.starts_with(keyword) ||
        (t.size() > keyword.size() && !detail::is_space(t[keyword.size()]))) {
        return std::nullopt;
    }

    auto modules = std::vector<Module>{};
    auto rest = t.substr(keyword.size());
    while (true) {
        auto comma = rest.find(',');
        if (auto m = parse_module(detail::trim(rest.substr(0, comma)))) {
            modules.push_back(*m);
        }
        if (comma == std::string_view::npos) break;
        rest = rest.substr(comma + 1);
    }
    return modules;
}

void enable(std::vector<Module>& modules, Module m) {
    if (std::ranges::find(modules, m) == modules.end()) modules.push_back(m);
}

auto skip_blank(std::span<const detail::Line> lines, std::size_t i) -> std::size_t {
    while (i < lines.size() && lines[i].is_blank()) ++i;
    return i;
}

auto run(std::string_view text, const ParseOptions& options) -> ParseResult {
    if (text.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw std::length_error{"litedoc input exceeds 4 GiB"};
    }

    auto lines = detail::split_lines(text);
    auto profile = options.profile;
    auto first = skip_blank(lines, 0);
    if (first < lines.size()) {
        if (auto p = profile_override(lines[first])) {
            profile = *p;
            first = skip_blank(lines, first + 1);
        }
    }

    auto doc = Document{profile, {}, std::nullopt, {}, make_span(0, text.size())};
    for (auto m : options.modules) enable(doc.modules, m);
    if (first < lines.size()) {
        if (auto listed = modules_line(lines[first])) {
            for (auto m : *listed) enable(doc.modules, m);
            first = skip_blank(lines, first + 1);
        }
    }

    auto diag = detail::Diagnostics{profile, options.max_nesting_depth};
    if (auto section = detail::extract_metadata(lines, first, diag)) {
        doc.metadata = std::move(section->metadata);
        first = section->next_line;
    }

    auto blocks = detail::BlockParser{
        diag, detail::InlineOptions::for_profile(profile, options.max_nesting_depth),
        doc.modules};
    doc.blocks = blocks.parse(std::span<const detail::Line>{lines}.subspan(first));

    auto result = ParseResult{std::move(doc), diag.take(), true};
    result.ok = result.errors.empty();
    return result;
}

}  // namespace

auto ParseResult::has_fatal_errors() const -> bool {
    return std::ranges::any_of(errors, [&](const ParseError& e) {
        return is_fatal(e.kind, document.profile);
    });
}

auto Parser::parse(std::string_view text) const -> Document {
    auto result = run(text, options_);
    for (const auto& error : result.errors) {
        if (is_fatal(error.kind, result.document.profile)) throw ParseFailure{error};
    }
    return std::move(result.document);
}

auto Parser::parse_with_recovery(std::string_view text) const -> ParseResult {
    return run(text, options_);
}

auto parse(std::string_view text, Profile profile) -> Document {
    return Parser{profile}.parse(text);
}

auto parse_with_recovery(std::string_view text, Profile profile) -> ParseResult {
    return Parser{profile}.parse_with_recovery(text);
}

}  // namespace litedoc_cpp
