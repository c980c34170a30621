/// @file profile.hpp
/// @brief Dialect profiles and the static construct-support table.

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace litedoc_cpp {

/// The dialect a document is parsed as.
enum class Profile : std::uint8_t {
    litedoc,    ///< Full native syntax: directives, footnotes, math, wiki links.
    md,         ///< Markdown core; extended syntax passes through as raw.
    md_strict,  ///< Same constructs as md; every diagnostic is a hard error.
};

/// Canonical name of a profile: "litedoc", "md" or "md-strict".
constexpr auto to_string_view(Profile profile) noexcept -> std::string_view {
    switch (profile) {
        case Profile::litedoc:   return "litedoc";
        case Profile::md:        return "md";
        case Profile::md_strict: return "md-strict";
    }
    return "unknown";
}

/// Parse a canonical profile name. Returns nullopt for unknown names.
constexpr auto parse_profile(std::string_view name) noexcept -> std::optional<Profile> {
    if (name == "litedoc") return Profile::litedoc;
    if (name == "md") return Profile::md;
    if (name == "md-strict") return Profile::md_strict;
    return std::nullopt;
}

/// Optional extensions a document can enable with an `@modules` line.
enum class Module : std::uint8_t {
    tables,
    footnotes,
    math,
    tasks,
    strikethrough,
    autolink,
    html,  ///< `::html` directives become HtmlBlock instead of RawBlock.
};

constexpr auto to_string_view(Module m) noexcept -> std::string_view {
    switch (m) {
        case Module::tables:        return "tables";
        case Module::footnotes:     return "footnotes";
        case Module::math:          return "math";
        case Module::tasks:         return "tasks";
        case Module::strikethrough: return "strikethrough";
        case Module::autolink:      return "autolink";
        case Module::html:          return "html";
    }
    return "unknown";
}

/// Parse a module name as written in `@modules`. Returns nullopt for unknown names.
constexpr auto parse_module(std::string_view name) noexcept -> std::optional<Module> {
    if (name == "tables") return Module::tables;
    if (name == "footnotes") return Module::footnotes;
    if (name == "math") return Module::math;
    if (name == "tasks") return Module::tasks;
    if (name == "strikethrough") return Module::strikethrough;
    if (name == "autolink") return Module::autolink;
    if (name == "html") return Module::html;
    return std::nullopt;
}

/// Syntactic constructs whose recognition depends on the profile.
enum class Construct : std::uint8_t {
    heading,
    paragraph,
    list,
    code_block,
    quote,
    thematic_break,
    table,
    front_matter,
    directive,       ///< `::name ... ::` container blocks.
    math_fence,      ///< `$$ ... $$` display math.
    html_block,      ///< Raw HTML lines.
    emphasis,        ///< `*`, `**` and code spans.
    link,            ///< `[label](dest)` and `<uri>`.
    wiki_link,       ///< `[[label|dest]]`.
    footnote_ref,    ///< `[^id]`.
    strikethrough,   ///< `~~text~~`.
    bare_autolink,   ///< `https://...` without angle brackets.
};

/// How a profile treats a construct.
enum class Support : std::uint8_t {
    native,    ///< Recognized and interpreted.
    raw,       ///< Recognized as syntax, passed through uninterpreted.
    rejected,  ///< Recognized as syntax, reported as a diagnostic, then recovered.
    ignored,   ///< Not recognized; the text is ordinary content.
};

/// Whether diagnostics under a profile are recoverable or hard errors.
enum class Strictness : std::uint8_t {
    lenient,
    strict,
};

/// Look up how `profile` treats `construct`. Pure function of its inputs.
constexpr auto support(Profile profile, Construct construct) noexcept -> Support {
    switch (construct) {
        case Construct::heading:
        case Construct::paragraph:
        case Construct::list:
        case Construct::code_block:
        case Construct::quote:
        case Construct::thematic_break:
        case Construct::table:
        case Construct::front_matter:
        case Construct::emphasis:
        case Construct::link:
        case Construct::strikethrough:
        case Construct::bare_autolink:
            return Support::native;
        case Construct::directive:
            switch (profile) {
                case Profile::litedoc:   return Support::native;
                case Profile::md:        return Support::raw;
                case Profile::md_strict: return Support::rejected;
            }
            break;
        case Construct::math_fence:
        case Construct::wiki_link:
        case Construct::footnote_ref:
            return profile == Profile::litedoc ? Support::native : Support::ignored;
        case Construct::html_block:
            return profile == Profile::litedoc ? Support::ignored : Support::native;
    }
    return Support::ignored;
}

/// Convenience: the construct is interpreted under the profile.
constexpr auto recognizes(Profile profile, Construct construct) noexcept -> bool {
    return support(profile, construct) == Support::native;
}

/// Strictness of a profile.
constexpr auto strictness(Profile profile) noexcept -> Strictness {
    return profile == Profile::md_strict ? Strictness::strict : Strictness::lenient;
}

}  // namespace litedoc_cpp
