/// @file parser.hpp
/// @brief Parse entry points: Parser, parse(), parse_with_recovery().

#pragma once

#include <litedoc-cpp/ast.hpp>
#include <litedoc-cpp/error.hpp>
#include <litedoc-cpp/profile.hpp>

#include <cstddef>
#include <string_view>
#include <vector>

namespace litedoc_cpp {

/// Parser configuration.
struct ParseOptions {
    /// Dialect used unless the document starts with an `@profile` line.
    Profile profile{Profile::litedoc};
    /// Maximum depth of nested directives, list items and quotes.
    std::size_t max_nesting_depth{64};
    /// Modules enabled for every document, in addition to its `@modules` line.
    std::vector<Module> modules{};

    auto operator==(const ParseOptions&) const -> bool = default;
};

/// The outcome of a recovering parse: a best-effort document plus diagnostics.
struct ParseResult {
    Document document;               ///< Always present, possibly partial.
    std::vector<ParseError> errors;  ///< Diagnostics in source order.
    bool ok{true};                   ///< Equivalent to `errors.empty()`.

    /// Check if any collected diagnostic is fatal for the document's profile.
    auto has_fatal_errors() const -> bool;
};

/// A reusable parser with a fixed configuration.
///
/// Parser holds no state between calls: every call is equivalent to a
/// fresh parse with the same options, and a single Parser may be used
/// from several threads at once.
///
/// @code
/// auto parser = Parser{Profile::md};
/// auto result = parser.parse_with_recovery("# Title\n\nBody");
/// if (!result.ok) { ... }
/// @endcode
class Parser {
public:
    /// Construct with the default options (Litedoc profile).
    Parser() = default;

    /// Construct with a profile and default limits.
    explicit Parser(Profile profile) : options_{profile} {}

    /// Construct with explicit options.
    explicit Parser(ParseOptions options) : options_{options} {}

    /// Parse, throwing on the first fatal diagnostic.
    /// @throws ParseFailure carrying the diagnostic's kind and span.
    /// @throws NestingDepthExceeded when containers nest too deeply.
    auto parse(std::string_view text) const -> Document;

    /// Parse, collecting diagnostics instead of throwing.
    /// @throws NestingDepthExceeded when containers nest too deeply.
    auto parse_with_recovery(std::string_view text) const -> ParseResult;

    auto profile() const noexcept -> Profile { return options_.profile; }
    auto options() const noexcept -> const ParseOptions& { return options_; }

private:
    ParseOptions options_{};
};

/// Parse `text` with `profile`. See Parser::parse().
auto parse(std::string_view text, Profile profile = Profile::litedoc) -> Document;

/// Parse `text` with `profile`. See Parser::parse_with_recovery().
auto parse_with_recovery(std::string_view text,
                         Profile profile = Profile::litedoc) -> ParseResult;

}  // namespace litedoc_cpp
