/// @file error.hpp
/// @brief Diagnostic and exception types for the litedoc-cpp library.

#pragma once

#include <litedoc-cpp/span.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace litedoc_cpp {

/// Structural causes of a parse diagnostic.
enum class ParseErrorKind : std::uint8_t {
    unterminated_container,  ///< A directive or fence was never closed.
    unknown_directive,       ///< A `::name` the profile does not interpret.
    malformed_table,         ///< Missing separator, stray line or ragged row.
    malformed_metadata,      ///< Front matter line or value that does not parse.
    invalid_heading_level,   ///< More than six `#` characters.
    invalid_list_marker,     ///< A line that cannot be a list item where one is required.
    malformed_footnote,      ///< A line inside `::footnotes` that is not a definition.
    nesting_too_deep,        ///< Containers nested beyond the configured bound.
};

/// Convert a ParseErrorKind to its string representation.
constexpr auto to_string_view(ParseErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ParseErrorKind::unterminated_container: return "unterminated_container";
        case ParseErrorKind::unknown_directive:      return "unknown_directive";
        case ParseErrorKind::malformed_table:        return "malformed_table";
        case ParseErrorKind::malformed_metadata:     return "malformed_metadata";
        case ParseErrorKind::invalid_heading_level:  return "invalid_heading_level";
        case ParseErrorKind::invalid_list_marker:    return "invalid_list_marker";
        case ParseErrorKind::malformed_footnote:     return "malformed_footnote";
        case ParseErrorKind::nesting_too_deep:       return "nesting_too_deep";
    }
    return "unknown";
}

/// A diagnostic: what went wrong, where, and a human-readable message.
struct ParseError {
    ParseErrorKind kind;  ///< The structural cause.
    Span span;            ///< The offending source range.
    std::string message;  ///< A human-readable description.

    ParseError(ParseErrorKind k, Span s, std::string msg)
        : kind{k}, span{s}, message{std::move(msg)} {}

    auto operator==(const ParseError& other) const -> bool = default;
};

/// Render a diagnostic as "message at bytes start..end".
auto to_string(const ParseError& error) -> std::string;

/// Thrown by the strict entry points for the first fatal diagnostic.
class ParseFailure : public std::runtime_error {
public:
    explicit ParseFailure(ParseError error)
        : std::runtime_error{to_string(error)}, error_{std::move(error)} {}

    auto error() const noexcept -> const ParseError& { return error_; }
    auto kind() const noexcept -> ParseErrorKind { return error_.kind; }
    auto span() const noexcept -> Span { return error_.span; }

private:
    ParseError error_;
};

/// Thrown by every entry point when containers nest deeper than allowed.
class NestingDepthExceeded : public ParseFailure {
public:
    using ParseFailure::ParseFailure;
};

}  // namespace litedoc_cpp
