/// @file recovery.hpp
/// @brief The (ParseErrorKind, Profile) -> recovery lookup.

#pragma once

#include <litedoc-cpp/error.hpp>
#include <litedoc-cpp/profile.hpp>

#include <cstdint>
#include <string_view>

namespace litedoc_cpp {

/// The deterministic substitute taken when a construct fails to parse.
enum class RecoveryAction : std::uint8_t {
    close_at_failure,    ///< Close the container where input ran out.
    substitute_raw,      ///< Keep the body as a RawBlock.
    pad_or_truncate,     ///< Pad short table rows, truncate long ones.
    keep_raw_value,      ///< Keep the unparsed metadata value as a string.
    clamp_level,         ///< Clamp the heading level to 6.
    treat_as_paragraph,  ///< Keep the line as ordinary paragraph text.
    skip_line,           ///< Drop the offending line.
    abort,               ///< No recovery; the parse cannot continue.
};

constexpr auto to_string_view(RecoveryAction action) noexcept -> std::string_view {
    switch (action) {
        case RecoveryAction::close_at_failure:   return "close_at_failure";
        case RecoveryAction::substitute_raw:     return "substitute_raw";
        case RecoveryAction::pad_or_truncate:    return "pad_or_truncate";
        case RecoveryAction::keep_raw_value:     return "keep_raw_value";
        case RecoveryAction::clamp_level:        return "clamp_level";
        case RecoveryAction::treat_as_paragraph: return "treat_as_paragraph";
        case RecoveryAction::skip_line:          return "skip_line";
        case RecoveryAction::abort:              return "abort";
    }
    return "unknown";
}

/// The recovery strategy for a diagnostic kind.
constexpr auto recovery_action(ParseErrorKind kind) noexcept -> RecoveryAction {
    switch (kind) {
        case ParseErrorKind::unterminated_container: return RecoveryAction::close_at_failure;
        case ParseErrorKind::unknown_directive:      return RecoveryAction::substitute_raw;
        case ParseErrorKind::malformed_table:        return RecoveryAction::pad_or_truncate;
        case ParseErrorKind::malformed_metadata:     return RecoveryAction::keep_raw_value;
        case ParseErrorKind::invalid_heading_level:  return RecoveryAction::clamp_level;
        case ParseErrorKind::invalid_list_marker:    return RecoveryAction::treat_as_paragraph;
        case ParseErrorKind::malformed_footnote:     return RecoveryAction::skip_line;
        case ParseErrorKind::nesting_too_deep:       return RecoveryAction::abort;
    }
    return RecoveryAction::abort;
}

/// Whether a diagnostic of `kind` is fatal for the strict entry point.
///
/// Kinds without a recovery strategy are always fatal. Under a strict
/// profile every diagnostic is fatal.
constexpr auto is_fatal(ParseErrorKind kind, Profile profile) noexcept -> bool {
    if (recovery_action(kind) == RecoveryAction::abort) return true;
    return strictness(profile) == Strictness::strict;
}

}  // namespace litedoc_cpp
