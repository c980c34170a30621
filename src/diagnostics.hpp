#pragma once

// Error recovery controller: collects diagnostics raised by the metadata
// extractor and the block parser, and bounds container nesting.
// Internal header -- not installed.

#include <litedoc-cpp/error.hpp>
#include <litedoc-cpp/profile.hpp>
#include <litedoc-cpp/span.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace litedoc_cpp::detail {

class Diagnostics {
public:
    Diagnostics(Profile profile, std::size_t max_depth)
        : profile_{profile}, max_depth_{max_depth} {}

    /// Record a recoverable diagnostic. The caller applies the recovery.
    void report(ParseErrorKind kind, Span span, std::string message);

    /// Record a diagnostic only under a strict profile.
    void report_if_strict(ParseErrorKind kind, Span span, std::string message) {
        if (strictness(profile_) == Strictness::strict) report(kind, span, std::move(message));
    }

    /// Collected diagnostics, ordered by span start.
    auto take() -> std::vector<ParseError>;

    auto profile() const noexcept -> Profile { return profile_; }
    void set_profile(Profile profile) noexcept { profile_ = profile; }

    auto depth() const noexcept -> std::size_t { return depth_; }
    auto max_depth() const noexcept -> std::size_t { return max_depth_; }

    /// RAII guard for one level of container nesting.
    /// @throws NestingDepthExceeded when entering would pass the bound.
    class DepthGuard {
    public:
        DepthGuard(Diagnostics& diag, Span span);
        ~DepthGuard() { --diag_.depth_; }

        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

    private:
        Diagnostics& diag_;
    };

    auto enter(Span span) -> DepthGuard { return DepthGuard{*this, span}; }

private:
    Profile profile_;
    std::size_t max_depth_;
    std::size_t depth_{0};
    std::vector<ParseError> errors_;
};

}  // namespace litedoc_cpp::detail
