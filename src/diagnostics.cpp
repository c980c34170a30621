#include "diagnostics.hpp"

#include <litedoc-cpp/recovery.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace litedoc_cpp::detail {

void Diagnostics::report(ParseErrorKind kind, Span span, std::string message) {
    spdlog::debug("litedoc: {} at {}..{} ({}), recovery: {}",
                  to_string_view(kind), span.start, span.end, message,
                  to_string_view(recovery_action(kind)));
    errors_.emplace_back(kind, span, std::move(message));
}

auto Diagnostics::take() -> std::vector<ParseError> {
    std::ranges::stable_sort(errors_, [](const ParseError& a, const ParseError& b) {
        return a.span.start < b.span.start;
    });
    return std::move(errors_);
}

Diagnostics::DepthGuard::DepthGuard(Diagnostics& diag, Span span) : diag_{diag} {
    if (diag_.depth_ >= diag_.max_depth_) {
        spdlog::debug("litedoc: nesting bound {} exceeded at {}..{}",
                      diag_.max_depth_, span.start, span.end);
        throw NestingDepthExceeded{ParseError{
            ParseErrorKind::nesting_too_deep, span,
            "containers nest deeper than " + std::to_string(diag_.max_depth_) + " levels"}};
    }
    ++diag_.depth_;
}

}  // namespace litedoc_cpp::detail
