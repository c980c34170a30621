#include <litedoc-cpp/ast.hpp>

#include <string>

namespace litedoc_cpp {

auto Inline::children() const -> const Inlines* {
    return std::visit(overload{
        [](const Emphasis& n) -> const Inlines* { return &n.children; },
        [](const Strong& n) -> const Inlines* { return &n.children; },
        [](const Strikethrough& n) -> const Inlines* { return &n.children; },
        [](const Link& n) -> const Inlines* { return &n.label; },
        [](const auto&) -> const Inlines* { return nullptr; },
    }, inner);
}

namespace {

void append_plain(const Inlines& inlines, std::string& out) {
    for (const auto& node : inlines) {
        std::visit(overload{
            [&](const Text& n) { out += n.content; },
            [&](const CodeSpan& n) { out += n.content; },
            [&](const AutoLink& n) { out += n.destination; },
            [&](const FootnoteRef&) {},
            [&](const HardBreak&) { out += '\n'; },
            [&](const SoftBreak&) { out += ' '; },
            [&](const auto&) {
                if (const auto* children = node.children()) append_plain(*children, out);
            },
        }, node.inner);
    }
}

}  // namespace

auto plain_text(const Inlines& inlines) -> std::string {
    auto out = std::string{};
    append_plain(inlines, out);
    return out;
}

}  // namespace litedoc_cpp
