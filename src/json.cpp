#include <litedoc-cpp/json.hpp>
#include <litedoc-cpp/recovery.hpp>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace litedoc_cpp {

namespace {

void strip_spans(nlohmann::json& j) {
    if (j.is_object()) {
        j.erase("span");
        for (auto& [key, value] : j.items()) strip_spans(value);
    } else if (j.is_array()) {
        for (auto& value : j) strip_spans(value);
    }
}

auto tagged(std::string_view type, Span span) -> nlohmann::json {
    return nlohmann::json{{"type", std::string{type}}, {"span", span}};
}

}  // namespace

// =============================================================================
// ADL serialization: to_json / from_json  (in namespace litedoc_cpp)
// =============================================================================

void to_json(nlohmann::json& j, const Span& span) {
    j = nlohmann::json{{"start", span.start}, {"end", span.end}};
}

void from_json(const nlohmann::json& j, Span& span) {
    span = Span{j.at("start").get<std::uint32_t>(), j.at("end").get<std::uint32_t>()};
}

void to_json(nlohmann::json& j, Profile profile) {
    j = std::string{to_string_view(profile)};
}

void from_json(const nlohmann::json& j, Profile& profile) {
    auto name = j.get<std::string>();
    auto parsed = parse_profile(name);
    if (!parsed) throw std::runtime_error{"unknown profile: " + name};
    profile = *parsed;
}

void to_json(nlohmann::json& j, Module m) {
    j = std::string{to_string_view(m)};
}

void from_json(const nlohmann::json& j, Module& m) {
    auto name = j.get<std::string>();
    auto parsed = parse_module(name);
    if (!parsed) throw std::runtime_error{"unknown module: " + name};
    m = *parsed;
}

void to_json(nlohmann::json& j, ParseErrorKind kind) {
    j = std::string{to_string_view(kind)};
}

// -- Metadata -----------------------------------------------------------------

void to_json(nlohmann::json& j, const MetaValue& value) {
    std::visit(overload{
        [&](const std::string& s) { j = s; },
        [&](std::int64_t i) { j = i; },
        [&](double d) { j = d; },
        [&](bool b) { j = b; },
        [&](const MetaList& items) {
            j = nlohmann::json::array();
            for (const auto& item : items) j.push_back(item);
        },
    }, value.inner);
}

void from_json(const nlohmann::json& j, MetaValue& value) {
    if (j.is_boolean()) {
        value = MetaValue{j.get<bool>()};
    } else if (j.is_number_integer()) {
        value = MetaValue{j.get<std::int64_t>()};
    } else if (j.is_number_float()) {
        value = MetaValue{j.get<double>()};
    } else if (j.is_string()) {
        value = MetaValue{j.get<std::string>()};
    } else if (j.is_array()) {
        auto items = MetaList{};
        for (const auto& item : j) items.push_back(item.get<MetaValue>());
        value = MetaValue{std::move(items)};
    } else {
        throw std::runtime_error{"cannot convert JSON to MetaValue"};
    }
}

// Entries are an array so that declaration order survives.
void to_json(nlohmann::json& j, const Metadata& metadata) {
    auto entries = nlohmann::json::array();
    for (const auto& [key, value] : metadata) {
        entries.push_back(nlohmann::json{{"key", key}, {"value", value}});
    }
    j = nlohmann::json{{"entries", std::move(entries)}, {"span", metadata.span}};
}

void from_json(const nlohmann::json& j, Metadata& metadata) {
    metadata = Metadata{};
    for (const auto& entry : j.at("entries")) {
        metadata.set(entry.at("key").get<std::string>(), entry.at("value").get<MetaValue>());
    }
    if (j.contains("span")) metadata.span = j["span"].get<Span>();
}

// -- Tree ---------------------------------------------------------------------

void to_json(nlohmann::json& j, const Inline& node) {
    j = tagged(to_string_view(node.kind()), node.span());
    std::visit(overload{
        [&](const Text& n) { j["content"] = n.content; },
        [&](const CodeSpan& n) { j["content"] = n.content; },
        [&](const Link& n) {
            j["label"] = n.label;
            j["destination"] = n.destination;
        },
        [&](const AutoLink& n) { j["destination"] = n.destination; },
        [&](const FootnoteRef& n) { j["id"] = n.id; },
        [&](const HardBreak&) {},
        [&](const SoftBreak&) {},
        [&](const auto& n) { j["children"] = n.children; },
    }, node.inner);
}

void to_json(nlohmann::json& j, const TableCell& cell) {
    j = nlohmann::json{{"content", cell.content}, {"span", cell.span}};
}

void to_json(nlohmann::json& j, const TableRow& row) {
    j = nlohmann::json{{"header", row.header}, {"cells", row.cells}, {"span", row.span}};
}

void to_json(nlohmann::json& j, const ListItem& item) {
    j = nlohmann::json{{"blocks", item.blocks}, {"span", item.span}};
}

void to_json(nlohmann::json& j, const FootnoteDef& def) {
    j = nlohmann::json{{"id", def.id}, {"blocks", def.blocks}, {"span", def.span}};
}

void to_json(nlohmann::json& j, const Block& node) {
    j = tagged(to_string_view(node.kind()), node.span());
    std::visit(overload{
        [&](const Heading& n) {
            j["level"] = n.level;
            j["content"] = n.content;
        },
        [&](const Paragraph& n) { j["content"] = n.content; },
        [&](const List& n) {
            j["kind"] = std::string{to_string_view(n.kind)};
            if (n.start) j["start"] = *n.start;
            j["items"] = n.items;
        },
        [&](const CodeBlock& n) {
            j["lang"] = n.lang ? nlohmann::json(*n.lang) : nlohmann::json(nullptr);
            j["content"] = n.content;
        },
        [&](const Callout& n) {
            j["kind"] = n.kind;
            if (n.title) j["title"] = *n.title;
            j["blocks"] = n.blocks;
        },
        [&](const Quote& n) { j["blocks"] = n.blocks; },
        [&](const Figure& n) {
            j["src"] = n.src;
            j["alt"] = n.alt;
            if (n.caption) j["caption"] = *n.caption;
            j["blocks"] = n.blocks;
        },
        [&](const Table& n) {
            j["columns"] = n.column_count();
            j["rows"] = n.rows;
        },
        [&](const Footnotes& n) { j["defs"] = n.defs; },
        [&](const MathBlock& n) {
            j["display"] = n.display;
            j["content"] = n.content;
        },
        [&](const ThematicBreak&) {},
        [&](const HtmlBlock& n) { j["content"] = n.content; },
        [&](const RawBlock& n) {
            j["name"] = n.name;
            j["content"] = n.content;
        },
    }, node.inner);
}

void to_json(nlohmann::json& j, const Document& doc) {
    j = nlohmann::json{
        {"profile", doc.profile},
        {"modules", doc.modules},
        {"metadata", doc.metadata ? nlohmann::json(*doc.metadata) : nlohmann::json(nullptr)},
        {"blocks", doc.blocks},
        {"span", doc.span},
    };
}

// -- Results ------------------------------------------------------------------

void to_json(nlohmann::json& j, const ParseError& error) {
    j = nlohmann::json{
        {"kind", error.kind},
        {"message", error.message},
        {"recovery", std::string{to_string_view(recovery_action(error.kind))}},
        {"span", error.span},
    };
}

void to_json(nlohmann::json& j, const ParseResult& result) {
    j = nlohmann::json{
        {"ok", result.ok},
        {"document", result.document},
        {"errors", result.errors},
    };
}

void to_json(nlohmann::json& j, const DocumentStats& stats) {
    auto blocks = nlohmann::json::object();
    for (std::size_t k = 0; k < stats.blocks_by_kind.size(); ++k) {
        blocks[std::string{to_string_view(static_cast<BlockKind>(k))}] = stats.blocks_by_kind[k];
    }
    auto inlines = nlohmann::json::object();
    for (std::size_t k = 0; k < stats.inlines_by_kind.size(); ++k) {
        inlines[std::string{to_string_view(static_cast<InlineKind>(k))}] = stats.inlines_by_kind[k];
    }
    j = nlohmann::json{
        {"total_blocks", stats.total_blocks},
        {"blocks_by_kind", std::move(blocks)},
        {"total_inlines", stats.total_inlines},
        {"inlines_by_kind", std::move(inlines)},
        {"list_items", stats.list_items},
        {"table_rows", stats.table_rows},
        {"footnote_defs", stats.footnote_defs},
        {"max_depth", stats.max_depth},
        {"metadata_entries", stats.metadata_entries},
        {"bytes", stats.bytes},
        {"words", stats.words},
        {"lines", stats.lines},
    };
}

// =============================================================================
// Document export
// =============================================================================

auto export_json(const Document& doc, bool include_spans) -> nlohmann::json {
    auto j = nlohmann::json(doc);
    if (!include_spans) strip_spans(j);
    return j;
}

}  // namespace litedoc_cpp
