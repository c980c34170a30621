/// @file json.hpp
/// @brief nlohmann/json serialization for documents and diagnostics.
///
/// Every node serializes as an object with a `"type"` tag (the BlockKind
/// or InlineKind name), its fields, and a `"span"` of `{start, end}`.

#pragma once

#include <litedoc-cpp/ast.hpp>
#include <litedoc-cpp/error.hpp>
#include <litedoc-cpp/metadata.hpp>
#include <litedoc-cpp/parser.hpp>
#include <litedoc-cpp/profile.hpp>
#include <litedoc-cpp/span.hpp>
#include <litedoc-cpp/stats.hpp>

#include <nlohmann/json.hpp>

namespace litedoc_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- Leaf types ---------------------------------------------------------------

void to_json(nlohmann::json& j, const Span& span);
void from_json(const nlohmann::json& j, Span& span);

void to_json(nlohmann::json& j, Profile profile);
void from_json(const nlohmann::json& j, Profile& profile);

void to_json(nlohmann::json& j, Module m);
void from_json(const nlohmann::json& j, Module& m);

void to_json(nlohmann::json& j, ParseErrorKind kind);

// -- Metadata -----------------------------------------------------------------

void to_json(nlohmann::json& j, const MetaValue& value);
void from_json(const nlohmann::json& j, MetaValue& value);

void to_json(nlohmann::json& j, const Metadata& metadata);
void from_json(const nlohmann::json& j, Metadata& metadata);

// -- Tree ---------------------------------------------------------------------

void to_json(nlohmann::json& j, const Inline& node);
void to_json(nlohmann::json& j, const Block& node);
void to_json(nlohmann::json& j, const ListItem& item);
void to_json(nlohmann::json& j, const TableRow& row);
void to_json(nlohmann::json& j, const TableCell& cell);
void to_json(nlohmann::json& j, const FootnoteDef& def);
void to_json(nlohmann::json& j, const Document& doc);

// -- Results ------------------------------------------------------------------

void to_json(nlohmann::json& j, const ParseError& error);
void to_json(nlohmann::json& j, const ParseResult& result);
void to_json(nlohmann::json& j, const DocumentStats& stats);

// =============================================================================
// Document export
// =============================================================================

/// Export a document as JSON.
/// @param doc The document to export.
/// @param include_spans Whether nodes carry their `"span"` member.
auto export_json(const Document& doc, bool include_spans = true) -> nlohmann::json;

}  // namespace litedoc_cpp
