#include <litedoc-cpp/json.hpp>
#include <litedoc-cpp/litedoc.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ld = litedoc_cpp;
using json = nlohmann::json;

namespace {

auto has_key_anywhere(const json& j, const std::string& key) -> bool {
    if (j.is_object()) {
        if (j.contains(key)) return true;
        for (const auto& [k, v] : j.items()) {
            if (has_key_anywhere(v, key)) return true;
        }
    } else if (j.is_array()) {
        for (const auto& v : j) {
            if (has_key_anywhere(v, key)) return true;
        }
    }
    return false;
}

}  // namespace

// =============================================================================
// Leaf types
// =============================================================================

TEST(JsonSpan, object_with_start_and_end) {
    const auto j = json(ld::Span{3, 9});
    EXPECT_EQ(j, (json{{"start", 3}, {"end", 9}}));
    EXPECT_EQ(j.get<ld::Span>(), (ld::Span{3, 9}));
}

TEST(JsonProfile, canonical_names) {
    EXPECT_EQ(json(ld::Profile::md_strict), "md-strict");
    EXPECT_EQ(json("md").get<ld::Profile>(), ld::Profile::md);
    EXPECT_THROW(json("rst").get<ld::Profile>(), std::runtime_error);
}

TEST(JsonErrorKind, snake_case_name) {
    EXPECT_EQ(json(ld::ParseErrorKind::malformed_table), "malformed_table");
}

// =============================================================================
// Metadata
// =============================================================================

TEST(JsonMetaValue, scalar_types) {
    EXPECT_EQ(json(ld::MetaValue{std::string{"x"}}), "x");
    EXPECT_EQ(json(ld::MetaValue{std::int64_t{42}}), 42);
    EXPECT_EQ(json(ld::MetaValue{true}), true);
    EXPECT_DOUBLE_EQ(json(ld::MetaValue{2.5}).get<double>(), 2.5);
}

TEST(JsonMetaValue, list_and_back) {
    const auto value = ld::MetaValue{ld::MetaList{
        ld::MetaValue{std::string{"a"}}, ld::MetaValue{std::int64_t{1}}}};
    const auto j = json(value);
    ASSERT_TRUE(j.is_array());
    EXPECT_EQ(j[0], "a");
    EXPECT_EQ(j[1], 1);
    EXPECT_EQ(j.get<ld::MetaValue>(), value);
}

TEST(JsonMetaValue, objects_are_rejected) {
    EXPECT_THROW(json::object().get<ld::MetaValue>(), std::runtime_error);
}

TEST(JsonMetadata, entries_keep_declaration_order) {
    const auto doc = ld::parse("--- meta ---\nzeta: 1\nalpha: two\n---\n");
    ASSERT_TRUE(doc.metadata.has_value());

    const auto j = json(*doc.metadata);
    ASSERT_EQ(j["entries"].size(), 2u);
    EXPECT_EQ(j["entries"][0]["key"], "zeta");
    EXPECT_EQ(j["entries"][0]["value"], 1);
    EXPECT_EQ(j["entries"][1]["key"], "alpha");
    EXPECT_EQ(j["entries"][1]["value"], "two");

    EXPECT_EQ(j.get<ld::Metadata>(), *doc.metadata);
}

// =============================================================================
// Document export
// =============================================================================

TEST(JsonDocument, heading_with_emphasis) {
    const auto doc = ld::parse("# Hi *there*");
    const auto j = ld::export_json(doc);

    EXPECT_EQ(j["profile"], "litedoc");
    EXPECT_TRUE(j["metadata"].is_null());
    ASSERT_EQ(j["blocks"].size(), 1u);

    const auto& heading = j["blocks"][0];
    EXPECT_EQ(heading["type"], "Heading");
    EXPECT_EQ(heading["level"], 1);
    EXPECT_EQ(heading["span"], (json{{"start", 0}, {"end", 12}}));
    ASSERT_EQ(heading["content"].size(), 2u);
    EXPECT_EQ(heading["content"][0]["type"], "Text");
    EXPECT_EQ(heading["content"][0]["content"], "Hi ");
    EXPECT_EQ(heading["content"][1]["type"], "Emphasis");
    EXPECT_EQ(heading["content"][1]["children"][0]["content"], "there");
}

TEST(JsonDocument, modules_are_listed_by_name) {
    EXPECT_TRUE(ld::export_json(ld::parse("text"))["modules"].empty());

    const auto j = ld::export_json(ld::parse("@modules footnotes, html\ntext"));
    EXPECT_EQ(j["modules"], (json{"footnotes", "html"}));
    EXPECT_EQ(json(ld::Module::strikethrough), "strikethrough");
    EXPECT_EQ(json("autolink").get<ld::Module>(), ld::Module::autolink);
    EXPECT_THROW((void)json("emoji").get<ld::Module>(), std::runtime_error);
}

TEST(JsonDocument, spans_can_be_omitted) {
    const auto doc = ld::parse("--- meta ---\na: 1\n---\n- x\n- [y](z)\n");
    EXPECT_TRUE(has_key_anywhere(ld::export_json(doc), "span"));
    const auto bare = ld::export_json(doc, false);
    EXPECT_FALSE(has_key_anywhere(bare, "span"));
    EXPECT_EQ(bare["blocks"][0]["items"][1]["blocks"][0]["content"][0]["destination"], "z");
}

TEST(JsonDocument, block_specific_fields) {
    const auto doc = ld::parse(
        "```\ncode\n```\n"
        "\n"
        "3. a\n"
        "\n"
        "::callout type=tip\nx\n::\n"
        "\n"
        "| a | b |\n|---|---|\n"
        "\n"
        "::math display\ny\n::\n");
    const auto j = ld::export_json(doc, false);
    ASSERT_EQ(j["blocks"].size(), 5u);

    EXPECT_EQ(j["blocks"][0]["type"], "CodeBlock");
    EXPECT_TRUE(j["blocks"][0]["lang"].is_null());
    EXPECT_EQ(j["blocks"][0]["content"], "code");

    EXPECT_EQ(j["blocks"][1]["kind"], "ordered");
    EXPECT_EQ(j["blocks"][1]["start"], 3);

    EXPECT_EQ(j["blocks"][2]["kind"], "tip");
    EXPECT_FALSE(j["blocks"][2].contains("title"));

    EXPECT_EQ(j["blocks"][3]["columns"], 2);
    EXPECT_EQ(j["blocks"][3]["rows"][0]["header"], true);

    EXPECT_EQ(j["blocks"][4]["type"], "MathBlock");
    EXPECT_EQ(j["blocks"][4]["display"], true);
}

// =============================================================================
// Results
// =============================================================================

TEST(JsonParseResult, errors_carry_kind_and_recovery) {
    const auto result = ld::parse_with_recovery("::widget\nbody\n::");
    const auto j = json(result);

    EXPECT_EQ(j["ok"], false);
    EXPECT_EQ(j["document"]["blocks"][0]["type"], "RawBlock");
    EXPECT_EQ(j["document"]["blocks"][0]["name"], "widget");
    ASSERT_EQ(j["errors"].size(), 1u);
    EXPECT_EQ(j["errors"][0]["kind"], "unknown_directive");
    EXPECT_EQ(j["errors"][0]["recovery"], "substitute_raw");
    EXPECT_EQ(j["errors"][0]["span"], (json{{"start", 0}, {"end", 8}}));
}

TEST(JsonStats, counts_by_kind_name) {
    const auto text = std::string{"# T\n\nOne *two*.\n"};
    const auto stats = ld::compute_stats(ld::parse(text), text);
    const auto j = json(stats);

    EXPECT_EQ(j["total_blocks"], 2);
    EXPECT_EQ(j["blocks_by_kind"]["Heading"], 1);
    EXPECT_EQ(j["blocks_by_kind"]["Paragraph"], 1);
    EXPECT_EQ(j["inlines_by_kind"]["Emphasis"], 1);
    EXPECT_EQ(j["words"], 4);
    EXPECT_EQ(j["lines"], 3);
}
