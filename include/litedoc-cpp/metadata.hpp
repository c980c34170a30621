/// @file metadata.hpp
/// @brief Front-matter values and the ordered key/value Metadata map.

#pragma once

#include <litedoc-cpp/span.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace litedoc_cpp {

struct MetaValue;

/// A bracketed list value: `[a, "b", 3]`.
using MetaList = std::vector<MetaValue>;

/// A typed front-matter value.
///
/// Alternatives: string, int64_t, double, bool, MetaList.
struct MetaValue {
    std::variant<std::string, std::int64_t, double, bool, MetaList> inner;

    /// Default-constructs to the empty string.
    MetaValue() : inner{std::string{}} {}

    MetaValue(std::string s) : inner{std::move(s)} {}
    MetaValue(std::string_view s) : inner{std::string{s}} {}
    MetaValue(const char* s) : inner{std::string{s}} {}
    MetaValue(std::int64_t i) : inner{i} {}
    MetaValue(int i) : inner{std::int64_t{i}} {}
    MetaValue(double d) : inner{d} {}
    MetaValue(bool b) : inner{b} {}
    MetaValue(MetaList items) : inner{std::move(items)} {}

    auto is_string() const -> bool { return std::holds_alternative<std::string>(inner); }
    auto is_int() const -> bool { return std::holds_alternative<std::int64_t>(inner); }
    auto is_float() const -> bool { return std::holds_alternative<double>(inner); }
    auto is_bool() const -> bool { return std::holds_alternative<bool>(inner); }
    auto is_list() const -> bool { return std::holds_alternative<MetaList>(inner); }

    auto operator==(const MetaValue& other) const -> bool = default;
};

/// Extract a typed value, or nullopt on type mismatch.
/// @code
/// auto title = get_value<std::string>(value);
/// @endcode
template <typename T>
auto get_value(const MetaValue& v) -> std::optional<T> {
    if (const auto* t = std::get_if<T>(&v.inner)) {
        return *t;
    }
    return std::nullopt;
}

/// Render a value the way it would be written in front matter.
auto to_string(const MetaValue& value) -> std::string;

/// Ordered key/value mapping parsed from the `--- meta ---` section.
///
/// Keys keep their declaration order; setting an existing key replaces
/// its value in place.
///
/// @code
/// if (doc.metadata && doc.metadata->contains("title")) {
///     auto title = doc.metadata->get<std::string>("title");
/// }
/// @endcode
class Metadata {
public:
    using Entry = std::pair<std::string, MetaValue>;
    using const_iterator = std::vector<Entry>::const_iterator;

    Metadata() = default;

    /// Membership test.
    auto contains(std::string_view key) const -> bool;

    /// Look up a value. Returns nullopt if the key is absent.
    auto get(std::string_view key) const -> std::optional<MetaValue>;

    /// Look up a value, or return `fallback` if the key is absent.
    auto get(std::string_view key, MetaValue fallback) const -> MetaValue;

    /// Look up a typed value. Returns nullopt if absent or of another type.
    template <typename T>
    auto get(std::string_view key) const -> std::optional<T> {
        const auto* v = find(key);
        if (!v) return std::nullopt;
        return get_value<T>(*v);
    }

    /// Look up a value. @throws std::out_of_range if the key is absent.
    auto at(std::string_view key) const -> const MetaValue&;

    /// Equivalent to at().
    auto operator[](std::string_view key) const -> const MetaValue& { return at(key); }

    /// Insert or replace a value.
    void set(std::string key, MetaValue value);

    auto size() const noexcept -> std::size_t { return entries_.size(); }
    auto empty() const noexcept -> bool { return entries_.empty(); }
    auto entries() const noexcept -> const std::vector<Entry>& { return entries_; }
    auto begin() const noexcept -> const_iterator { return entries_.begin(); }
    auto end() const noexcept -> const_iterator { return entries_.end(); }

    /// Source range of the whole front-matter section.
    Span span{};

    auto operator==(const Metadata&) const -> bool = default;

private:
    auto find(std::string_view key) const -> const MetaValue*;

    std::vector<Entry> entries_;
};

}  // namespace litedoc_cpp
