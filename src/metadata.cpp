#include <litedoc-cpp/metadata.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace litedoc_cpp {

namespace {

auto format_double(double d) -> std::string {
    auto buf = std::array<char, 64>{};
    auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), d);
    if (ec != std::errc{}) return "nan";
    auto out = std::string{buf.data(), end};
    // Keep the '.' so the value reads back as a float.
    if (out.find_first_of(".en") == std::string::npos) out += ".0";
    return out;
}

}  // namespace

auto to_string(const MetaValue& value) -> std::string {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + v + "\"";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return format_double(v);
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else {
            auto out = std::string{"["};
            for (std::size_t i = 0; i < v.size(); ++i) {
                if (i > 0) out += ", ";
                out += to_string(v[i]);
            }
            out += "]";
            return out;
        }
    }, value.inner);
}

auto Metadata::find(std::string_view key) const -> const MetaValue* {
    auto it = std::ranges::find_if(entries_, [&](const Entry& e) { return e.first == key; });
    return it == entries_.end() ? nullptr : &it->second;
}

auto Metadata::contains(std::string_view key) const -> bool {
    return find(key) != nullptr;
}

auto Metadata::get(std::string_view key) const -> std::optional<MetaValue> {
    if (const auto* v = find(key)) return *v;
    return std::nullopt;
}

auto Metadata::get(std::string_view key, MetaValue fallback) const -> MetaValue {
    if (const auto* v = find(key)) return *v;
    return fallback;
}

auto Metadata::at(std::string_view key) const -> const MetaValue& {
    if (const auto* v = find(key)) return *v;
    throw std::out_of_range{"metadata key not found: " + std::string{key}};
}

void Metadata::set(std::string key, MetaValue value) {
    auto it = std::ranges::find_if(entries_, [&](const Entry& e) { return e.first == key; });
    if (it != entries_.end()) {
        it->second = std::move(value);
        return;
    }
    entries_.emplace_back(std::move(key), std::move(value));
}

}  // namespace litedoc_cpp
