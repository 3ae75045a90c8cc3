#pragma once

#include <string>
#include <cmath>
#include <charconv>
#include <cstdint>
#include <type_traits>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "pool/errors.hpp"

// Canonical form of a pool item. encode must be deterministic and
// collision free, decode(encode(x)) == x. Both throw MalformedItemError.
template <class T>
struct ItemCodec;

template <>
struct ItemCodec<std::string> {
    static std::string encode(const std::string& item) { return item; }
    static std::string decode(const std::string& element) { return element; }
};

// character types print as characters, not numbers, so they have no codec
template <class T>
inline constexpr bool is_char_type_v =
    std::is_same_v<T, char> || std::is_same_v<T, wchar_t> || std::is_same_v<T, char8_t>
    || std::is_same_v<T, char16_t> || std::is_same_v<T, char32_t>;

template <class T>
    requires (std::is_integral_v<T> && !std::is_same_v<T, bool> && !is_char_type_v<T>)
struct ItemCodec<T> {
    static std::string encode(T item) { return fmt::format("{}", item); }

    static T decode(const std::string& element) {
        T value{};
        const char* const end = element.data() + element.size();
        const auto [ptr, ec] = std::from_chars(element.data(), end, value);
        if (ec != std::errc() || ptr != end)
            throw MalformedItemError(fmt::format("\"{}\" is not a valid integer item", element));
        return value;
    }
};

// Compact dump, object keys come out sorted. Numbers are normalized first so
// items that compare equal (1 and 1.0, 0.0 and -0.0) share one canonical form.
template <>
struct ItemCodec<nlohmann::json> {

    static std::string encode(const nlohmann::json& item) {
        const nlohmann::json canonical = normalize(item);
        try {
            return canonical.dump();
        } catch (const nlohmann::json::type_error& e) {
            throw MalformedItemError(fmt::format("item cannot be encoded: {}", e.what()));
        }
    }

    static nlohmann::json decode(const std::string& element) {
        try {
            return nlohmann::json::parse(element);
        } catch (const nlohmann::json::parse_error& e) {
            throw MalformedItemError(fmt::format("\"{}\" is not a valid json item: {}", element, e.what()));
        }
    }

private:
    static nlohmann::json normalize(const nlohmann::json& item) {
        if (item.is_number_float())
            return normalizeFloat(item.get<double>());

        if (item.is_object()) {
            nlohmann::json out = nlohmann::json::object();
            for (const auto& [key, value] : item.items())
                out[key] = normalize(value);
            return out;
        }

        if (item.is_array()) {
            nlohmann::json out = nlohmann::json::array();
            for (const auto& value : item)
                out.push_back(normalize(value));
            return out;
        }

        return item;
    }

    // NaN and inf dump as null, which would collide with a real null.
    // Integral floats become integers, which also folds -0.0 into 0.
    static nlohmann::json normalizeFloat(double value) {
        if (!std::isfinite(value))
            throw MalformedItemError("item contains a non finite number");
        if (std::trunc(value) != value)
            return value;
        if (value >= -9223372036854775808.0 && value < 9223372036854775808.0)
            return static_cast<int64_t>(value);
        if (value >= 0 && value < 18446744073709551616.0)
            return static_cast<uint64_t>(value);
        return value;
    }

};
