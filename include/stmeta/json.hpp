#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace stmeta {

// ------------------------------
// JSON value model
// ------------------------------

struct JsonNumber {
    // Source text of the number. Serialization writes it back unchanged so
    // integers beyond 2^53 (tensor data offsets) survive a rewrite.
    std::string raw;
    double value = 0.0;
    bool is_int = false;
};

struct Json {
    using Array = std::vector<Json>;
    // Insertion ordered; header keys are written back in the order they were read.
    using Object = std::vector<std::pair<std::string, Json>>;

    std::variant<std::nullptr_t, bool, JsonNumber, std::string, Array, Object> v;

    bool is_null() const { return std::holds_alternative<std::nullptr_t>(v); }
    bool is_object() const { return std::holds_alternative<Object>(v); }
    bool is_array() const { return std::holds_alternative<Array>(v); }
    bool is_string() const { return std::holds_alternative<std::string>(v); }
    bool is_bool() const { return std::holds_alternative<bool>(v); }
    bool is_number() const { return std::holds_alternative<JsonNumber>(v); }
    bool is_composite() const { return is_object() || is_array(); }

    const Object& as_object() const;
    Object& as_object();
    const Array& as_array() const;
    Array& as_array();
    const std::string& as_string() const;
    bool as_bool() const;
    const JsonNumber& as_number() const;

    // Object helpers. find() returns nullptr when the key is absent or this is not an object.
    const Json* find(std::string_view key) const;
    Json* find(std::string_view key);
    void set(std::string key, Json value);
    bool erase(std::string_view key);

    static Json null();
    static Json boolean(bool b);
    static Json string(std::string s);
    static Json number(double d);
    static Json integer(std::int64_t i);
    static Json unsigned_integer(std::uint64_t u);
    static Json array(Array a = {});
    static Json object(Object o = {});
};

/// Strict UTF-8 validation (no overlongs, surrogates or code points above U+10FFFF).
bool is_valid_utf8(const std::uint8_t* data, std::size_t size);
bool is_valid_utf8(std::string_view s);

/// Strict JSON parser. Throws StmetaError(InvalidJson) on any syntax error, invalid UTF-8 or trailing data.
Json parse_json(std::string_view text);

/// Compact serialization (no whitespace). Throws StmetaError(SerializationError) on non-finite numbers.
std::string dump_json(const Json& j);

/// Semantic equality: numbers compare by value, objects ignore key order.
bool json_equal(const Json& a, const Json& b);

/// Shortest decimal text that round-trips the double.
std::string format_double(double d);

} // namespace stmeta
