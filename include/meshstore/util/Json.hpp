#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace meshstore::util {

enum class JsonType { Null, Boolean, Number, String, Object, Array };

struct JsonValue {
    JsonType type{JsonType::Null};
    bool bool_value{false};
    double number_value{0.0};
    std::string number_text;
    std::string string_value;
    std::vector<JsonValue> array_value;
    std::vector<std::pair<std::string, JsonValue>> object_value;

    static JsonValue null();
    static JsonValue boolean(bool value);
    static JsonValue integer(std::int64_t value);
    static JsonValue unsigned_integer(std::uint64_t value);
    static JsonValue number(double value);
    static JsonValue string(std::string value);
    static JsonValue object();
    static JsonValue array();

    bool is_null() const { return type == JsonType::Null; }
    bool is_bool() const { return type == JsonType::Boolean; }
    bool is_number() const { return type == JsonType::Number; }
    bool is_string() const { return type == JsonType::String; }
    bool is_object() const { return type == JsonType::Object; }
    bool is_array() const { return type == JsonType::Array; }

    const JsonValue* find(std::string_view key) const;

    // Appends or replaces a member; the value must be an object.
    JsonValue& set(std::string key, JsonValue value);
    JsonValue& push(JsonValue value);

    // Integral view of a number without a fractional part or exponent.
    std::optional<std::uint64_t> as_uint64() const;
    std::optional<std::int64_t> as_int64() const;

    // indent < 0 produces compact output.
    std::string dump(int indent = -1) const;
};

// Throws std::runtime_error on malformed input.
JsonValue parse_json(std::string_view text);

std::string escape_json(std::string_view value);

}  // namespace meshstore::util
