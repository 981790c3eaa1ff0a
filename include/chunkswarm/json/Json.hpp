#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace chunkswarm::json {

enum class Type { Null, Boolean, Number, String, Object, Array };

struct Value {
    Type type{Type::Null};
    bool bool_value{false};
    double number_value{0.0};
    std::string string_value;
    std::vector<Value> array_value;
    std::vector<std::pair<std::string, Value>> object_value;

    static Value boolean(bool value);
    static Value number(double value);
    static Value string(std::string value);
    static Value array();
    static Value object();

    bool is_null() const { return type == Type::Null; }
    bool is_bool() const { return type == Type::Boolean; }
    bool is_number() const { return type == Type::Number; }
    bool is_string() const { return type == Type::String; }
    bool is_object() const { return type == Type::Object; }
    bool is_array() const { return type == Type::Array; }

    const Value* find(std::string_view key) const;

    // Object insert; replaces an existing key in place.
    Value& set(std::string key, Value value);
    Value& push_back(Value value);

    // Non-negative integral number that fits in uint64, or std::nullopt.
    std::optional<std::uint64_t> as_unsigned() const;
};

class ParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Throws ParseError on malformed input or trailing data.
Value parse(std::string_view input);

// Compact form, keys in insertion order.
std::string serialize(const Value& value);

}  // namespace chunkswarm::json
