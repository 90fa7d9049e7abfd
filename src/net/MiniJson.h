#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Small JSON document model. Objects keep insertion order so forwarded
// payloads serialize in the order they were built.
class JsonValue {
public:
    enum class Type { Null, Bool, Number, String, Array, Object };
    using Array = std::vector<JsonValue>;
    using Object = std::vector<std::pair<std::string, JsonValue>>;

    JsonValue() = default;
    JsonValue(std::nullptr_t) {}
    JsonValue(bool b);
    JsonValue(int v);
    JsonValue(int64_t v);
    JsonValue(double v);
    JsonValue(const char* s);
    JsonValue(std::string s);

    static JsonValue array();
    static JsonValue object();
    static JsonValue object(Object members);

    Type type() const { return type_; }
    bool is_null() const { return type_ == Type::Null; }
    bool is_bool() const { return type_ == Type::Bool; }
    bool is_number() const { return type_ == Type::Number; }
    bool is_integer() const { return type_ == Type::Number && is_int_; }
    bool is_string() const { return type_ == Type::String; }
    bool is_array() const { return type_ == Type::Array; }
    bool is_object() const { return type_ == Type::Object; }

    // Accessors throw std::runtime_error on a type mismatch.
    bool as_bool() const;
    int64_t as_int() const;
    double as_double() const;
    const std::string& as_string() const;
    const Array& as_array() const;
    const Object& as_object() const;

    // nullptr when this is not an object or the key is absent
    const JsonValue* find(const std::string& key) const;
    JsonValue& set(const std::string& key, JsonValue v);
    JsonValue& push_back(JsonValue v);
    size_t size() const;

    bool operator==(const JsonValue& o) const;
    bool operator!=(const JsonValue& o) const { return !(*this == o); }

private:
    Type type_ = Type::Null;
    bool bool_ = false;
    bool is_int_ = false;
    int64_t int_ = 0;
    double double_ = 0.0;
    std::string str_;
    Array arr_;
    Object obj_;
};

// Throws std::runtime_error describing the first syntax error.
JsonValue json_parse(std::string_view text);
std::optional<JsonValue> json_try_parse(std::string_view text);
std::string json_dump(const JsonValue& v);

std::string json_escape_resp(const std::string& s);


inline std::optional<int64_t> parse_int64_strict_sv(std::string_view s) {
    if (s.empty()) return std::nullopt;
    size_t i = 0;
    bool neg = false;
    if (s[i] == '-') { neg = true; ++i; }
    else if (s[i] == '+') { ++i; }
    if (i >= s.size()) return std::nullopt;

    const uint64_t maxAbs = neg ? (uint64_t(std::numeric_limits<int64_t>::max()) + 1ULL) : uint64_t(std::numeric_limits<int64_t>::max());
    uint64_t v = 0;
    for (; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c < '0' || c > '9') return std::nullopt;
        uint64_t d = uint64_t(c - '0');
        if (v > (maxAbs - d) / 10) return std::nullopt;
        v = v * 10 + d;
    }

    if (!neg) return static_cast<int64_t>(v);
    if (v == (uint64_t(std::numeric_limits<int64_t>::max()) + 1ULL)) return std::numeric_limits<int64_t>::min();
    return -static_cast<int64_t>(v);
}
