#include "MiniJson.h"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <unordered_map>

JsonValue::JsonValue(bool b) : type_(Type::Bool), bool_(b) {}
JsonValue::JsonValue(int v) : type_(Type::Number), is_int_(true), int_(v), double_(v) {}
JsonValue::JsonValue(int64_t v) : type_(Type::Number), is_int_(true), int_(v), double_(static_cast<double>(v)) {}
JsonValue::JsonValue(double v) : type_(Type::Number), double_(v) {}
JsonValue::JsonValue(const char* s) : type_(Type::String), str_(s) {}
JsonValue::JsonValue(std::string s) : type_(Type::String), str_(std::move(s)) {}

JsonValue JsonValue::array() { JsonValue v; v.type_ = Type::Array; return v; }
JsonValue JsonValue::object() { JsonValue v; v.type_ = Type::Object; return v; }
JsonValue JsonValue::object(Object members) { JsonValue v; v.type_ = Type::Object; v.obj_ = std::move(members); return v; }

bool JsonValue::as_bool() const {
    if (type_ != Type::Bool) throw std::runtime_error("json value is not a boolean");
    return bool_;
}

int64_t JsonValue::as_int() const {
    if (!is_integer()) throw std::runtime_error("json value is not an integer");
    return int_;
}

double JsonValue::as_double() const {
    if (type_ != Type::Number) throw std::runtime_error("json value is not a number");
    return is_int_ ? static_cast<double>(int_) : double_;
}

const std::string& JsonValue::as_string() const {
    if (type_ != Type::String) throw std::runtime_error("json value is not a string");
    return str_;
}

const JsonValue::Array& JsonValue::as_array() const {
    if (type_ != Type::Array) throw std::runtime_error("json value is not an array");
    return arr_;
}

const JsonValue::Object& JsonValue::as_object() const {
    if (type_ != Type::Object) throw std::runtime_error("json value is not an object");
    return obj_;
}

const JsonValue* JsonValue::find(const std::string& key) const {
    if (type_ != Type::Object) return nullptr;
    for (const auto& kv : obj_) {
        if (kv.first == key) return &kv.second;
    }
    return nullptr;
}

JsonValue& JsonValue::set(const std::string& key, JsonValue v) {
    if (type_ == Type::Null) type_ = Type::Object;
    if (type_ != Type::Object) throw std::runtime_error("json set on non-object");
    for (auto& kv : obj_) {
        if (kv.first == key) { kv.second = std::move(v); return *this; }
    }
    obj_.emplace_back(key, std::move(v));
    return *this;
}

JsonValue& JsonValue::push_back(JsonValue v) {
    if (type_ == Type::Null) type_ = Type::Array;
    if (type_ != Type::Array) throw std::runtime_error("json push_back on non-array");
    arr_.push_back(std::move(v));
    return *this;
}

size_t JsonValue::size() const {
    if (type_ == Type::Array) return arr_.size();
    if (type_ == Type::Object) return obj_.size();
    return 0;
}

bool JsonValue::operator==(const JsonValue& o) const {
    if (type_ != o.type_) return false;
    switch (type_) {
        case Type::Null: return true;
        case Type::Bool: return bool_ == o.bool_;
        case Type::Number:
            if (is_int_ && o.is_int_) return int_ == o.int_;
            return as_double() == o.as_double();
        case Type::String: return str_ == o.str_;
        case Type::Array: return arr_ == o.arr_;
        case Type::Object: return obj_ == o.obj_;
    }
    return false;
}

namespace {

constexpr int kMaxDepth = 64;

class Parser {
public:
    explicit Parser(std::string_view s) : s_(s) {}

    JsonValue parse_document() {
        skip_ws();
        JsonValue v = parse_value(0);
        skip_ws();
        if (pos_ != s_.size()) fail("trailing characters after json value");
        return v;
    }

private:
    [[noreturn]] void fail(const char* what) const {
        throw std::runtime_error(std::string(what) + " at offset " + std::to_string(pos_));
    }

    void skip_ws() {
        while (pos_ < s_.size() && (s_[pos_] == ' ' || s_[pos_] == '\t' || s_[pos_] == '\n' || s_[pos_] == '\r')) ++pos_;
    }

    bool consume_literal(std::string_view lit) {
        if (s_.compare(pos_, lit.size(), lit) == 0) { pos_ += lit.size(); return true; }
        return false;
    }

    JsonValue parse_value(int depth) {
        if (depth > kMaxDepth) fail("json nesting too deep");
        if (pos_ >= s_.size()) fail("unexpected end of json");
        char c = s_[pos_];
        if (c == '{') return parse_object(depth);
        if (c == '[') return parse_array(depth);
        if (c == '"') return JsonValue(parse_string());
        if (c == '-' || (c >= '0' && c <= '9')) return parse_number();
        if (consume_literal("true")) return JsonValue(true);
        if (consume_literal("false")) return JsonValue(false);
        if (consume_literal("null")) return JsonValue();
        fail("unexpected character in json");
    }

    // Duplicate keys keep their first position and take the last value.
    JsonValue parse_object(int depth) {
        ++pos_;
        JsonValue::Object members;
        std::unordered_map<std::string, size_t> index;
        skip_ws();
        if (pos_ < s_.size() && s_[pos_] == '}') { ++pos_; return JsonValue::object(); }
        for (;;) {
            skip_ws();
            if (pos_ >= s_.size() || s_[pos_] != '"') fail("expected string key in json object");
            std::string key = parse_string();
            skip_ws();
            if (pos_ >= s_.size() || s_[pos_] != ':') fail("missing ':' after json object key");
            ++pos_;
            skip_ws();
            JsonValue value = parse_value(depth + 1);
            auto it = index.find(key);
            if (it != index.end()) {
                members[it->second].second = std::move(value);
            } else {
                index.emplace(key, members.size());
                members.emplace_back(std::move(key), std::move(value));
            }
            skip_ws();
            if (pos_ >= s_.size()) fail("unterminated json object");
            if (s_[pos_] == ',') { ++pos_; continue; }
            if (s_[pos_] == '}') { ++pos_; return JsonValue::object(std::move(members)); }
            fail("expected ',' or '}' in json object");
        }
    }

    JsonValue parse_array(int depth) {
        ++pos_;
        JsonValue arr = JsonValue::array();
        skip_ws();
        if (pos_ < s_.size() && s_[pos_] == ']') { ++pos_; return arr; }
        for (;;) {
            skip_ws();
            arr.push_back(parse_value(depth + 1));
            skip_ws();
            if (pos_ >= s_.size()) fail("unterminated json array");
            if (s_[pos_] == ',') { ++pos_; continue; }
            if (s_[pos_] == ']') { ++pos_; return arr; }
            fail("expected ',' or ']' in json array");
        }
    }

    unsigned read_hex4() {
        if (pos_ + 4 > s_.size()) fail("invalid unicode escape in json string");
        unsigned code = 0;
        for (int k = 0; k < 4; ++k) {
            char ch = s_[pos_++];
            code <<= 4;
            if (ch >= '0' && ch <= '9') code += ch - '0';
            else if (ch >= 'a' && ch <= 'f') code += 10 + (ch - 'a');
            else if (ch >= 'A' && ch <= 'F') code += 10 + (ch - 'A');
            else fail("invalid hex in unicode escape");
        }
        return code;
    }

    static void append_utf8(std::string& out, unsigned code) {
        if (code <= 0x7f) out.push_back(static_cast<char>(code));
        else if (code <= 0x7ff) {
            out.push_back(static_cast<char>(0xc0 | ((code >> 6) & 0x1f)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3f)));
        } else if (code <= 0xffff) {
            out.push_back(static_cast<char>(0xe0 | ((code >> 12) & 0x0f)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3f)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3f)));
        } else {
            out.push_back(static_cast<char>(0xf0 | ((code >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3f)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3f)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3f)));
        }
    }

    std::string parse_string() {
        ++pos_; // opening quote
        std::string out;
        for (;;) {
            if (pos_ >= s_.size()) fail("unterminated json string");
            char c = s_[pos_++];
            if (c == '"') return out;
            if (static_cast<unsigned char>(c) < 0x20) fail("control character in json string");
            if (c != '\\') { out.push_back(c); continue; }
            if (pos_ >= s_.size()) fail("unterminated escape in json string");
            char e = s_[pos_++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned code = read_hex4();
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        if (!consume_literal("\\u")) fail("unpaired surrogate in json string");
                        unsigned low = read_hex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("invalid low surrogate in json string");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        fail("unpaired surrogate in json string");
                    }
                    append_utf8(out, code);
                    break;
                }
                default: fail("unsupported escape in json string");
            }
        }
    }

    JsonValue parse_number() {
        size_t start = pos_;
        bool integral = true;
        if (s_[pos_] == '-') ++pos_;
        if (pos_ >= s_.size()) fail("invalid json number");
        if (s_[pos_] == '0') {
            ++pos_;
        } else if (s_[pos_] >= '1' && s_[pos_] <= '9') {
            while (pos_ < s_.size() && std::isdigit(static_cast<unsigned char>(s_[pos_]))) ++pos_;
        } else {
            fail("invalid json number");
        }
        if (pos_ < s_.size() && s_[pos_] == '.') {
            integral = false;
            ++pos_;
            size_t digits = pos_;
            while (pos_ < s_.size() && std::isdigit(static_cast<unsigned char>(s_[pos_]))) ++pos_;
            if (pos_ == digits) fail("invalid json number fraction");
        }
        if (pos_ < s_.size() && (s_[pos_] == 'e' || s_[pos_] == 'E')) {
            integral = false;
            ++pos_;
            if (pos_ < s_.size() && (s_[pos_] == '+' || s_[pos_] == '-')) ++pos_;
            size_t digits = pos_;
            while (pos_ < s_.size() && std::isdigit(static_cast<unsigned char>(s_[pos_]))) ++pos_;
            if (pos_ == digits) fail("invalid json number exponent");
        }
        std::string text(s_.substr(start, pos_ - start));
        if (integral) {
            if (auto v = parse_int64_strict_sv(text)) return JsonValue(*v);
        }
        return JsonValue(std::strtod(text.c_str(), nullptr));
    }

    std::string_view s_;
    size_t pos_ = 0;
};

void dump_into(std::string& out, const JsonValue& v) {
    switch (v.type()) {
        case JsonValue::Type::Null: out += "null"; break;
        case JsonValue::Type::Bool: out += v.as_bool() ? "true" : "false"; break;
        case JsonValue::Type::Number:
            if (v.is_integer()) {
                out += std::to_string(v.as_int());
            } else {
                double d = v.as_double();
                if (!std::isfinite(d)) { out += "null"; break; }
                char buf[32];
                std::snprintf(buf, sizeof(buf), "%.17g", d);
                out += buf;
            }
            break;
        case JsonValue::Type::String:
            out.push_back('"'); out += json_escape_resp(v.as_string()); out.push_back('"');
            break;
        case JsonValue::Type::Array: {
            out.push_back('[');
            bool first = true;
            for (const auto& e : v.as_array()) {
                if (!first) out.push_back(',');
                first = false;
                dump_into(out, e);
            }
            out.push_back(']');
            break;
        }
        case JsonValue::Type::Object: {
            out.push_back('{');
            bool first = true;
            for (const auto& kv : v.as_object()) {
                if (!first) out.push_back(',');
                first = false;
                out.push_back('"'); out += json_escape_resp(kv.first); out += "\":";
                dump_into(out, kv.second);
            }
            out.push_back('}');
            break;
        }
    }
}

} // namespace

JsonValue json_parse(std::string_view text) {
    return Parser(text).parse_document();
}

std::optional<JsonValue> json_try_parse(std::string_view text) {
    try {
        return json_parse(text);
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

std::string json_dump(const JsonValue& v) {
    std::string out;
    dump_into(out, v);
    return out;
}

// Length of the well-formed UTF-8 sequence at s[i], or the length of its
// maximal invalid prefix negated (at least -1).
static int utf8_sequence(const std::string& s, size_t i) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if (c < 0x80) return 1;
    int need;
    unsigned char lo = 0x80, hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) need = 1;
    else if (c == 0xE0) { need = 2; lo = 0xA0; }
    else if (c == 0xED) { need = 2; hi = 0x9F; }
    else if (c >= 0xE1 && c <= 0xEF) need = 2;
    else if (c == 0xF0) { need = 3; lo = 0x90; }
    else if (c == 0xF4) { need = 3; hi = 0x8F; }
    else if (c >= 0xF1 && c <= 0xF3) need = 3;
    else return -1;
    int len = 1;
    for (int k = 0; k < need; ++k, lo = 0x80, hi = 0xBF) {
        if (i + len >= s.size()) return -len;
        unsigned char cc = static_cast<unsigned char>(s[i + len]);
        if (cc < lo || cc > hi) return -len;
        ++len;
    }
    return len;
}

// escape chars for JSON response strings; escapes control chars < 0x20 with \u00XX
// and replaces each invalid UTF-8 subsequence with U+FFFD
std::string json_escape_resp(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out; out.reserve(s.size()+8);
    for (size_t i = 0; i < s.size();) {
        unsigned char uc = static_cast<unsigned char>(s[i]);
        if (uc >= 0x80) {
            int n = utf8_sequence(s, i);
            if (n > 0) { out.append(s, i, size_t(n)); i += size_t(n); }
            else { out += "\xEF\xBF\xBD"; i += size_t(-n); }
            continue;
        }
        ++i;
        if (uc == '"') { out += "\\\""; }
        else if (uc == '\\') { out += "\\\\"; }
        else if (uc == '\n') { out += "\\n"; }
        else if (uc == '\r') { out += "\\r"; }
        else if (uc == '\t') { out += "\\t"; }
        else if (uc < 0x20) {
            out.push_back('\\'); out.push_back('u'); out.push_back('0'); out.push_back('0');
            out.push_back(hex[(uc >> 4) & 0xF]); out.push_back(hex[uc & 0xF]);
        } else out.push_back((char)uc);
    }
    return out;
}
