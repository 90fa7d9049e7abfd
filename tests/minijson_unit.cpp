
#include <chrono>
#include <iostream>
#include <string>
#include <optional>
#include <limits>
#include <stdexcept>
#include "net/MiniJson.h"

static bool throws_parse(const std::string& text) {
    try { json_parse(text); } catch (const std::runtime_error&) { return true; }
    return false;
}

int main() {

    auto e1 = json_escape_resp("abc");
    if (e1 != "abc") { std::cerr << "json_escape_resp changed plain text\n"; return 1; }
    auto e2 = json_escape_resp("a\"b");
    if (e2.find("\\\"") == std::string::npos) { std::cerr << "json_escape_resp did not escape quote\n"; return 1; }
    auto e4 = json_escape_resp("\n\t\r");
    if (e4.find("\\n") == std::string::npos || e4.find("\\t") == std::string::npos || e4.find("\\r") == std::string::npos) { std::cerr << "json_escape_resp did not escape control chars\n"; return 1; }

    // document parsing keeps types and key order
    {
        auto doc = json_parse(" {\"resources\":[{\"id\":5}],\"timeslot\":{\"start\":\"2024-01-01T10:00:00Z\",\"end\":null},\"n\":-2.5,\"ok\":true} ");
        if (!doc.is_object() || doc.size() != 4) { std::cerr << "object shape mismatch\n"; return 1; }
        const auto& members = doc.as_object();
        if (members[0].first != "resources" || members[3].first != "ok") { std::cerr << "key order not preserved\n"; return 1; }
        const JsonValue* res = doc.find("resources");
        if (!res || !res->is_array() || res->size() != 1) { std::cerr << "resources array missing\n"; return 1; }
        const JsonValue* id = res->as_array()[0].find("id");
        if (!id || !id->is_integer() || id->as_int() != 5) { std::cerr << "nested id mismatch\n"; return 1; }
        const JsonValue* ts = doc.find("timeslot");
        if (!ts || !ts->find("end") || !ts->find("end")->is_null()) { std::cerr << "null member not kept\n"; return 1; }
        const JsonValue* n = doc.find("n");
        if (!n || n->is_integer() || n->as_double() != -2.5) { std::cerr << "fractional number mismatch\n"; return 1; }
        if (!doc.find("ok")->as_bool()) { std::cerr << "bool mismatch\n"; return 1; }
        if (doc.find("missing") != nullptr) { std::cerr << "find returned absent key\n"; return 1; }
    }

    // dump is compact and round-trips the same document
    {
        std::string text = "{\"name\":\"Room A\",\"ids\":[1,2,3],\"nested\":{\"x\":null,\"y\":false}}";
        auto doc = json_parse(text);
        if (json_dump(doc) != text) { std::cerr << "dump mismatch: " << json_dump(doc) << "\n"; return 1; }
        if (json_parse(json_dump(doc)) != doc) { std::cerr << "reparsed document differs\n"; return 1; }
    }

    // unicode escapes, including surrogate pairs
    {
        auto s = json_parse("\"caf\\u00e9 \\ud83d\\ude00\"");
        if (s.as_string() != "caf\xc3\xa9 \xf0\x9f\x98\x80") { std::cerr << "unicode decode mismatch\n"; return 1; }
        auto raw = json_parse("\"\xd0\xbf\xd1\x80\xd0\xb8\xd0\xb2\xd0\xb5\xd1\x82\"");
        if (raw.as_string() != "\xd0\xbf\xd1\x80\xd0\xb8\xd0\xb2\xd0\xb5\xd1\x82") { std::cerr << "raw utf8 not preserved\n"; return 1; }
    }

    // integers stay exact up to int64 range
    {
        auto big = json_parse("9223372036854775807");
        if (!big.is_integer() || big.as_int() != std::numeric_limits<int64_t>::max()) { std::cerr << "int64 max lost\n"; return 1; }
        auto over = json_parse("9223372036854775808");
        if (over.is_integer()) { std::cerr << "overflowing integer should become double\n"; return 1; }
        if (json_dump(JsonValue(std::numeric_limits<double>::infinity())) != "null") { std::cerr << "non-finite should dump as null\n"; return 1; }
    }

    // builders
    {
        JsonValue payload = JsonValue::object();
        payload.set("id", int64_t(42));
        payload.set("status", "CANCELLED");
        payload.set("id", 43);
        if (json_dump(payload) != "{\"id\":43,\"status\":\"CANCELLED\"}") { std::cerr << "set should replace in place: " << json_dump(payload) << "\n"; return 1; }
        JsonValue arr = JsonValue::array();
        arr.push_back(JsonValue::object().set("id", 1));
        if (json_dump(arr) != "[{\"id\":1}]") { std::cerr << "array builder mismatch\n"; return 1; }
        if (json_dump(JsonValue::object()) != "{}" || json_dump(JsonValue::array()) != "[]") { std::cerr << "empty containers mismatch\n"; return 1; }
    }

    // accessor type mismatches throw
    {
        bool threw = false;
        try { JsonValue("x").as_int(); } catch (const std::runtime_error&) { threw = true; }
        if (!threw) { std::cerr << "as_int on string did not throw\n"; return 1; }
    }

    // duplicate keys keep the first position with the last value
    {
        auto doc = json_parse("{\"a\":1,\"b\":2,\"a\":3}");
        if (json_dump(doc) != "{\"a\":3,\"b\":2}") { std::cerr << "duplicate key handling mismatch: " << json_dump(doc) << "\n"; return 1; }
    }

    // a body-sized object with many distinct keys parses in linear time
    {
        std::string text = "{";
        for (int i = 0; i < 100000; ++i) {
            if (i) text += ',';
            text += "\"k" + std::to_string(i) + "\":" + std::to_string(i);
        }
        text += '}';
        auto t0 = std::chrono::steady_clock::now();
        auto doc = json_try_parse(text);
        double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        if (!doc || doc->size() != 100000) { std::cerr << "many-key object not parsed\n"; return 1; }
        if (secs > 2.0) { std::cerr << "many-key object took " << secs << "s to parse\n"; return 1; }
        const JsonValue* last = doc->find("k99999");
        if (!last || last->as_int() != 99999) { std::cerr << "last key lookup mismatch\n"; return 1; }
    }

    // invalid UTF-8 is replaced so dumped output stays valid
    {
        if (json_escape_resp("caf\xc3\xa9") != "caf\xc3\xa9") { std::cerr << "valid utf8 altered\n"; return 1; }
        if (json_escape_resp("a\xff b") != "a\xef\xbf\xbd b") { std::cerr << "stray byte not replaced\n"; return 1; }
        if (json_escape_resp("x\xe2\x82") != "x\xef\xbf\xbd") { std::cerr << "truncated sequence not replaced once\n"; return 1; }
        if (json_escape_resp("\xed\xa0\x80") != "\xef\xbf\xbd\xef\xbf\xbd\xef\xbf\xbd") { std::cerr << "encoded surrogate not rejected\n"; return 1; }
        if (json_escape_resp("\xf0\x9f\x98\x80") != "\xf0\x9f\x98\x80") { std::cerr << "4-byte sequence altered\n"; return 1; }
        if (json_dump(JsonValue(std::string("bad \x80\"q\""))) != "\"bad \xef\xbf\xbd\\\"q\\\"\"") { std::cerr << "dump of invalid utf8 string mismatch\n"; return 1; }
    }

    // malformed documents
    const char* bad[] = {"", "{", "[1,", "{a:1}", "{\"a\" 1}", "[1 2]", "01", "1.", "-", "tru", "\"abc", "\"\\x\"",
                         "\"\\ud83d\"", "{} extra", "\"a\nb\""};
    for (const char* b : bad) {
        if (!throws_parse(b)) { std::cerr << "accepted malformed json: " << b << "\n"; return 1; }
    }
    if (json_try_parse("not json")) { std::cerr << "json_try_parse accepted garbage\n"; return 1; }
    if (!json_try_parse("[]")) { std::cerr << "json_try_parse rejected []\n"; return 1; }

    try {
        json_parse("{\"a\":}");
        std::cerr << "missing value accepted\n"; return 1;
    } catch (const std::runtime_error& e) {
        if (std::string(e.what()).find("offset 5") == std::string::npos) { std::cerr << "error lacks offset: " << e.what() << "\n"; return 1; }
    }

    {
        std::string deep(200, '[');
        deep += std::string(200, ']');
        if (!throws_parse(deep)) { std::cerr << "nesting limit not enforced\n"; return 1; }
    }

    if (parse_int64_strict_sv("42") != 42 || parse_int64_strict_sv("+7") != 7 || parse_int64_strict_sv("-0") != 0) { std::cerr << "parse_int64_strict_sv mismatch\n"; return 1; }
    if (parse_int64_strict_sv("4x") || parse_int64_strict_sv("") || parse_int64_strict_sv(" 1")) { std::cerr << "parse_int64_strict_sv accepted junk\n"; return 1; }

    std::cout << "minijson_unit ok\n";
    return 0;
}
