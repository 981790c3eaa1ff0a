#include "chunkswarm/json/Json.hpp"

#include <cassert>
#include <string>

int main() {
    using namespace chunkswarm::json;

    const auto value = parse(R"({"file_name":"report.pdf","file_size":3670016,"chunks":[0,1,2,3],
                                 "ok":true,"none":null,"ratio":-1.5e2,"text":"a\"b\\c\u00e9\ud83d\ude00"})");
    assert(value.is_object());
    assert(value.find("file_name")->string_value == "report.pdf");
    assert(value.find("file_size")->as_unsigned() == 3670016u);
    assert(value.find("chunks")->array_value.size() == 4);
    assert(value.find("ok")->bool_value);
    assert(value.find("none")->is_null());
    assert(value.find("ratio")->number_value == -150.0);
    assert(!value.find("ratio")->as_unsigned().has_value());
    assert(value.find("text")->string_value == "a\"b\\c\xC3\xA9\xF0\x9F\x98\x80");
    assert(value.find("missing") == nullptr);

    auto body = Value::object();
    body.set("message", Value::string("Peer registered successfully"));
    body.set("peers_count", Value::number(2));
    body.set("peers_count", Value::number(3));
    auto list = Value::array();
    list.push_back(Value::number(0));
    list.push_back(Value::boolean(false));
    body.set("list", std::move(list));
    body.set("escaped", Value::string("line\nbreak\x01"));
    assert(serialize(body)
           == R"({"message":"Peer registered successfully","peers_count":3,"list":[0,false],"escaped":"line\nbreak\u0001"})");

    // Serialized text parses back to the same fields.
    const auto reparsed = parse(serialize(body));
    assert(reparsed.find("escaped")->string_value == "line\nbreak\x01");
    assert(serialize(Value::number(0.25)) == "0.25");

    for (const char* bad : {"", "{", "{\"a\":}", "[1,]", "tru", "01", "{\"a\":1} x", "\"\\q\"", "\"\\ud800\""}) {
        bool threw = false;
        try {
            static_cast<void>(parse(bad));
        } catch (const ParseError&) {
            threw = true;
        }
        assert(threw);
    }

    std::string deep;
    for (int i = 0; i < 100; ++i) {
        deep += '[';
    }
    bool threw = false;
    try {
        static_cast<void>(parse(deep));
    } catch (const ParseError&) {
        threw = true;
    }
    assert(threw);

    return 0;
}
