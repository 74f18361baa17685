#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

#include "hoard/net/resp.hpp"

using hoard::net::RespValue;

TEST_CASE("commands encode as arrays of bulk strings", "[net][resp]") {
    const auto wire = hoard::net::encode_command({"SET", "idx:lib:dim", "512"});
    REQUIRE(wire == "*3\r\n$3\r\nSET\r\n$11\r\nidx:lib:dim\r\n$3\r\n512\r\n");
}

TEST_CASE("parser handles every reply type", "[net][resp]") {
    RespValue v;
    REQUIRE(hoard::net::parse_resp("+OK\r\n", v).value() == 5);
    REQUIRE(v.type == RespValue::Type::simple_string);
    REQUIRE(v.str == "OK");

    REQUIRE(hoard::net::parse_resp("-Index already exists\r\n", v).has_value());
    REQUIRE(v.is_error());
    REQUIRE(v.str == "Index already exists");

    REQUIRE(hoard::net::parse_resp(":-42\r\n", v).has_value());
    REQUIRE(v.integer == -42);

    REQUIRE(hoard::net::parse_resp("$-1\r\n", v).has_value());
    REQUIRE(v.is_nil());

    const std::string nested = "*2\r\n$5\r\nlib:a\r\n*2\r\n$4\r\ndist\r\n$3\r\n0.5\r\n";
    REQUIRE(hoard::net::parse_resp(nested, v).value() == nested.size());
    REQUIRE(v.type == RespValue::Type::array);
    REQUIRE(v.elements.size() == 2);
    REQUIRE(v.elements[1].elements[1].str == "0.5");
}

TEST_CASE("bulk strings are binary safe", "[net][resp]") {
    const std::string payload("a\r\nb\0c", 6);
    const auto wire = hoard::net::encode_value(RespValue::bulk(payload));
    RespValue v;
    REQUIRE(hoard::net::parse_resp(wire, v).value() == wire.size());
    REQUIRE(v.str == payload);
}

TEST_CASE("incomplete input asks for more bytes", "[net][resp]") {
    RespValue v;
    REQUIRE(hoard::net::parse_resp("", v).value() == 0);
    REQUIRE(hoard::net::parse_resp("+OK", v).value() == 0);
    REQUIRE(hoard::net::parse_resp("$5\r\nab", v).value() == 0);
    REQUIRE(hoard::net::parse_resp("*2\r\n:1\r\n", v).value() == 0);
}

TEST_CASE("malformed input is a data integrity error", "[net][resp]") {
    RespValue v;
    for (const char* bad : {"?x\r\n", ":12a\r\n", "$-7\r\n", "$2\r\nabcd\r\n"}) {
        auto r = hoard::net::parse_resp(bad, v);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == hoard::core::error_code::data_integrity);
    }
    std::string deep;
    for (int i = 0; i < 40; ++i) deep += "*1\r\n";
    deep += ":1\r\n";
    REQUIRE_FALSE(hoard::net::parse_resp(deep, v).has_value());
}

TEST_CASE("float blobs are raw little-endian float32", "[net][resp]") {
    const std::vector<float> v{1.0f, -2.5f, 0.0f};
    const auto blob = hoard::net::float_blob(v);
    REQUIRE(blob.size() == 12);
    REQUIRE(static_cast<unsigned char>(blob[3]) == 0x3F);   // 1.0f = 0x3F800000
    REQUIRE(hoard::net::blob_floats(blob).value() == v);
    REQUIRE(hoard::net::blob_floats("abc").error().code == hoard::core::error_code::data_integrity);
}
