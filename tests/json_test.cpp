// json_test.cpp — Tests for nlohmann/json interoperability

#include <jsonmanip-cpp/json.hpp>

#include <jsonmanip-cpp/decimal.hpp>
#include <jsonmanip-cpp/error.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

using namespace jsonmanip_cpp;
using json = nlohmann::ordered_json;

// =============================================================================
// ADL serialization
// =============================================================================

TEST(JsonAdl, scalars_to_json) {
    EXPECT_TRUE(json(Value{}).is_null());
    EXPECT_EQ(json(Value{true}), json(true));
    EXPECT_EQ(json(Value{-5}), json(-5));
    EXPECT_EQ(json(Value{2.5}), json(2.5));
    EXPECT_EQ(json(Value{"text"}), json("text"));
}

TEST(JsonAdl, decimal_becomes_double) {
    const auto j = json(Value{*Decimal::parse("1.25")});
    ASSERT_TRUE(j.is_number_float());
    EXPECT_DOUBLE_EQ(j.get<double>(), 1.25);
}

TEST(JsonAdl, containers_keep_key_order) {
    const auto value = Value{Object{{"z", 1}, {"a", Array{1, "two", nullptr}}, {"m", Object{}}}};
    const auto j = json(value);
    ASSERT_TRUE(j.is_object());
    auto keys = std::string{};
    for (const auto& [key, item] : j.items()) keys += key;
    EXPECT_EQ(keys, "zam");
    EXPECT_EQ(j["a"], json::parse(R"([1, "two", null])"));
    EXPECT_TRUE(j["m"].is_object());
}

TEST(JsonAdl, from_json_scalars) {
    EXPECT_TRUE(json(nullptr).get<Value>().is_null());
    EXPECT_EQ(json(false).get<Value>(), Value{false});
    EXPECT_EQ(json(42).get<Value>(), Value{42});
    EXPECT_EQ(json(0.5).get<Value>(), Value{0.5});
    EXPECT_EQ(json("s").get<Value>(), Value{"s"});
}

TEST(JsonAdl, from_json_unsigned) {
    EXPECT_EQ(json(std::uint64_t{7}).get<Value>(), Value{7});
    const auto big = json(std::numeric_limits<std::uint64_t>::max()).get<Value>();
    ASSERT_TRUE(big.is_double());
    EXPECT_DOUBLE_EQ(big.as_double(), 18446744073709551615.0);
}

TEST(JsonAdl, from_json_containers) {
    const auto j = json::parse(R"({"b": [1, {"c": null}], "a": true})");
    const auto value = j.get<Value>();
    ASSERT_TRUE(value.is_object());
    EXPECT_EQ(value.as_object().keys(), (std::vector<std::string>{"b", "a"}));
    EXPECT_EQ(value, (Value{Object{{"b", Array{1, Object{{"c", nullptr}}}}, {"a", true}}}));
}

TEST(JsonAdl, binary_is_rejected) {
    const auto j = json::binary({1, 2, 3});
    try {
        (void)j.get<Value>();
        FAIL() << "expected an Error";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::type_error);
    }
}

// =============================================================================
// Text
// =============================================================================

TEST(ParseJson, documents) {
    EXPECT_EQ(parse_json("null"), Value{});
    EXPECT_EQ(parse_json(" [1, 2.5, \"x\", true] "), (Value{Array{1, 2.5, "x", true}}));
    EXPECT_EQ(parse_json(R"({"k": {"n": []}})"), (Value{Object{{"k", Object{{"n", Array{}}}}}}));
}

TEST(ParseJson, keeps_key_order) {
    const auto value = parse_json(R"({"z": 0, "y": 1, "x": 2})");
    EXPECT_EQ(value.as_object().keys(), (std::vector<std::string>{"z", "y", "x"}));
}

TEST(ParseJson, duplicate_keys_keep_the_last_value) {
    const auto value = parse_json(R"({"a": 1, "b": 2, "a": 3})");
    EXPECT_EQ(value, (Value{Object{{"a", 3}, {"b", 2}}}));
}

TEST(ParseJson, fractions_as_double_by_default) {
    const auto value = parse_json("1.10");
    ASSERT_TRUE(value.is_double());
    EXPECT_DOUBLE_EQ(value.as_double(), 1.1);
    EXPECT_TRUE(parse_json("3").is_int());
}

TEST(ParseJson, fractions_as_decimal) {
    const auto value = parse_json("[1.10, 2e3, 4]", "<string>", true);
    const auto& items = value.as_array();
    ASSERT_TRUE(items[0].is_decimal());
    EXPECT_EQ(items[0].as_decimal().to_string(), "1.10");
    ASSERT_TRUE(items[1].is_decimal());
    EXPECT_EQ(items[1].as_decimal(), *Decimal::parse("2000"));
    EXPECT_TRUE(items[2].is_int());
}

TEST(ParseJson, unsigned_overflow) {
    const auto value = parse_json("18446744073709551615");
    ASSERT_TRUE(value.is_double());

    const auto exact = parse_json("18446744073709551615", "<string>", true);
    ASSERT_TRUE(exact.is_decimal());
    EXPECT_EQ(exact.as_decimal().to_string(), "18446744073709551615");
}

TEST(ParseJson, deep_nesting) {
    const auto text = std::string(500, '[') + std::string(500, ']');
    auto value = parse_json(text);
    auto depth = 0;
    const Value* current = &value;
    while (current->is_array() && !current->as_array().empty()) {
        current = &current->as_array().front();
        ++depth;
    }
    EXPECT_EQ(depth, 499);
}

TEST(ParseJson, invalid_text) {
    for (const auto* text : {"", "[1, 2", "{\"a\" 1}", "nul", "[1] 2"}) {
        try {
            (void)parse_json(text, "input.json");
            ADD_FAILURE() << "expected a SyntaxError for: " << text;
        } catch (const SyntaxError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::syntax_error);
            EXPECT_EQ(e.filename(), "input.json");
            EXPECT_FALSE(e.msg().empty());
        }
    }
}

TEST(DumpJson, compact_and_indented) {
    const auto value = Value{Object{{"b", Array{1, 2}}, {"a", "x"}}};
    EXPECT_EQ(dump_json(value), R"({"b":[1,2],"a":"x"})");
    EXPECT_EQ(dump_json(value, 2), "{\n  \"b\": [\n    1,\n    2\n  ],\n  \"a\": \"x\"\n}");
}

TEST(DumpJson, non_finite_numbers_are_null) {
    EXPECT_EQ(dump_json(std::numeric_limits<double>::quiet_NaN()), "null");
    EXPECT_EQ(dump_json(std::numeric_limits<double>::infinity()), "null");
}

TEST(DumpJson, round_trips_through_parse) {
    const auto text = std::string{R"({"name":"list","items":[1,-2,3.5,null,true,{"":[]}]})"};
    EXPECT_EQ(dump_json(parse_json(text)), text);
}

TEST(DumpJson, stream_operator) {
    auto os = std::ostringstream{};
    os << Value{Array{1, "a"}};
    EXPECT_EQ(os.str(), R"([1,"a"])");
}
