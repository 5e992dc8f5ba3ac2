#include <docstore-cpp/patch.hpp>

#include <docstore-cpp/error.hpp>
#include <docstore-cpp/json.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

namespace ds = docstore_cpp;

// -- Scalars ------------------------------------------------------------------

TEST(ParseSelector, null_spellings) {
    EXPECT_TRUE(ds::parse_selector("").is_null());
    EXPECT_TRUE(ds::parse_selector("~").is_null());
    EXPECT_TRUE(ds::parse_selector("null").is_null());
    EXPECT_TRUE(ds::parse_selector("Null").is_null());
    EXPECT_TRUE(ds::parse_selector("NULL").is_null());
}

TEST(ParseSelector, booleans) {
    EXPECT_EQ(ds::parse_selector("true"), ds::Value{true});
    EXPECT_EQ(ds::parse_selector("True"), ds::Value{true});
    EXPECT_EQ(ds::parse_selector("FALSE"), ds::Value{false});
    EXPECT_EQ(ds::parse_selector("yes"), ds::Value{true});
    EXPECT_EQ(ds::parse_selector("On"), ds::Value{true});
    EXPECT_EQ(ds::parse_selector("no"), ds::Value{false});
    EXPECT_EQ(ds::parse_selector("OFF"), ds::Value{false});
}

TEST(ParseSelector, integers) {
    const auto v = ds::parse_selector("12");
    EXPECT_TRUE(v.is_int());
    EXPECT_EQ(v, ds::Value{12});
    EXPECT_EQ(ds::parse_selector("-3"), ds::Value{-3});
    EXPECT_EQ(ds::parse_selector("+4"), ds::Value{4});
}

TEST(ParseSelector, integer_notations) {
    EXPECT_EQ(ds::parse_selector("0x1A"), ds::Value{26});
    EXPECT_EQ(ds::parse_selector("-0x10"), ds::Value{-16});
    EXPECT_EQ(ds::parse_selector("0b101"), ds::Value{5});
    EXPECT_EQ(ds::parse_selector("010"), ds::Value{8});
    EXPECT_EQ(ds::parse_selector("1_000"), ds::Value{1000});
    EXPECT_EQ(ds::parse_selector("1:30"), ds::Value{90});
    EXPECT_EQ(ds::parse_selector("-9223372036854775808"),
              ds::Value{std::numeric_limits<std::int64_t>::min()});
}

TEST(ParseSelector, integer_out_of_range_is_rejected) {
    EXPECT_THROW(ds::parse_selector("9223372036854775808"), ds::PatchError);
    EXPECT_THROW(ds::parse_selector("0x1ffffffffffffffff"), ds::PatchError);
}

TEST(ParseSelector, reals) {
    const auto v = ds::parse_selector("1.5");
    EXPECT_TRUE(v.is_double());
    EXPECT_EQ(v, ds::Value{1.5});
    EXPECT_EQ(ds::parse_selector("2.0e+3"), ds::Value{2000.0});
    EXPECT_EQ(ds::parse_selector(".5"), ds::Value{0.5});
    EXPECT_EQ(ds::parse_selector("-1_0.5"), ds::Value{-10.5});
    EXPECT_EQ(ds::parse_selector("-.inf"), ds::Value{-std::numeric_limits<double>::infinity()});
    EXPECT_TRUE(std::isnan(ds::parse_selector(".NaN").get<double>()));
}

TEST(ParseSelector, exponent_without_a_dot_is_a_string) {
    EXPECT_EQ(ds::parse_selector("1e3"), ds::Value{"1e3"});
    EXPECT_EQ(ds::parse_selector("1.0e3"), ds::Value{"1.0e3"});
}

TEST(ParseSelector, plain_strings) {
    EXPECT_EQ(ds::parse_selector("a"), ds::Value{"a"});
    EXPECT_EQ(ds::parse_selector("hello world"), ds::Value{"hello world"});
    EXPECT_EQ(ds::parse_selector("inf"), ds::Value{"inf"});
    EXPECT_EQ(ds::parse_selector("1.2.3"), ds::Value{"1.2.3"});
    EXPECT_EQ(ds::parse_selector("a:b"), ds::Value{"a:b"});
}

TEST(ParseSelector, quoted_strings_stay_strings) {
    EXPECT_EQ(ds::parse_selector("'1'"), ds::Value{"1"});
    EXPECT_EQ(ds::parse_selector("'yes'"), ds::Value{"yes"});
    EXPECT_EQ(ds::parse_selector("!!str 12"), ds::Value{"12"});
    EXPECT_EQ(ds::parse_selector("\"true\""), ds::Value{"true"});
    EXPECT_EQ(ds::parse_selector("'it''s'"), ds::Value{"it's"});
    EXPECT_EQ(ds::parse_selector(R"("a\tbé")"), ds::Value{"a\tb\xc3\xa9"});
}

// -- Mappings -----------------------------------------------------------------

TEST(ParseSelector, single_pair) {
    EXPECT_EQ(ds::parse_selector("id: 1"), ds::parse_json(R"({"id": 1})"));
    EXPECT_EQ(ds::parse_selector("id: '1'"), ds::parse_json(R"({"id": "1"})"));
    EXPECT_EQ(ds::parse_selector("name: two words"), ds::parse_json(R"({"name": "two words"})"));
    EXPECT_EQ(ds::parse_selector("id:"), ds::parse_json(R"({"id": null})"));
}

TEST(ParseSelector, numeric_keys_become_integer_keys) {
    const auto v = ds::parse_selector("3: x");
    ASSERT_TRUE(v.is_object());
    EXPECT_NE(v.find(ds::Key{std::int64_t{3}}), nullptr);
}

TEST(ParseSelector, flow_mapping) {
    EXPECT_EQ(ds::parse_selector("{id: 1, name: 'x', ok: true}"),
              ds::parse_json(R"({"id": 1, "name": "x", "ok": true})"));
    EXPECT_EQ(ds::parse_selector("{}"), ds::parse_json("{}"));
    EXPECT_EQ(ds::parse_selector("{a: {b: [1, 2]}}"), ds::parse_json(R"({"a": {"b": [1, 2]}})"));
    EXPECT_EQ(ds::parse_selector("{a}"), ds::parse_json(R"({"a": null})"));
}

TEST(ParseSelector, flow_sequence) {
    EXPECT_EQ(ds::parse_selector("[1, a, 'b', null]"), ds::parse_json(R"([1, "a", "b", null])"));
    EXPECT_EQ(ds::parse_selector("[]"), ds::parse_json("[]"));
    EXPECT_EQ(ds::parse_selector("[1, 2,]"), ds::parse_json("[1, 2]"));
}

TEST(ParseSelector, pair_with_flow_value) {
    EXPECT_EQ(ds::parse_selector("tags: [a, b]"), ds::parse_json(R"({"tags": ["a", "b"]})"));
}

// -- Errors -------------------------------------------------------------------

TEST(ParseSelector, nested_mapping_values_are_rejected) {
    EXPECT_THROW(ds::parse_selector("a: b: c"), ds::PatchError);
    EXPECT_THROW(ds::parse_selector("a: b, c: d"), ds::PatchError);
}

TEST(ParseSelector, malformed_text_is_rejected) {
    EXPECT_THROW(ds::parse_selector("{a: 1"), ds::PatchError);
    EXPECT_THROW(ds::parse_selector("[1, 2"), ds::PatchError);
    EXPECT_THROW(ds::parse_selector("'open"), ds::PatchError);
    EXPECT_THROW(ds::parse_selector("{[1]: 2}"), ds::PatchError);
    EXPECT_THROW(ds::parse_selector(R"("\q")"), ds::PatchError);
}

TEST(ParseSelector, several_documents_are_rejected) {
    EXPECT_THROW(ds::parse_selector("a\n---\nb"), ds::PatchError);
}

TEST(ParseSelector, deep_nesting_is_rejected) {
    for (auto depth : {100, 5000}) {
        const auto text = std::string(static_cast<std::size_t>(depth), '[') +
                          std::string(static_cast<std::size_t>(depth), ']');
        EXPECT_THROW(ds::parse_selector(text), ds::PatchError) << depth;
    }
    EXPECT_NO_THROW(ds::parse_selector(std::string(32, '[') + std::string(32, ']')));
}

TEST(ParseSelector, error_is_a_bad_request) {
    try {
        (void)ds::parse_selector("{a: 1");
        FAIL() << "malformed selector was accepted";
    } catch (const ds::PatchError& e) {
        EXPECT_EQ(e.kind(), ds::ErrorKind::bad_request);
        EXPECT_NE(e.message().find("{a: 1"), std::string::npos) << e.message();
    }
}
