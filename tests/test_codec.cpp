/**
 * @file test_codec.cpp
 * @brief Tests for document decoding/encoding (GoogleTest)
 *
 * Tests cover:
 * - RULE C1: Format detection by extension
 * - RULE C2: Empty source decodes to an empty mapping
 * - RULE C3: Non-mapping roots are rejected
 * - RULE C4: Scalar types survive encode/decode
 * - RULE C5: TOML null handling
 */

#include <gtest/gtest.h>
#include "confstore/Codec.hpp"
#include "confstore/Errors.hpp"

using namespace confstore;

namespace {
/// TOML tables are key-sorted, so round trips compare without key order
nlohmann::json unordered(const Value& v) {
    return nlohmann::json::parse(v.dump());
}
}

// ============================================================================
// RULE C1: Format detection
// ============================================================================

TEST(DetectFormat, ByExtension) {
    EXPECT_EQ(detect_format("config.json"), Format::Json);
    EXPECT_EQ(detect_format("config.TOML"), Format::Toml);
    EXPECT_EQ(detect_format("config.yaml"), Format::Yaml);
    EXPECT_EQ(detect_format("config.yml"), Format::Yaml);
    EXPECT_EQ(detect_format("config"), Format::Yaml);
}

TEST(DetectFormat, ExplicitFormatWins) {
    EXPECT_EQ(detect_format("config.json", Format::Yaml), Format::Yaml);
}

TEST(GetFileExtension, LowercasesWithDot) {
    EXPECT_EQ(get_file_extension("/a/b/File.YAML"), ".yaml");
    EXPECT_EQ(get_file_extension("noext"), "");
}

// ============================================================================
// RULE C2/C3: Document shape
// ============================================================================

TEST(DecodeDocument, EmptySourceIsEmptyMapping) {
    for (Format f : {Format::Yaml, Format::Json, Format::Toml}) {
        Value doc = decode_document("", f);
        EXPECT_TRUE(doc.is_object());
        EXPECT_TRUE(doc.empty());
        EXPECT_TRUE(decode_document("  \n\n", f).is_object());
    }
}

TEST(DecodeDocument, CommentOnlyYamlIsEmptyMapping) {
    Value doc = decode_document("# nothing here\n", Format::Yaml);
    EXPECT_TRUE(doc.is_object());
    EXPECT_TRUE(doc.empty());
}

TEST(DecodeDocument, NonMappingRootThrows) {
    EXPECT_THROW(decode_document("- a\n- b\n", Format::Yaml), ParseError);
    EXPECT_THROW(decode_document("42\n", Format::Yaml), ParseError);
    EXPECT_THROW(decode_document("[1, 2]", Format::Json), ParseError);
}

TEST(DecodeDocument, YamlSyntaxErrorHasPosition) {
    try {
        decode_document("a: [1, 2\nb: 3\n", Format::Yaml, "bad.yaml");
        FAIL() << "Expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.file(), "bad.yaml");
        EXPECT_GT(e.line(), 0);
    }
}

TEST(DecodeDocument, JsonSyntaxError) {
    EXPECT_THROW(decode_document("{ invalid json }", Format::Json), ParseError);
}

TEST(DecodeDocument, TomlSyntaxError) {
    EXPECT_THROW(decode_document("key = [invalid", Format::Toml), ParseError);
}

// ============================================================================
// YAML typing
// ============================================================================

TEST(DecodeYaml, ScalarTypes) {
    Value doc = decode_document(
        "int: 42\n"
        "neg: -3\n"
        "float: 2.5\n"
        "yes_bool: true\n"
        "nothing: ~\n"
        "empty:\n"
        "word: hello\n"
        "quoted_num: \"42\"\n"
        "single: 'true'\n"
        "tagged: !!str 7\n"
        "yes_word: yes\n",
        Format::Yaml);

    EXPECT_EQ(doc["int"], 42);
    EXPECT_EQ(doc["neg"], -3);
    EXPECT_DOUBLE_EQ(doc["float"].get<double>(), 2.5);
    EXPECT_EQ(doc["yes_bool"], true);
    EXPECT_TRUE(doc["nothing"].is_null());
    EXPECT_TRUE(doc["empty"].is_null());
    EXPECT_EQ(doc["word"], "hello");
    EXPECT_EQ(doc["quoted_num"], "42");
    EXPECT_EQ(doc["single"], "true");
    EXPECT_EQ(doc["tagged"], "7");
    EXPECT_EQ(doc["yes_word"], "yes");
}

TEST(DecodeYaml, BlockScalarIsString) {
    Value doc = decode_document("msg: |\n  123\n", Format::Yaml);
    EXPECT_EQ(doc["msg"], "123\n");
}

TEST(DecodeYaml, KeepsKeyOrder) {
    Value doc = decode_document("z: 1\na: 2\nm: 3\n", Format::Yaml);
    std::vector<std::string> keys;
    for (auto it = doc.begin(); it != doc.end(); ++it) keys.push_back(it.key());
    EXPECT_EQ(keys, (std::vector<std::string>{"z", "a", "m"}));
}

TEST(DecodeYaml, FlowAndBlockCollections) {
    Value doc = decode_document("items: [1, 2, 3]\nmap:\n  a: {b: c}\n", Format::Yaml);
    EXPECT_EQ(doc["items"], Value({1, 2, 3}));
    EXPECT_EQ(doc["map"]["a"]["b"], "c");
}

// ============================================================================
// RULE C4: Encode/decode preserves scalar types
// ============================================================================

class EncodeRoundTripTest : public ::testing::TestWithParam<Format> {};

TEST_P(EncodeRoundTripTest, PreservesTypesAndStructure) {
    Value doc = {
        {"str", "hello"},
        {"num_str", "42"},
        {"bool_str", "true"},
        {"null_str", "null"},
        {"empty_str", ""},
        {"int", 42},
        {"float", 1.5},
        {"bool", false},
        {"list", {1, "two", 3.5}},
        {"nested", {{"deep", {{"key", "v"}}}}}
    };

    const std::string text = encode_document(doc, GetParam());
    ASSERT_FALSE(text.empty());
    EXPECT_EQ(text.back(), '\n');
    EXPECT_EQ(unordered(decode_document(text, GetParam())), unordered(doc));
}

INSTANTIATE_TEST_SUITE_P(AllFormats, EncodeRoundTripTest,
                         ::testing::Values(Format::Yaml, Format::Json, Format::Toml));

TEST(EncodeYaml, NullRoundTrips) {
    Value doc = {{"n", nullptr}};
    EXPECT_EQ(decode_document(encode_document(doc, Format::Yaml), Format::Yaml), doc);
}

TEST(EncodeYaml, FloatWithoutFractionStaysFloat) {
    Value doc = {{"f", 2.0}};
    Value back = decode_document(encode_document(doc, Format::Yaml), Format::Yaml);
    EXPECT_TRUE(back["f"].is_number_float());
}

TEST(EncodeYaml, MultiLineStringRoundTrips) {
    Value doc = {{"text", "line one\nline two"}};
    EXPECT_EQ(decode_document(encode_document(doc, Format::Yaml), Format::Yaml), doc);
}

// ============================================================================
// RULE C5: TOML null
// ============================================================================

TEST(EncodeToml, NullBecomesEmptyString) {
    Value doc = {{"n", nullptr}};
    Value back = decode_document(encode_document(doc, Format::Toml), Format::Toml);
    EXPECT_EQ(back["n"], "");
}

TEST(EncodeJson, InvalidUtf8ThrowsStoreError) {
    Value doc = {{"s", std::string("bad \xff byte")}};
    EXPECT_THROW(encode_document(doc, Format::Json), StoreError);
}
