#include "bencode/Bencode.hpp"
#include "bencode/BencodeFields.hpp"
#include "bencode/BencodeParser.hpp"
#include "utils/Errors.hpp"
#include <gtest/gtest.h>
#include <cstdint>
#include <string>

namespace {

size_t failureOffset(const std::string& input) {
    try {
        Bencode::decode(input);
    } catch (const MalformedEncoding& e) {
        return e.getOffset();
    }
    ADD_FAILURE() << "decode accepted " << input;
    return 0;
}

}

TEST(BencodeTest, DecodesScalars) {
    EXPECT_EQ(Bencode::decode("5:hello"), "hello");
    EXPECT_EQ(Bencode::decode("0:"), "");
    EXPECT_EQ(Bencode::decode("i52e").get<int64_t>(), 52);
    EXPECT_EQ(Bencode::decode("i-52e").get<int64_t>(), -52);
    EXPECT_EQ(Bencode::decode("i0e").get<int64_t>(), 0);
    EXPECT_EQ(Bencode::decode("i9223372036854775807e").get<int64_t>(), INT64_MAX);
}

TEST(BencodeTest, DecodesNestedContainers) {
    auto value = Bencode::decode("d3:cowl3:moo4:spame4:spami-3ee");
    ASSERT_TRUE(value.is_object());
    EXPECT_EQ(value["cow"], nlohmann::json::array({"moo", "spam"}));
    EXPECT_EQ(value["spam"].get<int64_t>(), -3);

    EXPECT_TRUE(Bencode::decode("le").is_array());
    EXPECT_TRUE(Bencode::decode("de").is_object());
}

TEST(BencodeTest, KeepsBinaryBytes) {
    std::string input = std::string("4:") + '\0' + '\xff' + '\x13' + 'e';
    auto value = Bencode::decode(input);
    ASSERT_EQ(value.get<std::string>().size(), 4u);
    EXPECT_EQ(value.get<std::string>()[1], '\xff');
}

TEST(BencodeTest, ReportsOffsetOfFirstViolation) {
    EXPECT_EQ(failureOffset(""), 0u);
    EXPECT_EQ(failureOffset("i12"), 0u);
    EXPECT_EQ(failureOffset("l5:helloi1e"), 0u);
    EXPECT_EQ(failureOffset("li1ex"), 4u);
    EXPECT_EQ(failureOffset("d3:fooi1ei2ee"), 9u);
    EXPECT_EQ(failureOffset("l10:shorte"), 1u);
    EXPECT_EQ(failureOffset("5:hellox"), 7u);
}

TEST(BencodeTest, RejectsNonCanonicalIntegers) {
    for (const char* input : {"i-0e", "i03e", "ie", "i-e", "i1x2e", "i99999999999999999999e"}) {
        EXPECT_THROW(Bencode::decode(input), MalformedEncoding) << input;
    }
}

TEST(BencodeTest, RejectsMalformedStrings) {
    for (const char* input : {"05:hello", ":abc", "3abc", "-1:a", "6:hello"}) {
        EXPECT_THROW(Bencode::decode(input), MalformedEncoding) << input;
    }
}

TEST(BencodeTest, RejectsDuplicateKeys) {
    EXPECT_THROW(Bencode::decode("d1:ai1e1:ai2ee"), MalformedEncoding);
}

TEST(BencodeTest, RejectsExcessiveNesting) {
    std::string deep(300, 'l');
    deep += std::string(300, 'e');
    EXPECT_THROW(Bencode::decode(deep), MalformedEncoding);
}

TEST(BencodeTest, CapturesRawSpansOfRootValues) {
    std::string input = "d4:infod4:name1:xe4:listli1ei2eee";
    BencodeParser parser;
    parser.decode(input);

    EXPECT_EQ(parser.rawValue("info"), "d4:name1:xe");
    EXPECT_EQ(parser.rawValue("list"), "li1ei2ee");
    EXPECT_FALSE(parser.hasRawValue("name"));
    EXPECT_THROW(parser.rawValue("missing"), MissingField);
}

TEST(BencodeTest, EncodesCanonically) {
    nlohmann::json dict = {{"zeta", 1}, {"alpha", "x"}, {"list", nlohmann::json::array({1, "two"})}};
    EXPECT_EQ(Bencode::encode(dict), "d5:alpha1:x4:listli1e3:twoe4:zetai1ee");
    EXPECT_EQ(Bencode::encode(-7), "i-7e");
    EXPECT_EQ(Bencode::encode(std::string("spam")), "4:spam");
}

TEST(BencodeTest, EncodedValueDecodesBack) {
    std::string encoded = "d8:announce9:http://x/4:infod6:lengthi5eee";
    EXPECT_EQ(Bencode::encode(Bencode::decode(encoded)), encoded);
}

TEST(BencodeFieldsTest, TypedAccess) {
    auto dict = Bencode::decode("d3:agei7e4:name3:bob5:itemsli1eee");

    EXPECT_EQ(BencodeFields::requireString(dict, "name"), "bob");
    EXPECT_EQ(BencodeFields::requireInteger(dict, "age"), 7);
    EXPECT_EQ(BencodeFields::requireList(dict, "items").size(), 1u);
    EXPECT_FALSE(BencodeFields::optionalString(dict, "nick"));

    EXPECT_THROW(BencodeFields::requireString(dict, "nick"), MissingField);
    EXPECT_THROW(BencodeFields::requireInteger(dict, "name"), InvalidField);
    EXPECT_THROW(BencodeFields::optionalString(dict, "age"), InvalidField);
}

TEST(BencodeFieldsTest, ClosedSchemaNamesUnknownKey) {
    auto dict = Bencode::decode("d1:ai1e5:extrai2ee");
    try {
        BencodeFields::expectOnly(dict, {"a"});
        FAIL() << "unknown key accepted";
    } catch (const UnexpectedField& e) {
        EXPECT_EQ(e.getKey(), "extra");
    }
    EXPECT_NO_THROW(BencodeFields::expectOnly(dict, {"a", "extra"}));
}
