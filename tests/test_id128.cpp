#include <gtest/gtest.h>
#include <sdid128/sdid128.hpp>

#include <map>
#include <sstream>
#include <unordered_set>

namespace sdid128 {
namespace {

const Id128::Bytes EXPECTED_BYTES = {{0x01, 0x23, 0x45, 0x67, 0x89, 0xab, 0xcd, 0xef, 0x01, 0x23,
                                      0x45, 0x67, 0x89, 0xab, 0xcd, 0xef}};

// ==================== Value Semantics Tests ====================

TEST(Id128Test, DefaultIsNull) {
    Id128 id;

    EXPECT_TRUE(id.is_null());
    EXPECT_FALSE(id.is_all_f());
    EXPECT_EQ(id.to_string(), "00000000-0000-0000-0000-000000000000");
}

TEST(Id128Test, AllFIsDetected) {
    Id128::Bytes bytes;
    bytes.fill(0xff);
    Id128 id(bytes);

    EXPECT_TRUE(id.is_all_f());
    EXPECT_FALSE(id.is_null());
}

TEST(Id128Test, FromBytesCopiesBuffer) {
    uint8_t buffer[Id128::SIZE];
    std::copy(EXPECTED_BYTES.begin(), EXPECTED_BYTES.end(), buffer);

    auto id = Id128::from_bytes(buffer);
    buffer[0] = 0xff;

    EXPECT_EQ(id.bytes(), EXPECTED_BYTES);
}

TEST(Id128Test, EqualityFollowsBytes) {
    Id128 a(EXPECTED_BYTES);
    Id128 b(EXPECTED_BYTES);
    Id128 c;

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_FALSE(a != b);
}

TEST(Id128Test, OrderingIsLexicographicOverBytes) {
    Id128::Bytes low{};
    Id128::Bytes high{};
    low[15] = 0xff;
    high[0] = 0x01;

    EXPECT_LT(Id128(low), Id128(high));
    EXPECT_LE(Id128(low), Id128(high));
    EXPECT_GT(Id128(high), Id128(low));
    EXPECT_GE(Id128(high), Id128(high));
    EXPECT_LT(Id128(), Id128(low));
}

TEST(Id128Test, UsableAsMapAndSetKey) {
    std::map<Id128, int> ordered;
    std::unordered_set<Id128> unordered;

    ordered[Id128(EXPECTED_BYTES)] = 1;
    ordered[Id128()] = 2;
    unordered.insert(Id128(EXPECTED_BYTES));
    unordered.insert(Id128(EXPECTED_BYTES));
    unordered.insert(Id128());

    EXPECT_EQ(ordered.begin()->first, Id128());
    EXPECT_EQ(unordered.size(), 2u);
}

TEST(Id128Test, EqualIdsHashEqually) {
    std::hash<Id128> hasher;

    EXPECT_EQ(hasher(Id128(EXPECTED_BYTES)), hasher(Id128(EXPECTED_BYTES)));
}

TEST(Id128Test, UuidVersionReadsByteSix) {
    Id128::Bytes bytes{};
    bytes[6] = 0x4a;

    EXPECT_EQ(Id128(bytes).uuid_version(), 4);
}

// ==================== Formatting Tests ====================

TEST(Id128FormatTest, HexLower) {
    EXPECT_EQ(Id128(EXPECTED_BYTES).to_string(Format::Hex, Case::Lower),
              "0123456789abcdef0123456789abcdef");
}

TEST(Id128FormatTest, HexUpper) {
    EXPECT_EQ(Id128(EXPECTED_BYTES).to_string(Format::Hex, Case::Upper),
              "0123456789ABCDEF0123456789ABCDEF");
}

TEST(Id128FormatTest, UuidIsDefault) {
    EXPECT_EQ(Id128(EXPECTED_BYTES).to_string(), "01234567-89ab-cdef-0123-456789abcdef");
}

TEST(Id128FormatTest, UuidUpper) {
    EXPECT_EQ(Id128(EXPECTED_BYTES).to_string(Format::Uuid, Case::Upper),
              "01234567-89AB-CDEF-0123-456789ABCDEF");
}

TEST(Id128FormatTest, Grouped) {
    EXPECT_EQ(Id128(EXPECTED_BYTES).to_string(Format::Grouped, Case::Lower),
              "0123-4567-89ab-cdef-0123-4567-89ab-cdef");
    EXPECT_EQ(Id128(EXPECTED_BYTES).to_string(Format::Grouped, Case::Upper),
              "0123-4567-89AB-CDEF-0123-4567-89AB-CDEF");
}

TEST(Id128FormatTest, StreamWritesUuid) {
    std::ostringstream ss;
    ss << Id128(EXPECTED_BYTES);

    EXPECT_EQ(ss.str(), "01234567-89ab-cdef-0123-456789abcdef");
}

TEST(Id128FormatTest, EnumNames) {
    EXPECT_STREQ(format_to_string(Format::Hex), "hex");
    EXPECT_STREQ(format_to_string(Format::Grouped), "grouped");
    EXPECT_EQ(format_from_string("uuid"), Format::Uuid);
    EXPECT_FALSE(format_from_string("rfc").has_value());
    EXPECT_STREQ(case_to_string(Case::Upper), "upper");
    EXPECT_EQ(case_from_string("lower"), Case::Lower);
    EXPECT_FALSE(case_from_string("LOWER").has_value());
}

TEST(Id128FormatTest, EveryLayoutAndCaseParsesBack) {
    Id128 id(EXPECTED_BYTES);

    for (auto format : {Format::Hex, Format::Uuid, Format::Grouped}) {
        for (auto letter_case : {Case::Lower, Case::Upper}) {
            auto parsed = Id128::parse(id.to_string(format, letter_case));
            ASSERT_TRUE(parsed.is_ok()) << parsed.error_message();
            EXPECT_EQ(parsed.value(), id);
        }
    }
}

// ==================== Strict Parsing Tests ====================

class Id128ParseTest : public ::testing::TestWithParam<const char*> {};

TEST_P(Id128ParseTest, ParsesToExpectedBytes) {
    auto parsed = Id128::parse(GetParam());

    ASSERT_TRUE(parsed.is_ok()) << parsed.error_message();
    EXPECT_EQ(parsed.value().bytes(), EXPECTED_BYTES);
}

INSTANTIATE_TEST_SUITE_P(AllLayouts, Id128ParseTest,
                         ::testing::Values("0123456789abcdef0123456789abcdef",
                                           "0123456789ABCDEF0123456789ABCDEF",
                                           "0123456789AbCdEf0123456789aBcDeF",
                                           "01234567-89ab-cdef-0123-456789abcdef",
                                           "01234567-89AB-CDEF-0123-456789ABCDEF",
                                           "01234567-89Ab-CdEf-0123-456789aBcDeF",
                                           "0123-4567-89ab-cdef-0123-4567-89ab-cdef",
                                           "0123-4567-89AB-CDEF-0123-4567-89AB-CDEF",
                                           "0123-4567-89Ab-CdEf-0123-4567-89aB-cDeF"));

TEST(Id128StrictParseTest, TooLongFails) {
    auto parsed = Id128::parse("0123-4567-89Ab-CdEf-0123-4567-89aB-cDeF-1234");

    EXPECT_EQ(parsed.error_code(), ErrorCode::ParseError);
    EXPECT_EQ(parsed.error_message(), "invalid string length: 44");
}

TEST(Id128StrictParseTest, TooShortFails) {
    EXPECT_TRUE(Id128::parse("0123-4567-89Ab-CdEf-0123-4567-89aB").is_error());
}

TEST(Id128StrictParseTest, EmptyFails) {
    EXPECT_EQ(Id128::parse("").error_code(), ErrorCode::ParseError);
}

TEST(Id128StrictParseTest, InvalidCharacterFails) {
    auto parsed = Id128::parse("0123-4567-89AB-CDEX-0123-4567-89AB-CDEF");

    EXPECT_EQ(parsed.error_code(), ErrorCode::ParseError);
    EXPECT_EQ(parsed.error_message(), "invalid character at position: 18");
}

TEST(Id128StrictParseTest, MisplacedDashInGroupedFails) {
    auto parsed = Id128::parse("0123-4567-89A-BCDEF-0123-4567-89AB-CDEF");

    EXPECT_EQ(parsed.error_code(), ErrorCode::ParseError);
    EXPECT_EQ(parsed.error_message(), "unexpected dash at position: 13");
}

TEST(Id128StrictParseTest, MissingDashInGroupedFails) {
    EXPECT_TRUE(Id128::parse("01234567-89AB-CDEF-0123-4567-89AB-CDEF").is_error());
}

TEST(Id128StrictParseTest, MisplacedDashInUuidFails) {
    EXPECT_TRUE(Id128::parse("01234567-89AB-CDEF-0123-456789ABCDE-F").is_error());
}

TEST(Id128StrictParseTest, MissingDashInUuidFails) {
    EXPECT_TRUE(Id128::parse("01234567-89AB-CDEF-0123456789ABCDE-F").is_error());
}

TEST(Id128StrictParseTest, DashInHexFails) {
    EXPECT_TRUE(Id128::parse("0123456789ABCDEF0123456789ABCDE-F").is_error());
}

TEST(Id128StrictParseTest, SurroundingWhitespaceFails) {
    EXPECT_TRUE(Id128::parse(" 0123456789abcdef0123456789abcde").is_error());
}

// ==================== Lax Parsing Tests ====================

TEST(Id128LaxParseTest, TooLongFails) {
    EXPECT_TRUE(Id128::parse_lax("0123-4567-89Ab-CdEf-0123-4567-89aB-cDeF-1234").is_error());
}

TEST(Id128LaxParseTest, TooShortFails) {
    EXPECT_TRUE(Id128::parse_lax("0123-4567-89Ab-CdEf-0123-4567-89aB").is_error());
}

TEST(Id128LaxParseTest, InvalidCharacterFails) {
    EXPECT_TRUE(Id128::parse_lax("0123-4567-89AB-CDEX-0123-4567-89AB-CDEF").is_error());
}

TEST(Id128LaxParseTest, MisplacedDashesAreAccepted) {
    EXPECT_TRUE(Id128::parse_lax("0123-4567-89A-BCDEF-0123-4567-89AB-CDEF").is_ok());
    EXPECT_TRUE(Id128::parse_lax("01234567-89AB-CDEF-0123-4567-89AB-CDEF").is_ok());
    EXPECT_TRUE(Id128::parse_lax("01234567-89AB-CDEF-0123-456789ABCDE-F").is_ok());
    EXPECT_TRUE(Id128::parse_lax("01234567-89AB-CDEF-0123456789ABCDE-F").is_ok());
    EXPECT_TRUE(Id128::parse_lax("0123456789ABCDEF0123456789ABCDE-F").is_ok());
}

TEST(Id128LaxParseTest, WhitespaceAndDashesAreStripped) {
    auto parsed = Id128::parse_lax("    01-23-456789AB-C----DEF01234567-89ABCDEF----     ");

    ASSERT_TRUE(parsed.is_ok()) << parsed.error_message();
    EXPECT_EQ(parsed.value().bytes(), EXPECTED_BYTES);
}

TEST(Id128LaxParseTest, InnerWhitespaceFails) {
    EXPECT_TRUE(Id128::parse_lax("0123456789abcdef 0123456789abcdef").is_error());
}

}  // namespace
}  // namespace sdid128
