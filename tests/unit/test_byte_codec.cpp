/**
 * @file test_byte_codec.cpp
 * @brief Unit tests for UUID text encoding and decoding
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <uuidkit/core/byte_codec.hpp>
#include <uuidkit/core/errors.hpp>

#include <string>
#include <vector>

using namespace uuidkit::core;

namespace {

const UuidBytes DNS_BYTES = {
    0x6B, 0xA7, 0xB8, 0x10,
    0x9D, 0xAD,
    0x11, 0xD1,
    0x80, 0xB4,
    0x00, 0xC0, 0x4F, 0xD4, 0x30, 0xC8
};

const UuidBytes URL_BYTES = {
    0x6B, 0xA7, 0xB8, 0x11,
    0x9D, 0xAD,
    0x11, 0xD1,
    0x80, 0xB4,
    0x00, 0xC0, 0x4F, 0xD4, 0x30, 0xC8
};

const std::vector<std::string> VALID_URL_STRINGS = {
    "6ba7b811-9dad-11d1-80b4-00c04fd430c8",            // canonical, lower case
    "6BA7B811-9DAD-11D1-80B4-00C04fD430C8",            // canonical, upper case
    "6ba7b8119dad11d180b400c04fd430c8",                // hex
    "6BA7B8119DAD11D180B400C04FD430C8",                // hex uppercase
    "6Ba7b8119Dad11d180B400c04fD430c8",                // hex mixed case
    "{6ba7b811-9dad-11d1-80b4-00c04fd430c8}",          // GUID
    "{6ba7b8119dad11d180b400c04fd430c8}",              // hex GUID
    "urn:uuid:6ba7b811-9dad-11d1-80b4-00c04fd430c8",   // URN
};

const std::vector<std::string> INVALID_STRINGS = {
    "",
    "6ba7b811-9dad-11d1-80b4-00c04fd430",              // too short
    "6ba7b811-9dad-11d1-80b4-00c04fd430000",           // too long
    "6ba7b811-9dad-11d1-80b4-00c0-4fd43000",           // extra dashes
    "6ba7b811-9dad-11d180-b4-00c04fd430c8",            // dashes in wrong position
    "urn uuid 6ba7b811-9dad-11d1-80b4-00c04fd430c8",   // invalid URN
    "urn:uuid:6ba7b8119dad11d180b400c04fd430c8",       // URN with hex body
    "URN:UUID:6ba7b811-9dad-11d1-80b4-00c04fd430c8",   // URN prefix is case-sensitive
    "[6ba7b811-9dad-11d1-80b4-00c04fd430c8]",          // invalid GUID
    "{6ba7b811-9dad-11d1-80b4-00c04fd430c8)",          // unbalanced GUID
    "6ba7b8119dad11d180b400c04fd430",                  // too short hex
    "6ba7b8119dad11d180b400c04fd430c800",              // too long hex
    "xxxxb811-9dad-11d1-80b4-00c04fd430",              // invalid hex chars
    "xxxxb8119dad11d180b400c04fd430",
    "6ba7b811-9dad-11d1-80b4-00c04fd430cg",            // non-hex in last byte
    "6ba7b8119dad11d180b400c04fd430c ",                // trailing space in hex
};

}  // namespace

// =============================================================================
// Encoding
// =============================================================================

TEST(ByteCodecTest, EncodesCanonicalLowerCase) {
    EXPECT_EQ(ByteCodec::encode(DNS_BYTES), "6ba7b810-9dad-11d1-80b4-00c04fd430c8");
    EXPECT_EQ(ByteCodec::encode(UuidBytes{}), "00000000-0000-0000-0000-000000000000");

    UuidBytes full;
    full.fill(0xFF);
    EXPECT_EQ(ByteCodec::encode(full), "ffffffff-ffff-ffff-ffff-ffffffffffff");
}

TEST(ByteCodecTest, CanonicalHyphenPositions) {
    std::string text = ByteCodec::encode(URL_BYTES);

    ASSERT_EQ(text.size(), ByteCodec::CANONICAL_LENGTH);
    EXPECT_EQ(text[8], '-');
    EXPECT_EQ(text[13], '-');
    EXPECT_EQ(text[18], '-');
    EXPECT_EQ(text[23], '-');
}

TEST(ByteCodecTest, EncodesEveryForm) {
    EXPECT_EQ(ByteCodec::encodeAs(DNS_BYTES, TextForm::CANONICAL),
              "6ba7b810-9dad-11d1-80b4-00c04fd430c8");
    EXPECT_EQ(ByteCodec::encodeAs(DNS_BYTES, TextForm::HEX),
              "6ba7b8109dad11d180b400c04fd430c8");
    EXPECT_EQ(ByteCodec::encodeAs(DNS_BYTES, TextForm::BRACED),
              "{6ba7b810-9dad-11d1-80b4-00c04fd430c8}");
    EXPECT_EQ(ByteCodec::encodeAs(DNS_BYTES, TextForm::BRACED_HEX),
              "{6ba7b8109dad11d180b400c04fd430c8}");
    EXPECT_EQ(ByteCodec::encodeAs(DNS_BYTES, TextForm::URN),
              "urn:uuid:6ba7b810-9dad-11d1-80b4-00c04fd430c8");
}

TEST(ByteCodecTest, EncodesUpperCaseKeepsUrnPrefix) {
    EXPECT_EQ(ByteCodec::encodeAs(DNS_BYTES, TextForm::URN, true),
              "urn:uuid:6BA7B810-9DAD-11D1-80B4-00C04FD430C8");
}

TEST(ByteCodecTest, EveryFormDecodesBack) {
    for (TextForm form : {TextForm::CANONICAL, TextForm::HEX, TextForm::BRACED,
                          TextForm::BRACED_HEX, TextForm::URN}) {
        for (bool upper : {false, true}) {
            std::string text = ByteCodec::encodeAs(URL_BYTES, form, upper);
            EXPECT_EQ(ByteCodec::decode(text), URL_BYTES) << text;
            EXPECT_EQ(ByteCodec::detectForm(text), form) << text;
        }
    }
}

// =============================================================================
// Decoding
// =============================================================================

TEST(ByteCodecTest, DecodesAllValidForms) {
    for (const auto& text : VALID_URL_STRINGS) {
        EXPECT_EQ(ByteCodec::decode(text), URL_BYTES) << text;
        EXPECT_EQ(ByteCodec::encode(ByteCodec::decode(text)), VALID_URL_STRINGS[0]) << text;
    }
}

TEST(ByteCodecTest, RejectsInvalidStrings) {
    for (const auto& text : INVALID_STRINGS) {
        EXPECT_THROW(ByteCodec::decode(text), FormatError) << text;
        EXPECT_FALSE(ByteCodec::tryDecode(text).has_value()) << text;
    }
}

TEST(ByteCodecTest, TryDecodeReturnsBytes) {
    auto bytes = ByteCodec::tryDecode("{6ba7b8109dad11d180b400c04fd430c8}");
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(*bytes, DNS_BYTES);
}

TEST(ByteCodecTest, FormatErrorReportsOffendingCharacter) {
    try {
        ByteCodec::decode("6ba7b810-9dad-11d1-80b4-00c04fd430cz");
        FAIL() << "Expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.source(), "6ba7b810-9dad-11d1-80b4-00c04fd430cz");
        EXPECT_EQ(e.offset(), 35u);
        EXPECT_THAT(e.what(), ::testing::HasSubstr("offset: 35"));
    }
}

TEST(ByteCodecTest, FormatErrorReportsMisplacedDash) {
    try {
        ByteCodec::decode("6ba7b810-9dad-11d180-b4-00c04fd430c8");
        FAIL() << "Expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.offset(), 18u);
    }
}

TEST(ByteCodecTest, FormatErrorOffsetsAccountForWrapping) {
    try {
        ByteCodec::decode("{6ba7b810-9dad-11d1-80b4-00c04fd430cz}");
        FAIL() << "Expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.offset(), 36u);
    }

    try {
        ByteCodec::decode("urn:uuid:6ba7b810-9dad-11d1-80b4-00c04fd430cz");
        FAIL() << "Expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.offset(), 44u);
    }

    try {
        ByteCodec::decode("urn:uuiX:6ba7b810-9dad-11d1-80b4-00c04fd430c8");
        FAIL() << "Expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.offset(), 7u);
    }
}

TEST(ByteCodecTest, WrongLengthHasNoOffset) {
    try {
        ByteCodec::decode("6ba7b810");
        FAIL() << "Expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.offset(), FormatError::npos);
        EXPECT_EQ(e.source(), "6ba7b810");
    }
}

TEST(ByteCodecTest, DecodeCanonicalRejectsOtherForms) {
    EXPECT_EQ(ByteCodec::decodeCanonical("6BA7B810-9DAD-11D1-80B4-00C04FD430C8"), DNS_BYTES);

    for (size_t i = 2; i < VALID_URL_STRINGS.size(); ++i) {
        EXPECT_THROW(ByteCodec::decodeCanonical(VALID_URL_STRINGS[i]), FormatError)
            << VALID_URL_STRINGS[i];
    }
}

TEST(ByteCodecTest, DetectForm) {
    EXPECT_EQ(ByteCodec::detectForm(VALID_URL_STRINGS[0]), TextForm::CANONICAL);
    EXPECT_EQ(ByteCodec::detectForm(VALID_URL_STRINGS[2]), TextForm::HEX);
    EXPECT_EQ(ByteCodec::detectForm(VALID_URL_STRINGS[5]), TextForm::BRACED);
    EXPECT_EQ(ByteCodec::detectForm(VALID_URL_STRINGS[6]), TextForm::BRACED_HEX);
    EXPECT_EQ(ByteCodec::detectForm(VALID_URL_STRINGS[7]), TextForm::URN);
    EXPECT_FALSE(ByteCodec::detectForm("[6ba7b811-9dad-11d1-80b4-00c04fd430c8]").has_value());
    EXPECT_FALSE(ByteCodec::detectForm("abc").has_value());
}

TEST(ByteCodecTest, DetectFormChecksDashes) {
    EXPECT_FALSE(ByteCodec::detectForm("6ba7b811x9dad-11d1-80b4-00c04fd430c8").has_value());
    EXPECT_FALSE(ByteCodec::detectForm("6ba7b811-9dad-11d180-b4-00c04fd430c8").has_value());
    EXPECT_FALSE(ByteCodec::detectForm("{6ba7b811-9dad-11d1-80b400c04fd430c8-}").has_value());
    EXPECT_FALSE(ByteCodec::detectForm("urn:uuid:6ba7b811-9dad-11d1_80b4-00c04fd430c8").has_value());

    // Hex digits are not validated, only the literals
    EXPECT_EQ(ByteCodec::detectForm("zzzzzzzz-zzzz-zzzz-zzzz-zzzzzzzzzzzz"), TextForm::CANONICAL);
}

TEST(ByteCodecTest, HexNibble) {
    EXPECT_EQ(ByteCodec::hexNibble('0'), 0);
    EXPECT_EQ(ByteCodec::hexNibble('9'), 9);
    EXPECT_EQ(ByteCodec::hexNibble('a'), 10);
    EXPECT_EQ(ByteCodec::hexNibble('F'), 15);
    EXPECT_EQ(ByteCodec::hexNibble('g'), -1);
    EXPECT_EQ(ByteCodec::hexNibble('-'), -1);
}
