/**
 * @file test_uuid.cpp
 * @brief Unit tests for the UUID value type
 */

#include <gtest/gtest.h>
#include <uuidkit/core/byte_codec.hpp>
#include <uuidkit/core/errors.hpp>
#include <uuidkit/core/uuid.hpp>

#include <algorithm>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

using namespace uuidkit::core;

namespace {

const char* DNS_TEXT = "6ba7b810-9dad-11d1-80b4-00c04fd430c8";
const char* URL_TEXT = "6ba7b811-9dad-11d1-80b4-00c04fd430c8";
const char* OID_TEXT = "6ba7b812-9dad-11d1-80b4-00c04fd430c8";
const char* X500_TEXT = "6ba7b814-9dad-11d1-80b4-00c04fd430c8";

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

UuidBytes withByte(size_t index, uint8_t value) {
    UuidBytes bytes{};
    bytes[index] = value;
    return bytes;
}

}  // namespace

// =============================================================================
// Construction
// =============================================================================

TEST(UuidTest, DefaultIsNil) {
    Uuid uuid;
    EXPECT_TRUE(uuid.isNil());
    EXPECT_EQ(uuid, Uuid::nil());
    EXPECT_EQ(uuid.toString(), "00000000-0000-0000-0000-000000000000");
}

TEST(UuidTest, AllZeroBytesYieldNilSingleton) {
    Uuid uuid = Uuid::fromBytes(UuidBytes{});
    EXPECT_TRUE(uuid.isNil());
    EXPECT_EQ(uuid, Uuid::nil());
}

TEST(UuidTest, ParseNilTextInEveryForm) {
    for (TextForm form : {TextForm::CANONICAL, TextForm::HEX, TextForm::BRACED,
                          TextForm::BRACED_HEX, TextForm::URN}) {
        std::string text = ByteCodec::encodeAs(UuidBytes{}, form);
        Uuid uuid = Uuid::parse(text);

        EXPECT_TRUE(uuid.isNil()) << text;
        EXPECT_EQ(uuid, Uuid::nil()) << text;
        EXPECT_EQ(Uuid::tryParse(text), Uuid::nil()) << text;
    }
}

TEST(UuidTest, FromBytesAtOffset) {
    std::vector<uint8_t> buffer(20, 0xAA);
    UuidBytes dns = Uuid::fromString(DNS_TEXT).toBytes();
    std::copy(dns.begin(), dns.end(), buffer.begin() + 3);

    EXPECT_EQ(Uuid::fromBytes(buffer, 3).toString(), DNS_TEXT);
    EXPECT_EQ(Uuid::fromBytes(buffer.data(), buffer.size(), 3).toString(), DNS_TEXT);
}

TEST(UuidTest, FromBytesRejectsShortRange) {
    std::vector<uint8_t> empty;
    EXPECT_THROW(Uuid::fromBytes(empty), RangeError);

    std::vector<uint8_t> seventeen(17, 0x11);
    EXPECT_NO_THROW(Uuid::fromBytes(seventeen, 1));
    EXPECT_THROW(Uuid::fromBytes(seventeen, 2), RangeError);
    EXPECT_THROW(Uuid::fromBytes(seventeen, 40), RangeError);
    EXPECT_THROW(Uuid::fromBytes(nullptr, 16), RangeError);
}

TEST(UuidTest, RangeErrorIsUuidError) {
    std::vector<uint8_t> empty;
    EXPECT_THROW(Uuid::fromBytes(empty), UuidError);
}

TEST(UuidTest, ToBytesReturnsCopy) {
    Uuid uuid = Uuid::fromString(DNS_TEXT);
    UuidBytes bytes = uuid.toBytes();
    bytes[0] = 0x00;

    EXPECT_EQ(uuid.toBytes()[0], 0x6B);
    EXPECT_EQ(uuid.toString(), DNS_TEXT);
}

TEST(UuidTest, ToStringIsCanonicalLowerCase) {
    EXPECT_EQ(Uuid::parse("6BA7B811-9DAD-11D1-80B4-00C04FD430C8").toString(), URL_TEXT);
    EXPECT_EQ(Uuid::parse("urn:uuid:6ba7b812-9dad-11d1-80b4-00c04fd430c8").toString(), OID_TEXT);
    EXPECT_EQ(Uuid::parse("{6ba7b8149dad11d180b400c04fd430c8}").toString(), X500_TEXT);
}

TEST(UuidTest, FromStringAcceptsOnlyCanonical) {
    EXPECT_NO_THROW(Uuid::fromString(URL_TEXT));
    EXPECT_THROW(Uuid::fromString("6ba7b8119dad11d180b400c04fd430c8"), FormatError);
    EXPECT_THROW(Uuid::fromString("{6ba7b811-9dad-11d1-80b4-00c04fd430c8}"), FormatError);
}

TEST(UuidTest, TryParse) {
    auto uuid = Uuid::tryParse(URL_TEXT);
    ASSERT_TRUE(uuid.has_value());
    EXPECT_EQ(uuid->toString(), URL_TEXT);

    EXPECT_FALSE(Uuid::tryParse("not-a-uuid").has_value());
}

TEST(UuidTest, MalformedTextRejected) {
    for (const auto& text : INVALID_STRINGS) {
        EXPECT_THROW(Uuid::parse(text), FormatError) << text;
        EXPECT_FALSE(Uuid::tryParse(text).has_value()) << text;
    }
}

TEST(UuidTest, StreamOutput) {
    std::ostringstream os;
    os << Uuid::fromString(DNS_TEXT);
    EXPECT_EQ(os.str(), DNS_TEXT);
}

// =============================================================================
// Variant and version
// =============================================================================

TEST(UuidTest, VariantFromTopBitsOfByte8) {
    const Variant expected[8] = {
        Variant::NCS, Variant::NCS, Variant::NCS, Variant::NCS,
        Variant::RFC4122, Variant::RFC4122, Variant::MICROSOFT, Variant::FUTURE
    };

    for (int i = 0; i < 8; ++i) {
        uint8_t top = static_cast<uint8_t>(i << 5);
        EXPECT_EQ(Uuid::fromBytes(withByte(8, top)).variant(), expected[i]) << i;
        EXPECT_EQ(Uuid::fromBytes(withByte(8, top | 0x1F)).variant(), expected[i]) << i;
    }
}

TEST(UuidTest, VariantNames) {
    EXPECT_STREQ(variantToString(Variant::NCS), "ncs");
    EXPECT_STREQ(variantToString(Variant::RFC4122), "rfc4122");
    EXPECT_STREQ(variantToString(Variant::MICROSOFT), "microsoft");
    EXPECT_STREQ(variantToString(Variant::FUTURE), "future");
}

TEST(UuidTest, VersionFromTopNibbleOfByte6) {
    for (int v = 0; v < 16; ++v) {
        UuidBytes bytes = withByte(6, static_cast<uint8_t>((v << 4) | 0x0F));
        bytes[8] = 0x80;
        EXPECT_EQ(Uuid::fromBytes(bytes).version(), v);
    }
}

TEST(UuidTest, NamespaceIdsAreTimeBased) {
    Uuid dns = Uuid::fromString(DNS_TEXT);
    EXPECT_EQ(dns.variant(), Variant::RFC4122);
    EXPECT_EQ(dns.version(), 1);
}

// =============================================================================
// Time-based fields
// =============================================================================

TEST(UuidTest, TimeFields) {
    Uuid dns = Uuid::fromString(DNS_TEXT);

    EXPECT_EQ(dns.timeLow(), 0x6BA7B810u);
    EXPECT_EQ(dns.timeMid(), 0x9DADu);
    EXPECT_EQ(dns.timeHi(), 0x1D1u);
    EXPECT_EQ(dns.timestamp(), 0x1D19DAD6BA7B810ULL);
    EXPECT_EQ(dns.clockSequence(), 0x00B4u);

    std::array<uint8_t, 6> node = {0x00, 0xC0, 0x4F, 0xD4, 0x30, 0xC8};
    EXPECT_EQ(dns.node(), node);
}

TEST(UuidTest, ClockSequenceIgnoresVariantBits) {
    Uuid uuid = Uuid::parse("00000000-0000-1000-ffff-000000000000");
    EXPECT_EQ(uuid.clockSequence(), 0x3FFFu);
}

// =============================================================================
// Ordering
// =============================================================================

TEST(UuidTest, TimeBasedOrderFollowsTimestamp) {
    Uuid a = Uuid::fromString("00000001-0000-1000-8000-000000000000");
    Uuid b = Uuid::fromString("00000002-0000-1000-8000-000000000000");
    Uuid c = Uuid::fromString("00000000-0001-1000-8000-000000000000");
    Uuid d = Uuid::fromString("00000000-0000-1001-8000-000000000000");

    EXPECT_LT(a, b);
    EXPECT_LT(b, c);
    EXPECT_LT(c, d);
    EXPECT_GT(Uuid::compare(b, a), 0);
    EXPECT_LT(Uuid::compare(a, b), 0);
}

TEST(UuidTest, TimeBasedOrderFallsBackToClockAndNode) {
    Uuid a = Uuid::fromString("00000001-0000-1000-8000-000000000001");
    Uuid b = Uuid::fromString("00000001-0000-1000-8000-000000000002");
    Uuid c = Uuid::fromString("00000001-0000-1000-8001-000000000000");

    EXPECT_LT(a, b);
    EXPECT_LT(b, c);
}

TEST(UuidTest, NilSortsBeforeEverything) {
    Uuid u = Uuid::fromString("7d444840-9dc0-11d1-b245-5ffdce74fad2");
    EXPECT_LT(Uuid::nil(), u);
    EXPECT_GT(u, Uuid::fromString(DNS_TEXT));
}

TEST(UuidTest, VersionComparedFirst) {
    Uuid v1 = Uuid::fromString("ffffffff-ffff-1fff-bfff-ffffffffffff");
    Uuid v4 = Uuid::fromString("00000000-0000-4000-8000-000000000000");
    Uuid v5 = Uuid::fromString("00000000-0000-5000-8000-000000000000");

    EXPECT_LT(v1, v4);
    EXPECT_LT(v4, v5);
}

TEST(UuidTest, NonTimeBasedOrderIsLexicographic) {
    Uuid a = Uuid::fromString("00000001-ffff-4fff-8000-000000000000");
    Uuid b = Uuid::fromString("00000002-0000-4000-8000-000000000000");
    EXPECT_LT(a, b);
    EXPECT_EQ(a.compareTo(a), 0);
}

TEST(UuidTest, OrderingIsTotal) {
    std::vector<Uuid> values = {
        Uuid::nil(),
        Uuid::fromString(DNS_TEXT),
        Uuid::fromString(URL_TEXT),
        Uuid::fromString(OID_TEXT),
        Uuid::fromString(X500_TEXT),
        Uuid::fromString("7d444840-9dc0-11d1-b245-5ffdce74fad2"),
        Uuid::fromString("886313e1-3b8a-5372-9b90-0c9aee199e5d"),
        Uuid::fromString("ffffffff-ffff-4fff-bfff-ffffffffffff"),
        Uuid::fromString("00000000-0000-0000-c000-000000000001"),
    };

    for (const auto& a : values) {
        for (const auto& b : values) {
            int ab = Uuid::compare(a, b);
            int ba = Uuid::compare(b, a);
            EXPECT_EQ(ab == 0, a == b);
            EXPECT_EQ(ab < 0, ba > 0);
        }
    }

    std::vector<Uuid> sorted = values;
    std::sort(sorted.begin(), sorted.end());
    for (size_t i = 1; i < sorted.size(); ++i) {
        EXPECT_LT(sorted[i - 1], sorted[i]);
    }
}

// =============================================================================
// Equality and hashing
// =============================================================================

TEST(UuidTest, EqualValuesHashEqual) {
    Uuid a = Uuid::parse("6BA7B810-9DAD-11D1-80B4-00C04FD430C8");
    Uuid b = Uuid::fromString(DNS_TEXT);

    EXPECT_EQ(a, b);
    EXPECT_EQ(a.hash(), b.hash());
    EXPECT_EQ(std::hash<Uuid>{}(a), std::hash<Uuid>{}(b));
    EXPECT_NE(a, Uuid::fromString(URL_TEXT));
}

TEST(UuidTest, UsableInUnorderedSet) {
    std::unordered_set<Uuid> set;
    set.insert(Uuid::fromString(DNS_TEXT));
    set.insert(Uuid::parse("{6ba7b810-9dad-11d1-80b4-00c04fd430c8}"));
    set.insert(Uuid::fromString(URL_TEXT));

    EXPECT_EQ(set.size(), 2u);
}
