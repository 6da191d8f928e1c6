/**
 * @file uuid.hpp
 * @brief Immutable 128-bit RFC 4122 UUID value.
 *
 * The value is held as four 32-bit big-endian words:
 * - word 0: time_low
 * - word 1: time_mid | time_hi_and_version
 * - word 2: clock_seq_hi_and_reserved | clock_seq_low | node[0..1]
 * - word 3: node[2..5]
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#pragma once

#include "uuidkit/core/byte_codec.hpp"
#include "uuidkit/core/export.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace uuidkit {
namespace core {

/**
 * @enum Variant
 * @brief Layout family encoded in the top bits of byte 8.
 */
enum class Variant {
    NCS,        ///< 0xx - reserved, NCS backward compatibility
    RFC4122,    ///< 10x - the layout specified by RFC 4122
    MICROSOFT,  ///< 110 - reserved, Microsoft backward compatibility
    FUTURE      ///< 111 - reserved for future definition
};

inline const char* variantToString(Variant variant) {
    switch (variant) {
        case Variant::NCS:       return "ncs";
        case Variant::RFC4122:   return "rfc4122";
        case Variant::MICROSOFT: return "microsoft";
        case Variant::FUTURE:    return "future";
        default:                 return "unknown";
    }
}

/**
 * @class Uuid
 * @brief A 128-bit Universally Unique Identifier.
 *
 * Instances are immutable and may be shared freely between threads.
 * A default-constructed Uuid is the nil UUID.
 *
 * Ordering is not plain byte order: the version is compared first, and
 * two time-based (v1) values are ordered by their 60-bit timestamp so
 * that they sort chronologically.
 *
 * Usage:
 * @code
 * Uuid a = Uuid::parse("urn:uuid:6ba7b810-9dad-11d1-80b4-00c04fd430c8");
 * auto b = Uuid::tryParse(userInput);
 * if (b && *b < a) { ... }
 * @endcode
 */
class UUIDKIT_CORE_API Uuid {
public:
    static constexpr size_t SIZE = 16;

    /// Mask of the 14-bit v1 clock sequence.
    static constexpr uint16_t CLOCK_SEQUENCE_MASK = 0x3FFF;

    /**
     * @brief Construct the nil UUID.
     */
    Uuid() : words_{0, 0, 0, 0} {}

    /**
     * @brief The nil UUID (all zero bits).
     */
    static const Uuid& nil();

    /**
     * @brief Create a UUID from 16 bytes of a larger buffer.
     * @param data Buffer start.
     * @param length Buffer length in bytes.
     * @param offset Index of the first UUID byte.
     * @throws RangeError if offset + 16 exceeds length.
     */
    static Uuid fromBytes(const uint8_t* data, size_t length, size_t offset = 0);

    static Uuid fromBytes(const std::vector<uint8_t>& bytes, size_t offset = 0) {
        return fromBytes(bytes.data(), bytes.size(), offset);
    }

    static Uuid fromBytes(const UuidBytes& bytes) {
        return fromBytes(bytes.data(), bytes.size(), 0);
    }

    /**
     * @brief Parse any of the accepted text forms.
     * @throws FormatError on invalid input.
     */
    static Uuid parse(const std::string& text);

    /**
     * @brief Parse any of the accepted text forms.
     * @return std::nullopt on invalid input.
     */
    static std::optional<Uuid> tryParse(const std::string& text);

    /**
     * @brief Parse the canonical 36-character form only.
     * @throws FormatError for any other text.
     */
    static Uuid fromString(const std::string& text);

    /**
     * @brief Copy of the 16 bytes in big-endian order.
     */
    UuidBytes toBytes() const;

    /**
     * @brief Canonical lower-case representation.
     */
    std::string toString() const;

    Variant variant() const;

    /**
     * @brief Top nibble of byte 6 (0-15).
     *
     * Meaningful only when variant() is RFC4122.
     */
    int version() const { return static_cast<int>((words_[1] >> 12) & 0x0F); }

    bool isNil() const {
        return (words_[0] | words_[1] | words_[2] | words_[3]) == 0;
    }

    // Field views used by time-based UUIDs

    uint32_t timeLow() const { return words_[0]; }
    uint16_t timeMid() const { return static_cast<uint16_t>(words_[1] >> 16); }
    /// time_hi without the version nibble (12 bits).
    uint16_t timeHi() const { return static_cast<uint16_t>(words_[1] & 0x0FFF); }

    /// 60-bit count of 100ns intervals since 1582-10-15 (v1 only).
    uint64_t timestamp() const {
        return (static_cast<uint64_t>(timeHi()) << 48) |
               (static_cast<uint64_t>(timeMid()) << 32) |
               timeLow();
    }

    /// 14-bit clock sequence (bytes 8-9 without the variant bits).
    uint16_t clockSequence() const {
        return static_cast<uint16_t>(words_[2] >> 16) & CLOCK_SEQUENCE_MASK;
    }

    /// Bytes 10-15.
    std::array<uint8_t, 6> node() const;

    size_t hash() const noexcept;

    /**
     * @brief Total order over UUIDs.
     * @return Negative, zero or positive as a is less, equal or greater than b.
     */
    static int compare(const Uuid& a, const Uuid& b);

    int compareTo(const Uuid& other) const { return compare(*this, other); }

    bool operator==(const Uuid& other) const {
        return words_[0] == other.words_[0] && words_[1] == other.words_[1] &&
               words_[2] == other.words_[2] && words_[3] == other.words_[3];
    }
    bool operator!=(const Uuid& other) const { return !(*this == other); }
    bool operator<(const Uuid& other) const { return compare(*this, other) < 0; }
    bool operator<=(const Uuid& other) const { return compare(*this, other) <= 0; }
    bool operator>(const Uuid& other) const { return compare(*this, other) > 0; }
    bool operator>=(const Uuid& other) const { return compare(*this, other) >= 0; }

private:
    Uuid(uint32_t w0, uint32_t w1, uint32_t w2, uint32_t w3)
        : words_{w0, w1, w2, w3} {}

    std::array<uint32_t, 4> words_;
};

UUIDKIT_CORE_API std::ostream& operator<<(std::ostream& os, const Uuid& uuid);

}  // namespace core
}  // namespace uuidkit

namespace std {

template <>
struct hash<uuidkit::core::Uuid> {
    size_t operator()(const uuidkit::core::Uuid& uuid) const noexcept {
        return uuid.hash();
    }
};

}  // namespace std
