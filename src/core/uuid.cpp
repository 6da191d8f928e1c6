/**
 * @file uuid.cpp
 * @brief UUID value implementation.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#include "uuidkit/core/uuid.hpp"
#include "uuidkit/core/errors.hpp"

#include <ostream>

namespace uuidkit {
namespace core {

namespace {

uint32_t readWord(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

void writeWord(uint8_t* p, uint32_t word) {
    p[0] = static_cast<uint8_t>(word >> 24);
    p[1] = static_cast<uint8_t>(word >> 16);
    p[2] = static_cast<uint8_t>(word >> 8);
    p[3] = static_cast<uint8_t>(word);
}

int compareUnsigned(uint32_t a, uint32_t b) {
    if (a < b) return -1;
    if (a > b) return 1;
    return 0;
}

// Murmur3 64-bit finalizer
uint64_t mix64(uint64_t k) {
    k ^= k >> 33;
    k *= 0xFF51AFD7ED558CCDULL;
    k ^= k >> 33;
    k *= 0xC4CEB9FE1A85EC53ULL;
    k ^= k >> 33;
    return k;
}

// Indexed by the three top bits of byte 8
constexpr Variant VARIANTS[8] = {
    Variant::NCS,        // 0 0 0
    Variant::NCS,        // 0 0 1
    Variant::NCS,        // 0 1 0
    Variant::NCS,        // 0 1 1
    Variant::RFC4122,    // 1 0 0
    Variant::RFC4122,    // 1 0 1
    Variant::MICROSOFT,  // 1 1 0
    Variant::FUTURE      // 1 1 1
};

}  // anonymous namespace

const Uuid& Uuid::nil() {
    static const Uuid instance;
    return instance;
}

Uuid Uuid::fromBytes(const uint8_t* data, size_t length, size_t offset) {
    if (data == nullptr || offset > length || length - offset < SIZE) {
        throw RangeError("Invalid UUID byte range: offset " + std::to_string(offset) +
                         " with buffer length " + std::to_string(length) +
                         " (16 bytes required)");
    }

    const uint8_t* p = data + offset;
    Uuid uuid(readWord(p), readWord(p + 4), readWord(p + 8), readWord(p + 12));
    if (uuid.isNil()) {
        return nil();
    }
    return uuid;
}

Uuid Uuid::parse(const std::string& text) {
    return fromBytes(ByteCodec::decode(text));
}

std::optional<Uuid> Uuid::tryParse(const std::string& text) {
    auto bytes = ByteCodec::tryDecode(text);
    if (!bytes) {
        return std::nullopt;
    }
    return fromBytes(*bytes);
}

Uuid Uuid::fromString(const std::string& text) {
    return fromBytes(ByteCodec::decodeCanonical(text));
}

UuidBytes Uuid::toBytes() const {
    UuidBytes bytes{};
    for (size_t i = 0; i < words_.size(); ++i) {
        writeWord(bytes.data() + 4 * i, words_[i]);
    }
    return bytes;
}

std::string Uuid::toString() const {
    return ByteCodec::encode(toBytes());
}

Variant Uuid::variant() const {
    return VARIANTS[words_[2] >> 29];
}

std::array<uint8_t, 6> Uuid::node() const {
    return {
        static_cast<uint8_t>(words_[2] >> 8),
        static_cast<uint8_t>(words_[2]),
        static_cast<uint8_t>(words_[3] >> 24),
        static_cast<uint8_t>(words_[3] >> 16),
        static_cast<uint8_t>(words_[3] >> 8),
        static_cast<uint8_t>(words_[3])
    };
}

size_t Uuid::hash() const noexcept {
    uint64_t hi = (static_cast<uint64_t>(words_[0]) << 32) | words_[1];
    uint64_t lo = (static_cast<uint64_t>(words_[2]) << 32) | words_[3];
    return static_cast<size_t>(mix64(hi ^ mix64(lo)));
}

int Uuid::compare(const Uuid& a, const Uuid& b) {
    int diff = a.version() - b.version();
    if (diff != 0) {
        return diff < 0 ? -1 : 1;
    }

    if (a.version() == 1) {
        // time_low is the most significant byte run but the least
        // significant part of the timestamp
        diff = compareUnsigned(a.timeHi(), b.timeHi());
        if (diff != 0) return diff;
        diff = compareUnsigned(a.timeMid(), b.timeMid());
        if (diff != 0) return diff;
        diff = compareUnsigned(a.timeLow(), b.timeLow());
        if (diff != 0) return diff;
    } else {
        diff = compareUnsigned(a.words_[0], b.words_[0]);
        if (diff != 0) return diff;
        diff = compareUnsigned(a.words_[1], b.words_[1]);
        if (diff != 0) return diff;
    }

    diff = compareUnsigned(a.words_[2], b.words_[2]);
    if (diff != 0) return diff;
    return compareUnsigned(a.words_[3], b.words_[3]);
}

std::ostream& operator<<(std::ostream& os, const Uuid& uuid) {
    return os << uuid.toString();
}

}  // namespace core
}  // namespace uuidkit
