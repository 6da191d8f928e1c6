/**
 * @file byte_codec.cpp
 * @brief UUID text codec implementation.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#include "uuidkit/core/byte_codec.hpp"
#include "uuidkit/core/errors.hpp"

namespace uuidkit {
namespace core {

namespace {

constexpr char LOWER_DIGITS[] = "0123456789abcdef";
constexpr char UPPER_DIGITS[] = "0123456789ABCDEF";
constexpr char URN_PREFIX[] = "urn:uuid:";
constexpr size_t URN_PREFIX_LENGTH = sizeof(URN_PREFIX) - 1;

// Offsets of the first hex digit of each byte within the canonical form
constexpr size_t CANONICAL_BYTE_POSITIONS[16] = {
    0, 2, 4, 6, 9, 11, 14, 16, 19, 21, 24, 26, 28, 30, 32, 34
};
constexpr size_t CANONICAL_DASH_POSITIONS[4] = {8, 13, 18, 23};

/**
 * @brief Why a decode attempt failed.
 *
 * offset is relative to the full source string.
 */
struct DecodeFailure {
    const char* message;
    size_t offset;
};

std::optional<DecodeFailure> decodeHexPair(const std::string& text, size_t pos,
                                           uint8_t& out) {
    int hi = ByteCodec::hexNibble(text[pos]);
    if (hi < 0) {
        return DecodeFailure{"Invalid character in UUID string", pos};
    }
    int lo = ByteCodec::hexNibble(text[pos + 1]);
    if (lo < 0) {
        return DecodeFailure{"Invalid character in UUID string", pos + 1};
    }
    out = static_cast<uint8_t>((hi << 4) | lo);
    return std::nullopt;
}

/// Decode 36 canonical characters starting at @p start.
std::optional<DecodeFailure> decodeCanonicalAt(const std::string& text,
                                               size_t start, UuidBytes& out) {
    for (size_t dash : CANONICAL_DASH_POSITIONS) {
        if (text[start + dash] != '-') {
            return DecodeFailure{"Expected '-' in UUID string", start + dash};
        }
    }
    for (size_t i = 0; i < out.size(); ++i) {
        auto failure = decodeHexPair(text, start + CANONICAL_BYTE_POSITIONS[i], out[i]);
        if (failure) {
            return failure;
        }
    }
    return std::nullopt;
}

/// Decode 32 hex characters starting at @p start.
std::optional<DecodeFailure> decodeHexAt(const std::string& text, size_t start,
                                         UuidBytes& out) {
    for (size_t i = 0; i < out.size(); ++i) {
        auto failure = decodeHexPair(text, start + 2 * i, out[i]);
        if (failure) {
            return failure;
        }
    }
    return std::nullopt;
}

bool hasCanonicalDashes(const std::string& text, size_t start) {
    for (size_t dash : CANONICAL_DASH_POSITIONS) {
        if (text[start + dash] != '-') {
            return false;
        }
    }
    return true;
}

std::optional<DecodeFailure> checkBraces(const std::string& text) {
    if (text.front() != '{') {
        return DecodeFailure{"Expected '{' at start of GUID string", 0};
    }
    if (text.back() != '}') {
        return DecodeFailure{"Expected '}' at end of GUID string", text.size() - 1};
    }
    return std::nullopt;
}

std::optional<DecodeFailure> decodeInto(const std::string& text, UuidBytes& out) {
    switch (text.size()) {
        case ByteCodec::CANONICAL_LENGTH:
            return decodeCanonicalAt(text, 0, out);

        case ByteCodec::HEX_LENGTH:
            return decodeHexAt(text, 0, out);

        case ByteCodec::BRACED_LENGTH: {
            auto failure = checkBraces(text);
            if (failure) {
                return failure;
            }
            return decodeCanonicalAt(text, 1, out);
        }

        case ByteCodec::BRACED_HEX_LENGTH: {
            auto failure = checkBraces(text);
            if (failure) {
                return failure;
            }
            return decodeHexAt(text, 1, out);
        }

        case ByteCodec::URN_LENGTH:
            for (size_t i = 0; i < URN_PREFIX_LENGTH; ++i) {
                if (text[i] != URN_PREFIX[i]) {
                    return DecodeFailure{"Invalid UUID URN prefix", i};
                }
            }
            return decodeCanonicalAt(text, URN_PREFIX_LENGTH, out);

        default:
            return DecodeFailure{"UUID string has invalid length", FormatError::npos};
    }
}

void appendHex(std::string& dst, const uint8_t* bytes, size_t count,
               const char* digits) {
    for (size_t i = 0; i < count; ++i) {
        dst.push_back(digits[bytes[i] >> 4]);
        dst.push_back(digits[bytes[i] & 0x0F]);
    }
}

void appendCanonical(std::string& dst, const UuidBytes& bytes, const char* digits) {
    appendHex(dst, bytes.data(), 4, digits);
    dst.push_back('-');
    appendHex(dst, bytes.data() + 4, 2, digits);
    dst.push_back('-');
    appendHex(dst, bytes.data() + 6, 2, digits);
    dst.push_back('-');
    appendHex(dst, bytes.data() + 8, 2, digits);
    dst.push_back('-');
    appendHex(dst, bytes.data() + 10, 6, digits);
}

}  // anonymous namespace

std::string ByteCodec::encode(const UuidBytes& bytes) {
    std::string result;
    result.reserve(CANONICAL_LENGTH);
    appendCanonical(result, bytes, LOWER_DIGITS);
    return result;
}

std::string ByteCodec::encodeAs(const UuidBytes& bytes, TextForm form, bool upper) {
    const char* digits = upper ? UPPER_DIGITS : LOWER_DIGITS;
    std::string result;
    result.reserve(URN_LENGTH);

    switch (form) {
        case TextForm::CANONICAL:
            appendCanonical(result, bytes, digits);
            break;
        case TextForm::HEX:
            appendHex(result, bytes.data(), bytes.size(), digits);
            break;
        case TextForm::BRACED:
            result.push_back('{');
            appendCanonical(result, bytes, digits);
            result.push_back('}');
            break;
        case TextForm::BRACED_HEX:
            result.push_back('{');
            appendHex(result, bytes.data(), bytes.size(), digits);
            result.push_back('}');
            break;
        case TextForm::URN:
            result.append(URN_PREFIX);
            appendCanonical(result, bytes, digits);
            break;
    }
    return result;
}

UuidBytes ByteCodec::decode(const std::string& text) {
    UuidBytes bytes{};
    auto failure = decodeInto(text, bytes);
    if (failure) {
        throw FormatError(failure->message, text, failure->offset);
    }
    return bytes;
}

UuidBytes ByteCodec::decodeCanonical(const std::string& text) {
    if (text.size() != CANONICAL_LENGTH) {
        throw FormatError("UUID string is not in canonical form", text);
    }
    UuidBytes bytes{};
    auto failure = decodeCanonicalAt(text, 0, bytes);
    if (failure) {
        throw FormatError(failure->message, text, failure->offset);
    }
    return bytes;
}

std::optional<UuidBytes> ByteCodec::tryDecode(const std::string& text) {
    UuidBytes bytes{};
    if (decodeInto(text, bytes)) {
        return std::nullopt;
    }
    return bytes;
}

std::optional<TextForm> ByteCodec::detectForm(const std::string& text) {
    switch (text.size()) {
        case CANONICAL_LENGTH:
            if (!hasCanonicalDashes(text, 0)) return std::nullopt;
            return TextForm::CANONICAL;
        case HEX_LENGTH:
            return TextForm::HEX;
        case BRACED_LENGTH:
            if (checkBraces(text) || !hasCanonicalDashes(text, 1)) return std::nullopt;
            return TextForm::BRACED;
        case BRACED_HEX_LENGTH:
            if (checkBraces(text)) return std::nullopt;
            return TextForm::BRACED_HEX;
        case URN_LENGTH:
            if (text.compare(0, URN_PREFIX_LENGTH, URN_PREFIX) != 0 ||
                !hasCanonicalDashes(text, URN_PREFIX_LENGTH)) {
                return std::nullopt;
            }
            return TextForm::URN;
        default:
            return std::nullopt;
    }
}

}  // namespace core
}  // namespace uuidkit
