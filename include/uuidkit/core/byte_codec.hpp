/**
 * @file byte_codec.hpp
 * @brief Conversion between the 16-byte UUID layout and its text forms.
 *
 * Accepted input grammars (hex digits are case-insensitive):
 * - Canonical:   xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx   (36 chars)
 * - Hex:         xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx       (32 chars)
 * - Braced:      {xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx} (38 chars)
 * - Braced hex:  {xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx}     (34 chars)
 * - URN:         urn:uuid:xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx (45 chars)
 *
 * The grammar is selected by input length alone; the literal characters
 * of the selected grammar must then match exactly.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#pragma once

#include "uuidkit/core/export.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace uuidkit {
namespace core {

/// Raw big-endian UUID bytes.
using UuidBytes = std::array<uint8_t, 16>;

/**
 * @enum TextForm
 * @brief Textual UUID representations understood by the codec.
 */
enum class TextForm {
    CANONICAL,   ///< 8-4-4-4-12 with hyphens
    HEX,         ///< 32 hex digits
    BRACED,      ///< canonical wrapped in braces (GUID style)
    BRACED_HEX,  ///< hex wrapped in braces
    URN          ///< "urn:uuid:" + canonical
};

inline const char* textFormToString(TextForm form) {
    switch (form) {
        case TextForm::CANONICAL:  return "canonical";
        case TextForm::HEX:        return "hex";
        case TextForm::BRACED:     return "braced";
        case TextForm::BRACED_HEX: return "braced-hex";
        case TextForm::URN:        return "urn";
        default:                   return "unknown";
    }
}

/**
 * @class ByteCodec
 * @brief Stateless UUID text encoder/decoder.
 *
 * All buffers are per call; the codec is safe to use from any thread.
 *
 * Usage:
 * @code
 * UuidBytes b = ByteCodec::decode("{6ba7b810-9dad-11d1-80b4-00c04fd430c8}");
 * std::string s = ByteCodec::encode(b);
 * // "6ba7b810-9dad-11d1-80b4-00c04fd430c8"
 * @endcode
 */
class UUIDKIT_CORE_API ByteCodec {
public:
    static constexpr size_t CANONICAL_LENGTH = 36;
    static constexpr size_t HEX_LENGTH = 32;
    static constexpr size_t BRACED_LENGTH = 38;
    static constexpr size_t BRACED_HEX_LENGTH = 34;
    static constexpr size_t URN_LENGTH = 45;

    /**
     * @brief Encode bytes as the 36-char lower-case canonical form.
     */
    static std::string encode(const UuidBytes& bytes);

    /**
     * @brief Encode bytes in any of the decodable forms.
     * @param bytes UUID bytes.
     * @param form Target representation.
     * @param upper Emit upper-case hex digits (the URN prefix stays lower).
     */
    static std::string encodeAs(const UuidBytes& bytes, TextForm form,
                                bool upper = false);

    /**
     * @brief Decode any accepted text form.
     * @throws FormatError if the text matches none of the grammars.
     */
    static UuidBytes decode(const std::string& text);

    /**
     * @brief Decode only the canonical 36-char form.
     * @throws FormatError on any other input.
     */
    static UuidBytes decodeCanonical(const std::string& text);

    /**
     * @brief Like decode(), but returns std::nullopt instead of throwing.
     */
    static std::optional<UuidBytes> tryDecode(const std::string& text);

    /**
     * @brief Identify the grammar a string would be decoded with.
     * @return The form selected by the length and the literal characters
     *         (braces, URN prefix, dashes), or std::nullopt. Hex digits are
     *         not validated.
     */
    static std::optional<TextForm> detectForm(const std::string& text);

    /**
     * @brief Value of a hex digit, or -1 for any other character.
     */
    static int hexNibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
};

}  // namespace core
}  // namespace uuidkit
