/**
 * @file errors.hpp
 * @brief Exception types raised by uuidkit.
 *
 * Every failure is reported synchronously by throwing one of these types.
 * They all derive from UuidError so callers can catch the whole family.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#pragma once

#include "uuidkit/core/export.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace uuidkit {
namespace core {

/**
 * @class UuidError
 * @brief Base class of all uuidkit exceptions.
 */
class UUIDKIT_CORE_API UuidError : public std::runtime_error {
public:
    explicit UuidError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class FormatError
 * @brief Text could not be decoded as a UUID.
 *
 * Holds the rejected source text and the index of the offending character.
 * offset() is npos when the text was rejected as a whole (wrong length,
 * missing braces or prefix).
 */
class UUIDKIT_CORE_API FormatError : public UuidError {
public:
    static constexpr size_t npos = static_cast<size_t>(-1);

    FormatError(const std::string& message, const std::string& source,
                size_t offset = npos)
        : UuidError(buildWhat(message, source, offset))
        , source_(source)
        , offset_(offset)
    {}

    /// The text that failed to decode.
    const std::string& source() const { return source_; }

    /// Index of the offending character, or npos.
    size_t offset() const { return offset_; }

private:
    static std::string buildWhat(const std::string& message,
                                 const std::string& source, size_t offset) {
        std::string what = message + " (source: \"" + source + "\"";
        if (offset != npos) {
            what += ", offset: " + std::to_string(offset);
        }
        return what + ")";
    }

    std::string source_;
    size_t offset_;
};

/**
 * @class RangeError
 * @brief A byte buffer is too short for the requested offset.
 */
class UUIDKIT_CORE_API RangeError : public UuidError {
public:
    explicit RangeError(const std::string& message) : UuidError(message) {}
};

/**
 * @class ArgumentError
 * @brief Invalid input given to a generator.
 */
class UUIDKIT_CORE_API ArgumentError : public UuidError {
public:
    explicit ArgumentError(const std::string& message) : UuidError(message) {}
};

/**
 * @class RateLimitError
 * @brief A time-based generator was asked for too many UUIDs per clock tick.
 *
 * Only the failing call is affected; the generator remains usable.
 */
class UUIDKIT_CORE_API RateLimitError : public UuidError {
public:
    explicit RateLimitError(const std::string& message) : UuidError(message) {}
};

}  // namespace core
}  // namespace uuidkit
