/**
 * @file uuid_util.hpp
 * @brief String-in, string-out convenience facade over the generators.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#pragma once

#include "uuidkit/services/export.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace uuidkit {
namespace services {

/**
 * @class UuidUtil
 * @brief One-call UUID helpers returning canonical strings.
 *
 * Thread-safe. v1() draws from a single process-wide time-based
 * generator guarded by a mutex, so successive calls are ordered.
 *
 * Usage:
 * @code
 * std::string id = UuidUtil::v4();
 * std::string stable = UuidUtil::v5("dns", "example.com");
 * if (UuidUtil::compare(a, b) < 0) { ... }
 * @endcode
 */
class UUIDKIT_SERVICES_API UuidUtil {
public:
    /**
     * @brief Time-based UUID from the shared process-wide generator.
     */
    static std::string v1();

    /**
     * @brief Time-based UUID from a fresh generator using the given node id.
     * @throws core::ArgumentError if nodeId is not 6 bytes.
     */
    static std::string v1(const std::vector<uint8_t>& nodeId);

    /**
     * @brief Random-based UUID.
     */
    static std::string v4();

    /**
     * @brief Name-based UUID.
     * @param ns Namespace as UUID text in any accepted form, or one of
     *           "dns", "url", "oid", "x500".
     * @param name Name within the namespace (UTF-8).
     * @throws core::FormatError if ns is neither.
     */
    static std::string v5(const std::string& ns, const std::string& name);

    /**
     * @brief Order two UUID strings.
     * @return Negative, zero or positive.
     * @throws core::FormatError if either string is not a UUID.
     */
    static int compare(const std::string& a, const std::string& b);

    /**
     * @brief Check whether text is a UUID in any accepted form.
     */
    static bool isValid(const std::string& text);

    /**
     * @brief Canonical form of any accepted UUID text.
     * @throws core::FormatError on invalid input.
     */
    static std::string normalize(const std::string& text);

    /**
     * @return "00000000-0000-0000-0000-000000000000"
     */
    static std::string nil();
};

}  // namespace services
}  // namespace uuidkit
