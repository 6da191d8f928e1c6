/**
 * @file name_generator.hpp
 * @brief Name-based (version 5, SHA-1) UUID generator.
 *
 * Only SHA-1 is supported; MD5-based version 3 is deprecated.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#pragma once

#include "uuidkit/core/uuid.hpp"
#include "uuidkit/generators/export.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace uuidkit {
namespace generators {

// RFC 4122 Appendix C namespaces

/// 6ba7b810-9dad-11d1-80b4-00c04fd430c8
UUIDKIT_GENERATORS_API const core::Uuid& namespaceDns();
/// 6ba7b811-9dad-11d1-80b4-00c04fd430c8
UUIDKIT_GENERATORS_API const core::Uuid& namespaceUrl();
/// 6ba7b812-9dad-11d1-80b4-00c04fd430c8
UUIDKIT_GENERATORS_API const core::Uuid& namespaceOid();
/// 6ba7b814-9dad-11d1-80b4-00c04fd430c8
UUIDKIT_GENERATORS_API const core::Uuid& namespaceX500();

/**
 * @brief Look up a well-known namespace by short name.
 * @param name "dns", "url", "oid" or "x500" (case-insensitive).
 */
UUIDKIT_GENERATORS_API std::optional<core::Uuid> namespaceByName(const std::string& name);

/**
 * @class NameUuidGenerator
 * @brief Generates RFC 4122 version 5 UUIDs for names within a namespace.
 *
 * Deterministic: the same namespace and name always give the same UUID.
 * Holds no mutable state; generate() is safe to call concurrently.
 *
 * Usage:
 * @code
 * NameUuidGenerator gen(namespaceDns());
 * gen.generate("python.org").toString();
 * // "886313e1-3b8a-5372-9b90-0c9aee199e5d"
 * @endcode
 */
class UUIDKIT_GENERATORS_API NameUuidGenerator {
public:
    explicit NameUuidGenerator(const core::Uuid& ns);

    /**
     * @brief UUID for a name given as UTF-8 text.
     */
    core::Uuid generate(const std::string& name) const {
        return generate(name.data(), name.size());
    }

    /**
     * @brief UUID for a name given as raw bytes.
     */
    core::Uuid generate(const void* name, size_t length) const;

    const core::Uuid& ns() const { return namespace_; }

    /**
     * @brief New generator for another namespace.
     */
    NameUuidGenerator withNamespace(const core::Uuid& ns) const {
        return NameUuidGenerator(ns);
    }

private:
    core::Uuid namespace_;
    core::UuidBytes namespaceBytes_;
};

}  // namespace generators
}  // namespace uuidkit
