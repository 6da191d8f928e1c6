/**
 * @file name_generator.cpp
 * @brief Version 5 UUID generation and the well-known namespaces.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#include "uuidkit/generators/name_generator.hpp"
#include "uuidkit/generators/sha1.hpp"

#include <algorithm>
#include <cctype>

namespace uuidkit {
namespace generators {

const core::Uuid& namespaceDns() {
    static const core::Uuid ns = core::Uuid::fromString("6ba7b810-9dad-11d1-80b4-00c04fd430c8");
    return ns;
}

const core::Uuid& namespaceUrl() {
    static const core::Uuid ns = core::Uuid::fromString("6ba7b811-9dad-11d1-80b4-00c04fd430c8");
    return ns;
}

const core::Uuid& namespaceOid() {
    static const core::Uuid ns = core::Uuid::fromString("6ba7b812-9dad-11d1-80b4-00c04fd430c8");
    return ns;
}

const core::Uuid& namespaceX500() {
    static const core::Uuid ns = core::Uuid::fromString("6ba7b814-9dad-11d1-80b4-00c04fd430c8");
    return ns;
}

std::optional<core::Uuid> namespaceByName(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "dns") return namespaceDns();
    if (lower == "url") return namespaceUrl();
    if (lower == "oid") return namespaceOid();
    if (lower == "x500") return namespaceX500();
    return std::nullopt;
}

NameUuidGenerator::NameUuidGenerator(const core::Uuid& ns)
    : namespace_(ns)
    , namespaceBytes_(ns.toBytes())
{}

core::Uuid NameUuidGenerator::generate(const void* name, size_t length) const {
    Sha1 sha;
    sha.update(namespaceBytes_.data(), namespaceBytes_.size());
    sha.update(name, length);
    Sha1::Digest digest = sha.finalize();

    core::UuidBytes bytes{};
    std::copy_n(digest.begin(), bytes.size(), bytes.begin());

    // Set version (5) and variant (10xx) bits per RFC 4122
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x50);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    return core::Uuid::fromBytes(bytes);
}

}  // namespace generators
}  // namespace uuidkit
