/**
 * @file random_generator.cpp
 * @brief Version 4 UUID generation.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#include "uuidkit/generators/random_generator.hpp"

#include <utility>

namespace uuidkit {
namespace generators {

RandomUuidGenerator::RandomUuidGenerator(std::shared_ptr<RandomSource> random)
    : random_(random ? std::move(random) : secureRandomSource())
{}

core::Uuid RandomUuidGenerator::generate() {
    core::UuidBytes bytes{};

    for (size_t i = 0; i < 4; ++i) {
        uint32_t value = random_->nextUint32();
        bytes[i * 4] = static_cast<uint8_t>(value >> 24);
        bytes[i * 4 + 1] = static_cast<uint8_t>(value >> 16);
        bytes[i * 4 + 2] = static_cast<uint8_t>(value >> 8);
        bytes[i * 4 + 3] = static_cast<uint8_t>(value);
    }

    // Set version (4) and variant (10xx) bits per RFC 4122
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    return core::Uuid::fromBytes(bytes);
}

}  // namespace generators
}  // namespace uuidkit
