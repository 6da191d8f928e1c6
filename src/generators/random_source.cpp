/**
 * @file random_source.cpp
 * @brief OpenSSL-backed random source.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#include "uuidkit/generators/random_source.hpp"
#include "uuidkit/core/errors.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <string>

namespace uuidkit {
namespace generators {

namespace {

void fillRandom(unsigned char* buf, int length) {
    if (RAND_bytes(buf, length) != 1) {
        throw core::UuidError("RAND_bytes failed: error " +
                              std::to_string(ERR_get_error()));
    }
}

}  // anonymous namespace

uint32_t SecureRandomSource::nextUint32() {
    unsigned char buf[4];
    fillRandom(buf, sizeof(buf));
    return (static_cast<uint32_t>(buf[0]) << 24) |
           (static_cast<uint32_t>(buf[1]) << 16) |
           (static_cast<uint32_t>(buf[2]) << 8) |
           static_cast<uint32_t>(buf[3]);
}

uint16_t SecureRandomSource::nextUint16() {
    unsigned char buf[2];
    fillRandom(buf, sizeof(buf));
    return static_cast<uint16_t>((buf[0] << 8) | buf[1]);
}

std::shared_ptr<RandomSource> secureRandomSource() {
    static const std::shared_ptr<RandomSource> instance =
        std::make_shared<SecureRandomSource>();
    return instance;
}

}  // namespace generators
}  // namespace uuidkit
