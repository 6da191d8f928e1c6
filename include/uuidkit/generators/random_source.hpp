/**
 * @file random_source.hpp
 * @brief Source of uniformly distributed random integers.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#pragma once

#include "uuidkit/generators/export.hpp"

#include <cstdint>
#include <memory>

namespace uuidkit {
namespace generators {

/**
 * @class RandomSource
 * @brief Uniform random integer provider used by the generators.
 *
 * Replaceable so tests can feed fixed values.
 */
class UUIDKIT_GENERATORS_API RandomSource {
public:
    virtual ~RandomSource() = default;

    virtual uint32_t nextUint32() = 0;
    virtual uint16_t nextUint16() = 0;
};

/**
 * @class SecureRandomSource
 * @brief Cryptographically secure source backed by OpenSSL RAND_bytes.
 *
 * Stateless on our side and safe to share between threads.
 *
 * @throws core::UuidError from nextUint32()/nextUint16() if the
 *         OpenSSL generator cannot produce output.
 */
class UUIDKIT_GENERATORS_API SecureRandomSource : public RandomSource {
public:
    uint32_t nextUint32() override;
    uint16_t nextUint16() override;
};

/**
 * @brief Process-wide SecureRandomSource instance.
 */
UUIDKIT_GENERATORS_API std::shared_ptr<RandomSource> secureRandomSource();

}  // namespace generators
}  // namespace uuidkit
