/**
 * @file random_generator.hpp
 * @brief Random-based (version 4) UUID generator.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#pragma once

#include "uuidkit/core/uuid.hpp"
#include "uuidkit/generators/export.hpp"
#include "uuidkit/generators/random_source.hpp"

#include <memory>

namespace uuidkit {
namespace generators {

/**
 * @class RandomUuidGenerator
 * @brief Generates RFC 4122 version 4 UUIDs.
 *
 * Format: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
 * where x is any hex digit and y is one of 8, 9, a, or b.
 *
 * Thread safety is that of the supplied RandomSource; the default
 * secure source may be shared.
 */
class UUIDKIT_GENERATORS_API RandomUuidGenerator {
public:
    /**
     * @param random Random source; the process-wide secure source if null.
     */
    explicit RandomUuidGenerator(std::shared_ptr<RandomSource> random = nullptr);

    core::Uuid generate();

private:
    std::shared_ptr<RandomSource> random_;
};

}  // namespace generators
}  // namespace uuidkit
