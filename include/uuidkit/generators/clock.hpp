/**
 * @file clock.hpp
 * @brief Time source consumed by the time-based UUID generator.
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
 * @class Clock
 * @brief Monotonic tick counter plus a wall clock.
 *
 * The monotonic counter may be coarse or, for a faulty source, move
 * backwards; TimeUuidGenerator is written to cope with both.
 */
class UUIDKIT_GENERATORS_API Clock {
public:
    virtual ~Clock() = default;

    /**
     * @brief Current monotonic tick count.
     */
    virtual int64_t ticks() const = 0;

    /**
     * @brief Ticks per second of ticks(). Always positive.
     */
    virtual int64_t frequency() const = 0;

    /**
     * @brief Wall-clock time in 100ns intervals since 1970-01-01 UTC.
     */
    virtual int64_t unixTimeIntervals() const = 0;
};

/**
 * @class SystemClock
 * @brief Clock backed by std::chrono::steady_clock and system_clock.
 */
class UUIDKIT_GENERATORS_API SystemClock : public Clock {
public:
    int64_t ticks() const override;
    int64_t frequency() const override;
    int64_t unixTimeIntervals() const override;
};

/**
 * @brief Process-wide SystemClock instance.
 */
UUIDKIT_GENERATORS_API std::shared_ptr<Clock> systemClock();

}  // namespace generators
}  // namespace uuidkit
