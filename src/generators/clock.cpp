/**
 * @file clock.cpp
 * @brief System clock implementation.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#include "uuidkit/generators/clock.hpp"

#include <chrono>
#include <ratio>

namespace uuidkit {
namespace generators {

namespace {

using Intervals = std::chrono::duration<int64_t, std::ratio<1, 10000000>>;

}  // anonymous namespace

int64_t SystemClock::ticks() const {
    return static_cast<int64_t>(
        std::chrono::steady_clock::now().time_since_epoch().count());
}

int64_t SystemClock::frequency() const {
    using Period = std::chrono::steady_clock::period;
    return static_cast<int64_t>(Period::den / Period::num);
}

int64_t SystemClock::unixTimeIntervals() const {
    return std::chrono::duration_cast<Intervals>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::shared_ptr<Clock> systemClock() {
    static const std::shared_ptr<Clock> instance = std::make_shared<SystemClock>();
    return instance;
}

}  // namespace generators
}  // namespace uuidkit
