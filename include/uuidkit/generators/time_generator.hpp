/**
 * @file time_generator.hpp
 * @brief Time-based (version 1) UUID generator.
 *
 * The generator captures the wall clock once at construction (the "zero
 * point") and afterwards advances only by the monotonic clock, so wall
 * clock adjustments cannot move its timestamps backwards.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#pragma once

#include "uuidkit/core/uuid.hpp"
#include "uuidkit/generators/clock.hpp"
#include "uuidkit/generators/export.hpp"
#include "uuidkit/generators/random_source.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace uuidkit {
namespace generators {

/**
 * @class TimeUuidGenerator
 * @brief Generates RFC 4122 version 1 UUIDs from a random node id.
 *
 * State per instance:
 * - clock sequence (14 bits), bumped whenever the clock is seen to regress
 * - node id (6 bytes), random with the multicast bit set unless supplied
 * - the interval count observed by the last generate() call
 * - extra intervals handed out while the clock did not advance
 *
 * Not thread-safe. Callers sharing one instance must serialize
 * generate() themselves.
 *
 * Usage:
 * @code
 * TimeUuidGenerator gen;
 * core::Uuid a = gen.generate();
 * core::Uuid b = gen.generate();   // b > a
 *
 * // Later, possibly in another process:
 * auto resumed = TimeUuidGenerator::fromLastUuid(b);
 * @endcode
 */
class UUIDKIT_GENERATORS_API TimeUuidGenerator {
public:
    using NodeId = std::array<uint8_t, 6>;

    /// 100ns intervals between 1582-10-15 and 1970-01-01.
    static constexpr int64_t GREGORIAN_OFFSET = 0x01B21DD213814000LL;
    static constexpr int64_t INTERVALS_PER_SECOND = 10000000;
    static constexpr int64_t INTERVALS_PER_MILLISECOND = 10000;
    static constexpr uint64_t TIMESTAMP_MASK = 0x0FFFFFFFFFFFFFFFULL;
    /// Highest clock frequency whose sub-second ticks convert without overflow.
    static constexpr int64_t MAX_CLOCK_FREQUENCY = INT64_MAX / INTERVALS_PER_SECOND;

    /**
     * @brief Generator with a random node id and clock sequence.
     * @param clock Time source; the system clock if null.
     * @param random Random source; the process-wide secure source if null.
     */
    explicit TimeUuidGenerator(std::shared_ptr<Clock> clock = nullptr,
                               std::shared_ptr<RandomSource> random = nullptr);

    /**
     * @brief Generator with an explicit node id.
     * @throws core::ArgumentError if nodeId is not exactly 6 bytes.
     */
    explicit TimeUuidGenerator(const std::vector<uint8_t>& nodeId,
                               std::shared_ptr<Clock> clock = nullptr,
                               std::shared_ptr<RandomSource> random = nullptr);

    /**
     * @brief Continue from the last UUID issued by an earlier generator.
     *
     * Inherits node id and clock sequence. If the previous UUID's timestamp
     * is ahead of this generator's clock the clock sequence is incremented.
     * Finding the current timestamp consumes one generate() call whose
     * result is discarded.
     *
     * @throws core::ArgumentError if last is not a version 1 UUID.
     */
    static TimeUuidGenerator fromLastUuid(const core::Uuid& last,
                                          std::shared_ptr<Clock> clock = nullptr,
                                          std::shared_ptr<RandomSource> random = nullptr);

    /**
     * @brief Produce the next UUID.
     * @throws core::RateLimitError if more than 10 000 UUIDs are requested
     *         before the clock advances; generator state is left unchanged.
     */
    core::Uuid generate();

    uint16_t clockSequence() const { return clockSeq_; }

    NodeId nodeId() const { return nodeId_; }

private:
    TimeUuidGenerator(const std::optional<NodeId>& nodeId,
                      std::shared_ptr<Clock> clock,
                      std::shared_ptr<RandomSource> random);

    static NodeId randomNodeId(RandomSource& random);
    static NodeId validNodeId(const std::vector<uint8_t>& nodeId);

    /// 100ns intervals elapsed since construction per the monotonic clock.
    int64_t elapsedIntervals() const;

    std::shared_ptr<Clock> clock_;
    NodeId nodeId_;
    uint16_t clockSeq_;
    int64_t frequency_;
    int64_t startTicks_;
    int64_t zeroIntervals_;   // UUID-epoch timestamp of startTicks_
    int64_t lastIntervals_;
    int64_t extraIntervals_;  // -1 until the first UUID is issued
};

}  // namespace generators
}  // namespace uuidkit
