/**
 * @file time_generator.cpp
 * @brief Version 1 UUID generation.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#include "uuidkit/generators/time_generator.hpp"
#include "uuidkit/core/errors.hpp"
#include "uuidkit/utils/logger.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace uuidkit {
namespace generators {

namespace {

constexpr const char* COMPONENT = "TimeGenerator";

std::string nodeToString(const TimeUuidGenerator::NodeId& node) {
    static const char digits[] = "0123456789abcdef";
    std::string text;
    for (size_t i = 0; i < node.size(); ++i) {
        if (i > 0) {
            text.push_back(':');
        }
        text.push_back(digits[node[i] >> 4]);
        text.push_back(digits[node[i] & 0x0F]);
    }
    return text;
}

}  // anonymous namespace

TimeUuidGenerator::TimeUuidGenerator(std::shared_ptr<Clock> clock,
                                     std::shared_ptr<RandomSource> random)
    : TimeUuidGenerator(std::nullopt, std::move(clock), std::move(random))
{}

TimeUuidGenerator::TimeUuidGenerator(const std::vector<uint8_t>& nodeId,
                                     std::shared_ptr<Clock> clock,
                                     std::shared_ptr<RandomSource> random)
    : TimeUuidGenerator(validNodeId(nodeId), std::move(clock), std::move(random))
{}

TimeUuidGenerator::TimeUuidGenerator(const std::optional<NodeId>& nodeId,
                                     std::shared_ptr<Clock> clock,
                                     std::shared_ptr<RandomSource> random)
    : clock_(clock ? std::move(clock) : systemClock())
    , nodeId_{}
    , clockSeq_(0)
    , frequency_(clock_->frequency())
    , startTicks_(clock_->ticks())
    , zeroIntervals_(GREGORIAN_OFFSET + clock_->unixTimeIntervals())
    , lastIntervals_(0)
    , extraIntervals_(-1)
{
    if (frequency_ <= 0 || frequency_ > MAX_CLOCK_FREQUENCY) {
        throw core::ArgumentError("Clock frequency must be in 1.." +
                                  std::to_string(MAX_CLOCK_FREQUENCY) + " Hz, got " +
                                  std::to_string(frequency_));
    }

    if (!random) {
        random = secureRandomSource();
    }
    nodeId_ = nodeId ? *nodeId : randomNodeId(*random);
    clockSeq_ = random->nextUint16() & core::Uuid::CLOCK_SEQUENCE_MASK;

    LOG_DEBUG(COMPONENT, "Created generator: node {}, clock sequence {}, clock frequency {} Hz",
              nodeToString(nodeId_), clockSeq_, frequency_);
}

TimeUuidGenerator::NodeId TimeUuidGenerator::randomNodeId(RandomSource& random) {
    NodeId node{};
    uint32_t u = random.nextUint32();
    node[0] = static_cast<uint8_t>((u >> 24) | 0x01);  // multicast bit
    node[1] = static_cast<uint8_t>(u >> 16);
    node[2] = static_cast<uint8_t>(u >> 8);
    node[3] = static_cast<uint8_t>(u);
    uint16_t v = random.nextUint16();
    node[4] = static_cast<uint8_t>(v >> 8);
    node[5] = static_cast<uint8_t>(v);
    return node;
}

TimeUuidGenerator::NodeId TimeUuidGenerator::validNodeId(const std::vector<uint8_t>& nodeId) {
    NodeId node{};
    if (nodeId.size() != node.size()) {
        throw core::ArgumentError("Node id must be exactly 6 bytes, got " +
                                  std::to_string(nodeId.size()));
    }
    std::copy(nodeId.begin(), nodeId.end(), node.begin());
    return node;
}

TimeUuidGenerator TimeUuidGenerator::fromLastUuid(const core::Uuid& last,
                                                  std::shared_ptr<Clock> clock,
                                                  std::shared_ptr<RandomSource> random) {
    if (last.version() != 1) {
        throw core::ArgumentError("UUID is not time-based v1 (version " +
                                  std::to_string(last.version()) + ")");
    }

    TimeUuidGenerator generator(std::optional<NodeId>(last.node()),
                                std::move(clock), std::move(random));
    generator.clockSeq_ = last.clockSequence();

    // timestamp() packs time_hi, time_mid, time_low in that priority
    core::Uuid resumed = generator.generate();
    if (last.timestamp() > resumed.timestamp()) {
        generator.clockSeq_ = (generator.clockSeq_ + 1) & core::Uuid::CLOCK_SEQUENCE_MASK;
        LOG_WARN(COMPONENT, "Last UUID {} is ahead of the clock, clock sequence now {}",
                 last, generator.clockSeq_);
    }

    return generator;
}

int64_t TimeUuidGenerator::elapsedIntervals() const {
    // Exact conversion: clocks coarser than 100ns yield several intervals
    // per tick, finer clocks several ticks per interval.
    int64_t ticks = clock_->ticks() - startTicks_;
    int64_t seconds = ticks / frequency_;
    int64_t remainder = ticks % frequency_;
    return seconds * INTERVALS_PER_SECOND + remainder * INTERVALS_PER_SECOND / frequency_;
}

core::Uuid TimeUuidGenerator::generate() {
    int64_t current = elapsedIntervals();
    int64_t diff = current - lastIntervals_;
    uint16_t clockSeq = clockSeq_;
    int64_t extra = 0;

    if (diff < 0) {
        // Clock regression: signal the discontinuity per RFC 4122 4.2.1
        clockSeq = (clockSeq + 1) & core::Uuid::CLOCK_SEQUENCE_MASK;
        LOG_WARN(COMPONENT, "Clock went back by {} intervals, clock sequence now {}",
                 -diff, clockSeq);
    } else if (extraIntervals_ >= diff) {
        // Still inside the run of intervals already handed out
        extra = extraIntervals_ - diff + 1;
        if (extra > INTERVALS_PER_MILLISECOND) {
            LOG_ERROR(COMPONENT, "Rate limit exceeded: {} UUIDs within one clock tick", extra);
            throw core::RateLimitError("Cannot generate more than 10M UUIDs/sec");
        }
    }

    clockSeq_ = clockSeq;
    lastIntervals_ = current;
    extraIntervals_ = extra;

    uint64_t timestamp = static_cast<uint64_t>(zeroIntervals_ + current + extra) & TIMESTAMP_MASK;
    uint32_t timeLow = static_cast<uint32_t>(timestamp);
    uint16_t timeMid = static_cast<uint16_t>(timestamp >> 32);
    uint16_t timeHi = static_cast<uint16_t>(timestamp >> 48) & 0x0FFF;

    core::UuidBytes bytes{};
    bytes[0] = static_cast<uint8_t>(timeLow >> 24);
    bytes[1] = static_cast<uint8_t>(timeLow >> 16);
    bytes[2] = static_cast<uint8_t>(timeLow >> 8);
    bytes[3] = static_cast<uint8_t>(timeLow);
    bytes[4] = static_cast<uint8_t>(timeMid >> 8);
    bytes[5] = static_cast<uint8_t>(timeMid);
    bytes[6] = static_cast<uint8_t>((timeHi >> 8) | 0x10);          // version 1
    bytes[7] = static_cast<uint8_t>(timeHi);
    bytes[8] = static_cast<uint8_t>(((clockSeq >> 8) & 0x3F) | 0x80);  // variant 10x
    bytes[9] = static_cast<uint8_t>(clockSeq);
    for (size_t i = 0; i < nodeId_.size(); ++i) {
        bytes[10 + i] = nodeId_[i];
    }

    return core::Uuid::fromBytes(bytes);
}

}  // namespace generators
}  // namespace uuidkit
