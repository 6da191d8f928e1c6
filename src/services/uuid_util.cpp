/**
 * @file uuid_util.cpp
 * @brief UuidUtil facade implementation.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#include "uuidkit/services/uuid_util.hpp"
#include "uuidkit/core/uuid.hpp"
#include "uuidkit/generators/name_generator.hpp"
#include "uuidkit/generators/random_generator.hpp"
#include "uuidkit/generators/time_generator.hpp"

#include <mutex>

namespace uuidkit {
namespace services {

namespace {

std::mutex& sharedTimeMutex() {
    static std::mutex mutex;
    return mutex;
}

generators::TimeUuidGenerator& sharedTimeGenerator() {
    static generators::TimeUuidGenerator generator;
    return generator;
}

}  // anonymous namespace

std::string UuidUtil::v1() {
    std::lock_guard<std::mutex> lock(sharedTimeMutex());
    return sharedTimeGenerator().generate().toString();
}

std::string UuidUtil::v1(const std::vector<uint8_t>& nodeId) {
    return generators::TimeUuidGenerator(nodeId).generate().toString();
}

std::string UuidUtil::v4() {
    return generators::RandomUuidGenerator().generate().toString();
}

std::string UuidUtil::v5(const std::string& ns, const std::string& name) {
    auto wellKnown = generators::namespaceByName(ns);
    core::Uuid nsUuid = wellKnown ? *wellKnown : core::Uuid::parse(ns);
    return generators::NameUuidGenerator(nsUuid).generate(name).toString();
}

int UuidUtil::compare(const std::string& a, const std::string& b) {
    return core::Uuid::compare(core::Uuid::parse(a), core::Uuid::parse(b));
}

bool UuidUtil::isValid(const std::string& text) {
    return core::ByteCodec::tryDecode(text).has_value();
}

std::string UuidUtil::normalize(const std::string& text) {
    return core::Uuid::parse(text).toString();
}

std::string UuidUtil::nil() {
    return core::Uuid::nil().toString();
}

}  // namespace services
}  // namespace uuidkit
