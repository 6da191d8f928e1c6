/**
 * @file main.cpp
 * @brief uuidkit-cli entry point
 *
 * Thin executable over the uuidkit libraries:
 * - v1 / v4 / v5 generation
 * - parse: decode any accepted text form and describe the value
 * - compare: order two UUIDs
 */

#include <uuidkit/cli/config.hpp>
#include <uuidkit/core/errors.hpp>
#include <uuidkit/core/uuid.hpp>
#include <uuidkit/generators/name_generator.hpp>
#include <uuidkit/generators/random_generator.hpp>
#include <uuidkit/generators/time_generator.hpp>
#include <uuidkit/services/uuid_util.hpp>
#include <uuidkit/utils/logger.hpp>

#include <iostream>
#include <optional>
#include <string>

using namespace uuidkit;
using namespace uuidkit::cli;

namespace {

std::string render(const core::Uuid& uuid, core::TextForm form, bool upper) {
    return core::ByteCodec::encodeAs(uuid.toBytes(), form, upper);
}

int runV1(const Config& config, core::TextForm form) {
    std::optional<generators::TimeUuidGenerator> generator;
    if (config.node_id.empty()) {
        generator.emplace();
    } else {
        auto node = parseNodeId(config.node_id);
        if (!node) {
            LOG_ERROR("Cli", "Invalid node id: {}", config.node_id);
            return 1;
        }
        generator.emplace(*node);
    }

    for (uint32_t i = 0; i < config.count; ++i) {
        std::cout << render(generator->generate(), form, config.upper) << "\n";
    }
    return 0;
}

int runV4(const Config& config, core::TextForm form) {
    generators::RandomUuidGenerator generator;
    for (uint32_t i = 0; i < config.count; ++i) {
        std::cout << render(generator.generate(), form, config.upper) << "\n";
    }
    return 0;
}

int runV5(const Config& config, core::TextForm form) {
    std::string ns = config.ns;
    std::string name = config.name;
    if (config.operands.size() == 2) {
        ns = config.operands[0];
        name = config.operands[1];
    } else if (config.operands.size() == 1) {
        name = config.operands[0];
    } else if (!config.operands.empty()) {
        LOG_ERROR("Cli", "v5 takes at most 2 operands, got {}", config.operands.size());
        return 1;
    }

    auto nsUuid = generators::namespaceByName(ns);
    core::Uuid resolved = nsUuid ? *nsUuid : core::Uuid::parse(ns);
    generators::NameUuidGenerator generator(resolved);
    std::cout << render(generator.generate(name), form, config.upper) << "\n";
    return 0;
}

int runParse(const Config& config, core::TextForm form) {
    if (config.operands.size() != 1) {
        LOG_ERROR("Cli", "parse takes exactly 1 operand, got {}", config.operands.size());
        return 1;
    }

    const std::string& text = config.operands[0];
    core::Uuid uuid = core::Uuid::parse(text);
    auto detected = core::ByteCodec::detectForm(text);

    std::cout << "uuid:    " << render(uuid, form, config.upper) << "\n"
              << "input:   " << core::textFormToString(*detected) << "\n"
              << "variant: " << core::variantToString(uuid.variant()) << "\n"
              << "version: " << uuid.version() << "\n";
    if (uuid.variant() == core::Variant::RFC4122 && uuid.version() == 1) {
        std::cout << "time:    " << uuid.timestamp() << "\n"
                  << "clock:   " << uuid.clockSequence() << "\n";
    }
    return 0;
}

int runCompare(const Config& config) {
    if (config.operands.size() != 2) {
        LOG_ERROR("Cli", "compare takes exactly 2 operands, got {}", config.operands.size());
        return 1;
    }

    int result = services::UuidUtil::compare(config.operands[0], config.operands[1]);
    std::cout << (result < 0 ? -1 : (result > 0 ? 1 : 0)) << "\n";
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    Config config = parseArgs(argc, argv);

    if (config.help) {
        printUsage(argv[0]);
        return config.error ? 1 : 0;
    }

    utils::Logger::instance().setLevel(parseLogLevel(config.log_level));

    auto form = parseTextForm(config.format);
    if (!form) {
        LOG_ERROR("Cli", "Unknown format: {}", config.format);
        return 1;
    }

    LOG_DEBUG("Cli", "Command: {}, count: {}", config.command, config.count);

    try {
        if (config.command == "v1") return runV1(config, *form);
        if (config.command == "v4") return runV4(config, *form);
        if (config.command == "v5") return runV5(config, *form);
        if (config.command == "parse") return runParse(config, *form);
        if (config.command == "compare") return runCompare(config);

        LOG_ERROR("Cli", "Unknown command: {}", config.command);
        printUsage(argv[0]);
        return 1;

    } catch (const core::UuidError& e) {
        LOG_ERROR("Cli", "{}", e.what());
        return 1;
    }
}
