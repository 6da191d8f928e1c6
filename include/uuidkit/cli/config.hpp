/**
 * @file config.hpp
 * @brief uuidkit-cli configuration and argument parsing
 */

#pragma once

#include "uuidkit/core/byte_codec.hpp"
#include "uuidkit/utils/logger.hpp"

#include <cstdint>
#include <cstring>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace uuidkit {
namespace cli {

/**
 * @brief CLI configuration structure
 */
struct Config {
    std::string command = "v4";            ///< v1, v4, v5, parse, compare
    std::vector<std::string> operands;     ///< Positional arguments after the command
    uint32_t count = 1;                    ///< UUIDs to emit for v1/v4
    std::string node_id;                   ///< 12 hex digits for v1 (empty = random)
    std::string ns = "dns";                ///< v5 namespace: dns, url, oid, x500 or UUID text
    std::string name;                      ///< v5 name
    std::string format = "canonical";      ///< canonical, hex, braced, braced-hex, urn
    bool upper = false;                    ///< Upper-case hex digits
    std::string log_level = "WARN";
    bool help = false;
    bool error = false;                    ///< Set when the arguments were rejected
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name) {
    std::cout << "uuidkit-cli - Generate, parse and compare UUIDs\n\n"
              << "Usage: " << program_name << " [OPTIONS] [COMMAND] [OPERANDS...]\n\n"
              << "Commands:\n"
              << "  v1                    Time-based UUID\n"
              << "  v4                    Random UUID (default)\n"
              << "  v5 [<ns> <name>]      Name-based UUID (SHA-1)\n"
              << "  parse <text>          Decode any accepted form and describe it\n"
              << "  compare <a> <b>       Print -1, 0 or 1\n"
              << "\nOptions:\n"
              << "  --count <n>           Number of UUIDs for v1/v4 (default: 1)\n"
              << "  --node-id <hex>       6-byte node id for v1, e.g. 01:23:45:67:89:ab\n"
              << "  --namespace <ns>      v5 namespace: dns, url, oid, x500 or a UUID (default: dns)\n"
              << "  --name <text>         v5 name\n"
              << "  --format <form>       canonical, hex, braced, braced-hex, urn (default: canonical)\n"
              << "  --upper               Upper-case hex digits\n"
              << "  --log-level <level>   TRACE, DEBUG, INFO, WARN, ERROR, FATAL, OFF (default: WARN)\n"
              << "\n  --help                Show this help message\n\n"
              << "Example:\n"
              << "  " << program_name << " v1 --count 5\n"
              << "  " << program_name << " v5 dns python.org\n"
              << "  " << program_name << " --format urn parse 6BA7B810-9DAD-11D1-80B4-00C04FD430C8\n";
}

/**
 * @brief Map a --format value to a text form
 * @return The form, or std::nullopt for unknown names
 */
inline std::optional<core::TextForm> parseTextForm(const std::string& name) {
    if (name == "canonical") return core::TextForm::CANONICAL;
    if (name == "hex") return core::TextForm::HEX;
    if (name == "braced" || name == "guid") return core::TextForm::BRACED;
    if (name == "braced-hex") return core::TextForm::BRACED_HEX;
    if (name == "urn") return core::TextForm::URN;
    return std::nullopt;
}

/**
 * @brief Parse a node id given as 12 hex digits
 *
 * ':' and '-' separators are ignored, so both "0123456789ab" and
 * "01:23:45:67:89:ab" are accepted.
 *
 * @return The 6 bytes, or std::nullopt if the text is malformed
 */
inline std::optional<std::vector<uint8_t>> parseNodeId(const std::string& text) {
    std::string digits;
    for (char c : text) {
        if (c == ':' || c == '-') continue;
        digits.push_back(c);
    }
    if (digits.size() != 12) {
        return std::nullopt;
    }

    std::vector<uint8_t> node;
    for (size_t i = 0; i < digits.size(); i += 2) {
        int hi = core::ByteCodec::hexNibble(digits[i]);
        int lo = core::ByteCodec::hexNibble(digits[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        node.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return node;
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;
    bool have_command = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        if (std::strcmp(arg, "--upper") == 0) {
            config.upper = true;
            continue;
        }

        // Positional: first is the command, the rest are its operands
        if (arg[0] != '-' || std::strcmp(arg, "-") == 0) {
            if (!have_command) {
                config.command = arg;
                have_command = true;
            } else {
                config.operands.push_back(arg);
            }
            continue;
        }

        // Options that require a value
        if (i + 1 >= argc) {
            std::cerr << "Error: Option " << arg << " requires a value\n";
            config.help = true;
            config.error = true;
            return config;
        }

        const char* value = argv[++i];

        if (std::strcmp(arg, "--command") == 0) {
            config.command = value;
            have_command = true;
        } else if (std::strcmp(arg, "--count") == 0) {
            try {
                unsigned long count = std::stoul(value);
                if (count == 0 || count > 1000000) {
                    throw std::out_of_range("count");
                }
                config.count = static_cast<uint32_t>(count);
            } catch (const std::logic_error&) {
                std::cerr << "Error: Invalid count " << value << " (1-1000000)\n";
                config.help = true;
                config.error = true;
                return config;
            }
        } else if (std::strcmp(arg, "--node-id") == 0) {
            config.node_id = value;
        } else if (std::strcmp(arg, "--namespace") == 0) {
            config.ns = value;
        } else if (std::strcmp(arg, "--name") == 0) {
            config.name = value;
        } else if (std::strcmp(arg, "--format") == 0) {
            config.format = value;
        } else if (std::strcmp(arg, "--log-level") == 0) {
            config.log_level = value;
        } else {
            std::cerr << "Error: Unknown option " << arg << "\n";
            config.help = true;
            config.error = true;
            return config;
        }
    }

    return config;
}

/**
 * @brief Convert log level string to LogLevel enum
 * @param level_str Log level string
 * @return LogLevel value (defaults to INFO if invalid)
 */
inline utils::LogLevel parseLogLevel(const std::string& level_str) {
    return utils::Logger::parseLevel(level_str);
}

}  // namespace cli
}  // namespace uuidkit
