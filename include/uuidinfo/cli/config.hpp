/**
 * @file config.hpp
 * @brief uuidinfo-cli configuration and argument parsing
 */

#pragma once

#include <cstring>
#include <iostream>
#include <string>
#include <vector>

namespace uuidinfo {
namespace cli {

/**
 * @brief Tool configuration structure
 */
struct Config {
    std::vector<std::string> uuids;  ///< UUID strings to decode, in order
    bool json = false;               ///< One JSON object per UUID
    bool little_endian = false;      ///< Read time fields little-endian
    std::string mac_delimiter = ":";
    bool mac_uppercase = false;
    std::string log_level = "INFO";
    bool demo = false;               ///< Append the built-in sample UUIDs
    bool help = false;
    bool invalid = false;            ///< Arguments could not be parsed
};

/**
 * @brief Sample UUIDs covering versions 1 to 5.
 */
inline const std::vector<std::string>& demoUuids() {
    static const std::vector<std::string> uuids = {
        "8be4df61-93ca-11d2-aa0d-00e098032b8c",
        "8be4df61-93ca-21d2-aa0d-00e098032b8c",
        "8be4df61-93ca-31d2-aa0d-00e098032b8c",
        "8be4df61-93ca-41d2-aa0d-00e098032b8c",
        "8be4df61-93ca-51d2-aa0d-00e098032b8c",
        "cab00d1e-cab0-10d1-beca-00decab00d1e",
    };
    return uuids;
}

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name) {
    std::cout << "uuidinfo - Decode RFC 4122 UUIDs\n\n"
              << "Usage: " << program_name << " [OPTIONS] <uuid>...\n\n"
              << "Accepted forms: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, {...}, urn:uuid:...\n\n"
              << "Options:\n"
              << "  --json                 Print each report as a JSON object\n"
              << "  --little-endian        Read time fields in little-endian (GUID) order\n"
              << "  --mac-delimiter <d>    Separator between MAC address bytes (default: :)\n"
              << "  --upper-mac            Print MAC addresses in uppercase\n"
              << "  --log-level <level>    TRACE, DEBUG, INFO, WARN, ERROR, FATAL, OFF (default: INFO)\n"
              << "  --demo                 Decode a built-in set of sample UUIDs\n"
              << "  --help                 Show this help message\n\n"
              << "Example:\n"
              << "  " << program_name << " 8be4df61-93ca-11d2-aa0d-00e098032b8c\n"
              << "  " << program_name << " --json --upper-mac --mac-delimiter - {8be4df61-93ca-11d2-aa0d-00e098032b8c}\n";
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        // Flags without a value
        if (std::strcmp(arg, "--json") == 0) {
            config.json = true;
            continue;
        }
        if (std::strcmp(arg, "--little-endian") == 0) {
            config.little_endian = true;
            continue;
        }
        if (std::strcmp(arg, "--upper-mac") == 0) {
            config.mac_uppercase = true;
            continue;
        }
        if (std::strcmp(arg, "--demo") == 0) {
            config.demo = true;
            continue;
        }

        // Anything not starting with "--" is a UUID
        if (std::strncmp(arg, "--", 2) != 0) {
            config.uuids.emplace_back(arg);
            continue;
        }

        if (std::strcmp(arg, "--mac-delimiter") != 0 && std::strcmp(arg, "--log-level") != 0) {
            std::cerr << "Error: Unknown option " << arg << "\n";
            config.invalid = true;
            return config;
        }

        if (i + 1 >= argc) {
            std::cerr << "Error: Option " << arg << " requires a value\n";
            config.invalid = true;
            return config;
        }

        const char* value = argv[++i];

        if (std::strcmp(arg, "--mac-delimiter") == 0) {
            config.mac_delimiter = value;
        } else {
            config.log_level = value;
        }
    }

    if (config.demo) {
        const auto& samples = demoUuids();
        config.uuids.insert(config.uuids.end(), samples.begin(), samples.end());
    }

    return config;
}

}  // namespace cli
}  // namespace uuidinfo
