/**
 * @file main.cpp
 * @brief uuidinfo-cli entry point
 *
 * Decodes each UUID given on the command line and prints its report.
 */

#include "output_formatter.hpp"

#include <uuidinfo/cli/config.hpp>
#include <uuidinfo/core/errors.hpp>
#include <uuidinfo/core/report_builder.hpp>
#include <uuidinfo/core/uuid.hpp>
#include <uuidinfo/utils/error_chain.hpp>
#include <uuidinfo/utils/logger.hpp>

#include <exception>
#include <iostream>

using namespace uuidinfo;

int main(int argc, char* argv[]) {
    cli::Config config = cli::parseArgs(argc, argv);

    if (config.invalid) {
        std::cerr << "Use --help for usage information.\n";
        return 1;
    }
    if (config.help || config.uuids.empty()) {
        cli::printUsage(argv[0]);
        return config.help ? 0 : 1;
    }

    utils::Logger::instance().setLevel(utils::parseLogLevel(config.log_level));

    core::ReportOptions options;
    options.decode.byte_order = config.little_endian ? core::ByteOrder::LittleEndian
                                                     : core::ByteOrder::BigEndian;
    options.mac_delimiter = config.mac_delimiter;
    options.mac_uppercase = config.mac_uppercase;

    cli::OutputFormatter out(config.json);
    size_t failures = 0;

    for (size_t i = 0; i < config.uuids.size(); ++i) {
        const std::string& text = config.uuids[i];
        try {
            const core::Uuid uuid = core::Uuid::parse(text);
            if (i > 0 && !config.json) {
                out.print_line("");
            }
            out.print_report(core::buildReport(uuid, options));
        } catch (const core::ParseError& e) {
            ++failures;
            LOG_ERROR("Cli", "Rejected input \"{}\"", e.input());
            out.print_error(text, utils::describeException(e));
        } catch (const std::exception& e) {
            ++failures;
            LOG_ERROR("Cli", "Failed to describe \"{}\": {}", text, e.what());
            out.print_error(text, utils::describeException(e));
        }
    }

    out.flush();
    LOG_DEBUG("Cli", "Decoded {} of {} inputs", config.uuids.size() - failures, config.uuids.size());
    return failures == 0 ? 0 : 1;
}
