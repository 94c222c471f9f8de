/**
 * @file main.cpp
 * @brief garage-cli entry point
 *
 * Parses the command line, loads configuration from the environment,
 * wires the S3 gateway, progress reporters and orchestrator together and
 * maps the outcome to the process exit status.
 */

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "garage/transfer/cli/command_line.h"
#include "garage/transfer/garage_transfer.h"
#include "garage/transfer/presentation/console_reporter.h"

using namespace garage::transfer;

namespace {

void configure_logging(const environment_settings& settings, const cli::command_line& cmd) {
    auto& logger = get_logger();
    logger.set_level(cmd.verbose ? log_level::debug : settings.level);
    logger.set_output_format(cmd.json_log ? log_output_format::json : settings.format);
    logger.initialize();
}

}  // namespace

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "garage-cli";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    auto parsed = cli::parse_command_line(args);
    if (!parsed) {
        std::cerr << "Error: " << parsed.error().message << "\n\n"
                  << cli::usage_text(program);
        return cli::exit_usage;
    }

    const auto& cmd = parsed.value();
    if (cmd.command == cli::command_kind::help) {
        std::cout << cli::usage_text(program);
        return cli::exit_success;
    }
    if (cmd.command == cli::command_kind::version) {
        std::cout << version::to_string() << "\n";
        return cli::exit_success;
    }

    auto settings = environment_config::load();
    if (!settings) {
        std::cerr << "Error: " << settings.error().message << "\n";
        return cli::exit_failure;
    }
    configure_logging(settings.value(), cmd);

    auto gateway = s3_gateway::create(settings.value().gateway);
    if (!gateway) {
        std::cerr << "Error: " << gateway.error().message << "\n";
        get_logger().shutdown();
        return cli::exit_failure;
    }

    auto console = std::make_shared<console_progress_reporter>(std::cout, !cmd.quiet);
    auto reporter = std::make_shared<buffered_progress_reporter>(console);

    int status = cli::exit_success;
    {
        transfer_orchestrator orchestrator(std::move(gateway.value()), reporter);
        cli::command_runner runner(orchestrator, std::cout, std::cerr,
                                   [reporter]() { reporter->flush(); });
        status = runner.run(cmd);
    }

    reporter->stop();
    get_logger().flush();
    get_logger().shutdown();
    return status;
}
