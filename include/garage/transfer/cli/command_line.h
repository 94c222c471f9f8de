/**
 * @file command_line.h
 * @brief garage-cli argument parsing and command dispatch
 */

#ifndef GARAGE_TRANSFER_CLI_COMMAND_LINE_H
#define GARAGE_TRANSFER_CLI_COMMAND_LINE_H

#include <chrono>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "garage/transfer/core/transfer_types.h"
#include "garage/transfer/core/types.h"

namespace garage::transfer {

class transfer_orchestrator;

namespace cli {

/// Process exit statuses
inline constexpr int exit_success = 0;
inline constexpr int exit_failure = 1;
inline constexpr int exit_usage = 2;

/**
 * @brief Subcommands understood by garage-cli
 */
enum class command_kind {
    upload,
    download,
    remove,
    list,
    presign,
    presign_put,
    help,
    version,
};

[[nodiscard]] auto to_string(command_kind kind) -> std::string_view;

/**
 * @brief Parsed invocation
 *
 * target is the source path for upload, the key (or prefix) for download,
 * delete and presign, and the optional prefix for list.
 */
struct command_line {
    command_kind command = command_kind::help;
    std::string bucket;
    std::string target;
    std::optional<std::string> destination;
    std::size_t parallelism = 5;
    bool recursive = false;
    bool dry_run = false;
    bool yes = false;
    std::chrono::seconds expires{0};
    bool verbose = false;
    bool json_log = false;
    bool quiet = false;

    /**
     * @brief run_config for the orchestrator
     */
    [[nodiscard]] auto to_run_config() const -> run_config;
};

/**
 * @brief Parse arguments (program name excluded)
 * @return Parsed command, or invalid_argument describing the usage error
 */
[[nodiscard]] auto parse_command_line(const std::vector<std::string>& args)
    -> result<command_line>;

/**
 * @brief Usage text printed for --help and after usage errors
 */
[[nodiscard]] auto usage_text(std::string_view program) -> std::string;

/**
 * @brief Runs a parsed command and prints its output
 *
 * Command output goes to out; refusals and errors go to err.
 */
class command_runner {
public:
    /**
     * @param orchestrator Orchestrator bound to the configured gateway
     * @param out Command output
     * @param err Diagnostics
     * @param flush_progress Called before summaries are printed so that
     *        buffered progress lines come first
     */
    command_runner(transfer_orchestrator& orchestrator,
                   std::ostream& out,
                   std::ostream& err,
                   std::function<void()> flush_progress = {});

    /**
     * @brief Execute the command
     * @return exit_success when the command and every item succeeded,
     *         exit_failure otherwise
     */
    [[nodiscard]] auto run(const command_line& cmd) -> int;

private:
    auto run_upload(const command_line& cmd) -> int;
    auto run_download(const command_line& cmd) -> int;
    auto run_delete(const command_line& cmd) -> int;
    auto run_list(const command_line& cmd) -> int;
    auto run_presign(const command_line& cmd, presign_method method) -> int;

    auto report_summary(const command_summary& summary) -> int;
    auto report_error(const error& err) -> int;
    void flush();

    transfer_orchestrator& orchestrator_;
    std::ostream& out_;
    std::ostream& err_;
    std::function<void()> flush_progress_;
};

}  // namespace cli
}  // namespace garage::transfer

#endif  // GARAGE_TRANSFER_CLI_COMMAND_LINE_H
