/**
 * @file command_line.cpp
 * @brief garage-cli argument parsing and command dispatch
 */

#include "garage/transfer/cli/command_line.h"

#include <charconv>
#include <sstream>

#include "garage/transfer/core/logging.h"
#include "garage/transfer/orchestrator/transfer_orchestrator.h"
#include "garage/transfer/presentation/console_reporter.h"

namespace garage::transfer::cli {

namespace {

auto usage_error(std::string message) -> unexpected {
    return unexpected{error{error_code::invalid_argument, std::move(message)}};
}

auto parse_positive(const std::string& option, const std::string& text)
    -> result<uint64_t> {
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0) {
        return usage_error("Option " + option + " expects a positive integer, got '" +
                           text + "'");
    }
    return value;
}

auto command_from_name(const std::string& name) -> std::optional<command_kind> {
    if (name == "upload") return command_kind::upload;
    if (name == "download") return command_kind::download;
    if (name == "delete") return command_kind::remove;
    if (name == "list") return command_kind::list;
    if (name == "presign") return command_kind::presign;
    if (name == "presign-put") return command_kind::presign_put;
    return std::nullopt;
}

struct arity {
    std::size_t required;
    std::size_t optional;
};

auto arity_of(command_kind kind) -> arity {
    switch (kind) {
        case command_kind::upload:
            return {2, 1};  // <bucket> <src> [dest]
        case command_kind::download:
            return {3, 0};  // <bucket> <key> <dest>
        case command_kind::list:
            return {1, 1};  // <bucket> [prefix]
        case command_kind::remove:
        case command_kind::presign:
        case command_kind::presign_put:
            return {2, 0};  // <bucket> <key>
        default:
            return {0, 0};
    }
}

}  // namespace

auto to_string(command_kind kind) -> std::string_view {
    switch (kind) {
        case command_kind::upload:
            return "upload";
        case command_kind::download:
            return "download";
        case command_kind::remove:
            return "delete";
        case command_kind::list:
            return "list";
        case command_kind::presign:
            return "presign";
        case command_kind::presign_put:
            return "presign-put";
        case command_kind::help:
            return "help";
        case command_kind::version:
            return "version";
    }
    return "unknown";
}

auto command_line::to_run_config() const -> run_config {
    run_config config;
    config.bucket = bucket;
    config.parallelism = parallelism;
    config.recursive = recursive;
    config.dry_run = dry_run;
    config.confirmed = yes;
    return config;
}

auto parse_command_line(const std::vector<std::string>& args) -> result<command_line> {
    command_line cmd;
    std::vector<std::string> positional;
    bool parallel_given = false;
    bool expires_given = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            cmd.command = command_kind::help;
            return cmd;
        } else if (arg == "-V" || arg == "--version") {
            cmd.command = command_kind::version;
            return cmd;
        } else if (arg == "-p" || arg == "--parallel") {
            if (++i >= args.size()) {
                return usage_error("Option " + arg + " requires a value");
            }
            auto value = parse_positive(arg, args[i]);
            if (!value) {
                return unexpected{value.error()};
            }
            cmd.parallelism = static_cast<std::size_t>(value.value());
            parallel_given = true;
        } else if (arg == "-e" || arg == "--expires") {
            if (++i >= args.size()) {
                return usage_error("Option " + arg + " requires a value");
            }
            auto value = parse_positive(arg, args[i]);
            if (!value) {
                return unexpected{value.error()};
            }
            cmd.expires = std::chrono::seconds{static_cast<int64_t>(value.value())};
            expires_given = true;
        } else if (arg == "-r" || arg == "--recursive") {
            cmd.recursive = true;
        } else if (arg == "--dry-run") {
            cmd.dry_run = true;
        } else if (arg == "--yes") {
            cmd.yes = true;
        } else if (arg == "--verbose") {
            cmd.verbose = true;
        } else if (arg == "--json-log") {
            cmd.json_log = true;
        } else if (arg == "--quiet") {
            cmd.quiet = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return usage_error("Unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        return usage_error("Missing command");
    }

    auto kind = command_from_name(positional.front());
    if (!kind) {
        return usage_error("Unknown command: " + positional.front());
    }
    cmd.command = *kind;
    positional.erase(positional.begin());

    auto expected = arity_of(cmd.command);
    if (positional.size() < expected.required) {
        return usage_error("Missing arguments for " + std::string(to_string(cmd.command)));
    }
    if (positional.size() > expected.required + expected.optional) {
        return usage_error("Too many arguments for " + std::string(to_string(cmd.command)));
    }

    const bool transfers_items = cmd.command == command_kind::upload ||
                                 cmd.command == command_kind::download ||
                                 cmd.command == command_kind::remove;
    const bool presigns = cmd.command == command_kind::presign ||
                          cmd.command == command_kind::presign_put;

    if (parallel_given && !transfers_items) {
        return usage_error("Option --parallel is not valid for " +
                           std::string(to_string(cmd.command)));
    }
    if (cmd.recursive && cmd.command != command_kind::download &&
        cmd.command != command_kind::remove) {
        return usage_error("Option --recursive is not valid for " +
                           std::string(to_string(cmd.command)));
    }
    if ((cmd.dry_run || cmd.yes) && cmd.command != command_kind::remove) {
        return usage_error("Options --dry-run and --yes are only valid for delete");
    }
    if (expires_given && !presigns) {
        return usage_error("Option --expires is only valid for presign commands");
    }

    cmd.bucket = positional[0];
    if (positional.size() > 1) {
        cmd.target = positional[1];
    }
    if (cmd.command == command_kind::upload && positional.size() > 2) {
        cmd.destination = positional[2];
    }
    if (cmd.command == command_kind::download) {
        cmd.destination = positional[2];
    }

    if (!expires_given) {
        if (cmd.command == command_kind::presign) {
            cmd.expires = std::chrono::seconds{3600};
        } else if (cmd.command == command_kind::presign_put) {
            cmd.expires = std::chrono::seconds{600};
        }
    }

    return cmd;
}

auto usage_text(std::string_view program) -> std::string {
    std::ostringstream oss;
    oss << "Usage: " << program << " <command> [options]\n"
        << "\n"
        << "Commands:\n"
        << "  upload <bucket> <src> [dest] [-p N]          Upload a file or folder\n"
        << "  download <bucket> <key> <dest> [-r] [-p N]   Download an object or prefix\n"
        << "  delete <bucket> <key> [-r] [--dry-run] [--yes] [-p N]\n"
        << "                                               Delete an object or prefix\n"
        << "  list <bucket> [prefix]                       List objects (recursive)\n"
        << "  presign <bucket> <key> [-e SECONDS]          Presigned GET URL (default 3600)\n"
        << "  presign-put <bucket> <key> [-e SECONDS]      Presigned PUT URL (default 600)\n"
        << "\n"
        << "Options:\n"
        << "  -p, --parallel <n>     Concurrent transfers (default: 5)\n"
        << "  -r, --recursive        Operate on every object under the key prefix\n"
        << "  --dry-run              Show what would be deleted\n"
        << "  --yes                  Confirm destructive operation\n"
        << "  -e, --expires <sec>    Presigned URL lifetime\n"
        << "  --verbose              Debug logging\n"
        << "  --json-log             JSON log lines\n"
        << "  --quiet                No progress bars\n"
        << "  -h, --help             Show this help message\n"
        << "  -V, --version          Show version\n"
        << "\n"
        << "Environment:\n"
        << "  S3_ENDPOINT, S3_ACCESS_KEY, S3_SECRET_KEY (required), S3_REGION,\n"
        << "  GARAGE_LOG_LEVEL, GARAGE_LOG_FORMAT. A .env file is read when present.\n";
    return oss.str();
}

command_runner::command_runner(transfer_orchestrator& orchestrator,
                               std::ostream& out,
                               std::ostream& err,
                               std::function<void()> flush_progress)
    : orchestrator_(orchestrator),
      out_(out),
      err_(err),
      flush_progress_(std::move(flush_progress)) {}

auto command_runner::run(const command_line& cmd) -> int {
    GT_LOG_DEBUG(log_category::cli,
                 "Running " + std::string(to_string(cmd.command)) + " on bucket " + cmd.bucket);

    switch (cmd.command) {
        case command_kind::upload:
            return run_upload(cmd);
        case command_kind::download:
            return run_download(cmd);
        case command_kind::remove:
            return run_delete(cmd);
        case command_kind::list:
            return run_list(cmd);
        case command_kind::presign:
            return run_presign(cmd, presign_method::get);
        case command_kind::presign_put:
            return run_presign(cmd, presign_method::put);
        default:
            return report_error(error{error_code::invalid_argument,
                "Command " + std::string(to_string(cmd.command)) + " cannot be run"});
    }
}

auto command_runner::run_upload(const command_line& cmd) -> int {
    auto summary = orchestrator_.upload(cmd.to_run_config(), cmd.target, cmd.destination);
    flush();
    if (!summary) {
        return report_error(summary.error());
    }
    return report_summary(summary.value());
}

auto command_runner::run_download(const command_line& cmd) -> int {
    auto summary = orchestrator_.download(cmd.to_run_config(), cmd.target,
                                          cmd.destination.value_or(""));
    flush();
    if (!summary) {
        return report_error(summary.error());
    }
    return report_summary(summary.value());
}

auto command_runner::run_delete(const command_line& cmd) -> int {
    auto summary = orchestrator_.remove(cmd.to_run_config(), cmd.target);
    flush();
    if (!summary) {
        return report_error(summary.error());
    }

    const auto& value = summary.value();
    if (value.dry_run) {
        for (const auto& key : value.planned_keys) {
            out_ << "[dry-run] " << key << "\n";
        }
        out_ << "\n" << value.describe() << "\n";
        return exit_success;
    }

    if (cmd.recursive) {
        out_ << "Deleted " << value.succeeded << " objects\n";
    }
    if (!value.all_succeeded()) {
        err_ << value.describe() << "\n";
        return exit_failure;
    }
    return exit_success;
}

auto command_runner::run_list(const command_line& cmd) -> int {
    auto listing = orchestrator_.list(cmd.to_run_config(), cmd.target);
    if (!listing) {
        return report_error(listing.error());
    }

    for (const auto& object : listing.value().objects) {
        out_ << object.key << " " << format_bytes(object.size) << "\n";
    }
    out_ << "\n" << listing.value().objects.size() << " objects, "
         << format_bytes(listing.value().total_size) << "\n";
    return exit_success;
}

auto command_runner::run_presign(const command_line& cmd, presign_method method) -> int {
    auto url = orchestrator_.presign(cmd.to_run_config(), cmd.target, method, cmd.expires);
    if (!url) {
        return report_error(url.error());
    }
    out_ << url.value() << "\n";
    return exit_success;
}

auto command_runner::report_summary(const command_summary& summary) -> int {
    if (summary.all_succeeded()) {
        if (summary.total > 1) {
            out_ << summary.describe() << ", " << format_bytes(summary.bytes_transferred)
                 << "\n";
        }
        return exit_success;
    }
    err_ << summary.describe() << "\n";
    return exit_failure;
}

auto command_runner::report_error(const error& err) -> int {
    if (err.code == error_code::confirmation_required) {
        err_ << err.message << "\n";
    } else {
        err_ << "Error: " << err.message << "\n";
        GT_LOG_ERROR(log_category::cli, err.message);
    }
    return exit_failure;
}

void command_runner::flush() {
    if (flush_progress_) {
        flush_progress_();
    }
}

}  // namespace garage::transfer::cli
