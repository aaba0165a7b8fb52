#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <fmt/color.h>
#include "kernel/config.hpp"
#include "kernel/errors.hpp"
#include "kernel/executor.hpp"
#include "util/logger.hpp"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace sandpit;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_USAGE = 2;

// Ctrl+C cancels the in-flight execution
std::shared_ptr<std::atomic<bool>> g_cancel = std::make_shared<std::atomic<bool>>(false);

void handle_interrupt(int) {
    g_cancel->store(true);
}

void print_usage() {
    std::cout <<
        "Usage: sandpit [--config FILE] [--log-level LEVEL] <command> [options]\n"
        "\n"
        "Commands:\n"
        "  run    Run source code in a sandbox\n"
        "           --code TEXT | --file PATH   code to run (one is required)\n"
        "           --target PATH               workspace file name (default main.py)\n"
        "           --interpreter NAME          interpreter (default from config)\n"
        "           --timeout SECONDS           wall-clock limit\n"
        "  test   Run a test command in a sandbox\n"
        "           --command CMD               e.g. \"python3 -m pytest -q\"\n"
        "           --dir DIR                   working directory inside the workspace\n"
        "           --add WS_PATH=LOCAL_FILE    copy a local file into the workspace (repeatable)\n"
        "           --timeout SECONDS           wall-clock limit\n"
        "  stats  Print configuration, pool and metrics snapshots\n"
        "\n"
        "Options for run/test:\n"
        "  --json   print the result as JSON\n";
}

bool read_file(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

bool parse_seconds(const std::string& text, std::chrono::milliseconds& out) {
    char* end = nullptr;
    double sec = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0' || sec <= 0) {
        return false;
    }
    out = std::chrono::milliseconds(static_cast<int64_t>(sec * 1000));
    return true;
}

void print_error(const kernel::Error& error) {
    fmt::print(stderr, fg(fmt::color::red) | fmt::emphasis::bold, "✗ ");
    fmt::print(stderr, "{}\n", security::mask_sensitive_data(kernel::format_error_message(error)));

    if (auto* d = error.details_as<kernel::ExecutionDetails>()) {
        if (!d->stderr_text.empty()) {
            fmt::print(stderr, "--- STDERR ---\n{}\n", security::mask_sensitive_data(d->stderr_text));
        }
    }
}

int report(const kernel::Result<kernel::ExecutionResult>& result, bool as_json) {
    if (!result) {
        if (as_json) {
            std::cout << kernel::to_record(result.error()).dump(2) << "\n";
        } else {
            print_error(result.error());
        }
        return EXIT_ERROR;
    }

    const auto& r = result.value();
    if (as_json) {
        std::cout << r.to_json().dump(2) << "\n";
    } else {
        std::cout << r.to_text();
        fmt::print(fg(fmt::color::green), "✓ ");
        fmt::print("{} on {}{} in {}ms\n", r.request_id, r.sandbox_id,
                   r.sandbox_reused ? " (reused)" : "", r.duration.count());
    }
    return EXIT_OK;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string log_level;
    std::string command;
    std::vector<std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (command.empty() && arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (command.empty() && arg == "--log-level" && i + 1 < argc) {
            log_level = argv[++i];
        } else if (command.empty() && (arg == "-h" || arg == "--help")) {
            print_usage();
            return EXIT_OK;
        } else if (command.empty()) {
            command = arg;
        } else {
            args.push_back(arg);
        }
    }

    if (command != "run" && command != "test" && command != "stats") {
        print_usage();
        return EXIT_USAGE;
    }

    auto loaded = kernel::load_config(config_path);
    if (!loaded) {
        util::init_logger();
        print_error(loaded.error());
        return EXIT_ERROR;
    }
    kernel::SandpitConfig config = loaded.value();
    if (!log_level.empty()) {
        config.log_level = log_level;
    }

    util::LogOptions log_options;
    log_options.level = config.log_level;
    log_options.log_file = config.log_file;
    util::init_logger(log_options);

    // Parse the subcommand options
    kernel::ExecutionRequest request;
    bool as_json = false;
    bool have_code = false;
    bool have_command = false;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        bool has_value = i + 1 < args.size();

        if (arg == "--json") {
            as_json = true;
        } else if (arg == "--timeout" && has_value) {
            std::chrono::milliseconds timeout{0};
            if (!parse_seconds(args[++i], timeout)) {
                fmt::print(stderr, "Invalid --timeout value: {}\n", args[i]);
                return EXIT_USAGE;
            }
            request.timeout = timeout;
        } else if (command == "run" && arg == "--code" && has_value) {
            request.payload = args[++i];
            have_code = true;
        } else if (command == "run" && arg == "--file" && has_value) {
            if (!read_file(args[++i], request.payload)) {
                fmt::print(stderr, "Cannot read {}\n", args[i]);
                return EXIT_USAGE;
            }
            have_code = true;
        } else if (command == "run" && arg == "--target" && has_value) {
            request.target_path = args[++i];
        } else if (command == "run" && arg == "--interpreter" && has_value) {
            request.interpreter = args[++i];
        } else if (command == "test" && arg == "--command" && has_value) {
            request.payload = args[++i];
            have_command = true;
        } else if (command == "test" && arg == "--dir" && has_value) {
            request.target_path = args[++i];
        } else if (command == "test" && arg == "--add" && has_value) {
            std::string spec = args[++i];
            auto eq = spec.find('=');
            if (eq == std::string::npos || eq == 0 || eq + 1 == spec.size()) {
                fmt::print(stderr, "--add expects WORKSPACE_PATH=LOCAL_FILE, got {}\n", spec);
                return EXIT_USAGE;
            }
            kernel::WorkspaceFile file;
            file.path = spec.substr(0, eq);
            if (!read_file(spec.substr(eq + 1), file.content)) {
                fmt::print(stderr, "Cannot read {}\n", spec.substr(eq + 1));
                return EXIT_USAGE;
            }
            request.files.push_back(std::move(file));
        } else {
            fmt::print(stderr, "Unknown option for {}: {}\n", command, arg);
            print_usage();
            return EXIT_USAGE;
        }
    }

    if (command == "run" && !have_code) {
        fmt::print(stderr, "run needs --code or --file\n");
        return EXIT_USAGE;
    }
    if (command == "test" && !have_command) {
        fmt::print(stderr, "test needs --command\n");
        return EXIT_USAGE;
    }

    auto runtime = kernel::create_runtime(config);
    if (!runtime) {
        print_error(runtime.error());
        return EXIT_ERROR;
    }

    kernel::Executor executor(config, runtime.value());

    if (command == "stats") {
        nlohmann::json out = {
            {"runtime", runtime.value()->name()},
            {"config", config.to_json()},
            {"pool", executor.get_pool_stats().to_json()},
            {"metrics", executor.get_metrics().to_json()}
        };
        std::cout << out.dump(2) << "\n";
        return EXIT_OK;
    }

    request.mode = command == "test" ? kernel::ExecutionMode::TEST_RUN
                                     : kernel::ExecutionMode::ARBITRARY_CODE;
    request.cancel = g_cancel;
    std::signal(SIGINT, handle_interrupt);
    std::signal(SIGTERM, handle_interrupt);

    auto result = executor.execute(request);
    int code = report(result, as_json);

    if (result && result.value().test_summary && !as_json) {
        const auto& failures = result.value().test_summary->failures;
        if (!failures.empty()) {
            std::cout << "\n" << kernel::analyze_test_failures(failures) << "\n";
        }
    }
    return code;
}
