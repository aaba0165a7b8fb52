/**
 * Sandpit Logger
 *
 * Installs the spdlog default logger used by every subsystem:
 * colored console output plus optional rotating log files.
 */
#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace sandpit::util {

struct LogOptions {
    std::string level = "info";
    std::string log_file;                        // Empty = console only
    size_t max_file_size = 10 * 1024 * 1024;     // 10MB per file
    size_t max_files = 5;                        // Rotated backups kept
};

// Initialize the default logger (console, plus files when configured)
void init_logger(const LogOptions& options = {});

// Change the active level at runtime
void set_log_level(spdlog::level::level_enum level);

// Parse "debug", "warn", ... (unknown names map to info)
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace sandpit::util
