#include "util/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <vector>

namespace sandpit::util {

void init_logger(const LogOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!options.log_file.empty()) {
        try {
            auto parent = std::filesystem::path(options.log_file).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                options.log_file, options.max_file_size, options.max_files));

            // Errors also go to their own file
            auto errors = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                options.log_file + ".errors", options.max_file_size, options.max_files);
            errors->set_level(spdlog::level::err);
            sinks.push_back(errors);
        } catch (const std::exception& e) {
            spdlog::warn("Cannot open log file {}: {}", options.log_file, e.what());
        }
    }

    spdlog::drop("sandpit");
    auto logger = std::make_shared<spdlog::logger>("sandpit", sinks.begin(), sinks.end());
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
    spdlog::set_level(parse_log_level(options.level));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    // from_str reports unknown names as off
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

} // namespace sandpit::util
