#include "kernel/taint_policy.hpp"
#include <fmt/format.h>
#include <regex>

namespace sandpit::kernel {

namespace {

const std::vector<std::regex>& install_patterns() {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(\bpip[0-9.]*["',\s]+install\b)"),
        std::regex(R"(-m["',\s]+pip["',\s]+install\b)"),
        std::regex(R"(\bensurepip\b)"),
        std::regex(R"(\bnpm["',\s]+(install|i|ci|add)\b)"),
        std::regex(R"(\byarn["',\s]+(add|install)\b)"),
        std::regex(R"(\bapt(-get)?["',\s]+install\b)"),
        std::regex(R"(\bconda["',\s]+install\b)"),
        std::regex(R"(\bpoetry["',\s]+(add|install)\b)"),
        std::regex(R"(\bgem["',\s]+install\b)"),
        std::regex(R"(\bcargo["',\s]+install\b)"),
        std::regex(R"(\bapk["',\s]+add\b)"),
    };
    return patterns;
}

} // namespace

bool mutates_environment(const std::string& text) {
    for (const auto& pattern : install_patterns()) {
        if (std::regex_search(text, pattern)) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> taint_reason(const runtime::ExecOutput& output,
                                        const std::vector<std::string>& sources,
                                        const std::optional<runtime::ResourceUsage>& usage) {
    if (output.timed_out) {
        return std::string("timeout");
    }
    if (output.cancelled) {
        return std::string("cancelled");
    }
    if (output.oom_killed) {
        return std::string("out of memory");
    }
    if (output.exit_code < 0 || output.exit_code >= 128) {
        return fmt::format("crashed (exit code {})", output.exit_code);
    }
    if (usage && usage->oom_kills > 0) {
        return std::string("out of memory");
    }
    if (usage && usage->memory_limit_bytes > 0 && usage->memory_bytes >= usage->memory_limit_bytes) {
        return std::string("memory ceiling reached");
    }
    for (const auto& source : sources) {
        if (mutates_environment(source)) {
            return std::string("package installation");
        }
    }
    return std::nullopt;
}

} // namespace sandpit::kernel
