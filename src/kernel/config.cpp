#include "kernel/config.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <climits>
#include <cmath>
#include <limits>
#include <type_traits>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace sandpit::kernel {

using json = nlohmann::json;

namespace {

bool parse_unsigned(const char* text, uint64_t& out) {
    if (!text || !*text || *text == '-') return false;
    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(text, &end, 10);
    if (errno != 0 || *end != '\0') return false;
    out = v;
    return true;
}

bool parse_double(const char* text, double& out) {
    if (!text || !*text) return false;
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(text, &end);
    if (errno != 0 || *end != '\0' || !std::isfinite(v)) return false;
    out = v;
    return true;
}

bool parse_bool(const std::string& text, bool& out) {
    if (text == "1" || text == "true" || text == "yes" || text == "on") { out = true; return true; }
    if (text == "0" || text == "false" || text == "no" || text == "off") { out = false; return true; }
    return false;
}

template <typename T>
void read_key(const json& j, const char* key, T& target) {
    if (j.contains(key)) target = j[key].get<T>();
}

} // namespace

// ============================================================================
// SandpitConfig Implementation
// ============================================================================

RetryPolicy SandpitConfig::retry_policy() const {
    RetryPolicy policy;
    policy.base_delay = std::chrono::milliseconds(retry_base_delay_ms);
    policy.max_delay = std::chrono::milliseconds(retry_max_delay_ms);
    policy.max_attempts = retry_max_attempts;
    return policy;
}

std::vector<std::string> SandpitConfig::validate() const {
    std::vector<std::string> bad;
    if (workspace_root.empty()) bad.push_back("workspace_root");
    if (runtime != "local" && runtime != "docker") bad.push_back("runtime");
    if (runtime == "docker" && image.empty()) bad.push_back("image");
    if (interpreter.empty()) bad.push_back("interpreter");
    if (pool.max_size == 0) bad.push_back("pool.max_size");
    if (pool.create_attempts == 0) bad.push_back("pool.create_attempts");
    if (execution.code_timeout_sec == 0 || execution.code_timeout_sec > execution.max_timeout_sec) {
        bad.push_back("execution.code_timeout_sec");
    }
    if (execution.test_timeout_sec == 0 || execution.test_timeout_sec > execution.max_timeout_sec) {
        bad.push_back("execution.test_timeout_sec");
    }
    if (execution.output_limit_bytes == 0) bad.push_back("execution.output_limit_bytes");
    if (constraints.memory_mb == 0 || constraints.memory_mb > constraints.max_memory_mb) {
        bad.push_back("constraints.memory_mb");
    }
    if (!std::isfinite(constraints.max_cpu_quota) || constraints.max_cpu_quota <= 0.0) {
        bad.push_back("constraints.max_cpu_quota");
    }
    if (!std::isfinite(constraints.cpu_quota) || constraints.cpu_quota <= 0.0 ||
        constraints.cpu_quota > constraints.max_cpu_quota) {
        bad.push_back("constraints.cpu_quota");
    }
    if (constraints.max_pids == 0 || constraints.max_pids > constraints.pids_ceiling) {
        bad.push_back("constraints.max_pids");
    }
    if (retry_max_attempts == 0) bad.push_back("retry.max_attempts");
    if (retry_max_delay_ms < retry_base_delay_ms) bad.push_back("retry.max_delay_ms");
    return bad;
}

SandpitConfig SandpitConfig::from_json(const json& j) {
    SandpitConfig c;

    read_key(j, "workspace_root", c.workspace_root);
    read_key(j, "runtime", c.runtime);
    read_key(j, "image", c.image);
    read_key(j, "interpreter", c.interpreter);
    read_key(j, "allowed_interpreters", c.allowed_interpreters);

    if (j.contains("pool")) {
        const auto& p = j["pool"];
        read_key(p, "max_size", c.pool.max_size);
        read_key(p, "acquire_timeout_ms", c.pool.acquire_timeout_ms);
        read_key(p, "idle_timeout_sec", c.pool.idle_timeout_sec);
        read_key(p, "sweep_interval_sec", c.pool.sweep_interval_sec);
        read_key(p, "create_attempts", c.pool.create_attempts);
    }

    if (j.contains("execution")) {
        const auto& e = j["execution"];
        read_key(e, "code_timeout_sec", c.execution.code_timeout_sec);
        read_key(e, "test_timeout_sec", c.execution.test_timeout_sec);
        read_key(e, "max_timeout_sec", c.execution.max_timeout_sec);
        read_key(e, "output_limit_bytes", c.execution.output_limit_bytes);
        read_key(e, "max_code_length", c.execution.max_code_length);
        read_key(e, "max_input_length", c.execution.max_input_length);
    }

    if (j.contains("constraints")) {
        const auto& r = j["constraints"];
        read_key(r, "memory_mb", c.constraints.memory_mb);
        read_key(r, "cpu_quota", c.constraints.cpu_quota);
        read_key(r, "max_pids", c.constraints.max_pids);
        read_key(r, "network", c.constraints.network);
        read_key(r, "max_memory_mb", c.constraints.max_memory_mb);
        read_key(r, "max_cpu_quota", c.constraints.max_cpu_quota);
        read_key(r, "pids_ceiling", c.constraints.pids_ceiling);
    }

    if (j.contains("retry")) {
        const auto& r = j["retry"];
        read_key(r, "base_delay_ms", c.retry_base_delay_ms);
        read_key(r, "max_delay_ms", c.retry_max_delay_ms);
        read_key(r, "max_attempts", c.retry_max_attempts);
    }

    read_key(j, "enable_cgroups", c.enable_cgroups);
    read_key(j, "enable_namespaces", c.enable_namespaces);

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        read_key(l, "level", c.log_level);
        read_key(l, "file", c.log_file);
        read_key(l, "audit_file", c.audit_file);
        read_key(l, "audit_max_entries", c.audit_max_entries);
    }

    return c;
}

json SandpitConfig::to_json() const {
    return {
        {"workspace_root", workspace_root},
        {"runtime", runtime},
        {"image", image},
        {"interpreter", interpreter},
        {"allowed_interpreters", allowed_interpreters},
        {"pool", {
            {"max_size", pool.max_size},
            {"acquire_timeout_ms", pool.acquire_timeout_ms},
            {"idle_timeout_sec", pool.idle_timeout_sec},
            {"sweep_interval_sec", pool.sweep_interval_sec},
            {"create_attempts", pool.create_attempts}
        }},
        {"execution", {
            {"code_timeout_sec", execution.code_timeout_sec},
            {"test_timeout_sec", execution.test_timeout_sec},
            {"max_timeout_sec", execution.max_timeout_sec},
            {"output_limit_bytes", execution.output_limit_bytes},
            {"max_code_length", execution.max_code_length},
            {"max_input_length", execution.max_input_length}
        }},
        {"constraints", {
            {"memory_mb", constraints.memory_mb},
            {"cpu_quota", constraints.cpu_quota},
            {"max_pids", constraints.max_pids},
            {"network", constraints.network},
            {"max_memory_mb", constraints.max_memory_mb},
            {"max_cpu_quota", constraints.max_cpu_quota},
            {"pids_ceiling", constraints.pids_ceiling}
        }},
        {"retry", {
            {"base_delay_ms", retry_base_delay_ms},
            {"max_delay_ms", retry_max_delay_ms},
            {"max_attempts", retry_max_attempts}
        }},
        {"enable_cgroups", enable_cgroups},
        {"enable_namespaces", enable_namespaces},
        {"logging", {
            {"level", log_level},
            {"file", log_file},
            {"audit_file", audit_file},
            {"audit_max_entries", audit_max_entries}
        }}
    };
}

std::vector<std::string> SandpitConfig::apply_env() {
    std::vector<std::string> bad;

    auto str = [](const char* name, std::string& target) {
        if (const char* v = std::getenv(name)) target = v;
    };
    auto num = [&bad](const char* name, auto& target) {
        const char* v = std::getenv(name);
        if (!v) return;
        using T = std::remove_reference_t<decltype(target)>;
        uint64_t parsed = 0;
        if (parse_unsigned(v, parsed) && parsed <= std::numeric_limits<T>::max()) {
            target = static_cast<T>(parsed);
        } else {
            bad.push_back(name);
        }
    };
    auto flag = [&bad](const char* name, bool& target) {
        const char* v = std::getenv(name);
        if (v && !parse_bool(v, target)) bad.push_back(name);
    };

    str("SANDPIT_WORKSPACE_ROOT", workspace_root);
    str("SANDPIT_RUNTIME", runtime);
    str("SANDPIT_IMAGE", image);
    str("SANDPIT_INTERPRETER", interpreter);
    str("SANDPIT_LOG_LEVEL", log_level);
    str("SANDPIT_LOG_FILE", log_file);
    str("SANDPIT_AUDIT_FILE", audit_file);

    num("SANDPIT_POOL_MAX_SIZE", pool.max_size);
    num("SANDPIT_ACQUIRE_TIMEOUT_MS", pool.acquire_timeout_ms);
    num("SANDPIT_IDLE_TIMEOUT_SEC", pool.idle_timeout_sec);
    num("SANDPIT_CODE_TIMEOUT_SEC", execution.code_timeout_sec);
    num("SANDPIT_TEST_TIMEOUT_SEC", execution.test_timeout_sec);
    num("SANDPIT_OUTPUT_LIMIT_BYTES", execution.output_limit_bytes);
    num("SANDPIT_MEMORY_MB", constraints.memory_mb);
    num("SANDPIT_MAX_PIDS", constraints.max_pids);
    num("SANDPIT_PIDS_CEILING", constraints.pids_ceiling);
    num("SANDPIT_RETRY_MAX_ATTEMPTS", retry_max_attempts);

    if (const char* v = std::getenv("SANDPIT_CPU_QUOTA")) {
        if (!parse_double(v, constraints.cpu_quota)) bad.push_back("SANDPIT_CPU_QUOTA");
    }

    flag("SANDPIT_NETWORK", constraints.network);
    flag("SANDPIT_ENABLE_CGROUPS", enable_cgroups);
    flag("SANDPIT_ENABLE_NAMESPACES", enable_namespaces);

    return bad;
}

// ============================================================================
// Loading
// ============================================================================

void load_dotenv() {
    static bool loaded = false;
    if (loaded) return;
    loaded = true;

    std::vector<std::filesystem::path> search_paths = {
        std::filesystem::current_path() / ".env",
        "../.env",
    };

    char exe_path[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", exe_path, sizeof(exe_path) - 1);
    if (len != -1) {
        exe_path[len] = '\0';
        auto exe_dir = std::filesystem::path(exe_path).parent_path();
        search_paths.push_back(exe_dir / ".env");
        search_paths.push_back(exe_dir.parent_path() / ".env");
    }

    for (const auto& env_path : search_paths) {
        std::error_code ec;
        if (!std::filesystem::exists(env_path, ec)) continue;

        std::ifstream file(env_path);
        std::string line;
        while (std::getline(file, line)) {
            size_t start = line.find_first_not_of(" \t\r\n");
            if (start == std::string::npos) continue;
            line = line.substr(start);
            if (line[0] == '#') continue;

            size_t eq_pos = line.find('=');
            if (eq_pos == std::string::npos) continue;

            std::string key = line.substr(0, eq_pos);
            std::string value = line.substr(eq_pos + 1);

            size_t key_end = key.find_last_not_of(" \t");
            if (key_end != std::string::npos) key = key.substr(0, key_end + 1);

            start = value.find_first_not_of(" \t");
            value = start == std::string::npos ? "" : value.substr(start);
            size_t val_end = value.find_last_not_of(" \t\r\n");
            if (val_end != std::string::npos) value = value.substr(0, val_end + 1);

            if (value.size() >= 2 &&
                ((value.front() == '"' && value.back() == '"') ||
                 (value.front() == '\'' && value.back() == '\''))) {
                value = value.substr(1, value.size() - 2);
            }

            // Existing environment wins
            if (!key.empty() && !value.empty() && std::getenv(key.c_str()) == nullptr) {
                setenv(key.c_str(), value.c_str(), 0);
            }
        }
        spdlog::debug("Loaded environment from {}", env_path.string());
        break;
    }
}

Result<SandpitConfig> load_config(const std::string& config_path) {
    load_dotenv();

    SandpitConfig config;
    if (!config_path.empty()) {
        std::ifstream file(config_path);
        if (!file.is_open()) {
            return Error::configuration("cannot open config file: " + config_path, {"config_path"},
                                        "Check that " + config_path + " exists and is readable.");
        }
        try {
            config = SandpitConfig::from_json(json::parse(file));
        } catch (const json::exception& e) {
            return Error::configuration(std::string("invalid config file: ") + e.what(), {"config_path"},
                                        "Fix the JSON syntax or value types in " + config_path + ".");
        }
        spdlog::debug("Loaded config from {}", config_path);
    }

    auto bad_env = config.apply_env();
    if (!bad_env.empty()) {
        return Error::configuration("invalid environment override", bad_env);
    }

    auto bad = config.validate();
    if (!bad.empty()) {
        return Error::configuration("invalid configuration", bad);
    }
    return config;
}

} // namespace sandpit::kernel
