/**
 * Sandpit Container Runtime
 *
 * Abstract client for the isolation backend: create an environment
 * from an image/template, run a command in it, stop, destroy and
 * query resource usage. LocalRuntime (namespaces + cgroups) and
 * DockerRuntime implement it; tests inject their own.
 */
#pragma once
#include <string>
#include <vector>
#include <atomic>
#include <chrono>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "kernel/errors.hpp"

namespace sandpit::runtime {

// Per-sandbox resource ceilings; a pooled sandbox is reused only for equal constraints
struct ResourceConstraints {
    uint64_t memory_mb = 512;
    double cpu_quota = 0.5;          // Fraction of one CPU
    uint32_t max_pids = 100;
    bool network = false;

    bool operator==(const ResourceConstraints& other) const {
        return memory_mb == other.memory_mb &&
               cpu_quota == other.cpu_quota &&
               max_pids == other.max_pids &&
               network == other.network;
    }
    bool operator!=(const ResourceConstraints& other) const { return !(*this == other); }

    nlohmann::json to_json() const {
        return {
            {"memory_mb", memory_mb},
            {"cpu_quota", cpu_quota},
            {"max_pids", max_pids},
            {"network", network}
        };
    }
};

struct EnvironmentSpec {
    std::string name;                 // Unique sandbox id
    std::string image;                // Image or template name
    std::string workspace_path;       // Host directory holding the workspace
    ResourceConstraints constraints;
};

struct ExecSpec {
    std::vector<std::string> argv;
    std::string working_dir = ".";    // Relative to the workspace
    std::string stdin_data;
    std::chrono::milliseconds timeout{30000};
    size_t output_limit = 64 * 1024;  // Per stream
    const std::atomic<bool>* cancel = nullptr;
};

struct ExecOutput {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;
    bool timed_out = false;
    bool cancelled = false;
    bool truncated = false;
    bool oom_killed = false;
    std::chrono::milliseconds duration{0};
};

struct ResourceUsage {
    uint64_t memory_bytes = 0;
    uint64_t memory_limit_bytes = 0;  // 0 = unknown
    double cpu_percent = 0.0;
    uint64_t pids = 0;
    uint64_t oom_kills = 0;

    nlohmann::json to_json() const {
        return {
            {"memory_mb", static_cast<double>(memory_bytes) / (1024.0 * 1024.0)},
            {"memory_limit_mb", static_cast<double>(memory_limit_bytes) / (1024.0 * 1024.0)},
            {"cpu_percent", cpu_percent},
            {"pids", pids},
            {"oom_kills", oom_kills}
        };
    }
};

class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    virtual std::string name() const = 0;

    // Returns the runtime's id for the new environment
    virtual kernel::Result<std::string> create(const EnvironmentSpec& spec) = 0;

    // Sandbox errors mean the runtime could not run the command at all
    virtual kernel::Result<ExecOutput> exec(const std::string& id, const ExecSpec& spec) = 0;

    // Kill whatever runs inside the environment
    virtual bool stop(const std::string& id) = 0;

    virtual bool destroy(const std::string& id) = 0;

    virtual std::optional<ResourceUsage> usage(const std::string& id) = 0;

    virtual bool healthy(const std::string& id) = 0;

    // Paths changed outside the workspace (and scratch space) since creation
    virtual std::vector<std::string> modified_outside_workspace(const std::string& id) = 0;
};

} // namespace sandpit::runtime
