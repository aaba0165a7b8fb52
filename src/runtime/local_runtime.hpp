/**
 * Sandpit Local Runtime
 *
 * Runs sandboxed commands directly on the host: one workspace directory
 * per environment, cgroups v2 for resource limits (memory, CPU, PIDs)
 * and a private network namespace when network access is off.
 * Requires root/CAP_SYS_ADMIN for full isolation; without it the runtime
 * degrades to rlimits only and says so.
 */
#pragma once
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <chrono>
#include <unordered_map>
#include <sys/types.h>
#include "runtime/container_runtime.hpp"

namespace sandpit::runtime {

struct LocalRuntimeConfig {
    std::string cgroup_root = "/sys/fs/cgroup/sandpit";
    uint64_t cpu_period_us = 100000;     // 100ms period
    bool enable_cgroups = true;
    bool enable_namespaces = true;
};

// What isolation is actually active for an environment
struct IsolationStatus {
    bool net_namespace = false;
    bool cgroups_available = false;
    bool memory_limit_applied = false;
    bool cpu_quota_applied = false;
    bool pids_limit_applied = false;
    std::string degraded_reason;

    bool is_degraded() const { return !degraded_reason.empty(); }
};

class LocalRuntime : public ContainerRuntime {
public:
    explicit LocalRuntime(const LocalRuntimeConfig& config = {});
    ~LocalRuntime() override;

    // Non-copyable
    LocalRuntime(const LocalRuntime&) = delete;
    LocalRuntime& operator=(const LocalRuntime&) = delete;

    // Probe whether this process may create network namespaces
    static bool network_namespace_available();

    std::string name() const override { return "local"; }

    kernel::Result<std::string> create(const EnvironmentSpec& spec) override;
    kernel::Result<ExecOutput> exec(const std::string& id, const ExecSpec& spec) override;
    bool stop(const std::string& id) override;
    bool destroy(const std::string& id) override;
    std::optional<ResourceUsage> usage(const std::string& id) override;
    bool healthy(const std::string& id) override;
    std::vector<std::string> modified_outside_workspace(const std::string& id) override;

    std::optional<IsolationStatus> isolation_status(const std::string& id) const;

private:
    struct Environment {
        EnvironmentSpec spec;
        std::string cgroup_path;
        IsolationStatus isolation;
        std::vector<pid_t> running;          // Process groups currently executing
        uint64_t last_cpu_usec = 0;
        std::chrono::steady_clock::time_point last_sample;
    };

    LocalRuntimeConfig config_;
    bool cgroup_root_ready_ = false;
    bool netns_available_ = false;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Environment>> environments_;

    bool init_cgroup_root();
    void setup_cgroups(Environment& env);
    void cleanup_cgroups(const Environment& env);
    uint64_t read_oom_kills(const Environment& env) const;
    std::shared_ptr<Environment> find(const std::string& id) const;
};

} // namespace sandpit::runtime
