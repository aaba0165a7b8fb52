#include "runtime/local_runtime.hpp"
#include "runtime/process.hpp"
#include <spdlog/spdlog.h>

#include <sys/wait.h>
#include <sched.h>
#include <signal.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace sandpit::runtime {

using kernel::Error;
using kernel::Result;
using kernel::SandboxDetails;

namespace {

bool write_cgroup_value(const std::string& path, const std::string& value) {
    if (!fs::exists(path)) {
        return false;
    }
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        return false;
    }
    ofs << value;
    ofs.flush();
    return ofs.good();
}

std::optional<uint64_t> read_cgroup_number(const std::string& path) {
    std::ifstream ifs(path);
    std::string value;
    if (!ifs.is_open() || !(ifs >> value) || value == "max") {
        return std::nullopt;
    }
    try {
        return std::stoull(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// "key value" lines (memory.events, cpu.stat)
std::optional<uint64_t> read_cgroup_key(const std::string& path, const std::string& key) {
    std::ifstream ifs(path);
    std::string k;
    uint64_t v;
    while (ifs >> k >> v) {
        if (k == key) return v;
    }
    return std::nullopt;
}

} // namespace

// ============================================================================
// LocalRuntime Implementation
// ============================================================================

LocalRuntime::LocalRuntime(const LocalRuntimeConfig& config)
    : config_(config) {
    if (config_.enable_cgroups) {
        cgroup_root_ready_ = init_cgroup_root();
    }
    if (config_.enable_namespaces) {
        netns_available_ = network_namespace_available();
        if (!netns_available_) {
            spdlog::warn("DEGRADED ISOLATION: cannot create network namespaces (need CAP_SYS_ADMIN)");
            spdlog::warn("  -> Sandboxed code will share the host network");
        }
    }
    spdlog::debug("LocalRuntime initialized (cgroups={}, netns={})",
                  cgroup_root_ready_ ? "ON" : "OFF", netns_available_ ? "ON" : "OFF");
}

LocalRuntime::~LocalRuntime() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, _] : environments_) {
            ids.push_back(id);
        }
    }
    for (const auto& id : ids) {
        destroy(id);
    }
}

bool LocalRuntime::network_namespace_available() {
    pid_t pid = fork();
    if (pid < 0) {
        return false;
    }
    if (pid == 0) {
        _exit(unshare(CLONE_NEWNET) == 0 ? 0 : 1);
    }
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return false;
    }
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

bool LocalRuntime::init_cgroup_root() {
    if (!fs::exists("/sys/fs/cgroup/cgroup.controllers")) {
        spdlog::warn("DEGRADED ISOLATION: cgroup v2 not available - resource limits will NOT be enforced");
        return false;
    }

    std::error_code ec;
    fs::create_directories(config_.cgroup_root, ec);
    if (ec) {
        spdlog::warn("DEGRADED ISOLATION: Cannot create cgroup root {} (need root): {}",
                     config_.cgroup_root, ec.message());
        return false;
    }

    // Enable controllers for the sandbox cgroups below our root
    std::string parent = fs::path(config_.cgroup_root).parent_path().string();
    for (const auto& dir : {parent, config_.cgroup_root}) {
        if (!write_cgroup_value(dir + "/cgroup.subtree_control", "+cpu +memory +pids")) {
            spdlog::debug("Could not enable cgroup controllers in {}", dir);
        }
    }
    spdlog::info("Using cgroup root: {}", config_.cgroup_root);
    return true;
}

void LocalRuntime::setup_cgroups(Environment& env) {
    auto& status = env.isolation;
    if (!cgroup_root_ready_) {
        status.degraded_reason = "cgroups unavailable";
        return;
    }

    env.cgroup_path = config_.cgroup_root + "/" + env.spec.name;
    std::error_code ec;
    fs::create_directories(env.cgroup_path, ec);
    if (ec) {
        spdlog::warn("DEGRADED ISOLATION: Cannot create sandbox cgroup {}: {}", env.cgroup_path, ec.message());
        status.degraded_reason = "cannot create sandbox cgroup";
        env.cgroup_path.clear();
        return;
    }
    status.cgroups_available = true;

    const auto& c = env.spec.constraints;
    uint64_t memory_bytes = c.memory_mb * 1024 * 1024;
    status.memory_limit_applied = write_cgroup_value(env.cgroup_path + "/memory.max",
                                                     std::to_string(memory_bytes));
    // Keep the sandbox from swapping around the limit
    if (!write_cgroup_value(env.cgroup_path + "/memory.swap.max", "0")) {
        spdlog::debug("memory.swap.max not available for {}", env.spec.name);
    }

    uint64_t quota = static_cast<uint64_t>(c.cpu_quota * static_cast<double>(config_.cpu_period_us));
    quota = std::max<uint64_t>(quota, 1000);
    status.cpu_quota_applied = write_cgroup_value(env.cgroup_path + "/cpu.max",
        std::to_string(quota) + " " + std::to_string(config_.cpu_period_us));

    status.pids_limit_applied = write_cgroup_value(env.cgroup_path + "/pids.max",
                                                   std::to_string(c.max_pids));

    if (!status.memory_limit_applied || !status.cpu_quota_applied || !status.pids_limit_applied) {
        status.degraded_reason = "partial cgroup limits";
        spdlog::warn("Sandbox {} running with partial cgroup limits: memory={}, cpu={}, pids={}",
            env.spec.name,
            status.memory_limit_applied ? "ON" : "OFF",
            status.cpu_quota_applied ? "ON" : "OFF",
            status.pids_limit_applied ? "ON" : "OFF");
    } else {
        spdlog::debug("Sandbox {} cgroup limits: memory={}MB cpu={}us/{}us pids={}",
            env.spec.name, c.memory_mb, quota, config_.cpu_period_us, c.max_pids);
    }
}

void LocalRuntime::cleanup_cgroups(const Environment& env) {
    if (env.cgroup_path.empty()) {
        return;
    }
    // A cgroup directory is removed with rmdir once it has no processes
    std::error_code ec;
    fs::remove(env.cgroup_path, ec);
    if (ec) {
        spdlog::warn("Failed to cleanup cgroup {}: {}", env.cgroup_path, ec.message());
    } else {
        spdlog::debug("Cleaned up cgroup: {}", env.cgroup_path);
    }
}

std::shared_ptr<LocalRuntime::Environment> LocalRuntime::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = environments_.find(id);
    return it == environments_.end() ? nullptr : it->second;
}

Result<std::string> LocalRuntime::create(const EnvironmentSpec& spec) {
    SandboxDetails details;
    details.image = spec.image;
    details.sandbox_id = spec.name;
    details.operation = "create";

    if (find(spec.name)) {
        return Error::sandbox("environment " + spec.name + " already exists", details);
    }

    std::error_code ec;
    fs::create_directories(spec.workspace_path, ec);
    if (ec) {
        return Error::sandbox("cannot create workspace " + spec.workspace_path + ": " + ec.message(),
                              details, "Check that the workspace root is writable.");
    }
    fs::permissions(spec.workspace_path, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        spdlog::debug("Cannot restrict workspace permissions on {}: {}", spec.workspace_path, ec.message());
    }

    auto env = std::make_shared<Environment>();
    env->spec = spec;
    env->last_sample = std::chrono::steady_clock::now();
    setup_cgroups(*env);
    env->isolation.net_namespace = !spec.constraints.network && netns_available_;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        environments_[spec.name] = env;
    }

    spdlog::info("Created local sandbox {} (workspace={})", spec.name, spec.workspace_path);
    return spec.name;
}

Result<ExecOutput> LocalRuntime::exec(const std::string& id, const ExecSpec& spec) {
    auto env = find(id);
    if (!env) {
        SandboxDetails details;
        details.sandbox_id = id;
        details.operation = "exec";
        return Error::sandbox("unknown environment " + id, details);
    }

    ProcessSpec ps;
    ps.argv = spec.argv;
    ps.cwd = (fs::path(env->spec.workspace_path) / spec.working_dir).lexically_normal().string();
    ps.stdin_data = spec.stdin_data;
    ps.timeout = spec.timeout;
    ps.output_limit = spec.output_limit;
    ps.cancel = spec.cancel;
    ps.isolate_network = env->isolation.net_namespace;
    ps.env = {"HOME=" + env->spec.workspace_path, "TMPDIR=" + env->spec.workspace_path,
              "PYTHONDONTWRITEBYTECODE=1"};

    // Without a memory cgroup, fall back to an address-space rlimit
    if (!env->isolation.memory_limit_applied) {
        ps.limits.address_space_bytes = env->spec.constraints.memory_mb * 1024 * 1024 * 2;
    }

    std::string procs = env->cgroup_path.empty() ? "" : env->cgroup_path + "/cgroup.procs";
    ps.on_spawn = [this, env, procs](pid_t pid) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            env->running.push_back(pid);
        }
        if (!procs.empty() && !write_cgroup_value(procs, std::to_string(pid))) {
            spdlog::warn("DEGRADED ISOLATION: Process {} not added to cgroup - resource limits NOT enforced",
                         pid);
        }
    };

    uint64_t oom_before = read_oom_kills(*env);

    ProcessResult pr;
    bool started = run_process(ps, pr);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        env->running.clear();
    }

    if (!started) {
        SandboxDetails details;
        details.image = env->spec.image;
        details.sandbox_id = id;
        details.operation = "exec";
        return Error::sandbox("failed to start process: " + pr.error, details);
    }

    ExecOutput out;
    out.exit_code = pr.exit_code;
    out.stdout_data = std::move(pr.stdout_data);
    out.stderr_data = std::move(pr.stderr_data);
    out.timed_out = pr.timed_out;
    out.cancelled = pr.cancelled;
    out.truncated = pr.truncated();
    out.duration = pr.duration;
    out.oom_killed = read_oom_kills(*env) > oom_before;

    spdlog::debug("Sandbox {} exec finished (exit={}, {}ms{})", id, out.exit_code,
                  out.duration.count(), out.timed_out ? ", timed out" : "");
    return out;
}

bool LocalRuntime::stop(const std::string& id) {
    auto env = find(id);
    if (!env) {
        return false;
    }

    std::vector<pid_t> running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running = env->running;
    }
    for (pid_t pid : running) {
        spdlog::info("Stopping sandbox {} process group {}", id, pid);
        kill_process_group(pid);
    }
    return true;
}

bool LocalRuntime::destroy(const std::string& id) {
    auto env = find(id);
    if (!env) {
        return false;
    }

    stop(id);
    cleanup_cgroups(*env);

    std::error_code ec;
    fs::remove_all(env->spec.workspace_path, ec);
    if (ec) {
        spdlog::warn("Failed to remove workspace {}: {}", env->spec.workspace_path, ec.message());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        environments_.erase(id);
    }
    spdlog::debug("Sandbox {} destroyed", id);
    return !ec;
}

uint64_t LocalRuntime::read_oom_kills(const Environment& env) const {
    if (env.cgroup_path.empty()) {
        return 0;
    }
    return read_cgroup_key(env.cgroup_path + "/memory.events", "oom_kill").value_or(0);
}

std::optional<ResourceUsage> LocalRuntime::usage(const std::string& id) {
    auto env = find(id);
    if (!env || env->cgroup_path.empty()) {
        return std::nullopt;
    }

    ResourceUsage u;
    u.memory_bytes = read_cgroup_number(env->cgroup_path + "/memory.current").value_or(0);
    u.memory_limit_bytes = read_cgroup_number(env->cgroup_path + "/memory.max").value_or(0);
    u.pids = read_cgroup_number(env->cgroup_path + "/pids.current").value_or(0);
    u.oom_kills = read_oom_kills(*env);

    auto cpu_usec = read_cgroup_key(env->cgroup_path + "/cpu.stat", "usage_usec");
    if (cpu_usec) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::steady_clock::now();
        auto wall_usec = std::chrono::duration_cast<std::chrono::microseconds>(
            now - env->last_sample).count();
        if (wall_usec > 0 && *cpu_usec >= env->last_cpu_usec) {
            u.cpu_percent = 100.0 * static_cast<double>(*cpu_usec - env->last_cpu_usec) /
                            static_cast<double>(wall_usec);
        }
        env->last_cpu_usec = *cpu_usec;
        env->last_sample = now;
    }
    return u;
}

bool LocalRuntime::healthy(const std::string& id) {
    auto env = find(id);
    if (!env) {
        return false;
    }
    std::error_code ec;
    if (!fs::is_directory(env->spec.workspace_path, ec)) {
        return false;
    }
    if (!env->cgroup_path.empty() && !fs::is_directory(env->cgroup_path, ec)) {
        return false;
    }
    return true;
}

std::vector<std::string> LocalRuntime::modified_outside_workspace(const std::string&) {
    // Local processes write to the shared host filesystem; there is no
    // per-environment diff to inspect.
    return {};
}

std::optional<IsolationStatus> LocalRuntime::isolation_status(const std::string& id) const {
    auto env = find(id);
    if (!env) {
        return std::nullopt;
    }
    return env->isolation;
}

} // namespace sandpit::runtime
