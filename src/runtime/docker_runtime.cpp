#include "runtime/docker_runtime.hpp"
#include "runtime/process.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace sandpit::runtime {

using json = nlohmann::json;
using kernel::Error;
using kernel::Result;
using kernel::SandboxDetails;

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// "10.5MiB", "1.2GB", "512kB" -> bytes
uint64_t parse_size(const std::string& text) {
    std::string s = trim(text);
    char* end = nullptr;
    double value = std::strtod(s.c_str(), &end);
    if (end == s.c_str()) return 0;
    std::string unit = trim(end);

    double mult = 1.0;
    if (unit == "kB" || unit == "KB") mult = 1e3;
    else if (unit == "MB") mult = 1e6;
    else if (unit == "GB") mult = 1e9;
    else if (unit == "KiB") mult = 1024.0;
    else if (unit == "MiB") mult = 1024.0 * 1024.0;
    else if (unit == "GiB") mult = 1024.0 * 1024.0 * 1024.0;
    return static_cast<uint64_t>(value * mult);
}

std::string format_cpus(double quota) {
    std::ostringstream oss;
    oss.precision(3);
    oss << quota;
    return oss.str();
}

bool daemon_error(const std::string& stderr_text) {
    return stderr_text.rfind("Error response from daemon", 0) == 0 ||
           stderr_text.rfind("Error: No such container", 0) == 0 ||
           stderr_text.find("Cannot connect to the Docker daemon") != std::string::npos;
}

} // namespace

// ============================================================================
// DockerRuntime Implementation
// ============================================================================

DockerRuntime::DockerRuntime(const DockerRuntimeConfig& config)
    : config_(config) {}

DockerRuntime::CommandResult DockerRuntime::execute_docker_command(
    const std::vector<std::string>& args) const {

    ProcessSpec spec;
    spec.argv.push_back(config_.docker_binary);
    spec.argv.insert(spec.argv.end(), args.begin(), args.end());
    spec.timeout = config_.command_timeout;
    spec.output_limit = 1024 * 1024;

    spdlog::debug("DockerRuntime: Executing: docker {}", args.empty() ? "" : args[0]);

    ProcessResult pr;
    CommandResult result;
    result.started = run_process(spec, pr);
    if (!result.started) {
        spdlog::error("DockerRuntime: Failed to execute command: {}", pr.error);
        result.error_output = pr.error;
        return result;
    }
    result.exit_code = pr.exit_code;
    result.output = trim(pr.stdout_data);
    result.error_output = trim(pr.stderr_data);
    result.timed_out = pr.timed_out;
    return result;
}

bool DockerRuntime::available() {
    auto result = execute_docker_command({"version", "--format", "{{.Server.Version}}"});
    if (result.ok() && !result.output.empty()) {
        docker_version_ = result.output;
        spdlog::info("DockerRuntime: Docker {} available", docker_version_);
        return true;
    }
    spdlog::warn("DockerRuntime: Docker not available - {}", result.error_output);
    return false;
}

bool DockerRuntime::image_exists(const std::string& image) const {
    return execute_docker_command({"image", "inspect", image}).ok();
}

bool DockerRuntime::pull_image(const std::string& image) const {
    spdlog::info("DockerRuntime: Pulling image {}", image);
    auto result = execute_docker_command({"pull", image});
    if (!result.ok()) {
        spdlog::error("DockerRuntime: Failed to pull image {}: {}", image, result.error_output);
    }
    return result.ok();
}

std::vector<std::string> DockerRuntime::build_run_args(const EnvironmentSpec& spec) const {
    const auto& c = spec.constraints;
    std::vector<std::string> args = {"run", "-d", "--name", spec.name};

    if (!c.network) {
        args.push_back("--network");
        args.push_back("none");
    }

    // Memory, no extra swap
    args.push_back("--memory");
    args.push_back(std::to_string(c.memory_mb) + "m");
    args.push_back("--memory-swap");
    args.push_back(std::to_string(c.memory_mb) + "m");

    args.push_back("--cpus");
    args.push_back(format_cpus(c.cpu_quota));

    args.push_back("--pids-limit");
    args.push_back(std::to_string(c.max_pids));

    args.push_back("--cap-drop");
    args.push_back("ALL");
    args.push_back("--security-opt");
    args.push_back("no-new-privileges:true");

    args.push_back("--tmpfs");
    args.push_back("/tmp:rw,noexec,nosuid,size=" + config_.tmpfs_size);

    args.push_back("-v");
    args.push_back(spec.workspace_path + ":" + config_.container_workdir + ":rw");
    args.push_back("-w");
    args.push_back(config_.container_workdir);
    args.push_back("-e");
    args.push_back("HOME=" + config_.container_workdir);
    args.push_back("-e");
    args.push_back("PYTHONDONTWRITEBYTECODE=1");

    if (!config_.user.empty()) {
        args.push_back("--user");
        args.push_back(config_.user);
    }

    args.push_back(spec.image);
    args.push_back("sleep");
    args.push_back("infinity");
    return args;
}

Result<std::string> DockerRuntime::create(const EnvironmentSpec& spec) {
    SandboxDetails details;
    details.image = spec.image;
    details.sandbox_id = spec.name;
    details.operation = "create";

    if (!image_exists(spec.image)) {
        if (!config_.pull_missing_images || !pull_image(spec.image)) {
            return Error::sandbox("image " + spec.image + " is not available", details);
        }
    }

    auto result = execute_docker_command(build_run_args(spec));
    if (!result.ok()) {
        spdlog::error("DockerRuntime: Failed to create container: {}", result.error_output);
        return Error::sandbox("docker run failed: " + result.error_output, details);
    }

    std::string container_id = result.output;
    spdlog::info("DockerRuntime: Created container {} for sandbox {}",
                 container_id.substr(0, 12), spec.name);
    return container_id;
}

Result<ExecOutput> DockerRuntime::exec(const std::string& id, const ExecSpec& spec) {
    std::string workdir = config_.container_workdir;
    if (!spec.working_dir.empty() && spec.working_dir != ".") {
        workdir += "/" + spec.working_dir;
    }

    ProcessSpec ps;
    ps.argv = {config_.docker_binary, "exec", "-i", "-w", workdir, id};
    ps.argv.insert(ps.argv.end(), spec.argv.begin(), spec.argv.end());
    ps.stdin_data = spec.stdin_data;
    ps.timeout = spec.timeout;
    ps.output_limit = spec.output_limit;
    ps.cancel = spec.cancel;

    ProcessResult pr;
    SandboxDetails details;
    details.sandbox_id = id;
    details.operation = "exec";

    if (!run_process(ps, pr)) {
        return Error::sandbox("failed to start docker exec: " + pr.error, details);
    }

    // Killing the CLI leaves the command running inside the container
    if ((pr.timed_out || pr.cancelled) && !stop(id)) {
        spdlog::warn("DockerRuntime: Could not kill container {} after an interrupted exec",
                     id.substr(0, 12));
    }

    if (!pr.timed_out && !pr.cancelled && pr.exit_code != 0 && daemon_error(pr.stderr_data)) {
        return Error::sandbox("docker exec failed: " + trim(pr.stderr_data), details);
    }

    ExecOutput out;
    out.exit_code = pr.exit_code;
    out.stdout_data = std::move(pr.stdout_data);
    out.stderr_data = std::move(pr.stderr_data);
    out.timed_out = pr.timed_out;
    out.cancelled = pr.cancelled;
    out.truncated = pr.truncated();
    out.duration = pr.duration;
    // SIGKILL from inside the container is the OOM killer
    out.oom_killed = !pr.timed_out && !pr.cancelled && pr.exit_code == 137;
    return out;
}

bool DockerRuntime::stop(const std::string& id) {
    auto result = execute_docker_command({"kill", id});
    if (result.ok()) {
        spdlog::info("DockerRuntime: Killed container {}", id.substr(0, 12));
    }
    return result.ok();
}

bool DockerRuntime::destroy(const std::string& id) {
    auto result = execute_docker_command({"rm", "-f", id});
    if (result.ok()) {
        spdlog::info("DockerRuntime: Removed container {}", id.substr(0, 12));
    } else {
        spdlog::warn("DockerRuntime: Failed to remove container {}: {}", id.substr(0, 12),
                     result.error_output);
    }
    return result.ok();
}

std::optional<ResourceUsage> DockerRuntime::parse_stats(const std::string& stats_json) {
    try {
        auto j = json::parse(stats_json);
        ResourceUsage u;

        std::string cpu = j.value("CPUPerc", "0%");
        if (!cpu.empty() && cpu.back() == '%') cpu.pop_back();
        u.cpu_percent = std::strtod(cpu.c_str(), nullptr);

        std::string mem = j.value("MemUsage", "");
        auto slash = mem.find('/');
        if (slash != std::string::npos) {
            u.memory_bytes = parse_size(mem.substr(0, slash));
            u.memory_limit_bytes = parse_size(mem.substr(slash + 1));
        }

        std::string pids = j.value("PIDs", "0");
        u.pids = std::strtoull(pids.c_str(), nullptr, 10);
        return u;
    } catch (const json::exception& e) {
        spdlog::debug("DockerRuntime: Cannot parse stats: {}", e.what());
        return std::nullopt;
    }
}

std::optional<ResourceUsage> DockerRuntime::usage(const std::string& id) {
    auto result = execute_docker_command({"stats", "--no-stream", "--format", "{{json .}}", id});
    if (!result.ok()) {
        return std::nullopt;
    }
    return parse_stats(result.output);
}

bool DockerRuntime::healthy(const std::string& id) {
    auto result = execute_docker_command({"inspect", "-f", "{{.State.Running}}", id});
    return result.ok() && result.output == "true";
}

std::vector<std::string> DockerRuntime::parse_diff(const std::string& diff_output,
                                                   const std::vector<std::string>& ignored_prefixes) {
    std::vector<std::pair<char, std::string>> entries;
    std::istringstream iss(diff_output);
    std::string line;
    while (std::getline(iss, line)) {
        line = trim(line);
        if (line.size() < 3 || line[1] != ' ') continue;
        entries.emplace_back(line[0], line.substr(2));
    }

    auto ignored = [&](const std::string& path) {
        for (const auto& prefix : ignored_prefixes) {
            if (path == prefix || path.rfind(prefix + "/", 0) == 0) return true;
        }
        return false;
    };

    std::vector<std::string> changed;
    for (const auto& [kind, path] : entries) {
        if (ignored(path)) continue;
        // 'C' on a directory that only contains other entries is just their parent
        if (kind == 'C') {
            bool parent_only = std::any_of(entries.begin(), entries.end(), [&](const auto& other) {
                return other.second.size() > path.size() &&
                       other.second.rfind(path == "/" ? path : path + "/", 0) == 0;
            });
            if (parent_only) continue;
        }
        changed.push_back(path);
    }
    return changed;
}

std::vector<std::string> DockerRuntime::modified_outside_workspace(const std::string& id) {
    auto result = execute_docker_command({"diff", id});
    if (!result.ok()) {
        spdlog::warn("DockerRuntime: Cannot diff container {}: {}", id.substr(0, 12), result.error_output);
        // Unknown state counts as modified
        return {DIFF_FAILED_ENTRY};
    }
    return parse_diff(result.output, {config_.container_workdir, "/tmp"});
}

} // namespace sandpit::runtime
