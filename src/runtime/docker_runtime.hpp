/**
 * Sandpit Docker Runtime
 *
 * Drives the docker CLI: one long-lived container per sandbox with the
 * host workspace bind-mounted at /workspace, no capabilities, no new
 * privileges, memory/CPU/PID ceilings and no network unless requested.
 */
#pragma once
#include <string>
#include <vector>
#include <chrono>
#include "runtime/container_runtime.hpp"

namespace sandpit::runtime {

struct DockerRuntimeConfig {
    std::string docker_binary = "docker";
    std::string container_workdir = "/workspace";
    std::string tmpfs_size = "100m";
    std::string user;                                  // Empty = image default
    std::chrono::milliseconds command_timeout{60000};  // For docker CLI calls
    bool pull_missing_images = true;
};

class DockerRuntime : public ContainerRuntime {
public:
    // Reported by modified_outside_workspace when docker diff fails
    static constexpr const char* DIFF_FAILED_ENTRY = "<docker diff failed>";

    explicit DockerRuntime(const DockerRuntimeConfig& config = {});
    ~DockerRuntime() override = default;

    // Non-copyable
    DockerRuntime(const DockerRuntime&) = delete;
    DockerRuntime& operator=(const DockerRuntime&) = delete;

    // Is the docker daemon reachable?
    bool available();
    const std::string& docker_version() const { return docker_version_; }

    std::string name() const override { return "docker"; }

    kernel::Result<std::string> create(const EnvironmentSpec& spec) override;
    kernel::Result<ExecOutput> exec(const std::string& id, const ExecSpec& spec) override;
    bool stop(const std::string& id) override;
    bool destroy(const std::string& id) override;
    std::optional<ResourceUsage> usage(const std::string& id) override;
    bool healthy(const std::string& id) override;
    std::vector<std::string> modified_outside_workspace(const std::string& id) override;

    // Exposed for tests
    std::vector<std::string> build_run_args(const EnvironmentSpec& spec) const;
    static std::vector<std::string> parse_diff(const std::string& diff_output,
                                               const std::vector<std::string>& ignored_prefixes);
    static std::optional<ResourceUsage> parse_stats(const std::string& stats_json);

private:
    struct CommandResult {
        bool started = false;
        int exit_code = -1;
        std::string output;
        std::string error_output;
        bool timed_out = false;

        bool ok() const { return started && !timed_out && exit_code == 0; }
    };

    DockerRuntimeConfig config_;
    std::string docker_version_;

    CommandResult execute_docker_command(const std::vector<std::string>& args) const;
    bool image_exists(const std::string& image) const;
    bool pull_image(const std::string& image) const;
};

} // namespace sandpit::runtime
