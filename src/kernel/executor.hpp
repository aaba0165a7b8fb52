/**
 * Sandpit Executor
 *
 * Single entry point that turns an ExecutionRequest into an
 * ExecutionResult or a typed Error:
 *   VALIDATING -> ACQUIRING -> RUNNING -> CAPTURING -> RELEASING -> DONE
 * (FAILED from any phase). Requests are validated before the pool is
 * touched; the borrowed sandbox is always released, tainted when the run
 * left it in a state unsafe to reuse.
 */
#pragma once
#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <chrono>
#include <optional>
#include <nlohmann/json.hpp>
#include "kernel/errors.hpp"
#include "kernel/config.hpp"
#include "kernel/metrics.hpp"
#include "kernel/audit_log.hpp"
#include "kernel/test_report.hpp"
#include "runtime/container_runtime.hpp"
#include "runtime/sandbox_pool.hpp"

namespace sandpit::kernel {

enum class ExecutionMode {
    ARBITRARY_CODE,   // Payload is source code run by the interpreter
    TEST_RUN          // Payload is a test command
};

inline const char* execution_mode_to_string(ExecutionMode mode) {
    switch (mode) {
        case ExecutionMode::ARBITRARY_CODE: return "arbitrary-code";
        case ExecutionMode::TEST_RUN:       return "test-run";
        default: return "unknown";
    }
}

inline std::optional<ExecutionMode> execution_mode_from_string(const std::string& str) {
    if (str == "arbitrary-code") return ExecutionMode::ARBITRARY_CODE;
    if (str == "test-run")       return ExecutionMode::TEST_RUN;
    return std::nullopt;
}

enum class ExecutionPhase {
    VALIDATING,
    ACQUIRING,
    RUNNING,
    CAPTURING,
    RELEASING,
    DONE,
    FAILED
};

inline const char* execution_phase_to_string(ExecutionPhase phase) {
    switch (phase) {
        case ExecutionPhase::VALIDATING: return "VALIDATING";
        case ExecutionPhase::ACQUIRING:  return "ACQUIRING";
        case ExecutionPhase::RUNNING:    return "RUNNING";
        case ExecutionPhase::CAPTURING:  return "CAPTURING";
        case ExecutionPhase::RELEASING:  return "RELEASING";
        case ExecutionPhase::DONE:       return "DONE";
        case ExecutionPhase::FAILED:     return "FAILED";
        default: return "UNKNOWN";
    }
}

// Extra file placed in the workspace before the run
struct WorkspaceFile {
    std::string path;                 // Workspace-relative
    std::string content;
};

struct ExecutionRequest {
    std::string payload;                                   // Code or command
    std::string target_path;                               // Empty = "main.py" / "."
    std::optional<std::chrono::milliseconds> timeout;      // Empty = mode default
    std::optional<runtime::ResourceConstraints> constraints;
    ExecutionMode mode = ExecutionMode::ARBITRARY_CODE;
    std::vector<WorkspaceFile> files;
    std::string interpreter;                               // Empty = configured default
    std::shared_ptr<std::atomic<bool>> cancel;             // Set to abandon the run
};

struct ExecutionResult {
    std::string request_id;
    int exit_code = 0;
    std::string stdout_text;
    std::string stderr_text;
    std::chrono::milliseconds duration{0};
    bool truncated = false;
    std::string sandbox_id;
    bool sandbox_reused = false;
    uint32_t attempts = 1;
    std::optional<TestSummary> test_summary;

    nlohmann::json to_json() const;

    // Exit code line plus "--- STDOUT ---" / "--- STDERR ---" blocks
    std::string to_text() const;
};

class Executor {
public:
    Executor(const SandpitConfig& config, std::shared_ptr<runtime::ContainerRuntime> runtime);
    ~Executor();

    // Non-copyable
    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    // Safe to call from many threads at once
    Result<ExecutionResult> execute(const ExecutionRequest& request);

    runtime::PoolMetrics get_pool_stats() const;
    void clear_pool();

    MetricsSnapshot get_metrics() const;
    void reset_metrics();

    // Query usage of every live sandbox, recording each sample
    nlohmann::json sample_resources();

    AuditLogger& audit() { return audit_; }
    runtime::SandboxPool& pool() { return *pool_; }
    const SandpitConfig& config() const { return config_; }

private:
    struct PreparedRun {
        ExecutionMode mode;
        std::vector<std::string> argv;
        std::string working_dir;
        std::vector<WorkspaceFile> files;       // Target file included, paths normalized
        std::chrono::milliseconds timeout{0};
        runtime::ResourceConstraints constraints;
        std::vector<std::string> sources;       // Text scanned by the taint policy
    };

    SandpitConfig config_;
    std::shared_ptr<runtime::ContainerRuntime> runtime_;
    AuditLogger audit_;
    Metrics metrics_;
    std::unique_ptr<runtime::SandboxPool> pool_;
    std::atomic<uint64_t> next_request_id_{1};

    Result<ExecutionResult> run(const ExecutionRequest& request, const std::string& request_id,
                                std::chrono::steady_clock::time_point started);
    Result<PreparedRun> prepare(const ExecutionRequest& request) const;
    Result<std::string> workspace_relative(const std::string& candidate, const std::string& field,
                                           bool allow_root) const;
    std::optional<Error> write_workspace(const runtime::SandboxHandle& handle,
                                         const PreparedRun& run) const;

    Error fail(Error error, const std::string& request_id, ExecutionMode mode,
               std::chrono::steady_clock::time_point started);
    void set_phase(const std::string& request_id, ExecutionPhase phase) const;
};

// Build the runtime named by config.runtime
Result<std::shared_ptr<runtime::ContainerRuntime>> create_runtime(const SandpitConfig& config);

} // namespace sandpit::kernel
