/**
 * Sandpit Process Runner
 *
 * fork/exec with separate stdout/stderr capture, per-stream output caps,
 * rlimits, a hard wall-clock timeout and cooperative cancellation.
 * The child runs in its own process group so a kill reaches every
 * descendant.
 */
#pragma once
#include <string>
#include <vector>
#include <atomic>
#include <chrono>
#include <functional>
#include <cstdint>
#include <sys/types.h>

namespace sandpit::runtime {

struct ProcessLimits {
    uint64_t address_space_bytes = 0;                 // RLIMIT_AS (0 = unlimited)
    uint32_t cpu_time_sec = 0;                        // RLIMIT_CPU (0 = unlimited)
    uint64_t file_size_bytes = 64 * 1024 * 1024;      // RLIMIT_FSIZE
    uint32_t max_open_files = 256;                    // RLIMIT_NOFILE
};

struct ProcessSpec {
    std::vector<std::string> argv;
    std::string cwd;                                  // Empty = inherit
    std::string stdin_data;
    std::vector<std::string> env;                     // Extra KEY=VALUE entries
    std::chrono::milliseconds timeout{0};             // 0 = no timeout
    size_t output_limit = 64 * 1024;                  // Per stream
    ProcessLimits limits;
    bool isolate_network = false;                     // New (empty) network namespace
    const std::atomic<bool>* cancel = nullptr;

    // Runs in the parent after fork, before the child may exec
    std::function<void(pid_t)> on_spawn;
};

struct ProcessResult {
    int exit_code = -1;                               // 128+N when killed by signal N
    int term_signal = 0;
    std::string stdout_data;
    std::string stderr_data;
    bool timed_out = false;
    bool cancelled = false;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    std::chrono::milliseconds duration{0};
    std::string error;                                // Runner failure, not child stderr

    bool truncated() const { return stdout_truncated || stderr_truncated; }
};

// Returns false if the process could not be started (result.error says why)
bool run_process(const ProcessSpec& spec, ProcessResult& result);

// Kill a process group started by run_process
void kill_process_group(pid_t pgid);

} // namespace sandpit::runtime
