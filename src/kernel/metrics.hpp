/**
 * Sandpit Metrics
 *
 * Process-wide execution counters and durations, mutated by every
 * concurrent caller of the executor. snapshot() copies everything out
 * under the lock; reset() zeroes it.
 */
#pragma once
#include <array>
#include <mutex>
#include <chrono>
#include <cstdint>
#include <optional>
#include <nlohmann/json.hpp>
#include "kernel/errors.hpp"

namespace sandpit::kernel {

struct MetricsSnapshot {
    uint64_t executions = 0;
    uint64_t code_executions = 0;
    uint64_t test_executions = 0;
    uint64_t successes = 0;
    uint64_t failures = 0;
    std::array<uint64_t, ERROR_KIND_COUNT> failures_by_kind{};
    uint64_t timeouts = 0;
    uint64_t cancellations = 0;
    uint64_t validation_rejections = 0;
    uint64_t pool_hits = 0;
    uint64_t pool_misses = 0;
    uint64_t retries = 0;
    uint64_t tainted_releases = 0;
    uint64_t truncated_outputs = 0;

    std::chrono::milliseconds total_duration{0};
    std::chrono::milliseconds min_duration{0};
    std::chrono::milliseconds max_duration{0};

    // Last sampled sandbox usage
    uint64_t last_memory_bytes = 0;
    double last_cpu_percent = 0.0;
    uint64_t last_pids = 0;
    uint64_t resource_samples = 0;

    double average_duration_ms() const;
    uint64_t failures_of(ErrorKind kind) const { return failures_by_kind[static_cast<size_t>(kind)]; }

    nlohmann::json to_json() const;
};

class Metrics {
public:
    Metrics() = default;

    // Non-copyable
    Metrics(const Metrics&) = delete;
    Metrics& operator=(const Metrics&) = delete;

    // One finished execution; failure = kind of the surfaced error
    void record_execution(bool test_run, std::chrono::milliseconds duration,
                          std::optional<ErrorKind> failure = std::nullopt);

    void record_timeout();
    void record_cancellation();
    void record_validation_rejection();
    void record_pool_acquire(bool hit);
    void record_retry();
    void record_tainted_release();
    void record_truncated_output();
    void record_resource_usage(uint64_t memory_bytes, double cpu_percent, uint64_t pids);

    MetricsSnapshot snapshot() const;
    void reset();

private:
    mutable std::mutex mutex_;
    MetricsSnapshot data_;
};

} // namespace sandpit::kernel
