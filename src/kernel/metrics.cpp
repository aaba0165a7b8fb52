#include "kernel/metrics.hpp"

namespace sandpit::kernel {

double MetricsSnapshot::average_duration_ms() const {
    if (executions == 0) {
        return 0.0;
    }
    return static_cast<double>(total_duration.count()) / static_cast<double>(executions);
}

nlohmann::json MetricsSnapshot::to_json() const {
    nlohmann::json by_kind = nlohmann::json::object();
    for (size_t i = 0; i < ERROR_KIND_COUNT; i++) {
        by_kind[error_kind_to_string(static_cast<ErrorKind>(i))] = failures_by_kind[i];
    }

    return nlohmann::json{
        {"counts", {
            {"executions", executions},
            {"code_executions", code_executions},
            {"test_executions", test_executions},
            {"successes", successes},
            {"failures", failures},
            {"failures_by_kind", by_kind},
            {"timeouts", timeouts},
            {"cancellations", cancellations},
            {"validation_rejections", validation_rejections},
            {"pool_hits", pool_hits},
            {"pool_misses", pool_misses},
            {"retries", retries},
            {"tainted_releases", tainted_releases},
            {"truncated_outputs", truncated_outputs}
        }},
        {"durations", {
            {"total_ms", total_duration.count()},
            {"min_ms", min_duration.count()},
            {"max_ms", max_duration.count()},
            {"average_ms", average_duration_ms()}
        }},
        {"resources", {
            {"last_memory_bytes", last_memory_bytes},
            {"last_cpu_percent", last_cpu_percent},
            {"last_pids", last_pids},
            {"samples", resource_samples}
        }}
    };
}

// ============================================================================
// Metrics Implementation
// ============================================================================

void Metrics::record_execution(bool test_run, std::chrono::milliseconds duration,
                               std::optional<ErrorKind> failure) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (data_.executions == 0 || duration < data_.min_duration) {
        data_.min_duration = duration;
    }
    if (duration > data_.max_duration) {
        data_.max_duration = duration;
    }
    data_.executions++;
    data_.total_duration += duration;

    if (test_run) {
        data_.test_executions++;
    } else {
        data_.code_executions++;
    }

    if (failure) {
        data_.failures++;
        data_.failures_by_kind[static_cast<size_t>(*failure)]++;
    } else {
        data_.successes++;
    }
}

void Metrics::record_timeout() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.timeouts++;
}

void Metrics::record_cancellation() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.cancellations++;
}

void Metrics::record_validation_rejection() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.validation_rejections++;
}

void Metrics::record_pool_acquire(bool hit) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (hit) {
        data_.pool_hits++;
    } else {
        data_.pool_misses++;
    }
}

void Metrics::record_retry() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.retries++;
}

void Metrics::record_tainted_release() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.tainted_releases++;
}

void Metrics::record_truncated_output() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.truncated_outputs++;
}

void Metrics::record_resource_usage(uint64_t memory_bytes, double cpu_percent, uint64_t pids) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.last_memory_bytes = memory_bytes;
    data_.last_cpu_percent = cpu_percent;
    data_.last_pids = pids;
    data_.resource_samples++;
}

MetricsSnapshot Metrics::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_;
}

void Metrics::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_ = MetricsSnapshot{};
}

} // namespace sandpit::kernel
