/**
 * Sandpit Sandbox Pool
 *
 * Bounded set of reusable sandboxes on top of a ContainerRuntime.
 * Bookkeeping happens under one pool-wide lock; environment creation,
 * workspace recycling and destruction run outside it (creation on the
 * acquiring thread, recycle/destroy on the pool's maintenance thread).
 *
 * Per-handle state machine:
 *   IDLE -> IN_USE                 acquire
 *   IN_USE -> RECYCLING -> IDLE    clean release (workspace reset + health check)
 *   IN_USE -> DRAINING -> DESTROYED  tainted release or failed health check
 *   IDLE -> DRAINING -> DESTROYED  idle eviction, clear()
 */
#pragma once
#include <string>
#include <vector>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <optional>
#include <functional>
#include <condition_variable>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "kernel/errors.hpp"
#include "runtime/container_runtime.hpp"

namespace sandpit::runtime {

enum class SandboxState {
    IDLE,
    IN_USE,
    RECYCLING,
    DRAINING,
    DESTROYED
};

inline const char* sandbox_state_to_string(SandboxState state) {
    switch (state) {
        case SandboxState::IDLE:      return "IDLE";
        case SandboxState::IN_USE:    return "IN_USE";
        case SandboxState::RECYCLING: return "RECYCLING";
        case SandboxState::DRAINING:  return "DRAINING";
        case SandboxState::DESTROYED: return "DESTROYED";
        default: return "UNKNOWN";
    }
}

// Snapshot of a pooled sandbox handed to the borrower
struct SandboxHandle {
    std::string id;                          // "sbx-0001"
    std::string runtime_id;                  // Container/environment id in the runtime
    std::string image;
    std::string workspace_path;              // Host directory
    ResourceConstraints constraints;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point last_used;
    SandboxState state = SandboxState::IDLE;
    uint64_t use_count = 0;
    bool reused = false;                     // Came from the idle set

    nlohmann::json to_json() const;
};

struct PoolConfig {
    size_t max_size = 3;
    std::chrono::milliseconds acquire_timeout{30000};
    std::chrono::seconds idle_timeout{300};
    std::chrono::seconds sweep_interval{60};   // 0 = no periodic sweep
    uint32_t create_attempts = 3;
    kernel::RetryPolicy retry;
    std::string workspace_root = "/tmp/sandpit/workspaces";
    std::string image = "sandpit-python:latest";
};

struct PoolMetrics {
    uint64_t created = 0;
    uint64_t reused = 0;
    uint64_t destroyed = 0;
    uint64_t tainted_releases = 0;
    uint64_t create_failures = 0;
    uint64_t acquire_timeouts = 0;
    size_t current_size = 0;                 // Live handles, any state
    size_t idle_count = 0;
    size_t in_use_count = 0;
    size_t peak_in_use = 0;
    size_t max_size = 0;
    uint64_t executions = 0;
    std::chrono::milliseconds total_execution_time{0};

    nlohmann::json to_json() const;
};

enum class PoolEvent {
    CREATED,
    REUSED,
    RELEASED,
    TAINTED,
    EVICTED,
    DESTROYED
};

inline const char* pool_event_to_string(PoolEvent event) {
    switch (event) {
        case PoolEvent::CREATED:   return "CREATED";
        case PoolEvent::REUSED:    return "REUSED";
        case PoolEvent::RELEASED:  return "RELEASED";
        case PoolEvent::TAINTED:   return "TAINTED";
        case PoolEvent::EVICTED:   return "EVICTED";
        case PoolEvent::DESTROYED: return "DESTROYED";
        default: return "UNKNOWN";
    }
}

// Called outside the pool lock
using PoolEventCallback = std::function<void(PoolEvent, const SandboxHandle&)>;

class SandboxPool {
public:
    SandboxPool(std::shared_ptr<ContainerRuntime> runtime, const PoolConfig& config);
    ~SandboxPool();

    // Non-copyable
    SandboxPool(const SandboxPool&) = delete;
    SandboxPool& operator=(const SandboxPool&) = delete;

    // Blocks up to acquire_timeout when the pool is full
    kernel::Result<SandboxHandle> acquire(const ResourceConstraints& constraints);

    // Never blocks on runtime work
    void release(const SandboxHandle& handle, bool tainted = false);

    // Destroy idle handles unused for longer than older_than; returns how many
    size_t evict_idle(std::chrono::seconds older_than);

    // Destroy every handle regardless of state
    void clear();

    PoolMetrics stats() const;
    void reset_counters();

    // Credit one finished execution to the pool counters
    void record_execution(std::chrono::milliseconds duration);

    // Snapshot of every live handle
    std::vector<SandboxHandle> handles() const;

    // nullopt once a handle is destroyed or was never known
    std::optional<SandboxState> state_of(const std::string& id) const;

    // Block until the maintenance queue is empty
    void wait_for_maintenance();

    void set_event_callback(PoolEventCallback callback);

    ContainerRuntime& runtime() { return *runtime_; }
    const PoolConfig& config() const { return config_; }

private:
    struct Slot {
        SandboxHandle handle;
        std::chrono::steady_clock::time_point idle_since;
    };

    enum class JobKind { RECYCLE, DESTROY };
    struct Job {
        JobKind kind;
        std::shared_ptr<Slot> slot;
    };

    std::shared_ptr<ContainerRuntime> runtime_;
    PoolConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable available_cv_;   // A slot changed state
    std::condition_variable work_cv_;        // Maintenance work queued
    std::condition_variable drained_cv_;     // Maintenance queue empty
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
    std::deque<Job> jobs_;
    size_t pending_creates_ = 0;
    size_t running_jobs_ = 0;
    bool stopping_ = false;
    PoolMetrics counters_;

    std::atomic<uint64_t> next_id_{1};
    PoolEventCallback event_callback_;
    std::mutex callback_mutex_;

    std::thread worker_;

    kernel::Result<SandboxHandle> create_sandbox(const ResourceConstraints& constraints);
    void maintenance_loop();
    void run_recycle(const std::shared_ptr<Slot>& slot);
    void run_destroy(const std::shared_ptr<Slot>& slot);
    bool reset_workspace(const std::string& path) const;

    // Caller holds mutex_
    void schedule_destroy(const std::shared_ptr<Slot>& slot);
    void update_peak();
    size_t count_state(SandboxState state) const;

    void emit(PoolEvent event, const SandboxHandle& handle);
};

// RAII borrow of a pooled sandbox; unreleased leases go back tainted
class SandboxLease {
public:
    SandboxLease(SandboxPool& pool, SandboxHandle handle);
    ~SandboxLease();

    SandboxLease(const SandboxLease&) = delete;
    SandboxLease& operator=(const SandboxLease&) = delete;

    SandboxLease(SandboxLease&& other) noexcept;

    const SandboxHandle& handle() const { return handle_; }
    bool released() const { return released_; }

    void release(bool tainted);

private:
    SandboxPool* pool_;
    SandboxHandle handle_;
    bool released_ = false;
};

} // namespace sandpit::runtime
