#include "runtime/sandbox_pool.hpp"
#include "security/validator.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace sandpit::runtime {

using kernel::Error;
using kernel::Result;
using kernel::SandboxDetails;

nlohmann::json SandboxHandle::to_json() const {
    return {
        {"id", id},
        {"runtime_id", runtime_id},
        {"image", image},
        {"workspace_path", workspace_path},
        {"constraints", constraints.to_json()},
        {"created_at", kernel::format_timestamp(created_at)},
        {"last_used", kernel::format_timestamp(last_used)},
        {"state", sandbox_state_to_string(state)},
        {"use_count", use_count},
        {"reused", reused}
    };
}

nlohmann::json PoolMetrics::to_json() const {
    return {
        {"created", created},
        {"reused", reused},
        {"destroyed", destroyed},
        {"tainted_releases", tainted_releases},
        {"create_failures", create_failures},
        {"acquire_timeouts", acquire_timeouts},
        {"current_size", current_size},
        {"idle_count", idle_count},
        {"in_use_count", in_use_count},
        {"peak_in_use", peak_in_use},
        {"max_size", max_size},
        {"executions", executions},
        {"total_execution_time_ms", total_execution_time.count()}
    };
}

// ============================================================================
// SandboxPool Implementation
// ============================================================================

SandboxPool::SandboxPool(std::shared_ptr<ContainerRuntime> runtime, const PoolConfig& config)
    : runtime_(std::move(runtime))
    , config_(config) {
    if (config_.max_size == 0) {
        config_.max_size = 1;
    }
    if (config_.create_attempts == 0) {
        config_.create_attempts = 1;
    }
    counters_.max_size = config_.max_size;

    worker_ = std::thread(&SandboxPool::maintenance_loop, this);
    spdlog::info("Sandbox pool ready (runtime={}, max_size={}, image={})",
                 runtime_->name(), config_.max_size, config_.image);
}

SandboxPool::~SandboxPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        for (auto& [id, slot] : slots_) {
            auto state = slot->handle.state;
            if (state == SandboxState::IDLE || state == SandboxState::IN_USE) {
                schedule_destroy(slot);
            } else if (state == SandboxState::RECYCLING) {
                // The queued recycle job sees DRAINING and destroys instead
                slot->handle.state = SandboxState::DRAINING;
            }
        }
    }
    available_cv_.notify_all();
    work_cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
    spdlog::info("Sandbox pool shut down");
}

Result<SandboxHandle> SandboxPool::acquire(const ResourceConstraints& constraints) {
    auto deadline = std::chrono::steady_clock::now() + config_.acquire_timeout;

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (stopping_) {
            SandboxDetails details;
            details.image = config_.image;
            details.operation = "acquire";
            return Error::sandbox("sandbox pool is shutting down", details);
        }

        // 1. Reuse an idle handle with the same constraints
        for (auto& [id, slot] : slots_) {
            if (slot->handle.state == SandboxState::IDLE && slot->handle.constraints == constraints) {
                slot->handle.state = SandboxState::IN_USE;
                slot->handle.last_used = std::chrono::system_clock::now();
                slot->handle.use_count++;
                slot->handle.reused = true;
                counters_.reused++;
                update_peak();

                SandboxHandle handle = slot->handle;
                lock.unlock();
                spdlog::debug("Reusing sandbox {} (uses={})", handle.id, handle.use_count);
                emit(PoolEvent::REUSED, handle);
                return handle;
            }
        }

        // A matching handle is being recycled; waiting for it beats creating a new one
        bool recycling_match = std::any_of(slots_.begin(), slots_.end(), [&](const auto& entry) {
            return entry.second->handle.state == SandboxState::RECYCLING &&
                   entry.second->handle.constraints == constraints;
        });

        // 2. Create a new handle if there is room
        if (!recycling_match && slots_.size() + pending_creates_ < config_.max_size) {
            pending_creates_++;
            lock.unlock();

            auto created = create_sandbox(constraints);

            lock.lock();
            pending_creates_--;
            if (!created) {
                counters_.create_failures++;
                lock.unlock();
                available_cv_.notify_all();
                return created;
            }
            if (stopping_) {
                // Shutdown raced the creation; hand the environment to the destroy queue
                auto slot = std::make_shared<Slot>();
                slot->handle = created.value();
                slots_[slot->handle.id] = slot;
                schedule_destroy(slot);
                work_cv_.notify_one();
                continue;
            }

            auto slot = std::make_shared<Slot>();
            slot->handle = created.value();
            slot->handle.state = SandboxState::IN_USE;
            slot->handle.use_count = 1;
            slots_[slot->handle.id] = slot;
            counters_.created++;
            update_peak();

            SandboxHandle handle = slot->handle;
            lock.unlock();
            emit(PoolEvent::CREATED, handle);
            return handle;
        }

        // 3. Full of idle handles with other constraints: evict the least recently used
        if (!recycling_match && count_state(SandboxState::DRAINING) == 0) {
            std::shared_ptr<Slot> oldest;
            for (auto& [id, slot] : slots_) {
                if (slot->handle.state != SandboxState::IDLE) continue;
                if (!oldest || slot->idle_since < oldest->idle_since) {
                    oldest = slot;
                }
            }
            if (oldest) {
                spdlog::debug("Evicting idle sandbox {} to make room", oldest->handle.id);
                schedule_destroy(oldest);
                SandboxHandle evicted = oldest->handle;
                lock.unlock();
                work_cv_.notify_one();
                emit(PoolEvent::EVICTED, evicted);
                lock.lock();
                continue;
            }
        }

        // 4. Wait for a release, a recycle or a destruction
        if (available_cv_.wait_until(lock, deadline) == std::cv_status::timeout &&
            std::chrono::steady_clock::now() >= deadline) {
            counters_.acquire_timeouts++;
            SandboxDetails details;
            details.image = config_.image;
            details.operation = "acquire";
            spdlog::warn("Timed out after {}ms waiting for a sandbox (pool size {}/{})",
                         config_.acquire_timeout.count(), slots_.size(), config_.max_size);
            return Error::sandbox(
                fmt::format("no sandbox became available within {}ms", config_.acquire_timeout.count()),
                details);
        }
    }
}

Result<SandboxHandle> SandboxPool::create_sandbox(const ResourceConstraints& constraints) {
    SandboxHandle handle;
    handle.id = fmt::format("sbx-{:04d}", next_id_.fetch_add(1));
    handle.image = config_.image;
    handle.constraints = constraints;

    SandboxDetails details;
    details.image = config_.image;
    details.sandbox_id = handle.id;
    details.operation = "create";

    auto workspace = security::validate_path(handle.id, config_.workspace_root);
    if (!workspace) {
        return Error::sandbox("invalid workspace for " + handle.id + ": " + workspace.reason, details);
    }
    handle.workspace_path = workspace.value;

    EnvironmentSpec spec;
    spec.name = handle.id;
    spec.image = config_.image;
    spec.workspace_path = handle.workspace_path;
    spec.constraints = constraints;

    std::optional<Error> last_error;
    for (uint32_t attempt = 0; attempt < config_.create_attempts; attempt++) {
        details.attempts = attempt + 1;

        std::error_code ec;
        fs::create_directories(handle.workspace_path, ec);
        if (ec) {
            return Error::sandbox("cannot create workspace " + handle.workspace_path + ": " + ec.message(),
                                  details, "Check that workspace_root exists and is writable.");
        }

        auto created = runtime_->create(spec);
        if (created) {
            handle.runtime_id = created.value();
            handle.created_at = std::chrono::system_clock::now();
            handle.last_used = handle.created_at;
            spdlog::info("Created sandbox {} (attempt {}/{})", handle.id, attempt + 1,
                         config_.create_attempts);
            return handle;
        }

        last_error = created.error();
        spdlog::warn("Sandbox {} creation attempt {}/{} failed: {}", handle.id, attempt + 1,
                     config_.create_attempts, created.error().message());

        // Leftovers of a half-created environment would collide with the next attempt
        if (!runtime_->destroy(spec.name)) {
            spdlog::debug("Nothing to clean up after failed creation of {}", handle.id);
        }

        if (!kernel::should_retry(created.error()) || attempt + 1 >= config_.create_attempts) {
            break;
        }
        std::this_thread::sleep_for(kernel::get_retry_delay(attempt, config_.retry));
    }

    std::error_code ec;
    fs::remove_all(handle.workspace_path, ec);

    std::string cause = last_error ? last_error->message() : "unknown error";
    std::optional<std::string> hint;
    if (last_error) hint = last_error->hint();
    return Error::sandbox(fmt::format("failed to create sandbox after {} attempt(s): {}",
                                      details.attempts, cause),
                          details, hint);
}

void SandboxPool::release(const SandboxHandle& handle, bool tainted) {
    SandboxHandle released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(handle.id);
        if (it == slots_.end() || it->second->handle.state != SandboxState::IN_USE) {
            // clear() or shutdown already took it
            spdlog::debug("Release of sandbox {} ignored (not in use)", handle.id);
            return;
        }
        auto slot = it->second;
        slot->handle.last_used = std::chrono::system_clock::now();

        if (tainted) {
            counters_.tainted_releases++;
            schedule_destroy(slot);
        } else {
            slot->handle.state = SandboxState::RECYCLING;
            jobs_.push_back({JobKind::RECYCLE, slot});
        }
        released = slot->handle;
    }
    work_cv_.notify_one();

    if (tainted) {
        spdlog::info("Sandbox {} released tainted, destroying", handle.id);
        emit(PoolEvent::TAINTED, released);
    } else {
        spdlog::debug("Sandbox {} released for reuse", handle.id);
        emit(PoolEvent::RELEASED, released);
    }
}

size_t SandboxPool::evict_idle(std::chrono::seconds older_than) {
    auto now = std::chrono::steady_clock::now();
    std::vector<SandboxHandle> evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, slot] : slots_) {
            if (slot->handle.state == SandboxState::IDLE && now - slot->idle_since >= older_than) {
                schedule_destroy(slot);
                evicted.push_back(slot->handle);
            }
        }
    }
    if (!evicted.empty()) {
        work_cv_.notify_one();
        spdlog::info("Evicting {} idle sandbox(es) unused for {}s", evicted.size(), older_than.count());
    }
    for (const auto& handle : evicted) {
        emit(PoolEvent::EVICTED, handle);
    }
    return evicted.size();
}

void SandboxPool::clear() {
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, slot] : slots_) {
            switch (slot->handle.state) {
                case SandboxState::IDLE:
                case SandboxState::IN_USE:
                    schedule_destroy(slot);
                    count++;
                    break;
                case SandboxState::RECYCLING:
                    slot->handle.state = SandboxState::DRAINING;
                    count++;
                    break;
                default:
                    break;
            }
        }
    }
    work_cv_.notify_one();
    available_cv_.notify_all();
    spdlog::info("Clearing sandbox pool ({} handle(s))", count);
}

PoolMetrics SandboxPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PoolMetrics snapshot = counters_;
    snapshot.current_size = slots_.size();
    snapshot.idle_count = count_state(SandboxState::IDLE);
    snapshot.in_use_count = count_state(SandboxState::IN_USE);
    snapshot.max_size = config_.max_size;
    return snapshot;
}

void SandboxPool::reset_counters() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_ = PoolMetrics{};
    counters_.max_size = config_.max_size;
    counters_.peak_in_use = count_state(SandboxState::IN_USE);
}

void SandboxPool::record_execution(std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.executions++;
    counters_.total_execution_time += duration;
}

std::vector<SandboxHandle> SandboxPool::handles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SandboxHandle> result;
    result.reserve(slots_.size());
    for (const auto& [id, slot] : slots_) {
        result.push_back(slot->handle);
    }
    return result;
}

std::optional<SandboxState> SandboxPool::state_of(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(id);
    if (it == slots_.end()) {
        return std::nullopt;
    }
    return it->second->handle.state;
}

void SandboxPool::wait_for_maintenance() {
    std::unique_lock<std::mutex> lock(mutex_);
    drained_cv_.wait(lock, [this] { return jobs_.empty() && running_jobs_ == 0; });
}

void SandboxPool::set_event_callback(PoolEventCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    event_callback_ = std::move(callback);
}

void SandboxPool::emit(PoolEvent event, const SandboxHandle& handle) {
    PoolEventCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = event_callback_;
    }
    if (callback) {
        callback(event, handle);
    }
}

void SandboxPool::schedule_destroy(const std::shared_ptr<Slot>& slot) {
    slot->handle.state = SandboxState::DRAINING;
    jobs_.push_back({JobKind::DESTROY, slot});
}

void SandboxPool::update_peak() {
    counters_.peak_in_use = std::max(counters_.peak_in_use, count_state(SandboxState::IN_USE));
}

size_t SandboxPool::count_state(SandboxState state) const {
    return static_cast<size_t>(std::count_if(slots_.begin(), slots_.end(), [state](const auto& entry) {
        return entry.second->handle.state == state;
    }));
}

// ============================================================================
// Maintenance thread
// ============================================================================

void SandboxPool::maintenance_loop() {
    auto next_sweep = std::chrono::steady_clock::now() + config_.sweep_interval;

    while (true) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto has_work = [this] { return stopping_ || !jobs_.empty(); };

        if (config_.sweep_interval.count() > 0) {
            work_cv_.wait_until(lock, next_sweep, has_work);
        } else {
            work_cv_.wait(lock, has_work);
        }

        if (jobs_.empty()) {
            if (stopping_) {
                break;
            }
            if (config_.sweep_interval.count() > 0 && std::chrono::steady_clock::now() >= next_sweep) {
                next_sweep = std::chrono::steady_clock::now() + config_.sweep_interval;
                lock.unlock();
                evict_idle(config_.idle_timeout);
            }
            continue;
        }

        Job job = jobs_.front();
        jobs_.pop_front();
        running_jobs_++;
        lock.unlock();

        if (job.kind == JobKind::RECYCLE) {
            run_recycle(job.slot);
        } else {
            run_destroy(job.slot);
        }

        lock.lock();
        running_jobs_--;
        if (jobs_.empty() && running_jobs_ == 0) {
            drained_cv_.notify_all();
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    drained_cv_.notify_all();
}

void SandboxPool::run_recycle(const std::shared_ptr<Slot>& slot) {
    const std::string id = slot->handle.id;
    const std::string runtime_id = slot->handle.runtime_id;

    std::string failure;
    if (!reset_workspace(slot->handle.workspace_path)) {
        failure = "workspace reset failed";
    } else if (!runtime_->healthy(runtime_id)) {
        failure = "health check failed";
    } else {
        auto changed = runtime_->modified_outside_workspace(runtime_id);
        if (!changed.empty()) {
            failure = fmt::format("{} path(s) modified outside the workspace (first: {})",
                                  changed.size(), changed.front());
        }
    }

    bool reusable = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (slot->handle.state == SandboxState::RECYCLING && failure.empty()) {
            slot->handle.state = SandboxState::IDLE;
            slot->idle_since = std::chrono::steady_clock::now();
            reusable = true;
        } else {
            slot->handle.state = SandboxState::DRAINING;
        }
    }

    if (!failure.empty()) {
        spdlog::warn("Sandbox {} not reusable: {}", id, failure);
    }

    if (reusable) {
        available_cv_.notify_all();
    } else {
        run_destroy(slot);
    }
}

void SandboxPool::run_destroy(const std::shared_ptr<Slot>& slot) {
    const std::string runtime_id = slot->handle.runtime_id;

    if (!runtime_->stop(runtime_id)) {
        spdlog::debug("Sandbox {} had nothing running to stop", slot->handle.id);
    }
    if (!runtime_->destroy(runtime_id)) {
        spdlog::warn("Runtime could not destroy sandbox {} cleanly", slot->handle.id);
    }

    std::error_code ec;
    fs::remove_all(slot->handle.workspace_path, ec);
    if (ec) {
        spdlog::warn("Failed to remove workspace {}: {}", slot->handle.workspace_path, ec.message());
    }

    SandboxHandle destroyed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        slot->handle.state = SandboxState::DESTROYED;
        destroyed = slot->handle;
        slots_.erase(slot->handle.id);
        counters_.destroyed++;
    }
    available_cv_.notify_all();

    spdlog::info("Destroyed sandbox {}", destroyed.id);
    emit(PoolEvent::DESTROYED, destroyed);
}

bool SandboxPool::reset_workspace(const std::string& path) const {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        return false;
    }

    std::vector<fs::path> entries;
    for (auto it = fs::directory_iterator(path, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        entries.push_back(it->path());
    }
    if (ec) {
        spdlog::warn("Cannot list workspace {}: {}", path, ec.message());
        return false;
    }

    for (const auto& entry : entries) {
        fs::remove_all(entry, ec);
        if (ec) {
            spdlog::warn("Cannot remove {} from workspace: {}", entry.string(), ec.message());
            return false;
        }
    }
    return true;
}

// ============================================================================
// SandboxLease Implementation
// ============================================================================

SandboxLease::SandboxLease(SandboxPool& pool, SandboxHandle handle)
    : pool_(&pool)
    , handle_(std::move(handle)) {}

SandboxLease::SandboxLease(SandboxLease&& other) noexcept
    : pool_(other.pool_)
    , handle_(std::move(other.handle_))
    , released_(other.released_) {
    other.released_ = true;
}

SandboxLease::~SandboxLease() {
    if (!released_) {
        spdlog::warn("Sandbox {} lease dropped without release, discarding it", handle_.id);
        pool_->release(handle_, true);
    }
}

void SandboxLease::release(bool tainted) {
    if (released_) {
        return;
    }
    released_ = true;
    pool_->release(handle_, tainted);
}

} // namespace sandpit::runtime
