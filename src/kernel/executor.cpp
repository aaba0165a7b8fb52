#include "kernel/executor.hpp"
#include "kernel/taint_policy.hpp"
#include "runtime/local_runtime.hpp"
#include "runtime/docker_runtime.hpp"
#include "security/validator.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace sandpit::kernel {

using runtime::SandboxHandle;
using runtime::SandboxLease;
using security::ValidationViolation;

namespace {

// Requests are validated against this root before any sandbox exists
const char* VIRTUAL_ROOT = "/workspace";

runtime::PoolConfig make_pool_config(const SandpitConfig& config) {
    runtime::PoolConfig pc;
    pc.max_size = config.pool.max_size;
    pc.acquire_timeout = std::chrono::milliseconds(config.pool.acquire_timeout_ms);
    pc.idle_timeout = std::chrono::seconds(config.pool.idle_timeout_sec);
    pc.sweep_interval = std::chrono::seconds(config.pool.sweep_interval_sec);
    pc.create_attempts = config.pool.create_attempts;
    pc.retry = config.retry_policy();
    pc.workspace_root = config.workspace_root;
    pc.image = config.image;
    return pc;
}

AuditConfig make_audit_config(const SandpitConfig& config) {
    AuditConfig ac;
    ac.max_entries = config.audit_max_entries;
    ac.file_path = config.audit_file;
    return ac;
}

ExecutionDetails execution_details(const runtime::ExecOutput& out, const std::string& sandbox_id) {
    ExecutionDetails d;
    d.exit_code = out.exit_code;
    d.stdout_text = out.stdout_data;
    d.stderr_text = out.stderr_data;
    d.timed_out = out.timed_out;
    d.cancelled = out.cancelled;
    d.output_truncated = out.truncated;
    d.sandbox_id = sandbox_id;
    return d;
}

// Copy of a sandbox error with the attempt count filled in
Error with_attempts(const Error& error, uint32_t attempts) {
    if (auto* d = error.details_as<SandboxDetails>()) {
        SandboxDetails details = *d;
        details.attempts = attempts;
        return Error::sandbox(error.message(), details, error.hint());
    }
    return error;
}

} // namespace

nlohmann::json ExecutionResult::to_json() const {
    nlohmann::json j = {
        {"request_id", request_id},
        {"exit_code", exit_code},
        {"stdout", stdout_text},
        {"stderr", stderr_text},
        {"duration_ms", duration.count()},
        {"truncated", truncated},
        {"sandbox_id", sandbox_id},
        {"sandbox_reused", sandbox_reused},
        {"attempts", attempts}
    };
    if (test_summary) {
        j["test_summary"] = test_summary->to_json();
    }
    return j;
}

std::string ExecutionResult::to_text() const {
    std::ostringstream out;
    out << "Exit code: " << exit_code << "\n";
    if (!stdout_text.empty()) {
        out << "--- STDOUT ---\n" << stdout_text;
        if (stdout_text.back() != '\n') out << "\n";
    }
    if (!stderr_text.empty()) {
        out << "--- STDERR ---\n" << stderr_text;
        if (stderr_text.back() != '\n') out << "\n";
    }
    if (truncated) {
        out << "[output truncated]\n";
    }
    if (test_summary) {
        out << format_test_summary(*test_summary) << "\n";
    }
    return out.str();
}

// ============================================================================
// Executor Implementation
// ============================================================================

Executor::Executor(const SandpitConfig& config, std::shared_ptr<runtime::ContainerRuntime> runtime)
    : config_(config)
    , runtime_(std::move(runtime))
    , audit_(make_audit_config(config)) {

    pool_ = std::make_unique<runtime::SandboxPool>(runtime_, make_pool_config(config_));
    pool_->set_event_callback([this](runtime::PoolEvent event, const SandboxHandle& handle) {
        audit_.log_sandbox(runtime::pool_event_to_string(event), handle.id, handle.to_json());
    });
}

Executor::~Executor() {
    // Stop the pool before the audit log it reports to
    pool_.reset();
}

Result<ExecutionResult> Executor::execute(const ExecutionRequest& request) {
    std::string request_id = fmt::format("exec-{}", next_request_id_.fetch_add(1));
    auto started = std::chrono::steady_clock::now();

    try {
        return run(request, request_id, started);
    } catch (const std::exception& e) {
        spdlog::error("{}: unexpected failure: {}", request_id, e.what());
        return fail(Error::tool(std::string("unexpected failure: ") + e.what(), "executor",
                                execution_mode_to_string(request.mode)),
                    request_id, request.mode, started);
    }
}

Result<ExecutionResult> Executor::run(const ExecutionRequest& request, const std::string& request_id,
                                      std::chrono::steady_clock::time_point started) {
    const bool test_run = request.mode == ExecutionMode::TEST_RUN;

    // ---- validating ----
    set_phase(request_id, ExecutionPhase::VALIDATING);
    auto prepared = prepare(request);
    if (!prepared) {
        const Error& error = prepared.error();
        if (error.kind() == ErrorKind::INPUT_VALIDATION) {
            metrics_.record_validation_rejection();
            audit_.log_security(error.type_name(), request_id, error.to_record());
        }
        return fail(error, request_id, request.mode, started);
    }
    const PreparedRun& plan = prepared.value();

    // ---- acquiring ----
    set_phase(request_id, ExecutionPhase::ACQUIRING);
    auto acquired = pool_->acquire(plan.constraints);
    if (!acquired) {
        return fail(acquired.error(), request_id, request.mode, started);
    }
    metrics_.record_pool_acquire(acquired.value().reused);

    std::optional<SandboxLease> lease;
    lease.emplace(*pool_, acquired.value());

    RetryPolicy policy = config_.retry_policy();
    uint32_t attempts = 0;
    std::optional<runtime::ExecOutput> output;

    while (!output) {
        attempts++;
        const SandboxHandle& handle = lease->handle();

        if (auto write_error = write_workspace(handle, plan)) {
            lease->release(true);
            metrics_.record_tainted_release();
            return fail(*write_error, request_id, request.mode, started);
        }

        if (request.cancel && request.cancel->load()) {
            lease->release(false);
            metrics_.record_cancellation();
            runtime::ExecOutput none;
            none.cancelled = true;
            return fail(Error::execution("execution cancelled before it started",
                                         execution_details(none, handle.id)),
                        request_id, request.mode, started);
        }

        // ---- running ----
        set_phase(request_id, ExecutionPhase::RUNNING);
        runtime::ExecSpec spec;
        spec.argv = plan.argv;
        spec.working_dir = plan.working_dir;
        spec.timeout = plan.timeout;
        spec.output_limit = config_.execution.output_limit_bytes;
        spec.cancel = request.cancel.get();

        auto exec = pool_->runtime().exec(handle.runtime_id, spec);
        if (exec) {
            output = std::move(exec.value());
            break;
        }

        // The runtime could not run the command: this sandbox is suspect either way
        lease->release(true);
        metrics_.record_tainted_release();

        if (!should_retry(exec.error()) || attempts >= policy.max_attempts) {
            return fail(with_attempts(exec.error(), attempts), request_id, request.mode, started);
        }

        auto delay = get_retry_delay(attempts - 1, policy);
        spdlog::warn("{}: attempt {}/{} failed ({}), retrying in {}ms", request_id, attempts,
                     policy.max_attempts, exec.error().message(), delay.count());
        metrics_.record_retry();
        std::this_thread::sleep_for(delay);

        set_phase(request_id, ExecutionPhase::ACQUIRING);
        auto again = pool_->acquire(plan.constraints);
        if (!again) {
            return fail(again.error(), request_id, request.mode, started);
        }
        metrics_.record_pool_acquire(again.value().reused);
        lease.emplace(*pool_, again.value());
    }

    // ---- capturing ----
    set_phase(request_id, ExecutionPhase::CAPTURING);
    const SandboxHandle handle = lease->handle();

    std::optional<runtime::ResourceUsage> usage;
    if (output->exit_code != 0 && !output->timed_out && !output->cancelled) {
        usage = pool_->runtime().usage(handle.runtime_id);
        if (usage) {
            metrics_.record_resource_usage(usage->memory_bytes, usage->cpu_percent, usage->pids);
            audit_.log(AuditCategory::RESOURCE, "USAGE", handle.id, usage->to_json());
        }
    }

    if (output->truncated) metrics_.record_truncated_output();
    if (output->timed_out) metrics_.record_timeout();
    if (output->cancelled) metrics_.record_cancellation();

    auto taint = taint_reason(*output, plan.sources, usage);

    // ---- releasing ----
    set_phase(request_id, ExecutionPhase::RELEASING);
    lease->release(taint.has_value());
    if (taint) {
        metrics_.record_tainted_release();
        spdlog::info("{}: sandbox {} tainted ({})", request_id, handle.id, *taint);
    }
    pool_->record_execution(output->duration);

    if (output->timed_out) {
        return fail(Error::execution(fmt::format("execution timed out after {}ms", plan.timeout.count()),
                                     execution_details(*output, handle.id)),
                    request_id, request.mode, started);
    }
    if (output->cancelled) {
        return fail(Error::execution("execution cancelled", execution_details(*output, handle.id)),
                    request_id, request.mode, started);
    }

    // Test runners exit 1 when tests fail; that is still a report
    bool failed = test_run ? (output->exit_code != 0 && output->exit_code != 1)
                           : output->exit_code != 0;
    if (failed) {
        return fail(Error::execution(fmt::format("process exited with code {}", output->exit_code),
                                     execution_details(*output, handle.id)),
                    request_id, request.mode, started);
    }

    ExecutionResult result;
    result.request_id = request_id;
    result.exit_code = output->exit_code;
    result.stdout_text = std::move(output->stdout_data);
    result.stderr_text = std::move(output->stderr_data);
    result.duration = output->duration;
    result.truncated = output->truncated;
    result.sandbox_id = handle.id;
    result.sandbox_reused = handle.reused;
    result.attempts = attempts;
    if (test_run) {
        result.test_summary = parse_test_report(result.stdout_text);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    metrics_.record_execution(test_run, elapsed);
    audit_.log_execution(request_id, {
        {"mode", execution_mode_to_string(request.mode)},
        {"sandbox_id", handle.id},
        {"exit_code", result.exit_code},
        {"duration_ms", result.duration.count()},
        {"truncated", result.truncated},
        {"tainted", taint.has_value()},
        {"attempts", attempts}
    }, true);

    set_phase(request_id, ExecutionPhase::DONE);
    spdlog::info("{}: {} finished in {}ms on {} (exit {})", request_id,
                 execution_mode_to_string(request.mode), result.duration.count(), handle.id,
                 result.exit_code);
    return result;
}

Result<Executor::PreparedRun> Executor::prepare(const ExecutionRequest& request) const {
    const auto& exec_cfg = config_.execution;
    PreparedRun plan;
    plan.mode = request.mode;

    // Timeout
    const std::chrono::milliseconds max_timeout(uint64_t(exec_cfg.max_timeout_sec) * 1000);
    if (request.timeout) {
        if (request.timeout->count() <= 0 || *request.timeout > max_timeout) {
            return Error::input_validation(ValidationViolation::INVALID_INPUT, "timeout",
                                           fmt::format("must be between 1ms and {}s", exec_cfg.max_timeout_sec),
                                           std::to_string(request.timeout->count()));
        }
        plan.timeout = *request.timeout;
    } else {
        uint32_t sec = request.mode == ExecutionMode::TEST_RUN ? exec_cfg.test_timeout_sec
                                                               : exec_cfg.code_timeout_sec;
        plan.timeout = std::chrono::milliseconds(uint64_t(sec) * 1000);
    }

    // Constraints
    const auto& limits = config_.constraints;
    if (request.constraints) {
        const auto& c = *request.constraints;
        if (c.memory_mb == 0 || c.memory_mb > limits.max_memory_mb ||
            !std::isfinite(c.cpu_quota) || c.cpu_quota <= 0.0 || c.cpu_quota > limits.max_cpu_quota ||
            c.max_pids == 0 || c.max_pids > limits.pids_ceiling) {
            return Error::input_validation(ValidationViolation::INVALID_INPUT, "constraints",
                                           fmt::format("must stay within {}MB memory, {} CPUs and {} processes",
                                                       limits.max_memory_mb, limits.max_cpu_quota,
                                                       limits.pids_ceiling),
                                           c.to_json().dump());
        }
        plan.constraints = c;
    } else {
        plan.constraints.memory_mb = limits.memory_mb;
        plan.constraints.cpu_quota = limits.cpu_quota;
        plan.constraints.max_pids = limits.max_pids;
        plan.constraints.network = limits.network;
    }

    if (request.mode == ExecutionMode::ARBITRARY_CODE) {
        auto code = security::validate_user_input(request.payload, exec_cfg.max_code_length);
        if (!code) {
            return Error::input_validation(code.violation, "payload", code.reason, request.payload);
        }

        auto target = workspace_relative(request.target_path.empty() ? "main.py" : request.target_path,
                                         "target_path", false);
        if (!target) {
            return target.error();
        }

        std::string interpreter = request.interpreter.empty() ? config_.interpreter : request.interpreter;
        const auto& allowed = config_.allowed_interpreters;
        if (std::find(allowed.begin(), allowed.end(), interpreter) == allowed.end()) {
            return Error::input_validation(ValidationViolation::INVALID_INPUT, "interpreter",
                                           "interpreter is not allowed", interpreter);
        }

        plan.argv = {interpreter, target.value()};
        plan.working_dir = ".";
        plan.files.push_back({target.value(), request.payload});
    } else {
        auto text = security::validate_user_input(request.payload, exec_cfg.max_input_length);
        if (!text) {
            return Error::input_validation(text.violation, "command", text.reason, request.payload);
        }
        auto command = security::validate_command(request.payload);
        if (!command) {
            return Error::input_validation(command.violation, "command", command.reason, request.payload);
        }
        if (!security::split_command_line(command.value, plan.argv)) {
            return Error::input_validation(ValidationViolation::INVALID_INPUT, "command",
                                           "unbalanced quotes", request.payload);
        }

        auto dir = workspace_relative(request.target_path.empty() ? "." : request.target_path,
                                      "target_path", true);
        if (!dir) {
            return dir.error();
        }
        plan.working_dir = dir.value();
    }

    auto argv_check = security::validate_argv(plan.argv);
    if (!argv_check) {
        return Error::input_validation(argv_check.violation, "command", argv_check.reason,
                                       plan.argv.empty() ? "" : plan.argv.front());
    }

    plan.sources.push_back(request.payload);
    for (const auto& file : request.files) {
        auto path = workspace_relative(file.path, "files", false);
        if (!path) {
            return path.error();
        }
        auto content = security::validate_user_input(file.content, exec_cfg.max_code_length);
        if (!content && !file.content.empty()) {
            return Error::input_validation(content.violation, "files", file.path + ": " + content.reason,
                                           file.path);
        }
        plan.files.push_back({path.value(), file.content});
        plan.sources.push_back(file.content);
    }
    return plan;
}

Result<std::string> Executor::workspace_relative(const std::string& candidate, const std::string& field,
                                                 bool allow_root) const {
    // No sandbox exists yet: resolve lexically, whatever the host has at VIRTUAL_ROOT
    auto outcome = security::validate_path(candidate, VIRTUAL_ROOT, security::PathResolution::LEXICAL);
    if (!outcome) {
        return Error::input_validation(outcome.violation, field, outcome.reason, candidate);
    }
    std::string rel = fs::path(outcome.value).lexically_relative(VIRTUAL_ROOT).generic_string();

    if (rel.empty() || rel == ".") {
        if (!allow_root) {
            return Error::input_validation(ValidationViolation::INVALID_INPUT, field,
                                           "must name a file inside the workspace", candidate);
        }
        return std::string(".");
    }
    if (!allow_root) {
        auto name = security::validate_filename(fs::path(rel).filename().string());
        if (!name) {
            return Error::input_validation(name.violation, field, name.reason, candidate);
        }
    }
    return rel;
}

std::optional<Error> Executor::write_workspace(const SandboxHandle& handle, const PreparedRun& run) const {
    SandboxDetails details;
    details.image = handle.image;
    details.sandbox_id = handle.id;
    details.operation = "write";

    // Re-check against the real workspace: symlinks there could point elsewhere
    for (const auto& file : run.files) {
        auto outcome = security::validate_path(file.path, handle.workspace_path);
        if (!outcome) {
            return Error::input_validation(outcome.violation, "files", outcome.reason, file.path);
        }

        fs::path target(outcome.value);
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return Error::sandbox("cannot create directory for " + file.path + ": " + ec.message(), details);
        }

        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out << file.content;
        out.close();
        if (!out) {
            return Error::sandbox("cannot write " + file.path + " into the workspace", details);
        }
    }

    if (run.working_dir != ".") {
        auto dir = security::validate_path(run.working_dir, handle.workspace_path);
        if (!dir) {
            return Error::input_validation(dir.violation, "target_path", dir.reason, run.working_dir);
        }
        std::error_code ec;
        fs::create_directories(dir.value, ec);
        if (ec) {
            return Error::sandbox("cannot create working directory " + run.working_dir + ": " + ec.message(),
                                  details);
        }
    }
    return std::nullopt;
}

Error Executor::fail(Error error, const std::string& request_id, ExecutionMode mode,
                     std::chrono::steady_clock::time_point started) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    metrics_.record_execution(mode == ExecutionMode::TEST_RUN, elapsed, error.kind());
    audit_.log_error(error, request_id);
    audit_.log_execution(request_id, {
        {"mode", execution_mode_to_string(mode)},
        {"error_type", error.type_name()},
        {"duration_ms", elapsed.count()}
    }, false);

    set_phase(request_id, ExecutionPhase::FAILED);
    spdlog::warn("{}: {}", request_id, security::mask_sensitive_data(format_error_message(error)));
    return error;
}

void Executor::set_phase(const std::string& request_id, ExecutionPhase phase) const {
    spdlog::debug("{}: {}", request_id, execution_phase_to_string(phase));
}

runtime::PoolMetrics Executor::get_pool_stats() const {
    return pool_->stats();
}

void Executor::clear_pool() {
    pool_->clear();
}

MetricsSnapshot Executor::get_metrics() const {
    return metrics_.snapshot();
}

void Executor::reset_metrics() {
    metrics_.reset();
    pool_->reset_counters();
}

nlohmann::json Executor::sample_resources() {
    nlohmann::json samples = nlohmann::json::array();
    for (const auto& handle : pool_->handles()) {
        auto usage = pool_->runtime().usage(handle.runtime_id);
        if (!usage) continue;

        metrics_.record_resource_usage(usage->memory_bytes, usage->cpu_percent, usage->pids);
        audit_.log(AuditCategory::RESOURCE, "USAGE", handle.id, usage->to_json());

        auto entry = usage->to_json();
        entry["sandbox_id"] = handle.id;
        entry["state"] = runtime::sandbox_state_to_string(handle.state);
        samples.push_back(entry);
    }
    return samples;
}

// ============================================================================
// Runtime selection
// ============================================================================

Result<std::shared_ptr<runtime::ContainerRuntime>> create_runtime(const SandpitConfig& config) {
    if (config.runtime == "local") {
        runtime::LocalRuntimeConfig rc;
        rc.enable_cgroups = config.enable_cgroups;
        rc.enable_namespaces = config.enable_namespaces;
        std::shared_ptr<runtime::ContainerRuntime> rt = std::make_shared<runtime::LocalRuntime>(rc);
        return rt;
    }

    if (config.runtime == "docker") {
        auto docker = std::make_shared<runtime::DockerRuntime>();
        if (!docker->available()) {
            return Error::configuration("docker daemon is not reachable", {"runtime"},
                                        std::string("Start the Docker daemon or set runtime to \"local\"."));
        }
        std::shared_ptr<runtime::ContainerRuntime> rt = docker;
        return rt;
    }

    return Error::configuration("unknown runtime '" + config.runtime + "'", {"runtime"},
                                std::string("Set runtime to \"local\" or \"docker\"."));
}

} // namespace sandpit::kernel
