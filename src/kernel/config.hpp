/**
 * Sandpit Configuration
 *
 * Defaults, overridden by an optional JSON file, overridden by
 * SANDPIT_* environment variables (a .env file is loaded first and
 * never replaces variables already set).
 */
#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "kernel/errors.hpp"

namespace sandpit::kernel {

struct PoolSettings {
    size_t max_size = 3;                     // Live sandboxes, any state
    uint32_t acquire_timeout_ms = 30000;     // Wait for a free sandbox
    uint32_t idle_timeout_sec = 300;         // Idle budget before eviction
    uint32_t sweep_interval_sec = 60;        // Idle sweep period (0 = off)
    uint32_t create_attempts = 3;            // Creation tries per acquire
};

struct ExecutionSettings {
    uint32_t code_timeout_sec = 30;          // arbitrary-code default
    uint32_t test_timeout_sec = 120;         // test-run default
    uint32_t max_timeout_sec = 600;          // Largest timeout a request may ask for
    size_t output_limit_bytes = 64 * 1024;   // Per stream
    size_t max_code_length = 50000;
    size_t max_input_length = 10000;
};

struct ConstraintSettings {
    uint64_t memory_mb = 512;
    double cpu_quota = 0.5;                  // Fraction of one CPU
    uint32_t max_pids = 100;
    bool network = false;
    uint64_t max_memory_mb = 4096;           // Largest memory a request may ask for
    double max_cpu_quota = 4.0;
    uint32_t pids_ceiling = 1024;            // Largest max_pids a request may ask for
};

struct SandpitConfig {
    std::string workspace_root = "/tmp/sandpit/workspaces";
    std::string runtime = "local";           // "local" or "docker"
    std::string image = "sandpit-python:latest";
    std::string interpreter = "python3";
    std::vector<std::string> allowed_interpreters = {"python3", "python", "node"};

    PoolSettings pool;
    ExecutionSettings execution;
    ConstraintSettings constraints;

    uint32_t retry_base_delay_ms = 1000;
    uint32_t retry_max_delay_ms = 60000;
    uint32_t retry_max_attempts = 3;

    bool enable_cgroups = true;
    bool enable_namespaces = true;

    std::string log_level = "info";
    std::string log_file;                    // Empty = console only
    std::string audit_file;                  // Empty = in-memory only
    size_t audit_max_entries = 10000;

    RetryPolicy retry_policy() const;

    // Problems found, one entry per offending key
    std::vector<std::string> validate() const;

    static SandpitConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    // Apply SANDPIT_* overrides; returns variables that failed to parse
    std::vector<std::string> apply_env();
};

// Load .env (cwd, parents, executable dir) without overriding existing variables
void load_dotenv();

// Defaults, then config_path (when non-empty), then the environment
Result<SandpitConfig> load_config(const std::string& config_path = "");

} // namespace sandpit::kernel
