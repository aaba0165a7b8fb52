/**
 * Sandpit Audit Log
 *
 * Structured record sink for typed errors, execution attempts,
 * validation rejections and sandbox lifecycle events. Keeps a bounded
 * in-memory history and optionally appends every entry to a JSONL file.
 */
#pragma once
#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <chrono>
#include <fstream>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "kernel/errors.hpp"

namespace sandpit::kernel {

// Audit event categories
enum class AuditCategory {
    SECURITY,         // Validation rejections
    EXECUTION,        // Every execution attempt
    SANDBOX,          // Create, reuse, release, destroy
    ERROR,            // Typed errors
    RESOURCE          // Resource usage samples
};

inline std::string audit_category_to_string(AuditCategory cat) {
    switch (cat) {
        case AuditCategory::SECURITY:  return "SECURITY";
        case AuditCategory::EXECUTION: return "EXECUTION";
        case AuditCategory::SANDBOX:   return "SANDBOX";
        case AuditCategory::ERROR:     return "ERROR";
        case AuditCategory::RESOURCE:  return "RESOURCE";
        default: return "UNKNOWN";
    }
}

inline std::optional<AuditCategory> audit_category_from_string(const std::string& str) {
    if (str == "SECURITY")  return AuditCategory::SECURITY;
    if (str == "EXECUTION") return AuditCategory::EXECUTION;
    if (str == "SANDBOX")   return AuditCategory::SANDBOX;
    if (str == "ERROR")     return AuditCategory::ERROR;
    if (str == "RESOURCE")  return AuditCategory::RESOURCE;
    return std::nullopt;
}

struct AuditLogEntry {
    uint64_t id;                              // Unique entry ID
    std::chrono::system_clock::time_point timestamp;
    AuditCategory category;
    std::string event_type;                   // e.g. "EXECUTE", "PATH_TRAVERSAL"
    std::string subject;                      // Request or sandbox id
    nlohmann::json details;
    bool success;

    nlohmann::json to_json() const;
    std::string to_jsonl() const;
};

struct AuditConfig {
    size_t max_entries = 10000;               // Max entries in memory
    std::string file_path;                    // JSONL mirror (empty = none)
    bool log_security = true;
    bool log_execution = true;
    bool log_sandbox = true;
    bool log_errors = true;
    bool log_resource = true;

    bool is_enabled(AuditCategory cat) const;
};

class AuditLogger {
public:
    AuditLogger();
    explicit AuditLogger(const AuditConfig& config);
    ~AuditLogger() = default;

    // Non-copyable
    AuditLogger(const AuditLogger&) = delete;
    AuditLogger& operator=(const AuditLogger&) = delete;

    void log(AuditCategory category,
             const std::string& event_type,
             const std::string& subject,
             const nlohmann::json& details,
             bool success = true);

    // Record a typed error (details = to_record())
    void log_error(const Error& error, const std::string& subject);
    void log_security(const std::string& event_type, const std::string& subject,
                      const nlohmann::json& details);
    void log_execution(const std::string& subject, const nlohmann::json& details, bool success);
    void log_sandbox(const std::string& event_type, const std::string& sandbox_id,
                     const nlohmann::json& details);

    std::vector<AuditLogEntry> get_entries(
        std::optional<AuditCategory> category = std::nullopt,
        const std::string& subject = "",      // Empty = all
        uint64_t since_id = 0,                // Entries after this ID
        size_t limit = 100
    ) const;

    std::string export_jsonl(size_t limit = 0) const;  // 0 = all entries

    void set_config(const AuditConfig& config);
    AuditConfig get_config() const;

    void clear();

    size_t entry_count() const;
    uint64_t last_entry_id() const;

private:
    AuditConfig config_;
    std::deque<AuditLogEntry> entries_;
    std::ofstream file_;
    mutable std::mutex mutex_;
    uint64_t next_id_ = 1;

    void open_file();
    void trim_entries();
};

} // namespace sandpit::kernel
