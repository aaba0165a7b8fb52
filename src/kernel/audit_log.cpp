#include "kernel/audit_log.hpp"
#include "security/validator.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <sstream>

namespace sandpit::kernel {

using json = nlohmann::json;

// ============================================================================
// AuditLogEntry Implementation
// ============================================================================

json AuditLogEntry::to_json() const {
    json j;
    j["id"] = id;
    j["timestamp"] = format_timestamp(timestamp);
    j["category"] = audit_category_to_string(category);
    j["event_type"] = event_type;
    if (!subject.empty()) {
        j["subject"] = subject;
    }
    j["success"] = success;
    j["details"] = details;
    return j;
}

std::string AuditLogEntry::to_jsonl() const {
    return to_json().dump() + "\n";
}

// ============================================================================
// AuditConfig Implementation
// ============================================================================

bool AuditConfig::is_enabled(AuditCategory cat) const {
    switch (cat) {
        case AuditCategory::SECURITY:  return log_security;
        case AuditCategory::EXECUTION: return log_execution;
        case AuditCategory::SANDBOX:   return log_sandbox;
        case AuditCategory::ERROR:     return log_errors;
        case AuditCategory::RESOURCE:  return log_resource;
        default: return false;
    }
}

// ============================================================================
// AuditLogger Implementation
// ============================================================================

AuditLogger::AuditLogger() : config_() {
    spdlog::debug("AuditLogger initialized with default config");
}

AuditLogger::AuditLogger(const AuditConfig& config) : config_(config) {
    open_file();
    spdlog::debug("AuditLogger initialized (max_entries={})", config_.max_entries);
}

void AuditLogger::open_file() {
    // Caller must hold the mutex (or be the constructor)
    if (file_.is_open()) {
        file_.close();
    }
    if (config_.file_path.empty()) {
        return;
    }

    std::error_code ec;
    auto parent = std::filesystem::path(config_.file_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }
    file_.open(config_.file_path, std::ios::app);
    if (!file_.is_open()) {
        spdlog::warn("Cannot open audit file {}; keeping entries in memory only", config_.file_path);
    }
}

void AuditLogger::log(AuditCategory category,
                      const std::string& event_type,
                      const std::string& subject,
                      const json& details,
                      bool success) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!config_.is_enabled(category)) {
        return;
    }

    AuditLogEntry entry;
    entry.id = next_id_++;
    entry.timestamp = std::chrono::system_clock::now();
    entry.category = category;
    entry.event_type = event_type;
    entry.subject = subject;
    entry.details = details;
    entry.success = success;

    if (file_.is_open()) {
        file_ << security::mask_sensitive_data(entry.to_jsonl());
        file_.flush();
    }

    entries_.push_back(std::move(entry));
    trim_entries();

    spdlog::trace("Audit[{}]: {} subject={} success={}",
                  audit_category_to_string(category), event_type, subject, success);
}

void AuditLogger::log_error(const Error& error, const std::string& subject) {
    log(AuditCategory::ERROR, error.type_name(), subject, error.to_record(), false);
}

void AuditLogger::log_security(const std::string& event_type,
                               const std::string& subject,
                               const json& details) {
    log(AuditCategory::SECURITY, event_type, subject, details, false);
}

void AuditLogger::log_execution(const std::string& subject, const json& details, bool success) {
    log(AuditCategory::EXECUTION, "EXECUTE", subject, details, success);
}

void AuditLogger::log_sandbox(const std::string& event_type,
                              const std::string& sandbox_id,
                              const json& details) {
    log(AuditCategory::SANDBOX, event_type, sandbox_id, details, true);
}

std::vector<AuditLogEntry> AuditLogger::get_entries(
    std::optional<AuditCategory> category,
    const std::string& subject,
    uint64_t since_id,
    size_t limit) const {

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AuditLogEntry> result;

    for (auto it = entries_.rbegin(); it != entries_.rend() && result.size() < limit; ++it) {
        const auto& entry = *it;
        if (entry.id <= since_id) {
            continue;
        }
        if (category && entry.category != *category) {
            continue;
        }
        if (!subject.empty() && entry.subject != subject) {
            continue;
        }
        result.push_back(entry);
    }

    // Chronological order
    std::reverse(result.begin(), result.end());
    return result;
}

std::string AuditLogger::export_jsonl(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;

    size_t count = 0;
    for (const auto& entry : entries_) {
        if (limit > 0 && count >= limit) {
            break;
        }
        oss << entry.to_jsonl();
        count++;
    }
    return oss.str();
}

void AuditLogger::set_config(const AuditConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool reopen = config.file_path != config_.file_path;
    config_ = config;
    if (reopen) {
        open_file();
    }
    trim_entries();
    spdlog::debug("AuditLogger config updated (max_entries={})", config_.max_entries);
}

AuditConfig AuditLogger::get_config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void AuditLogger::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    spdlog::debug("AuditLogger cleared");
}

size_t AuditLogger::entry_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

uint64_t AuditLogger::last_entry_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_id_ - 1;
}

void AuditLogger::trim_entries() {
    // Caller must hold the mutex
    while (entries_.size() > config_.max_entries) {
        entries_.pop_front();
    }
}

} // namespace sandpit::kernel
