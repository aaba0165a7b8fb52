/**
 * Sandpit Error Taxonomy
 *
 * Closed set of failure kinds, each with a fixed details schema,
 * an optional remediation hint and a creation timestamp. Also the
 * retry policy consumed by explicit retry loops.
 */
#pragma once
#include <string>
#include <vector>
#include <memory>
#include <variant>
#include <optional>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "security/validator.hpp"

namespace sandpit::kernel {

enum class ErrorKind {
    CONFIGURATION,
    EXECUTION,
    API,
    SANDBOX,
    KNOWLEDGE_BASE,
    TOOL,
    INPUT_VALIDATION
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CONFIGURATION:    return "CONFIGURATION";
        case ErrorKind::EXECUTION:        return "EXECUTION";
        case ErrorKind::API:              return "API";
        case ErrorKind::SANDBOX:          return "SANDBOX";
        case ErrorKind::KNOWLEDGE_BASE:   return "KNOWLEDGE_BASE";
        case ErrorKind::TOOL:             return "TOOL";
        case ErrorKind::INPUT_VALIDATION: return "INPUT_VALIDATION";
        default: return "UNKNOWN";
    }
}

constexpr size_t ERROR_KIND_COUNT = 7;

class Error;

struct ConfigurationDetails {
    std::vector<std::string> missing_keys;
};

struct ExecutionDetails {
    std::optional<int> exit_code;
    std::string stdout_text;
    std::string stderr_text;
    bool timed_out = false;
    bool cancelled = false;
    bool output_truncated = false;
    std::string sandbox_id;
};

struct ApiDetails {
    std::string api_name;
    std::optional<int> status_code;   // Absent = network failure, no response
    std::string response;
};

struct SandboxDetails {
    std::string image;
    std::string sandbox_id;
    std::string operation;            // "create", "acquire", "exec", ...
    uint32_t attempts = 0;
};

struct KnowledgeBaseDetails {
    std::string path;
};

struct ToolDetails {
    std::string tool_name;
    std::string tool_input;
    std::shared_ptr<const Error> cause;
};

struct InputValidationDetails {
    security::ValidationViolation violation = security::ValidationViolation::INVALID_INPUT;
    std::string field;
    std::string value_excerpt;
};

// Variant order matches ErrorKind
using ErrorDetails = std::variant<ConfigurationDetails,
                                  ExecutionDetails,
                                  ApiDetails,
                                  SandboxDetails,
                                  KnowledgeBaseDetails,
                                  ToolDetails,
                                  InputValidationDetails>;

class Error {
public:
    Error(std::string message, ErrorDetails details, std::optional<std::string> hint = std::nullopt);

    // Factories fill in a default hint when none is given
    static Error configuration(std::string message,
                               std::vector<std::string> missing_keys = {},
                               std::optional<std::string> hint = std::nullopt);
    static Error execution(std::string message, ExecutionDetails details,
                           std::optional<std::string> hint = std::nullopt);
    static Error api(std::string message, std::string api_name,
                     std::optional<int> status_code, std::string response = "",
                     std::optional<std::string> hint = std::nullopt);
    static Error sandbox(std::string message, SandboxDetails details,
                         std::optional<std::string> hint = std::nullopt);
    static Error knowledge_base(std::string message, std::string path,
                                std::optional<std::string> hint = std::nullopt);
    static Error tool(std::string message, std::string tool_name, std::string tool_input,
                      std::optional<Error> cause = std::nullopt,
                      std::optional<std::string> hint = std::nullopt);
    static Error input_validation(security::ValidationViolation violation,
                                  std::string field, std::string message,
                                  const std::string& value = "");

    ErrorKind kind() const { return static_cast<ErrorKind>(details_.index()); }
    const std::string& message() const { return message_; }
    const ErrorDetails& details() const { return details_; }
    const std::optional<std::string>& hint() const { return hint_; }
    std::chrono::system_clock::time_point timestamp() const { return timestamp_; }

    template <typename T>
    const T* details_as() const { return std::get_if<T>(&details_); }

    // "ExecutionError", "PathTraversalError", ...
    std::string type_name() const;

    // Flat record: error_type, kind, message, details, hint, timestamp
    nlohmann::json to_record() const;

private:
    std::string message_;
    ErrorDetails details_;
    std::optional<std::string> hint_;
    std::chrono::system_clock::time_point timestamp_;
};

// Value or typed error
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    T& value() { return std::get<T>(data_); }
    const T& value() const { return std::get<T>(data_); }
    const Error& error() const { return std::get<Error>(data_); }

private:
    std::variant<T, Error> data_;
};

// Backoff configuration
struct RetryPolicy {
    std::chrono::milliseconds base_delay{1000};   // One backoff unit
    std::chrono::milliseconds max_delay{60000};   // Ceiling
    uint32_t max_attempts = 3;                    // Total tries, first included
};

bool should_retry(const Error& error);

// base_delay * 2^attempt, capped at max_delay
std::chrono::milliseconds get_retry_delay(uint32_t attempt, const RetryPolicy& policy = {});

// "ErrorType: message" plus a "Solution:" line when a hint exists
std::string format_error_message(const Error& error);

nlohmann::json to_record(const Error& error);

// ISO 8601 UTC with milliseconds
std::string format_timestamp(std::chrono::system_clock::time_point tp);

} // namespace sandpit::kernel
