#include "kernel/errors.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace sandpit::kernel {

using json = nlohmann::json;

namespace {

std::string execution_hint(const ExecutionDetails& d) {
    if (d.timed_out || (d.exit_code && *d.exit_code == 124)) {
        return "Execution timed out. Check for infinite loops or raise the timeout.";
    }
    if (d.cancelled) {
        return "Execution was cancelled before it finished.";
    }
    if (d.stderr_text.find("SyntaxError") != std::string::npos) {
        return "Check the code for syntax errors (missing colons, parentheses or quotes).";
    }
    if (d.stderr_text.find("ModuleNotFoundError") != std::string::npos ||
        d.stderr_text.find("ImportError") != std::string::npos) {
        return "A required module is missing from the sandbox image. Add it to the image.";
    }
    if (d.stderr_text.find("MemoryError") != std::string::npos ||
        (d.exit_code && *d.exit_code == 137)) {
        return "The process ran out of memory. Reduce memory usage or raise the memory limit.";
    }
    if (d.output_truncated) {
        return "Output exceeded the capture limit. Reduce payload size or output volume.";
    }
    return "Review the error output above and fix the code.";
}

std::string api_hint(const ApiDetails& d) {
    if (!d.status_code) {
        return "Check network connectivity to " + d.api_name + ".";
    }
    switch (*d.status_code) {
        case 401: return "Check that the " + d.api_name + " credential is set and valid.";
        case 403: return "The " + d.api_name + " credential lacks permission for this operation.";
        case 404: return "The requested " + d.api_name + " endpoint or resource does not exist.";
        case 429: return "Rate limit exceeded. Wait before retrying.";
        case 500:
        case 502:
        case 503:
        case 504: return d.api_name + " is unavailable. Try again later.";
        default:  return "Check the " + d.api_name + " response for details.";
    }
}

std::string sandbox_hint(const SandboxDetails& d) {
    if (d.operation == "acquire") {
        return "All sandboxes are busy. Retry later or raise the pool size.";
    }
    if (!d.image.empty()) {
        return "Check that the container runtime is running and the image '" + d.image + "' exists.";
    }
    return "Check that the container runtime is running.";
}

std::string type_name_for_violation(security::ValidationViolation v) {
    switch (v) {
        case security::ValidationViolation::PATH_TRAVERSAL:    return "PathTraversalError";
        case security::ValidationViolation::COMMAND_INJECTION: return "CommandInjectionError";
        default: return "InputValidationError";
    }
}

json details_to_json(const ErrorDetails& details) {
    json j = json::object();
    if (auto* d = std::get_if<ConfigurationDetails>(&details)) {
        j["missing_keys"] = d->missing_keys;
    } else if (auto* d = std::get_if<ExecutionDetails>(&details)) {
        j["exit_code"] = d->exit_code ? json(*d->exit_code) : json(nullptr);
        j["stdout"] = d->stdout_text;
        j["stderr"] = d->stderr_text;
        j["timed_out"] = d->timed_out;
        j["cancelled"] = d->cancelled;
        j["output_truncated"] = d->output_truncated;
        if (!d->sandbox_id.empty()) j["sandbox_id"] = d->sandbox_id;
    } else if (auto* d = std::get_if<ApiDetails>(&details)) {
        j["api_name"] = d->api_name;
        j["status_code"] = d->status_code ? json(*d->status_code) : json(nullptr);
        j["response"] = d->response;
    } else if (auto* d = std::get_if<SandboxDetails>(&details)) {
        j["image"] = d->image;
        j["sandbox_id"] = d->sandbox_id;
        j["operation"] = d->operation;
        j["attempts"] = d->attempts;
    } else if (auto* d = std::get_if<KnowledgeBaseDetails>(&details)) {
        j["path"] = d->path;
    } else if (auto* d = std::get_if<ToolDetails>(&details)) {
        j["tool_name"] = d->tool_name;
        j["tool_input"] = d->tool_input;
        if (d->cause) j["cause"] = d->cause->to_record();
    } else if (auto* d = std::get_if<InputValidationDetails>(&details)) {
        j["violation"] = security::violation_to_string(d->violation);
        j["field"] = d->field;
        j["value"] = d->value_excerpt;
    }
    return j;
}

} // namespace

// ============================================================================
// Error Implementation
// ============================================================================

Error::Error(std::string message, ErrorDetails details, std::optional<std::string> hint)
    : message_(std::move(message)),
      details_(std::move(details)),
      hint_(std::move(hint)),
      timestamp_(std::chrono::system_clock::now()) {}

Error Error::configuration(std::string message,
                           std::vector<std::string> missing_keys,
                           std::optional<std::string> hint) {
    if (!hint) {
        if (missing_keys.empty()) {
            hint = "Check the configuration file and SANDPIT_* environment variables.";
        } else {
            std::string keys;
            for (const auto& k : missing_keys) {
                if (!keys.empty()) keys += ", ";
                keys += k;
            }
            hint = "Set the missing or invalid settings: " + keys + ".";
        }
    }
    return Error(std::move(message), ConfigurationDetails{std::move(missing_keys)}, std::move(hint));
}

Error Error::execution(std::string message, ExecutionDetails details,
                       std::optional<std::string> hint) {
    if (!hint) hint = execution_hint(details);
    return Error(std::move(message), std::move(details), std::move(hint));
}

Error Error::api(std::string message, std::string api_name,
                 std::optional<int> status_code, std::string response,
                 std::optional<std::string> hint) {
    ApiDetails details{std::move(api_name), status_code, std::move(response)};
    if (!hint) hint = api_hint(details);
    return Error(std::move(message), std::move(details), std::move(hint));
}

Error Error::sandbox(std::string message, SandboxDetails details,
                     std::optional<std::string> hint) {
    if (!hint) hint = sandbox_hint(details);
    return Error(std::move(message), std::move(details), std::move(hint));
}

Error Error::knowledge_base(std::string message, std::string path,
                            std::optional<std::string> hint) {
    if (!hint) hint = "Add documents to the knowledge base at '" + path + "'.";
    return Error(std::move(message), KnowledgeBaseDetails{std::move(path)}, std::move(hint));
}

Error Error::tool(std::string message, std::string tool_name, std::string tool_input,
                  std::optional<Error> cause, std::optional<std::string> hint) {
    ToolDetails details;
    details.tool_name = std::move(tool_name);
    details.tool_input = std::move(tool_input);
    if (cause) {
        if (!hint) hint = cause->hint();
        details.cause = std::make_shared<const Error>(std::move(*cause));
    }
    return Error(std::move(message), std::move(details), std::move(hint));
}

Error Error::input_validation(security::ValidationViolation violation,
                              std::string field, std::string message,
                              const std::string& value) {
    InputValidationDetails details;
    details.violation = violation;
    details.field = field;
    details.value_excerpt = security::mask_sensitive_data(value.substr(0, 100));

    std::string hint;
    switch (violation) {
        case security::ValidationViolation::PATH_TRAVERSAL:
            hint = "Use a path relative to the workspace without '..' components.";
            break;
        case security::ValidationViolation::COMMAND_INJECTION:
            hint = "Pass a single command without chaining, pipes, redirection or substitution.";
            break;
        default:
            hint = "Correct the '" + field + "' field (reduce payload size or remove control characters).";
            break;
    }
    return Error(field + ": " + message, std::move(details), std::move(hint));
}

std::string Error::type_name() const {
    switch (kind()) {
        case ErrorKind::CONFIGURATION:  return "ConfigurationError";
        case ErrorKind::EXECUTION:      return "ExecutionError";
        case ErrorKind::API:            return "APIError";
        case ErrorKind::SANDBOX:        return "SandboxError";
        case ErrorKind::KNOWLEDGE_BASE: return "KnowledgeBaseError";
        case ErrorKind::TOOL:           return "ToolError";
        case ErrorKind::INPUT_VALIDATION:
            return type_name_for_violation(std::get<InputValidationDetails>(details_).violation);
        default: return "Error";
    }
}

json Error::to_record() const {
    json j;
    j["error_type"] = type_name();
    j["kind"] = error_kind_to_string(kind());
    j["message"] = message_;
    j["details"] = details_to_json(details_);
    j["hint"] = hint_ ? json(*hint_) : json(nullptr);
    j["timestamp"] = format_timestamp(timestamp_);
    return j;
}

// ============================================================================
// Retry Policy
// ============================================================================

bool should_retry(const Error& error) {
    switch (error.kind()) {
        case ErrorKind::API: {
            const auto* d = error.details_as<ApiDetails>();
            if (!d->status_code) {
                return true;  // Network error
            }
            return *d->status_code == 429 || *d->status_code == 503;
        }
        case ErrorKind::SANDBOX:
            return true;
        case ErrorKind::TOOL: {
            const auto* d = error.details_as<ToolDetails>();
            return d->cause && should_retry(*d->cause);
        }
        case ErrorKind::CONFIGURATION:
        case ErrorKind::EXECUTION:
        case ErrorKind::KNOWLEDGE_BASE:
        case ErrorKind::INPUT_VALIDATION:
        default:
            return false;
    }
}

std::chrono::milliseconds get_retry_delay(uint32_t attempt, const RetryPolicy& policy) {
    // Past 2^30 the cap always wins
    uint32_t shift = std::min<uint32_t>(attempt, 30);
    auto base = policy.base_delay.count();
    auto cap = policy.max_delay.count();
    if (base <= 0) return std::chrono::milliseconds(0);

    int64_t factor = int64_t(1) << shift;
    if (base > cap / factor) {
        return policy.max_delay;
    }
    return std::chrono::milliseconds(std::min<int64_t>(base * factor, cap));
}

std::string format_error_message(const Error& error) {
    std::string out = error.type_name() + ": " + error.message();
    if (error.hint() && !error.hint()->empty()) {
        out += "\nSolution: " + *error.hint();
    }
    return out;
}

json to_record(const Error& error) {
    return error.to_record();
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    std::tm tm_utc{};
    gmtime_r(&time_t, &tm_utc);
    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

} // namespace sandpit::kernel
