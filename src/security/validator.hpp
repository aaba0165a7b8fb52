/**
 * Sandpit Security Validator
 *
 * Pure checks for paths, filenames, commands and free text before they
 * reach the filesystem or a sandboxed process. Nothing here throws for
 * hostile input: every check returns a ValidationOutcome and the caller
 * decides which typed error to raise.
 */
#pragma once
#include <string>
#include <vector>
#include <cstddef>

namespace sandpit::security {

// Why a value was rejected
enum class ValidationViolation {
    NONE,
    INVALID_INPUT,
    PATH_TRAVERSAL,
    COMMAND_INJECTION
};

inline const char* violation_to_string(ValidationViolation v) {
    switch (v) {
        case ValidationViolation::NONE:              return "NONE";
        case ValidationViolation::INVALID_INPUT:     return "INVALID_INPUT";
        case ValidationViolation::PATH_TRAVERSAL:    return "PATH_TRAVERSAL";
        case ValidationViolation::COMMAND_INJECTION: return "COMMAND_INJECTION";
        default: return "UNKNOWN";
    }
}

struct ValidationOutcome {
    bool valid = false;
    std::string value;      // Normalized value (only meaningful when valid)
    std::string reason;     // Rejection reason (only meaningful when invalid)
    ValidationViolation violation = ValidationViolation::NONE;

    explicit operator bool() const { return valid; }

    static ValidationOutcome accept(std::string value);
    static ValidationOutcome reject(ValidationViolation violation, std::string reason);
};

constexpr size_t MAX_USER_INPUT_LENGTH = 10000;
constexpr size_t MAX_CODE_LENGTH = 50000;
constexpr size_t MAX_FILENAME_LENGTH = 255;

enum class PathResolution {
    FILESYSTEM,   // Follow symlinks that exist on disk
    LEXICAL       // Normalize the text only; the root need not exist
};

// Resolve candidate against workspace_root; the result must stay inside it
ValidationOutcome validate_path(const std::string& candidate, const std::string& workspace_root,
                                PathResolution resolution = PathResolution::FILESYSTEM);

// Shell-string command: no chaining, substitution, pipes or destructive patterns
ValidationOutcome validate_command(const std::string& candidate);

// Argument-vector command (never passed through a shell)
ValidationOutcome validate_argv(const std::vector<std::string>& argv);

// Single path component
ValidationOutcome validate_filename(const std::string& candidate);

// Free text: bounded length, printable characters, valid UTF-8
ValidationOutcome validate_user_input(const std::string& candidate,
                                      size_t max_length = MAX_USER_INPUT_LENGTH);

// Best-effort cleanup; each result has been re-checked by its validate_* twin
ValidationOutcome sanitize_path(const std::string& candidate, const std::string& workspace_root);
ValidationOutcome sanitize_command(const std::string& candidate);
ValidationOutcome sanitize_filename(const std::string& candidate);
ValidationOutcome sanitize_user_input(const std::string& candidate,
                                      size_t max_length = MAX_USER_INPUT_LENGTH);

// Replace API keys, bearer tokens and passwords before logging
std::string mask_sensitive_data(const std::string& text);

// Split a command line into arguments, honoring single/double quotes and backslashes.
// Returns false on an unterminated quote.
bool split_command_line(const std::string& command, std::vector<std::string>& out);

} // namespace sandpit::security
