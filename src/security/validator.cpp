#include "security/validator.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <optional>
#include <regex>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace sandpit::security {

namespace {

// Commands that must never run, even as part of an argument vector
const std::vector<std::regex>& destructive_patterns() {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(--no-preserve-root)"),
        std::regex(R"((^|\s)sudo(\s|$))"),
        std::regex(R"((^|\s)su(\s|$))"),
        std::regex(R"(\bchmod\s+(-[a-z]+\s+)*0?777\b)", std::regex::icase),
        std::regex(R"(\bmkfs(\.\w+)?\b)"),
        std::regex(R"(\bdd\s+.*\bof=/dev/)"),
        std::regex(R"(>\s*/dev/(sd|nvme|hd|vd|mem|kmem))"),
        std::regex(R"(/etc/(passwd|shadow|sudoers))"),
        std::regex(R"(:\(\)\s*\{\s*:\s*\|\s*:\s*&\s*\}\s*;\s*:)"),
        std::regex(R"(\b(curl|wget)\b.*\|\s*(ba|z|da)?sh\b)"),
    };
    return patterns;
}

const std::vector<std::string> BLOCKED_BINARIES = {
    "sudo", "su", "doas", "mkfs", "shutdown", "reboot", "halt", "poweroff", "init"
};

const char* const SHELL_METACHARACTERS[] = {
    ";", "&&", "||", "|", "&", "`", "$(", "${", ">", "<", "\n", "\r"
};

const std::vector<std::string> RESERVED_DEVICE_NAMES = {
    "CON", "PRN", "AUX", "NUL",
    "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
    "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"
};

bool is_control(unsigned char c, bool allow_whitespace) {
    if (allow_whitespace && (c == '\t' || c == '\n' || c == '\r')) {
        return false;
    }
    return c < 0x20 || c == 0x7f;
}

bool has_control_chars(const std::string& s, bool allow_whitespace) {
    return std::any_of(s.begin(), s.end(), [&](char c) {
        return is_control(static_cast<unsigned char>(c), allow_whitespace);
    });
}

bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        size_t len;
        if (c < 0x80) len = 1;
        else if ((c & 0xE0) == 0xC0 && c >= 0xC2) len = 2;
        else if ((c & 0xF0) == 0xE0) len = 3;
        else if ((c & 0xF8) == 0xF0 && c <= 0xF4) len = 4;
        else return false;

        if (i + len > s.size()) return false;
        for (size_t k = 1; k < len; k++) {
            if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return false;
        }
        i += len;
    }
    return true;
}

// Number of code points (assumes valid UTF-8)
size_t utf8_length(const std::string& s) {
    return std::count_if(s.begin(), s.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    });
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string excerpt(const std::string& s) {
    constexpr size_t MAX_EXCERPT = 80;
    return s.size() > MAX_EXCERPT ? s.substr(0, MAX_EXCERPT) + "..." : s;
}

bool is_within(const fs::path& p, const fs::path& root) {
    auto c = p.begin();
    for (auto r = root.begin(); r != root.end(); ++r) {
        if (r->empty()) continue;
        if (c == p.end() || *c != *r) return false;
        ++c;
    }
    return true;
}

// Quotes and grouping around a word: 'rm', "/", $(rm, /)
std::string strip_wrapping(const std::string& word) {
    const char* wrap = "'\"()`{}$";
    size_t start = word.find_first_not_of(wrap);
    if (start == std::string::npos) return "";
    size_t end = word.find_last_not_of(wrap);
    return word.substr(start, end - start + 1);
}

bool is_rm_word(const std::string& word) {
    if (word.size() < 2 || word.compare(word.size() - 2, 2, "rm") != 0) return false;
    if (word.size() == 2) return true;
    unsigned char before = static_cast<unsigned char>(word[word.size() - 3]);
    return !std::isalnum(before) && before != '_' && before != '-' && before != '.';
}

// True when deleting target removes the root, the home directory or the
// whole working directory: "/", "//", "/.", "~/", "./", "../", "*", "/*", ...
bool is_root_like(const std::string& word) {
    std::string target = strip_wrapping(word);
    if (target.empty()) return false;
    if (target[0] == '~') {
        target = "/" + target.substr(1);
    } else if (word.find("$HOME") != std::string::npos || word.find("${HOME}") != std::string::npos) {
        size_t end = target.find('/');
        target = end == std::string::npos ? "/" : target.substr(end);
    }

    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos <= target.size()) {
        size_t slash = target.find('/', pos);
        if (slash == std::string::npos) slash = target.size();
        parts.push_back(target.substr(pos, slash - pos));
        pos = slash + 1;
    }
    while (!parts.empty() && (parts.back().empty() || parts.back() == "*" || parts.back() == ".")) {
        parts.pop_back();
    }

    int depth = 0;
    for (const auto& part : parts) {
        if (part.empty() || part == ".") continue;
        if (part == "..") {
            if (depth > 0) depth--;
            continue;
        }
        depth++;
    }
    return depth == 0;
}

// rm with -r/-R/--recursive in any position aimed at a root-like target
std::optional<std::string> find_recursive_delete(const std::string& command) {
    std::string spaced;
    for (char c : command) {
        if (c == ';' || c == '|' || c == '&') {
            spaced += ' ';
            spaced += c;
            spaced += ' ';
        } else if (c == '\n') {
            spaced += " ; ";
        } else {
            spaced += c;
        }
    }

    std::vector<std::string> words;
    std::istringstream iss(spaced);
    for (std::string w; iss >> w;) words.push_back(w);

    for (size_t i = 0; i < words.size(); i++) {
        std::string head = words[i];
        while (!head.empty() && std::strchr("'\")`}", head.back())) head.pop_back();
        if (!is_rm_word(head)) continue;

        bool recursive = false;
        bool options_done = false;
        std::vector<std::string> targets;
        size_t j = i + 1;
        for (; j < words.size(); j++) {
            const std::string& w = words[j];
            if (w == ";" || w == "|" || w == "&") break;
            std::string bare = strip_wrapping(w);
            if (!options_done && bare == "--") {
                options_done = true;
            } else if (!options_done && bare.rfind("--", 0) == 0) {
                if (bare == "--recursive") recursive = true;
            } else if (!options_done && bare.size() > 1 && bare[0] == '-') {
                if (bare.find_first_of("rR") != std::string::npos) recursive = true;
            } else {
                targets.push_back(w);
            }
        }
        if (!recursive) continue;
        for (const auto& target : targets) {
            if (is_root_like(target)) {
                return "rm -r " + strip_wrapping(target);
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> find_destructive(const std::string& command) {
    if (auto hit = find_recursive_delete(command)) {
        return hit;
    }
    for (const auto& pattern : destructive_patterns()) {
        std::smatch m;
        if (std::regex_search(command, m, pattern)) {
            return trim(m.str());
        }
    }
    return std::nullopt;
}

} // namespace

// ============================================================================
// ValidationOutcome
// ============================================================================

ValidationOutcome ValidationOutcome::accept(std::string value) {
    ValidationOutcome out;
    out.valid = true;
    out.value = std::move(value);
    return out;
}

ValidationOutcome ValidationOutcome::reject(ValidationViolation violation, std::string reason) {
    ValidationOutcome out;
    out.valid = false;
    out.violation = violation;
    out.reason = std::move(reason);
    return out;
}

// ============================================================================
// Validators
// ============================================================================

ValidationOutcome validate_path(const std::string& candidate, const std::string& workspace_root,
                                PathResolution resolution) {
    if (candidate.empty()) {
        return ValidationOutcome::reject(ValidationViolation::INVALID_INPUT, "path is empty");
    }
    if (workspace_root.empty()) {
        return ValidationOutcome::reject(ValidationViolation::INVALID_INPUT,
                                         "workspace root is not configured");
    }
    if (candidate.find('\0') != std::string::npos) {
        return ValidationOutcome::reject(ValidationViolation::PATH_TRAVERSAL,
                                         "path contains a null byte");
    }
    if (has_control_chars(candidate, false)) {
        return ValidationOutcome::reject(ValidationViolation::INVALID_INPUT,
                                         "path contains control characters");
    }

    const bool lexical = resolution == PathResolution::LEXICAL;
    std::error_code ec;
    fs::path root = fs::absolute(workspace_root, ec);
    if (!ec) root = lexical ? root.lexically_normal() : fs::weakly_canonical(root, ec);
    if (ec) {
        return ValidationOutcome::reject(ValidationViolation::INVALID_INPUT,
                                         "cannot resolve workspace root: " + ec.message());
    }

    fs::path cand(candidate);
    fs::path full = cand.is_absolute() ? cand : root / cand;
    fs::path resolved = lexical ? full.lexically_normal() : fs::weakly_canonical(full, ec);
    if (ec) {
        return ValidationOutcome::reject(ValidationViolation::INVALID_INPUT,
                                         "cannot resolve path: " + ec.message());
    }
    // "dir/" names the directory itself
    if (resolved.filename().empty() && resolved.has_parent_path() && resolved != resolved.root_path()) {
        resolved = resolved.parent_path();
    }
    if (root.filename().empty() && root.has_parent_path() && root != root.root_path()) {
        root = root.parent_path();
    }

    if (!is_within(resolved, root)) {
        return ValidationOutcome::reject(ValidationViolation::PATH_TRAVERSAL,
                                         "path escapes the workspace: " + excerpt(candidate));
    }
    return ValidationOutcome::accept(resolved.string());
}

ValidationOutcome validate_command(const std::string& candidate) {
    std::string command = trim(candidate);
    if (command.empty()) {
        return ValidationOutcome::reject(ValidationViolation::INVALID_INPUT, "command is empty");
    }
    if (command.find('\0') != std::string::npos) {
        return ValidationOutcome::reject(ValidationViolation::COMMAND_INJECTION,
                                         "command contains a null byte");
    }
    if (auto hit = find_destructive(command)) {
        return ValidationOutcome::reject(ValidationViolation::COMMAND_INJECTION,
                                         "dangerous command pattern: " + *hit);
    }
    for (const char* meta : SHELL_METACHARACTERS) {
        if (command.find(meta) != std::string::npos) {
            std::string shown = meta[0] == '\n' ? "\\n" : meta[0] == '\r' ? "\\r" : meta;
            return ValidationOutcome::reject(ValidationViolation::COMMAND_INJECTION,
                                             "shell metacharacter '" + shown + "' not allowed");
        }
    }
    if (has_control_chars(command, true)) {
        return ValidationOutcome::reject(ValidationViolation::COMMAND_INJECTION,
                                         "command contains control characters");
    }
    return ValidationOutcome::accept(command);
}

ValidationOutcome validate_argv(const std::vector<std::string>& argv) {
    if (argv.empty() || argv[0].empty()) {
        return ValidationOutcome::reject(ValidationViolation::INVALID_INPUT,
                                         "argument vector is empty");
    }

    std::string joined;
    for (size_t i = 0; i < argv.size(); i++) {
        const auto& arg = argv[i];
        if (arg.find('\0') != std::string::npos) {
            return ValidationOutcome::reject(ValidationViolation::COMMAND_INJECTION,
                                             "argument " + std::to_string(i) + " contains a null byte");
        }
        // Code passed with -c may span lines; the program name may not
        if (has_control_chars(arg, i > 0)) {
            return ValidationOutcome::reject(ValidationViolation::COMMAND_INJECTION,
                                             "argument " + std::to_string(i) + " contains control characters");
        }
        if (i > 0) joined += ' ';
        joined += arg;
    }

    std::string program = fs::path(argv[0]).filename().string();
    for (const auto& blocked : BLOCKED_BINARIES) {
        if (program == blocked || program.rfind(blocked + ".", 0) == 0) {
            return ValidationOutcome::reject(ValidationViolation::COMMAND_INJECTION,
                                             "program not allowed: " + program);
        }
    }
    if (auto hit = find_destructive(joined)) {
        return ValidationOutcome::reject(ValidationViolation::COMMAND_INJECTION,
                                         "dangerous command pattern: " + *hit);
    }
    return ValidationOutcome::accept(joined);
}

ValidationOutcome validate_filename(const std::string& candidate) {
    if (candidate.empty()) {
        return ValidationOutcome::reject(ValidationViolation::INVALID_INPUT, "filename is empty");
    }
    if (candidate.size() > MAX_FILENAME_LENGTH) {
        return ValidationOutcome::reject(ValidationViolation::INVALID_INPUT,
                                         "filename longer than 255 bytes");
    }
    if (candidate.find('/') != std::string::npos || candidate.find('\\') != std::string::npos) {
        return ValidationOutcome::reject(ValidationViolation::PATH_TRAVERSAL,
                                         "filename contains a path separator");
    }
    if (candidate == "." || candidate == "..") {
        return ValidationOutcome::reject(ValidationViolation::PATH_TRAVERSAL,
                                         "filename refers to a directory");
    }
    if (candidate[0] == '.') {
        return ValidationOutcome::reject(ValidationViolation::INVALID_INPUT,
                                         "hidden filenames are not allowed");
    }
    if (has_control_chars(candidate, false)) {
        return ValidationOutcome::reject(ValidationViolation::INVALID_INPUT,
                                         "filename contains control characters");
    }
    if (candidate.find_first_of("<>:\"|?*") != std::string::npos) {
        return ValidationOutcome::reject(ValidationViolation::INVALID_INPUT,
                                         "filename contains a reserved character");
    }

    std::string stem = to_upper(candidate.substr(0, candidate.find('.')));
    if (std::find(RESERVED_DEVICE_NAMES.begin(), RESERVED_DEVICE_NAMES.end(), stem)
            != RESERVED_DEVICE_NAMES.end()) {
        return ValidationOutcome::reject(ValidationViolation::INVALID_INPUT,
                                         "reserved device name: " + candidate);
    }
    return ValidationOutcome::accept(candidate);
}

ValidationOutcome validate_user_input(const std::string& candidate, size_t max_length) {
    if (trim(candidate).empty()) {
        return ValidationOutcome::reject(ValidationViolation::INVALID_INPUT, "input is empty");
    }
    if (candidate.find('\0') != std::string::npos) {
        return ValidationOutcome::reject(ValidationViolation::INVALID_INPUT,
                                         "input contains a null byte");
    }
    if (has_control_chars(candidate, true)) {
        return ValidationOutcome::reject(ValidationViolation::INVALID_INPUT,
                                         "input contains control characters");
    }
    if (!is_valid_utf8(candidate)) {
        return ValidationOutcome::reject(ValidationViolation::INVALID_INPUT,
                                         "input is not valid UTF-8");
    }
    if (utf8_length(candidate) > max_length) {
        return ValidationOutcome::reject(ValidationViolation::INVALID_INPUT,
                                         "input exceeds " + std::to_string(max_length) + " characters");
    }
    return ValidationOutcome::accept(candidate);
}

// ============================================================================
// Sanitizers
// ============================================================================

ValidationOutcome sanitize_path(const std::string& candidate, const std::string& workspace_root) {
    std::string cleaned;
    for (char c : candidate) {
        if (is_control(static_cast<unsigned char>(c), false)) continue;
        cleaned += (c == '\\') ? '/' : c;
    }

    // Keep only forward components; drop ".", ".." and the root
    fs::path rebuilt;
    for (const auto& part : fs::path(cleaned).relative_path()) {
        if (part.empty() || part == "." || part == "..") continue;
        rebuilt /= part;
    }
    if (rebuilt.empty()) rebuilt = ".";
    return validate_path(rebuilt.string(), workspace_root);
}

ValidationOutcome sanitize_command(const std::string& candidate) {
    std::string cleaned;
    for (char c : candidate) {
        if (is_control(static_cast<unsigned char>(c), false)) {
            cleaned += ' ';
            continue;
        }
        cleaned += c;
    }
    return validate_command(trim(cleaned));
}

ValidationOutcome sanitize_filename(const std::string& candidate) {
    std::string cleaned;
    for (char c : candidate) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (c == '/' || c == '\\') {
            cleaned += '_';
        } else if (is_control(uc, false) || std::string("<>:\"|?*").find(c) != std::string::npos) {
            continue;
        } else {
            cleaned += c;
        }
    }

    size_t first = cleaned.find_first_not_of(". ");
    cleaned = first == std::string::npos ? "" : cleaned.substr(first);
    if (cleaned.size() > MAX_FILENAME_LENGTH) {
        cleaned.resize(MAX_FILENAME_LENGTH);
    }

    std::string stem = to_upper(cleaned.substr(0, cleaned.find('.')));
    if (std::find(RESERVED_DEVICE_NAMES.begin(), RESERVED_DEVICE_NAMES.end(), stem)
            != RESERVED_DEVICE_NAMES.end()) {
        cleaned = "_" + cleaned;
        if (cleaned.size() > MAX_FILENAME_LENGTH) cleaned.resize(MAX_FILENAME_LENGTH);
    }
    return validate_filename(cleaned);
}

ValidationOutcome sanitize_user_input(const std::string& candidate, size_t max_length) {
    std::string cleaned;
    size_t i = 0;
    while (i < candidate.size()) {
        unsigned char c = static_cast<unsigned char>(candidate[i]);
        if (c < 0x80) {
            if (!is_control(c, true)) cleaned += static_cast<char>(c);
            i++;
            continue;
        }
        // Keep well-formed multi-byte sequences, drop stray bytes
        size_t len = (c & 0xE0) == 0xC0 ? 2 : (c & 0xF0) == 0xE0 ? 3 : (c & 0xF8) == 0xF0 ? 4 : 0;
        std::string seq = len && i + len <= candidate.size() ? candidate.substr(i, len) : "";
        if (!seq.empty() && is_valid_utf8(seq)) {
            cleaned += seq;
            i += len;
        } else {
            i++;
        }
    }

    cleaned = trim(cleaned);

    // Truncate on a code point boundary
    size_t points = 0;
    for (size_t pos = 0; pos < cleaned.size(); pos++) {
        if ((static_cast<unsigned char>(cleaned[pos]) & 0xC0) != 0x80) {
            if (points == max_length) {
                cleaned.resize(pos);
                break;
            }
            points++;
        }
    }
    return validate_user_input(cleaned, max_length);
}

// ============================================================================
// Masking and parsing helpers
// ============================================================================

std::string mask_sensitive_data(const std::string& text) {
    static const std::vector<std::pair<std::regex, std::string>> rules = {
        {std::regex(R"(sk-[A-Za-z0-9_-]{16,})"), "sk-***"},
        {std::regex(R"(tvly-[A-Za-z0-9_-]{8,})"), "tvly-***"},
        {std::regex(R"(\bAC[a-f0-9]{32}\b)"), "AC***"},
        {std::regex(R"(Bearer\s+[A-Za-z0-9._~+/=-]+)"), "Bearer ***"},
        {std::regex(R"(\b(password|passwd|secret|api_key|token)\s*([=:])\s*[^\s&]+)",
                    std::regex::icase), "$1$2***"},
    };

    std::string masked = text;
    for (const auto& [pattern, replacement] : rules) {
        masked = std::regex_replace(masked, pattern, replacement);
    }
    return masked;
}

bool split_command_line(const std::string& command, std::vector<std::string>& out) {
    out.clear();
    std::string cur;
    bool have_token = false;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;

    auto flush = [&]() {
        if (have_token) {
            out.push_back(cur);
            cur.clear();
            have_token = false;
        }
    };

    for (char c : command) {
        if (esc) {
            cur.push_back(c);
            esc = false;
            continue;
        }
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') { flush(); continue; }
            have_token = true;
            if (c == '\\') { esc = true; continue; }
            if (c == '\'') { st = SQ; continue; }
            if (c == '"') { st = DQ; continue; }
            cur.push_back(c);
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else {
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { st = NORM; continue; }
            cur.push_back(c);
        }
    }
    if (st != NORM || esc) {
        out.clear();
        return false;
    }
    flush();
    return true;
}

} // namespace sandpit::security
