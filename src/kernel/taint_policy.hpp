/**
 * Sandpit Taint Policy
 *
 * Decides whether a sandbox may go back to the pool after an execution.
 * A sandbox is tainted when the run:
 *   - timed out or was cancelled (killed mid-flight)
 *   - crashed: killed by a signal, exit code >= 128, or never started
 *   - was OOM-killed or reached its memory ceiling
 *   - could have installed packages (pip/npm/apt/... in the payload or files)
 * Writes outside the workspace are caught later, by the pool's recycle check.
 */
#pragma once
#include <string>
#include <vector>
#include <optional>
#include "runtime/container_runtime.hpp"

namespace sandpit::kernel {

// True when text invokes a package manager install
bool mutates_environment(const std::string& text);

// Reason the sandbox must be destroyed, or nullopt when it is reusable
std::optional<std::string> taint_reason(const runtime::ExecOutput& output,
                                        const std::vector<std::string>& sources,
                                        const std::optional<runtime::ResourceUsage>& usage);

} // namespace sandpit::kernel
