#pragma once

#include <string>
#include <vector>

namespace wrc {

/// Exit status and captured streams of a finished child process.
struct ProcessResult {
    int exit_code = -1;         // -1 when killed by a signal
    std::string output;         // stdout
    std::string errors;         // stderr

    bool ok() const { return exit_code == 0; }
};

// ─── Process Runner ────────────────────────────────────────────
// Runs an executable (looked up on PATH) with an argument vector, no
// shell involved, and blocks until it exits.

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    /// argv[0] is the program. Throws std::runtime_error if the process
    /// cannot be started at all; a non-zero exit is reported in the
    /// result, not thrown. Exit code 127 means exec failed in the child.
    virtual ProcessResult run(const std::vector<std::string>& argv) const;
};

} // namespace wrc
