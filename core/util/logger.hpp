#pragma once

#include <iostream>
#include <string>

namespace wrc {

enum class LogLevel {
    QUIET,      // warnings only
    NORMAL,     // progress lines
    VERBOSE     // per-iteration diagnostics
};

// ─── Logger ────────────────────────────────────────────────────
// Line-oriented progress output. Progress goes to `out`, warnings to
// `err`. Streams are borrowed and must outlive the logger.

class Logger {
public:
    explicit Logger(std::ostream& out = std::cout, std::ostream& err = std::cerr)
        : out_(&out), err_(&err) {}

    /// Level matching a pair of quiet / verbose flags. Quiet wins.
    static LogLevel levelFor(bool quiet, bool verbose);

    void setLevel(LogLevel level) { level_ = level; }
    LogLevel level() const { return level_; }

    bool isVerbose() const { return level_ == LogLevel::VERBOSE; }

    void info(const std::string& message);
    void verbose(const std::string& message);
    void warn(const std::string& message);

    /// Final outcome line. Printed at every level, quiet included.
    void result(const std::string& message);

private:
    std::ostream* out_;
    std::ostream* err_;
    LogLevel level_ = LogLevel::NORMAL;
};

} // namespace wrc
