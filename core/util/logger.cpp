#include "util/logger.hpp"

namespace wrc {

LogLevel Logger::levelFor(bool quiet, bool verbose) {
    if (quiet) return LogLevel::QUIET;
    return verbose ? LogLevel::VERBOSE : LogLevel::NORMAL;
}

void Logger::info(const std::string& message) {
    if (level_ == LogLevel::QUIET) return;
    *out_ << message << '\n';
}

void Logger::verbose(const std::string& message) {
    if (level_ != LogLevel::VERBOSE) return;
    *out_ << message << '\n';
}

void Logger::result(const std::string& message) {
    *out_ << message << '\n';
}

void Logger::warn(const std::string& message) {
    *err_ << "warning: " << message << '\n';
    err_->flush();
}

} // namespace wrc
