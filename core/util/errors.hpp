#pragma once

#include <stdexcept>
#include <string>

namespace wrc {

/// Failure categories surfaced by a recompression run.
enum class ErrorKind {
    NONE,
    INPUT_FORMAT,           // neither JPEG nor PNG
    PROBE_FAILURE,          // could not stat a file
    GUESS_FAILURE,          // could not estimate the original JPEG quality
    CONVERSION_FAILURE,     // could not build the reference PNG
    ENCODE_FAILURE,
    DECODE_FAILURE,
    SCORE_FAILURE,
    TRIAL_FAILURE,          // any step of a trial failed
    CLEANUP_FAILURE,
    THRESHOLD_OUT_OF_RANGE,
    INVALID_CONFIG,
    RELAXATION_LIMIT
};

/// Human-readable name of an error kind ("TrialFailure", ...).
std::string errorKindName(ErrorKind kind);

/// Exception thrown by collaborators and the search loop.
/// Caught and turned into a tagged result only by the Recompressor.
class RecompressError : public std::runtime_error {
public:
    RecompressError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace wrc
