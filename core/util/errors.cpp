#include "util/errors.hpp"

namespace wrc {

std::string errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:                   return "None";
        case ErrorKind::INPUT_FORMAT:           return "InputFormatError";
        case ErrorKind::PROBE_FAILURE:          return "ProbeFailure";
        case ErrorKind::GUESS_FAILURE:          return "GuessFailure";
        case ErrorKind::CONVERSION_FAILURE:     return "ConversionFailure";
        case ErrorKind::ENCODE_FAILURE:         return "EncodeFailure";
        case ErrorKind::DECODE_FAILURE:         return "DecodeFailure";
        case ErrorKind::SCORE_FAILURE:          return "ScoreFailure";
        case ErrorKind::TRIAL_FAILURE:          return "TrialFailure";
        case ErrorKind::CLEANUP_FAILURE:        return "CleanupFailure";
        case ErrorKind::THRESHOLD_OUT_OF_RANGE: return "ThresholdOutOfRange";
        case ErrorKind::INVALID_CONFIG:         return "InvalidConfig";
        case ErrorKind::RELAXATION_LIMIT:       return "RelaxationLimitReached";
    }
    return "Unknown";
}

} // namespace wrc
