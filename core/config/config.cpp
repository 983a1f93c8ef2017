#include "config/config.hpp"

namespace wrc {

const char* const kThresholdRangeMessage = "Threshold must be between 0 and 1.";
const char* const kMultiplierMessage = "Threshold multiplier must be greater than 1.";

bool thresholdInRange(double threshold) {
    return threshold >= 0.0 && threshold <= 1.0;
}

bool multiplierLoosens(double multiplier) {
    return multiplier > 1.0;
}

std::optional<ConfigError> validateConfig(const RecompressConfig& config) {
    if (!thresholdInRange(config.threshold)) {
        return ConfigError{ErrorKind::THRESHOLD_OUT_OF_RANGE, kThresholdRangeMessage};
    }
    if (!multiplierLoosens(config.threshold_multiplier)) {
        return ConfigError{ErrorKind::INVALID_CONFIG, kMultiplierMessage};
    }
    if (config.max_attempts < 1) {
        return ConfigError{ErrorKind::INVALID_CONFIG,
            "Attempt cap must be at least 1."};
    }
    if (config.escape_nudge < 1) {
        return ConfigError{ErrorKind::INVALID_CONFIG,
            "Escape nudge must be at least 1."};
    }
    if (config.max_relaxations < 0) {
        return ConfigError{ErrorKind::INVALID_CONFIG,
            "Relaxation limit cannot be negative."};
    }
    return std::nullopt;
}

} // namespace wrc
