#pragma once

#include "util/errors.hpp"
#include <optional>
#include <string>

namespace wrc {

/// Executables invoked by ExternalImageTools. Looked up on PATH unless
/// given as paths.
struct ToolPaths {
    std::string cwebp = "cwebp";
    std::string dwebp = "dwebp";
    std::string convert = "convert";        // ImageMagick
    std::string identify = "identify";      // ImageMagick
    std::string ssimulacra = "ssimulacra";
};

/// Options for one recompression run.
struct RecompressConfig {
    double threshold = 0.01;            // max SSIMULACRA score accepted, [0, 1]
    double threshold_multiplier = 1.1;  // relaxation factor per failed attempt
    int start = 75;                     // start quality when guessing fails
    bool quiet = false;
    bool verbose = false;

    int max_attempts = 3;               // visits to one quality before escaping
    int escape_nudge = 2;               // quality shift applied on escape
    int max_relaxations = 0;            // 0 = unlimited
    bool keep_intermediates = false;    // skip removal of working PNGs

    ToolPaths tools;
};

struct ConfigError {
    ErrorKind kind = ErrorKind::INVALID_CONFIG;
    std::string message;
};

/// Check a config before any search work starts. The threshold check
/// uses the same message as the relaxation loop.
std::optional<ConfigError> validateConfig(const RecompressConfig& config);

/// True when `threshold` lies in [0, 1].
bool thresholdInRange(double threshold);

/// True when `multiplier` strictly loosens a threshold (> 1).
bool multiplierLoosens(double multiplier);

extern const char* const kThresholdRangeMessage;
extern const char* const kMultiplierMessage;

} // namespace wrc
