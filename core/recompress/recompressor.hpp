#pragma once

#include "config/config.hpp"
#include "tools/image_tools.hpp"
#include "trial/trial_evaluator.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"
#include <cstdint>
#include <string>

namespace wrc {

/// Outcome of recompressing one image. `message` is the line shown to
/// the user in both the success and the failure case.
struct RecompressResult {
    bool success = false;
    ErrorKind error = ErrorKind::NONE;
    std::string message;

    std::string input;
    std::string output;         // WebP written on success
    bool lossless = false;
    uintmax_t input_size = 0;
    uintmax_t output_size = 0;
    int quality = 0;            // 100 on the lossless path

    double final_threshold = 0.0;
    int relaxations = 0;
    int total_trials = 0;
    double elapsed_seconds = 0.0;
};

// ─── Recompressor ──────────────────────────────────────────────
// Entry point for one image.
//
// PNG inputs get a single lossless encode. JPEG inputs are validated,
// measured and rasterized to a reference PNG, and the quality search
// runs against that reference. Starting quality is the guessed
// original JPEG quality, or config.start when the guess fails.
// Every failure is returned as a tagged result; nothing is thrown.

class Recompressor {
public:
    Recompressor(ImageTools& tools, TrialEvaluator& evaluator, Logger& logger)
        : tools_(tools), evaluator_(evaluator), logger_(logger) {}

    RecompressResult run(const std::string& input, const RecompressConfig& config);

private:
    ImageTools& tools_;
    TrialEvaluator& evaluator_;
    Logger& logger_;

    RecompressResult runLossless(const std::string& input);
    RecompressResult runLossy(const std::string& input, const RecompressConfig& config);
    int startingQuality(const std::string& input, const RecompressConfig& config);
};

/// Recompress with the command line tools named in config.tools.
RecompressResult recompressFile(const std::string& input,
                                const RecompressConfig& config,
                                Logger& logger);

} // namespace wrc
