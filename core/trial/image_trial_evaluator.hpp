#pragma once

#include "trial/trial_evaluator.hpp"
#include "tools/image_tools.hpp"
#include "util/logger.hpp"

namespace wrc {

/// TrialEvaluator over ImageTools: encode the source at the requested
/// quality, measure the WebP, decode it back to PNG and score it
/// against the reference PNG.
class ImageTrialEvaluator : public TrialEvaluator {
public:
    ImageTrialEvaluator(ImageTools& tools, Logger& logger)
        : tools_(tools), logger_(logger) {}

    TrialMeasurement run(const TrialRequest& request) override;

private:
    ImageTools& tools_;
    Logger& logger_;
};

} // namespace wrc
