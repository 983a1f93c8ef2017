#include "trial/image_trial_evaluator.hpp"
#include "util/errors.hpp"
#include "util/format.hpp"
#include <sstream>

namespace wrc {

TrialMeasurement ImageTrialEvaluator::run(const TrialRequest& request) {
    if (!request.context) {
        throw RecompressError(ErrorKind::TRIAL_FAILURE, "trial requested without a context");
    }
    const TrialContext& ctx = *request.context;

    tools_.encodeLossy(ctx.source, ctx.files.output_webp, request.quality);

    TrialMeasurement m;
    m.size = tools_.probeByteSize(ctx.files.output_webp);

    tools_.decodeToPng(ctx.files.output_webp, ctx.files.webp_png);
    m.score = tools_.compareImages(ctx.files.reference_png, ctx.files.webp_png);

    if (!request.quiet && logger_.isVerbose()) {
        std::ostringstream line;
        line << "q" << request.quality
             << ": score " << formatDecimal(m.score, 6)
             << ", " << formatKilobytes(m.size);
        if (request.history) {
            if (const TrialRecord* prior = request.history->find(request.quality)) {
                line << " (visit " << prior->attempts + 1 << ")";
            }
        }
        logger_.verbose(line.str());
    }
    return m;
}

} // namespace wrc
