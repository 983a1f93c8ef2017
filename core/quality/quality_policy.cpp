#include "quality/quality_policy.hpp"
#include <algorithm>
#include <cmath>

namespace wrc {

int clampQuality(double quality) {
    if (!(quality > kMinQuality)) return kMinQuality;
    if (quality > kMaxQuality) return kMaxQuality;
    return static_cast<int>(std::lround(quality));
}

int getQualityInterval(double score, double threshold, int quality) {
    double gap = std::fabs(score - threshold);
    double relative = threshold > 0.0 ? gap / threshold : gap * 100.0;
    double raw = std::ceil(relative * kIntervalScale);

    // NaN lands here too
    if (!(raw >= 1.0)) return 1;

    int step = raw > kMaxQualityInterval ? kMaxQualityInterval : static_cast<int>(raw);
    if (quality > kFineQualityBand) {
        step = (step + 1) / 2;
    }
    return std::max(step, 1);
}

double roundTo(double value, int digits) {
    double factor = std::pow(10.0, digits);
    return std::round(value * factor) / factor;
}

double relaxThreshold(double threshold, double multiplier) {
    double relaxed = roundTo(threshold * multiplier, kThresholdDigits);
    double unit = std::pow(10.0, -kThresholdDigits);
    if (relaxed < threshold + unit) {
        relaxed = roundTo(threshold + unit, kThresholdDigits);
    }
    return relaxed;
}

std::optional<FinalQuality> getFinalQuality(double threshold, const TrialTable& trials) {
    std::optional<FinalQuality> best;
    for (const auto& [quality, record] : trials) {
        if (record.score > threshold) continue;
        if (!best || record.size < best->size) {
            best = FinalQuality{quality, record.size};
        }
    }
    return best;
}

} // namespace wrc
