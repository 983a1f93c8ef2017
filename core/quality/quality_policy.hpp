#pragma once

#include "search/trial_table.hpp"
#include <cstdint>
#include <optional>

namespace wrc {

constexpr int kMinQuality = 0;
constexpr int kMaxQuality = 100;

/// Multiplier applied to the relative score gap when sizing a step.
constexpr double kIntervalScale = 4.0;

/// Largest step a single adjustment may take.
constexpr int kMaxQualityInterval = 25;

/// Qualities above this take half-size steps.
constexpr int kFineQualityBand = 90;

/// Decimal places kept when relaxing a threshold.
constexpr int kThresholdDigits = 4;

/// Map any real number onto the integer quality range [0, 100].
/// Rounds to the nearest integer inside the range. NaN maps to 0.
int clampQuality(double quality);

/// Step size for the next quality guess. Grows with |score - threshold|
/// relative to the threshold, never less than 1 and never more than
/// kMaxQualityInterval.
int getQualityInterval(double score, double threshold, int quality);

/// Round to a fixed number of decimal places.
double roundTo(double value, int digits = kThresholdDigits);

/// Next threshold after a failed attempt: threshold * multiplier rounded
/// to kThresholdDigits. Always strictly larger than `threshold`, so a
/// zero or tiny threshold still makes progress.
double relaxThreshold(double threshold, double multiplier);

struct FinalQuality {
    int quality = 0;
    uintmax_t size = 0;
};

/// Pick the smallest-size record whose score is within `threshold`.
/// Scans ascending quality; on equal sizes the lower quality wins.
/// Empty when no record passes.
std::optional<FinalQuality> getFinalQuality(double threshold, const TrialTable& trials);

} // namespace wrc
