#pragma once

#include "files/working_files.hpp"
#include "search/trial_table.hpp"
#include <cstdint>
#include <string>

namespace wrc {

/// Everything a trial needs that does not change within one search.
struct TrialContext {
    std::string source;         // input JPEG
    uintmax_t input_size = 0;
    WorkingFileSet files;
    bool quiet = false;
};

/// One trial at one quality.
struct TrialRequest {
    const TrialContext* context = nullptr;
    int quality = 0;
    bool quiet = false;
    const TrialTable* history = nullptr;  // null in final mode
};

struct TrialMeasurement {
    double score = 0.0;
    uintmax_t size = 0;
};

/// Encode -> decode -> score -> size at one quality. Opaque to the
/// controller, which only consumes the measurement.
/// Throws RecompressError when any step fails.
class TrialEvaluator {
public:
    virtual ~TrialEvaluator() = default;

    virtual TrialMeasurement run(const TrialRequest& request) = 0;
};

} // namespace wrc
