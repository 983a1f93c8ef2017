#include "recompress/recompressor.hpp"
#include "files/working_files.hpp"
#include "quality/quality_policy.hpp"
#include "search/candidate_selector.hpp"
#include "search/relaxation_driver.hpp"
#include "search/search_controller.hpp"
#include "search/trial_table.hpp"
#include "tools/external_image_tools.hpp"
#include "tools/process_runner.hpp"
#include "trial/image_trial_evaluator.hpp"
#include "util/format.hpp"

namespace wrc {

namespace {

RecompressResult failure(RecompressResult result, ErrorKind kind, const std::string& message) {
    result.success = false;
    result.error = kind;
    result.message = message;
    return result;
}

} // namespace

RecompressResult Recompressor::run(const std::string& input, const RecompressConfig& config) {
    logger_.setLevel(Logger::levelFor(config.quiet, config.verbose));

    switch (detectInputFormat(input)) {
        case InputFormat::PNG:
            return runLossless(input);
        case InputFormat::JPEG:
            return runLossy(input, config);
        case InputFormat::UNSUPPORTED:
            break;
    }

    RecompressResult result;
    result.input = input;
    return failure(result, ErrorKind::INPUT_FORMAT, "Input must be a JPEG or PNG image.");
}

RecompressResult Recompressor::runLossless(const std::string& input) {
    RecompressResult result;
    result.input = input;
    result.lossless = true;
    result.quality = kMaxQuality;
    result.output = losslessOutputPath(input);

    try {
        result.input_size = tools_.probeByteSize(input);
    } catch (const RecompressError&) {
        return failure(result, ErrorKind::PROBE_FAILURE, "Couldn't get the size of PNG input.");
    }

    logger_.info("Input: " + input);

    try {
        tools_.encodeLossless(input, result.output);
    } catch (const RecompressError& e) {
        logger_.verbose(e.what());
        return failure(result, ErrorKind::ENCODE_FAILURE,
            "Couldn't encode lossless WebP from PNG input.");
    }

    try {
        result.output_size = tools_.probeByteSize(result.output);
    } catch (const RecompressError&) {
        return failure(result, ErrorKind::PROBE_FAILURE, "Couldn't get the size of WebP output.");
    }

    result.success = true;
    result.message = "Encoded lossless WebP from PNG input: " +
        formatKilobytes(result.input_size) + " -> " + formatKilobytes(result.output_size);
    return result;
}

int Recompressor::startingQuality(const std::string& input, const RecompressConfig& config) {
    int start = clampQuality(config.start);
    try {
        int guessed = clampQuality(tools_.guessOriginalQuality(input));
        logger_.verbose("Guessed JPEG quality at q" + std::to_string(guessed));
        return guessed;
    } catch (const RecompressError& e) {
        logger_.verbose(std::string("Couldn't guess JPEG quality (") + e.what() +
                        "). Starting at q" + std::to_string(start));
        return start;
    }
}

RecompressResult Recompressor::runLossy(const std::string& input, const RecompressConfig& config) {
    RecompressResult result;
    result.input = input;

    if (auto error = validateConfig(config)) {
        return failure(result, error->kind, error->message);
    }

    try {
        result.input_size = tools_.probeByteSize(input);
    } catch (const RecompressError&) {
        return failure(result, ErrorKind::PROBE_FAILURE, "Couldn't get the size of JPEG input.");
    }

    logger_.info("Input: " + input);

    TrialContext context;
    context.source = input;
    context.input_size = result.input_size;
    context.files = makeWorkingFiles(input);
    context.quiet = config.quiet;
    result.output = context.files.output_webp;

    int start = startingQuality(input, config);

    try {
        tools_.makeReferenceImage(input, context.files.reference_png);
    } catch (const RecompressError& e) {
        if (!config.keep_intermediates) cleanupQuietly(tools_, context.files, logger_);
        return failure(result, ErrorKind::CONVERSION_FAILURE,
            std::string("Couldn't create a PNG reference from the JPEG given: ") + e.what());
    }

    TrialTable trials;
    SearchController controller(evaluator_, logger_);
    CandidateSelector selector(evaluator_, tools_, logger_);
    RelaxationDriver driver(controller, selector, logger_);

    SearchResult search;
    try {
        search = driver.run(context, start, config, trials);
    } catch (const RecompressError& e) {
        if (!config.keep_intermediates) cleanupQuietly(tools_, context.files, logger_);
        return failure(result, e.kind(), std::string("Couldn't run image trial: ") + e.what());
    }

    result.final_threshold = search.final_threshold;
    result.relaxations = search.relaxations;
    result.total_trials = search.total_trials;
    result.elapsed_seconds = search.elapsed_seconds;

    if (!search.success) {
        if (!config.keep_intermediates) cleanupQuietly(tools_, context.files, logger_);
        return failure(result, search.error, search.message);
    }

    result.success = true;
    result.quality = search.final_quality;
    result.output_size = search.final_size;
    result.message = "Candidate found at q" + std::to_string(result.quality) + ": " +
        formatKilobytes(result.input_size) + " -> " + formatKilobytes(result.output_size);
    return result;
}

RecompressResult recompressFile(const std::string& input,
                                const RecompressConfig& config,
                                Logger& logger) {
    ProcessRunner runner;
    ExternalImageTools tools(runner, config.tools);
    ImageTrialEvaluator evaluator(tools, logger);
    Recompressor recompressor(tools, evaluator, logger);
    return recompressor.run(input, config);
}

} // namespace wrc
