#include "tools/external_image_tools.hpp"
#include "quality/quality_policy.hpp"

#include <cmath>
#include <cstddef>
#include <filesystem>
#include <stdexcept>

namespace wrc {

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& text) {
    const char* space = " \t\r\n";
    std::size_t first = text.find_first_not_of(space);
    if (first == std::string::npos) return "";
    std::size_t last = text.find_last_not_of(space);
    return text.substr(first, last - first + 1);
}

// First line of a tool's stderr, for error details.
std::string firstLine(const std::string& text) {
    std::string trimmed = trim(text);
    std::size_t newline = trimmed.find('\n');
    return newline == std::string::npos ? trimmed : trimmed.substr(0, newline);
}

} // namespace

std::string ExternalImageTools::invoke(ErrorKind kind, const std::vector<std::string>& argv) const {
    ProcessResult result;
    try {
        result = runner_.run(argv);
    } catch (const std::runtime_error& e) {
        throw RecompressError(kind, e.what());
    }

    if (!result.ok()) {
        std::string detail = argv[0];
        if (result.exit_code == 127) {
            detail += " could not be executed";
        } else if (result.exit_code < 0) {
            detail += " was terminated by a signal";
        } else {
            detail += " exited with status " + std::to_string(result.exit_code);
        }
        std::string reason = firstLine(result.errors);
        if (!reason.empty()) detail += ": " + reason;
        throw RecompressError(kind, detail);
    }
    return result.output;
}

uintmax_t ExternalImageTools::probeByteSize(const std::string& path) {
    std::error_code ec;
    uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        throw RecompressError(ErrorKind::PROBE_FAILURE,
            "Couldn't stat " + path + ": " + ec.message());
    }
    return size;
}

int ExternalImageTools::guessOriginalQuality(const std::string& path) {
    std::string output = trim(invoke(ErrorKind::GUESS_FAILURE,
        {paths_.identify, "-format", "%Q", path}));

    int quality = 0;
    try {
        std::size_t used = 0;
        quality = std::stoi(output, &used);
        if (used != output.size()) throw std::invalid_argument(output);
    } catch (const std::logic_error&) {
        throw RecompressError(ErrorKind::GUESS_FAILURE,
            "Unexpected quality estimate: '" + output + "'");
    }

    // identify reports 0 when the quantization tables give no estimate
    if (quality <= kMinQuality || quality > kMaxQuality) {
        throw RecompressError(ErrorKind::GUESS_FAILURE,
            "No usable quality estimate for " + path);
    }
    return quality;
}

void ExternalImageTools::makeReferenceImage(const std::string& source, const std::string& dest) {
    invoke(ErrorKind::CONVERSION_FAILURE, {paths_.convert, source, dest});
}

void ExternalImageTools::encodeLossy(const std::string& source, const std::string& dest, int quality) {
    invoke(ErrorKind::ENCODE_FAILURE,
        {paths_.cwebp, "-q", std::to_string(clampQuality(quality)), "-mt", source, "-o", dest});
}

void ExternalImageTools::encodeLossless(const std::string& source, const std::string& dest) {
    invoke(ErrorKind::ENCODE_FAILURE,
        {paths_.cwebp, "-lossless", "-q", std::to_string(kMaxQuality), "-mt", source, "-o", dest});
}

void ExternalImageTools::decodeToPng(const std::string& source, const std::string& dest) {
    invoke(ErrorKind::DECODE_FAILURE, {paths_.dwebp, source, "-o", dest});
}

double ExternalImageTools::compareImages(const std::string& reference, const std::string& candidate) {
    std::string output = trim(invoke(ErrorKind::SCORE_FAILURE,
        {paths_.ssimulacra, reference, candidate}));

    double score = 0.0;
    try {
        std::size_t used = 0;
        score = std::stod(output, &used);
        if (used != output.size()) throw std::invalid_argument(output);
    } catch (const std::logic_error&) {
        throw RecompressError(ErrorKind::SCORE_FAILURE,
            "Unexpected score output: '" + output + "'");
    }

    // a non-finite score can never pass a threshold
    if (!std::isfinite(score)) {
        throw RecompressError(ErrorKind::SCORE_FAILURE,
            "Unusable score output: '" + output + "'");
    }
    return score;
}

void ExternalImageTools::cleanup(const WorkingFileSet& files) {
    std::string failures;
    for (const std::string& path : {files.reference_png, files.webp_png}) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            if (!failures.empty()) failures += "; ";
            failures += path + ": " + ec.message();
        }
    }
    if (!failures.empty()) {
        throw RecompressError(ErrorKind::CLEANUP_FAILURE, failures);
    }
}

} // namespace wrc
