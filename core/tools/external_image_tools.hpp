#pragma once

#include "tools/image_tools.hpp"
#include "tools/process_runner.hpp"
#include "config/config.hpp"
#include "util/errors.hpp"
#include <string>
#include <utility>
#include <vector>

namespace wrc {

// ─── External Image Tools ──────────────────────────────────────
// ImageTools backed by command line programs:
//   cwebp / dwebp            encode and decode WebP
//   convert / identify       ImageMagick rasterize and quality guess
//   ssimulacra               perceptual score, printed on stdout
// Sizes and cleanup go through std::filesystem.

class ExternalImageTools : public ImageTools {
public:
    ExternalImageTools(const ProcessRunner& runner, ToolPaths paths = {})
        : runner_(runner), paths_(std::move(paths)) {}

    uintmax_t probeByteSize(const std::string& path) override;
    int guessOriginalQuality(const std::string& path) override;
    void makeReferenceImage(const std::string& source, const std::string& dest) override;
    void encodeLossy(const std::string& source, const std::string& dest, int quality) override;
    void encodeLossless(const std::string& source, const std::string& dest) override;
    void decodeToPng(const std::string& source, const std::string& dest) override;
    double compareImages(const std::string& reference, const std::string& candidate) override;
    void cleanup(const WorkingFileSet& files) override;

private:
    const ProcessRunner& runner_;
    ToolPaths paths_;

    /// Run a tool; any failure to start or non-zero exit becomes a
    /// RecompressError of `kind`. Returns captured stdout.
    std::string invoke(ErrorKind kind, const std::vector<std::string>& argv) const;
};

} // namespace wrc
