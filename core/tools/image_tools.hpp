#pragma once

#include "files/working_files.hpp"
#include <cstdint>
#include <string>

namespace wrc {

class Logger;

/// Image operations the search consumes but does not implement.
/// Every method throws RecompressError on failure, tagged with the
/// matching ErrorKind.
class ImageTools {
public:
    virtual ~ImageTools() = default;

    /// Byte size of a file. PROBE_FAILURE.
    virtual uintmax_t probeByteSize(const std::string& path) = 0;

    /// Estimated encode quality of a JPEG, in [0, 100]. GUESS_FAILURE.
    virtual int guessOriginalQuality(const std::string& path) = 0;

    /// Rasterize `source` into a PNG at `dest`. CONVERSION_FAILURE.
    virtual void makeReferenceImage(const std::string& source, const std::string& dest) = 0;

    /// Lossy WebP at `quality`. ENCODE_FAILURE.
    virtual void encodeLossy(const std::string& source, const std::string& dest, int quality) = 0;

    /// Lossless WebP. ENCODE_FAILURE.
    virtual void encodeLossless(const std::string& source, const std::string& dest) = 0;

    /// Decode a WebP back to PNG. DECODE_FAILURE.
    virtual void decodeToPng(const std::string& source, const std::string& dest) = 0;

    /// Perceptual distance between two rasters; lower is more similar.
    /// SCORE_FAILURE.
    virtual double compareImages(const std::string& reference, const std::string& candidate) = 0;

    /// Remove intermediate files; the output WebP is kept. CLEANUP_FAILURE.
    virtual void cleanup(const WorkingFileSet& files) = 0;
};

/// Best-effort cleanup: a failure is logged as a warning and dropped.
void cleanupQuietly(ImageTools& tools, const WorkingFileSet& files, Logger& logger);

} // namespace wrc
