#pragma once

#include <string>

namespace wrc {

enum class InputFormat {
    JPEG,
    PNG,
    UNSUPPORTED
};

/// Classify by extension (.jpg, .jpeg, .png; case-insensitive).
InputFormat detectInputFormat(const std::string& path);

/// Intermediate and output files of one search, derived from the input
/// path and resolved against the current directory.
struct WorkingFileSet {
    std::string reference_png;  // <stem>.png, the JPEG rasterized
    std::string output_webp;    // <stem>.webp, the deliverable
    std::string webp_png;       // <stem>-webp.png, output decoded back
};

/// Working files for a JPEG input.
WorkingFileSet makeWorkingFiles(const std::string& input);

/// Output path of the lossless path for a PNG input.
std::string losslessOutputPath(const std::string& input);

} // namespace wrc
