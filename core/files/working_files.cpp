#include "files/working_files.hpp"
#include <filesystem>
#include <regex>

namespace wrc {

namespace {

const std::regex& jpegPattern() {
    static const std::regex pattern("\\.jpe?g$", std::regex::icase);
    return pattern;
}

const std::regex& pngPattern() {
    static const std::regex pattern("\\.png$", std::regex::icase);
    return pattern;
}

std::string resolve(const std::string& path) {
    return std::filesystem::absolute(path).lexically_normal().string();
}

} // namespace

InputFormat detectInputFormat(const std::string& path) {
    if (std::regex_search(path, pngPattern())) return InputFormat::PNG;
    if (std::regex_search(path, jpegPattern())) return InputFormat::JPEG;
    return InputFormat::UNSUPPORTED;
}

WorkingFileSet makeWorkingFiles(const std::string& input) {
    WorkingFileSet files;
    files.reference_png = resolve(std::regex_replace(input, jpegPattern(), ".png"));
    files.output_webp = resolve(std::regex_replace(input, jpegPattern(), ".webp"));
    files.webp_png = resolve(std::regex_replace(input, jpegPattern(), "-webp.png"));
    return files;
}

std::string losslessOutputPath(const std::string& input) {
    return resolve(std::regex_replace(input, pngPattern(), ".webp"));
}

} // namespace wrc
