// webp_recompress: recompress JPEG and PNG images to the smallest WebP
// that stays within a perceptual threshold of the source.

#include <CLI/CLI.hpp>

#include "config/config.hpp"
#include "recompress/recompressor.hpp"
#include "util/logger.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    CLI::App app{"Recompress JPEG and PNG images to perceptually equivalent, smaller WebP"};

    wrc::RecompressConfig config;
    std::vector<std::string> inputs;

    app.add_option("inputs", inputs, "JPEG or PNG files to recompress")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("-t,--threshold", config.threshold,
                   "Maximum SSIMULACRA score a candidate may have")
        ->check(CLI::Range(0.0, 1.0))
        ->capture_default_str();
    app.add_option("-m,--threshold-multiplier", config.threshold_multiplier,
                   "Factor applied to the threshold after a failed search")
        ->check(CLI::Validator(
            [](std::string& value) -> std::string {
                double multiplier = 0.0;
                if (!CLI::detail::lexical_cast(value, multiplier) ||
                    !wrc::multiplierLoosens(multiplier)) {
                    return wrc::kMultiplierMessage;
                }
                return std::string();
            },
            "NUMBER > 1"))
        ->capture_default_str();
    app.add_option("-s,--start", config.start,
                   "Starting quality when the JPEG quality cannot be guessed")
        ->check(CLI::Range(0, 100))
        ->capture_default_str();
    app.add_flag("-q,--quiet", config.quiet, "Suppress progress output");
    app.add_flag("-v,--verbose", config.verbose, "Print per-trial diagnostics");
    app.add_option("--max-relaxations", config.max_relaxations,
                   "Give up after this many threshold relaxations (0 = never)")
        ->check(CLI::NonNegativeNumber)
        ->capture_default_str();
    app.add_flag("--keep-intermediates", config.keep_intermediates,
                 "Leave the reference and decoded PNG files in place");

    auto* tools = app.add_option_group("Tools", "Executables used for each step");
    tools->add_option("--cwebp", config.tools.cwebp, "WebP encoder")->capture_default_str();
    tools->add_option("--dwebp", config.tools.dwebp, "WebP decoder")->capture_default_str();
    tools->add_option("--convert", config.tools.convert, "ImageMagick convert")->capture_default_str();
    tools->add_option("--identify", config.tools.identify, "ImageMagick identify")->capture_default_str();
    tools->add_option("--ssimulacra", config.tools.ssimulacra, "Perceptual scorer")->capture_default_str();

    CLI11_PARSE(app, argc, argv);

    wrc::Logger logger(std::cout, std::cerr);
    int failures = 0;

    for (const auto& input : inputs) {
        wrc::RecompressResult result = wrc::recompressFile(input, config, logger);
        if (result.success) {
            logger.result(result.message);
        } else {
            std::cerr << input << ": " << result.message << "\n";
            failures++;
        }
    }

    return failures == 0 ? 0 : 1;
}
