/**
 * Face Cropper - portrait to face-only transparent PNG
 *
 * Crops each portrait to a square around the largest skin-colored region
 * and feathers the edges to transparent:
 *   ./face_cropper portraits/ cropped/ --verbose
 *   ./face_cropper boss.jpg cropped/ --feather-ratio 0.85 --debug-masks
 */

#include "batch.hpp"
#include "face_cropper.hpp"
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

const char* kDebugDir = "face_cropper_debug";

struct Options {
    fs::path inputPath;
    fs::path outputDir;
    bool overwrite = false;
    bool verbose = false;
    bool debugMasks = false;
    double featherRatio = 0.92;
};

void printUsage(const char* programName) {
    std::cout << "Face Cropper - crop portrait photos down to face-only, transparent PNGs\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << programName << " <input_path> <output_dir> [options]\n\n";
    std::cout << "  input_path  - A portrait image or a folder of images (.jpg .jpeg .png .webp)\n";
    std::cout << "  output_dir  - Destination folder for cropped PNGs\n\n";
    std::cout << "Options:\n";
    std::cout << "  --overwrite          Recreate PNGs even when they already exist\n";
    std::cout << "  --feather-ratio R    Inner radius (0-0.98) of full opacity before the fade (default: 0.92)\n";
    std::cout << "  --debug-masks        Write mask, bounds and crop previews to " << kDebugDir << "/\n";
    std::cout << "  --verbose            Log progress as files are processed\n";
}

bool parseArgs(int argc, char* argv[], Options& options) {
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--overwrite") {
            options.overwrite = true;
        } else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else if (arg == "--debug-masks") {
            options.debugMasks = true;
        } else if (arg == "--feather-ratio") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --feather-ratio needs a value" << std::endl;
                return false;
            }
            std::optional<double> ratio = facecrop::parseNumber(argv[++i]);
            if (!ratio) {
                std::cerr << "Error: invalid feather ratio '" << argv[i] << "'" << std::endl;
                return false;
            }
            options.featherRatio = *ratio;
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: unknown option " << arg << std::endl;
            return false;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        return false;
    }

    options.inputPath = positional[0];
    options.outputDir = positional[1];
    return true;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    Options options;
    if (!parseArgs(argc, argv, options)) {
        printUsage(argv[0]);
        return 1;
    }

    std::error_code ec;
    if (!fs::exists(options.inputPath, ec)) {
        std::cerr << "Error: Cannot find " << options.inputPath.string() << std::endl;
        return 1;
    }

    facecrop::Config config;
    config.featherRatio = options.featherRatio;
    config.debugMasks = options.debugMasks;
    config.verbose = options.verbose;

    std::vector<fs::path> inputs;
    try {
        inputs = facecrop::collectInputs(options.inputPath);
        fs::create_directories(options.outputDir);
    } catch (const fs::filesystem_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::unique_ptr<facecrop::FaceCropper> cropper;
    try {
        cropper = std::make_unique<facecrop::FaceCropper>(config);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    facecrop::BatchOptions batch;
    batch.outputDir = options.outputDir;
    batch.debugDir = kDebugDir;
    batch.overwrite = options.overwrite;
    batch.verbose = options.verbose;
    batch.debugMasks = options.debugMasks;

    facecrop::BatchSummary summary = facecrop::cropAll(*cropper, inputs, batch);
    return summary.exitCode();
}
