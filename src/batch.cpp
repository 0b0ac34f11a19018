#include "batch.hpp"
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace facecrop {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool writeImage(const fs::path& path, const cv::Mat& image) {
    if (!cv::imwrite(path.string(), image)) {
        std::cerr << "Error: Cannot write " << path.string() << std::endl;
        return false;
    }
    return true;
}

bool exportDebugLayers(const DebugLayers& layers, const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        std::cerr << "Error: Cannot create " << dir.string() << ": " << ec.message() << std::endl;
        return false;
    }

    // Attempt all three so one bad layer doesn't hide the others
    bool ok = writeImage(dir / "mask.png", layers.maskPreview);
    ok = writeImage(dir / "bounds.png", layers.boundsOverlay) && ok;
    ok = writeImage(dir / "cropped.png", layers.cropped) && ok;
    return ok;
}

} // anonymous namespace

std::optional<double> parseNumber(const std::string& text) {
    size_t pos = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &pos);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }
    return value;
}

bool isSupportedImage(const fs::path& path) {
    static const std::set<std::string> imageExts = {".jpg", ".jpeg", ".png", ".webp"};
    return imageExts.count(lowercase(path.extension().string())) > 0;
}

std::vector<fs::path> collectInputs(const fs::path& path) {
    if (fs::is_regular_file(path)) {
        return {path};
    }

    std::vector<fs::path> inputs;
    for (const auto& entry : fs::directory_iterator(path)) {
        if (!entry.is_regular_file()) continue;
        if (isSupportedImage(entry.path())) {
            inputs.push_back(entry.path());
        }
    }
    std::sort(inputs.begin(), inputs.end());
    return inputs;
}

fs::path outputPathFor(const fs::path& input, const fs::path& outputDir) {
    return outputDir / (input.stem().string() + ".png");
}

BatchSummary cropAll(const FaceCropper& cropper,
                     const std::vector<fs::path>& inputs,
                     const BatchOptions& options) {
    BatchSummary summary;
    const size_t total = inputs.size();

    for (size_t i = 0; i < total; i++) {
        const fs::path& src = inputs[i];
        const fs::path outPath = outputPathFor(src, options.outputDir);

        std::error_code ec;
        const bool exists = fs::exists(outPath, ec);
        if (ec) {
            std::cerr << "Error: Cannot check " << outPath.string() << ": " << ec.message() << std::endl;
            summary.failed++;
            continue;
        }
        if (exists && !options.overwrite) {
            if (options.verbose) {
                std::cout << "[skip] " << src.filename().string() << " -> already exists" << std::endl;
            }
            summary.skipped++;
            continue;
        }

        if (options.verbose) {
            std::cout << "[" << (i + 1) << "/" << total << "] Cropping " << src.filename().string() << " ..." << std::endl;
        }

        try {
            cv::Mat image = cv::imread(src.string(), cv::IMREAD_COLOR);
            if (image.empty()) {
                std::cerr << "Error: Cannot load " << src.string() << std::endl;
                summary.failed++;
                continue;
            }

            CropResult result = cropper.cropToFace(image);
            if (!writeImage(outPath, result.rgba)) {
                summary.failed++;
                continue;
            }
            summary.written++;

            if (options.debugMasks && !exportDebugLayers(result.debug, options.debugDir)) {
                summary.failed++;
            }

            if (options.verbose) {
                std::cout << "    saved " << outPath.string()
                          << (result.usedFallback ? " (centered fallback)" : "") << std::endl;
            }
        } catch (const cv::Exception& e) {
            std::cerr << "Error: OpenCV failed on " << src.string() << ": " << e.what() << std::endl;
            summary.failed++;
        } catch (const std::exception& e) {
            std::cerr << "Error: " << src.string() << ": " << e.what() << std::endl;
            summary.failed++;
        }
    }

    if (options.verbose) {
        std::cout << "\nWrote " << summary.written << " of " << total << " images";
        if (summary.skipped > 0) std::cout << ", " << summary.skipped << " skipped";
        if (summary.failed > 0) std::cout << ", " << summary.failed << " failed";
        std::cout << std::endl;
    }

    return summary;
}

} // namespace facecrop
