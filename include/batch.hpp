#pragma once

#include "face_cropper.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace facecrop {

struct BatchOptions {
    std::filesystem::path outputDir;
    std::filesystem::path debugDir = "face_cropper_debug";
    bool overwrite = false;
    bool verbose = false;
    bool debugMasks = false;
};

struct BatchSummary {
    int written = 0;
    int skipped = 0;
    int failed = 0;   // decode, crop or write errors, one count per input file

    int exitCode() const { return failed > 0 ? 1 : 0; }
};

// Whole-string decimal parse for numeric command-line values. nullopt when
// the text is empty, not a number, or has trailing characters.
std::optional<double> parseNumber(const std::string& text);

// .jpg .jpeg .png .webp, any letter case
bool isSupportedImage(const std::filesystem::path& path);

// A single file as given, or the supported images directly inside a
// directory, sorted by path. Throws std::filesystem::filesystem_error.
std::vector<std::filesystem::path> collectInputs(const std::filesystem::path& path);

// <outputDir>/<stem>.png
std::filesystem::path outputPathFor(const std::filesystem::path& input,
                                    const std::filesystem::path& outputDir);

// Crops every input in order and writes the PNGs. A failing file is
// reported on stderr and counted; the remaining files still run.
BatchSummary cropAll(const FaceCropper& cropper,
                     const std::vector<std::filesystem::path>& inputs,
                     const BatchOptions& options);

} // namespace facecrop
