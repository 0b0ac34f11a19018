#pragma once

#include <opencv2/core.hpp>
#include <memory>
#include <optional>
#include <ostream>

namespace facecrop {

// Morphology passes applied to the raw skin mask: open, close, then dilate.
// Kernel sides must be odd.
struct MorphSchedule {
    int openKernel = 5;
    int closeKernel = 9;
    int dilateKernel = 7;
    int dilateIterations = 2;
};

// Per-edge growth of the face box as a fraction of the face extent.
// Grows upward for hair/forehead and only a little toward the neck.
struct ExpansionFactors {
    double top = 0.55;
    double bottom = 0.25;
    double side = 0.45;
};

struct Config {
    double featherRatio = 0.92;      // inner radius of the opaque plateau, clamped to [0, 0.98]
    bool debugMasks = false;
    bool verbose = false;
    ExpansionFactors expansion;
    MorphSchedule morphology;
    int fallbackBiasDivisor = 6;     // fallback crop moves up by side / divisor
};

// Crop rectangle over the source frame, bottom and right exclusive.
struct CropBox {
    int top = 0;
    int bottom = 0;
    int left = 0;
    int right = 0;

    int height() const { return bottom - top; }
    int width() const { return right - left; }
    bool empty() const { return height() <= 0 || width() <= 0; }

    CropBox clamp(int frameHeight, int frameWidth) const;
    cv::Rect toRect() const { return cv::Rect(left, top, width(), height()); }
};

bool operator==(const CropBox& a, const CropBox& b);
bool operator!=(const CropBox& a, const CropBox& b);
std::ostream& operator<<(std::ostream& os, const CropBox& box);

// Intermediate images handed back for inspection when Config::debugMasks is set
struct DebugLayers {
    cv::Mat maskPreview;     // CV_8UC1, selected component
    cv::Mat boundsOverlay;   // CV_8UC4, source frame with the crop box drawn
    cv::Mat cropped;         // CV_8UC4, same as CropResult::rgba
};

struct CropResult {
    cv::Mat rgba;            // CV_8UC4, BGRA channel order
    CropBox box;
    bool usedFallback = false;
    DebugLayers debug;
};

class Segmentation;

// Stack a BGR crop and an alpha map of the same size into a BGRA image
cv::Mat composeRgba(const cv::Mat& bgr, const cv::Mat& alpha);

// Centered square of side min(H, W), moved up by side / biasDivisor
CropBox fallbackCropBox(const cv::Size& frame, int biasDivisor = 6);

class FaceCropper {
public:
    explicit FaceCropper(const Config& config);
    ~FaceCropper();

    FaceCropper(const FaceCropper&) = delete;
    FaceCropper& operator=(const FaceCropper&) = delete;

    // Accepts 8-bit gray, BGR or BGRA images.
    // Throws std::invalid_argument for empty or unsupported input.
    CropResult cropToFace(const cv::Mat& image) const;

    const Config& getConfig() const { return m_config; }

protected:
    CropResult cropFallback(const cv::Mat& bgr) const;
    CropResult cropRegion(const cv::Mat& bgr, const CropBox& box,
                          const cv::Mat& componentMask, bool fallback) const;

private:
    Config m_config;
    std::unique_ptr<Segmentation> m_segmentation;
};

// One-shot form of FaceCropper::cropToFace with the default schedule
CropResult cropToFace(const cv::Mat& image, double featherRatio = 0.92, bool emitDebug = false);

} // namespace facecrop
