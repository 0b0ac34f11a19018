#pragma once

#include "face_cropper.hpp"

namespace facecrop {

// Skin thresholds on full-range BT.601 YCbCr, plus RGB guards against
// near-gray and oversaturated pixels
namespace skin {
constexpr int kCbMin = 77;
constexpr int kCbMax = 127;
constexpr int kCrMin = 133;
constexpr int kCrMax = 173;
constexpr int kLumaFloor = 60;    // Y must exceed this
constexpr int kRedFloor = 70;
constexpr int kGreenFloor = 40;
constexpr int kBlueFloor = 20;
constexpr int kRedGreenGap = 5;   // |R - G| must exceed this
} // namespace skin

class Segmentation {
public:
    // Throws std::invalid_argument if the morphology schedule is invalid
    explicit Segmentation(const Config& config);
    ~Segmentation() = default;

    // 0/255 mask of skin-colored pixels in a BGR image
    static cv::Mat skinColorMask(const cv::Mat& image);

    // Open, close, dilate per the configured schedule
    cv::Mat refineMask(const cv::Mat& mask) const;

    // Skin mask -> refine -> largest component.
    // nullopt when no skin-colored region survives.
    std::optional<cv::Mat> segmentFace(const cv::Mat& image) const;

private:
    Config m_config;
};

} // namespace facecrop
