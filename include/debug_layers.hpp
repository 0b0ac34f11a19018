#pragma once

#include "face_cropper.hpp"

namespace facecrop {

constexpr uchar kOverlayAlpha = 120;

// Grayscale copy of the selected mask, or a blank frame when there is none
cv::Mat renderMaskPreview(const cv::Mat& componentMask, const cv::Size& frame);

// Source frame made translucent, with the crop box outlined in opaque red
cv::Mat renderBoundsOverlay(const cv::Mat& bgr, const CropBox& box);

} // namespace facecrop
