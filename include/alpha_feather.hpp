#pragma once

#include "face_cropper.hpp"

namespace facecrop {

constexpr double kMaxFeatherRatio = 0.98;

// Clamp to [0, kMaxFeatherRatio]. NaN throws std::invalid_argument.
double clampFeatherRatio(double ratio);

// Opacity in [0, 1] at normalized radius rho: opaque up to innerRatio,
// linear ramp down to zero at rho = 1
double featherOpacity(double rho, double innerRatio);

// CV_8UC1 radial ramp filling the given size. The normalization uses each
// axis' own half extent, so non-square sizes give an elliptical falloff.
cv::Mat featheredAlpha(const cv::Size& size, double innerRatio);

} // namespace facecrop
