#pragma once

#include "face_cropper.hpp"

namespace facecrop {

// Largest 8-connected region of a 0/255 mask, as a mask of the same size.
// On equal pixel counts the region reached first in row-major order wins.
// Returns nullopt when the mask has no set pixel.
std::optional<cv::Mat> largestComponent(const cv::Mat& mask);

// Number of 8-connected regions
int countComponents(const cv::Mat& mask);

} // namespace facecrop
