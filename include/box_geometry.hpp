#pragma once

#include "face_cropper.hpp"

namespace facecrop {

// Tight box around the set pixels of a mask, nullopt if none are set
std::optional<CropBox> boundingBox(const cv::Mat& mask);

// Grow each edge by int(factor * face extent), clamped to the frame
CropBox expandBox(const CropBox& face, const ExpansionFactors& factors, const cv::Size& frame);

// Square of side max(h, w) on the box center. When it sticks out of the
// frame it is translated back in, never rescaled. A frame shorter than
// the side caps both extents to its short edge.
CropBox makeSquare(const CropBox& box, const cv::Size& frame);

// bounding box -> expand -> square, for a single-component mask
std::optional<CropBox> computeCropBox(const cv::Mat& componentMask, const ExpansionFactors& factors);

} // namespace facecrop
