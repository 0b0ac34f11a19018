#pragma once

#include "face_cropper.hpp"

namespace facecrop {

// Square structuring element. The side must be odd and positive.
class MorphKernel {
public:
    explicit MorphKernel(int size);

    int size() const { return m_size; }
    int radius() const { return m_size / 2; }

private:
    int m_size;
};

// Binary morphology on 0/255 CV_8UC1 masks. Pixels outside the frame
// count as background for both operations.
cv::Mat erodeMask(const cv::Mat& mask, const MorphKernel& kernel);
cv::Mat dilateMask(const cv::Mat& mask, const MorphKernel& kernel, int iterations = 1);

// Removes specks smaller than the kernel
cv::Mat openMask(const cv::Mat& mask, const MorphKernel& kernel);
// Fills holes smaller than the kernel
cv::Mat closeMask(const cv::Mat& mask, const MorphKernel& kernel);

// Throws std::invalid_argument on an even kernel or a non-positive iteration count
void validateSchedule(const MorphSchedule& schedule);

cv::Mat refineMask(const cv::Mat& mask, const MorphSchedule& schedule);

} // namespace facecrop
