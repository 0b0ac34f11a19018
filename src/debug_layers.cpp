#include "debug_layers.hpp"
#include <opencv2/imgproc.hpp>
#include <vector>

namespace facecrop {

cv::Mat renderMaskPreview(const cv::Mat& componentMask, const cv::Size& frame) {
    if (componentMask.empty()) {
        return cv::Mat::zeros(frame, CV_8UC1);
    }
    return componentMask.clone();
}

cv::Mat renderBoundsOverlay(const cv::Mat& bgr, const CropBox& box) {
    cv::Mat overlay;
    cv::cvtColor(bgr, overlay, cv::COLOR_BGR2BGRA);

    std::vector<cv::Mat> channels;
    cv::split(overlay, channels);
    channels[3].setTo(cv::Scalar(kOverlayAlpha));
    cv::merge(channels, overlay);

    if (!box.empty()) {
        cv::rectangle(overlay,
                      cv::Point(box.left, box.top),
                      cv::Point(box.right - 1, box.bottom - 1),
                      cv::Scalar(0, 0, 255, 255), 1);
    }

    return overlay;
}

} // namespace facecrop
