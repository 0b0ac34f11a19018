#include "segmentation.hpp"
#include "components.hpp"
#include "morphology.hpp"
#include <opencv2/imgproc.hpp>
#include <cstdlib>
#include <iostream>

namespace facecrop {

Segmentation::Segmentation(const Config& config) : m_config(config) {
    validateSchedule(m_config.morphology);
}

cv::Mat Segmentation::skinColorMask(const cv::Mat& image) {
    CV_Assert(image.type() == CV_8UC3);

    cv::Mat ycrcb;
    cv::cvtColor(image, ycrcb, cv::COLOR_BGR2YCrCb);

    // Channel order is Y, Cr, Cb
    cv::Mat mask;
    cv::inRange(ycrcb,
                cv::Scalar(skin::kLumaFloor + 1, skin::kCrMin, skin::kCbMin),
                cv::Scalar(255, skin::kCrMax, skin::kCbMax),
                mask);

    for (int y = 0; y < image.rows; y++) {
        const cv::Vec3b* bgr = image.ptr<cv::Vec3b>(y);
        uchar* out = mask.ptr<uchar>(y);
        for (int x = 0; x < image.cols; x++) {
            if (!out[x]) continue;
            const int b = bgr[x][0];
            const int g = bgr[x][1];
            const int r = bgr[x][2];
            bool plausible = r > skin::kRedFloor && g > skin::kGreenFloor && b > skin::kBlueFloor &&
                             std::abs(r - g) > skin::kRedGreenGap;
            if (!plausible) out[x] = 0;
        }
    }

    return mask;
}

cv::Mat Segmentation::refineMask(const cv::Mat& mask) const {
    return facecrop::refineMask(mask, m_config.morphology);
}

std::optional<cv::Mat> Segmentation::segmentFace(const cv::Mat& image) const {
    cv::Mat skinMask = skinColorMask(image);
    cv::Mat refined = refineMask(skinMask);
    std::optional<cv::Mat> component = largestComponent(refined);

    if (m_config.verbose) {
        std::cout << "Segmentation: skin=" << cv::countNonZero(skinMask)
                  << " refined=" << cv::countNonZero(refined)
                  << " regions=" << countComponents(refined)
                  << " kept=" << (component ? cv::countNonZero(*component) : 0) << std::endl;
    }

    return component;
}

} // namespace facecrop
