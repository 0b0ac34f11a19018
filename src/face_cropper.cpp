#include "face_cropper.hpp"
#include "alpha_feather.hpp"
#include "box_geometry.hpp"
#include "debug_layers.hpp"
#include "segmentation.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace facecrop {

namespace {

// Bring supported inputs to 3-channel BGR without copying when already there
cv::Mat toBgr(const cv::Mat& image) {
    if (image.empty()) {
        throw std::invalid_argument("Input image is empty");
    }
    if (image.depth() != CV_8U) {
        throw std::invalid_argument("Input image must be 8-bit");
    }

    cv::Mat bgr;
    switch (image.channels()) {
        case 1:
            cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
            break;
        case 3:
            bgr = image;
            break;
        case 4:
            cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
            break;
        default:
            throw std::invalid_argument("Unsupported channel count: " + std::to_string(image.channels()));
    }
    return bgr;
}

void validateExpansion(const ExpansionFactors& factors) {
    for (double f : {factors.top, factors.bottom, factors.side}) {
        if (!std::isfinite(f) || f < 0.0) {
            throw std::invalid_argument("Expansion factors must be finite and non-negative");
        }
    }
}

} // anonymous namespace

CropBox CropBox::clamp(int frameHeight, int frameWidth) const {
    CropBox clamped;
    clamped.top = std::max(top, 0);
    clamped.bottom = std::min(bottom, frameHeight);
    clamped.left = std::max(left, 0);
    clamped.right = std::min(right, frameWidth);
    return clamped;
}

bool operator==(const CropBox& a, const CropBox& b) {
    return a.top == b.top && a.bottom == b.bottom && a.left == b.left && a.right == b.right;
}

bool operator!=(const CropBox& a, const CropBox& b) {
    return !(a == b);
}

std::ostream& operator<<(std::ostream& os, const CropBox& box) {
    return os << "[top=" << box.top << " bottom=" << box.bottom
              << " left=" << box.left << " right=" << box.right << "]";
}

cv::Mat composeRgba(const cv::Mat& bgr, const cv::Mat& alpha) {
    if (bgr.size() != alpha.size()) {
        throw std::invalid_argument("Crop and alpha map differ in size");
    }
    CV_Assert(bgr.type() == CV_8UC3 && alpha.type() == CV_8UC1);

    std::vector<cv::Mat> channels;
    cv::split(bgr, channels);
    channels.push_back(alpha);

    cv::Mat rgba;
    cv::merge(channels, rgba);
    return rgba;
}

CropBox fallbackCropBox(const cv::Size& frame, int biasDivisor) {
    if (biasDivisor <= 0) {
        throw std::invalid_argument("Fallback bias divisor must be positive");
    }

    const int side = std::min(frame.width, frame.height);
    CropBox box;
    box.left = (frame.width - side) / 2;
    // Portrait subjects sit in the upper part of the frame
    box.top = std::max((frame.height - side) / 2 - side / biasDivisor, 0);
    box.right = box.left + side;
    box.bottom = box.top + side;
    return box;
}

FaceCropper::FaceCropper(const Config& config) : m_config(config) {
    m_config.featherRatio = clampFeatherRatio(config.featherRatio);
    if (m_config.featherRatio != config.featherRatio) {
        std::cerr << "Warning: feather ratio " << config.featherRatio
                  << " clamped to " << m_config.featherRatio << std::endl;
    }
    validateExpansion(m_config.expansion);
    if (m_config.fallbackBiasDivisor <= 0) {
        throw std::invalid_argument("Fallback bias divisor must be positive");
    }

    m_segmentation = std::make_unique<Segmentation>(m_config);
}

FaceCropper::~FaceCropper() = default;

CropResult FaceCropper::cropToFace(const cv::Mat& image) const {
    cv::Mat bgr = toBgr(image);

    std::optional<cv::Mat> component = m_segmentation->segmentFace(bgr);
    if (!component) {
        if (m_config.verbose) {
            std::cout << "No skin region found, using centered crop" << std::endl;
        }
        return cropFallback(bgr);
    }

    std::optional<CropBox> box = computeCropBox(*component, m_config.expansion);
    if (!box || box->empty()) {
        std::cerr << "Warning: crop box collapsed, using centered crop" << std::endl;
        return cropFallback(bgr);
    }

    if (m_config.verbose) {
        std::cout << "Crop box: " << *box << std::endl;
    }
    return cropRegion(bgr, *box, *component, false);
}

CropResult FaceCropper::cropFallback(const cv::Mat& bgr) const {
    CropBox box = fallbackCropBox(bgr.size(), m_config.fallbackBiasDivisor);
    return cropRegion(bgr, box, cv::Mat(), true);
}

CropResult FaceCropper::cropRegion(const cv::Mat& bgr, const CropBox& box,
                                   const cv::Mat& componentMask, bool fallback) const {
    cv::Mat crop = bgr(box.toRect());
    cv::Mat alpha = featheredAlpha(crop.size(), m_config.featherRatio);

    CropResult result;
    result.rgba = composeRgba(crop, alpha);
    result.box = box;
    result.usedFallback = fallback;

    if (m_config.debugMasks) {
        result.debug.maskPreview = renderMaskPreview(componentMask, bgr.size());
        result.debug.boundsOverlay = renderBoundsOverlay(bgr, box);
        result.debug.cropped = result.rgba.clone();
    }

    return result;
}

CropResult cropToFace(const cv::Mat& image, double featherRatio, bool emitDebug) {
    Config config;
    config.featherRatio = featherRatio;
    config.debugMasks = emitDebug;
    FaceCropper cropper(config);
    return cropper.cropToFace(image);
}

} // namespace facecrop
