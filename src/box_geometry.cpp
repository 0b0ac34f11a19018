#include "box_geometry.hpp"
#include <algorithm>

namespace facecrop {

std::optional<CropBox> boundingBox(const cv::Mat& mask) {
    CV_Assert(mask.type() == CV_8UC1);

    int minX = mask.cols;
    int maxX = -1;
    int minY = mask.rows;
    int maxY = -1;

    for (int y = 0; y < mask.rows; y++) {
        const uchar* row = mask.ptr<uchar>(y);
        for (int x = 0; x < mask.cols; x++) {
            if (row[x]) {
                minX = std::min(minX, x);
                maxX = std::max(maxX, x);
                minY = std::min(minY, y);
                maxY = std::max(maxY, y);
            }
        }
    }

    if (maxY == -1) {
        return std::nullopt;
    }

    return CropBox{minY, maxY + 1, minX, maxX + 1};
}

CropBox expandBox(const CropBox& face, const ExpansionFactors& factors, const cv::Size& frame) {
    const int faceH = face.height();
    const int faceW = face.width();

    int expandTop = static_cast<int>(faceH * factors.top);
    int expandBottom = static_cast<int>(faceH * factors.bottom);
    int expandSide = static_cast<int>(faceW * factors.side);

    CropBox expanded;
    expanded.top = std::max(face.top - expandTop, 0);
    expanded.bottom = std::min(face.bottom + expandBottom, frame.height);
    expanded.left = std::max(face.left - expandSide, 0);
    expanded.right = std::min(face.right + expandSide, frame.width);
    return expanded;
}

CropBox makeSquare(const CropBox& box, const cv::Size& frame) {
    // A side longer than the short frame edge can't stay square inside it
    const int side = std::min({std::max(box.height(), box.width()), frame.height, frame.width});
    const int centerY = box.top + box.height() / 2;
    const int centerX = box.left + box.width() / 2;
    const int half = side / 2;

    CropBox square;
    square.top = centerY - half;
    square.bottom = square.top + side;
    square.left = centerX - half;
    square.right = square.left + side;

    // Shift back inside the frame, keeping the side
    if (square.top < 0) {
        square.bottom -= square.top;
        square.top = 0;
    }
    if (square.left < 0) {
        square.right -= square.left;
        square.left = 0;
    }
    if (square.bottom > frame.height) {
        square.top -= square.bottom - frame.height;
        square.bottom = frame.height;
    }
    if (square.right > frame.width) {
        square.left -= square.right - frame.width;
        square.right = frame.width;
    }

    return square.clamp(frame.height, frame.width);
}

std::optional<CropBox> computeCropBox(const cv::Mat& componentMask, const ExpansionFactors& factors) {
    std::optional<CropBox> face = boundingBox(componentMask);
    if (!face) {
        return std::nullopt;
    }

    const cv::Size frame = componentMask.size();
    CropBox expanded = expandBox(*face, factors, frame);
    return makeSquare(expanded, frame);
}

} // namespace facecrop
