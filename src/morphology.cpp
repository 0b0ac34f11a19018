#include "morphology.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace facecrop {

namespace {

enum class MorphOp {
    ERODE,
    DILATE
};

inline bool windowHit(int count, int kernelSize, MorphOp op) {
    return op == MorphOp::ERODE ? count == kernelSize : count > 0;
}

// Sliding k-wide window along each row. Out-of-frame columns never count,
// so an erode window touching the border can't reach k.
cv::Mat rowPass(const cv::Mat& src, const MorphKernel& kernel, MorphOp op) {
    const int radius = kernel.radius();
    cv::Mat dst(src.size(), CV_8UC1);

    for (int y = 0; y < src.rows; y++) {
        const uchar* in = src.ptr<uchar>(y);
        uchar* out = dst.ptr<uchar>(y);

        int count = 0;
        for (int x = 0; x <= radius && x < src.cols; x++) {
            count += in[x] != 0;
        }

        for (int x = 0; x < src.cols; x++) {
            out[x] = windowHit(count, kernel.size(), op) ? 255 : 0;

            int enter = x + radius + 1;
            if (enter < src.cols) count += in[enter] != 0;
            int leave = x - radius;
            if (leave >= 0) count -= in[leave] != 0;
        }
    }

    return dst;
}

// Same window down each column, with one running count per column
cv::Mat columnPass(const cv::Mat& src, const MorphKernel& kernel, MorphOp op) {
    const int radius = kernel.radius();
    cv::Mat dst(src.size(), CV_8UC1);
    std::vector<int> counts(static_cast<size_t>(src.cols), 0);

    auto accumulate = [&](int row, int delta) {
        const uchar* in = src.ptr<uchar>(row);
        for (int x = 0; x < src.cols; x++) {
            if (in[x]) counts[x] += delta;
        }
    };

    for (int y = 0; y <= radius && y < src.rows; y++) {
        accumulate(y, 1);
    }

    for (int y = 0; y < src.rows; y++) {
        uchar* out = dst.ptr<uchar>(y);
        for (int x = 0; x < src.cols; x++) {
            out[x] = windowHit(counts[x], kernel.size(), op) ? 255 : 0;
        }

        int enter = y + radius + 1;
        if (enter < src.rows) accumulate(enter, 1);
        int leave = y - radius;
        if (leave >= 0) accumulate(leave, -1);
    }

    return dst;
}

// The square window is the product of a row and a column window, so
// "all set" and "any set" both split into two 1-D passes.
cv::Mat morph(const cv::Mat& mask, const MorphKernel& kernel, MorphOp op) {
    CV_Assert(mask.type() == CV_8UC1);
    return columnPass(rowPass(mask, kernel, op), kernel, op);
}

} // anonymous namespace

MorphKernel::MorphKernel(int size) : m_size(size) {
    if (size <= 0 || size % 2 == 0) {
        throw std::invalid_argument("Kernel size must be odd and positive, got " + std::to_string(size));
    }
}

cv::Mat erodeMask(const cv::Mat& mask, const MorphKernel& kernel) {
    return morph(mask, kernel, MorphOp::ERODE);
}

cv::Mat dilateMask(const cv::Mat& mask, const MorphKernel& kernel, int iterations) {
    if (iterations < 1) {
        throw std::invalid_argument("Dilate iterations must be at least 1, got " + std::to_string(iterations));
    }

    cv::Mat result = morph(mask, kernel, MorphOp::DILATE);
    for (int i = 1; i < iterations; i++) {
        result = morph(result, kernel, MorphOp::DILATE);
    }
    return result;
}

cv::Mat openMask(const cv::Mat& mask, const MorphKernel& kernel) {
    return dilateMask(erodeMask(mask, kernel), kernel);
}

cv::Mat closeMask(const cv::Mat& mask, const MorphKernel& kernel) {
    return erodeMask(dilateMask(mask, kernel), kernel);
}

void validateSchedule(const MorphSchedule& schedule) {
    const MorphKernel openKernel(schedule.openKernel);
    const MorphKernel closeKernel(schedule.closeKernel);
    const MorphKernel dilateKernel(schedule.dilateKernel);
    if (schedule.dilateIterations < 1) {
        throw std::invalid_argument("Dilate iterations must be at least 1, got " +
                                    std::to_string(schedule.dilateIterations));
    }
}

cv::Mat refineMask(const cv::Mat& mask, const MorphSchedule& schedule) {
    cv::Mat clean = openMask(mask, MorphKernel(schedule.openKernel));
    clean = closeMask(clean, MorphKernel(schedule.closeKernel));
    return dilateMask(clean, MorphKernel(schedule.dilateKernel), schedule.dilateIterations);
}

} // namespace facecrop
