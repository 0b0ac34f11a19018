#include "alpha_feather.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace facecrop {

double clampFeatherRatio(double ratio) {
    if (std::isnan(ratio)) {
        throw std::invalid_argument("Feather ratio must be a number");
    }
    return std::clamp(ratio, 0.0, kMaxFeatherRatio);
}

double featherOpacity(double rho, double innerRatio) {
    const double outer = 1.0;
    if (rho <= innerRatio) return 1.0;
    if (rho >= outer) return 0.0;
    return std::clamp((outer - rho) / (outer - innerRatio), 0.0, 1.0);
}

cv::Mat featheredAlpha(const cv::Size& size, double innerRatio) {
    const double inner = clampFeatherRatio(innerRatio);
    cv::Mat alpha(size, CV_8UC1);

    const double cy = (size.height - 1) / 2.0;
    const double cx = (size.width - 1) / 2.0;
    const double halfH = size.height / 2.0;
    const double halfW = size.width / 2.0;

    for (int y = 0; y < size.height; y++) {
        const double dy = (y - cy) / halfH;
        uchar* out = alpha.ptr<uchar>(y);
        for (int x = 0; x < size.width; x++) {
            const double dx = (x - cx) / halfW;
            const double rho = std::sqrt(dx * dx + dy * dy);
            // Truncate, so only the plateau reaches 255
            out[x] = static_cast<uchar>(featherOpacity(rho, inner) * 255.0);
        }
    }

    return alpha;
}

} // namespace facecrop
