#include "components.hpp"
#include <vector>

namespace facecrop {

namespace {

// Breadth-first labeling over the whole mask. The queue doubles as the
// region's pixel list: once the head reaches the tail it holds every
// flat index of the region, in visit order.
template <typename OnRegion>
void scanComponents(const cv::Mat& mask, OnRegion&& onRegion) {
    CV_Assert(mask.type() == CV_8UC1);

    const int rows = mask.rows;
    const int cols = mask.cols;
    std::vector<uchar> visited(static_cast<size_t>(rows) * cols, 0);
    std::vector<size_t> queue;

    for (int y = 0; y < rows; y++) {
        const uchar* row = mask.ptr<uchar>(y);
        for (int x = 0; x < cols; x++) {
            const size_t start = static_cast<size_t>(y) * cols + x;
            if (!row[x] || visited[start]) continue;

            queue.clear();
            queue.push_back(start);
            visited[start] = 1;

            for (size_t head = 0; head < queue.size(); head++) {
                const int cy = static_cast<int>(queue[head] / cols);
                const int cx = static_cast<int>(queue[head] % cols);

                for (int ny = cy - 1; ny <= cy + 1; ny++) {
                    if (ny < 0 || ny >= rows) continue;
                    const uchar* neighbors = mask.ptr<uchar>(ny);
                    for (int nx = cx - 1; nx <= cx + 1; nx++) {
                        if (nx < 0 || nx >= cols) continue;
                        const size_t idx = static_cast<size_t>(ny) * cols + nx;
                        if (visited[idx] || !neighbors[nx]) continue;
                        visited[idx] = 1;
                        queue.push_back(idx);
                    }
                }
            }

            onRegion(queue);
        }
    }
}

} // anonymous namespace

std::optional<cv::Mat> largestComponent(const cv::Mat& mask) {
    std::vector<size_t> best;

    scanComponents(mask, [&best](std::vector<size_t>& region) {
        // Strictly greater: a later region of equal size never replaces the first
        if (region.size() > best.size()) {
            best.swap(region);
        }
    });

    if (best.empty()) {
        return std::nullopt;
    }

    cv::Mat component = cv::Mat::zeros(mask.size(), CV_8UC1);
    const size_t cols = mask.cols;
    for (size_t idx : best) {
        component.ptr<uchar>(static_cast<int>(idx / cols))[idx % cols] = 255;
    }
    return component;
}

int countComponents(const cv::Mat& mask) {
    int count = 0;
    scanComponents(mask, [&count](std::vector<size_t>&) { count++; });
    return count;
}

} // namespace facecrop
