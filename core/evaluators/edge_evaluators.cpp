#include "evaluators/edge_evaluators.hpp"

#include <opencv2/imgproc.hpp>
#include <cstdlib>
#include <vector>

namespace aim {

namespace {

/// Luma weights 0.2125 R, 0.7154 G, 0.0721 B, as an 8-bit image.
cv::Mat lumaGray(const cv::Mat& image) {
    cv::Mat gray;
    cv::transform(image, gray, cv::Matx13f(0.0721f, 0.7154f, 0.2125f));
    return gray;
}

/// Offsets [begin, end) of a window of radius r around c on an axis
/// of length n, shrunk towards the image edge.
std::pair<int, int> window(int c, int n, int r) {
    int begin = c < r ? -c : -r;
    int end = n - c < r ? n - c : r;
    return {begin, end};
}

bool anyEdgeAround(const cv::Mat& edges, int x, int y, int r) {
    auto [x0, x1] = window(x, edges.cols, r);
    auto [y0, y1] = window(y, edges.rows, r);
    for (int dy = y0; dy < y1; dy++) {
        int yy = y + dy;
        if (yy < 0 || yy >= edges.rows) continue;
        const uchar* row = edges.ptr<uchar>(yy);
        for (int dx = x0; dx < x1; dx++) {
            int xx = x + dx;
            if (xx >= 0 && xx < edges.cols && row[xx]) return true;
        }
    }
    return false;
}

} // namespace

MetricValues EdgeDensityEvaluator::evaluate(const Artifact& artifact) const {
    const cv::Mat& image = requireImage(artifact);

    cv::Mat gray;
    cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    cv::GaussianBlur(gray, gray, cv::Size(7, 7), 1.0);

    cv::Mat edges;
    cv::Canny(gray, edges, kCannyLow, kCannyHigh);

    double density = static_cast<double>(cv::countNonZero(edges)) /
                     static_cast<double>(edges.total());
    return {density};
}

// ─── pf2 ───────────────────────────────────────────────────────

MetricValues EdgeCongestionEvaluator::evaluate(const Artifact& artifact) const {
    const cv::Mat& image = requireImage(artifact);
    const int w = image.cols;
    const int h = image.rows;

    auto differs = [&](int x0, int y0, int x1, int y1) {
        const cv::Vec3b& a = image.at<cv::Vec3b>(y0, x0);
        const cv::Vec3b& b = image.at<cv::Vec3b>(y1, x1);
        for (int c = 0; c < 3; c++) {
            if (std::abs(a[c] - b[c]) > kChannelDelta) return true;
        }
        return false;
    };

    // Column-major scan; a pixel only borders a neighbour not yet marked
    cv::Mat border = cv::Mat::zeros(h, w, CV_8UC1);
    const int nx[] = {1, -1, 0, 0};
    const int ny[] = {0, 0, 1, -1};
    for (int x = 1; x < w - 1; x++) {
        for (int y = 1; y < h - 1; y++) {
            for (int k = 0; k < 4; k++) {
                int xx = x + nx[k];
                int yy = y + ny[k];
                if (border.at<uchar>(yy, xx) == 0 && differs(x, y, xx, yy)) {
                    border.at<uchar>(y, x) = 255;
                    break;
                }
            }
        }
    }

    auto rowSum = [&](int y, int x0, int x1) {
        int sum = 0;
        for (int x = x0; x <= x1; x++) sum += border.at<uchar>(y, x);
        return sum;
    };
    auto columnSum = [&](int x, int y0, int y1) {
        int sum = 0;
        for (int y = y0; y <= y1; y++) sum += border.at<uchar>(y, x);
        return sum;
    };

    const int d = kCriticalSpacing;
    int64_t edges = 0;
    int64_t uncongested = 0;
    for (int x = d; x < w - d; x++) {
        for (int y = d; y < h - d; y++) {
            if (border.at<uchar>(y, x) == 0) continue;
            edges++;
            if (rowSum(y, x + 1, x + d - 1) == 0 || rowSum(y, x - d, x - 2) == 0 ||
                columnSum(x, y + 1, y + d - 1) == 0 || columnSum(x, y - d, y - 2) == 0) {
                uncongested++;
            }
        }
    }

    double congestion = edges > 0
        ? static_cast<double>(edges - uncongested) / static_cast<double>(edges)
        : 0.0;
    return {congestion};
}

// ─── pf4 ───────────────────────────────────────────────────────

MetricValues FigureGroundContrastEvaluator::evaluate(const Artifact& artifact) const {
    cv::Mat gray = lumaGray(requireImage(artifact));

    std::vector<double> counts;
    for (int level = 1; level <= kLevels; level++) {
        cv::GaussianBlur(gray, gray, cv::Size(7, 7), 2.0);
        cv::Mat edges;
        cv::Canny(gray, edges, level * 0.04, level * 0.1);
        counts.push_back(static_cast<double>(cv::countNonZero(edges)));
    }

    double weighted = 0.0;
    for (int i = 0; i + 1 < kLevels; i++) {
        double weight = 1.0 - (static_cast<double>(i) - 1.0) / (kLevels - 1);
        weighted += (counts[i] - counts[i + 1]) * weight;
    }

    double total = counts[0] - counts[kLevels - 2];
    return {total != 0.0 ? weighted / total : 0.0};
}

// ─── pf5 ───────────────────────────────────────────────────────

MetricValues PixelSymmetryEvaluator::evaluate(const Artifact& artifact) const {
    cv::Mat gray = lumaGray(requireImage(artifact));
    cv::GaussianBlur(gray, gray, cv::Size(7, 7), 2.0);

    cv::Mat edges;
    cv::Canny(gray, edges, 0.11, 0.27);
    const int w = edges.cols;
    const int h = edges.rows;

    // Keep one edge pixel per neighbourhood, in scan order
    int64_t all = 0;
    for (int y = 0; y < h; y++) {
        for (int x = 0; x < w; x++) {
            if (!edges.at<uchar>(y, x)) continue;
            all++;
            auto [x0, x1] = window(x, w, kThinRadius);
            auto [y0, y1] = window(y, h, kThinRadius);
            for (int dy = y0; dy < y1; dy++) {
                for (int dx = x0; dx < x1; dx++) {
                    int xx = x + dx;
                    int yy = y + dy;
                    if ((dx || dy) && xx >= 0 && xx < w && yy >= 0 && yy < h) {
                        edges.at<uchar>(yy, xx) = 0;
                    }
                }
            }
        }
    }

    int64_t symmetric = 0;
    for (int y = 0; y < h; y++) {
        for (int x = 0; x < w / 2; x++) {
            if (!edges.at<uchar>(y, x)) continue;
            if (anyEdgeAround(edges, w - x, y, kSymmetryRadius)) symmetric++;
            if (anyEdgeAround(edges, x, h - y, kSymmetryRadius)) symmetric++;
        }
    }

    if (all <= 1) return {0.0};
    double share = static_cast<double>(symmetric) / static_cast<double>(all);
    double area = static_cast<double>(w) * static_cast<double>(h);
    return {share * area / (static_cast<double>(all - 1) * 4.0)};
}

} // namespace aim
