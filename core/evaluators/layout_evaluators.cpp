#include "evaluators/layout_evaluators.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <array>
#include <functional>
#include <cmath>

namespace aim {

namespace {

constexpr double kEpsilon = 1e-12;

/// Σ p·log p of a density histogram scaled by 100.
double histogramEntropy(const std::vector<int64_t>& counts, double bin_width, int64_t total) {
    double sum = 0.0;
    for (int64_t n : counts) {
        double p = static_cast<double>(n) / (static_cast<double>(total) * bin_width) * 100.0;
        p += kEpsilon;
        sum += p * std::log(p);
    }
    return sum;
}

int binOf(double value, double upper, int bins) {
    int bin = static_cast<int>(value / upper * bins);
    return std::clamp(bin, 0, bins - 1);
}

/// Hue and saturation entropy of a float HSV region.
double colourEntropy(const cv::Mat& hsv) {
    constexpr int kHueBins = 30;
    constexpr int kSaturationBins = 32;
    std::vector<int64_t> hue(kHueBins, 0);
    std::vector<int64_t> saturation(kSaturationBins, 0);

    for (int y = 0; y < hsv.rows; y++) {
        const cv::Vec3f* row = hsv.ptr<cv::Vec3f>(y);
        for (int x = 0; x < hsv.cols; x++) {
            hue[binOf(row[x][0], 360.0, kHueBins)]++;
            saturation[binOf(row[x][1] * 100.0, 100.0, kSaturationBins)]++;
        }
    }

    int64_t total = static_cast<int64_t>(hsv.total());
    return std::abs(histogramEntropy(hue, 360.0 / kHueBins, total) +
                    histogramEntropy(saturation, 100.0 / kSaturationBins, total)) / 2.0;
}

/// Lightness entropy of a float Lab region.
double intensityEntropy(const cv::Mat& lab) {
    constexpr int kLightnessBins = 20;
    std::vector<int64_t> lightness(kLightnessBins, 0);

    for (int y = 0; y < lab.rows; y++) {
        const cv::Vec3f* row = lab.ptr<cv::Vec3f>(y);
        for (int x = 0; x < lab.cols; x++) {
            lightness[binOf(row[x][0], 100.0, kLightnessBins)]++;
        }
    }
    return histogramEntropy(lightness, 100.0 / kLightnessBins,
                            static_cast<int64_t>(lab.total()));
}

struct Midpoint {
    double dx;
    double dy;
};

Midpoint offsetFromCentre(const QuadLeaf& leaf, int width, int height) {
    return {leaf.x + leaf.width / 2.0 - width / 2.0, leaf.y + leaf.height / 2.0 - height / 2.0};
}

double imbalance(double a, double b) {
    double scale = std::max(std::abs(a), std::abs(b));
    return scale > 0.0 ? (a - b) / scale : 0.0;
}

void normalize(std::array<double, 4>& values) {
    double top = *std::max_element(values.begin(), values.end());
    if (top <= 0.0) return;
    for (double& v : values) v /= top;
}

} // namespace

// ─── Decomposition ─────────────────────────────────────────────

std::vector<QuadLeaf> QuadtreeEvaluator::decompose(const cv::Mat& image) const {
    cv::Mat unit;
    image.convertTo(unit, CV_32FC3, 1.0 / 255.0);
    cv::Mat hsv, lab;
    cv::cvtColor(unit, hsv, cv::COLOR_BGR2HSV);
    cv::cvtColor(unit, lab, cv::COLOR_BGR2Lab);

    std::vector<QuadLeaf> leaves;
    std::function<void(const cv::Rect&, int)> split = [&](const cv::Rect& region, int depth) {
        bool busy = colourEntropy(hsv(region)) < kColourEntropyThreshold ||
                    intensityEntropy(lab(region)) > kIntensityEntropyThreshold ||
                    depth < kMinDepth;
        int half_w = region.width / 2;
        int half_h = region.height / 2;

        if (!busy || half_w <= kMinLeafSide || half_h <= kMinLeafSide) {
            leaves.push_back({region.x, region.y, region.width, region.height});
            return;
        }

        // Top-left, bottom-left, top-right, bottom-right
        int rest_w = region.width - half_w;
        int rest_h = region.height - half_h;
        split({region.x, region.y, half_w, half_h}, depth + 1);
        split({region.x, region.y + half_h, half_w, rest_h}, depth + 1);
        split({region.x + half_w, region.y, rest_w, half_h}, depth + 1);
        split({region.x + half_w, region.y + half_h, rest_w, rest_h}, depth + 1);
    };
    split({0, 0, image.cols, image.rows}, 0);
    return leaves;
}

// ─── Scores ────────────────────────────────────────────────────

double QuadtreeEvaluator::balance(const std::vector<QuadLeaf>& leaves, int width, int height) {
    double top = 0.0, bottom = 0.0, left = 0.0, right = 0.0;
    for (const auto& leaf : leaves) {
        double area = static_cast<double>(leaf.width) * leaf.height;
        Midpoint d = offsetFromCentre(leaf, width, height);
        (d.dx > 0.0 ? right : left) += std::abs(d.dx) * area;
        (d.dy > 0.0 ? bottom : top) += std::abs(d.dy) * area;
    }
    return 1.0 - (std::abs(imbalance(top, bottom)) + std::abs(imbalance(left, right))) / 2.0;
}

double QuadtreeEvaluator::equilibrium(const std::vector<QuadLeaf>& leaves, int width, int height) {
    if (leaves.empty()) return 1.0;

    double total_area = 0.0, sum_x = 0.0, sum_y = 0.0;
    for (const auto& leaf : leaves) {
        double area = static_cast<double>(leaf.width) * leaf.height;
        Midpoint d = offsetFromCentre(leaf, width, height);
        total_area += area;
        sum_x += area * std::abs(d.dx);
        sum_y += area * std::abs(d.dy);
    }
    double n = static_cast<double>(leaves.size());
    double em_x = 2.0 * sum_x / (width * n * total_area);
    double em_y = 2.0 * sum_y / (height * n * total_area);
    return 1.0 - (std::abs(em_x) + std::abs(em_y)) / 2.0;
}

double QuadtreeEvaluator::symmetry(const std::vector<QuadLeaf>& leaves, int width, int height) {
    // Quadrants: upper-left, upper-right, lower-left, lower-right
    std::array<double, 4> xs{}, ys{}, hs{}, bs{}, ts{}, rs{};
    for (const auto& leaf : leaves) {
        Midpoint d = offsetFromCentre(leaf, width, height);
        int q = (d.dy > 0.0 ? 2 : 0) + (d.dx > 0.0 ? 1 : 0);

        xs[q] += std::abs(d.dx);
        ys[q] += std::abs(d.dy);
        hs[q] += leaf.height;
        bs[q] += leaf.width;
        if (d.dx != 0.0) ts[q] += std::abs(d.dy) / std::abs(d.dx);
        rs[q] += std::sqrt(d.dx * d.dx + d.dy * d.dy);
    }

    std::array<std::array<double, 4>*, 6> measures = {&xs, &ys, &hs, &bs, &ts, &rs};
    for (auto* m : measures) normalize(*m);

    auto difference = [&](int a, int b, int c, int d) {
        double sum = 0.0;
        for (auto* m : measures) {
            sum += std::abs((*m)[a] - (*m)[b]) + std::abs((*m)[c] - (*m)[d]);
        }
        return sum / 12.0;
    };

    double vertical = difference(0, 1, 2, 3);
    double horizontal = difference(0, 2, 1, 3);
    double rotational = difference(0, 3, 1, 2);
    return 1.0 - (vertical + horizontal + rotational) / 3.0;
}

MetricValues QuadtreeEvaluator::evaluate(const Artifact& artifact) const {
    const cv::Mat& image = requireImage(artifact);
    std::vector<QuadLeaf> leaves = decompose(image);

    return {balance(leaves, image.cols, image.rows),
            symmetry(leaves, image.cols, image.rows),
            equilibrium(leaves, image.cols, image.rows),
            static_cast<int64_t>(leaves.size())};
}

} // namespace aim
