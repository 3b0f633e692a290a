#pragma once

#include "evaluators/evaluator.hpp"

#include <vector>

namespace aim {

// ─── Layout metrics ────────────────────────────────────────────

/// One quadtree leaf, in pixels.
struct QuadLeaf {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
};

/// pf6: quadtree decomposition (Ngo et al. 2003, Zheng et al. 2009).
/// A region splits into four while its colour entropy is low or its
/// intensity entropy high, or it is above kMinDepth, and its halves
/// stay larger than kMinLeafSide. The leaves are scored for balance,
/// symmetry and equilibrium; the fourth value is the leaf count.
class QuadtreeEvaluator : public Evaluator {
public:
    static constexpr double kColourEntropyThreshold = 55.0;
    static constexpr double kIntensityEntropyThreshold = 70.0;
    static constexpr int kMinDepth = 2;
    static constexpr int kMinLeafSide = 8;

    std::string metricId() const override { return "pf6"; }
    MetricValues evaluate(const Artifact& artifact) const override;

    /// Leaves of the decomposition, in depth-first order.
    std::vector<QuadLeaf> decompose(const cv::Mat& image) const;

    // Leaves are assigned to sides and quadrants by their midpoint.
    static double balance(const std::vector<QuadLeaf>& leaves, int width, int height);
    static double symmetry(const std::vector<QuadLeaf>& leaves, int width, int height);
    static double equilibrium(const std::vector<QuadLeaf>& leaves, int width, int height);
};

} // namespace aim
