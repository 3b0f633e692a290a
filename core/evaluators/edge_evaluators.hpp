#pragma once

#include "evaluators/evaluator.hpp"

namespace aim {

/// pf1: edge density, the share of Canny edge pixels after a 7x7
/// Gaussian blur (sigma 1) of the grayscale image (Rosenholtz et al.).
class EdgeDensityEvaluator : public Evaluator {
public:
    static constexpr double kCannyLow = 0.11;
    static constexpr double kCannyHigh = 0.27;

    std::string metricId() const override { return "pf1"; }
    MetricValues evaluate(const Artifact& artifact) const override;
};

/// pf2: edge congestion, the share of colour-border pixels that have
/// another border pixel within kCriticalSpacing in all four directions.
/// A border pixel differs by more than kChannelDelta in some channel
/// from a 4-neighbour.
class EdgeCongestionEvaluator : public Evaluator {
public:
    static constexpr int kChannelDelta = 50;
    static constexpr int kCriticalSpacing = 4;

    std::string metricId() const override { return "pf2"; }
    MetricValues evaluate(const Artifact& artifact) const override;
};

/// pf4: figure-ground contrast. Edges are counted over kLevels Canny
/// threshold levels of a progressively blurred grayscale image; edges
/// lost at low levels weigh more.
class FigureGroundContrastEvaluator : public Evaluator {
public:
    static constexpr int kLevels = 7;

    std::string metricId() const override { return "pf4"; }
    MetricValues evaluate(const Artifact& artifact) const override;
};

/// pf5: pixel symmetry (Miniukovich & De Angeli 2014). Canny edges are
/// thinned to one pixel per kThinRadius neighbourhood, then each edge
/// pixel of the left half is matched against its vertical and
/// horizontal mirror within kSymmetryRadius.
class PixelSymmetryEvaluator : public Evaluator {
public:
    static constexpr int kThinRadius = 3;
    static constexpr int kSymmetryRadius = 4;

    std::string metricId() const override { return "pf5"; }
    MetricValues evaluate(const Artifact& artifact) const override;
};

} // namespace aim
