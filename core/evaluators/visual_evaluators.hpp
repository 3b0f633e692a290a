#pragma once

#include "evaluators/evaluator.hpp"

namespace aim {

/// vg1: saliency heat map (spectral residual, Hou & Zhang 2007) as a
/// colour-mapped PNG. Uniform images have no salient region and yield
/// an empty payload.
class SaliencyEvaluator : public Evaluator {
public:
    /// Width of the downscaled image the spectrum is computed on.
    static constexpr int kSpectrumWidth = 64;

    std::string metricId() const override { return "vg1"; }
    MetricValues evaluate(const Artifact& artifact) const override;
};

/// ac1: colour vision deficiency simulations, in the order
/// deuteranopia, protanopia, tritanopia.
class ColourBlindnessEvaluator : public Evaluator {
public:
    std::string metricId() const override { return "ac1"; }
    MetricValues evaluate(const Artifact& artifact) const override;
};

} // namespace aim
