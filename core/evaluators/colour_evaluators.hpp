#pragma once

#include "evaluators/evaluator.hpp"

namespace aim {

// ─── Colour perception metrics ─────────────────────────────────
// All statistics are population statistics over every pixel.

/// cp2: number of distinct RGB colours occurring at least
/// kMinOccurrences times (colour reduction for desktop GUIs).
class DistinctRgbEvaluator : public Evaluator {
public:
    static constexpr int kMinOccurrences = 5;

    std::string metricId() const override { return "cp2"; }
    MetricValues evaluate(const Artifact& artifact) const override;
};

/// cp3: circular mean hue (degrees), mean and std of saturation,
/// mean and std of value. S and V in [0, 1].
class HsvAverageEvaluator : public Evaluator {
public:
    std::string metricId() const override { return "cp3"; }
    MetricValues evaluate(const Artifact& artifact) const override;
};

/// cp4: HSV triples occurring more than kMinOccurrences times, then the
/// number of distinct hue, saturation and value levels.
class HsvUniqueEvaluator : public Evaluator {
public:
    static constexpr int kMinOccurrences = 5;

    std::string metricId() const override { return "cp4"; }
    MetricValues evaluate(const Artifact& artifact) const override;
};

/// cp5: mean and std of L*, a*, b* (CIELAB, D65).
class LabAverageEvaluator : public Evaluator {
public:
    std::string metricId() const override { return "cp5"; }
    MetricValues evaluate(const Artifact& artifact) const override;
};

/// cp6: Hasler & Süsstrunk (2003) colourfulness and its opponent
/// colour statistics.
class ColourfulnessEvaluator : public Evaluator {
public:
    std::string metricId() const override { return "cp6"; }
    MetricValues evaluate(const Artifact& artifact) const override;
};

/// cp7: static colour clusters. The RGB cube is sliced into 32 levels
/// per channel; counts the cells holding more than kMinOccurrences pixels.
class StaticClusterEvaluator : public Evaluator {
public:
    static constexpr int kLevels = 32;
    static constexpr int kMinOccurrences = 5;

    std::string metricId() const override { return "cp7"; }
    MetricValues evaluate(const Artifact& artifact) const override;
};

/// cp8: dynamic colour clusters (Miniukovich & De Angeli). Colours seen
/// at least kMinFrequency times are merged, most frequent first, into
/// the first cluster whose centre lies within kMaxDistance in RGB.
/// Returns the number of clusters holding more than kMinColours colours
/// and their average colour count.
class DynamicClusterEvaluator : public Evaluator {
public:
    static constexpr int kMinFrequency = 6;
    static constexpr double kMaxDistance = 3.0;
    static constexpr int kMinColours = 5;

    std::string metricId() const override { return "cp8"; }
    MetricValues evaluate(const Artifact& artifact) const override;
};

/// cp9: standard deviation of Rec. 709 luma.
class LuminanceDeviationEvaluator : public Evaluator {
public:
    std::string metricId() const override { return "cp9"; }
    MetricValues evaluate(const Artifact& artifact) const override;
};

/// cp10: mean WAVE colour preference (Palmer & Schloss 2010). Every
/// pixel takes the score of its nearest of the 32 rated colours.
class WaveEvaluator : public Evaluator {
public:
    std::string metricId() const override { return "cp10"; }
    MetricValues evaluate(const Artifact& artifact) const override;
};

} // namespace aim
