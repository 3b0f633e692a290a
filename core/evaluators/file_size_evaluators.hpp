#pragma once

#include "evaluators/evaluator.hpp"

namespace aim {

/// cp1: PNG file size in bytes. The artifact's own size when it is a
/// PNG, otherwise the size of its PNG re-encoding.
class PngFileSizeEvaluator : public Evaluator {
public:
    std::string metricId() const override { return "cp1"; }
    MetricValues evaluate(const Artifact& artifact) const override;
};

/// pf3: size in bytes of the JPEG re-encoding at kJpegQuality.
class JpegFileSizeEvaluator : public Evaluator {
public:
    std::string metricId() const override { return "pf3"; }
    MetricValues evaluate(const Artifact& artifact) const override;
};

} // namespace aim
