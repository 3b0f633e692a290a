#pragma once

#include "evaluators/artifact.hpp"
#include "evaluators/result_value.hpp"
#include <string>

namespace aim {

// ─── Evaluator ─────────────────────────────────────────────────
// Abstract base class for one metric's computation.
//
// Contract:
//   - pure with respect to the artifact (never mutates it),
//   - deterministic for identical bytes,
//   - returns exactly the values declared by the metric's result
//     descriptors, in index order,
//   - signals errors by throwing EvaluationError.
// Implementations are called concurrently from worker threads.

class Evaluator {
public:
    virtual ~Evaluator() = default;

    /// Id of the metric this evaluator implements.
    virtual std::string metricId() const = 0;

    /// Compute the metric for a decoded artifact.
    virtual MetricValues evaluate(const Artifact& artifact) const = 0;
};

/// The decoded image of an artifact. Throws
/// EvaluationError(InvalidInput) when the artifact was never decoded.
const cv::Mat& requireImage(const Artifact& artifact);

} // namespace aim
