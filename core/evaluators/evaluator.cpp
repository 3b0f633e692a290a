#include "evaluators/evaluator.hpp"
#include "common/errors.hpp"

namespace aim {

const cv::Mat& requireImage(const Artifact& artifact) {
    if (!artifact.decoded() || artifact.image.type() != CV_8UC3) {
        throw EvaluationError(EvaluationErrorKind::InvalidInput,
                              "Artifact has no decoded 8-bit BGR image");
    }
    return artifact.image;
}

} // namespace aim
