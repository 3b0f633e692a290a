#include "evaluators/file_size_evaluators.hpp"
#include "common/errors.hpp"
#include "evaluators/image_codec.hpp"

namespace aim {

MetricValues PngFileSizeEvaluator::evaluate(const Artifact& artifact) const {
    if (artifact.mime_type == "image/png") {
        if (artifact.bytes.empty()) {
            throw EvaluationError(EvaluationErrorKind::InvalidInput, "Artifact has no bytes");
        }
        return {static_cast<int64_t>(artifact.bytes.size())};
    }
    return {static_cast<int64_t>(encodePng(requireImage(artifact)).size())};
}

MetricValues JpegFileSizeEvaluator::evaluate(const Artifact& artifact) const {
    return {static_cast<int64_t>(encodeJpeg(requireImage(artifact), kJpegQuality).size())};
}

} // namespace aim
