#include "evaluators/image_codec.hpp"
#include "common/base64.hpp"
#include "common/errors.hpp"

#include <opencv2/imgcodecs.hpp>

namespace aim {

namespace {

std::vector<uint8_t> encode(const char* ext, const cv::Mat& image, const std::vector<int>& params) {
    std::vector<uint8_t> buffer;
    bool ok = false;
    try {
        ok = cv::imencode(ext, image, buffer, params);
    } catch (const cv::Exception& e) {
        throw EvaluationError(EvaluationErrorKind::ComputationFailure,
                              std::string("Image encoding failed: ") + e.what());
    }
    if (!ok) {
        throw EvaluationError(EvaluationErrorKind::ComputationFailure,
                              std::string("Image encoding failed (") + ext + ")");
    }
    return buffer;
}

} // namespace

std::vector<uint8_t> encodePng(const cv::Mat& image) {
    return encode(".png", image, {cv::IMWRITE_PNG_COMPRESSION, kPngCompression});
}

std::vector<uint8_t> encodeJpeg(const cv::Mat& image, int quality) {
    return encode(".jpg", image, {cv::IMWRITE_JPEG_QUALITY, quality});
}

Base64Image toBase64Png(const cv::Mat& image) {
    return Base64Image{base64Encode(encodePng(image))};
}

} // namespace aim
