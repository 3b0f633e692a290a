#pragma once

#include "evaluators/result_value.hpp"
#include <opencv2/core.hpp>
#include <cstdint>
#include <vector>

namespace aim {

/// PNG compression level used for every re-encoding.
constexpr int kPngCompression = 6;

/// JPEG quality used for re-encoding (file size metric).
constexpr int kJpegQuality = 70;

/// Encode to PNG. Throws EvaluationError(ComputationFailure) on failure.
std::vector<uint8_t> encodePng(const cv::Mat& image);

/// Encode to JPEG. Throws EvaluationError(ComputationFailure) on failure.
std::vector<uint8_t> encodeJpeg(const cv::Mat& image, int quality = kJpegQuality);

/// Encode to PNG and wrap as a base64 image value.
Base64Image toBase64Png(const cv::Mat& image);

} // namespace aim
