#include "evaluators/artifact.hpp"
#include "common/base64.hpp"
#include "common/errors.hpp"
#include "evaluators/image_codec.hpp"

#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <limits>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace aim {

std::string sniffMimeType(const std::vector<uint8_t>& bytes) {
    static const uint8_t kPng[] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    if (bytes.size() >= sizeof(kPng) &&
        std::equal(std::begin(kPng), std::end(kPng), bytes.begin())) {
        return "image/png";
    }
    if (bytes.size() >= 3 && bytes[0] == 0xFF && bytes[1] == 0xD8 && bytes[2] == 0xFF) {
        return "image/jpeg";
    }
    return "";
}

namespace {

uint32_t readBigEndian(const std::vector<uint8_t>& bytes, size_t pos, size_t width) {
    uint32_t value = 0;
    for (size_t i = 0; i < width; i++) value = (value << 8) | bytes[pos + i];
    return value;
}

std::optional<cv::Size> pngSize(const std::vector<uint8_t>& bytes) {
    // Signature, then IHDR: length, "IHDR", width, height
    if (bytes.size() < 24 || std::memcmp(&bytes[12], "IHDR", 4) != 0) return std::nullopt;
    uint32_t width = readBigEndian(bytes, 16, 4);
    uint32_t height = readBigEndian(bytes, 20, 4);
    const uint32_t limit = static_cast<uint32_t>(std::numeric_limits<int>::max());
    if (width > limit || height > limit) return std::nullopt;
    return cv::Size(static_cast<int>(width), static_cast<int>(height));
}

std::optional<cv::Size> jpegSize(const std::vector<uint8_t>& bytes) {
    size_t pos = 2;
    while (pos + 4 <= bytes.size()) {
        if (bytes[pos] != 0xFF) return std::nullopt;
        uint8_t marker = bytes[pos + 1];
        if (marker == 0xFF) {
            pos++;
            continue;
        }
        // Standalone markers carry no length
        if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) {
            pos += 2;
            continue;
        }
        if (marker == 0xD9 || marker == 0xDA) return std::nullopt;

        size_t length = readBigEndian(bytes, pos + 2, 2);
        bool frame = marker >= 0xC0 && marker <= 0xCF && marker != 0xC4 && marker != 0xC8 &&
                     marker != 0xCC;
        if (frame) {
            if (pos + 9 > bytes.size()) return std::nullopt;
            int height = static_cast<int>(readBigEndian(bytes, pos + 5, 2));
            int width = static_cast<int>(readBigEndian(bytes, pos + 7, 2));
            return cv::Size(width, height);
        }
        if (length < 2) return std::nullopt;
        pos += 2 + length;
    }
    return std::nullopt;
}

std::optional<std::string> checkDimensions(int width, int height, const ArtifactLimits& limits) {
    if (width < limits.min_width || height < limits.min_height) {
        return "Image is too small (min " + std::to_string(limits.min_width) + " x " +
               std::to_string(limits.min_height) + " pixels): " + std::to_string(width) + " x " +
               std::to_string(height) + " pixels";
    }
    if (width > limits.max_width || height > limits.max_height) {
        return "Image is too large (max " + std::to_string(limits.max_width) + " x " +
               std::to_string(limits.max_height) + " pixels): " + std::to_string(width) + " x " +
               std::to_string(height) + " pixels";
    }
    return std::nullopt;
}

} // namespace

std::optional<cv::Size> readImageSize(const std::vector<uint8_t>& bytes) {
    const std::string mime = sniffMimeType(bytes);
    if (mime == "image/png") return pngSize(bytes);
    if (mime == "image/jpeg") return jpegSize(bytes);
    return std::nullopt;
}

Artifact parseDataUrl(const std::string& data_url) {
    const std::string prefix = "data:";
    const std::string marker = ";base64,";
    if (data_url.compare(0, prefix.size(), prefix) != 0) {
        throw ArtifactError("Not a data URL");
    }
    size_t pos = data_url.find(marker);
    if (pos == std::string::npos) {
        throw ArtifactError("Data URL is not base64-encoded");
    }

    Artifact artifact;
    artifact.mime_type = data_url.substr(prefix.size(), pos - prefix.size());
    try {
        artifact.bytes = base64Decode(data_url.substr(pos + marker.size()));
    } catch (const std::invalid_argument& e) {
        throw ArtifactError(std::string("Data URL payload: ") + e.what());
    }
    return artifact;
}

std::optional<std::string> decodeArtifact(Artifact& artifact, const ArtifactLimits& limits) {
    if (!limits.allowsMimeType(artifact.mime_type)) {
        return "Unsupported image type: '" + artifact.mime_type + "'";
    }
    if (artifact.bytes.empty()) {
        return std::string("Image is empty");
    }
    if (artifact.bytes.size() > limits.max_bytes) {
        return "Image is too large: " + std::to_string(artifact.bytes.size()) +
               " bytes (max " + std::to_string(limits.max_bytes) + ")";
    }
    if (sniffMimeType(artifact.bytes) != artifact.mime_type) {
        return "Image content does not match its type '" + artifact.mime_type + "'";
    }

    // Limits apply before decoding, so a small file declaring huge
    // dimensions is never allocated.
    std::optional<cv::Size> declared = readImageSize(artifact.bytes);
    if (!declared) {
        return std::string("Image could not be decoded: unreadable header");
    }
    if (auto error = checkDimensions(declared->width, declared->height, limits)) {
        return error;
    }

    cv::Mat decoded;
    try {
        decoded = cv::imdecode(artifact.bytes, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        return std::string("Image could not be decoded: ") + e.what();
    }
    if (decoded.empty()) {
        return std::string("Image could not be decoded");
    }

    if (auto error = checkDimensions(decoded.cols, decoded.rows, limits)) {
        return error;
    }

    if (limits.crop_width && limits.crop_height &&
        (decoded.cols > *limits.crop_width || decoded.rows > *limits.crop_height)) {
        cv::Rect viewport(0, 0, std::min(decoded.cols, *limits.crop_width),
                          std::min(decoded.rows, *limits.crop_height));
        decoded = decoded(viewport).clone();
        try {
            artifact.bytes = encodePng(decoded);
        } catch (const EvaluationError& e) {
            return std::string("Image could not be cropped: ") + e.what();
        }
        artifact.mime_type = "image/png";
    }

    artifact.image = decoded;
    return std::nullopt;
}

Artifact FileArtifactResolver::resolve(const std::string& locator) const {
    std::filesystem::path path(locator);
    if (path.is_relative() && !base_dir_.empty()) {
        path = std::filesystem::path(base_dir_) / path;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ArtifactError("Cannot read artifact: " + path.string());
    }

    Artifact artifact;
    artifact.bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw ArtifactError("I/O error while reading artifact: " + path.string());
    }
    artifact.mime_type = sniffMimeType(artifact.bytes);
    if (artifact.mime_type.empty()) {
        throw ArtifactError("Unrecognized image format: " + path.string());
    }
    return artifact;
}

} // namespace aim
