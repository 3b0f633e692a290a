#pragma once

#include "common/engine_config.hpp"
#include <opencv2/core.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace aim {

// ─── Artifact ──────────────────────────────────────────────────
// The design under evaluation. Raw bytes plus the decoded image,
// which the dispatcher fills in while validating the request.
// Shared read-only between all tasks of a session.

struct Artifact {
    std::string mime_type;
    std::vector<uint8_t> bytes;
    cv::Mat image;   // 8-bit, 3-channel BGR

    int width() const { return image.cols; }
    int height() const { return image.rows; }
    bool decoded() const { return !image.empty(); }
};

using ArtifactPtr = std::shared_ptr<const Artifact>;

/// Mime type from the file signature ("image/png", "image/jpeg"),
/// or empty when unrecognized.
std::string sniffMimeType(const std::vector<uint8_t>& bytes);

/// Pixel dimensions read from the PNG IHDR chunk or the JPEG frame
/// header, without decoding. nullopt when the header is missing or
/// truncated.
std::optional<cv::Size> readImageSize(const std::vector<uint8_t>& bytes);

/// Parse "data:<mime>;base64,<payload>". Throws ArtifactError.
Artifact parseDataUrl(const std::string& data_url);

/// Check the raw artifact against the limits and decode it in place,
/// applying the optional viewport crop. Returns the rejection message,
/// or nullopt when the artifact is acceptable.
std::optional<std::string> decodeArtifact(Artifact& artifact, const ArtifactLimits& limits);

// ─── Artifact Resolver ─────────────────────────────────────────
// Obtains an artifact from an opaque locator. Failures are
// infrastructure-level and raise ArtifactError.

class ArtifactResolver {
public:
    virtual ~ArtifactResolver() = default;

    virtual Artifact resolve(const std::string& locator) const = 0;
};

/// Resolves locators as local file paths, relative to a base directory.
class FileArtifactResolver : public ArtifactResolver {
public:
    explicit FileArtifactResolver(std::string base_dir = "")
        : base_dir_(std::move(base_dir)) {}

    Artifact resolve(const std::string& locator) const override;

private:
    std::string base_dir_;
};

} // namespace aim
