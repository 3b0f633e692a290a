#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace aim {

// ─── Scheduling Policy ─────────────────────────────────────────
// Order in which queued tasks are handed to free workers.

enum class SchedulingPolicy {
    SPEED_FIRST,   // higher declared speed first, then registration order
    FIFO           // registration order only
};

// ─── Artifact Limits ───────────────────────────────────────────

struct ArtifactLimits {
    size_t max_bytes = 20 * 1024 * 1024;
    int min_width = 1;
    int min_height = 1;
    int max_width = 16384;
    int max_height = 16384;
    std::vector<std::string> allowed_mime_types = {"image/png", "image/jpeg"};

    /// Optional viewport crop (top-left anchored). Both set or both unset.
    std::optional<int> crop_width;
    std::optional<int> crop_height;

    bool allowsMimeType(const std::string& mime_type) const;
};

// ─── Engine Config ─────────────────────────────────────────────

struct EngineConfig {
    int workers = 0;                  // 0 = hardware concurrency
    int task_timeout_ms = 60000;
    SchedulingPolicy scheduling = SchedulingPolicy::SPEED_FIRST;
    int display_precision = 2;
    std::string log_level = "info";
    std::string registry_path;        // empty = not configured
    ArtifactLimits artifact;

    /// Worker count with 0 resolved to the available CPU parallelism.
    size_t resolvedWorkers() const;

    /// Parse a JSON document. Missing keys keep their defaults.
    /// Throws ConfigError on malformed JSON, wrong types or bad values.
    static EngineConfig fromJsonString(const std::string& text);

    /// Load from a file. A relative registry path is resolved against
    /// the directory of the config file.
    static EngineConfig loadFromFile(const std::string& path);
};

const char* toString(SchedulingPolicy policy);

} // namespace aim
