#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace aim {

enum class ValueType {
    INTEGER,
    FLOAT,
    IMAGE_BLOB
};

enum class VisualizationType {
    TABLE,
    IMAGE
};

/// Declared cost rating of a metric. Higher is faster.
enum class Speed {
    SLOW = 0,
    MEDIUM = 1,
    FAST = 2
};

// ─── Score Band ────────────────────────────────────────────────
// A labeled numeric range. An unset bound is unbounded on that side.

struct ScoreBand {
    std::string id;
    std::optional<double> min;
    std::optional<double> max;
    std::string judgment;      // e.g. "good", "normal", "bad"
    std::string description;   // e.g. "Suitable", "Fair", "Huge"
    std::string icon;          // optional, empty when absent

    /// min <= value <= max, with an unbounded end always satisfied.
    bool contains(double value) const {
        if (min && value < *min) return false;
        if (max && value > *max) return false;
        return true;
    }
};

// ─── Result Descriptor ─────────────────────────────────────────

struct ResultDescriptor {
    std::string id;
    size_t index = 0;
    ValueType type = ValueType::FLOAT;
    std::string name;
    std::string description;           // optional, empty when absent
    std::vector<ScoreBand> scores;     // declared order; empty for image blobs
};

// ─── Category ──────────────────────────────────────────────────

struct CategoryDescriptor {
    std::string id;
    std::string name;
    std::string icon;
};

// ─── Metric Descriptor ─────────────────────────────────────────

struct MetricDescriptor {
    std::string id;
    std::string category_id;
    std::string name;
    std::string description;
    int evidence = 1;      // [1, 5]
    int relevance = 1;     // [1, 5]
    Speed speed = Speed::MEDIUM;
    VisualizationType visualization = VisualizationType::TABLE;
    std::vector<ResultDescriptor> results;   // sorted by index after load

    /// Position in the registry document. Assigned by the registry.
    size_t registration_order = 0;
};

const char* toString(ValueType type);
const char* toString(VisualizationType type);

} // namespace aim
