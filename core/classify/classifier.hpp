#pragma once

#include "registry/metric_descriptor.hpp"
#include "evaluators/result_value.hpp"
#include <optional>
#include <string>
#include <vector>

namespace aim {

/// Qualitative judgment of a raw value: the band it fell into.
struct Judgment {
    std::string band_id;
    std::string label;         // band judgment, e.g. "good"
    std::string description;   // e.g. "Suitable"
    std::string icon;

    bool operator==(const Judgment& other) const {
        return band_id == other.band_id && label == other.label &&
               description == other.description && icon == other.icon;
    }
};

/// Classify a value against score bands. Bands are tested in declared
/// order and the first band with min <= value <= max wins (an unbounded
/// end always matches). Returns nullopt when no band matches or value
/// is NaN. Always uses the full-precision value.
std::optional<Judgment> classify(double value, const std::vector<ScoreBand>& bands);

/// Classify a ResultValue. Image blobs are never classified.
std::optional<Judgment> classify(const ResultValue& value, const std::vector<ScoreBand>& bands);

/// Presentation only: integers as-is, floats with a fixed number of
/// decimals, images as "<image>" or "" when empty.
std::string formatValue(const ResultValue& value, int precision);

} // namespace aim
