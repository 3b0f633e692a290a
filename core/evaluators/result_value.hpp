#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace aim {

/// Base64-encoded PNG. An empty payload means the view could not be
/// produced for this input; it is forwarded as-is and never classified.
struct Base64Image {
    std::string data;

    bool empty() const { return data.empty(); }
    bool operator==(const Base64Image& other) const { return data == other.data; }
};

/// One raw metric value. The alternative must match the declared
/// ValueType of its ResultDescriptor (INTEGER, FLOAT, IMAGE_BLOB).
using ResultValue = std::variant<int64_t, double, Base64Image>;

/// Values of one metric, in ResultDescriptor index order.
using MetricValues = std::vector<ResultValue>;

} // namespace aim
