#include "classify/classifier.hpp"

#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace aim {

std::optional<Judgment> classify(double value, const std::vector<ScoreBand>& bands) {
    if (std::isnan(value)) return std::nullopt;

    for (const auto& band : bands) {
        if (band.contains(value)) {
            return Judgment{band.id, band.judgment, band.description, band.icon};
        }
    }
    return std::nullopt;
}

std::optional<Judgment> classify(const ResultValue& value, const std::vector<ScoreBand>& bands) {
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return classify(static_cast<double>(*i), bands);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return classify(*d, bands);
    }
    return std::nullopt;
}

std::string formatValue(const ResultValue& value, int precision) {
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return std::to_string(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return fmt::format("{:.{}f}", *d, precision);
    }
    return std::get<Base64Image>(value).empty() ? "" : "<image>";
}

} // namespace aim
