#include "registry/metric_registry.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>
#include <unordered_set>

namespace aim {

namespace {

using json = nlohmann::ordered_json;

// ─── Band checks ───────────────────────────────────────────────

double lowerOf(const ScoreBand& b) {
    return b.min ? *b.min : -std::numeric_limits<double>::infinity();
}

double upperOf(const ScoreBand& b) {
    return b.max ? *b.max : std::numeric_limits<double>::infinity();
}

std::string where(const MetricDescriptor& m, const ResultDescriptor& r) {
    return "metric '" + m.id + "', result '" + r.id + "'";
}

void validateBands(const MetricDescriptor& m, const ResultDescriptor& r) {
    if (r.type == ValueType::IMAGE_BLOB && !r.scores.empty()) {
        throw RegistryError(where(m, r) + ": image results cannot declare score bands");
    }

    std::unordered_set<std::string> band_ids;
    for (size_t j = 0; j < r.scores.size(); j++) {
        const ScoreBand& band = r.scores[j];
        if (!band_ids.insert(band.id).second) {
            throw RegistryError(where(m, r) + ": duplicate band id '" + band.id + "'");
        }
        if (band.min && band.max && *band.min > *band.max) {
            throw RegistryError(where(m, r) + ", band '" + band.id + "': min > max");
        }
        // First match wins, so a band inside an earlier one can never match.
        for (size_t i = 0; i < j; i++) {
            const ScoreBand& earlier = r.scores[i];
            if (lowerOf(earlier) <= lowerOf(band) && upperOf(band) <= upperOf(earlier)) {
                throw RegistryError(where(m, r) + ", band '" + band.id +
                                    "' is shadowed by earlier band '" + earlier.id + "'");
            }
        }
    }
}

void validateMetric(MetricDescriptor& m,
                    const std::unordered_set<std::string>& category_ids) {
    if (m.id.empty()) {
        throw RegistryError("Metric with empty id");
    }
    if (m.evidence < 1 || m.evidence > 5) {
        throw RegistryError("metric '" + m.id + "': evidence must be in [1, 5]");
    }
    if (m.relevance < 1 || m.relevance > 5) {
        throw RegistryError("metric '" + m.id + "': relevance must be in [1, 5]");
    }
    if (!category_ids.empty() && category_ids.count(m.category_id) == 0) {
        throw RegistryError("metric '" + m.id + "': unknown category '" + m.category_id + "'");
    }
    if (m.results.empty()) {
        throw RegistryError("metric '" + m.id + "': no results declared");
    }

    // Indices must be exactly 0..N-1.
    std::vector<bool> seen(m.results.size(), false);
    std::unordered_set<std::string> result_ids;
    for (const auto& r : m.results) {
        if (r.index >= m.results.size()) {
            throw RegistryError(where(m, r) + ": index " + std::to_string(r.index) +
                                " out of range (non-contiguous indices)");
        }
        if (seen[r.index]) {
            throw RegistryError(where(m, r) + ": duplicate index " + std::to_string(r.index));
        }
        seen[r.index] = true;
        if (!result_ids.insert(r.id).second) {
            throw RegistryError(where(m, r) + ": duplicate result id");
        }
        validateBands(m, r);
    }

    std::sort(m.results.begin(), m.results.end(),
              [](const ResultDescriptor& a, const ResultDescriptor& b) {
                  return a.index < b.index;
              });
}

// ─── JSON parsing ──────────────────────────────────────────────

std::string optionalText(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null() || j.at(key).is_boolean()) return "";
    if (!j.at(key).is_string()) {
        throw RegistryError(std::string("'") + key + "' must be a string");
    }
    return j.at(key).get<std::string>();
}

template <typename T>
T required(const json& j, const char* key, const std::string& context) {
    if (!j.contains(key)) {
        throw RegistryError(context + ": missing '" + key + "'");
    }
    try {
        return j.at(key).get<T>();
    } catch (const json::exception&) {
        throw RegistryError(context + ": '" + key + "' has the wrong type");
    }
}

/// Icons are either a plain string or a [prefix, name] pair with nulls.
std::string parseIcon(const json& j) {
    if (!j.contains("icon") || j.at("icon").is_null()) return "";
    const json& icon = j.at("icon");
    if (icon.is_string()) return icon.get<std::string>();
    if (icon.is_array()) {
        std::string out;
        for (const auto& part : icon) {
            if (!part.is_string()) return "";
            if (!out.empty()) out += " ";
            out += part.get<std::string>();
        }
        return out;
    }
    throw RegistryError("'icon' must be a string or a list");
}

std::optional<double> parseBound(const json& v, const std::string& context) {
    if (v.is_null()) return std::nullopt;
    if (!v.is_number()) {
        throw RegistryError(context + ": range bounds must be numbers or null");
    }
    return v.get<double>();
}

ScoreBand parseBand(const json& j, const std::string& context) {
    if (!j.is_object()) throw RegistryError(context + ": score band must be an object");
    ScoreBand band;
    band.id = required<std::string>(j, "id", context);
    std::string band_ctx = context + ", band '" + band.id + "'";

    const json& range = j.contains("range") ? j.at("range") : json();
    if (!range.is_array() || range.size() != 2) {
        throw RegistryError(band_ctx + ": 'range' must be [min, max]");
    }
    band.min = parseBound(range[0], band_ctx);
    band.max = parseBound(range[1], band_ctx);
    band.judgment = optionalText(j, "judgment");
    band.description = optionalText(j, "description");
    band.icon = parseIcon(j);
    return band;
}

ValueType parseValueType(const std::string& s, const std::string& context) {
    if (s == "int" || s == "integer") return ValueType::INTEGER;
    if (s == "float") return ValueType::FLOAT;
    if (s == "b64" || s == "image") return ValueType::IMAGE_BLOB;
    throw RegistryError(context + ": unknown result type '" + s + "'");
}

ResultDescriptor parseResult(const json& j, const std::string& metric_id) {
    std::string context = "metric '" + metric_id + "'";
    if (!j.is_object()) throw RegistryError(context + ": result must be an object");

    ResultDescriptor r;
    r.id = required<std::string>(j, "id", context);
    context += ", result '" + r.id + "'";
    long long index = required<long long>(j, "index", context);
    if (index < 0) throw RegistryError(context + ": negative index");
    r.index = static_cast<size_t>(index);
    r.type = parseValueType(required<std::string>(j, "type", context), context);
    r.name = required<std::string>(j, "name", context);
    r.description = optionalText(j, "description");

    if (j.contains("scores")) {
        if (!j.at("scores").is_array()) throw RegistryError(context + ": 'scores' must be a list");
        for (const auto& band : j.at("scores")) {
            r.scores.push_back(parseBand(band, context));
        }
    }
    return r;
}

MetricDescriptor parseMetric(const std::string& key, const json& j) {
    std::string context = "metric '" + key + "'";
    if (!j.is_object()) throw RegistryError(context + " must be an object");

    MetricDescriptor m;
    m.id = required<std::string>(j, "id", context);
    if (m.id != key) {
        throw RegistryError(context + ": id '" + m.id + "' does not match its key");
    }
    m.category_id = required<std::string>(j, "category", context);
    m.name = required<std::string>(j, "name", context);
    m.description = optionalText(j, "description");
    m.evidence = required<int>(j, "evidence", context);
    m.relevance = required<int>(j, "relevance", context);

    int speed = required<int>(j, "speed", context);
    if (speed < 0 || speed > 2) {
        throw RegistryError(context + ": speed must be 0 (slow), 1 (medium) or 2 (fast)");
    }
    m.speed = static_cast<Speed>(speed);

    std::string vis = required<std::string>(j, "visualizationType", context);
    if (vis == "table") {
        m.visualization = VisualizationType::TABLE;
    } else if (vis == "image" || vis == "b64") {
        m.visualization = VisualizationType::IMAGE;
    } else {
        throw RegistryError(context + ": unknown visualizationType '" + vis + "'");
    }

    if (!j.contains("results") || !j.at("results").is_array()) {
        throw RegistryError(context + ": 'results' must be a list");
    }
    for (const auto& r : j.at("results")) {
        m.results.push_back(parseResult(r, m.id));
    }
    return m;
}

} // namespace

// ─── MetricRegistry ────────────────────────────────────────────

MetricRegistry MetricRegistry::fromDescriptors(std::vector<MetricDescriptor> metrics,
                                               std::vector<CategoryDescriptor> categories) {
    MetricRegistry registry;

    std::unordered_set<std::string> category_ids;
    for (const auto& c : categories) {
        if (!category_ids.insert(c.id).second) {
            throw RegistryError("Duplicate category id '" + c.id + "'");
        }
    }

    for (size_t i = 0; i < metrics.size(); i++) {
        MetricDescriptor& m = metrics[i];
        validateMetric(m, category_ids);
        if (registry.id_index_.count(m.id) > 0) {
            throw RegistryError("Duplicate metric id '" + m.id + "'");
        }
        m.registration_order = i;
        registry.id_index_[m.id] = i;
    }

    registry.metrics_ = std::move(metrics);
    registry.categories_ = std::move(categories);
    return registry;
}

MetricRegistry MetricRegistry::loadFromString(const std::string& json_text) {
    // Repeated keys inside "metrics" would silently overwrite each other
    // in the parsed document, so they are collected while parsing.
    std::string current_root_key;
    std::unordered_set<std::string> metric_keys;
    std::vector<std::string> duplicates;

    json::parser_callback_t track_keys =
        [&](int depth, json::parse_event_t event, json& parsed) {
            if (event == json::parse_event_t::key) {
                if (depth == 1) {
                    current_root_key = parsed.get<std::string>();
                } else if (depth == 2 && current_root_key == "metrics") {
                    std::string key = parsed.get<std::string>();
                    if (!metric_keys.insert(key).second) duplicates.push_back(key);
                }
            }
            return true;
        };

    json doc;
    try {
        doc = json::parse(json_text, track_keys);
    } catch (const json::parse_error& e) {
        throw RegistryError(std::string("Malformed registry document: ") + e.what());
    }
    if (!duplicates.empty()) {
        throw RegistryError("Duplicate metric id '" + duplicates.front() + "'");
    }
    if (!doc.is_object() || !doc.contains("metrics") || !doc.at("metrics").is_object()) {
        throw RegistryError("Registry document must contain a 'metrics' object");
    }

    std::vector<CategoryDescriptor> categories;
    if (doc.contains("categories")) {
        if (!doc.at("categories").is_array()) {
            throw RegistryError("'categories' must be a list");
        }
        for (const auto& c : doc.at("categories")) {
            if (!c.is_object()) throw RegistryError("category must be an object");
            CategoryDescriptor cat;
            cat.id = required<std::string>(c, "id", "category");
            cat.name = optionalText(c, "name");
            cat.icon = parseIcon(c);
            categories.push_back(std::move(cat));
        }
    }

    std::vector<MetricDescriptor> metrics;
    for (const auto& item : doc.at("metrics").items()) {
        metrics.push_back(parseMetric(item.key(), item.value()));
    }

    MetricRegistry registry = fromDescriptors(std::move(metrics), std::move(categories));
    logger()->info("Metric registry loaded: {} metrics, {} categories",
                   registry.count(), registry.categories().size());
    return registry;
}

MetricRegistry MetricRegistry::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw RegistryError("Cannot open registry document: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return loadFromString(buffer.str());
}

const MetricDescriptor* MetricRegistry::lookup(const std::string& id) const {
    auto it = id_index_.find(id);
    return (it != id_index_.end()) ? &metrics_[it->second] : nullptr;
}

std::vector<const MetricDescriptor*> MetricRegistry::listByCategory(
    const std::string& category_id) const {
    std::vector<const MetricDescriptor*> result;
    for (const auto& m : metrics_) {
        if (m.category_id == category_id) {
            result.push_back(&m);
        }
    }
    return result;
}

const char* toString(ValueType type) {
    switch (type) {
        case ValueType::INTEGER:    return "int";
        case ValueType::FLOAT:      return "float";
        case ValueType::IMAGE_BLOB: return "b64";
    }
    return "unknown";
}

const char* toString(VisualizationType type) {
    switch (type) {
        case VisualizationType::TABLE: return "table";
        case VisualizationType::IMAGE: return "image";
    }
    return "unknown";
}

} // namespace aim
