#pragma once

#include "registry/metric_descriptor.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace aim {

// ─── Metric Registry ───────────────────────────────────────────
// Immutable catalog of metric, result and score-band definitions.
// Validated once at load time; every failure raises RegistryError so
// an invalid document prevents startup. After load the registry is
// only read, and is shared between sessions without locking
// (std::shared_ptr<const MetricRegistry>).

class MetricRegistry {
public:
    /// Parse and validate a registry document:
    ///   { "categories": [...], "metrics": { id -> descriptor } }
    /// Key order of "metrics" is the registration order.
    static MetricRegistry loadFromString(const std::string& json_text);

    static MetricRegistry loadFromFile(const std::string& path);

    /// Validate already-built descriptors. Registration order is the
    /// vector order. An empty category list disables category checks.
    static MetricRegistry fromDescriptors(std::vector<MetricDescriptor> metrics,
                                          std::vector<CategoryDescriptor> categories = {});

    /// Look up a metric by id. Returns nullptr when not found.
    const MetricDescriptor* lookup(const std::string& id) const;

    bool contains(const std::string& id) const { return lookup(id) != nullptr; }

    /// Metrics of one category, in registration order.
    std::vector<const MetricDescriptor*> listByCategory(const std::string& category_id) const;

    /// All metrics in registration order.
    const std::vector<MetricDescriptor>& metrics() const { return metrics_; }

    const std::vector<CategoryDescriptor>& categories() const { return categories_; }

    size_t count() const { return metrics_.size(); }

private:
    MetricRegistry() = default;

    std::vector<MetricDescriptor> metrics_;
    std::vector<CategoryDescriptor> categories_;
    std::unordered_map<std::string, size_t> id_index_;
};

} // namespace aim
