#pragma once

#include "evaluators/evaluator.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace aim {

/// Maps metric ids to their evaluator implementations.
/// Populated at startup, read-only afterwards. Evaluators are held by
/// shared_ptr so a timed-out computation keeps its evaluator alive.
class EvaluatorCatalog {
public:
    /// Register an evaluator under its metricId(). Throws
    /// std::invalid_argument if the id is already taken.
    void registerEvaluator(std::unique_ptr<Evaluator> evaluator);

    /// Look up the evaluator for a metric. Returns nullptr if absent.
    std::shared_ptr<const Evaluator> find(const std::string& metric_id) const;

    bool contains(const std::string& metric_id) const { return find(metric_id) != nullptr; }

    /// Registered metric ids, in registration order.
    const std::vector<std::string>& ids() const { return ids_; }

    size_t count() const { return evaluators_.size(); }

private:
    std::unordered_map<std::string, std::shared_ptr<const Evaluator>> evaluators_;
    std::vector<std::string> ids_;
};

} // namespace aim
