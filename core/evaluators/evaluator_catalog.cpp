#include "evaluators/evaluator_catalog.hpp"
#include <stdexcept>

namespace aim {

void EvaluatorCatalog::registerEvaluator(std::unique_ptr<Evaluator> evaluator) {
    if (!evaluator) {
        throw std::invalid_argument("Cannot register a null evaluator");
    }
    std::string id = evaluator->metricId();
    if (evaluators_.count(id) > 0) {
        throw std::invalid_argument("Evaluator already registered for metric '" + id + "'");
    }
    evaluators_[id] = std::shared_ptr<const Evaluator>(std::move(evaluator));
    ids_.push_back(id);
}

std::shared_ptr<const Evaluator> EvaluatorCatalog::find(const std::string& metric_id) const {
    auto it = evaluators_.find(metric_id);
    return (it != evaluators_.end()) ? it->second : nullptr;
}

} // namespace aim
