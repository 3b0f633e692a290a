#pragma once

#include "evaluators/evaluator_catalog.hpp"

namespace aim {

/// Register every built-in metric implementation.
void registerDefaultEvaluators(EvaluatorCatalog& catalog);

} // namespace aim
