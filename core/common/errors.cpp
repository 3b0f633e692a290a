#include "common/errors.hpp"

namespace aim {

const char* toString(EvaluationErrorKind kind) {
    switch (kind) {
        case EvaluationErrorKind::InvalidInput:       return "invalid_input";
        case EvaluationErrorKind::ComputationFailure: return "computation_failure";
        case EvaluationErrorKind::Timeout:            return "timeout";
    }
    return "unknown";
}

} // namespace aim
