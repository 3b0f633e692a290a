#pragma once

#include <stdexcept>
#include <string>

namespace aim {

/// Invalid registry document. Raised at load time; the process must not start.
class RegistryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Invalid engine configuration.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The artifact could not be obtained or decoded.
class ArtifactError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed client request message.
class RequestError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ─── Evaluation Error ──────────────────────────────────────────
// Raised by evaluators. Never crosses a task boundary: the worker
// converts it into a failed TaskOutcome.

enum class EvaluationErrorKind {
    InvalidInput,
    ComputationFailure,
    Timeout
};

const char* toString(EvaluationErrorKind kind);

class EvaluationError : public std::runtime_error {
public:
    EvaluationError(EvaluationErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    EvaluationErrorKind kind() const { return kind_; }

private:
    EvaluationErrorKind kind_;
};

} // namespace aim
