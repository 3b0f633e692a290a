#pragma once

#include "evaluators/artifact.hpp"
#include <string>
#include <variant>
#include <vector>

namespace aim {

/// Reference to an artifact that an ArtifactResolver can obtain.
struct ArtifactLocator {
    std::string locator;
};

/// One client request: the artifact (inline bytes + mime type, or a
/// locator) and the metrics to compute. Repeated ids are allowed and
/// evaluated once. An empty session id gets a generated one.
struct EvaluationRequest {
    std::string session_id;
    std::variant<Artifact, ArtifactLocator> artifact;
    std::vector<std::string> metrics;
};

} // namespace aim
