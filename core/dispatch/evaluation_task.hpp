#pragma once

#include "evaluators/evaluator.hpp"
#include "registry/metric_descriptor.hpp"
#include "session/evaluation_session.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace aim {

enum class TaskState {
    PENDING,
    RUNNING,
    COMPLETED
};

const char* toString(TaskState state);

/// Shape check at the task-completion boundary: the values must match
/// the declared result descriptors in count and type. Returns the
/// mismatch description, or nullopt when the shape is correct.
std::optional<std::string> checkShape(const MetricDescriptor& metric, const MetricValues& values);

/// Starts an evaluator computation off the calling thread. Throws
/// (std::system_error) when it cannot.
using ComputationLauncher = std::function<void(std::function<void()>)>;

/// Runs each computation on a new detached thread.
ComputationLauncher detachedThreadLauncher();

// ─── Evaluation Task ───────────────────────────────────────────
// One metric's unit of work: Pending -> Running -> Completed.
// Owned by the dispatcher's queued job, never shared across tasks.

class EvaluationTask {
public:
    EvaluationTask(std::shared_ptr<EvaluationSession> session,
                   const MetricDescriptor& metric,
                   std::shared_ptr<const Evaluator> evaluator,
                   ArtifactPtr artifact,
                   uint64_t sequence,
                   ComputationLauncher launcher = detachedThreadLauncher());

    /// Run the evaluator under the timeout, then check the shape and
    /// classify numeric values. Never throws for evaluator errors:
    /// every failure becomes a failed TaskOutcome.
    ///
    /// The evaluator runs on its own thread. When the timeout expires
    /// the task completes with Timeout and returns; the computation
    /// keeps running in the background and its result is dropped.
    TaskOutcome run(std::chrono::milliseconds timeout, int display_precision);

    TaskState state() const { return state_; }
    const std::string& metricId() const { return metric_.id; }
    const MetricDescriptor& metric() const { return metric_; }
    uint64_t sequence() const { return sequence_; }
    const std::shared_ptr<EvaluationSession>& session() const { return session_; }

private:
    TaskOutcome complete(TaskOutcome outcome);

    std::shared_ptr<EvaluationSession> session_;
    const MetricDescriptor& metric_;
    std::shared_ptr<const Evaluator> evaluator_;
    ArtifactPtr artifact_;
    uint64_t sequence_;
    ComputationLauncher launcher_;
    TaskState state_ = TaskState::PENDING;
};

} // namespace aim
