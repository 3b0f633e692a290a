#include "dispatch/evaluation_task.hpp"
#include "dispatch/task_budget.hpp"
#include "common/logging.hpp"

#include <future>
#include <stdexcept>
#include <thread>

namespace aim {

namespace {

bool matchesType(const ResultValue& value, ValueType type) {
    switch (type) {
        case ValueType::INTEGER:    return std::holds_alternative<int64_t>(value);
        case ValueType::FLOAT:      return std::holds_alternative<double>(value);
        case ValueType::IMAGE_BLOB: return std::holds_alternative<Base64Image>(value);
    }
    return false;
}

const char* typeNameOf(const ResultValue& value) {
    if (std::holds_alternative<int64_t>(value)) return "int";
    if (std::holds_alternative<double>(value)) return "float";
    return "b64";
}

} // namespace

const char* toString(TaskState state) {
    switch (state) {
        case TaskState::PENDING:   return "pending";
        case TaskState::RUNNING:   return "running";
        case TaskState::COMPLETED: return "completed";
    }
    return "unknown";
}

std::optional<std::string> checkShape(const MetricDescriptor& metric, const MetricValues& values) {
    if (values.size() != metric.results.size()) {
        return "expected " + std::to_string(metric.results.size()) + " values, got " +
               std::to_string(values.size());
    }
    for (size_t i = 0; i < values.size(); i++) {
        const ResultDescriptor& r = metric.results[i];
        if (!matchesType(values[i], r.type)) {
            return "value " + std::to_string(i) + " (" + r.id + ") is " + typeNameOf(values[i]) +
                   ", declared " + toString(r.type);
        }
    }
    return std::nullopt;
}

ComputationLauncher detachedThreadLauncher() {
    return [](std::function<void()> computation) {
        std::thread(std::move(computation)).detach();
    };
}

EvaluationTask::EvaluationTask(std::shared_ptr<EvaluationSession> session,
                               const MetricDescriptor& metric,
                               std::shared_ptr<const Evaluator> evaluator,
                               ArtifactPtr artifact,
                               uint64_t sequence,
                               ComputationLauncher launcher)
    : session_(std::move(session)),
      metric_(metric),
      evaluator_(std::move(evaluator)),
      artifact_(std::move(artifact)),
      sequence_(sequence),
      launcher_(std::move(launcher)) {}

TaskOutcome EvaluationTask::run(std::chrono::milliseconds timeout, int display_precision) {
    if (state_ != TaskState::PENDING) {
        throw std::logic_error("Task " + metric_.id + " already " + toString(state_));
    }
    state_ = TaskState::RUNNING;

    TaskBudget budget(timeout);
    budget.start();
    const std::string session_id = session_ ? session_->id() : "";
    logger()->debug("Session {}: running {}", session_id, metric_.id);

    if (!evaluator_ || !artifact_) {
        return complete(TaskOutcome::failed(metric_.id, EvaluationErrorKind::InvalidInput,
                                            "Task has no evaluator or artifact",
                                            budget.elapsedSeconds()));
    }

    // The computation thread owns everything it touches, so it may
    // outlive this task after a timeout.
    auto promise = std::make_shared<std::promise<MetricValues>>();
    std::future<MetricValues> future = promise->get_future();
    try {
        launcher_([promise, evaluator = evaluator_, artifact = artifact_]() {
            try {
                promise->set_value(evaluator->evaluate(*artifact));
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });
    } catch (const std::exception& e) {
        logger()->error("Session {}: could not start {}: {}", session_id, metric_.id, e.what());
        return complete(TaskOutcome::failed(metric_.id, EvaluationErrorKind::ComputationFailure,
                                            std::string("Could not start metric computation: ") +
                                                e.what(),
                                            budget.elapsedSeconds()));
    }

    if (future.wait_for(budget.remaining()) != std::future_status::ready) {
        logger()->warn("Session {}: {} timed out after {} ms", session_id, metric_.id,
                       timeout.count());
        return complete(TaskOutcome::failed(
            metric_.id, EvaluationErrorKind::Timeout,
            "Metric '" + metric_.id + "' exceeded its " + std::to_string(timeout.count()) +
                " ms budget",
            budget.elapsedSeconds()));
    }

    MetricValues values;
    try {
        values = future.get();
    } catch (const EvaluationError& e) {
        logger()->warn("Session {}: {} failed ({}): {}", session_id, metric_.id,
                       toString(e.kind()), e.what());
        return complete(TaskOutcome::failed(metric_.id, e.kind(), e.what(),
                                            budget.elapsedSeconds()));
    } catch (const std::exception& e) {
        logger()->warn("Session {}: {} failed: {}", session_id, metric_.id, e.what());
        return complete(TaskOutcome::failed(metric_.id, EvaluationErrorKind::ComputationFailure,
                                            e.what(), budget.elapsedSeconds()));
    } catch (...) {
        logger()->warn("Session {}: {} failed with a non-standard exception", session_id,
                       metric_.id);
        return complete(TaskOutcome::failed(metric_.id, EvaluationErrorKind::ComputationFailure,
                                            "Unknown error during metric execution",
                                            budget.elapsedSeconds()));
    }

    if (auto mismatch = checkShape(metric_, values)) {
        logger()->warn("Session {}: {} returned a malformed result: {}", session_id,
                       metric_.id, *mismatch);
        return complete(TaskOutcome::failed(metric_.id, EvaluationErrorKind::ComputationFailure,
                                            "Malformed result: " + *mismatch,
                                            budget.elapsedSeconds()));
    }

    std::vector<ResultEntry> entries;
    entries.reserve(values.size());
    for (size_t i = 0; i < values.size(); i++) {
        const ResultDescriptor& r = metric_.results[i];
        ResultEntry entry;
        entry.result_id = r.id;
        entry.index = r.index;
        entry.judgment = classify(values[i], r.scores);
        entry.display = formatValue(values[i], display_precision);
        entry.value = std::move(values[i]);
        entries.push_back(std::move(entry));
    }

    double elapsed = budget.elapsedSeconds();
    logger()->debug("Session {}: {} finished in {:.1f} ms", session_id, metric_.id,
                    elapsed * 1000.0);
    return complete(TaskOutcome::succeeded(metric_.id, std::move(entries), elapsed));
}

TaskOutcome EvaluationTask::complete(TaskOutcome outcome) {
    state_ = TaskState::COMPLETED;
    return outcome;
}

} // namespace aim
