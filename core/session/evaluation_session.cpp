#include "session/evaluation_session.hpp"
#include "common/logging.hpp"

#include <stdexcept>

namespace aim {

const std::string& sessionIdOf(const SessionEvent& event) {
    return std::visit([](const auto& e) -> const std::string& { return e.session_id; }, event);
}

EvaluationSession::EvaluationSession(std::string id, std::shared_ptr<EventSink> sink)
    : id_(std::move(id)), sink_(std::move(sink)) {}

size_t EvaluationSession::submittedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return submitted_;
}

size_t EvaluationSession::completedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

bool EvaluationSession::isTerminal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminal_;
}

std::optional<TaskOutcome> EvaluationSession::outcome(const std::string& metric_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = results_.find(metric_id);
    if (it == results_.end()) return std::nullopt;
    return it->second;
}

std::map<std::string, TaskOutcome> EvaluationSession::results() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_;
}

std::optional<std::string> EvaluationSession::errorMessage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_message_;
}

bool EvaluationSession::waitUntilTerminal(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return terminal_cv_.wait_for(lock, timeout, [this] { return terminal_; });
}

void EvaluationSession::cancel() {
    if (cancelled_.exchange(true)) return;
    logger()->debug("Session {} cancelled", id_);
    markTerminal();
}

void EvaluationSession::begin(size_t submitted_count) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.load()) {
            logger()->debug("Session {} cancelled before its tasks were scheduled", id_);
            return;
        }
        if (started_ || terminal_) {
            throw std::logic_error("Session " + id_ + " already started");
        }
        started_ = true;
        submitted_ = submitted_count;
    }
    if (submitted_count == 0 && !isCancelled()) {
        emit(SessionCompleteEvent{id_});
        markTerminal();
    }
}

void EvaluationSession::recordOutcome(TaskOutcome outcome) {
    bool complete = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.load()) {
            logger()->debug("Session {}: discarding late result of {}", id_, outcome.metric_id);
            return;
        }
        if (!started_ || terminal_ || completed_ >= submitted_) {
            logger()->error("Session {}: unexpected result of {} ignored", id_, outcome.metric_id);
            return;
        }
        if (results_.count(outcome.metric_id) > 0) {
            logger()->error("Session {}: duplicate result of {} ignored", id_, outcome.metric_id);
            return;
        }
        results_[outcome.metric_id] = outcome;
        completed_++;
        complete = (completed_ == submitted_);
    }

    emit(MetricResultEvent{id_, std::move(outcome)});
    if (complete) {
        emit(SessionCompleteEvent{id_});
        markTerminal();
    }
}

void EvaluationSession::reject(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_ || terminal_) {
            throw std::logic_error("Session " + id_ + " cannot be rejected after it started");
        }
        error_message_ = message;
    }
    logger()->warn("Session {} rejected: {}", id_, message);
    emit(ValidationErrorEvent{id_, message});
    markTerminal();
}

void EvaluationSession::fail(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_ || terminal_) {
            throw std::logic_error("Session " + id_ + " cannot fail after it started");
        }
        error_message_ = message;
    }
    logger()->warn("Session {} failed: {}", id_, message);
    emit(GeneralErrorEvent{id_, message});
    markTerminal();
}

void EvaluationSession::abort(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (terminal_ || cancelled_.load()) return;
        error_message_ = message;
        cancelled_.store(true);
    }
    logger()->warn("Session {} aborted: {}", id_, message);
    deliver(GeneralErrorEvent{id_, message});
    markTerminal();
}

void EvaluationSession::emit(const SessionEvent& event) {
    if (isCancelled()) return;
    deliver(event);
}

void EvaluationSession::deliver(const SessionEvent& event) {
    if (!sink_) return;
    try {
        sink_->onEvent(event);
    } catch (const std::exception& e) {
        logger()->error("Session {}: event sink failed: {}", id_, e.what());
    }
}

void EvaluationSession::markTerminal() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        terminal_ = true;
    }
    terminal_cv_.notify_all();
}

} // namespace aim
