#pragma once

#include "session/session_events.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace aim {

// ─── Evaluation Session ────────────────────────────────────────
// Progress of one request. Created by the Dispatcher and passed by
// handle. State is written only through begin/recordOutcome/reject/
// fail/abort, which the Dispatcher calls from a single aggregator thread
// (reject/fail happen before any task exists); readers may query from
// any thread. The lock covers the state update only, never an
// evaluator call.
//
// Invariants:
//   completedCount() <= submittedCount()
//   SessionComplete is emitted exactly once, when they become equal.

class EvaluationSession {
public:
    EvaluationSession(std::string id, std::shared_ptr<EventSink> sink);

    EvaluationSession(const EvaluationSession&) = delete;
    EvaluationSession& operator=(const EvaluationSession&) = delete;

    const std::string& id() const { return id_; }

    size_t submittedCount() const;
    size_t completedCount() const;

    /// True once a terminal event was delivered, or after cancel().
    bool isTerminal() const;

    bool isCancelled() const { return cancelled_.load(); }

    /// Outcome of one metric, if it has completed.
    std::optional<TaskOutcome> outcome(const std::string& metric_id) const;

    /// Snapshot of all completed outcomes, keyed by metric id.
    std::map<std::string, TaskOutcome> results() const;

    /// Message of a ValidationError / GeneralError, if the whole
    /// request was rejected.
    std::optional<std::string> errorMessage() const;

    /// Block until the session is terminal. Returns false on timeout.
    bool waitUntilTerminal(std::chrono::milliseconds timeout) const;

    /// Client went away: pending tasks are dropped and late results
    /// are discarded without being delivered.
    void cancel();

    // ── Aggregator side ──

    /// Tasks were scheduled. A session with nothing to do completes
    /// immediately. No-op on a session cancelled in the meantime.
    void begin(size_t submitted_count);

    /// Apply one task outcome and emit its MetricResult, followed by
    /// SessionComplete when it was the last one.
    void recordOutcome(TaskOutcome outcome);

    /// Whole request rejected before any task started.
    void reject(const std::string& message);

    /// Infrastructure failure before any task started.
    void fail(const std::string& message);

    /// Infrastructure failure after begin(): emits GeneralError in place
    /// of SessionComplete and discards every later outcome.
    void abort(const std::string& message);

private:
    void emit(const SessionEvent& event);
    void deliver(const SessionEvent& event);
    void markTerminal();

    const std::string id_;
    std::shared_ptr<EventSink> sink_;

    mutable std::mutex mutex_;
    mutable std::condition_variable terminal_cv_;
    size_t submitted_ = 0;
    size_t completed_ = 0;
    bool started_ = false;
    bool terminal_ = false;
    std::map<std::string, TaskOutcome> results_;
    std::optional<std::string> error_message_;
    std::atomic<bool> cancelled_{false};
};

} // namespace aim
