#pragma once

#include "classify/classifier.hpp"
#include "common/errors.hpp"
#include "evaluators/result_value.hpp"

#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace aim {

// ─── Task Outcome ──────────────────────────────────────────────
// Typed result of one metric's task. Failures carry no values.

struct ResultEntry {
    std::string result_id;
    size_t index = 0;
    ResultValue value;
    std::optional<Judgment> judgment;   // numeric results only
    std::string display;                // presentation formatting
};

struct TaskOutcome {
    std::string metric_id;
    bool success = false;
    std::vector<ResultEntry> results;
    std::optional<EvaluationErrorKind> error_kind;
    std::string error_message;
    double elapsed_seconds = 0.0;

    static TaskOutcome succeeded(std::string metric_id, std::vector<ResultEntry> results,
                                 double elapsed_seconds) {
        TaskOutcome o;
        o.metric_id = std::move(metric_id);
        o.success = true;
        o.results = std::move(results);
        o.elapsed_seconds = elapsed_seconds;
        return o;
    }

    static TaskOutcome failed(std::string metric_id, EvaluationErrorKind kind,
                              std::string message, double elapsed_seconds) {
        TaskOutcome o;
        o.metric_id = std::move(metric_id);
        o.error_kind = kind;
        o.error_message = std::move(message);
        o.elapsed_seconds = elapsed_seconds;
        return o;
    }
};

// ─── Session Events ────────────────────────────────────────────
// Outbound stream of one session. Per session either a single
// ValidationError or GeneralError, or a sequence of MetricResult
// events followed by exactly one SessionComplete.

struct MetricResultEvent {
    std::string session_id;
    TaskOutcome outcome;
};

struct ValidationErrorEvent {
    std::string session_id;
    std::string message;
};

struct GeneralErrorEvent {
    std::string session_id;
    std::string message;
};

struct SessionCompleteEvent {
    std::string session_id;
};

using SessionEvent = std::variant<MetricResultEvent, ValidationErrorEvent,
                                  GeneralErrorEvent, SessionCompleteEvent>;

const std::string& sessionIdOf(const SessionEvent& event);

// ─── Event Sink ────────────────────────────────────────────────
// The transport side. Events of one session are delivered one at a
// time, never concurrently.

class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void onEvent(const SessionEvent& event) = 0;
};

class CallbackEventSink : public EventSink {
public:
    using Callback = std::function<void(const SessionEvent&)>;

    explicit CallbackEventSink(Callback callback) : callback_(std::move(callback)) {}

    void onEvent(const SessionEvent& event) override { callback_(event); }

private:
    Callback callback_;
};

} // namespace aim
