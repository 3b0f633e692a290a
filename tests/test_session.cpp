#include <gtest/gtest.h>
#include "session/evaluation_session.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <thread>

using namespace aim;
using aim_test::EventRecorder;

static TaskOutcome okOutcome(const std::string& metric_id, int64_t value) {
    ResultEntry entry;
    entry.result_id = metric_id + "_0";
    entry.value = value;
    return TaskOutcome::succeeded(metric_id, {entry}, 0.01);
}

// ─── Completion ───────────────────────────────────────────────

TEST(SessionTest, CompletesExactlyOnceWhenAllOutcomesArrive) {
    auto recorder = std::make_shared<EventRecorder>();
    EvaluationSession session("s1", recorder);
    session.begin(2);
    EXPECT_EQ(session.submittedCount(), 2u);
    EXPECT_FALSE(session.isTerminal());

    session.recordOutcome(okOutcome("a", 1));
    EXPECT_EQ(session.completedCount(), 1u);
    EXPECT_EQ(recorder->count<SessionCompleteEvent>(), 0u);

    session.recordOutcome(okOutcome("b", 2));
    EXPECT_EQ(session.completedCount(), 2u);
    EXPECT_TRUE(session.isTerminal());

    auto events = recorder->events();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<MetricResultEvent>(events[0]));
    EXPECT_TRUE(std::holds_alternative<MetricResultEvent>(events[1]));
    EXPECT_TRUE(std::holds_alternative<SessionCompleteEvent>(events[2]));
    EXPECT_EQ(sessionIdOf(events[2]), "s1");
}

TEST(SessionTest, EmptySessionCompletesImmediately) {
    auto recorder = std::make_shared<EventRecorder>();
    EvaluationSession session("s", recorder);
    session.begin(0);

    EXPECT_TRUE(session.isTerminal());
    ASSERT_EQ(recorder->events().size(), 1u);
    EXPECT_EQ(recorder->count<SessionCompleteEvent>(), 1u);
}

TEST(SessionTest, DuplicateAndExtraOutcomesAreIgnored) {
    auto recorder = std::make_shared<EventRecorder>();
    EvaluationSession session("s", recorder);
    session.begin(2);

    session.recordOutcome(okOutcome("a", 1));
    session.recordOutcome(okOutcome("a", 99));
    EXPECT_EQ(session.completedCount(), 1u);
    EXPECT_EQ(std::get<int64_t>(session.outcome("a")->results[0].value), 1);

    session.recordOutcome(okOutcome("b", 2));
    session.recordOutcome(okOutcome("c", 3));
    EXPECT_EQ(session.completedCount(), 2u);
    EXPECT_LE(session.completedCount(), session.submittedCount());
    EXPECT_EQ(recorder->count<MetricResultEvent>(), 2u);
    EXPECT_EQ(recorder->count<SessionCompleteEvent>(), 1u);
}

TEST(SessionTest, StoresFailedOutcomes) {
    EvaluationSession session("s", nullptr);
    session.begin(1);
    session.recordOutcome(
        TaskOutcome::failed("a", EvaluationErrorKind::Timeout, "too slow", 1.0));

    auto outcome = session.outcome("a");
    ASSERT_TRUE(outcome.has_value());
    EXPECT_FALSE(outcome->success);
    EXPECT_EQ(outcome->error_kind, EvaluationErrorKind::Timeout);
    EXPECT_TRUE(outcome->results.empty());
    EXPECT_TRUE(session.isTerminal());
    EXPECT_FALSE(session.outcome("b").has_value());
}

// ─── Request-level errors ─────────────────────────────────────

TEST(SessionTest, RejectEmitsSingleValidationError) {
    auto recorder = std::make_shared<EventRecorder>();
    EvaluationSession session("s", recorder);
    session.reject("Unknown metric: x");

    EXPECT_TRUE(session.isTerminal());
    EXPECT_EQ(session.errorMessage(), std::optional<std::string>("Unknown metric: x"));
    ASSERT_EQ(recorder->events().size(), 1u);
    auto* error = std::get_if<ValidationErrorEvent>(&recorder->events()[0]);
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(error->message, "Unknown metric: x");

    EXPECT_THROW(session.begin(1), std::logic_error);
}

TEST(SessionTest, FailEmitsSingleGeneralError) {
    auto recorder = std::make_shared<EventRecorder>();
    EvaluationSession session("s", recorder);
    session.fail("Artifact could not be obtained");

    EXPECT_TRUE(session.isTerminal());
    EXPECT_EQ(recorder->count<GeneralErrorEvent>(), 1u);
    EXPECT_EQ(recorder->events().size(), 1u);
}

TEST(SessionTest, CannotRejectAfterBegin) {
    EvaluationSession session("s", nullptr);
    session.begin(1);
    EXPECT_THROW(session.reject("late"), std::logic_error);
    EXPECT_THROW(session.fail("late"), std::logic_error);
    EXPECT_THROW(session.begin(1), std::logic_error);
}

// ─── Cancellation ─────────────────────────────────────────────

TEST(SessionTest, CancelledSessionDiscardsLateOutcomes) {
    auto recorder = std::make_shared<EventRecorder>();
    EvaluationSession session("s", recorder);
    session.begin(2);
    session.recordOutcome(okOutcome("a", 1));

    session.cancel();
    EXPECT_TRUE(session.isCancelled());
    EXPECT_TRUE(session.isTerminal());

    session.recordOutcome(okOutcome("b", 2));
    EXPECT_EQ(session.completedCount(), 1u);
    EXPECT_EQ(recorder->count<MetricResultEvent>(), 1u);
    EXPECT_EQ(recorder->count<SessionCompleteEvent>(), 0u);
}

TEST(SessionTest, CancelBeforeBeginMakesBeginANoOp) {
    auto recorder = std::make_shared<EventRecorder>();
    auto session = std::make_shared<EvaluationSession>("sid", recorder);
    session->cancel();

    EXPECT_NO_THROW(session->begin(2));
    EXPECT_TRUE(session->isTerminal());
    EXPECT_EQ(session->submittedCount(), 0u);
    EXPECT_TRUE(recorder->events().empty());

    session->recordOutcome(okOutcome("a", 1));
    EXPECT_EQ(session->completedCount(), 0u);
}

TEST(SessionTest, AbortAfterBeginEmitsSingleGeneralError) {
    auto recorder = std::make_shared<EventRecorder>();
    EvaluationSession session("s", recorder);
    session.begin(3);
    session.recordOutcome(okOutcome("a", 1));

    session.abort("Engine is shutting down");
    EXPECT_TRUE(session.isTerminal());
    EXPECT_TRUE(session.isCancelled());
    EXPECT_EQ(session.errorMessage(), std::optional<std::string>("Engine is shutting down"));

    session.recordOutcome(okOutcome("b", 2));
    session.abort("again");
    session.cancel();

    auto events = recorder->events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<MetricResultEvent>(events[0]));
    auto* error = std::get_if<GeneralErrorEvent>(&events[1]);
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(error->message, "Engine is shutting down");
    EXPECT_EQ(recorder->count<SessionCompleteEvent>(), 0u);
    EXPECT_EQ(session.completedCount(), 1u);
}

TEST(SessionTest, AbortAfterCompletionIsIgnored) {
    auto recorder = std::make_shared<EventRecorder>();
    EvaluationSession session("s", recorder);
    session.begin(1);
    session.recordOutcome(okOutcome("a", 1));

    session.abort("late");
    EXPECT_EQ(recorder->count<GeneralErrorEvent>(), 0u);
    EXPECT_EQ(recorder->count<SessionCompleteEvent>(), 1u);
    EXPECT_FALSE(session.errorMessage().has_value());
}

TEST(SessionTest, WaitUntilTerminal) {
    EvaluationSession session("s", nullptr);
    session.begin(1);
    EXPECT_FALSE(session.waitUntilTerminal(std::chrono::milliseconds(10)));

    std::thread worker([&]() { session.recordOutcome(okOutcome("a", 1)); });
    EXPECT_TRUE(session.waitUntilTerminal(std::chrono::seconds(5)));
    worker.join();
}

TEST(SessionTest, ThrowingSinkDoesNotBreakSession) {
    auto sink = std::make_shared<CallbackEventSink>([](const SessionEvent&) {
        throw std::runtime_error("transport closed");
    });
    EvaluationSession session("s", sink);
    session.begin(1);
    EXPECT_NO_THROW(session.recordOutcome(okOutcome("a", 1)));
    EXPECT_TRUE(session.isTerminal());
    EXPECT_EQ(session.completedCount(), 1u);
}
