#pragma once

#include "common/engine_config.hpp"
#include "dispatch/blocking_queue.hpp"
#include "dispatch/evaluation_request.hpp"
#include "dispatch/worker_pool.hpp"
#include "evaluators/evaluator_catalog.hpp"
#include "registry/metric_registry.hpp"
#include "session/evaluation_session.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

namespace aim {

// ─── Dispatcher ────────────────────────────────────────────────
// Validates requests, fans one EvaluationTask per metric out to a
// bounded worker pool and funnels the outcomes through a channel to a
// single aggregator thread, which is the only writer of session state
// once tasks exist.
//
//   submit ──validate──> session.begin(n) ──> WorkerPool (K threads)
//                                                  │ TaskOutcome
//                                                  v
//                      aggregator thread <── BlockingQueue
//                              │
//                              v
//                      session.recordOutcome ──> EventSink

class Dispatcher {
public:
    Dispatcher(std::shared_ptr<const MetricRegistry> registry,
               std::shared_ptr<const EvaluatorCatalog> catalog,
               EngineConfig config,
               std::shared_ptr<const ArtifactResolver> resolver = nullptr);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Validate the request and schedule its tasks. Never throws for
    /// request-level problems: a rejected request yields a terminal
    /// session whose only event is a ValidationError or GeneralError.
    std::shared_ptr<EvaluationSession> submit(EvaluationRequest request,
                                              std::shared_ptr<EventSink> sink);

    /// Cancel an active session. Returns false if it is unknown or
    /// already finished.
    bool cancel(const std::string& session_id);

    /// Active (non-terminal) session by id, or nullptr.
    std::shared_ptr<EvaluationSession> findSession(const std::string& session_id) const;

    size_t activeSessionCount() const;

    /// Cancel all active sessions, drop queued tasks, stop the workers
    /// and the aggregator. Idempotent; called by the destructor.
    void shutdown();

    const EngineConfig& config() const { return config_; }
    const MetricRegistry& registry() const { return *registry_; }
    const EvaluatorCatalog& catalog() const { return *catalog_; }

private:
    using Completion = std::pair<std::shared_ptr<EvaluationSession>, TaskOutcome>;

    void aggregatorLoop();
    void forget(const std::shared_ptr<EvaluationSession>& session);
    std::optional<std::string> validateMetrics(const std::vector<std::string>& metrics) const;
    int rankOf(const MetricDescriptor& metric) const;

    std::shared_ptr<const MetricRegistry> registry_;
    std::shared_ptr<const EvaluatorCatalog> catalog_;
    const EngineConfig config_;
    std::shared_ptr<const ArtifactResolver> resolver_;

    WorkerPool pool_;
    BlockingQueue<Completion> completions_;
    std::thread aggregator_;

    mutable std::mutex sessions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<EvaluationSession>> active_;
    std::atomic<uint64_t> next_sequence_{0};
    std::atomic<bool> shut_down_{false};
};

/// Random 128-bit session id as 32 lowercase hex digits.
std::string generateSessionId();

} // namespace aim
