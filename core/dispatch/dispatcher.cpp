#include "dispatch/dispatcher.hpp"
#include "dispatch/evaluation_task.hpp"
#include "common/logging.hpp"

#include <algorithm>
#include <chrono>
#include <random>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>

namespace aim {

namespace {

TaskOutcome runGuarded(EvaluationTask& task, std::chrono::milliseconds timeout, int precision) {
    // Every scheduled task reports exactly one outcome, or its session
    // never completes.
    try {
        return task.run(timeout, precision);
    } catch (const std::exception& e) {
        logger()->error("Session {}: task {} aborted: {}", task.session()->id(), task.metricId(),
                        e.what());
        return TaskOutcome::failed(task.metricId(), EvaluationErrorKind::ComputationFailure,
                                   e.what(), 0.0);
    } catch (...) {
        logger()->error("Session {}: task {} aborted", task.session()->id(), task.metricId());
        return TaskOutcome::failed(task.metricId(), EvaluationErrorKind::ComputationFailure,
                                   "Unknown error during metric execution", 0.0);
    }
}

} // namespace

std::string generateSessionId() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    return fmt::format("{:016x}{:016x}", rng(), rng());
}

Dispatcher::Dispatcher(std::shared_ptr<const MetricRegistry> registry,
                       std::shared_ptr<const EvaluatorCatalog> catalog,
                       EngineConfig config,
                       std::shared_ptr<const ArtifactResolver> resolver)
    : registry_(std::move(registry)),
      catalog_(std::move(catalog)),
      config_(std::move(config)),
      resolver_(std::move(resolver)),
      pool_(config_.resolvedWorkers()) {
    if (!registry_ || !catalog_) {
        throw std::invalid_argument("Dispatcher requires a registry and an evaluator catalog");
    }
    for (const auto& metric : registry_->metrics()) {
        if (!catalog_->contains(metric.id)) {
            logger()->warn("Metric {} has no evaluator and will be rejected", metric.id);
        }
    }
    aggregator_ = std::thread(&Dispatcher::aggregatorLoop, this);
    logger()->info("Dispatcher ready: {} workers, {} scheduling, {} ms task timeout",
                   pool_.size(), toString(config_.scheduling), config_.task_timeout_ms);
}

Dispatcher::~Dispatcher() {
    shutdown();
}

std::optional<std::string> Dispatcher::validateMetrics(const std::vector<std::string>& metrics) const {
    for (const auto& id : metrics) {
        if (!registry_->contains(id)) return "Unknown metric: " + id;
        if (!catalog_->contains(id)) return "No evaluator registered for metric: " + id;
    }
    return std::nullopt;
}

int Dispatcher::rankOf(const MetricDescriptor& metric) const {
    if (config_.scheduling == SchedulingPolicy::FIFO) return 0;
    return static_cast<int>(metric.speed);
}

std::shared_ptr<EvaluationSession> Dispatcher::submit(EvaluationRequest request,
                                                      std::shared_ptr<EventSink> sink) {
    if (request.session_id.empty()) request.session_id = generateSessionId();
    auto session = std::make_shared<EvaluationSession>(request.session_id, std::move(sink));

    if (auto error = validateMetrics(request.metrics)) {
        session->reject(*error);
        return session;
    }

    Artifact artifact;
    if (auto* locator = std::get_if<ArtifactLocator>(&request.artifact)) {
        if (!resolver_) {
            session->fail("No artifact resolver configured for locator " + locator->locator);
            return session;
        }
        try {
            artifact = resolver_->resolve(locator->locator);
        } catch (const std::exception& e) {
            session->fail(std::string("Artifact could not be obtained: ") + e.what());
            return session;
        }
    } else {
        artifact = std::move(std::get<Artifact>(request.artifact));
    }

    if (auto error = decodeArtifact(artifact, config_.artifact)) {
        session->reject(*error);
        return session;
    }

    if (shut_down_.load()) {
        session->fail("Engine is shutting down");
        return session;
    }

    // Unique metrics in registration order
    std::vector<const MetricDescriptor*> metrics;
    for (const auto& id : request.metrics) {
        const MetricDescriptor* metric = registry_->lookup(id);
        if (std::find(metrics.begin(), metrics.end(), metric) == metrics.end()) {
            metrics.push_back(metric);
        }
    }
    std::sort(metrics.begin(), metrics.end(),
              [](const MetricDescriptor* a, const MetricDescriptor* b) {
                  return a->registration_order < b->registration_order;
              });

    auto shared_artifact = std::make_shared<const Artifact>(std::move(artifact));
    logger()->info("Session {}: {} metrics on {}x{} {}", session->id(), metrics.size(),
                   shared_artifact->width(), shared_artifact->height(),
                   shared_artifact->mime_type);

    // Started before it becomes visible to cancel()
    session->begin(metrics.size());
    if (!metrics.empty()) {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        active_[session->id()] = session;
    }

    const std::chrono::milliseconds timeout(config_.task_timeout_ms);
    const int precision = config_.display_precision;
    for (const MetricDescriptor* metric : metrics) {
        uint64_t sequence = next_sequence_.fetch_add(1);
        auto task = std::make_shared<EvaluationTask>(session, *metric,
                                                     catalog_->find(metric->id),
                                                     shared_artifact, sequence);
        bool queued = pool_.submit({rankOf(*metric), sequence}, [this, task, timeout, precision]() {
            if (task->session()->isCancelled()) {
                logger()->debug("Session {}: dropped queued task {}", task->session()->id(),
                                task->metricId());
                return;
            }
            completions_.push({task->session(), runGuarded(*task, timeout, precision)});
        });
        if (!queued) {
            // Pool stopped between the shutdown check and here
            session->abort("Engine is shutting down");
            forget(session);
            break;
        }
    }
    return session;
}

void Dispatcher::forget(const std::shared_ptr<EvaluationSession>& session) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = active_.find(session->id());
    if (it != active_.end() && it->second == session) active_.erase(it);
}

void Dispatcher::aggregatorLoop() {
    while (auto completion = completions_.pop()) {
        auto& session = completion->first;
        session->recordOutcome(std::move(completion->second));
        if (session->isTerminal()) forget(session);
    }
}

bool Dispatcher::cancel(const std::string& session_id) {
    std::shared_ptr<EvaluationSession> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = active_.find(session_id);
        if (it == active_.end()) return false;
        session = it->second;
        active_.erase(it);
    }
    if (session->isTerminal()) return false;
    session->cancel();
    logger()->info("Session {} cancelled", session_id);
    return true;
}

std::shared_ptr<EvaluationSession> Dispatcher::findSession(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = active_.find(session_id);
    return it == active_.end() ? nullptr : it->second;
}

size_t Dispatcher::activeSessionCount() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return active_.size();
}

void Dispatcher::shutdown() {
    if (shut_down_.exchange(true)) return;

    std::unordered_map<std::string, std::shared_ptr<EvaluationSession>> active;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        active.swap(active_);
    }
    for (auto& entry : active) entry.second->cancel();

    size_t discarded = pool_.shutdown();
    completions_.close();
    if (aggregator_.joinable()) aggregator_.join();
    logger()->info("Dispatcher stopped: {} sessions cancelled, {} queued tasks discarded",
                   active.size(), discarded);
}

} // namespace aim
