// Batch evaluator: runs the selected metrics over local screenshot files
// and writes the event stream as JSON lines, or one CSV row per image.

#include "common/engine_config.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "dispatch/dispatcher.hpp"
#include "evaluators/default_evaluators.hpp"
#include "registry/metric_registry.hpp"
#include "session/event_codec.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitRejected = 2;

struct CliOptions {
    std::string config_path;
    std::string registry_path;
    std::vector<std::string> metrics;   // empty = every registered metric
    bool csv = false;
    std::vector<std::string> images;
};

void printUsage() {
    std::printf("aim_evaluate - evaluate GUI design screenshots\n\n");
    std::printf("Usage: aim_evaluate [options] IMAGE...\n\n");
    std::printf("Options:\n");
    std::printf("  --config FILE     Engine configuration (JSON)\n");
    std::printf("  --registry FILE   Metric registry document (default: config/metrics.json)\n");
    std::printf("  --metrics a,b,c   Metrics to compute (default: all)\n");
    std::printf("  --format FMT      Output format: jsonl, csv (default: jsonl)\n");
    std::printf("  --help            Show this help\n");
}

std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

/// Returns false when the program should exit with the given code.
bool parseArgs(int argc, char* argv[], CliOptions& opts, int& exit_code) {
    for (int idx = 1; idx < argc; ++idx) {
        const char* arg = argv[idx];
        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            printUsage();
            exit_code = kExitOk;
            return false;
        }
        bool has_value = idx + 1 < argc;
        if (std::strcmp(arg, "--config") == 0 && has_value) {
            opts.config_path = argv[++idx];
        } else if (std::strcmp(arg, "--registry") == 0 && has_value) {
            opts.registry_path = argv[++idx];
        } else if (std::strcmp(arg, "--metrics") == 0 && has_value) {
            opts.metrics = splitList(argv[++idx]);
        } else if (std::strcmp(arg, "--format") == 0 && has_value) {
            std::string format = argv[++idx];
            if (format == "csv") {
                opts.csv = true;
            } else if (format != "jsonl") {
                std::fprintf(stderr, "Unknown format: %s\n", format.c_str());
                exit_code = kExitUsage;
                return false;
            }
        } else if (std::strncmp(arg, "--", 2) == 0) {
            std::fprintf(stderr, "Unknown or incomplete option: %s\n", arg);
            printUsage();
            exit_code = kExitUsage;
            return false;
        } else {
            opts.images.push_back(arg);
        }
    }
    if (opts.images.empty()) {
        printUsage();
        exit_code = kExitUsage;
        return false;
    }
    return true;
}

// ─── CSV output ────────────────────────────────────────────────

std::string csvField(const std::string& text) {
    if (text.find_first_of(",\"\n") == std::string::npos) return text;
    std::string quoted = "\"";
    for (char c : text) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    return quoted + "\"";
}

std::vector<const aim::MetricDescriptor*> selectedMetrics(const aim::MetricRegistry& registry,
                                                          const std::vector<std::string>& ids) {
    std::vector<const aim::MetricDescriptor*> out;
    for (const auto& metric : registry.metrics()) {
        if (ids.empty() || std::find(ids.begin(), ids.end(), metric.id) != ids.end()) {
            out.push_back(&metric);
        }
    }
    return out;
}

void writeCsvHeader(const std::vector<const aim::MetricDescriptor*>& metrics) {
    std::cout << "filename,total_evaluation_time";
    for (const auto* metric : metrics) {
        std::cout << "," << metric->id << "_time";
        for (const auto& result : metric->results) {
            if (result.type == aim::ValueType::IMAGE_BLOB) continue;
            std::cout << "," << metric->id << "_result_" << (result.index + 1);
        }
    }
    std::cout << "\n";
}

void writeCsvRow(const std::string& image, double total_seconds,
                 const std::vector<const aim::MetricDescriptor*>& metrics,
                 const aim::EvaluationSession& session) {
    std::cout << csvField(image) << "," << fmt::format("{:.4f}", total_seconds);
    for (const auto* metric : metrics) {
        auto outcome = session.outcome(metric->id);
        std::cout << ",";
        if (outcome) std::cout << fmt::format("{:.4f}", outcome->elapsed_seconds);
        for (const auto& result : metric->results) {
            if (result.type == aim::ValueType::IMAGE_BLOB) continue;
            std::cout << ",";
            if (!outcome || !outcome->success) continue;
            const aim::ResultValue& value = outcome->results[result.index].value;
            if (auto* i = std::get_if<int64_t>(&value)) {
                std::cout << *i;
            } else if (auto* d = std::get_if<double>(&value)) {
                std::cout << fmt::format("{:.4f}", *d);
            }
        }
    }
    std::cout << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    int exit_code = kExitOk;
    if (!parseArgs(argc, argv, opts, exit_code)) {
        return exit_code;
    }

    aim::EngineConfig config;
    std::shared_ptr<const aim::MetricRegistry> registry;
    try {
        if (!opts.config_path.empty()) {
            config = aim::EngineConfig::loadFromFile(opts.config_path);
        }
        if (!opts.registry_path.empty()) {
            config.registry_path = opts.registry_path;
        } else if (config.registry_path.empty()) {
            config.registry_path = "config/metrics.json";
        }
        aim::setLogLevel(config.log_level);
        registry = std::make_shared<const aim::MetricRegistry>(
            aim::MetricRegistry::loadFromFile(config.registry_path));
    } catch (const std::exception& e) {
        aim::logger()->error("Startup failed: {}", e.what());
        return kExitUsage;
    }

    auto catalog = std::make_shared<aim::EvaluatorCatalog>();
    aim::registerDefaultEvaluators(*catalog);

    std::vector<std::string> metric_ids = opts.metrics;
    if (metric_ids.empty()) {
        for (const auto& metric : registry->metrics()) metric_ids.push_back(metric.id);
    }
    auto csv_metrics = selectedMetrics(*registry, opts.metrics);

    aim::Dispatcher dispatcher(registry, catalog, config,
                               std::make_shared<aim::FileArtifactResolver>());

    std::mutex out_mutex;
    auto sink = std::make_shared<aim::CallbackEventSink>([&](const aim::SessionEvent& event) {
        if (opts.csv) return;
        std::lock_guard<std::mutex> lock(out_mutex);
        std::cout << aim::encodeEvent(event) << "\n";
        std::cout.flush();
    });

    if (opts.csv) writeCsvHeader(csv_metrics);

    bool any_rejected = false;
    for (const auto& image : opts.images) {
        aim::logger()->info("Evaluating {}...", image);
        auto start = std::chrono::steady_clock::now();

        aim::EvaluationRequest request;
        request.artifact = aim::ArtifactLocator{image};
        request.metrics = metric_ids;
        auto session = dispatcher.submit(std::move(request), sink);
        while (!session->waitUntilTerminal(std::chrono::seconds(1))) {
        }

        if (auto error = session->errorMessage()) {
            aim::logger()->error("{}: {}", image, *error);
            any_rejected = true;
        }
        if (opts.csv) {
            double total = std::chrono::duration<double>(
                std::chrono::steady_clock::now() - start).count();
            writeCsvRow(image, total, csv_metrics, *session);
        }
    }

    dispatcher.shutdown();
    return any_rejected ? kExitRejected : kExitOk;
}
