// PyBind11 bindings for the AIM evaluation engine.
// Exposes the metric registry, classifier, configuration and dispatcher to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DAIM_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>
#include <pybind11/chrono.h>

#include "classify/classifier.hpp"
#include "common/engine_config.hpp"
#include "common/logging.hpp"
#include "dispatch/dispatcher.hpp"
#include "evaluators/default_evaluators.hpp"
#include "registry/metric_registry.hpp"
#include "session/event_codec.hpp"

namespace py = pybind11;

namespace {

// Delivers events to a Python callable as dicts shaped like the JSON
// wire format. Called from the dispatcher's aggregator thread.
class PythonEventSink : public aim::EventSink {
public:
    explicit PythonEventSink(py::function callback) : callback_(std::move(callback)) {}

    ~PythonEventSink() override {
        py::gil_scoped_acquire gil;
        callback_ = py::function();
    }

    void onEvent(const aim::SessionEvent& event) override {
        std::string encoded = aim::encodeEvent(event);
        py::gil_scoped_acquire gil;
        try {
            callback_(py::module_::import("json").attr("loads")(encoded));
        } catch (py::error_already_set& e) {
            aim::logger()->error("Python event callback raised: {}", e.what());
        }
    }

private:
    py::function callback_;
};

std::shared_ptr<aim::EventSink> makeSink(py::object callback) {
    if (callback.is_none()) return nullptr;
    return std::make_shared<PythonEventSink>(callback.cast<py::function>());
}

std::shared_ptr<aim::Dispatcher> makeDispatcher(const aim::EngineConfig& config,
                                                const std::string& registry_path) {
    const std::string& path = registry_path.empty() ? config.registry_path : registry_path;
    if (path.empty()) throw aim::ConfigError("No registry path given");
    auto registry = std::make_shared<const aim::MetricRegistry>(aim::MetricRegistry::loadFromFile(path));
    auto catalog = std::make_shared<aim::EvaluatorCatalog>();
    aim::registerDefaultEvaluators(*catalog);
    // The aggregator thread may be waiting for the GIL to deliver an
    // event, so the GIL is released while the dispatcher shuts down.
    return std::shared_ptr<aim::Dispatcher>(
        new aim::Dispatcher(registry, catalog, config,
                            std::make_shared<aim::FileArtifactResolver>()),
        [](aim::Dispatcher* dispatcher) {
            py::gil_scoped_release release;
            delete dispatcher;
        });
}

} // namespace

PYBIND11_MODULE(aim_bindings, m) {
    m.doc() = "AIM metric evaluation engine bindings";

    py::register_exception<aim::RegistryError>(m, "RegistryError");
    py::register_exception<aim::ConfigError>(m, "ConfigError");
    py::register_exception<aim::ArtifactError>(m, "ArtifactError");
    py::register_exception<aim::RequestError>(m, "RequestError");

    // ── ScoreBand ──
    py::class_<aim::ScoreBand>(m, "ScoreBand")
        .def(py::init<>())
        .def_readwrite("id", &aim::ScoreBand::id)
        .def_readwrite("min", &aim::ScoreBand::min)
        .def_readwrite("max", &aim::ScoreBand::max)
        .def_readwrite("judgment", &aim::ScoreBand::judgment)
        .def_readwrite("description", &aim::ScoreBand::description)
        .def_readwrite("icon", &aim::ScoreBand::icon)
        .def("contains", &aim::ScoreBand::contains);

    // ── ResultDescriptor ──
    py::class_<aim::ResultDescriptor>(m, "ResultDescriptor")
        .def_readonly("id", &aim::ResultDescriptor::id)
        .def_readonly("index", &aim::ResultDescriptor::index)
        .def_property_readonly("type", [](const aim::ResultDescriptor& r) {
            return std::string(aim::toString(r.type));
        })
        .def_readonly("name", &aim::ResultDescriptor::name)
        .def_readonly("description", &aim::ResultDescriptor::description)
        .def_readonly("scores", &aim::ResultDescriptor::scores);

    // ── MetricDescriptor ──
    py::class_<aim::MetricDescriptor>(m, "MetricDescriptor")
        .def_readonly("id", &aim::MetricDescriptor::id)
        .def_readonly("category_id", &aim::MetricDescriptor::category_id)
        .def_readonly("name", &aim::MetricDescriptor::name)
        .def_readonly("description", &aim::MetricDescriptor::description)
        .def_readonly("evidence", &aim::MetricDescriptor::evidence)
        .def_readonly("relevance", &aim::MetricDescriptor::relevance)
        .def_property_readonly("speed", [](const aim::MetricDescriptor& d) {
            return static_cast<int>(d.speed);
        })
        .def_property_readonly("visualization_type", [](const aim::MetricDescriptor& d) {
            return std::string(aim::toString(d.visualization));
        })
        .def_readonly("results", &aim::MetricDescriptor::results);

    // ── MetricRegistry ──
    py::class_<aim::MetricRegistry, std::shared_ptr<aim::MetricRegistry>>(m, "MetricRegistry")
        .def_static("load_from_file", [](const std::string& path) {
            return std::make_shared<aim::MetricRegistry>(aim::MetricRegistry::loadFromFile(path));
        })
        .def_static("load_from_string", [](const std::string& text) {
            return std::make_shared<aim::MetricRegistry>(aim::MetricRegistry::loadFromString(text));
        })
        .def("lookup", &aim::MetricRegistry::lookup, py::return_value_policy::reference_internal)
        .def("contains", &aim::MetricRegistry::contains)
        .def("list_by_category", &aim::MetricRegistry::listByCategory,
             py::return_value_policy::reference_internal)
        .def("metric_ids", [](const aim::MetricRegistry& self) {
            std::vector<std::string> ids;
            for (const auto& metric : self.metrics()) ids.push_back(metric.id);
            return ids;
        })
        .def("count", &aim::MetricRegistry::count);

    // ── Judgment ──
    py::class_<aim::Judgment>(m, "Judgment")
        .def_readonly("band_id", &aim::Judgment::band_id)
        .def_readonly("label", &aim::Judgment::label)
        .def_readonly("description", &aim::Judgment::description)
        .def_readonly("icon", &aim::Judgment::icon);

    m.def("classify", py::overload_cast<double, const std::vector<aim::ScoreBand>&>(&aim::classify),
          py::arg("value"), py::arg("bands"));

    // ── EngineConfig ──
    py::class_<aim::EngineConfig>(m, "EngineConfig")
        .def(py::init<>())
        .def_readwrite("workers", &aim::EngineConfig::workers)
        .def_readwrite("task_timeout_ms", &aim::EngineConfig::task_timeout_ms)
        .def_readwrite("display_precision", &aim::EngineConfig::display_precision)
        .def_readwrite("log_level", &aim::EngineConfig::log_level)
        .def_readwrite("registry_path", &aim::EngineConfig::registry_path)
        .def_property("scheduling",
            [](const aim::EngineConfig& c) { return std::string(aim::toString(c.scheduling)); },
            [](aim::EngineConfig& c, const std::string& name) {
                if (name == "speed_first") c.scheduling = aim::SchedulingPolicy::SPEED_FIRST;
                else if (name == "fifo") c.scheduling = aim::SchedulingPolicy::FIFO;
                else throw aim::ConfigError("Unknown scheduling policy: " + name);
            })
        .def_static("load_from_file", &aim::EngineConfig::loadFromFile)
        .def_static("from_json", &aim::EngineConfig::fromJsonString);

    // ── EvaluationSession ──
    py::class_<aim::EvaluationSession, std::shared_ptr<aim::EvaluationSession>>(m, "EvaluationSession")
        .def_property_readonly("id", &aim::EvaluationSession::id)
        .def("submitted_count", &aim::EvaluationSession::submittedCount)
        .def("completed_count", &aim::EvaluationSession::completedCount)
        .def("is_terminal", &aim::EvaluationSession::isTerminal)
        .def("error_message", &aim::EvaluationSession::errorMessage)
        .def("wait", &aim::EvaluationSession::waitUntilTerminal,
             py::arg("timeout"), py::call_guard<py::gil_scoped_release>())
        .def("cancel", &aim::EvaluationSession::cancel);

    // ── Dispatcher ──
    py::class_<aim::Dispatcher, std::shared_ptr<aim::Dispatcher>>(m, "Dispatcher")
        .def(py::init(&makeDispatcher),
             py::arg("config") = aim::EngineConfig{}, py::arg("registry_path") = "")
        .def("submit_data_url",
             [](aim::Dispatcher& self, const std::string& data_url,
                std::vector<std::string> metrics, py::object callback, std::string session_id) {
                 aim::EvaluationRequest request;
                 request.session_id = std::move(session_id);
                 request.artifact = aim::parseDataUrl(data_url);
                 request.metrics = std::move(metrics);
                 return self.submit(std::move(request), makeSink(callback));
             },
             py::arg("data_url"), py::arg("metrics"), py::arg("callback") = py::none(),
             py::arg("session_id") = "")
        .def("submit_file",
             [](aim::Dispatcher& self, const std::string& path,
                std::vector<std::string> metrics, py::object callback, std::string session_id) {
                 aim::EvaluationRequest request;
                 request.session_id = std::move(session_id);
                 request.artifact = aim::ArtifactLocator{path};
                 request.metrics = std::move(metrics);
                 return self.submit(std::move(request), makeSink(callback));
             },
             py::arg("path"), py::arg("metrics"), py::arg("callback") = py::none(),
             py::arg("session_id") = "")
        .def("cancel", &aim::Dispatcher::cancel)
        .def("active_session_count", &aim::Dispatcher::activeSessionCount)
        .def("shutdown", &aim::Dispatcher::shutdown, py::call_guard<py::gil_scoped_release>());

    m.def("set_log_level", &aim::setLogLevel);
}
