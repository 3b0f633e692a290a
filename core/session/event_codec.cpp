#include "session/event_codec.hpp"
#include "common/errors.hpp"

namespace aim {

using json = nlohmann::ordered_json;

namespace {

json resultEntryToJson(const ResultEntry& entry) {
    json out;
    out["id"] = entry.result_id;
    out["index"] = entry.index;
    out["value"] = valueToJson(entry.value);
    out["display"] = entry.display;
    if (entry.judgment) {
        out["judgment"] = {
            {"id", entry.judgment->band_id},
            {"judgment", entry.judgment->label},
            {"description", entry.judgment->description},
            {"icon", entry.judgment->icon},
        };
    } else {
        out["judgment"] = nullptr;
    }
    return out;
}

struct EventEncoder {
    json operator()(const MetricResultEvent& e) const {
        json out;
        out["type"] = "result";
        out["action"] = "pushResult";
        out["session"] = e.session_id;
        out["metric"] = e.outcome.metric_id;
        json results = json::array();
        for (const auto& entry : e.outcome.results) results.push_back(resultEntryToJson(entry));
        out["result"] = std::move(results);
        if (!e.outcome.success) {
            out["error"] = {
                {"kind", e.outcome.error_kind ? toString(*e.outcome.error_kind) : "unknown"},
                {"message", e.outcome.error_message},
            };
        }
        out["execution_time"] = e.outcome.elapsed_seconds;
        return out;
    }

    json operator()(const ValidationErrorEvent& e) const {
        return {{"type", "error"}, {"action", "pushValidationError"},
                {"session", e.session_id}, {"message", e.message}};
    }

    json operator()(const GeneralErrorEvent& e) const {
        return {{"type", "error"}, {"action", "pushGeneralError"},
                {"session", e.session_id}, {"message", e.message}};
    }

    json operator()(const SessionCompleteEvent& e) const {
        return {{"type", "complete"}, {"action", "pushComplete"}, {"session", e.session_id}};
    }
};

const json* optionalString(const json& message, const char* key) {
    auto it = message.find(key);
    if (it == message.end() || it->is_null()) return nullptr;
    if (!it->is_string()) throw RequestError(std::string("'") + key + "' must be a string");
    return &*it;
}

} // namespace

json valueToJson(const ResultValue& value) {
    if (auto* i = std::get_if<int64_t>(&value)) return *i;
    if (auto* d = std::get_if<double>(&value)) return *d;
    return std::get<Base64Image>(value).data;
}

json toJson(const SessionEvent& event) {
    return std::visit(EventEncoder{}, event);
}

std::string encodeEvent(const SessionEvent& event) {
    return toJson(event).dump();
}

EvaluationRequest parseExecuteRequest(const std::string& message) {
    json doc;
    try {
        doc = json::parse(message);
    } catch (const json::parse_error& e) {
        throw RequestError(std::string("Malformed request: ") + e.what());
    }
    if (!doc.is_object()) throw RequestError("Request must be a JSON object");

    auto type = doc.find("type");
    if (type == doc.end() || !type->is_string()) throw RequestError("Request has no type");
    if (type->get<std::string>() != "execute") {
        throw RequestError("Unsupported request type: " + type->get<std::string>());
    }

    EvaluationRequest request;

    auto metrics = doc.find("metrics");
    if (metrics == doc.end() || !metrics->is_object()) {
        throw RequestError("'metrics' must be an object of metric id to boolean");
    }
    for (auto it = metrics->begin(); it != metrics->end(); ++it) {
        if (!it.value().is_boolean()) {
            throw RequestError("Metric flag for '" + it.key() + "' must be a boolean");
        }
        if (it.value().get<bool>()) request.metrics.push_back(it.key());
    }

    if (const json* data = optionalString(doc, "data")) {
        request.artifact = parseDataUrl(data->get<std::string>());
    } else if (const json* url = optionalString(doc, "url")) {
        request.artifact = ArtifactLocator{url->get<std::string>()};
    } else {
        throw RequestError("Request carries neither 'data' nor 'url'");
    }

    if (const json* session = optionalString(doc, "session")) {
        request.session_id = session->get<std::string>();
    }
    return request;
}

} // namespace aim
