#include "common/engine_config.hpp"
#include "common/errors.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace aim {

namespace {

using nlohmann::json;

template <typename T>
T readValue(const json& j, const char* key, const char* expected) {
    try {
        return j.at(key).get<T>();
    } catch (const json::exception&) {
        throw ConfigError(std::string("Config key '") + key + "' must be " + expected);
    }
}

int readPositiveInt(const json& j, const char* key, int min_value) {
    int v = readValue<int>(j, key, "an integer");
    if (v < min_value) {
        throw ConfigError(std::string("Config key '") + key + "' must be >= " +
                          std::to_string(min_value));
    }
    return v;
}

void readArtifactLimits(const json& j, ArtifactLimits& limits) {
    if (!j.is_object()) {
        throw ConfigError("Config key 'artifact' must be an object");
    }
    if (j.contains("max_bytes")) {
        long long v = readValue<long long>(j, "max_bytes", "an integer");
        if (v <= 0) throw ConfigError("Config key 'max_bytes' must be > 0");
        limits.max_bytes = static_cast<size_t>(v);
    }
    if (j.contains("min_width"))  limits.min_width  = readPositiveInt(j, "min_width", 1);
    if (j.contains("min_height")) limits.min_height = readPositiveInt(j, "min_height", 1);
    if (j.contains("max_width"))  limits.max_width  = readPositiveInt(j, "max_width", 1);
    if (j.contains("max_height")) limits.max_height = readPositiveInt(j, "max_height", 1);
    if (limits.min_width > limits.max_width || limits.min_height > limits.max_height) {
        throw ConfigError("Artifact minimum dimensions exceed maximum dimensions");
    }
    if (j.contains("allowed_mime_types")) {
        limits.allowed_mime_types =
            readValue<std::vector<std::string>>(j, "allowed_mime_types", "a list of strings");
        if (limits.allowed_mime_types.empty()) {
            throw ConfigError("Config key 'allowed_mime_types' must not be empty");
        }
    }
    if (j.contains("crop_width"))  limits.crop_width  = readPositiveInt(j, "crop_width", 1);
    if (j.contains("crop_height")) limits.crop_height = readPositiveInt(j, "crop_height", 1);
    if (limits.crop_width.has_value() != limits.crop_height.has_value()) {
        throw ConfigError("'crop_width' and 'crop_height' must be set together");
    }
}

} // namespace

bool ArtifactLimits::allowsMimeType(const std::string& mime_type) const {
    return std::find(allowed_mime_types.begin(), allowed_mime_types.end(), mime_type) !=
           allowed_mime_types.end();
}

size_t EngineConfig::resolvedWorkers() const {
    if (workers > 0) return static_cast<size_t>(workers);
    unsigned hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
}

EngineConfig EngineConfig::fromJsonString(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Malformed engine config: ") + e.what());
    }
    if (!j.is_object()) {
        throw ConfigError("Engine config must be a JSON object");
    }

    EngineConfig config;
    if (j.contains("workers")) config.workers = readPositiveInt(j, "workers", 0);
    if (j.contains("task_timeout_ms")) {
        config.task_timeout_ms = readPositiveInt(j, "task_timeout_ms", 1);
    }
    if (j.contains("scheduling")) {
        std::string s = readValue<std::string>(j, "scheduling", "a string");
        if (s == "speed_first") {
            config.scheduling = SchedulingPolicy::SPEED_FIRST;
        } else if (s == "fifo") {
            config.scheduling = SchedulingPolicy::FIFO;
        } else {
            throw ConfigError("Unknown scheduling policy: " + s);
        }
    }
    if (j.contains("display_precision")) {
        config.display_precision = readPositiveInt(j, "display_precision", 0);
    }
    if (j.contains("log_level")) config.log_level = readValue<std::string>(j, "log_level", "a string");
    if (j.contains("registry")) config.registry_path = readValue<std::string>(j, "registry", "a string");
    if (j.contains("artifact")) readArtifactLimits(j.at("artifact"), config.artifact);
    return config;
}

EngineConfig EngineConfig::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open engine config: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    EngineConfig config = fromJsonString(buffer.str());
    if (!config.registry_path.empty()) {
        std::filesystem::path registry(config.registry_path);
        if (registry.is_relative()) {
            config.registry_path =
                (std::filesystem::path(path).parent_path() / registry).lexically_normal().string();
        }
    }
    return config;
}

const char* toString(SchedulingPolicy policy) {
    switch (policy) {
        case SchedulingPolicy::SPEED_FIRST: return "speed_first";
        case SchedulingPolicy::FIFO:        return "fifo";
    }
    return "unknown";
}

} // namespace aim
