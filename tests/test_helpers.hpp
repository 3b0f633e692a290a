#pragma once

#include "evaluators/artifact.hpp"
#include "evaluators/evaluator.hpp"
#include "registry/metric_registry.hpp"
#include "session/session_events.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace aim_test {

// ─── Images ────────────────────────────────────────────────────

inline cv::Mat solidImage(int width, int height, const cv::Scalar& bgr) {
    return cv::Mat(height, width, CV_8UC3, bgr);
}

/// Deterministic colourful pattern with smooth gradients and hard edges.
inline cv::Mat patternImage(int width, int height) {
    cv::Mat image(height, width, CV_8UC3);
    for (int y = 0; y < height; y++) {
        for (int x = 0; x < width; x++) {
            auto& px = image.at<cv::Vec3b>(y, x);
            px[0] = static_cast<uint8_t>(x * 255 / std::max(1, width - 1));
            px[1] = static_cast<uint8_t>(y * 255 / std::max(1, height - 1));
            px[2] = ((x / 8 + y / 8) % 2 == 0) ? 230 : 20;
        }
    }
    return image;
}

inline std::vector<uint8_t> pngBytes(const cv::Mat& image) {
    std::vector<uint8_t> out;
    cv::imencode(".png", image, out);
    return out;
}

/// Decoded PNG artifact, as the dispatcher hands it to evaluators.
inline aim::Artifact pngArtifact(const cv::Mat& image) {
    aim::Artifact artifact;
    artifact.mime_type = "image/png";
    artifact.bytes = pngBytes(image);
    artifact.image = image.clone();
    return artifact;
}

inline uint32_t crc32(const uint8_t* data, size_t size, uint32_t crc = 0xFFFFFFFFu) {
    for (size_t i = 0; i < size; i++) {
        crc ^= data[i];
        for (int k = 0; k < 8; k++) {
            crc = (crc >> 1) ^ (0xEDB88320u & (0u - (crc & 1u)));
        }
    }
    return crc;
}

/// Grow a PNG to exactly `target` bytes by inserting a tEXt chunk
/// before IEND. The image content is unchanged.
inline std::vector<uint8_t> padPng(std::vector<uint8_t> png, size_t target) {
    const size_t kChunkOverhead = 12;   // length + type + crc
    const size_t kIendSize = 12;
    if (target < png.size() + kChunkOverhead + 2) return png;

    size_t data_size = target - png.size() - kChunkOverhead;
    std::vector<uint8_t> chunk;
    chunk.reserve(data_size + kChunkOverhead);
    for (int shift = 24; shift >= 0; shift -= 8) {
        chunk.push_back(static_cast<uint8_t>((data_size >> shift) & 0xFF));
    }
    const char* type = "tEXt";
    chunk.insert(chunk.end(), type, type + 4);
    chunk.push_back('c');
    chunk.push_back(0);
    chunk.insert(chunk.end(), data_size - 2, 'x');
    uint32_t crc = crc32(chunk.data() + 4, data_size + 4) ^ 0xFFFFFFFFu;
    for (int shift = 24; shift >= 0; shift -= 8) {
        chunk.push_back(static_cast<uint8_t>((crc >> shift) & 0xFF));
    }

    png.insert(png.end() - kIendSize, chunk.begin(), chunk.end());
    return png;
}

// ─── Registry fixtures ─────────────────────────────────────────

inline aim::ScoreBand band(const std::string& id, std::optional<double> min,
                           std::optional<double> max, const std::string& description,
                           const std::string& judgment = "") {
    aim::ScoreBand b;
    b.id = id;
    b.min = min;
    b.max = max;
    b.description = description;
    b.judgment = judgment;
    return b;
}

inline aim::ResultDescriptor result(const std::string& id, size_t index, aim::ValueType type,
                                    std::vector<aim::ScoreBand> scores = {}) {
    aim::ResultDescriptor r;
    r.id = id;
    r.index = index;
    r.type = type;
    r.name = id;
    r.scores = std::move(scores);
    return r;
}

inline aim::MetricDescriptor metric(const std::string& id, aim::Speed speed,
                                    std::vector<aim::ResultDescriptor> results) {
    aim::MetricDescriptor m;
    m.id = id;
    m.category_id = "test";
    m.name = id;
    m.speed = speed;
    m.results = std::move(results);
    return m;
}

/// One integer result, no bands.
inline aim::MetricDescriptor intMetric(const std::string& id,
                                       aim::Speed speed = aim::Speed::MEDIUM) {
    return metric(id, speed, {result(id + "_0", 0, aim::ValueType::INTEGER)});
}

/// The file size bands of the PNG size metric.
inline std::vector<aim::ScoreBand> fileSizeBands() {
    return {band("r1", 0.0, 500000.0, "Suitable", "good"),
            band("r2", 500001.0, 1200000.0, "Fair", "normal"),
            band("r3", 1200001.0, std::nullopt, "Huge", "bad")};
}

// ─── Evaluators ────────────────────────────────────────────────

/// Evaluator backed by a function; counts its invocations.
class FunctionEvaluator : public aim::Evaluator {
public:
    using Fn = std::function<aim::MetricValues(const aim::Artifact&)>;

    FunctionEvaluator(std::string id, Fn fn) : id_(std::move(id)), fn_(std::move(fn)) {}

    std::string metricId() const override { return id_; }

    aim::MetricValues evaluate(const aim::Artifact& artifact) const override {
        calls_++;
        return fn_(artifact);
    }

    int calls() const { return calls_.load(); }

private:
    std::string id_;
    Fn fn_;
    mutable std::atomic<int> calls_{0};
};

// ─── Event recording ───────────────────────────────────────────

class EventRecorder : public aim::EventSink {
public:
    void onEvent(const aim::SessionEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::vector<aim::SessionEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    template <typename T>
    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& e : events_) {
            if (std::holds_alternative<T>(e)) n++;
        }
        return n;
    }

    /// MetricResult outcomes in delivery order.
    std::vector<aim::TaskOutcome> outcomes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<aim::TaskOutcome> out;
        for (const auto& e : events_) {
            if (auto* r = std::get_if<aim::MetricResultEvent>(&e)) out.push_back(r->outcome);
        }
        return out;
    }

private:
    mutable std::mutex mutex_;
    std::vector<aim::SessionEvent> events_;
};

} // namespace aim_test
