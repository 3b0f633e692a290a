#include <gtest/gtest.h>
#include "common/base64.hpp"
#include "common/errors.hpp"
#include "session/event_codec.hpp"
#include "test_helpers.hpp"

using namespace aim;

// ─── Outbound events ──────────────────────────────────────────

TEST(EventCodecTest, EncodesMetricResult) {
    ResultEntry size;
    size.result_id = "cp1_0";
    size.index = 0;
    size.value = int64_t{300000};
    size.judgment = Judgment{"r1", "good", "Suitable", ""};
    size.display = "300000";

    ResultEntry map;
    map.result_id = "cp1_1";
    map.index = 1;
    map.value = Base64Image{"aGk="};
    map.display = "<image>";

    SessionEvent event = MetricResultEvent{
        "s1", TaskOutcome::succeeded("cp1", {size, map}, 0.25)};
    auto j = toJson(event);

    EXPECT_EQ(j["type"], "result");
    EXPECT_EQ(j["action"], "pushResult");
    EXPECT_EQ(j["session"], "s1");
    EXPECT_EQ(j["metric"], "cp1");
    EXPECT_DOUBLE_EQ(j["execution_time"].get<double>(), 0.25);
    EXPECT_FALSE(j.contains("error"));

    ASSERT_EQ(j["result"].size(), 2u);
    EXPECT_EQ(j["result"][0]["id"], "cp1_0");
    EXPECT_EQ(j["result"][0]["value"], 300000);
    EXPECT_EQ(j["result"][0]["judgment"]["description"], "Suitable");
    EXPECT_EQ(j["result"][0]["judgment"]["judgment"], "good");
    EXPECT_EQ(j["result"][1]["value"], "aGk=");
    EXPECT_TRUE(j["result"][1]["judgment"].is_null());

    // Keys keep insertion order on the wire
    std::string text = encodeEvent(event);
    EXPECT_EQ(text.rfind("{\"type\":\"result\",\"action\":\"pushResult\"", 0), 0u);
}

TEST(EventCodecTest, EncodesFailedMetric) {
    SessionEvent event = MetricResultEvent{
        "s1", TaskOutcome::failed("pf1", EvaluationErrorKind::Timeout, "budget exceeded", 60.0)};
    auto j = toJson(event);

    EXPECT_TRUE(j["result"].empty());
    EXPECT_EQ(j["error"]["kind"], "timeout");
    EXPECT_EQ(j["error"]["message"], "budget exceeded");
}

TEST(EventCodecTest, EncodesTerminalEvents) {
    auto validation = toJson(ValidationErrorEvent{"s", "Unknown metric: x"});
    EXPECT_EQ(validation["type"], "error");
    EXPECT_EQ(validation["action"], "pushValidationError");
    EXPECT_EQ(validation["message"], "Unknown metric: x");

    auto general = toJson(GeneralErrorEvent{"s", "Screenshot failed"});
    EXPECT_EQ(general["action"], "pushGeneralError");

    auto complete = toJson(SessionCompleteEvent{"s"});
    EXPECT_EQ(complete["type"], "complete");
    EXPECT_EQ(complete["action"], "pushComplete");
    EXPECT_EQ(complete["session"], "s");
}

// ─── Inbound requests ─────────────────────────────────────────

TEST(EventCodecTest, ParsesUploadRequest) {
    std::vector<uint8_t> png = aim_test::pngBytes(aim_test::patternImage(8, 8));
    std::string message = R"({"type": "execute", "url": null, "filename": "design.png",
        "data": "data:image/png;base64,)" + base64Encode(png) + R"(",
        "metrics": {"cp1": true, "cp2": false, "pf1": true}})";

    EvaluationRequest request = parseExecuteRequest(message);
    EXPECT_EQ(request.metrics, (std::vector<std::string>{"cp1", "pf1"}));
    ASSERT_TRUE(std::holds_alternative<Artifact>(request.artifact));
    const Artifact& artifact = std::get<Artifact>(request.artifact);
    EXPECT_EQ(artifact.mime_type, "image/png");
    EXPECT_EQ(artifact.bytes, png);
    EXPECT_TRUE(request.session_id.empty());
}

TEST(EventCodecTest, ParsesUrlRequestAsLocator) {
    EvaluationRequest request = parseExecuteRequest(
        R"({"type": "execute", "url": "https://example.org", "filename": null, "data": null,
            "metrics": {"vg1": true}, "session": "abc"})");
    ASSERT_TRUE(std::holds_alternative<ArtifactLocator>(request.artifact));
    EXPECT_EQ(std::get<ArtifactLocator>(request.artifact).locator, "https://example.org");
    EXPECT_EQ(request.session_id, "abc");
}

TEST(EventCodecTest, RejectsMalformedRequests) {
    EXPECT_THROW(parseExecuteRequest("not json"), RequestError);
    EXPECT_THROW(parseExecuteRequest("[]"), RequestError);
    EXPECT_THROW(parseExecuteRequest(R"({"type": "preview"})"), RequestError);
    EXPECT_THROW(parseExecuteRequest(R"({"type": "execute", "url": "u"})"), RequestError);
    EXPECT_THROW(parseExecuteRequest(
                     R"({"type": "execute", "url": "u", "metrics": {"cp1": "yes"}})"),
                 RequestError);
    EXPECT_THROW(parseExecuteRequest(R"({"type": "execute", "metrics": {}})"), RequestError);
    EXPECT_THROW(parseExecuteRequest(
                     R"({"type": "execute", "data": "data:image/png;base64,%%", "metrics": {}})"),
                 ArtifactError);
}
