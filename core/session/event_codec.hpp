#pragma once

#include "dispatch/evaluation_request.hpp"
#include "session/session_events.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace aim {

// ─── Event Codec ───────────────────────────────────────────────
// JSON wire format shared with the browser front end.
//
// Outbound:
//   {"type":"result","action":"pushResult","session":..,"metric":..,
//    "result":[{"id","index","value","display","judgment"}],
//    "execution_time":..}
//   failed metric: "result":[] plus "error":{"kind","message"}
//   {"type":"error","action":"pushValidationError","session":..,"message":..}
//   {"type":"error","action":"pushGeneralError","session":..,"message":..}
//   {"type":"complete","action":"pushComplete","session":..}
//
// Inbound:
//   {"type":"execute","url":..,"data":..,"filename":..,"metrics":{id:bool}}

nlohmann::ordered_json toJson(const SessionEvent& event);

std::string encodeEvent(const SessionEvent& event);

/// A JSON number for numeric values, a base64 string for images.
nlohmann::ordered_json valueToJson(const ResultValue& value);

/// Parse an "execute" message. The artifact is the inline data URL in
/// "data" when present, otherwise "url" becomes a locator. Only metrics
/// mapped to true are requested, in message order.
/// Throws RequestError on malformed messages and ArtifactError on a
/// malformed data URL.
EvaluationRequest parseExecuteRequest(const std::string& message);

} // namespace aim
