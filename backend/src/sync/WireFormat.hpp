#pragma once
#include <ctime>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "RemoteScheduler.hpp"

/*
  JSON bodies of the remote review call:

    request  { "cardId": "...", "rating": 1..4, "reviewTimeMs": n }
    response { "success": true,  "data": { "nextState": {
                   "stability": s, "difficulty": d, "phase": "review",
                   "due": "2026-01-02T03:04:05Z" } } }
             { "success": false, "error": "..." }
*/
namespace Wire
{
    nlohmann::json encodeRequest(const RemoteReviewRequest& request);
    // nullopt when cardId is missing/empty or rating is not 1..4
    std::optional<RemoteReviewRequest> decodeRequest(const nlohmann::json& body);

    nlohmann::json encodeResponse(const RemoteReviewResponse& response);
    // Malformed bodies decode to a failed response carrying the reason.
    RemoteReviewResponse decodeResponse(const nlohmann::json& body);

    std::string formatUtc(std::time_t t);
    std::optional<std::time_t> parseUtc(const std::string& text);
}
