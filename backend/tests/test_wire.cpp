#include "../src/sync/WireFormat.hpp"
#include "../src/sync/LocalAuthority.hpp"

#include <ctime>
#include <iostream>
#include <string>

namespace {

struct TestSuite {
  bool ok = true;
  void require(bool condition, const std::string& message) {
    if (!condition) {
      std::cerr << "[FAIL] " << message << std::endl;
      ok = false;
    }
  }
};

constexpr std::time_t T0 = 1767225600;  // 2026-01-01T00:00:00Z

using nlohmann::json;

void test_request_codec(TestSuite& suite) {
  RemoteReviewRequest req{"card-7", Rating::HARD, 4200};
  json body = Wire::encodeRequest(req);
  suite.require(body["cardId"] == "card-7" && body["rating"] == 2 && body["reviewTimeMs"] == 4200,
                "request uses the wire field names");

  auto decoded = Wire::decodeRequest(json{{"cardId", "c"}, {"rating", 4}, {"reviewTimeMs", 10}});
  suite.require(decoded && decoded->rating == Rating::EASY && decoded->review_time_ms == 10, "request decodes");

  suite.require(!Wire::decodeRequest(json{{"cardId", "c"}, {"rating", 0}}), "rating 0 rejected");
  suite.require(!Wire::decodeRequest(json{{"cardId", "c"}, {"rating", 5}}), "rating 5 rejected");
  suite.require(!Wire::decodeRequest(json{{"cardId", "c"}, {"rating", "3"}}), "string rating rejected");
  suite.require(!Wire::decodeRequest(json{{"cardId", ""}, {"rating", 3}}), "empty card id rejected");
  suite.require(!Wire::decodeRequest(json{{"rating", 3}}), "missing card id rejected");
  suite.require(!Wire::decodeRequest(json{{"cardId", "c"}, {"rating", 3}, {"reviewTimeMs", -1}}),
                "negative review time rejected");
}

void test_response_codec(TestSuite& suite) {
  json ok = {
      {"success", true},
      {"data", {{"nextState", {{"stability", 12.5}, {"difficulty", 4.25}, {"phase", "review"},
                               {"due", "2026-01-13T08:30:00.123Z"}}}}},
  };
  RemoteReviewResponse r = Wire::decodeResponse(ok);
  suite.require(r.success && r.next_state, "successful response decodes");
  suite.require(r.next_state && r.next_state->stability == 12.5 && r.next_state->difficulty == 4.25,
                "model values decode");
  suite.require(r.next_state && r.next_state->phase == Phase::REVIEW, "phase decodes");
  suite.require(r.next_state && r.next_state->due == T0 + 12 * 86400 + 8 * 3600 + 30 * 60,
                "due decodes with fractional seconds truncated");

  RemoteReviewResponse failed = Wire::decodeResponse(json{{"success", false}, {"error", "rate limited"}});
  suite.require(!failed.success && failed.error == "rate limited", "failure keeps the remote error");

  RemoteReviewResponse bare = Wire::decodeResponse(json{{"success", false}});
  suite.require(!bare.success && !bare.error.empty(), "failure without error text still explains itself");
}

void test_malformed_responses(TestSuite& suite) {
  auto malformed = [](const json& body) {
    RemoteReviewResponse r = Wire::decodeResponse(body);
    return !r.success && !r.next_state && r.error.rfind("malformed response", 0) == 0;
  };
  json state = {{"stability", 3.0}, {"difficulty", 5.0}, {"phase", "review"}, {"due", "2026-01-02T00:00:00Z"}};

  suite.require(malformed(json::array()), "non-object rejected");
  suite.require(malformed(json{{"data", {{"nextState", state}}}}), "missing success flag rejected");
  suite.require(malformed(json{{"success", "yes"}}), "non-boolean success rejected");
  suite.require(malformed(json{{"success", true}}), "success without data rejected");

  json badPhase = state;
  badPhase["phase"] = "mastered";
  suite.require(malformed(json{{"success", true}, {"data", {{"nextState", badPhase}}}}), "unknown phase rejected");

  json badDue = state;
  badDue["due"] = "tomorrow";
  suite.require(malformed(json{{"success", true}, {"data", {{"nextState", badDue}}}}), "bad timestamp rejected");

  json zeroStability = state;
  zeroStability["stability"] = 0.0;
  suite.require(malformed(json{{"success", true}, {"data", {{"nextState", zeroStability}}}}),
                "non-positive stability rejected");

  json missing = state;
  missing.erase("difficulty");
  suite.require(malformed(json{{"success", true}, {"data", {{"nextState", missing}}}}), "missing field rejected");
}

void test_timestamps(TestSuite& suite) {
  suite.require(Wire::formatUtc(T0) == "2026-01-01T00:00:00Z", "epoch seconds format as ISO-8601 UTC");
  auto parsed = Wire::parseUtc("2024-02-29T23:59:59Z");
  suite.require(parsed && Wire::formatUtc(*parsed) == "2024-02-29T23:59:59Z", "leap day parses");
  suite.require(!Wire::parseUtc("2026-01-01T00:00:00"), "missing zone designator rejected");
  suite.require(!Wire::parseUtc("2026-13-01T00:00:00Z"), "month 13 rejected");
  suite.require(!Wire::parseUtc("2026-01-01T00:00:00.Z"), "empty fraction rejected");
  suite.require(!Wire::parseUtc("2026-01-01T00:00:00Zjunk"), "trailing text rejected");
}

void test_local_authority_service(TestSuite& suite) {
  LocalAuthority authority(SchedulerParams(), []() { return T0; });

  json reply = authority.handle(json{{"cardId", "c1"}, {"rating", 3}, {"reviewTimeMs", 900}});
  suite.require(reply["success"] == true, "valid request succeeds");
  suite.require(reply["data"]["nextState"]["phase"] == "learning", "good on a new card stays in learning");
  suite.require(reply["data"]["nextState"]["due"] == "2026-01-01T00:10:00Z", "due is ten minutes out");

  json second = authority.handle(json{{"cardId", "c1"}, {"rating", 3}, {"reviewTimeMs", 900}});
  suite.require(second["data"]["nextState"]["phase"] == "review", "authority keeps its own per-card history");

  json rejected = authority.handle(json{{"cardId", "c1"}, {"rating", 9}});
  suite.require(rejected["success"] == false && rejected["error"] == "Invalid cardId or rating",
                "invalid request is refused");
  suite.require(authority.reviewsHandled() == 2, "refused requests are not counted");

  authority.setOffline(true);
  bool threw = false;
  try {
    authority.submitReview(RemoteReviewRequest{"c1", Rating::GOOD, 0});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  suite.require(threw, "offline authority raises a transport error");
}

}  // namespace

int main() {
  TestSuite suite;

  test_request_codec(suite);
  test_response_codec(suite);
  test_malformed_responses(suite);
  test_timestamps(suite);
  test_local_authority_service(suite);

  if (!suite.ok) {
    std::cerr << "Wire format tests FAILED" << std::endl;
    return 1;
  }

  std::cout << "Wire format tests passed" << std::endl;
  return 0;
}
