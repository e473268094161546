#include "WireFormat.hpp"
#include <cstdio>
#include <cstring>
#include <cmath>
#include <spdlog/spdlog.h>

namespace Wire
{
    nlohmann::json encodeRequest(const RemoteReviewRequest& request) {
        return nlohmann::json{
            { "cardId", request.card_id },
            { "rating", ratingValue(request.rating) },
            { "reviewTimeMs", request.review_time_ms }
        };
    }

    std::optional<RemoteReviewRequest> decodeRequest(const nlohmann::json& body) {
        if (!body.is_object()) return std::nullopt;

        auto id = body.find("cardId");
        auto rating = body.find("rating");
        if (id == body.end() || !id->is_string() || id->get<std::string>().empty()) return std::nullopt;
        if (rating == body.end() || !rating->is_number_integer()) return std::nullopt;

        auto parsed = ratingFromInt(rating->get<int>());
        if (!parsed) return std::nullopt;

        RemoteReviewRequest req;
        req.card_id = id->get<std::string>();
        req.rating = *parsed;

        auto ms = body.find("reviewTimeMs");
        if (ms != body.end()) {
            if (ms->is_number_unsigned()) {
                req.review_time_ms = ms->get<std::uint64_t>();
            }
            else if (ms->is_number_integer() && ms->get<std::int64_t>() >= 0) {
                req.review_time_ms = static_cast<std::uint64_t>(ms->get<std::int64_t>());
            }
            else {
                return std::nullopt;
            }
        }
        return req;
    }

    nlohmann::json encodeResponse(const RemoteReviewResponse& response) {
        nlohmann::json body = { { "success", response.success } };
        if (response.next_state) {
            const AuthoritativeState& s = *response.next_state;
            body["data"] = {
                { "nextState", {
                    { "stability", s.stability },
                    { "difficulty", s.difficulty },
                    { "phase", phaseName(s.phase) },
                    { "due", formatUtc(s.due) }
                } }
            };
        }
        if (!response.error.empty()) body["error"] = response.error;
        return body;
    }

    static RemoteReviewResponse malformed(const std::string& why) {
        spdlog::warn("Wire: malformed review response ({})", why);
        RemoteReviewResponse r;
        r.success = false;
        r.error = "malformed response: " + why;
        return r;
    }

    RemoteReviewResponse decodeResponse(const nlohmann::json& body) {
        if (!body.is_object()) return malformed("not an object");

        auto success = body.find("success");
        if (success == body.end() || !success->is_boolean()) return malformed("missing success flag");

        RemoteReviewResponse r;
        r.success = success->get<bool>();

        auto error = body.find("error");
        if (error != body.end() && error->is_string()) r.error = error->get<std::string>();

        if (!r.success) {
            if (r.error.empty()) r.error = "remote reported failure";
            return r;
        }

        auto data = body.find("data");
        if (data == body.end() || !data->is_object()) return malformed("missing data");
        auto next = data->find("nextState");
        if (next == data->end() || !next->is_object()) return malformed("missing nextState");

        auto stability = next->find("stability");
        auto difficulty = next->find("difficulty");
        auto phase = next->find("phase");
        auto due = next->find("due");
        if (stability == next->end() || !stability->is_number()) return malformed("stability");
        if (difficulty == next->end() || !difficulty->is_number()) return malformed("difficulty");
        if (phase == next->end() || !phase->is_string()) return malformed("phase");
        if (due == next->end() || !due->is_string()) return malformed("due");

        auto parsedPhase = phaseFromName(phase->get<std::string>());
        if (!parsedPhase) return malformed("unknown phase '" + phase->get<std::string>() + "'");
        auto parsedDue = parseUtc(due->get<std::string>());
        if (!parsedDue) return malformed("bad due timestamp");

        AuthoritativeState s;
        s.stability = stability->get<double>();
        s.difficulty = difficulty->get<double>();
        s.phase = *parsedPhase;
        s.due = *parsedDue;
        if (!std::isfinite(s.stability) || s.stability <= 0.0 || !std::isfinite(s.difficulty))
            return malformed("non-finite or non-positive model values");

        r.next_state = s;
        return r;
    }

    // Days since 1970-01-01 for a proleptic Gregorian date.
    static long long daysFromCivil(long long y, unsigned m, unsigned d) {
        y -= m <= 2;
        const long long era = (y >= 0 ? y : y - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<long long>(doe) - 719468;
    }

    std::string formatUtc(std::time_t t) {
        std::tm tm{};
        gmtime_r(&t, &tm);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
        return buf;
    }

    // Accepts YYYY-MM-DDTHH:MM:SS with optional fractional seconds and a
    // trailing Z. Fractions are truncated.
    std::optional<std::time_t> parseUtc(const std::string& text) {
        int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0, consumed = 0;
        if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &y, &mo, &d, &h, &mi, &s, &consumed) != 6)
            return std::nullopt;
        if (mo < 1 || mo > 12 || d < 1 || d > 31 || h > 23 || mi > 59 || s > 60 || h < 0 || mi < 0 || s < 0)
            return std::nullopt;

        std::size_t pos = static_cast<std::size_t>(consumed);
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            std::size_t digits = 0;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') { ++pos; ++digits; }
            if (digits == 0) return std::nullopt;
        }
        if (pos + 1 != text.size() || text[pos] != 'Z') return std::nullopt;

        long long days = daysFromCivil(y, static_cast<unsigned>(mo), static_cast<unsigned>(d));
        return static_cast<std::time_t>(days * 86400LL + h * 3600LL + mi * 60LL + s);
    }
}
