#include "LocalAuthority.hpp"
#include <set>
#include <stdexcept>
#include <tuple>
#include <utility>
#include <spdlog/spdlog.h>
#include "WireFormat.hpp"

LocalAuthority::LocalAuthority(SchedulerParams params, Clock c)
    : scheduler(std::move(params)),
    clock(c ? std::move(c) : Clock([]() { return std::time(nullptr); }))
{
    spdlog::info("LocalAuthority initialized");
}

RemoteReviewResponse LocalAuthority::submitReview(const RemoteReviewRequest& request) {
    if (offline_.load()) {
        throw std::runtime_error("network unreachable");
    }
    return Wire::decodeResponse(handle(Wire::encodeRequest(request)));
}

nlohmann::json LocalAuthority::handle(const nlohmann::json& body) {
    auto request = Wire::decodeRequest(body);
    if (!request) {
        spdlog::warn("LocalAuthority: rejecting review request {}", body.dump());
        return Wire::encodeResponse(RemoteReviewResponse{ false, std::nullopt, "Invalid cardId or rating" });
    }

    std::time_t now = clock();

    std::lock_guard<std::mutex> lock(mutex);
    auto it = states.find(request->card_id);
    SchedulingState current = it != states.end() ? it->second : SchedulingState::fresh(now);

    SchedulingUpdate update = scheduler.computeUpdate(current, request->rating, now);
    states[request->card_id] = update.next;
    handled++;

    AuthoritativeState out;
    out.stability = update.next.stability;
    out.difficulty = update.next.difficulty;
    out.phase = update.next.phase;
    out.due = update.next.due;

    spdlog::debug("LocalAuthority: card={} q={} reviewTimeMs={} -> {}",
        request->card_id, ratingValue(request->rating), request->review_time_ms, update.next.describe());
    return Wire::encodeResponse(RemoteReviewResponse{ true, out, "" });
}

std::size_t LocalAuthority::replay(const ReviewLog& log, const SchedulingStateStore& store,
    const std::string& learnerId)
{
    using ReviewKey = std::tuple<std::string, std::time_t, int>;
    std::multiset<ReviewKey> unsent;
    for (const auto& p : store.pendingSubmissions(learnerId))
        unsent.insert(ReviewKey(p.card_id, p.review.reviewed_at, ratingValue(p.review.rating)));

    std::map<std::string, SchedulingState> rebuilt;
    std::size_t replayed = 0;
    for (const auto& e : log.forLearner(learnerId)) {
        auto pending = unsent.find(ReviewKey(e.card_id, e.reviewed_at, ratingValue(e.rating)));
        if (pending != unsent.end()) {
            unsent.erase(pending);
            continue;
        }
        auto it = rebuilt.find(e.card_id);
        SchedulingState current = it != rebuilt.end() ? it->second : SchedulingState::fresh(e.reviewed_at);
        rebuilt[e.card_id] = scheduler.computeUpdate(current, e.rating, e.reviewed_at).next;
        replayed++;
    }

    std::lock_guard<std::mutex> lock(mutex);
    states = std::move(rebuilt);
    spdlog::info("LocalAuthority: replayed {} review(s) for learner '{}' into {} card(s)",
        replayed, learnerId, states.size());
    return states.size();
}

std::optional<SchedulingState> LocalAuthority::stateFor(const std::string& cardId) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = states.find(cardId);
    if (it == states.end()) return std::nullopt;
    return it->second;
}

std::size_t LocalAuthority::reviewsHandled() const {
    std::lock_guard<std::mutex> lock(mutex);
    return handled;
}
