#pragma once
#include <atomic>
#include <ctime>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "RemoteScheduler.hpp"
#include "../core/Scheduler.hpp"
#include "../storage/ReviewLog.hpp"
#include "../storage/SchedulingStateStore.hpp"

/*
  In-process stand-in for the authoritative scheduling service. Requests
  go through the same JSON bodies a networked service would see, and the
  authority keeps its own per-card table, so its answers can legitimately
  differ from a client's optimistic estimate.

  The table lives in memory only. After a restart, replay() rebuilds it
  from the learner's review log so answers continue the real history
  instead of starting every card over.

  setOffline(true) makes every call fail like an unreachable host.
*/
class LocalAuthority : public RemoteScheduler {
public:
    using Clock = std::function<std::time_t()>;

    explicit LocalAuthority(SchedulerParams params = SchedulerParams(), Clock clock = Clock());

    RemoteReviewResponse submitReview(const RemoteReviewRequest& request) override;

    // Service side of the call: request body in, response body out.
    nlohmann::json handle(const nlohmann::json& body);

    // Replaces the table with the learner's logged reviews, minus those the
    // store still holds as pending (they will be resubmitted). Returns the
    // number of cards known afterwards.
    std::size_t replay(const ReviewLog& log, const SchedulingStateStore& store, const std::string& learnerId);

    void setOffline(bool offline) { offline_.store(offline); }
    bool isOffline() const { return offline_.load(); }

    std::optional<SchedulingState> stateFor(const std::string& cardId) const;
    std::size_t reviewsHandled() const;

private:
    Scheduler scheduler;
    Clock clock;
    std::atomic<bool> offline_{ false };

    mutable std::mutex mutex;
    std::map<std::string, SchedulingState> states;
    std::size_t handled = 0;
};
