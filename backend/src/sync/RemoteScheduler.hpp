#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "../core/Rating.hpp"
#include "../core/SchedulingState.hpp"

struct RemoteReviewRequest {
    std::string card_id;
    Rating rating = Rating::GOOD;
    std::uint64_t review_time_ms = 0;
};

struct RemoteReviewResponse {
    bool success = false;
    std::optional<AuthoritativeState> next_state;  // present on success
    std::string error;
};

// The authoritative scheduling service. Implementations may block and are
// always called off the session thread; transport faults may be thrown as
// std::exception and count as transient failures.
class RemoteScheduler {
public:
    virtual ~RemoteScheduler() = default;

    virtual RemoteReviewResponse submitReview(const RemoteReviewRequest& request) = 0;
};
