#pragma once
#include <cstdint>
#include <ctime>
#include <string>
#include <vector>
#include "../core/Rating.hpp"

// One accepted rating. Audit and statistics only; scheduling never reads it.
struct ReviewEvent {
    std::string card_id;
    std::string learner_id;
    std::string deck_id;
    Rating rating = Rating::GOOD;
    Phase phase = Phase::NEW;       // phase before the rating was applied
    double elapsed_days = 0.0;
    double scheduled_days = 0.0;
    std::uint64_t review_time_ms = 0;
    std::time_t reviewed_at = 0;
};

// Emitted once per ended session.
struct SessionEvent {
    std::string learner_id;
    std::string deck_id;
    std::time_t started_at = 0;
    std::time_t ended_at = 0;
    int reviewed = 0;
    int correct = 0;

    std::int64_t durationMs() const { return static_cast<std::int64_t>(ended_at - started_at) * 1000; }
};

// Append-only: there is no update or erase.
class ReviewLog {
public:
    void append(const ReviewEvent& event);
    void appendSession(const SessionEvent& event);

    const std::vector<ReviewEvent>& events() const { return reviews; }
    const std::vector<SessionEvent>& sessions() const { return session_events; }

    std::vector<ReviewEvent> forLearner(const std::string& learnerId) const;
    std::vector<ReviewEvent> forCard(const std::string& cardId, const std::string& learnerId) const;

    std::size_t size() const { return reviews.size(); }

private:
    std::vector<ReviewEvent> reviews;
    std::vector<SessionEvent> session_events;
};
