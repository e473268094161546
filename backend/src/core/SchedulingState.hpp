#pragma once
#include <ctime>
#include <cstddef>
#include <optional>
#include <string>
#include "Rating.hpp"

// Memory-model belief for one (card, learner) pair.
struct SchedulingState {
    double stability = 0.0;        // days until recall decays to the retention target
    double difficulty = 0.0;       // [1..10], higher => harder; 0 until first rating
    double elapsed_days = 0.0;     // since last review, at the time of the last review
    double scheduled_days = 0.0;   // interval chosen at the last review (fractional for steps)
    int reps = 0;                  // non-decreasing
    int lapses = 0;                // non-decreasing
    Phase phase = Phase::NEW;
    std::size_t learning_step = 0; // index into the active (re)learning step list
    std::time_t due = 0;
    std::optional<std::time_t> last_review;

    // Fresh record for a card the learner has never rated: due immediately.
    static SchedulingState fresh(std::time_t now);

    // False for records that cannot have come out of the Scheduler
    // (non-finite numbers, negative counters, due before last review).
    bool isConsistent() const;

    bool isDue(std::time_t now) const { return due <= now; }

    std::string describe() const;
};

// Fields the authoritative scheduler returns; counters stay local.
struct AuthoritativeState {
    double stability = 0.0;
    double difficulty = 0.0;
    Phase phase = Phase::NEW;
    std::time_t due = 0;
};

bool operator==(const SchedulingState& a, const SchedulingState& b);
bool operator!=(const SchedulingState& a, const SchedulingState& b);
