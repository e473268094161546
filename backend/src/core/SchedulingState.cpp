#include "SchedulingState.hpp"
#include <cmath>
#include <spdlog/fmt/fmt.h>

SchedulingState SchedulingState::fresh(std::time_t now) {
    SchedulingState s;
    s.phase = Phase::NEW;
    s.due = now;
    return s;
}

bool SchedulingState::isConsistent() const {
    if (!std::isfinite(stability) || !std::isfinite(difficulty)) return false;
    if (!std::isfinite(elapsed_days) || !std::isfinite(scheduled_days)) return false;
    if (reps < 0 || lapses < 0) return false;
    if (elapsed_days < 0.0 || scheduled_days < 0.0) return false;

    if (phase == Phase::NEW) {
        // a never-rated card carries no model parameters yet
        return reps == 0 || stability > 0.0;
    }
    if (stability <= 0.0) return false;
    if (difficulty < 1.0 || difficulty > 10.0) return false;
    if (last_review && due < *last_review) return false;
    return true;
}

std::string SchedulingState::describe() const {
    return fmt::format("phase={} S={:.3f} D={:.3f} reps={} lapses={} sched={:.4f}d due={}",
        phaseName(phase), stability, difficulty, reps, lapses, scheduled_days,
        static_cast<long long>(due));
}

bool operator==(const SchedulingState& a, const SchedulingState& b) {
    return a.stability == b.stability
        && a.difficulty == b.difficulty
        && a.elapsed_days == b.elapsed_days
        && a.scheduled_days == b.scheduled_days
        && a.reps == b.reps
        && a.lapses == b.lapses
        && a.phase == b.phase
        && a.learning_step == b.learning_step
        && a.due == b.due
        && a.last_review == b.last_review;
}

bool operator!=(const SchedulingState& a, const SchedulingState& b) {
    return !(a == b);
}
