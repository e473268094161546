#pragma once
#include <array>
#include <ctime>
#include <string>
#include <vector>
#include "Rating.hpp"
#include "SchedulingState.hpp"

/*
  Tuneable inputs of the memory model. Learning steps are minutes, every
  other interval is in days. The weight vector follows the FSRS v4 layout:
    w[0..3]   initial stability per rating
    w[4..7]   difficulty (initial mean, per-grade slope, step, mean reversion)
    w[8..10]  recall stability growth
    w[11..14] post-lapse stability
    w[15..16] hard penalty, easy bonus
*/
struct SchedulerParams {
    double request_retention = 0.9;
    double maximum_interval = 36500.0;
    std::vector<double> learning_steps = { 1.0, 10.0 };
    std::vector<double> relearning_steps = { 10.0 };
    double graduating_interval = 1.0;
    double easy_interval = 4.0;
    double min_stability = 0.1;
    double max_stability = 36500.0;
    std::array<double, 17> w = {
        0.4, 0.6, 2.4, 5.8,
        4.93, 0.94, 0.86, 0.01,
        1.49, 0.14, 0.94,
        2.18, 0.05, 0.34, 1.26,
        0.29, 2.61
    };

    // Empty string when usable, otherwise the first problem found.
    std::string validate() const;
};

// Scheduled interval, in days, that each rating would produce.
struct IntervalPreviews {
    std::array<double, 4> days{};

    double operator[](Rating r) const { return days[ratingIndex(r)]; }
};

struct SchedulingOutcome {
    SchedulingState next;
    double interval_days = 0.0;
};

// All four candidate outcomes for one pre-update state.
struct SchedulingPreview {
    std::array<SchedulingOutcome, 4> outcomes;

    const SchedulingOutcome& operator[](Rating r) const { return outcomes[ratingIndex(r)]; }
    IntervalPreviews intervals() const;
};

struct SchedulingUpdate {
    SchedulingState next;
    IntervalPreviews previews;
};

/*
  Pure stability/difficulty scheduler:
   - previews for all four ratings come from the pre-update state
   - the committed update for a rating is exactly its preview
   - stability, difficulty and intervals are clamped here, never by callers
   - intervals are ordered again <= hard <= good <= easy
   - never reads the wall clock; `now` is always passed in
*/
class Scheduler {
public:
    explicit Scheduler(SchedulerParams params = SchedulerParams());

    SchedulingPreview preview(const SchedulingState& state, std::time_t now) const;
    SchedulingUpdate computeUpdate(const SchedulingState& state, Rating rating, std::time_t now) const;

    // Probability of recall after `elapsedDays` for a given stability.
    double retrievability(double stability, double elapsedDays) const;
    // Interval (days) at which recall falls to the requested retention.
    double nextInterval(double stability) const;

    const SchedulerParams& params() const { return params_; }

private:
    SchedulerParams params_;

    struct Candidate {
        SchedulingState next;    // phase, step, S, D, lapses filled in
        double interval_days = 0.0;
    };
    using Candidates = std::array<Candidate, 4>;

    Candidates candidatesForNew(const SchedulingState& s) const;
    Candidates candidatesForLearning(const SchedulingState& s, const std::vector<double>& steps, Phase phase) const;
    Candidates candidatesForReview(const SchedulingState& s, double elapsedDays) const;

    double initialStability(Rating r) const;
    double initialDifficulty(Rating r) const;
    double nextDifficulty(double d, Rating r) const;
    double recallStability(double s, double d, double r, Rating rating) const;
    double forgetStability(double s, double d, double r) const;

    double clampStability(double s) const;
    double hardStepMinutes(const std::vector<double>& steps, std::size_t step) const;
    double graduationDays(double stability, double floorDays) const;

    // short-term stability multipliers while (re)learning
    double learning_hard_factor;
    double learning_good_factor;
    double learning_easy_factor;
};

// Compact human label for an interval in days: "1m", "6h", "3d", "2mo", "1.5y".
std::string formatInterval(double days);
