#include "Scheduler.hpp"
#include <algorithm>
#include <cmath>
#include <utility>
#include <spdlog/spdlog.h>

static constexpr double SECONDS_PER_DAY = 86400.0;
static constexpr double MINUTES_PER_DAY = 1440.0;
static constexpr double MIN_DIFFICULTY = 1.0;
static constexpr double MAX_DIFFICULTY = 10.0;

std::string SchedulerParams::validate() const {
    if (!(request_retention > 0.0 && request_retention < 1.0))
        return "request_retention must be in (0, 1)";
    if (!(maximum_interval >= 1.0))
        return "maximum_interval must be at least 1 day";
    if (learning_steps.empty())
        return "learning_steps must not be empty";
    for (double m : learning_steps)
        if (!(m > 0.0)) return "learning_steps must be positive";
    for (double m : relearning_steps)
        if (!(m > 0.0)) return "relearning_steps must be positive";
    if (!(graduating_interval > 0.0) || !(easy_interval > 0.0))
        return "graduating_interval and easy_interval must be positive";
    if (!(min_stability > 0.0) || !(max_stability >= min_stability))
        return "stability bounds must satisfy 0 < min <= max";
    for (double x : w)
        if (!std::isfinite(x)) return "weights must be finite";
    for (std::size_t i = 0; i < 4; ++i)
        if (!(w[i] > 0.0)) return "initial stability weights must be positive";
    return "";
}

IntervalPreviews SchedulingPreview::intervals() const {
    IntervalPreviews p;
    for (std::size_t i = 0; i < outcomes.size(); ++i) p.days[i] = outcomes[i].interval_days;
    return p;
}

Scheduler::Scheduler(SchedulerParams params)
    : params_(std::move(params)),
    learning_hard_factor(1.0),
    learning_good_factor(1.2),
    learning_easy_factor(1.5)
{
    std::string why = params_.validate();
    if (!why.empty()) {
        spdlog::warn("Scheduler parameters rejected ({}); using defaults", why);
        params_ = SchedulerParams();
    }
    spdlog::info("Scheduler initialized: retention={:.2f}, max_interval={}d, learning_steps={}, relearning_steps={}",
        params_.request_retention, params_.maximum_interval,
        params_.learning_steps.size(), params_.relearning_steps.size());
}

/*
  Public API:
    - preview(state, now)            four candidate outcomes, nothing committed
    - computeUpdate(state, r, now)   the candidate for r plus all four intervals
*/

SchedulingPreview Scheduler::preview(const SchedulingState& s, std::time_t now) const {
    double elapsed = 0.0;
    if (s.last_review) {
        elapsed = std::max(0.0, static_cast<double>(now - *s.last_review) / SECONDS_PER_DAY);
    }

    Candidates c;
    switch (s.phase) {
    case Phase::NEW:
        c = candidatesForNew(s);
        break;
    case Phase::LEARNING:
        c = candidatesForLearning(s, params_.learning_steps, Phase::LEARNING);
        break;
    case Phase::RELEARNING:
        // relearning steps may have been configured away since the lapse
        c = candidatesForLearning(s,
            params_.relearning_steps.empty() ? params_.learning_steps : params_.relearning_steps,
            Phase::RELEARNING);
        break;
    case Phase::REVIEW:
        c = candidatesForReview(s, elapsed);
        break;
    }

    // Cap every interval, then lift each one to at least the previous rating's
    // so the four never cross. Capping first keeps the lift within the cap.
    SchedulingPreview out;
    double floorDays = 0.0;
    for (Rating r : kAllRatings) {
        const Candidate& cand = c[ratingIndex(r)];

        double days = std::min(cand.interval_days, params_.maximum_interval);
        days = std::max(days, floorDays);
        floorDays = days;

        long long seconds = std::max(1LL, std::llround(days * SECONDS_PER_DAY));

        SchedulingState next = cand.next;
        next.stability = clampStability(next.stability);
        next.difficulty = std::clamp(next.difficulty, MIN_DIFFICULTY, MAX_DIFFICULTY);
        next.elapsed_days = elapsed;
        next.scheduled_days = days;
        next.reps = s.reps + 1;
        next.lapses = std::max(next.lapses, s.lapses);
        next.last_review = now;
        next.due = now + static_cast<std::time_t>(seconds);

        out.outcomes[ratingIndex(r)] = SchedulingOutcome{ next, days };
    }
    return out;
}

SchedulingUpdate Scheduler::computeUpdate(const SchedulingState& s, Rating rating, std::time_t now) const {
    SchedulingPreview p = preview(s, now);

    SchedulingUpdate u;
    u.next = p[rating].next;
    u.previews = p.intervals();

    spdlog::debug("Scheduler update: q={} {} -> {} (previews {:.4f}/{:.4f}/{:.4f}/{:.4f}d)",
        ratingValue(rating), s.describe(), u.next.describe(),
        u.previews.days[0], u.previews.days[1], u.previews.days[2], u.previews.days[3]);
    return u;
}

/* -------------------------
   Memory model
   -------------------------
   Retention model: R(t) = (1 + t / (9 S))^-1, S in days.
   Solving R(I) = r for the next interval gives I = 9 S (1/r - 1); at the
   default r = 0.9 the interval equals the stability.

   - Successful recall grows S by a factor that shrinks with difficulty and
     with S itself, and grows with how much had been forgotten (1 - R).
   - A lapse replaces S with the post-lapse stability, never larger than S.
   - Difficulty steps by grade and reverts slightly toward the initial mean.
*/

double Scheduler::retrievability(double stability, double elapsedDays) const {
    if (stability <= 0.0) return 0.0;
    return 1.0 / (1.0 + std::max(0.0, elapsedDays) / (9.0 * stability));
}

double Scheduler::nextInterval(double stability) const {
    return 9.0 * stability * (1.0 / params_.request_retention - 1.0);
}

double Scheduler::initialStability(Rating r) const {
    return clampStability(params_.w[ratingIndex(r)]);
}

double Scheduler::initialDifficulty(Rating r) const {
    const auto& w = params_.w;
    double d = w[4] - (ratingValue(r) - 3) * w[5];
    return std::clamp(d, MIN_DIFFICULTY, MAX_DIFFICULTY);
}

double Scheduler::nextDifficulty(double d, Rating r) const {
    const auto& w = params_.w;
    double stepped = d - w[6] * (ratingValue(r) - 3);
    double reverted = w[7] * w[4] + (1.0 - w[7]) * stepped;
    return std::clamp(reverted, MIN_DIFFICULTY, MAX_DIFFICULTY);
}

double Scheduler::recallStability(double s, double d, double r, Rating rating) const {
    const auto& w = params_.w;
    double hardPenalty = rating == Rating::HARD ? w[15] : 1.0;
    double easyBonus = rating == Rating::EASY ? w[16] : 1.0;

    double growth = std::exp(w[8])
        * (11.0 - d)
        * std::pow(s, -w[9])
        * (std::exp((1.0 - r) * w[10]) - 1.0)
        * hardPenalty
        * easyBonus;

    return clampStability(s * (1.0 + growth));
}

double Scheduler::forgetStability(double s, double d, double r) const {
    const auto& w = params_.w;
    double lapsed = w[11]
        * std::pow(d, -w[12])
        * (std::pow(s + 1.0, w[13]) - 1.0)
        * std::exp((1.0 - r) * w[14]);
    return clampStability(std::min(lapsed, s));
}

double Scheduler::clampStability(double s) const {
    if (!std::isfinite(s)) return params_.min_stability;
    return std::clamp(s, params_.min_stability, params_.max_stability);
}

// Hard repeats the current step with a longer delay: halfway to the next
// step, or half as long again on the last step.
double Scheduler::hardStepMinutes(const std::vector<double>& steps, std::size_t step) const {
    if (step + 1 < steps.size()) return (steps[step] + steps[step + 1]) / 2.0;
    return steps[step] * 1.5;
}

double Scheduler::graduationDays(double stability, double floorDays) const {
    return std::max(floorDays, std::max(1.0, std::round(nextInterval(stability))));
}

/* -------------------------
   Per-phase candidates
   ------------------------- */

Scheduler::Candidates Scheduler::candidatesForNew(const SchedulingState& s) const {
    const auto& steps = params_.learning_steps;
    Candidates c;

    for (Rating r : kAllRatings) {
        Candidate& cand = c[ratingIndex(r)];
        cand.next = s;
        cand.next.stability = initialStability(r);
        cand.next.difficulty = initialDifficulty(r);
        cand.next.learning_step = 0;
    }

    Candidate& again = c[ratingIndex(Rating::AGAIN)];
    again.next.phase = Phase::LEARNING;
    again.next.lapses = s.lapses + 1;
    again.interval_days = steps[0] / MINUTES_PER_DAY;

    Candidate& hard = c[ratingIndex(Rating::HARD)];
    hard.next.phase = Phase::LEARNING;
    hard.interval_days = hardStepMinutes(steps, 0) / MINUTES_PER_DAY;

    Candidate& good = c[ratingIndex(Rating::GOOD)];
    if (steps.size() > 1) {
        good.next.phase = Phase::LEARNING;
        good.next.learning_step = 1;
        good.interval_days = steps[1] / MINUTES_PER_DAY;
    }
    else {
        good.next.phase = Phase::REVIEW;
        good.interval_days = graduationDays(good.next.stability, params_.graduating_interval);
    }

    // easy skips the learning steps entirely
    Candidate& easy = c[ratingIndex(Rating::EASY)];
    easy.next.phase = Phase::REVIEW;
    easy.interval_days = graduationDays(easy.next.stability, params_.easy_interval);

    return c;
}

Scheduler::Candidates Scheduler::candidatesForLearning(const SchedulingState& s,
    const std::vector<double>& steps, Phase phase) const
{
    std::size_t step = std::min(s.learning_step, steps.size() - 1);
    double stab = clampStability(s.stability);
    double diff = s.difficulty > 0.0
        ? std::clamp(s.difficulty, MIN_DIFFICULTY, MAX_DIFFICULTY)
        : initialDifficulty(Rating::GOOD);

    // graduating out of relearning has no configured floor beyond one day
    double goodFloor = phase == Phase::LEARNING ? params_.graduating_interval : 1.0;
    double easyFloor = phase == Phase::LEARNING ? params_.easy_interval : 1.0;

    Candidates c;
    for (Rating r : kAllRatings) {
        Candidate& cand = c[ratingIndex(r)];
        cand.next = s;
        cand.next.difficulty = nextDifficulty(diff, r);
    }

    Candidate& again = c[ratingIndex(Rating::AGAIN)];
    again.next.phase = phase;
    again.next.learning_step = 0;
    again.next.lapses = s.lapses + 1;
    again.next.stability = std::min(stab, initialStability(Rating::AGAIN));
    again.interval_days = steps[0] / MINUTES_PER_DAY;

    Candidate& hard = c[ratingIndex(Rating::HARD)];
    hard.next.phase = phase;
    hard.next.learning_step = step;
    hard.next.stability = stab * learning_hard_factor;
    hard.interval_days = hardStepMinutes(steps, step) / MINUTES_PER_DAY;

    Candidate& good = c[ratingIndex(Rating::GOOD)];
    good.next.stability = stab * learning_good_factor;
    if (step + 1 < steps.size()) {
        good.next.phase = phase;
        good.next.learning_step = step + 1;
        good.interval_days = steps[step + 1] / MINUTES_PER_DAY;
    }
    else {
        good.next.phase = Phase::REVIEW;
        good.next.learning_step = 0;
        good.interval_days = graduationDays(good.next.stability, goodFloor);
    }

    Candidate& easy = c[ratingIndex(Rating::EASY)];
    easy.next.phase = Phase::REVIEW;
    easy.next.learning_step = 0;
    easy.next.stability = stab * learning_easy_factor;
    easy.interval_days = graduationDays(easy.next.stability, easyFloor);

    return c;
}

Scheduler::Candidates Scheduler::candidatesForReview(const SchedulingState& s, double elapsedDays) const {
    double stab = clampStability(s.stability);
    double diff = std::clamp(s.difficulty > 0.0 ? s.difficulty : params_.w[4], MIN_DIFFICULTY, MAX_DIFFICULTY);
    double recall = retrievability(stab, elapsedDays);

    Candidates c;
    for (Rating r : kAllRatings) {
        Candidate& cand = c[ratingIndex(r)];
        cand.next = s;
        cand.next.phase = Phase::REVIEW;
        cand.next.learning_step = 0;
        cand.next.difficulty = nextDifficulty(diff, r);
    }

    // lapse
    Candidate& again = c[ratingIndex(Rating::AGAIN)];
    again.next.stability = forgetStability(stab, diff, recall);
    again.next.lapses = s.lapses + 1;
    if (!params_.relearning_steps.empty()) {
        again.next.phase = Phase::RELEARNING;
        again.interval_days = params_.relearning_steps[0] / MINUTES_PER_DAY;
    }
    else {
        again.interval_days = 1.0;
    }

    double hardDays = 0.0, goodDays = 0.0, easyDays = 0.0;
    for (Rating r : { Rating::HARD, Rating::GOOD, Rating::EASY }) {
        Candidate& cand = c[ratingIndex(r)];
        cand.next.stability = recallStability(stab, diff, recall, r);
        double days = std::max(1.0, std::round(nextInterval(cand.next.stability)));
        if (r == Rating::HARD) hardDays = days;
        else if (r == Rating::GOOD) goodDays = days;
        else easyDays = days;
    }

    // whole-day review intervals strictly separate the successful grades
    hardDays = std::min(hardDays, goodDays);
    goodDays = std::max(goodDays, hardDays + 1.0);
    easyDays = std::max(easyDays, goodDays + 1.0);

    c[ratingIndex(Rating::HARD)].interval_days = hardDays;
    c[ratingIndex(Rating::GOOD)].interval_days = goodDays;
    c[ratingIndex(Rating::EASY)].interval_days = easyDays;

    spdlog::debug("Review candidates: S={:.3f} D={:.3f} R={:.3f} t={:.2f}d -> {}/{}/{}d",
        stab, diff, recall, elapsedDays, hardDays, goodDays, easyDays);
    return c;
}

std::string formatInterval(double days) {
    if (days < 1.0 / 24.0) {
        long long minutes = std::max(1LL, std::llround(days * MINUTES_PER_DAY));
        return std::to_string(minutes) + "m";
    }
    if (days < 1.0) {
        return std::to_string(std::llround(days * 24.0)) + "h";
    }
    if (days < 30.0) {
        return std::to_string(std::llround(days)) + "d";
    }
    if (days < 365.0) {
        return std::to_string(std::llround(days / 30.0)) + "mo";
    }
    return fmt::format("{:.1f}y", days / 365.0);
}
