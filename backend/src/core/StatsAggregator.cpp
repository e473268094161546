#include "StatsAggregator.hpp"
#include <algorithm>
#include <set>
#include <spdlog/spdlog.h>

namespace {
    constexpr std::int64_t SECONDS_PER_DAY = 86400;

    std::int64_t floorDiv(std::int64_t a, std::int64_t b) {
        std::int64_t q = a / b;
        if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
        return q;
    }
}

StatsAggregator::StatsAggregator(const SchedulingStateStore& stateStore, const ReviewLog& reviewLog,
    int utcOffsetMinutes, StudyLimits limits)
    : store(stateStore),
    log(reviewLog),
    utc_offset_minutes(utcOffsetMinutes),
    study_limits(limits)
{
}

std::int64_t StatsAggregator::localDay(std::time_t t) const {
    return floorDiv(static_cast<std::int64_t>(t) + static_cast<std::int64_t>(utc_offset_minutes) * 60, SECONDS_PER_DAY);
}

std::time_t StatsAggregator::localDayEnd(std::int64_t day) const {
    return static_cast<std::time_t>((day + 1) * SECONDS_PER_DAY - static_cast<std::int64_t>(utc_offset_minutes) * 60 - 1);
}

std::string StatsAggregator::dayString(std::int64_t day) const {
    std::time_t t = static_cast<std::time_t>(day * SECONDS_PER_DAY);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

bool StatsAggregator::isMastered(const SchedulingState& state) {
    return state.phase == Phase::REVIEW && state.stability > MASTERED_STABILITY_DAYS;
}

int StatsAggregator::hostUtcOffsetMinutes(std::time_t now) {
    std::tm local{};
    std::tm utc{};
    localtime_r(&now, &local);
    gmtime_r(&now, &utc);

    // both broken-down times read back as if they were UTC
    local.tm_isdst = 0;
    utc.tm_isdst = 0;
    std::time_t asLocal = timegm(&local);
    std::time_t asUtc = timegm(&utc);
    return static_cast<int>((asLocal - asUtc) / 60);
}

DeckStats StatsAggregator::deckStats(const std::string& deckId, const std::vector<Card>& cards,
    const std::string& learnerId, std::time_t now) const
{
    DeckStats stats;
    stats.deck_id = deckId;

    for (const auto& card : cards) {
        if (card.deck_id != deckId) continue;
        stats.total++;

        const StateRecord* rec = store.find(card.id, learnerId);
        if (!rec || !rec->state.isConsistent()) {
            // never studied, or unusable and treated as new
            stats.new_count++;
            stats.due++;
            continue;
        }

        const SchedulingState& s = rec->state;
        switch (s.phase) {
        case Phase::NEW: stats.new_count++; break;
        case Phase::LEARNING: stats.learning_count++; break;
        case Phase::REVIEW: stats.review_count++; break;
        case Phase::RELEARNING: stats.relearning_count++; break;
        }
        if (s.isDue(now)) stats.due++;
        if (isMastered(s)) stats.mastered++;
    }

    stats.mastery_ratio = stats.total == 0 ? 0.0
        : static_cast<double>(stats.mastered) / static_cast<double>(stats.total);
    return stats;
}

DailyQuota StatsAggregator::quota(const std::string& learnerId, std::time_t now) const {
    DailyQuota q;
    std::int64_t today = localDay(now);

    for (const auto& e : log.events()) {
        if (e.learner_id != learnerId || localDay(e.reviewed_at) != today) continue;
        if (e.phase == Phase::NEW) q.new_used++;
        else q.reviews_used++;
    }

    q.new_remaining = std::max(0, study_limits.new_cards_per_day - q.new_used);
    if (study_limits.reviews_per_day > 0) {
        q.reviews_remaining = std::max(0, study_limits.reviews_per_day - q.reviews_used);
    }
    return q;
}

GlobalStats StatsAggregator::globalStats(const std::string& learnerId, const std::vector<Card>& cards, std::time_t now) const {
    GlobalStats g;
    std::int64_t today = localDay(now);

    /* ---- Review log ---- */
    std::set<std::int64_t> studyDays;
    int correct = 0;
    for (const auto& e : log.events()) {
        if (e.learner_id != learnerId) continue;

        std::int64_t day = localDay(e.reviewed_at);
        studyDays.insert(day);

        g.rating_counts[ratingIndex(e.rating)]++;
        g.total_reviews++;
        if (isCorrect(e.rating)) correct++;

        if (day == today) {
            g.reviewed_today++;
            g.study_time_today_ms += e.review_time_ms;
            if (e.phase == Phase::NEW) g.new_today++;
        }
    }
    g.accuracy = g.total_reviews == 0 ? 0.0 : static_cast<double>(correct) / static_cast<double>(g.total_reviews);

    /* ---- Streaks ---- */
    if (!studyDays.empty()) {
        std::int64_t last = *studyDays.rbegin();
        g.last_study_day = dayString(last);

        int run = 0;
        std::int64_t prev = 0;
        for (std::int64_t day : studyDays) {
            run = (run > 0 && day == prev + 1) ? run + 1 : 1;
            g.streak_longest = std::max(g.streak_longest, run);
            prev = day;
        }
        // `run` now ends at the most recent day
        if (last == today || last == today - 1) g.streak_current = run;
    }

    /* ---- Cards ---- */
    std::time_t endToday = localDayEnd(today);
    std::time_t endTomorrow = localDayEnd(today + 1);
    for (const auto& card : cards) {
        g.total_cards++;
        const StateRecord* rec = store.find(card.id, learnerId);
        if (!rec || !rec->state.isConsistent()) {
            g.due_today++;
            continue;
        }
        const SchedulingState& s = rec->state;
        if (s.due <= endToday) g.due_today++;
        else if (s.due <= endTomorrow) g.due_tomorrow++;
        if (isMastered(s)) g.total_mastered++;
    }

    g.quota = quota(learnerId, now);

    spdlog::debug("globalStats learner={}: reviews={} today={} streak={}/{} due_today={}",
        learnerId, g.total_reviews, g.reviewed_today, g.streak_current, g.streak_longest, g.due_today);
    return g;
}
