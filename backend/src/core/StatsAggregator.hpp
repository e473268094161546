#pragma once
#include <array>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include "Card.hpp"
#include "../storage/ReviewLog.hpp"
#include "../storage/SchedulingStateStore.hpp"

struct StudyLimits {
    int new_cards_per_day = 20;
    int reviews_per_day = 0;   // 0 = unlimited
};

struct DeckStats {
    std::string deck_id;
    std::size_t total = 0;
    std::size_t new_count = 0;         // includes cards without a record
    std::size_t learning_count = 0;
    std::size_t review_count = 0;
    std::size_t relearning_count = 0;
    std::size_t due = 0;
    std::size_t mastered = 0;
    double mastery_ratio = 0.0;
};

struct DailyQuota {
    int new_used = 0;
    int new_remaining = 0;
    int reviews_used = 0;
    std::optional<int> reviews_remaining;   // nullopt when unlimited
};

struct GlobalStats {
    int streak_current = 0;
    int streak_longest = 0;
    std::optional<std::string> last_study_day;   // YYYY-MM-DD, local

    int reviewed_today = 0;
    int new_today = 0;
    std::uint64_t study_time_today_ms = 0;

    std::array<int, 4> rating_counts{};   // indexed by ratingIndex
    int total_reviews = 0;
    double accuracy = 0.0;                // share of GOOD/EASY

    std::size_t due_today = 0;
    std::size_t due_tomorrow = 0;
    std::size_t total_cards = 0;
    std::size_t total_mastered = 0;

    DailyQuota quota;
};

/*
  Read-only projection over the scheduling store and the review log.
  Keeps no counters of its own: the same inputs always give the same
  numbers. Calendar days are local days at a fixed UTC offset.
*/
class StatsAggregator {
public:
    static constexpr double MASTERED_STABILITY_DAYS = 21.0;

    StatsAggregator(const SchedulingStateStore& store, const ReviewLog& log,
        int utcOffsetMinutes = 0, StudyLimits limits = StudyLimits());

    DeckStats deckStats(const std::string& deckId, const std::vector<Card>& cards,
        const std::string& learnerId, std::time_t now) const;

    GlobalStats globalStats(const std::string& learnerId, const std::vector<Card>& cards, std::time_t now) const;

    DailyQuota quota(const std::string& learnerId, std::time_t now) const;

    // Days since the epoch in local time.
    std::int64_t localDay(std::time_t t) const;
    std::string dayString(std::int64_t day) const;

    static bool isMastered(const SchedulingState& state);

    // Offset of the host's local zone at `now`, in minutes east of UTC.
    static int hostUtcOffsetMinutes(std::time_t now);

    int utcOffsetMinutes() const { return utc_offset_minutes; }
    const StudyLimits& limits() const { return study_limits; }

private:
    const SchedulingStateStore& store;
    const ReviewLog& log;
    int utc_offset_minutes;
    StudyLimits study_limits;

    // End of the local day containing `day` start + n days, as a timestamp.
    std::time_t localDayEnd(std::int64_t day) const;
};
