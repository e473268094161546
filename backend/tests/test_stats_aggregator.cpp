#include "../src/core/StatsAggregator.hpp"

#include <cmath>
#include <ctime>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct TestSuite {
  bool ok = true;
  void require(bool condition, const std::string& message) {
    if (!condition) {
      std::cerr << "[FAIL] " << message << std::endl;
      ok = false;
    }
  }
};

constexpr std::time_t T0 = 1767225600;  // 2026-01-01T00:00:00Z
constexpr std::time_t DAY = 86400;
const std::string LEARNER = "ada";

Card card(const std::string& id) {
  Card c = Card::simple("deck", "prompt " + id, "answer " + id, 0);
  c.id = id;
  return c;
}

void putState(SchedulingStateStore& store, const std::string& id, Phase phase, double stability, std::time_t due) {
  StateRecord rec;
  rec.card_id = id;
  rec.learner_id = LEARNER;
  rec.state.phase = phase;
  rec.state.stability = stability;
  rec.state.difficulty = 5.0;
  rec.state.reps = 3;
  rec.state.last_review = T0 - 40 * DAY;
  rec.state.due = due;
  store.upsert(rec);
}

ReviewEvent event(std::time_t at, Rating rating, Phase phase = Phase::REVIEW, std::uint64_t ms = 1000) {
  ReviewEvent e;
  e.card_id = "a";
  e.learner_id = LEARNER;
  e.deck_id = "deck";
  e.rating = rating;
  e.phase = phase;
  e.review_time_ms = ms;
  e.reviewed_at = at;
  return e;
}

void test_deck_stats(TestSuite& suite) {
  SchedulingStateStore store;
  ReviewLog log;
  putState(store, "b", Phase::REVIEW, 30.0, T0 + 10 * DAY);
  putState(store, "c", Phase::REVIEW, 5.0, T0 - DAY);
  putState(store, "d", Phase::LEARNING, 1.0, T0 - 60);

  StatsAggregator stats(store, log);
  std::vector<Card> cards = {card("a"), card("b"), card("c"), card("d")};
  DeckStats d = stats.deckStats("deck", cards, LEARNER, T0);

  suite.require(d.total == 4, "deck total counts every card");
  suite.require(d.new_count == 1, "a card without a record counts as new");
  suite.require(d.review_count == 2 && d.learning_count == 1 && d.relearning_count == 0, "phase counts");
  suite.require(d.due == 3, "unseen and overdue cards are due");
  suite.require(d.mastered == 1, "review with stability over 21 days is mastered");
  suite.require(std::fabs(d.mastery_ratio - 0.25) < 1e-12, "mastery ratio is mastered over total");

  DeckStats empty = stats.deckStats("other", cards, LEARNER, T0);
  suite.require(empty.total == 0 && empty.mastery_ratio == 0.0, "an empty deck has zero mastery");
}

void test_streak_across_local_midnight(TestSuite& suite) {
  SchedulingStateStore store;
  ReviewLog log;
  // 23:30 and 00:30 local time at UTC+1
  log.append(event(T0 - 90 * 60, Rating::GOOD));
  log.append(event(T0 - 30 * 60, Rating::GOOD));

  StatsAggregator plusOne(store, log, 60);
  GlobalStats g = plusOne.globalStats(LEARNER, {}, T0);
  suite.require(g.streak_current == 2, "two local days make a streak of two");
  suite.require(g.streak_longest == 2, "longest streak includes the current one");
  suite.require(g.reviewed_today == 1, "reviewed today resets at local midnight");
  suite.require(g.last_study_day && *g.last_study_day == "2026-01-01", "last study day is the local date");

  StatsAggregator utc(store, log, 0);
  GlobalStats u = utc.globalStats(LEARNER, {}, T0);
  suite.require(u.streak_current == 1, "same reviews fall on one UTC day");
  suite.require(u.reviewed_today == 0, "nothing reviewed on the new UTC day");
  suite.require(u.last_study_day && *u.last_study_day == "2025-12-31", "last UTC study day is the previous date");
}

void test_streak_rules(TestSuite& suite) {
  SchedulingStateStore store;
  ReviewLog log;
  for (int d : {10, 9, 8, 1, 0}) log.append(event(T0 + 3600 - d * DAY, Rating::GOOD));

  StatsAggregator stats(store, log);
  GlobalStats g = stats.globalStats(LEARNER, {}, T0 + 7200);
  suite.require(g.streak_current == 2, "current streak counts back from today");
  suite.require(g.streak_longest == 3, "longest streak is the longest run");

  GlobalStats later = stats.globalStats(LEARNER, {}, T0 + DAY + 7200);
  suite.require(later.streak_current == 2, "a streak survives while yesterday was studied");

  GlobalStats lapsed = stats.globalStats(LEARNER, {}, T0 + 2 * DAY + 7200);
  suite.require(lapsed.streak_current == 0, "a missed day breaks the current streak");
  suite.require(lapsed.streak_longest == 3, "a broken streak keeps the longest");

  ReviewLog empty;
  StatsAggregator none(store, empty);
  GlobalStats n = none.globalStats(LEARNER, {}, T0);
  suite.require(n.streak_current == 0 && n.streak_longest == 0 && !n.last_study_day, "no reviews, no streak");
  suite.require(n.accuracy == 0.0, "no reviews, zero accuracy");
}

void test_today_and_distribution(TestSuite& suite) {
  SchedulingStateStore store;
  ReviewLog log;
  log.append(event(T0 - DAY, Rating::AGAIN, Phase::REVIEW, 5000));
  log.append(event(T0 + 100, Rating::GOOD, Phase::NEW, 1500));
  log.append(event(T0 + 200, Rating::EASY, Phase::NEW, 2500));
  log.append(event(T0 + 300, Rating::HARD, Phase::REVIEW, 1000));

  ReviewEvent other = event(T0 + 400, Rating::EASY, Phase::NEW, 9999);
  other.learner_id = "bob";
  log.append(other);

  StudyLimits limits;
  limits.new_cards_per_day = 2;
  limits.reviews_per_day = 3;
  StatsAggregator stats(store, log, 0, limits);
  GlobalStats g = stats.globalStats(LEARNER, {}, T0 + 3600);

  suite.require(g.total_reviews == 4, "other learners' reviews are excluded");
  suite.require(g.reviewed_today == 3, "three reviews today");
  suite.require(g.new_today == 2, "new cards counted by pre-review phase");
  suite.require(g.study_time_today_ms == 5000, "study time sums today's review times");
  suite.require(g.rating_counts[ratingIndex(Rating::AGAIN)] == 1 && g.rating_counts[ratingIndex(Rating::HARD)] == 1 &&
                    g.rating_counts[ratingIndex(Rating::GOOD)] == 1 && g.rating_counts[ratingIndex(Rating::EASY)] == 1,
                "rating distribution");
  suite.require(std::fabs(g.accuracy - 0.5) < 1e-12, "accuracy is the share of good and easy");

  suite.require(g.quota.new_used == 2 && g.quota.new_remaining == 0, "new quota used up");
  suite.require(g.quota.reviews_used == 1, "one review used today");
  suite.require(g.quota.reviews_remaining && *g.quota.reviews_remaining == 2, "review quota remaining");

  StatsAggregator unlimited(store, log);
  DailyQuota q = unlimited.quota(LEARNER, T0 + 3600);
  suite.require(!q.reviews_remaining, "zero review limit means unlimited");
  suite.require(q.new_remaining == 18, "default new-card limit is 20");
}

void test_due_today_and_tomorrow(TestSuite& suite) {
  SchedulingStateStore store;
  ReviewLog log;
  putState(store, "overdue", Phase::REVIEW, 30.0, T0 - DAY);
  putState(store, "tonight", Phase::REVIEW, 5.0, T0 + 20 * 3600);
  putState(store, "tomorrow", Phase::REVIEW, 5.0, T0 + 30 * 3600);
  putState(store, "later", Phase::REVIEW, 5.0, T0 + 50 * 3600);

  StatsAggregator stats(store, log);
  std::vector<Card> cards = {card("unseen"), card("overdue"), card("tonight"), card("tomorrow"), card("later")};
  GlobalStats g = stats.globalStats(LEARNER, cards, T0 + 12 * 3600);

  suite.require(g.due_today == 3, "unseen, overdue and later-today cards are due today");
  suite.require(g.due_tomorrow == 1, "one card due tomorrow");
  suite.require(g.total_cards == 5 && g.total_mastered == 1, "card totals");
}

void test_recompute_is_stable(TestSuite& suite) {
  SchedulingStateStore store;
  ReviewLog log;
  putState(store, "b", Phase::REVIEW, 30.0, T0 + DAY);
  log.append(event(T0 - DAY, Rating::GOOD));
  log.append(event(T0 + 60, Rating::AGAIN));

  StatsAggregator stats(store, log, 120);
  std::vector<Card> cards = {card("a"), card("b")};
  GlobalStats a = stats.globalStats(LEARNER, cards, T0 + 3600);
  GlobalStats b = stats.globalStats(LEARNER, cards, T0 + 3600);

  bool same = a.streak_current == b.streak_current && a.streak_longest == b.streak_longest &&
              a.last_study_day == b.last_study_day && a.reviewed_today == b.reviewed_today &&
              a.new_today == b.new_today && a.study_time_today_ms == b.study_time_today_ms &&
              a.rating_counts == b.rating_counts && a.accuracy == b.accuracy && a.due_today == b.due_today &&
              a.due_tomorrow == b.due_tomorrow && a.total_mastered == b.total_mastered &&
              a.quota.new_used == b.quota.new_used && a.quota.reviews_used == b.quota.reviews_used;
  suite.require(same, "stats recomputed from the same store and log are identical");

  DeckStats da = stats.deckStats("deck", cards, LEARNER, T0);
  DeckStats db = stats.deckStats("deck", cards, LEARNER, T0);
  suite.require(da.due == db.due && da.mastered == db.mastered && da.new_count == db.new_count,
                "deck stats recompute identically");
}

void test_local_day(TestSuite& suite) {
  SchedulingStateStore store;
  ReviewLog log;
  StatsAggregator west(store, log, -300);
  suite.require(west.localDay(T0) == west.localDay(T0 - DAY) + 1, "local days are consecutive");
  suite.require(west.dayString(west.localDay(T0)) == "2025-12-31", "UTC-5 midnight is still the previous day");
  suite.require(west.dayString(west.localDay(T0 + 5 * 3600)) == "2026-01-01", "UTC-5 day starts at 05:00 UTC");

  int host = StatsAggregator::hostUtcOffsetMinutes(T0);
  suite.require(host >= -14 * 60 && host <= 14 * 60, "host offset is a real zone offset");
}

}  // namespace

int main() {
  TestSuite suite;

  test_deck_stats(suite);
  test_streak_across_local_midnight(suite);
  test_streak_rules(suite);
  test_today_and_distribution(suite);
  test_due_today_and_tomorrow(suite);
  test_recompute_is_stable(suite);
  test_local_day(suite);

  if (!suite.ok) {
    std::cerr << "Stats aggregator tests FAILED" << std::endl;
    return 1;
  }

  std::cout << "Stats aggregator tests passed" << std::endl;
  return 0;
}
