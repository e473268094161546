#pragma once
#include <cstdint>
#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "Card.hpp"
#include "Scheduler.hpp"
#include "../storage/ReviewLog.hpp"
#include "../storage/SchedulingStateStore.hpp"
#include "../sync/ReconciliationChannel.hpp"

enum class SessionStatus {
    NOT_STARTED,
    IN_PROGRESS,
    COMPLETE
};

std::string sessionStatusName(SessionStatus status);

enum class RateStatus {
    APPLIED,
    REFUSED,   // restricted rating; nothing changed
    INVALID    // caller error; nothing changed
};

struct RateResult {
    RateStatus status = RateStatus::INVALID;
    std::string reason;
    std::optional<SchedulingState> next;
    std::uint64_t sequence = 0;

    bool applied() const { return status == RateStatus::APPLIED; }
};

struct ChoiceResult {
    bool accepted = false;
    bool correct = false;
    std::string reason;
};

enum class ReconcileStatus {
    CONFIRMED,
    STALE,              // an answer for a later review was already applied
    FAILED_WILL_RETRY,
    ABANDONED           // retry limit reached; local estimate stands
};

std::string reconcileStatusName(ReconcileStatus status);

struct ReconcileOutcome {
    std::string card_id;
    std::uint64_t sequence = 0;
    ReconcileStatus status = ReconcileStatus::FAILED_WILL_RETRY;
    std::string error;
};

// One card of a session: the session-local view, not the stored record.
struct SessionCard {
    Card card;
    SchedulingState state;
    IntervalPreviews previews;
    bool rated = false;
    bool restricted = false;   // choice answered wrong: only AGAIN/HARD allowed
    std::optional<bool> choice_correct;
};

struct SessionRecord {
    std::string deck_id;
    std::vector<SessionCard> cards;
    std::size_t current_index = 0;   // == cards.size() when complete
    int reviewed = 0;
    int correct = 0;
    std::time_t started_at = 0;
};

struct Progress {
    std::size_t current = 0;
    std::size_t total = 0;
    double percentage = 0.0;
};

struct SessionSummary {
    std::string deck_id;
    int reviewed = 0;
    int correct = 0;
    std::time_t started_at = 0;
    std::time_t ended_at = 0;
    std::int64_t duration_ms = 0;
};

struct SessionOptions {
    int retry_limit = 3;
};

extern const char* const RESTRICTED_RATING_REASON;

/*
  Single-pass study session over a working set of cards, for one learner.

  Ratings are applied locally first (store tagged optimistic), logged, then
  submitted to the remote scheduler. Remote answers are applied only when
  the owner calls pumpReconciliation()/flushReconciliation(), always keyed by
  card identity: the store entry is overwritten, the session snapshot only
  if that card is still the current one.

  The store, log and scheduler are owned by the caller and must outlive this
  object; the destructor waits for and applies in-flight calls.
*/
class SessionManager {
public:
    SessionManager(std::string learnerId, const Scheduler& scheduler,
        SchedulingStateStore& store, ReviewLog& log,
        std::shared_ptr<RemoteScheduler> remote, SessionOptions options = SessionOptions());
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    SessionStatus status() const;

    // Replaces any current session. Duplicate card ids keep the first one.
    void startSession(const std::string& deckId, const std::vector<Card>& cards, std::time_t now);

    const SessionCard* getCurrentCard() const;

    ChoiceResult submitChoiceAnswer(std::size_t optionIndex);

    RateResult rateCard(Rating rating, std::uint64_t reviewTimeMs, std::time_t now);
    // Raw input variant: rejects ratings outside 1..4 and cards that are not current.
    RateResult rateCard(const std::string& cardId, int rawRating, std::uint64_t reviewTimeMs, std::time_t now);

    bool nextCard();

    std::optional<SessionSummary> endSession(std::time_t now);

    Progress getProgress() const;

    std::vector<ReconcileOutcome> pumpReconciliation();
    std::vector<ReconcileOutcome> flushReconciliation();

    // Resubmits unconfirmed reviews not already in flight. Returns how many.
    std::size_t syncPending();

    const std::optional<SessionRecord>& session() const { return current; }
    const std::string& learnerId() const { return learner_id; }
    std::size_t inFlight() const { return channel.inFlight(); }

private:
    std::string learner_id;
    const Scheduler& scheduler;
    SchedulingStateStore& store;
    ReviewLog& log;
    ReconciliationChannel channel;
    SessionOptions options;
    std::optional<SessionRecord> current;

    void dispatch(const std::string& cardId, const PendingReview& review);
    std::vector<ReconcileOutcome> apply(const std::vector<ReconciliationMessage>& messages);
    ReconcileOutcome applyOne(const ReconciliationMessage& message);

    static RateResult invalid(const std::string& reason);
};
