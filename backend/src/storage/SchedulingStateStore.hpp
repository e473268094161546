#pragma once
#include <cstdint>
#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "../core/Card.hpp"
#include "../core/SchedulingState.hpp"

enum class SyncTag {
    OPTIMISTIC,               // local estimate, authoritative answer outstanding
    AUTHORITATIVE_CONFIRMED
};

std::string syncTagName(SyncTag tag);
std::optional<SyncTag> syncTagFromName(const std::string& name);

// A local review whose authoritative result has not arrived yet.
struct PendingReview {
    std::uint64_t sequence = 0;
    Rating rating = Rating::GOOD;
    std::uint64_t review_time_ms = 0;
    std::time_t reviewed_at = 0;
    int attempts = 0;              // failed submissions so far
};

struct StateRecord {
    std::string card_id;
    std::string learner_id;
    SchedulingState state;
    SyncTag tag = SyncTag::AUTHORITATIVE_CONFIRMED;
    std::uint64_t last_sequence = 0;       // last local review applied
    std::uint64_t confirmed_sequence = 0;  // last review the authority answered
    std::vector<PendingReview> pending;    // oldest first
};

struct PendingSubmission {
    std::string card_id;
    std::string learner_id;
    PendingReview review;
};

struct DueQuery {
    std::string learner_id;
    std::vector<Card> cards;                // candidate cards (usually one deck)
    std::time_t now = 0;
    std::size_t offset = 0;
    std::size_t limit = 20;
    std::optional<std::size_t> max_new;     // daily new-card allowance
};

struct DuePage {
    std::vector<Card> cards;
    std::size_t total_due = 0;   // before paging
    std::size_t new_count = 0;   // in this page
    std::size_t review_count = 0;
};

enum class AuthoritativeApply {
    APPLIED,
    STALE          // an answer for a later review was already applied
};

/*
  One scheduling record per (card, learner). The single mutable resource
  shared by sessions and background reconciliation; every write is keyed by
  identity, never by a session position.

  Sequence numbers order the reviews of one record: optimistic writes bump
  last_sequence, authoritative writes carry the sequence they answer.
*/
class SchedulingStateStore {
public:
    using Key = std::pair<std::string, std::string>; // (card_id, learner_id)

    const StateRecord* find(const std::string& cardId, const std::string& learnerId) const;

    // Latest usable state, or a fresh new-phase record when none exists or the
    // stored one is corrupt. Creates/replaces the record in that case.
    const StateRecord& ensure(const std::string& cardId, const std::string& learnerId, std::time_t now);

    // Local-first write. Returns the review's sequence number.
    std::uint64_t applyOptimistic(const std::string& cardId, const std::string& learnerId,
        const SchedulingState& next, Rating rating, std::uint64_t reviewTimeMs, std::time_t now);

    AuthoritativeApply applyAuthoritative(const std::string& cardId, const std::string& learnerId,
        std::uint64_t sequence, const AuthoritativeState& authoritative);

    // Counts a failed submission. Returns false once the review is abandoned
    // after `retryLimit` attempts; its optimistic state stays in place.
    bool recordSyncFailure(const std::string& cardId, const std::string& learnerId,
        std::uint64_t sequence, int retryLimit);

    std::vector<PendingSubmission> pendingSubmissions(const std::string& learnerId) const;
    std::size_t pendingCount(const std::string& learnerId) const;

    DuePage fetchDue(const DueQuery& query) const;

    // Loading from disk; replaces any record with the same key.
    void upsert(const StateRecord& record);

    std::vector<StateRecord> records(const std::string& learnerId) const;
    const std::map<Key, StateRecord>& all() const { return records_by_key; }
    std::size_t size() const { return records_by_key.size(); }
    void clear() { records_by_key.clear(); }

private:
    std::map<Key, StateRecord> records_by_key;
};
