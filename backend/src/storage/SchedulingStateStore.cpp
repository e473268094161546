#include "SchedulingStateStore.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

std::string syncTagName(SyncTag tag) {
    switch (tag) {
    case SyncTag::OPTIMISTIC: return "optimistic";
    case SyncTag::AUTHORITATIVE_CONFIRMED: return "confirmed";
    }
    return "optimistic";
}

std::optional<SyncTag> syncTagFromName(const std::string& name) {
    if (name == "optimistic") return SyncTag::OPTIMISTIC;
    if (name == "confirmed") return SyncTag::AUTHORITATIVE_CONFIRMED;
    return std::nullopt;
}

const StateRecord* SchedulingStateStore::find(const std::string& cardId, const std::string& learnerId) const {
    auto it = records_by_key.find(Key(cardId, learnerId));
    if (it == records_by_key.end()) return nullptr;
    return &it->second;
}

const StateRecord& SchedulingStateStore::ensure(const std::string& cardId, const std::string& learnerId, std::time_t now) {
    auto it = records_by_key.find(Key(cardId, learnerId));
    if (it == records_by_key.end()) {
        StateRecord rec;
        rec.card_id = cardId;
        rec.learner_id = learnerId;
        rec.state = SchedulingState::fresh(now);
        spdlog::debug("StateStore: new record for card={} learner={}", cardId, learnerId);
        return records_by_key.emplace(Key(cardId, learnerId), rec).first->second;
    }

    StateRecord& rec = it->second;
    if (!rec.state.isConsistent()) {
        // partial local storage loss: relearn from scratch rather than fail
        spdlog::warn("StateStore: corrupt state for card={} learner={} ({}); falling back to new",
            cardId, learnerId, rec.state.describe());
        rec.state = SchedulingState::fresh(now);
    }
    return rec;
}

std::uint64_t SchedulingStateStore::applyOptimistic(const std::string& cardId, const std::string& learnerId,
    const SchedulingState& next, Rating rating, std::uint64_t reviewTimeMs, std::time_t now)
{
    StateRecord& rec = records_by_key[Key(cardId, learnerId)];
    rec.card_id = cardId;
    rec.learner_id = learnerId;

    // counters never move backwards, whatever the caller computed from
    int reps = std::max(rec.state.reps, next.reps);
    int lapses = std::max(rec.state.lapses, next.lapses);
    rec.state = next;
    rec.state.reps = reps;
    rec.state.lapses = lapses;

    rec.tag = SyncTag::OPTIMISTIC;
    rec.last_sequence += 1;

    PendingReview pending;
    pending.sequence = rec.last_sequence;
    pending.rating = rating;
    pending.review_time_ms = reviewTimeMs;
    pending.reviewed_at = now;
    rec.pending.push_back(pending);

    spdlog::debug("StateStore: optimistic card={} seq={} {}", cardId, rec.last_sequence, rec.state.describe());
    return rec.last_sequence;
}

AuthoritativeApply SchedulingStateStore::applyAuthoritative(const std::string& cardId, const std::string& learnerId,
    std::uint64_t sequence, const AuthoritativeState& auth)
{
    StateRecord& rec = records_by_key[Key(cardId, learnerId)];
    if (rec.card_id.empty()) {
        rec.card_id = cardId;
        rec.learner_id = learnerId;
        rec.state = SchedulingState::fresh(auth.due);
    }

    if (sequence < rec.confirmed_sequence) {
        spdlog::warn("StateStore: stale authoritative answer for card={} (seq {} < confirmed {})",
            cardId, sequence, rec.confirmed_sequence);
        return AuthoritativeApply::STALE;
    }

    // steps only exist in the (re)learning phases the local estimate agreed on
    bool keepStep = auth.phase == rec.state.phase
        && (auth.phase == Phase::LEARNING || auth.phase == Phase::RELEARNING);
    if (!keepStep) rec.state.learning_step = 0;

    const std::time_t estimatedDue = rec.state.due;
    rec.state.stability = auth.stability;
    rec.state.difficulty = auth.difficulty;
    rec.state.phase = auth.phase;
    rec.state.due = auth.due;
    if (rec.state.last_review && rec.state.due < *rec.state.last_review) {
        spdlog::warn("StateStore: authoritative due for card={} precedes last review; clamping", cardId);
        rec.state.due = *rec.state.last_review;
    }

    // the interval must describe the due time actually held
    if (rec.state.due != estimatedDue) {
        rec.state.scheduled_days = rec.state.last_review
            ? static_cast<double>(rec.state.due - *rec.state.last_review) / 86400.0
            : 0.0;
    }

    rec.confirmed_sequence = sequence;
    rec.pending.erase(std::remove_if(rec.pending.begin(), rec.pending.end(),
        [sequence](const PendingReview& p) { return p.sequence <= sequence; }),
        rec.pending.end());
    rec.tag = rec.pending.empty() ? SyncTag::AUTHORITATIVE_CONFIRMED : SyncTag::OPTIMISTIC;

    spdlog::info("StateStore: authoritative card={} seq={} tag={} {}",
        cardId, sequence, syncTagName(rec.tag), rec.state.describe());
    return AuthoritativeApply::APPLIED;
}

bool SchedulingStateStore::recordSyncFailure(const std::string& cardId, const std::string& learnerId,
    std::uint64_t sequence, int retryLimit)
{
    auto it = records_by_key.find(Key(cardId, learnerId));
    if (it == records_by_key.end()) return false;

    auto& pending = it->second.pending;
    for (auto p = pending.begin(); p != pending.end(); ++p) {
        if (p->sequence != sequence) continue;
        p->attempts++;
        if (p->attempts >= retryLimit) {
            spdlog::error("StateStore: review seq={} for card={} exceeded retry limit ({}); keeping local estimate",
                sequence, cardId, retryLimit);
            pending.erase(p);
            return false;
        }
        spdlog::warn("StateStore: sync attempt {} failed for card={} seq={}", p->attempts, cardId, sequence);
        return true;
    }
    return false;
}

std::vector<PendingSubmission> SchedulingStateStore::pendingSubmissions(const std::string& learnerId) const {
    std::vector<PendingSubmission> out;
    for (const auto& kv : records_by_key) {
        const StateRecord& rec = kv.second;
        if (rec.learner_id != learnerId) continue;
        for (const auto& p : rec.pending) out.push_back(PendingSubmission{ rec.card_id, rec.learner_id, p });
    }
    std::sort(out.begin(), out.end(),
        [](const PendingSubmission& a, const PendingSubmission& b) {
            return a.review.reviewed_at < b.review.reviewed_at;
        });
    return out;
}

std::size_t SchedulingStateStore::pendingCount(const std::string& learnerId) const {
    std::size_t n = 0;
    for (const auto& kv : records_by_key)
        if (kv.second.learner_id == learnerId) n += kv.second.pending.size();
    return n;
}

/*
  Due fetch: never-seen (or still new) cards first in deck order, capped by
  the daily new allowance, then due reviews oldest-due first. Paged after
  ordering so successive pages never overlap.
*/
DuePage SchedulingStateStore::fetchDue(const DueQuery& q) const {
    std::vector<Card> fresh;
    std::vector<std::pair<std::time_t, Card>> reviews;

    for (const auto& card : q.cards) {
        const StateRecord* rec = find(card.id, q.learner_id);
        if (!rec || rec->state.phase == Phase::NEW) {
            fresh.push_back(card);
        }
        else if (!rec->state.isConsistent() || rec->state.isDue(q.now)) {
            reviews.emplace_back(rec->state.due, card);
        }
    }

    if (q.max_new && fresh.size() > *q.max_new) fresh.resize(*q.max_new);
    std::stable_sort(reviews.begin(), reviews.end(),
        [](const std::pair<std::time_t, Card>& a, const std::pair<std::time_t, Card>& b) {
            return a.first < b.first;
        });

    std::vector<std::pair<bool, Card>> ordered; // (is_new, card)
    for (auto& c : fresh) ordered.emplace_back(true, c);
    for (auto& r : reviews) ordered.emplace_back(false, r.second);

    DuePage page;
    page.total_due = ordered.size();
    std::size_t end = q.limit == 0 ? ordered.size() : std::min(ordered.size(), q.offset + q.limit);
    for (std::size_t i = q.offset; i < end; ++i) {
        if (ordered[i].first) page.new_count++;
        else page.review_count++;
        page.cards.push_back(ordered[i].second);
    }

    spdlog::debug("fetchDue: learner={} candidates={} due={} page=[{}, {}) new={} review={}",
        q.learner_id, q.cards.size(), page.total_due, q.offset, end, page.new_count, page.review_count);
    return page;
}

void SchedulingStateStore::upsert(const StateRecord& record) {
    records_by_key[Key(record.card_id, record.learner_id)] = record;
}

std::vector<StateRecord> SchedulingStateStore::records(const std::string& learnerId) const {
    std::vector<StateRecord> out;
    for (const auto& kv : records_by_key)
        if (kv.second.learner_id == learnerId) out.push_back(kv.second);
    return out;
}
