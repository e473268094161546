#include "SessionManager.hpp"
#include <algorithm>
#include <unordered_set>
#include <utility>
#include <spdlog/spdlog.h>

const char* const RESTRICTED_RATING_REASON =
    "For incorrect answers, please choose Again or Hard to help reinforce this card";

std::string sessionStatusName(SessionStatus status) {
    switch (status) {
    case SessionStatus::NOT_STARTED: return "not_started";
    case SessionStatus::IN_PROGRESS: return "in_progress";
    case SessionStatus::COMPLETE: return "complete";
    }
    return "not_started";
}

std::string reconcileStatusName(ReconcileStatus status) {
    switch (status) {
    case ReconcileStatus::CONFIRMED: return "confirmed";
    case ReconcileStatus::STALE: return "stale";
    case ReconcileStatus::FAILED_WILL_RETRY: return "failed_will_retry";
    case ReconcileStatus::ABANDONED: return "abandoned";
    }
    return "failed_will_retry";
}

SessionManager::SessionManager(std::string learnerId, const Scheduler& sched,
    SchedulingStateStore& stateStore, ReviewLog& reviewLog,
    std::shared_ptr<RemoteScheduler> remote, SessionOptions opts)
    : learner_id(std::move(learnerId)),
    scheduler(sched),
    store(stateStore),
    log(reviewLog),
    channel(std::move(remote)),
    options(opts)
{
    if (options.retry_limit < 1) options.retry_limit = 1;
    spdlog::info("SessionManager initialized for learner '{}' (retry_limit={})", learner_id, options.retry_limit);
}

SessionManager::~SessionManager() {
    if (channel.inFlight() > 0) {
        spdlog::debug("SessionManager: applying {} outstanding reconciliations before shutdown", channel.inFlight());
        flushReconciliation();
    }
}

SessionStatus SessionManager::status() const {
    if (!current) return SessionStatus::NOT_STARTED;
    if (current->current_index >= current->cards.size()) return SessionStatus::COMPLETE;
    return SessionStatus::IN_PROGRESS;
}

void SessionManager::startSession(const std::string& deckId, const std::vector<Card>& cards, std::time_t now) {
    SessionRecord record;
    record.deck_id = deckId;
    record.started_at = now;
    record.cards.reserve(cards.size());

    std::unordered_set<std::string> seen;
    for (const auto& card : cards) {
        if (!seen.insert(card.id).second) {
            spdlog::warn("startSession: card '{}' listed twice for deck '{}'; keeping the first", card.id, deckId);
            continue;
        }
        const StateRecord& rec = store.ensure(card.id, learner_id, now);

        SessionCard entry;
        entry.card = card;
        entry.state = rec.state;
        entry.previews = scheduler.preview(rec.state, now).intervals();
        record.cards.push_back(std::move(entry));
    }

    if (current) {
        spdlog::info("startSession: replacing active session for deck '{}'", current->deck_id);
    }
    current = std::move(record);
    spdlog::info("Session started: learner={} deck={} cards={}", learner_id, deckId, current->cards.size());
}

const SessionCard* SessionManager::getCurrentCard() const {
    if (!current || current->current_index >= current->cards.size()) return nullptr;
    return &current->cards[current->current_index];
}

ChoiceResult SessionManager::submitChoiceAnswer(std::size_t optionIndex) {
    ChoiceResult result;
    if (!current || current->current_index >= current->cards.size()) {
        result.reason = "no card to answer";
        return result;
    }

    SessionCard& entry = current->cards[current->current_index];
    if (entry.card.kind != CardKind::CHOICE) {
        result.reason = "card is not a choice card";
        return result;
    }
    if (entry.rated) {
        result.reason = "card already rated in this session";
        return result;
    }
    if (optionIndex >= entry.card.options.size()) {
        result.reason = "option index out of range";
        return result;
    }

    result.accepted = true;
    result.correct = entry.card.correct_option && *entry.card.correct_option == optionIndex;
    entry.choice_correct = result.correct;
    entry.restricted = !result.correct;

    spdlog::info("Choice answer for card {}: option={} correct={}", entry.card.id, optionIndex, result.correct);
    return result;
}

RateResult SessionManager::invalid(const std::string& reason) {
    spdlog::warn("rateCard rejected: {}", reason);
    RateResult r;
    r.status = RateStatus::INVALID;
    r.reason = reason;
    return r;
}

RateResult SessionManager::rateCard(const std::string& cardId, int rawRating, std::uint64_t reviewTimeMs, std::time_t now) {
    auto rating = ratingFromInt(rawRating);
    if (!rating) return invalid("unknown rating value " + std::to_string(rawRating));
    if (!current) return invalid("no active session");

    const SessionCard* entry = getCurrentCard();
    if (!entry || entry->card.id != cardId) {
        bool inSession = std::any_of(current->cards.begin(), current->cards.end(),
            [&cardId](const SessionCard& c) { return c.card.id == cardId; });
        return invalid(inSession
            ? "card '" + cardId + "' is not the current card"
            : "card '" + cardId + "' is not in the current session");
    }
    return rateCard(*rating, reviewTimeMs, now);
}

RateResult SessionManager::rateCard(Rating rating, std::uint64_t reviewTimeMs, std::time_t now) {
    if (!current) return invalid("no active session");
    if (current->current_index >= current->cards.size()) return invalid("session is complete");

    SessionCard& entry = current->cards[current->current_index];
    if (entry.rated) return invalid("card '" + entry.card.id + "' already rated in this session");

    if (entry.restricted) {
        switch (rating) {
        case Rating::AGAIN:
        case Rating::HARD:
            break;
        case Rating::GOOD:
        case Rating::EASY: {
            spdlog::info("Rating {} refused for card {}: restricted after incorrect answer",
                ratingLabel(rating), entry.card.id);
            RateResult refused;
            refused.status = RateStatus::REFUSED;
            refused.reason = RESTRICTED_RATING_REASON;
            return refused;
        }
        }
    }

    // The store may hold a newer authoritative value than the snapshot taken
    // at session start; schedule from the latest known state.
    const StateRecord& rec = store.ensure(entry.card.id, learner_id, now);
    SchedulingState before = rec.state;
    SchedulingUpdate update = scheduler.computeUpdate(before, rating, now);

    std::uint64_t seq = store.applyOptimistic(entry.card.id, learner_id, update.next, rating, reviewTimeMs, now);
    const StateRecord* applied = store.find(entry.card.id, learner_id);

    entry.state = applied ? applied->state : update.next;
    entry.previews = update.previews;
    entry.rated = true;
    current->reviewed++;
    if (isCorrect(rating)) current->correct++;

    ReviewEvent event;
    event.card_id = entry.card.id;
    event.learner_id = learner_id;
    event.deck_id = current->deck_id;
    event.rating = rating;
    event.phase = before.phase;
    event.elapsed_days = update.next.elapsed_days;
    event.scheduled_days = update.next.scheduled_days;
    event.review_time_ms = reviewTimeMs;
    event.reviewed_at = now;
    log.append(event);

    spdlog::info("Rated card {} as {} -> {} due in {}",
        entry.card.id, ratingLabel(rating), phaseName(entry.state.phase), formatInterval(update.next.scheduled_days));

    // local state is visible before the remote call leaves
    PendingReview pending;
    pending.sequence = seq;
    pending.rating = rating;
    pending.review_time_ms = reviewTimeMs;
    pending.reviewed_at = now;
    dispatch(entry.card.id, pending);

    RateResult result;
    result.status = RateStatus::APPLIED;
    result.next = entry.state;
    result.sequence = seq;
    return result;
}

bool SessionManager::nextCard() {
    if (!current) return false;
    if (current->current_index < current->cards.size()) current->current_index++;

    bool more = current->current_index < current->cards.size();
    if (!more) {
        spdlog::info("Session complete: deck={} reviewed={} correct={}",
            current->deck_id, current->reviewed, current->correct);
    }
    return more;
}

std::optional<SessionSummary> SessionManager::endSession(std::time_t now) {
    if (!current) return std::nullopt;

    SessionSummary summary;
    summary.deck_id = current->deck_id;
    summary.reviewed = current->reviewed;
    summary.correct = current->correct;
    summary.started_at = current->started_at;
    summary.ended_at = std::max(now, current->started_at);
    summary.duration_ms = static_cast<std::int64_t>(summary.ended_at - summary.started_at) * 1000;

    SessionEvent event;
    event.learner_id = learner_id;
    event.deck_id = summary.deck_id;
    event.started_at = summary.started_at;
    event.ended_at = summary.ended_at;
    event.reviewed = summary.reviewed;
    event.correct = summary.correct;
    log.appendSession(event);

    // unconfirmed reviews stay pinned in the store; in-flight calls continue
    current.reset();
    spdlog::info("Session ended: {} call(s) still in flight, {} review(s) unconfirmed",
        channel.inFlight(), store.pendingCount(learner_id));
    return summary;
}

Progress SessionManager::getProgress() const {
    Progress p;
    if (!current) return p;

    p.total = current->cards.size();
    if (p.total == 0) return p;

    p.current = std::min(current->current_index + 1, p.total);
    p.percentage = std::clamp(100.0 * static_cast<double>(p.current) / static_cast<double>(p.total), 0.0, 100.0);
    return p;
}

void SessionManager::dispatch(const std::string& cardId, const PendingReview& review) {
    ReconciliationTicket ticket;
    ticket.card_id = cardId;
    ticket.learner_id = learner_id;
    ticket.sequence = review.sequence;
    ticket.request.card_id = cardId;
    ticket.request.rating = review.rating;
    ticket.request.review_time_ms = review.review_time_ms;
    channel.dispatch(ticket);
}

std::vector<ReconcileOutcome> SessionManager::pumpReconciliation() {
    return apply(channel.drainReady());
}

std::vector<ReconcileOutcome> SessionManager::flushReconciliation() {
    return apply(channel.drainAll());
}

std::vector<ReconcileOutcome> SessionManager::apply(const std::vector<ReconciliationMessage>& messages) {
    std::vector<ReconcileOutcome> outcomes;
    outcomes.reserve(messages.size());
    for (const auto& msg : messages) outcomes.push_back(applyOne(msg));
    return outcomes;
}

ReconcileOutcome SessionManager::applyOne(const ReconciliationMessage& msg) {
    const ReconciliationTicket& t = msg.ticket;

    ReconcileOutcome outcome;
    outcome.card_id = t.card_id;
    outcome.sequence = t.sequence;

    if (!msg.response.success || !msg.response.next_state) {
        outcome.error = msg.response.error.empty() ? "remote returned no state" : msg.response.error;
        bool willRetry = store.recordSyncFailure(t.card_id, t.learner_id, t.sequence, options.retry_limit);
        outcome.status = willRetry ? ReconcileStatus::FAILED_WILL_RETRY : ReconcileStatus::ABANDONED;
        spdlog::warn("Reconciliation failed for card={} seq={}: {} ({})",
            t.card_id, t.sequence, outcome.error, reconcileStatusName(outcome.status));
        return outcome;
    }

    AuthoritativeApply applied = store.applyAuthoritative(t.card_id, t.learner_id, t.sequence, *msg.response.next_state);
    if (applied == AuthoritativeApply::STALE) {
        outcome.status = ReconcileStatus::STALE;
        return outcome;
    }
    outcome.status = ReconcileStatus::CONFIRMED;

    // Only the current card's snapshot follows the store; a card the learner
    // has moved past keeps the snapshot it was rated with.
    if (current && t.learner_id == learner_id && current->current_index < current->cards.size()) {
        SessionCard& entry = current->cards[current->current_index];
        if (entry.card.id == t.card_id) {
            const StateRecord* rec = store.find(t.card_id, learner_id);
            if (rec) entry.state = rec->state;
        }
    }
    return outcome;
}

std::size_t SessionManager::syncPending() {
    std::size_t sent = 0;
    for (const auto& p : store.pendingSubmissions(learner_id)) {
        if (channel.isInFlight(p.card_id, p.learner_id, p.review.sequence)) continue;
        dispatch(p.card_id, p.review);
        sent++;
    }
    if (sent > 0) spdlog::info("syncPending: resubmitted {} review(s)", sent);
    return sent;
}
