#include "ReviewLog.hpp"
#include <spdlog/spdlog.h>

void ReviewLog::append(const ReviewEvent& event) {
    reviews.push_back(event);
    spdlog::debug("ReviewLog: card={} learner={} q={} phase={} sched={:.4f}d ({} events)",
        event.card_id, event.learner_id, ratingValue(event.rating),
        phaseName(event.phase), event.scheduled_days, reviews.size());
}

void ReviewLog::appendSession(const SessionEvent& event) {
    session_events.push_back(event);
    spdlog::info("Session recorded: learner={} deck={} reviewed={} correct={} duration={}ms",
        event.learner_id, event.deck_id, event.reviewed, event.correct, event.durationMs());
}

std::vector<ReviewEvent> ReviewLog::forLearner(const std::string& learnerId) const {
    std::vector<ReviewEvent> out;
    for (const auto& e : reviews)
        if (e.learner_id == learnerId) out.push_back(e);
    return out;
}

std::vector<ReviewEvent> ReviewLog::forCard(const std::string& cardId, const std::string& learnerId) const {
    std::vector<ReviewEvent> out;
    for (const auto& e : reviews)
        if (e.card_id == cardId && e.learner_id == learnerId) out.push_back(e);
    return out;
}
