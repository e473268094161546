#include "ReconciliationChannel.hpp"
#include <chrono>
#include <exception>
#include <utility>
#include <spdlog/spdlog.h>

ReconciliationChannel::ReconciliationChannel(std::shared_ptr<RemoteScheduler> remoteScheduler)
    : remote(std::move(remoteScheduler))
{
    if (remote) spdlog::info("ReconciliationChannel ready");
    else spdlog::warn("ReconciliationChannel has no remote; reviews stay local until a remote is available");
}

ReconciliationChannel::~ReconciliationChannel() {
    // futures from std::async block on destruction anyway; make it explicit
    for (auto& call : in_flight) {
        if (call.result.valid()) call.result.wait();
    }
}

void ReconciliationChannel::dispatch(const ReconciliationTicket& ticket) {
    if (!remote) {
        RemoteReviewResponse offline;
        offline.success = false;
        offline.error = "offline: no remote scheduler";
        completed.push_back(ReconciliationMessage{ ticket, offline });
        return;
    }

    std::shared_ptr<RemoteScheduler> target = remote;
    RemoteReviewRequest request = ticket.request;

    InFlight call;
    call.ticket = ticket;
    call.result = std::async(std::launch::async, [target, request]() {
        try {
            return target->submitReview(request);
        }
        catch (const std::exception& e) {
            RemoteReviewResponse failed;
            failed.success = false;
            failed.error = e.what();
            return failed;
        }
    });
    in_flight.push_back(std::move(call));

    spdlog::debug("Reconciliation dispatched: card={} seq={} q={} ({} in flight)",
        ticket.card_id, ticket.sequence, ratingValue(ticket.request.rating), in_flight.size());
}

ReconciliationMessage ReconciliationChannel::collect(InFlight& call) {
    ReconciliationMessage msg;
    msg.ticket = call.ticket;
    try {
        msg.response = call.result.get();
    }
    catch (const std::exception& e) {
        // broken promise or similar; treat like any transport failure
        msg.response.success = false;
        msg.response.error = e.what();
    }
    return msg;
}

std::vector<ReconciliationMessage> ReconciliationChannel::drainReady() {
    std::vector<ReconciliationMessage> out = std::move(completed);
    completed.clear();

    auto it = in_flight.begin();
    while (it != in_flight.end()) {
        if (it->result.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            out.push_back(collect(*it));
            it = in_flight.erase(it);
        }
        else {
            ++it;
        }
    }
    return out;
}

std::vector<ReconciliationMessage> ReconciliationChannel::drainAll() {
    std::vector<ReconciliationMessage> out = std::move(completed);
    completed.clear();

    for (auto& call : in_flight) out.push_back(collect(call));
    in_flight.clear();
    return out;
}

bool ReconciliationChannel::isInFlight(const std::string& cardId, const std::string& learnerId, std::uint64_t sequence) const {
    for (const auto& call : in_flight) {
        const auto& t = call.ticket;
        if (t.card_id == cardId && t.learner_id == learnerId && t.sequence == sequence) return true;
    }
    for (const auto& msg : completed) {
        const auto& t = msg.ticket;
        if (t.card_id == cardId && t.learner_id == learnerId && t.sequence == sequence) return true;
    }
    return false;
}
