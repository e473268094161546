#pragma once
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <vector>
#include "RemoteScheduler.hpp"

// Identifies which local review a remote answer belongs to.
struct ReconciliationTicket {
    std::string card_id;
    std::string learner_id;
    std::uint64_t sequence = 0;
    RemoteReviewRequest request;
};

// A completed remote call, posted back to the owner's thread.
struct ReconciliationMessage {
    ReconciliationTicket ticket;
    RemoteReviewResponse response;
};

/*
  Runs one asynchronous remote call per dispatched ticket. The worker only
  produces a response; nothing is applied until the owner drains the
  channel, so all state mutation stays on the owner's thread.

  A null remote means offline: every dispatch completes immediately as a
  failure.
*/
class ReconciliationChannel {
public:
    explicit ReconciliationChannel(std::shared_ptr<RemoteScheduler> remote);
    ~ReconciliationChannel();

    ReconciliationChannel(const ReconciliationChannel&) = delete;
    ReconciliationChannel& operator=(const ReconciliationChannel&) = delete;

    void dispatch(const ReconciliationTicket& ticket);

    // Completed calls only; never blocks.
    std::vector<ReconciliationMessage> drainReady();
    // Waits for every in-flight call.
    std::vector<ReconciliationMessage> drainAll();

    bool isInFlight(const std::string& cardId, const std::string& learnerId, std::uint64_t sequence) const;
    std::size_t inFlight() const { return in_flight.size() + completed.size(); }

private:
    struct InFlight {
        ReconciliationTicket ticket;
        std::future<RemoteReviewResponse> result;
    };

    std::shared_ptr<RemoteScheduler> remote;
    std::vector<InFlight> in_flight;
    std::vector<ReconciliationMessage> completed; // resolved without a worker

    static ReconciliationMessage collect(InFlight& call);
};
