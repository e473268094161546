#pragma once
#include <string>
#include <vector>
#include <unordered_map>
#include "Card.hpp"

// Immutable card content keyed by card id. Authoring and import live outside
// the scheduling core; this is the read side the session pulls from.
class CardStore {
public:
    // Rejects malformed cards and duplicate ids. Returns true if stored.
    bool add(const Card& card);

    const Card* find(const std::string& cardId) const;

    // Cards of one deck ordered by position, then id.
    std::vector<Card> deckCards(const std::string& deckId) const;
    std::vector<std::string> deckIds() const;

    std::vector<Card> all() const;
    std::size_t size() const { return cards_by_id.size(); }
    void clear();

private:
    std::unordered_map<std::string, Card> cards_by_id;
    std::vector<std::string> insertion_order;
};
