#include "CardStore.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

bool CardStore::add(const Card& card) {
    if (!card.isWellFormed()) {
        spdlog::warn("CardStore: rejecting malformed card '{}'", card.id);
        return false;
    }
    if (cards_by_id.count(card.id)) {
        spdlog::warn("CardStore: card '{}' already present", card.id);
        return false;
    }
    cards_by_id.emplace(card.id, card);
    insertion_order.push_back(card.id);
    spdlog::debug("CardStore: added card '{}' to deck '{}'", card.id, card.deck_id);
    return true;
}

const Card* CardStore::find(const std::string& cardId) const {
    auto it = cards_by_id.find(cardId);
    if (it == cards_by_id.end()) return nullptr;
    return &it->second;
}

std::vector<Card> CardStore::deckCards(const std::string& deckId) const {
    std::vector<Card> out;
    for (const auto& id : insertion_order) {
        const Card& c = cards_by_id.at(id);
        if (c.deck_id == deckId) out.push_back(c);
    }
    std::stable_sort(out.begin(), out.end(),
        [](const Card& a, const Card& b) {
            if (a.position != b.position) return a.position < b.position;
            return a.id < b.id;
        });
    return out;
}

std::vector<std::string> CardStore::deckIds() const {
    std::vector<std::string> decks;
    for (const auto& id : insertion_order) {
        const std::string& deck = cards_by_id.at(id).deck_id;
        if (std::find(decks.begin(), decks.end(), deck) == decks.end())
            decks.push_back(deck);
    }
    return decks;
}

std::vector<Card> CardStore::all() const {
    std::vector<Card> out;
    out.reserve(insertion_order.size());
    for (const auto& id : insertion_order) out.push_back(cards_by_id.at(id));
    return out;
}

void CardStore::clear() {
    cards_by_id.clear();
    insertion_order.clear();
}
