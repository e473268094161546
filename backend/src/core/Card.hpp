#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstddef>

enum class CardKind {
    SIMPLE,
    CHOICE
};

std::string cardKindName(CardKind kind);
std::optional<CardKind> cardKindFromName(const std::string& name);

// Card content is never changed by the scheduling core. The CardStore only
// hands out const references once a card is added.
class Card {
public:
    Card() = default;

    static Card simple(const std::string& deckId, const std::string& prompt,
        const std::string& answer, int position = 0);
    static Card choice(const std::string& deckId, const std::string& prompt,
        const std::vector<std::string>& options, std::size_t correctOption, int position = 0);

    std::string id;          // Auto-generated
    std::string deck_id;
    std::string prompt;
    std::string answer;
    std::optional<std::string> prompt_image;
    std::optional<std::string> answer_image;

    CardKind kind = CardKind::SIMPLE;
    std::vector<std::string> options;          // non-empty iff kind == CHOICE
    std::optional<std::size_t> correct_option; // set iff kind == CHOICE
    int position = 0;

    // options/correct_option agree with kind
    bool isWellFormed() const;

    // Utility
    static std::string generateID();
};
