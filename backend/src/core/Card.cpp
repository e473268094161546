#include "Card.hpp"
#include <chrono>
#include <random>
#include <cstdint>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

std::string cardKindName(CardKind kind) {
    switch (kind) {
    case CardKind::SIMPLE: return "simple";
    case CardKind::CHOICE: return "choice";
    }
    return "simple";
}

std::optional<CardKind> cardKindFromName(const std::string& name) {
    if (name == "simple") return CardKind::SIMPLE;
    if (name == "choice") return CardKind::CHOICE;
    return std::nullopt;
}

Card Card::simple(const std::string& deckId, const std::string& prompt,
    const std::string& answer, int position)
{
    Card c;
    c.id = generateID();
    c.deck_id = deckId;
    c.prompt = prompt;
    c.answer = answer;
    c.kind = CardKind::SIMPLE;
    c.position = position;
    spdlog::debug("Created simple card: ID={}, deck={}", c.id, deckId);
    return c;
}

Card Card::choice(const std::string& deckId, const std::string& prompt,
    const std::vector<std::string>& options, std::size_t correctOption, int position)
{
    Card c;
    c.id = generateID();
    c.deck_id = deckId;
    c.prompt = prompt;
    c.kind = CardKind::CHOICE;
    c.options = options;
    c.position = position;
    if (correctOption < options.size()) {
        c.correct_option = correctOption;
        c.answer = options[correctOption];
    }
    else {
        spdlog::warn("Choice card {} created with out-of-range answer index {}", c.id, correctOption);
    }
    spdlog::debug("Created choice card: ID={}, deck={}, options={}", c.id, deckId, options.size());
    return c;
}

bool Card::isWellFormed() const {
    if (id.empty() || deck_id.empty()) return false;
    if (kind == CardKind::SIMPLE) {
        return options.empty() && !correct_option;
    }
    return !options.empty() && correct_option && *correct_option < options.size();
}

// "c<creation ms>-<64 random bits>", both in hex, so ids sort by creation time.
std::string Card::generateID() {
    static thread_local std::mt19937_64 eng{ std::random_device{}() };
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return fmt::format("c{:011x}-{:016x}", static_cast<std::uint64_t>(millis), eng());
}
