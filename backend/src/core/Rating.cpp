#include "Rating.hpp"

std::string ratingLabel(Rating r) {
    switch (r) {
    case Rating::AGAIN: return "Again";
    case Rating::HARD: return "Hard";
    case Rating::GOOD: return "Good";
    case Rating::EASY: return "Easy";
    }
    return "Unknown";
}

std::string phaseName(Phase p) {
    switch (p) {
    case Phase::NEW: return "new";
    case Phase::LEARNING: return "learning";
    case Phase::REVIEW: return "review";
    case Phase::RELEARNING: return "relearning";
    }
    return "new";
}

std::optional<Phase> phaseFromName(const std::string& name) {
    if (name == "new") return Phase::NEW;
    if (name == "learning") return Phase::LEARNING;
    if (name == "review") return Phase::REVIEW;
    if (name == "relearning") return Phase::RELEARNING;
    return std::nullopt;
}
