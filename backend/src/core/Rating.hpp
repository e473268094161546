#pragma once
#include <array>
#include <cstddef>
#include <optional>
#include <string>

enum class Rating {
    AGAIN = 1,
    HARD = 2,
    GOOD = 3,
    EASY = 4
};

enum class Phase {
    NEW,
    LEARNING,
    REVIEW,
    RELEARNING
};

constexpr std::array<Rating, 4> kAllRatings = {
    Rating::AGAIN, Rating::HARD, Rating::GOOD, Rating::EASY
};

// 0..3, used to index per-rating arrays
inline std::size_t ratingIndex(Rating r) {
    return static_cast<std::size_t>(r) - 1;
}

inline int ratingValue(Rating r) {
    return static_cast<int>(r);
}

// Wire and CLI input arrive as 1..4; anything else is a caller error.
inline std::optional<Rating> ratingFromInt(int value) {
    switch (value) {
    case 1: return Rating::AGAIN;
    case 2: return Rating::HARD;
    case 3: return Rating::GOOD;
    case 4: return Rating::EASY;
    default: return std::nullopt;
    }
}

// A rating of GOOD or better counts as a correct recall.
inline bool isCorrect(Rating r) {
    return r == Rating::GOOD || r == Rating::EASY;
}

std::string ratingLabel(Rating r);

std::string phaseName(Phase p);
std::optional<Phase> phaseFromName(const std::string& name);
