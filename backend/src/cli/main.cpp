#include <iostream>
#include <vector>
#include <string>
#include <algorithm>
#include <chrono>
#include <ctime>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

#include "../utils/logging.hpp"
#include "../utils/Config.hpp"
#include "../storage/Storage.hpp"
#include "../storage/ReviewLog.hpp"
#include "../storage/SchedulingStateStore.hpp"
#include "../core/CardStore.hpp"
#include "../core/Scheduler.hpp"
#include "../core/SessionManager.hpp"
#include "../core/StatsAggregator.hpp"
#include "../sync/LocalAuthority.hpp"

static void discardLine() {
    std::cin.clear();
    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
}

// Reads an integer line; nullopt on anything else.
static std::optional<int> readInt() {
    int v;
    if (!(std::cin >> v)) {
        discardLine();
        return std::nullopt;
    }
    discardLine();
    return v;
}

static void printCardLine(const Card& c, const SchedulingStateStore& store, const std::string& learner) {
    std::cout << "[" << c.deck_id << " #" << c.position << "] " << c.prompt;
    if (c.kind == CardKind::CHOICE) std::cout << " (choice, " << c.options.size() << " options)";
    std::cout << "\n";

    const StateRecord* rec = store.find(c.id, learner);
    if (!rec) {
        std::cout << "   Not studied yet\n";
        return;
    }
    const SchedulingState& s = rec->state;
    std::cout << "   Phase: " << phaseName(s.phase)
        << " | Stability: " << fmt::format("{:.2f}", s.stability)
        << " | Difficulty: " << fmt::format("{:.2f}", s.difficulty)
        << " | Reps: " << s.reps << " | Lapses: " << s.lapses << "\n";
    std::cout << "   Interval: " << formatInterval(s.scheduled_days)
        << " | Sync: " << syncTagName(rec->tag);
    if (!rec->pending.empty()) std::cout << " (" << rec->pending.size() << " pending)";
    std::cout << "\n";
}

static void listAllCards(const CardStore& cards, const SchedulingStateStore& store, const std::string& learner) {
    std::cout << "\n===== ALL CARDS =====\n";
    if (cards.size() == 0) {
        std::cout << "No cards stored.\n";
        return;
    }
    for (const auto& deck : cards.deckIds()) {
        std::cout << "Deck: " << deck << "\n";
        for (const auto& c : cards.deckCards(deck)) printCardLine(c, store, learner);
        std::cout << "-----------------------------\n";
    }
}

static void addCard(CardStore& cards) {
    std::string deck, prompt;
    std::cout << "Deck: "; std::getline(std::cin, deck);
    if (deck.empty()) { std::cout << "Deck required.\n"; return; }
    std::cout << "Prompt: "; std::getline(std::cin, prompt);
    if (prompt.empty()) { std::cout << "Prompt required.\n"; return; }

    std::cout << "Kind (1 = simple, 2 = choice): ";
    auto kind = readInt();
    int position = static_cast<int>(cards.deckCards(deck).size());

    Card card;
    if (kind && *kind == 2) {
        std::vector<std::string> options;
        std::cout << "Enter options, one per line, empty line to finish:\n";
        std::string opt;
        while (std::getline(std::cin, opt) && !opt.empty()) options.push_back(opt);
        if (options.size() < 2) { std::cout << "Need at least two options.\n"; return; }

        std::cout << "Correct option number: ";
        auto correct = readInt();
        if (!correct || *correct < 1 || static_cast<std::size_t>(*correct) > options.size()) {
            std::cout << "Invalid option number.\n";
            return;
        }
        card = Card::choice(deck, prompt, options, static_cast<std::size_t>(*correct - 1), position);
    }
    else {
        std::string answer;
        std::cout << "Answer: "; std::getline(std::cin, answer);
        card = Card::simple(deck, prompt, answer, position);
    }

    if (cards.add(card)) std::cout << "Card added.\n";
    else std::cout << "Card rejected.\n";
}

static void printReconciliation(const std::vector<ReconcileOutcome>& outcomes) {
    for (const auto& o : outcomes) {
        if (o.status == ReconcileStatus::CONFIRMED) continue;
        std::cout << "  [sync] card " << o.card_id << ": " << reconcileStatusName(o.status);
        if (!o.error.empty()) std::cout << " (" << o.error << ")";
        std::cout << "\n";
    }
}

static void studyDeck(SessionManager& session, const CardStore& cards, const SchedulingStateStore& store,
    const StatsAggregator& stats)
{
    auto decks = cards.deckIds();
    if (decks.empty()) { std::cout << "No decks.\n"; return; }

    for (std::size_t i = 0; i < decks.size(); ++i) std::cout << i + 1 << ". " << decks[i] << "\n";
    std::cout << "Choose deck: ";
    auto sel = readInt();
    if (!sel || *sel < 1 || static_cast<std::size_t>(*sel) > decks.size()) {
        std::cout << "Invalid selection.\n";
        return;
    }
    const std::string& deck = decks[*sel - 1];

    std::time_t now = std::time(nullptr);
    DailyQuota quota = stats.quota(session.learnerId(), now);

    DueQuery query;
    query.learner_id = session.learnerId();
    query.cards = cards.deckCards(deck);
    query.now = now;
    query.limit = 0;
    query.max_new = static_cast<std::size_t>(quota.new_remaining);
    DuePage page = store.fetchDue(query);

    std::vector<Card> working;
    std::size_t reviewBudget = quota.reviews_remaining
        ? static_cast<std::size_t>(*quota.reviews_remaining) : page.cards.size();
    for (const auto& c : page.cards) {
        const StateRecord* rec = store.find(c.id, session.learnerId());
        bool isNew = !rec || rec->state.phase == Phase::NEW;
        if (!isNew) {
            if (reviewBudget == 0) continue;
            reviewBudget--;
        }
        working.push_back(c);
    }

    if (working.empty()) {
        std::cout << "Nothing due in '" << deck << "' (new left today: " << quota.new_remaining << ").\n";
        return;
    }

    session.startSession(deck, working, now);

    while (const SessionCard* entry = session.getCurrentCard()) {
        Progress p = session.getProgress();
        std::cout << "\n[" << p.current << "/" << p.total << " " << fmt::format("{:.0f}", p.percentage) << "%] "
            << entry->card.prompt << "\n";

        auto shown = std::chrono::steady_clock::now();

        if (entry->card.kind == CardKind::CHOICE) {
            for (std::size_t i = 0; i < entry->card.options.size(); ++i)
                std::cout << "  " << i + 1 << ") " << entry->card.options[i] << "\n";
            ChoiceResult cr;
            while (!cr.accepted) {
                std::cout << "Your answer: ";
                auto ans = readInt();
                if (!ans || *ans < 1) { std::cout << "Invalid input.\n"; continue; }
                cr = session.submitChoiceAnswer(static_cast<std::size_t>(*ans - 1));
                if (!cr.accepted) std::cout << cr.reason << "\n";
            }
            std::cout << (cr.correct ? "Correct!\n" : "Incorrect.\n");
            if (entry->card.correct_option)
                std::cout << "Answer: " << entry->card.options[*entry->card.correct_option] << "\n";
        }
        else {
            std::cout << "(press Enter to show the answer)";
            std::string dummy; std::getline(std::cin, dummy);
            std::cout << "Answer: " << entry->card.answer << "\n";
        }

        std::uint64_t elapsedMs = static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - shown).count());

        RateResult result;
        while (!result.applied()) {
            std::cout << "\nChoose rating:\n";
            for (Rating r : kAllRatings) {
                std::cout << " " << ratingValue(r) << " = " << ratingLabel(r)
                    << " (" << formatInterval(entry->previews[r]) << ")\n";
            }
            std::cout << "> ";
            auto q = readInt();
            if (!q) { std::cout << "Invalid input.\n"; continue; }

            result = session.rateCard(entry->card.id, *q, elapsedMs, std::time(nullptr));
            if (!result.applied()) std::cout << result.reason << "\n";
        }

        std::cout << "Next review in " << formatInterval(result.next->scheduled_days) << ".\n";
        printReconciliation(session.pumpReconciliation());
        session.nextCard();
    }

    auto summary = session.endSession(std::time(nullptr));
    if (summary) {
        std::cout << "\nSession complete: " << summary->reviewed << " reviewed, "
            << summary->correct << " correct, " << summary->duration_ms / 1000 << "s.\n";
    }
    printReconciliation(session.pumpReconciliation());
}

static void showStats(const StatsAggregator& stats, const CardStore& cards, const std::string& learner) {
    std::time_t now = std::time(nullptr);
    auto all = cards.all();
    GlobalStats g = stats.globalStats(learner, all, now);

    std::cout << "\n===== STATS =====\n"
        << "Streak: " << g.streak_current << " day(s) (longest " << g.streak_longest << ")\n"
        << "Last studied: " << g.last_study_day.value_or("never") << "\n"
        << "Today: " << g.reviewed_today << " reviewed, " << g.new_today << " new, "
        << g.study_time_today_ms / 1000 << "s\n"
        << "Accuracy: " << fmt::format("{:.1f}", g.accuracy * 100.0) << "% over " << g.total_reviews << " review(s)\n"
        << "Ratings: ";
    for (Rating r : kAllRatings) std::cout << ratingLabel(r) << "=" << g.rating_counts[ratingIndex(r)] << " ";
    std::cout << "\nDue today: " << g.due_today << ", tomorrow: " << g.due_tomorrow << "\n"
        << "Mastered: " << g.total_mastered << "/" << g.total_cards << "\n"
        << "New cards left today: " << g.quota.new_remaining << "\n"
        << "Reviews left today: "
        << (g.quota.reviews_remaining ? std::to_string(*g.quota.reviews_remaining) : "unlimited") << "\n";

    for (const auto& deck : cards.deckIds()) {
        DeckStats d = stats.deckStats(deck, cards.deckCards(deck), learner, now);
        std::cout << "  " << deck << ": " << d.total << " cards, " << d.due << " due, "
            << d.new_count << " new, " << d.learning_count + d.relearning_count << " learning, "
            << d.review_count << " review, mastery " << fmt::format("{:.0f}", d.mastery_ratio * 100.0) << "%\n";
    }
}

int main() {
    try {
        Storage::init();
    }
    catch (const std::runtime_error& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    AppConfig config;
    if (!ConfigLoader::load(ConfigLoader::DEFAULT_PATH, config)) {
        std::cerr << "Could not read " << ConfigLoader::DEFAULT_PATH << "; using defaults.\n";
    }
    Log::init(config.logging);

    std::string learner, passphrase;
    while (learner.empty()) {
        std::cout << "Learner: "; std::getline(std::cin, learner);
        if (!std::cin) return 0;
    }
    std::cout << "Passphrase: "; std::getline(std::cin, passphrase);

    CardStore cards;
    SchedulingStateStore store;
    ReviewLog log;
    const std::string dataFile = Storage::snapshotFileFor(learner);
    if (!Storage::loadSnapshot(cards, store, log, dataFile, passphrase)) {
        std::cout << "Could not open data for '" << learner << "' (wrong passphrase?).\n";
        return 1;
    }

    int tzOffset = config.timezone_offset_minutes.value_or(StatsAggregator::hostUtcOffsetMinutes(std::time(nullptr)));
    StatsAggregator stats(store, log, tzOffset, config.limits);

    Scheduler scheduler(config.scheduler);
    auto authority = std::make_shared<LocalAuthority>(config.scheduler);
    authority->replay(log, store, learner);
    authority->setOffline(config.sync.simulate_offline);

    SessionOptions options;
    options.retry_limit = config.sync.retry_limit;
    SessionManager session(learner, scheduler, store, log, authority, options);

    // MAIN LOOP
    while (true) {
        std::cout << "\n===== MAIN MENU =====\n"
            "Learner: " << learner << "\n"
            "1. Add Card\n"
            "2. Study Deck\n"
            "3. List All Cards\n"
            "4. Stats\n"
            "5. Sync Pending (" << store.pendingCount(learner) << ")\n"
            "6. Save & Exit\n> ";

        auto choice = readInt();
        if (!std::cin) break;
        if (!choice) continue;

        if (*choice == 1) {
            addCard(cards);
        }
        else if (*choice == 2) {
            studyDeck(session, cards, store, stats);
        }
        else if (*choice == 3) {
            listAllCards(cards, store, learner);
        }
        else if (*choice == 4) {
            showStats(stats, cards, learner);
        }
        else if (*choice == 5) {
            std::size_t sent = session.syncPending();
            auto outcomes = session.flushReconciliation();
            std::size_t confirmed = static_cast<std::size_t>(std::count_if(outcomes.begin(), outcomes.end(),
                [](const ReconcileOutcome& o) { return o.status == ReconcileStatus::CONFIRMED; }));
            std::cout << "Resubmitted " << sent << ", confirmed " << confirmed << ".\n";
            printReconciliation(outcomes);
        }
        else if (*choice == 6) {
            break;
        }
        else std::cout << "Invalid.\n";
    }

    printReconciliation(session.flushReconciliation());
    if (!Storage::saveSnapshot(cards, store, log, dataFile, passphrase)) {
        std::cout << "Error saving data.\n";
        return 1;
    }
    std::cout << "Goodbye!\n";
    return 0;
}
