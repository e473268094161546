#include "Storage.hpp"
#include <fstream>
#include <sstream>
#include <cstring>
#include <stdexcept>
#include <sodium.h>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

static const char MAGIC_HDR[] = "CADENCE1\n";

/* ---- Field encoding ---- */

static std::string escapeField(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
        case '\\': out += "\\\\"; break;
        case '\t': out += "\\t"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        default: out += c;
        }
    }
    return out;
}

static std::string unescapeField(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\' || i + 1 == s.size()) {
            out += s[i];
            continue;
        }
        char n = s[++i];
        if (n == 't') out += '\t';
        else if (n == 'n') out += '\n';
        else if (n == 'r') out += '\r';
        else out += n;
    }
    return out;
}

static std::vector<std::string> splitFields(const std::string& line) {
    std::vector<std::string> fields;
    std::string cur;
    for (char c : line) {
        if (c == '\t') {
            fields.push_back(unescapeField(cur));
            cur.clear();
        }
        else {
            cur += c;
        }
    }
    fields.push_back(unescapeField(cur));
    return fields;
}

static std::string joinFields(const std::vector<std::string>& fields) {
    std::string line;
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i) line += '\t';
        line += escapeField(fields[i]);
    }
    return line;
}

// "-" marks an absent optional value
static std::string optionalField(const std::optional<std::string>& v) {
    return v ? "+" + *v : "-";
}

static std::optional<std::string> readOptional(const std::string& f) {
    if (f.empty() || f == "-") return std::nullopt;
    return f.substr(1);
}

// Field readers throw std::invalid_argument / std::out_of_range on bad input;
// the record parser catches them and skips the record.
static double toDouble(const std::string& f) { return std::stod(f); }
static long long toInt(const std::string& f) { return std::stoll(f); }
static unsigned long long toUnsigned(const std::string& f) {
    if (!f.empty() && f[0] == '-') throw std::invalid_argument("negative value");
    return std::stoull(f);
}

static Rating toRating(const std::string& f) {
    auto r = ratingFromInt(static_cast<int>(toInt(f)));
    if (!r) throw std::invalid_argument("rating out of range");
    return *r;
}

static Phase toPhase(const std::string& f) {
    auto p = phaseFromName(f);
    if (!p) throw std::invalid_argument("unknown phase '" + f + "'");
    return *p;
}

/* ---- Records ---- */

static std::string cardLine(const Card& c) {
    std::vector<std::string> f = {
        c.id, c.deck_id, c.prompt, c.answer,
        optionalField(c.prompt_image), optionalField(c.answer_image),
        cardKindName(c.kind), std::to_string(c.position),
        c.correct_option ? std::to_string(*c.correct_option) : "-",
        std::to_string(c.options.size())
    };
    f.insert(f.end(), c.options.begin(), c.options.end());
    return joinFields(f);
}

static Card parseCard(const std::vector<std::string>& f) {
    if (f.size() < 10) throw std::invalid_argument("short card record");

    Card c;
    c.id = f[0];
    c.deck_id = f[1];
    c.prompt = f[2];
    c.answer = f[3];
    c.prompt_image = readOptional(f[4]);
    c.answer_image = readOptional(f[5]);

    auto kind = cardKindFromName(f[6]);
    if (!kind) throw std::invalid_argument("unknown card kind '" + f[6] + "'");
    c.kind = *kind;
    c.position = static_cast<int>(toInt(f[7]));
    if (f[8] != "-") c.correct_option = static_cast<std::size_t>(toUnsigned(f[8]));

    std::size_t count = static_cast<std::size_t>(toUnsigned(f[9]));
    if (f.size() != 10 + count) throw std::invalid_argument("option count mismatch");
    c.options.assign(f.begin() + 10, f.end());
    return c;
}

static std::string stateLine(const StateRecord& r) {
    const SchedulingState& s = r.state;
    std::vector<std::string> f = {
        r.card_id, r.learner_id,
        fmt::format("{}", s.stability), fmt::format("{}", s.difficulty),
        fmt::format("{}", s.elapsed_days), fmt::format("{}", s.scheduled_days),
        std::to_string(s.reps), std::to_string(s.lapses),
        phaseName(s.phase), std::to_string(s.learning_step),
        std::to_string(static_cast<long long>(s.due)),
        s.last_review ? std::to_string(static_cast<long long>(*s.last_review)) : "-",
        syncTagName(r.tag),
        std::to_string(r.last_sequence), std::to_string(r.confirmed_sequence),
        std::to_string(r.pending.size())
    };
    for (const auto& p : r.pending) {
        f.push_back(std::to_string(p.sequence));
        f.push_back(std::to_string(ratingValue(p.rating)));
        f.push_back(std::to_string(p.review_time_ms));
        f.push_back(std::to_string(static_cast<long long>(p.reviewed_at)));
        f.push_back(std::to_string(p.attempts));
    }
    return joinFields(f);
}

static StateRecord parseState(const std::vector<std::string>& f) {
    if (f.size() < 16) throw std::invalid_argument("short state record");

    StateRecord r;
    r.card_id = f[0];
    r.learner_id = f[1];

    SchedulingState& s = r.state;
    s.stability = toDouble(f[2]);
    s.difficulty = toDouble(f[3]);
    s.elapsed_days = toDouble(f[4]);
    s.scheduled_days = toDouble(f[5]);
    s.reps = static_cast<int>(toInt(f[6]));
    s.lapses = static_cast<int>(toInt(f[7]));
    s.phase = toPhase(f[8]);
    s.learning_step = static_cast<std::size_t>(toUnsigned(f[9]));
    s.due = static_cast<std::time_t>(toInt(f[10]));
    if (f[11] != "-") s.last_review = static_cast<std::time_t>(toInt(f[11]));

    auto tag = syncTagFromName(f[12]);
    if (!tag) throw std::invalid_argument("unknown sync tag '" + f[12] + "'");
    r.tag = *tag;
    r.last_sequence = toUnsigned(f[13]);
    r.confirmed_sequence = toUnsigned(f[14]);

    std::size_t count = static_cast<std::size_t>(toUnsigned(f[15]));
    if (f.size() != 16 + count * 5) throw std::invalid_argument("pending count mismatch");
    for (std::size_t i = 0; i < count; ++i) {
        std::size_t base = 16 + i * 5;
        PendingReview p;
        p.sequence = toUnsigned(f[base]);
        p.rating = toRating(f[base + 1]);
        p.review_time_ms = toUnsigned(f[base + 2]);
        p.reviewed_at = static_cast<std::time_t>(toInt(f[base + 3]));
        p.attempts = static_cast<int>(toInt(f[base + 4]));
        r.pending.push_back(p);
    }
    return r;
}

static std::string reviewLine(const ReviewEvent& e) {
    return joinFields({
        e.card_id, e.learner_id, e.deck_id,
        std::to_string(ratingValue(e.rating)), phaseName(e.phase),
        fmt::format("{}", e.elapsed_days), fmt::format("{}", e.scheduled_days),
        std::to_string(e.review_time_ms),
        std::to_string(static_cast<long long>(e.reviewed_at))
    });
}

static ReviewEvent parseReview(const std::vector<std::string>& f) {
    if (f.size() != 9) throw std::invalid_argument("bad review record");

    ReviewEvent e;
    e.card_id = f[0];
    e.learner_id = f[1];
    e.deck_id = f[2];
    e.rating = toRating(f[3]);
    e.phase = toPhase(f[4]);
    e.elapsed_days = toDouble(f[5]);
    e.scheduled_days = toDouble(f[6]);
    e.review_time_ms = toUnsigned(f[7]);
    e.reviewed_at = static_cast<std::time_t>(toInt(f[8]));
    return e;
}

static std::string sessionLine(const SessionEvent& e) {
    return joinFields({
        e.learner_id, e.deck_id,
        std::to_string(static_cast<long long>(e.started_at)),
        std::to_string(static_cast<long long>(e.ended_at)),
        std::to_string(e.reviewed), std::to_string(e.correct)
    });
}

static SessionEvent parseSession(const std::vector<std::string>& f) {
    if (f.size() != 6) throw std::invalid_argument("bad session record");

    SessionEvent e;
    e.learner_id = f[0];
    e.deck_id = f[1];
    e.started_at = static_cast<std::time_t>(toInt(f[2]));
    e.ended_at = static_cast<std::time_t>(toInt(f[3]));
    e.reviewed = static_cast<int>(toInt(f[4]));
    e.correct = static_cast<int>(toInt(f[5]));
    return e;
}

/* ---- Plain body ---- */

std::string Storage::serializePlain(const CardStore& cards, const SchedulingStateStore& states, const ReviewLog& log) {
    std::ostringstream oss;

    oss << "[cards]\n";
    for (const auto& c : cards.all()) oss << cardLine(c) << "\n";

    oss << "[states]\n";
    for (const auto& kv : states.all()) oss << stateLine(kv.second) << "\n";

    oss << "[reviews]\n";
    for (const auto& e : log.events()) oss << reviewLine(e) << "\n";

    oss << "[sessions]\n";
    for (const auto& e : log.sessions()) oss << sessionLine(e) << "\n";

    return oss.str();
}

bool Storage::parsePlain(const std::string& plain, CardStore& cards, SchedulingStateStore& states, ReviewLog& log) {
    std::istringstream iss(plain);

    CardStore parsedCards;
    SchedulingStateStore parsedStates;
    std::vector<ReviewEvent> parsedReviews;
    std::vector<SessionEvent> parsedSessions;

    std::string section;
    std::string line;
    std::size_t lineNo = 0;
    std::size_t skipped = 0;
    bool sawHeader = false;

    while (std::getline(iss, line)) {
        ++lineNo;
        if (line.empty()) continue;
        if (line.front() == '[' && line.back() == ']') {
            section = line.substr(1, line.size() - 2);
            sawHeader = true;
            continue;
        }

        try {
            auto f = splitFields(line);
            if (section == "cards") {
                if (!parsedCards.add(parseCard(f))) skipped++;
            }
            else if (section == "states") parsedStates.upsert(parseState(f));
            else if (section == "reviews") parsedReviews.push_back(parseReview(f));
            else if (section == "sessions") parsedSessions.push_back(parseSession(f));
            else {
                spdlog::warn("Snapshot line {}: record outside a known section", lineNo);
                skipped++;
            }
        }
        catch (const std::exception& e) {
            spdlog::warn("Snapshot line {} ({}) skipped: {}", lineNo, section, e.what());
            skipped++;
        }
    }

    if (!sawHeader && lineNo > 0) {
        spdlog::error("Snapshot body has no sections");
        return false;
    }

    cards = parsedCards;
    states = parsedStates;
    for (const auto& e : parsedReviews) log.append(e);
    for (const auto& e : parsedSessions) log.appendSession(e);

    if (skipped > 0) spdlog::warn("Snapshot: {} record(s) skipped", skipped);
    return true;
}

/* ---- Encrypted file ---- */

void Storage::init() {
    if (sodium_init() < 0) {
        spdlog::error("libsodium initialisation failed");
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

std::string Storage::snapshotFileFor(const std::string& learnerId) {
    return "data_" + learnerId + ".dat";
}

static bool deriveKey(const std::string& passphrase, const unsigned char* salt, std::vector<unsigned char>& key) {
    key.assign(crypto_secretbox_KEYBYTES, 0);
    if (crypto_pwhash(key.data(), key.size(),
        passphrase.c_str(), passphrase.size(),
        salt,
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE,
        crypto_pwhash_ALG_DEFAULT) != 0)
    {
        spdlog::error("crypto_pwhash failed during snapshot key derivation");
        key.clear();
        return false;
    }
    return true;
}

bool Storage::saveSnapshot(const CardStore& cards, const SchedulingStateStore& states,
    const ReviewLog& log, const std::string& filename, const std::string& passphrase)
{
    spdlog::info("Saving snapshot to '{}' ({} cards, {} states, {} reviews)",
        filename, cards.size(), states.size(), log.size());

    unsigned char salt[crypto_pwhash_SALTBYTES];
    randombytes_buf(salt, sizeof(salt));

    std::vector<unsigned char> key;
    if (!deriveKey(passphrase, salt, key)) return false;

    std::string plain = serializePlain(cards, states, log);
    const unsigned char* p = reinterpret_cast<const unsigned char*>(plain.data());
    unsigned long long plen = plain.size();

    std::vector<unsigned char> ciphertext(plen + crypto_secretbox_MACBYTES);

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    randombytes_buf(nonce, sizeof(nonce));

    int rc = crypto_secretbox_easy(ciphertext.data(), p, plen, nonce, key.data());
    sodium_memzero(key.data(), key.size());
    if (rc != 0) {
        spdlog::error("Encryption failed");
        return false;
    }

    std::ofstream out(filename, std::ios::binary | std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to open '{}' for encrypted write", filename);
        return false;
    }

    out.write(MAGIC_HDR, sizeof(MAGIC_HDR) - 1);
    out.write(reinterpret_cast<const char*>(salt), sizeof(salt));
    out.write(reinterpret_cast<const char*>(nonce), sizeof(nonce));
    out.write(reinterpret_cast<const char*>(ciphertext.data()), ciphertext.size());
    if (!out) {
        spdlog::error("Write to '{}' failed", filename);
        return false;
    }
    return true;
}

bool Storage::loadSnapshot(CardStore& cards, SchedulingStateStore& states,
    ReviewLog& log, const std::string& filename, const std::string& passphrase)
{
    spdlog::info("Loading snapshot from '{}'", filename);

    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        spdlog::warn("Snapshot '{}' not found; treating as empty", filename);
        return true;
    }

    char hdr[sizeof(MAGIC_HDR) - 1];
    in.read(hdr, sizeof(hdr));
    if (in.gcount() != sizeof(hdr) || std::strncmp(hdr, MAGIC_HDR, sizeof(hdr)) != 0) {
        spdlog::error("Invalid magic header");
        return false;
    }

    unsigned char salt[crypto_pwhash_SALTBYTES];
    in.read(reinterpret_cast<char*>(salt), sizeof(salt));
    if (in.gcount() != sizeof(salt)) {
        spdlog::error("Failed to read salt");
        return false;
    }

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    in.read(reinterpret_cast<char*>(nonce), sizeof(nonce));
    if (in.gcount() != sizeof(nonce)) {
        spdlog::error("Failed to read nonce");
        return false;
    }

    std::vector<unsigned char> ciphertext(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>());

    if (ciphertext.size() < crypto_secretbox_MACBYTES) {
        spdlog::error("Ciphertext too short");
        return false;
    }

    std::vector<unsigned char> key;
    if (!deriveKey(passphrase, salt, key)) return false;

    std::vector<unsigned char> plain(ciphertext.size() - crypto_secretbox_MACBYTES);
    int rc = crypto_secretbox_open_easy(plain.data(), ciphertext.data(), ciphertext.size(), nonce, key.data());
    sodium_memzero(key.data(), key.size());
    if (rc != 0) {
        spdlog::error("Decryption failed (wrong passphrase or corrupt file)");
        return false;
    }

    std::string plain_str(reinterpret_cast<char*>(plain.data()), plain.size());
    if (!parsePlain(plain_str, cards, states, log)) return false;

    spdlog::info("Loaded {} cards, {} states, {} reviews", cards.size(), states.size(), log.size());
    return true;
}
