#pragma once
#include <string>
#include <vector>
#include "../core/CardStore.hpp"
#include "ReviewLog.hpp"
#include "SchedulingStateStore.hpp"

// Storage handles the per-learner encrypted snapshot file.
//
// Encrypted binary format:
//   Header: 9 bytes ASCII "CADENCE1\n" (magic + version)
//   Salt: crypto_pwhash_SALTBYTES (key = Argon2id(passphrase, salt))
//   Nonce: crypto_secretbox_NONCEBYTES
//   Ciphertext: remaining bytes
//
// The plaintext is line oriented: a "[section]" line followed by one
// tab-separated record per line (cards, states, reviews, sessions).
// Tabs, newlines and backslashes inside fields are escaped.

class Storage {
public:
    // Must run before any other call. Throws std::runtime_error if libsodium
    // cannot be initialised.
    static void init();

    static bool saveSnapshot(const CardStore& cards, const SchedulingStateStore& states,
        const ReviewLog& log, const std::string& filename, const std::string& passphrase);

    // A missing file loads as empty and returns true. Unreadable records are
    // skipped with a warning; a bad header or failed decryption returns false
    // and leaves the containers untouched. The log is appended to.
    static bool loadSnapshot(CardStore& cards, SchedulingStateStore& states,
        ReviewLog& log, const std::string& filename, const std::string& passphrase);

    // Plain body, exposed for the round trip checks.
    static std::string serializePlain(const CardStore& cards, const SchedulingStateStore& states, const ReviewLog& log);
    static bool parsePlain(const std::string& plain, CardStore& cards, SchedulingStateStore& states, ReviewLog& log);

    static std::string snapshotFileFor(const std::string& learnerId);
};
