/**
 * stmt parser - version 1.00
 * --------------------------------------------------------
 * Bank statement text to ledger transaction converter
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <optional>

namespace stmt {

// --- Basis ---

// Half-open byte range [begin, end) inside the sanitized statement text
struct TextSpan {
    std::size_t begin{0};
    std::size_t end{0};
};

struct CalendarDate {
    int year{0};
    int month{0};   // 1..12
    int day{0};     // 1..31
};

// Magnitudes are never negative; the direction lives in `negative`
struct SignedAmount {
    bool negative{false};
    std::int64_t hundredths{0};  // exact value in 1/100 of the currency unit
    std::int64_t minor{0};       // rounded to ParserOptions::minor_unit_exponent
};

// One candidate transaction cut out of the statement text (raw strings only)
struct IntermediateTransaction {
    std::string description;          // whitespace-collapsed
    std::string transactionDateTime;  // "27.07.2025 в 08:16"
    std::string processingDate;       // "28.07.2025"
    std::optional<std::string> cardSuffix; // "*1234"
    std::string transactionAmount;    // "–500,00 ₽" (transaction currency)
    std::string accountAmount;        // "–500,00 ₽" (account currency)
    TextSpan span;                    // description start .. last consumed field
    int importOrdinal{-1};            // running index of the anchor in the text
};

// Identifiers resolved once per batch from the ledger service
struct ResolutionContext {
    std::string accountId;
    std::int64_t currencyId{0};   // instrument id
    std::int64_t userId{0};
};

// Submission-ready record (batch upsert / deletion shape)
struct CanonicalTransaction {
    std::string id;               // UUID
    std::int64_t createdAt{0};    // unix seconds
    std::int64_t changedAt{0};    // unix seconds
    std::int64_t userId{0};
    std::optional<std::string> incomeAccount;
    std::int64_t incomeInstrument{0};
    std::int64_t income{0};       // minor units, >= 0
    std::optional<std::string> outcomeAccount;
    std::int64_t outcomeInstrument{0};
    std::int64_t outcome{0};      // minor units, >= 0
    std::optional<std::string> payee;
    std::string comment;
    std::string date;             // YYYY-MM-DD
    bool deleted{false};
};

// --- Ledger service state ---
struct LedgerAccount {
    std::string id;
    std::string title;
    std::int64_t instrument{0};
    bool deleted{false};
};

struct LedgerInstrument {
    std::int64_t id{0};
    std::string shortTitle;   // "RUB"
    std::string title;        // "Российский рубль"
};

struct LedgerUser {
    std::int64_t id{0};
};

struct LedgerSnapshot {
    std::int64_t serverTimestamp{0};
    std::vector<LedgerAccount> accounts;
    std::vector<LedgerInstrument> instruments;
    std::vector<LedgerUser> users;
    std::vector<CanonicalTransaction> transactions;
};

// Everything submitted in one request (all or nothing)
struct Batch {
    std::int64_t serverTimestamp{0};
    std::int64_t clientTimestamp{0};
    std::vector<CanonicalTransaction> transactions;
};

} // namespace stmt
