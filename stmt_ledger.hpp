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
#include "stmt_model.hpp"
#include "stmt_result.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stmt {

struct ResolutionRequest {
    std::string account_title;                      // matched exactly
    std::string currency_short_title = "RUB";
    std::string currency_title = "Российский рубль";
};

// user id the ledger assumes when the snapshot names no user
constexpr std::int64_t kDefaultUserId = 1;

inline const LedgerAccount* find_account(const LedgerSnapshot& s, const std::string& title) {
    for (const auto& a : s.accounts)
        if (a.title == title) return &a;
    return nullptr;
}

inline const LedgerInstrument* find_instrument(const LedgerSnapshot& s, const std::string& shortTitle, const std::string& title) {
    for (const auto& i : s.instruments)
        if (i.shortTitle == shortTitle || i.title == title) return &i;
    return nullptr;
}

// Resolves account, currency and user once for a whole batch
inline bool resolve_context(const LedgerSnapshot& s, const ResolutionRequest& req,
                            ResolutionContext& out, ResolutionError* error = nullptr) {
    const LedgerAccount* acct = find_account(s, req.account_title);
    if (!acct) {
        if (error) *error = ResolutionError{ ResolutionErrorKind::AccountNotFound,
                                             "No account titled '" + req.account_title + "'" };
        return false;
    }
    const LedgerInstrument* inst = find_instrument(s, req.currency_short_title, req.currency_title);
    if (!inst) {
        if (error) *error = ResolutionError{ ResolutionErrorKind::CurrencyNotFound,
                                             "No instrument '" + req.currency_short_title + "' / '" + req.currency_title + "'" };
        return false;
    }
    out.accountId  = acct->id;
    out.currencyId = inst->id;
    out.userId     = s.users.empty() ? kDefaultUserId : s.users.front().id;
    return true;
}

// ---------- Deletion ----------
struct DeletionFilter {
    std::optional<std::string> account_title;
    std::optional<std::string> start_date;   // YYYY-MM-DD, inclusive
    std::optional<std::string> end_date;     // YYYY-MM-DD, inclusive
};

// Tombstones (deleted = true) for every live transaction the filter selects.
// ISO dates compare correctly as strings.
inline bool plan_deletion(const LedgerSnapshot& s, const DeletionFilter& filter, std::int64_t now,
                          Batch& out, ResolutionError* error = nullptr) {
    std::optional<std::string> accountId;
    if (filter.account_title) {
        const LedgerAccount* acct = find_account(s, *filter.account_title);
        if (!acct) {
            if (error) *error = ResolutionError{ ResolutionErrorKind::AccountNotFound,
                                                 "No account titled '" + *filter.account_title + "'" };
            return false;
        }
        accountId = acct->id;
    }
    const std::int64_t userId = s.users.empty() ? kDefaultUserId : s.users.front().id;

    Batch b;
    b.serverTimestamp = s.serverTimestamp;
    b.clientTimestamp = now;
    for (const auto& t : s.transactions) {
        if (t.deleted) continue;
        if (accountId) {
            const std::optional<std::string>& acct = t.incomeAccount ? t.incomeAccount : t.outcomeAccount;
            if (acct != accountId) continue;
        }
        if (filter.start_date && t.date < *filter.start_date) continue;
        if (filter.end_date && t.date > *filter.end_date) continue;

        CanonicalTransaction d = t;
        d.changedAt = now;
        if (d.createdAt == 0) d.createdAt = now;
        d.userId = userId;
        d.deleted = true;
        b.transactions.push_back(std::move(d));
    }
    out = std::move(b);
    return true;
}

// ---------- Account listing ----------
struct AccountRow {
    std::string title;
    std::string id;
    std::string currency;   // instrument short title, "?" if unknown
};

inline std::vector<AccountRow> list_accounts(const LedgerSnapshot& s) {
    std::vector<AccountRow> rows;
    for (const auto& a : s.accounts) {
        if (a.deleted) continue;
        AccountRow r{ a.title, a.id, "?" };
        for (const auto& i : s.instruments) {
            if (i.id == a.instrument) { r.currency = i.shortTitle.empty() ? "?" : i.shortTitle; break; }
        }
        rows.push_back(std::move(r));
    }
    return rows;
}

} // namespace stmt
