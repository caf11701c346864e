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
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace stmt {

inline std::string generate_id() {
    boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

inline std::int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Normalized fields of one transaction, ready to become a record
struct NormalizedFields {
    std::string date;                 // YYYY-MM-DD
    SignedAmount amount;              // amount.minor != 0
    std::optional<std::string> payee;
    std::string description;
};

// Builds CanonicalTransactions for one batch. The context and the timestamp are
// fixed at construction: every record of the batch shares them.
class RecordAssembler {
public:
    using IdSource = std::function<std::string()>;

    RecordAssembler(ResolutionContext ctx, std::int64_t now, IdSource ids = generate_id)
        : ctx_(std::move(ctx))
        , now_(now)
        , ids_(std::move(ids))
    {
    }

    CanonicalTransaction assemble(const NormalizedFields& f) const {
        CanonicalTransaction t;
        t.id        = ids_();
        t.createdAt = now_;
        t.changedAt = now_;
        t.userId    = ctx_.userId;
        t.deleted   = false;

        t.incomeInstrument  = ctx_.currencyId;
        t.outcomeInstrument = ctx_.currencyId;
        if (f.amount.negative) {
            t.outcomeAccount = ctx_.accountId;
            t.outcome = f.amount.minor;
            t.income  = 0;
        } else {
            t.incomeAccount = ctx_.accountId;
            t.income  = f.amount.minor;
            t.outcome = 0;
        }

        t.payee   = f.payee;
        t.comment = f.description;
        t.date    = f.date;
        return t;
    }

private:
    const ResolutionContext ctx_;
    const std::int64_t now_;
    IdSource ids_;
};

} // namespace stmt
