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
#include "stmt_amount.hpp"
#include "stmt_assembler.hpp"
#include "stmt_date.hpp"
#include "stmt_ledger.hpp"
#include "stmt_model.hpp"
#include "stmt_options.hpp"
#include "stmt_payee.hpp"
#include "stmt_result.hpp"
#include "stmt_sanitizer.hpp"
#include "stmt_segmenter.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stmt {

// ---------- Converter-Class ----------
//
// raw text -> Sanitizer -> Segmenter -> {DateNormalizer, AmountNormalizer, PayeeExtractor}
//          -> RecordAssembler -> Batch
class Converter {
public:
    using Clock = std::function<std::int64_t()>;

    explicit Converter(ParserOptions opt = {})
        : opt_(std::move(opt))
        , sanitizer_(opt_)
        , segmenter_(opt_)
        , dates_(opt_)
        , amounts_(opt_)
        , payees_(opt_)
        , clock_(unix_now)
        , ids_(generate_id)
    {
    }

    // deterministic timestamps / ids (tests, reproducible exports)
    void set_clock(Clock clock) { clock_ = std::move(clock); }
    void set_id_source(RecordAssembler::IdSource ids) { ids_ = std::move(ids); }

    std::vector<IntermediateTransaction> segment(std::string_view rawText, ConversionReport* report=nullptr) const {
        const std::string text = sanitizer_.sanitize(rawText);
        return segmenter_.segment(text, report);
    }

    // Normalizes one segment; a Failure means the transaction is dropped
    Outcome<NormalizedFields> normalize(const IntermediateTransaction& t) const {
        const std::string& dateRaw = !t.processingDate.empty() ? t.processingDate : t.transactionDateTime;
        const std::string& amountRaw = !t.accountAmount.empty() ? t.accountAmount : t.transactionAmount;

        Outcome<std::string> date = dates_.normalize(dateRaw);
        if (const Failure* f = std::get_if<Failure>(&date)) return *f;

        Outcome<SignedAmount> amount = amounts_.normalize(amountRaw);
        if (const Failure* f = std::get_if<Failure>(&amount)) return *f;

        NormalizedFields n;
        n.date        = std::get<std::string>(date);
        n.amount      = std::get<SignedAmount>(amount);
        n.payee       = payees_.extract(t.description);
        n.description = t.description;
        return n;
    }

    // Whole statement with an already resolved context
    void convert(std::string_view rawText, const ResolutionContext& ctx, Batch& out,
                 ConversionReport* report=nullptr, std::int64_t serverTimestamp=0) const {
        const std::int64_t now = clock_();
        RecordAssembler assembler(ctx, now, ids_);

        Batch b;
        b.serverTimestamp = serverTimestamp;
        b.clientTimestamp = now;

        for (const auto& t : segment(rawText, report)) {
            Outcome<NormalizedFields> n = normalize(t);
            if (const Failure* f = std::get_if<Failure>(&n)) {
                report_skip(report, *f, t.span.begin);
                continue;
            }
            b.transactions.push_back(assembler.assemble(std::get<NormalizedFields>(n)));
        }
        if (report) report->assembled += b.transactions.size();
        out = std::move(b);
    }

    // Resolves the context first; on failure nothing is assembled and `out` is left empty
    bool convert(std::string_view rawText, const LedgerSnapshot& snapshot, const ResolutionRequest& req,
                 Batch& out, ConversionReport* report=nullptr, ResolutionError* error=nullptr) const {
        out = Batch{};
        ResolutionContext ctx;
        if (!resolve_context(snapshot, req, ctx, error)) return false;
        convert(rawText, ctx, out, report, snapshot.serverTimestamp);
        return true;
    }

private:
    ParserOptions opt_;
    Sanitizer sanitizer_;
    Segmenter segmenter_;
    DateNormalizer dates_;
    AmountNormalizer amounts_;
    PayeeExtractor payees_;
    Clock clock_;
    RecordAssembler::IdSource ids_;
};

} // namespace stmt
