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
#include "stmt_text.hpp"
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace stmt {

struct ExportOptions {
    char delimiter = ';';
    bool include_header = true;
    bool write_utf8_bom = false;   // Excel-compatible
    bool use_decimal_comma = false;
    int minor_unit_exponent = 0;   // how income/outcome are scaled (ParserOptions::minor_unit_exponent)
    bool include_deleted = true;   // "Deleted" column
};

inline std::string csv_escape(const std::string& s, char delimiter) {
    bool needQuotes = s.find(delimiter) != std::string::npos ||
                      s.find('"')       != std::string::npos ||
                      s.find('\n')      != std::string::npos ||
                      s.find('\r')      != std::string::npos;
    std::string out = s;
    // double quotes
    for (size_t pos = 0; (pos = out.find('"', pos)) != std::string::npos; pos += 2)
        out.insert(pos, "\"");
    if (needQuotes) {
        out.insert(out.begin(), '"');
        out.push_back('"');
    }
    return out;
}

// minor units -> "1200" / "12.00" / "12,00"
inline std::string fmt_amount(std::int64_t minor, int exp, bool use_decimal_comma=false) {
    bool neg = minor < 0; if (neg) minor = -minor;
    std::int64_t pow10 = 1; for (int i=0;i<exp;++i) pow10 *= 10;
    std::int64_t major = minor / pow10;
    std::int64_t frac  = minor % pow10;

    std::ostringstream oss;
    if (neg) oss << '-';
    oss << major;
    if (exp > 0) {
        oss << (use_decimal_comma ? ',' : '.')
            << std::setw(exp) << std::setfill('0') << frac;
    }
    return oss.str();
}

// Income positive, outcome negative
inline std::int64_t signed_minor(const CanonicalTransaction& t) {
    return t.income != 0 ? t.income : -t.outcome;
}

using TxRow = std::vector<std::pair<std::string,std::string>>;
using ExportData = std::vector<TxRow>;

enum class ExportField {
    Id,
    Date,
    Created,
    Changed,
    User,
    IncomeAccount,
    IncomeInstrument,
    Income,
    OutcomeAccount,
    OutcomeInstrument,
    Outcome,
    Payee,
    Comment,
    Deleted,
    Count // Array size
};

constexpr std::size_t to_index(ExportField f) noexcept {
    return static_cast<std::size_t>(f);
}

/*
Each exported field is a pair:
- first: display value as written to the CSV
- second: canonical value for sorting and comparison
*/
inline std::string normalize_field(ExportField f, const std::string& v) {
    switch (f) {
    // Free text: NFC + casefold, whitespace removed
    case ExportField::Payee:
    case ExportField::Comment:
        return normalize_freetext(v);

    // "2025-07-27" -> "20250727"
    case ExportField::Date: {
        std::string s;
        for (char c : v) if (c != '-') s.push_back(c);
        return s;
    }

    default:
        return trim(v);
    }
}

// === Actual export function ===========================================
inline void export_transactions_csv(const Batch& batch, std::ostream* osPtr=nullptr, ExportData* vPtr=nullptr, const ExportOptions& opt = {}) {

    if (osPtr && opt.write_utf8_bom) {
        const unsigned char bom[3] = {0xEF,0xBB,0xBF};
        osPtr->write(reinterpret_cast<const char*>(bom), 3);
    }
    const char D = opt.delimiter;
    const std::size_t columns = opt.include_deleted ? to_index(ExportField::Count) : to_index(ExportField::Deleted);

    auto write_row = [&](const TxRow& row) {
        if (!osPtr) return;
        std::ostream& os = *osPtr;
        for (size_t i = 0; i < columns && i < row.size(); ++i) {
            os << csv_escape(row[i].first, D);
            os << (i + 1 < columns ? D : '\n');
        }
    };

    if (opt.include_header) {
        TxRow header = {
            { "Id",                "" },
            { "Date",              "" },
            { "Created",           "" },
            { "Changed",           "" },
            { "User",              "" },
            { "IncomeAccount",     "" },
            { "IncomeInstrument",  "" },
            { "Income",            "" },
            { "OutcomeAccount",    "" },
            { "OutcomeInstrument", "" },
            { "Outcome",           "" },
            { "Payee",             "" },
            { "Comment",           "" },
            { "Deleted",           "" }
        };
        write_row(header);
        if (vPtr) {
            vPtr->push_back(header);
        }
    }

    for (const auto& t : batch.transactions) {
        const std::string income  = fmt_amount(t.income,  opt.minor_unit_exponent, opt.use_decimal_comma);
        const std::string outcome = fmt_amount(t.outcome, opt.minor_unit_exponent, opt.use_decimal_comma);
        const std::string deleted = t.deleted ? "1" : "0";

        TxRow row = {
            { t.id, "" },
            { t.date, "" },
            { std::to_string(t.createdAt), std::to_string(t.createdAt) },
            { std::to_string(t.changedAt), std::to_string(t.changedAt) },
            { std::to_string(t.userId), std::to_string(t.userId) },
            { t.incomeAccount.value_or(std::string()), "" },
            { std::to_string(t.incomeInstrument), std::to_string(t.incomeInstrument) },
            { income, std::to_string(t.income) },
            { t.outcomeAccount.value_or(std::string()), "" },
            { std::to_string(t.outcomeInstrument), std::to_string(t.outcomeInstrument) },
            { outcome, std::to_string(t.outcome) },
            { t.payee.value_or(std::string()), "" },
            { t.comment, "" },
            { deleted, deleted }
        };

        write_row(row);
        if (vPtr) {
            for (size_t i = 0; i < row.size(); ++i) {
                if (row[i].second.empty())
                    row[i].second = normalize_field(static_cast<ExportField>(i), row[i].first);
            }
            vPtr->push_back(row);
        }
    }
}

// Dry-run lines: "1. 2025-07-28 | Оплата товаров и услуг YANDEX_GO | -500"
inline std::vector<std::string> preview_lines(const Batch& batch, std::size_t limit, int exp, std::size_t commentWidth = 50) {
    std::vector<std::string> out;
    std::size_t n = 0;
    for (const auto& t : batch.transactions) {
        if (n == limit) break;
        ++n;

        // cut the comment on a code point boundary
        std::string comment;
        std::size_t cps = 0;
        for_each_codepoint(t.comment, [&](utf8proc_int32_t cp) {
            if (cps++ < commentWidth) append_codepoint(comment, cp);
        });

        const std::int64_t v = signed_minor(t);
        std::string line = std::to_string(n) + ". " + t.date + " | " + comment + " | " +
                           (v >= 0 ? "+" : "") + fmt_amount(v, exp);
        out.push_back(std::move(line));
    }
    if (batch.transactions.size() > limit) {
        out.push_back("... " + std::to_string(batch.transactions.size() - limit) + " more");
    }
    return out;
}

} // namespace stmt
