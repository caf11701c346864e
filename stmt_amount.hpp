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
#include "stmt_options.hpp"
#include "stmt_result.hpp"
#include "stmt_text.hpp"
#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace stmt {

// Magnitude of  intp.frac  scaled by 10^exp, rounded half to even.
// std::nullopt on overflow.
inline std::optional<std::int64_t> round_scaled(const std::string& intp, const std::string& frac, int exp) {
    if (exp < 0) exp = 0;

    // safe parser: t -> uint64
    auto parse_u64 = [](const std::string& t, std::uint64_t& out)->bool {
        out = 0;
        for (unsigned char c : t) {
            unsigned d = (unsigned)(c - '0');
            if (d > 9) return false;
            if (out > (std::numeric_limits<std::uint64_t>::max() - d) / 10ull) return false;
            out = out * 10ull + d;
        }
        return true;
    };

    // digits that stay, digits that decide the rounding
    std::string kept = frac.substr(0, std::min(frac.size(), (size_t)exp));
    if ((int)kept.size() < exp) kept.append((size_t)(exp - (int)kept.size()), '0');
    const std::string dropped = frac.size() > (size_t)exp ? frac.substr((size_t)exp) : std::string();

    std::uint64_t v = 0;
    if (!parse_u64((intp.empty() ? std::string("0") : intp) + kept, v)) return std::nullopt;

    bool up = false;
    if (!dropped.empty()) {
        const char first = dropped[0];
        const bool restNonZero = dropped.find_first_not_of('0', 1) != std::string::npos;
        if (first > '5') up = true;
        else if (first == '5') up = restNonZero || (v % 2 == 1);
    }
    if (up) {
        if (v == std::numeric_limits<std::uint64_t>::max()) return std::nullopt;
        ++v;
    }
    if (v > (std::uint64_t)std::numeric_limits<std::int64_t>::max()) return std::nullopt;
    return (std::int64_t)v;
}

// ---------- AmountNormalizer ----------
// "+1 200,50 ₽" -> positive, 120050 hundredths, 1200 whole units
class AmountNormalizer {
public:
    explicit AmountNormalizer(const ParserOptions& opt = {})
        : currencyMark_(opt.currency_mark)
        , exponent_(opt.minor_unit_exponent)
    {
    }

    Outcome<SignedAmount> normalize(std::string_view raw) const {
        auto fail = [&](const std::string& why) {
            return Failure{ SkipKind::AmountParseError, std::string(raw), why };
        };

        std::string s = strip_all_spaces(raw);

        // sign: '+', '-', en dash, em dash, minus sign; none means positive
        bool neg = false;
        static const char* const kMinus[] = { "-", "–", "—", "−" };
        if (starts_with(s, "+")) {
            s.erase(0, 1);
        } else {
            for (const char* m : kMinus) {
                if (starts_with(s, m)) {
                    neg = true;
                    s.erase(0, std::char_traits<char>::length(m));
                    break;
                }
            }
        }

        if (!currencyMark_.empty() && ends_with(s, currencyMark_))
            s.erase(s.size() - currencyMark_.size());

        // determine decimal separator: the last of ',' and '.', the other one groups
        size_t lastDot = s.find_last_of('.');
        size_t lastCom = s.find_last_of(',');
        char dec = 0;
        if (lastDot != std::string::npos || lastCom != std::string::npos) {
            if (lastDot == std::string::npos) dec = ',';
            else if (lastCom == std::string::npos) dec = '.';
            else dec = (lastDot > lastCom) ? '.' : ',';
        }

        std::string intp, frac;
        if (dec) {
            size_t pos = s.find_last_of(dec);
            intp = s.substr(0, pos);
            frac = s.substr(pos + 1);
            if (intp.find(dec) != std::string::npos) return fail("repeated decimal separator");
            const char other = (dec == '.') ? ',' : '.';
            intp.erase(std::remove(intp.begin(), intp.end(), other), intp.end());
        } else {
            intp = s;
        }

        auto only_digits = [](const std::string& t)->bool {
            for (unsigned char c : t) if (c < '0' || c > '9') return false;
            return true;
        };
        if (intp.empty() && frac.empty()) return fail("no digits");
        if (!only_digits(intp) || !only_digits(frac)) return fail("not a decimal numeral: '" + s + "'");

        std::optional<std::int64_t> hundredths = round_scaled(intp, frac, 2);
        std::optional<std::int64_t> minor = round_scaled(intp, frac, exponent_);
        if (!hundredths || !minor) return fail("amount out of range");

        if (*minor == 0) {
            return Failure{ SkipKind::ZeroAmountSkip, std::string(raw), "amount rounds to zero" };
        }
        return SignedAmount{ neg, *hundredths, *minor };
    }

    int exponent() const { return exponent_; }

private:
    std::string currencyMark_;
    int exponent_;
};

} // namespace stmt
