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
#include <cstdio>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace stmt {

// ---------- Calendar helpers ----------
inline bool is_leap_year(int y) {
    return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
}

inline int days_in_month(int y, int m) {
    static const int kDays[12] = {31,28,31,30,31,30,31,31,30,31,30,31};
    if (m < 1 || m > 12) return 0;
    return (m == 2 && is_leap_year(y)) ? 29 : kDays[m - 1];
}

inline std::optional<CalendarDate> make_date(int y, int m, int d) {
    if (y < 1 || y > 9999) return std::nullopt;
    if (m < 1 || m > 12) return std::nullopt;
    if (d < 1 || d > days_in_month(y, m)) return std::nullopt;
    return CalendarDate{ y, m, d };
}

// "2025-07-27"
inline std::string to_iso(const CalendarDate& d) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", d.year, d.month, d.day);
    return buf;
}

// "27.07.2025"
inline std::string to_dmy(const CalendarDate& d) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d.%02d.%04d", d.day, d.month, d.year);
    return buf;
}

// Exact match of `s` against a strptime-like template.
// %d %m %H %M: one or two digits; %Y: four digits; ' ' matches one or more blanks;
// any other character must match literally. The whole input must be consumed.
inline Outcome<CalendarDate> match_template(std::string_view s, std::string_view tmpl) {
    auto fail = [&](const char* why) {
        return Failure{ SkipKind::DateParseError, std::string(s),
                        std::string("template '") + std::string(tmpl) + "': " + why };
    };
    auto is_digit = [](char c) { return c >= '0' && c <= '9'; };

    int y = -1, mo = -1, d = -1, hh = 0, mi = 0;
    size_t i = 0;
    for (size_t t = 0; t < tmpl.size(); ++t) {
        const char tc = tmpl[t];
        if (tc == '%' && t + 1 < tmpl.size()) {
            const char directive = tmpl[++t];
            const size_t maxDigits = (directive == 'Y') ? 4 : 2;
            const size_t minDigits = (directive == 'Y') ? 4 : 1;
            size_t n = 0;
            int v = 0;
            while (i < s.size() && n < maxDigits && is_digit(s[i])) {
                v = v * 10 + (s[i] - '0');
                ++i;
                ++n;
            }
            if (n < minDigits) return fail("missing number");
            switch (directive) {
            case 'd': d  = v; break;
            case 'm': mo = v; break;
            case 'Y': y  = v; break;
            case 'H': hh = v; break;
            case 'M': mi = v; break;
            default:  return fail("unknown directive");
            }
        } else if (tc == ' ') {
            size_t n = 0;
            while (i < s.size() && s[i] == ' ') { ++i; ++n; }
            if (n == 0) return fail("blank expected");
        } else {
            if (i >= s.size() || s[i] != tc) return fail("literal mismatch");
            ++i;
        }
    }
    if (i != s.size()) return fail("unconverted data remains");
    if (hh > 23 || mi > 59) return fail("time out of range");
    if (y < 0 || mo < 0 || d < 0) return fail("incomplete date");

    if (auto cd = make_date(y, mo, d)) return *cd;
    return fail("not a calendar date");
}

// ---------- DateNormalizer ----------
// Day-month-year bias with a numeral fallback. Best effort for foreign-order
// dates: "03.04.2025" is always the 3rd of April.
class DateNormalizer {
public:
    explicit DateNormalizer(const ParserOptions& opt = {})
        : templates_(opt.date_templates)
        , timeSeparator_(" " + opt.time_connector + " ")
        , numerals_("(\\d{1,2})[./](\\d{1,2})[./](\\d{4})")
    {
    }

    // "27.07.2025 в 08:16" -> "2025-07-27"
    Outcome<std::string> normalize(std::string_view raw) const {
        Outcome<CalendarDate> r = parse(raw);
        if (const CalendarDate* d = std::get_if<CalendarDate>(&r)) return to_iso(*d);
        return std::get<Failure>(r);
    }

    Outcome<CalendarDate> parse(std::string_view raw) const {
        const std::string cleaned = trim(raw);
        const std::string datePart = strip_time(cleaned);

        for (const auto& tmpl : templates_) {
            Outcome<CalendarDate> r = match_template(datePart, tmpl);
            if (succeeded(r)) return r;
        }

        Outcome<CalendarDate> r = disambiguate(cleaned);
        if (succeeded(r)) return r;

        Failure f = std::get<Failure>(r);
        f.raw = std::string(raw);
        return f;
    }

    // Drops everything from the time connector on
    std::string strip_time(const std::string& s) const {
        const size_t pos = s.find(timeSeparator_);
        return pos == std::string::npos ? s : trim(s.substr(0, pos));
    }

    // Three digit groups (a, b, c) separated by '.' or '/'
    Outcome<CalendarDate> disambiguate(const std::string& s) const {
        std::smatch m;
        if (!std::regex_search(s, m, numerals_)) {
            return Failure{ SkipKind::DateParseError, s, "no day/month/year numerals" };
        }
        const int a = std::stoi(m.str(1));
        const int b = std::stoi(m.str(2));
        const int c = std::stoi(m.str(3));

        struct Reading { int day; int month; const char* name; };
        std::vector<Reading> candidates;
        if (a > 12) {
            candidates.push_back({ a, b, "day.month.year" });
        } else if (b > 12) {
            candidates.push_back({ b, a, "month.day.year" });
        } else {
            candidates.push_back({ a, b, "day.month.year" });
            candidates.push_back({ b, a, "month.day.year" });
        }

        std::string tried;
        for (const auto& r : candidates) {
            if (auto d = make_date(c, r.month, r.day)) return *d;
            if (!tried.empty()) tried += ", ";
            tried += r.name;
        }
        return Failure{ SkipKind::DateParseError, s, "no valid calendar date as " + tried };
    }

private:
    std::vector<std::string> templates_;
    std::string timeSeparator_;
    std::regex numerals_;
};

} // namespace stmt
