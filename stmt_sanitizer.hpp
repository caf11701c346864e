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
#include "stmt_options.hpp"
#include "stmt_text.hpp"
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace stmt {

// Strips page counters, continuation notices and balance lines.
class Sanitizer {
public:
    explicit Sanitizer(const ParserOptions& opt = {}) {
        patterns_.reserve(opt.boilerplate_patterns.size());
        for (const auto& p : opt.boilerplate_patterns)
            patterns_.emplace_back(p, std::regex::ECMAScript | std::regex::optimize);
    }

    // Idempotent: sanitize(sanitize(x)) == sanitize(x)
    std::string sanitize(std::string_view raw) const {
        std::string text = normalize_spaces(raw);

        // removing one notice can join the halves of another, so run to a fixed point
        for (;;) {
            std::string next = text;
            for (const auto& re : patterns_)
                next = std::regex_replace(next, re, "");
            if (next == text) break;
            text.swap(next);
        }
        return text;
    }

private:
    std::vector<std::regex> patterns_;
};

} // namespace stmt
