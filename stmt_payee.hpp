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
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace stmt {

struct PayeeMatch {
    std::string label;   // which pattern matched
    std::string name;
};

// Counterparty name from the description; no match is not an error.
class PayeeExtractor {
public:
    explicit PayeeExtractor(const ParserOptions& opt = {}) {
        for (const auto& p : opt.payee_patterns)
            patterns_.push_back({ p.label, std::regex(p.regex) });
    }

    std::optional<PayeeMatch> match(std::string_view description) const {
        const std::string s(description);
        std::smatch m;
        for (const auto& p : patterns_) {
            if (!std::regex_search(s, m, p.re) || m.size() < 2) continue;
            std::string name = trim(m.str(1));
            if (name.empty()) continue;
            return PayeeMatch{ p.label, std::move(name) };
        }
        return std::nullopt;
    }

    std::optional<std::string> extract(std::string_view description) const {
        if (auto m = match(description)) return m->name;
        return std::nullopt;
    }

private:
    struct Compiled {
        std::string label;
        std::regex re;
    };
    std::vector<Compiled> patterns_;
};

} // namespace stmt
