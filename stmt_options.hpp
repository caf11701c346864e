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
#include <cstddef>
#include <string>
#include <vector>

namespace stmt {

struct PayeePattern {
    std::string label;
    std::string regex;    // exactly one capture group: the counterparty name
};

// Layout description of the supported statement (Russian, rouble account).
// Patterns are ECMAScript regular expressions over UTF-8 bytes.
struct ParserOptions {
    // "27.07.2025 в 08:16"
    std::string time_connector = "в";
    std::string currency_mark  = "₽";

    // removed before segmentation
    std::vector<std::string> boilerplate_patterns = {
        "Страница\\s+\\d+\\s+из\\s+\\d+",
        "Продолжение\\s+на\\s+следующей\\s+странице",
        "Входящий остаток.*?₽",
        "Исходящий остаток.*?₽"
    };

    // a description containing one of these is a table heading, not a transaction
    std::vector<std::string> header_keywords = {
        "Описание операции",
        "Дата и время",
        "МСК",
        "Страница"
    };

    // in Unicode code points
    std::size_t min_description_length = 5;

    // tried in order, first match wins
    std::vector<PayeePattern> payee_patterns = {
        { "sbp-incoming", "Входящий перевод СБП, ([^,]+)" },
        { "sbp-outgoing", "Исходящий перевод СБП, ([^,]+)" },
        { "merchant",     "Оплата товаров и услуг ([A-Z_0-9]+)" }
    };

    // exact templates tried before the numeral fallback;
    // %d %m %H %M take one or two digits, %Y exactly four, a blank matches any run of blanks
    std::vector<std::string> date_templates = {
        "%d.%m.%Y",
        "%d.%m.%Y в %H:%M",   // only reached when time_connector is not "в"; parse() strips it first
        "%Y-%m-%d",
        "%d/%m/%Y",
        "%Y.%m.%d"
    };

    // 0 = whole currency units (what the ledger import has always sent), 2 = hundredths
    int minor_unit_exponent = 0;
};

} // namespace stmt
