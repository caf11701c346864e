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
#include <pugixml.hpp>
#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cstring>
#include <istream>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace stmt {

// ---------- Helpers (namespace-agnostic, only classic loops) ----------
inline const char* ln(const pugi::xml_node& n) {
    if (!n) return "";
    const char* full = n.name();
    const char* c = std::strrchr(full, ':');
    return c ? c + 1 : full;
}
inline bool isln(const pugi::xml_node& n, const char* wanted) { return std::strcmp(ln(n), wanted) == 0; }

// direct child with local name
inline pugi::xml_node child_any(const pugi::xml_node& p, const char* name) {
    for (pugi::xml_node c = p.first_child(); c; c = c.next_sibling())
        if (isln(c, name)) return c;
    return pugi::xml_node();
}

inline std::string txt(const pugi::xml_node& n) {
    std::string s = n.text().as_string(); // UTF-8
    auto notsp = [](int ch){ return ch!=' ' && ch!='\t' && ch!='\n' && ch!='\r'; };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notsp));
    s.erase(std::find_if(s.rbegin(), s.rend(), notsp).base(), s.end());
    return s;
}
inline std::string child_text(const pugi::xml_node& p, const char* name) {
    pugi::xml_node n = child_any(p, name);
    return n ? txt(n) : std::string();
}

// Missing child keeps `out`; present but malformed is an error
inline bool read_i64(const pugi::xml_node& p, const char* name, std::int64_t& out, std::string* error) {
    pugi::xml_node n = child_any(p, name);
    if (!n) return true;
    const std::string s = txt(n);
    if (s.empty()) return true;
    std::int64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        if (error) *error = std::string("Invalid number in <") + name + ">: '" + s + "'";
        return false;
    }
    out = v;
    return true;
}

inline void read_bool(const pugi::xml_node& p, const char* name, bool& out) {
    pugi::xml_node n = child_any(p, name);
    if (!n) return;
    const std::string s = txt(n);
    out = (s == "true" || s == "1");
}

inline std::optional<std::string> optional_text(const pugi::xml_node& p, const char* name) {
    std::string s = child_text(p, name);
    if (s.empty()) return std::nullopt;
    return s;
}

inline bool parse_ledger_transaction(const pugi::xml_node& n, CanonicalTransaction& t, std::string* error) {
    t.id = child_text(n, "id");
    if (t.id.empty()) {
        if (error) *error = "Transaction without <id>";
        return false;
    }
    if (!read_i64(n, "created", t.createdAt, error)) return false;
    if (!read_i64(n, "changed", t.changedAt, error)) return false;
    if (!read_i64(n, "user", t.userId, error)) return false;
    read_bool(n, "deleted", t.deleted);

    t.incomeAccount = optional_text(n, "incomeAccount");
    if (!read_i64(n, "incomeInstrument", t.incomeInstrument, error)) return false;
    if (!read_i64(n, "income", t.income, error)) return false;
    t.outcomeAccount = optional_text(n, "outcomeAccount");
    if (!read_i64(n, "outcomeInstrument", t.outcomeInstrument, error)) return false;
    if (!read_i64(n, "outcome", t.outcome, error)) return false;

    t.payee   = optional_text(n, "payee");
    t.comment = child_text(n, "comment");
    t.date    = child_text(n, "date");
    return true;
}

// ---------- Ledger snapshot reader ----------
//
// <snapshot>
//   <serverTimestamp>1753600000</serverTimestamp>
//   <account><id/><title/><instrument/><deleted/></account>
//   <instrument><id/><shortTitle/><title/></instrument>
//   <user><id/></user>
//   <transaction>...</transaction>
// </snapshot>
class SnapshotReader {
public:

    bool read_file(const std::string& path, LedgerSnapshot& out, std::string* error=nullptr) const {
        pugi::xml_document doc;
        pugi::xml_parse_result ok = doc.load_file(path.c_str(), pugi::parse_default | pugi::parse_declaration);
        if (!ok){ if(error)*error=std::string("XML file parse error: ") + ok.description(); return false; }
        return read_doc(doc, out, error);
    }

    bool read_file(std::istream& is, LedgerSnapshot& out, std::string* error=nullptr) const {
        pugi::xml_document doc;
        pugi::xml_parse_result ok = doc.load(is, pugi::parse_default | pugi::parse_declaration);
        if (!ok){ if(error)*error=std::string("XML file parse error: ") + ok.description(); return false; }
        return read_doc(doc, out, error);
    }

    bool read_string(const std::string& xml_utf8, LedgerSnapshot& out, std::string* error=nullptr) const {
        pugi::xml_document doc;
        pugi::xml_parse_result ok = doc.load_buffer(xml_utf8.data(), xml_utf8.size(), pugi::parse_default | pugi::parse_declaration);
        if (!ok){ if(error)*error=std::string("XML parse error: ") + ok.description(); return false; }
        return read_doc(doc, out, error);
    }

private:
    bool read_doc(const pugi::xml_document& doc, LedgerSnapshot& out, std::string* error) const {
        pugi::xml_node root = doc.document_element();
        if (!root){ if(error)*error="Empty document"; return false; }
        if (!isln(root, "snapshot")){ if(error)*error=std::string("Unsupported root <") + ln(root) + ">"; return false; }

        LedgerSnapshot s;
        if (!read_i64(root, "serverTimestamp", s.serverTimestamp, error)) return false;

        for (pugi::xml_node n = root.first_child(); n; n = n.next_sibling()) {
            if (isln(n, "account")) {
                LedgerAccount a;
                a.id = child_text(n, "id");
                a.title = child_text(n, "title");
                if (!read_i64(n, "instrument", a.instrument, error)) return false;
                read_bool(n, "deleted", a.deleted);
                s.accounts.push_back(std::move(a));
            } else if (isln(n, "instrument")) {
                LedgerInstrument i;
                if (!read_i64(n, "id", i.id, error)) return false;
                i.shortTitle = child_text(n, "shortTitle");
                i.title = child_text(n, "title");
                s.instruments.push_back(std::move(i));
            } else if (isln(n, "user")) {
                LedgerUser u;
                if (!read_i64(n, "id", u.id, error)) return false;
                s.users.push_back(u);
            } else if (isln(n, "transaction")) {
                CanonicalTransaction t;
                if (!parse_ledger_transaction(n, t, error)) return false;
                s.transactions.push_back(std::move(t));
            }
        }
        out = std::move(s);
        return true;
    }
};

// ---------- Parser options reader ----------
//
// Overrides on top of the options passed in; repeated elements replace the whole list.
// <stmt-options>
//   <time-connector/> <currency-mark/> <min-description-length/> <minor-unit-exponent/>
//   <boilerplate-pattern/>* <header-keyword/>* <payee-pattern label=".."/>* <date-template/>*
// </stmt-options>
class OptionsReader {
public:

    bool read_file(const std::string& path, ParserOptions& out, std::string* error=nullptr) const {
        pugi::xml_document doc;
        pugi::xml_parse_result ok = doc.load_file(path.c_str(), pugi::parse_default | pugi::parse_declaration);
        if (!ok){ if(error)*error=std::string("XML file parse error: ") + ok.description(); return false; }
        return read_doc(doc, out, error);
    }

    bool read_string(const std::string& xml_utf8, ParserOptions& out, std::string* error=nullptr) const {
        pugi::xml_document doc;
        pugi::xml_parse_result ok = doc.load_buffer(xml_utf8.data(), xml_utf8.size(), pugi::parse_default | pugi::parse_declaration);
        if (!ok){ if(error)*error=std::string("XML parse error: ") + ok.description(); return false; }
        return read_doc(doc, out, error);
    }

private:
    static bool check_regex(const std::string& re, std::string* error) {
        try {
            std::regex compiled(re);
        } catch (const std::regex_error& e) {
            if (error) *error = "Invalid pattern '" + re + "': " + e.what();
            return false;
        }
        return true;
    }

    bool read_doc(const pugi::xml_document& doc, ParserOptions& out, std::string* error) const {
        pugi::xml_node root = doc.document_element();
        if (!root){ if(error)*error="Empty document"; return false; }
        if (!isln(root, "stmt-options")){ if(error)*error=std::string("Unsupported root <") + ln(root) + ">"; return false; }

        ParserOptions o = out;
        if (pugi::xml_node n = child_any(root, "time-connector")) o.time_connector = txt(n);
        if (pugi::xml_node n = child_any(root, "currency-mark"))  o.currency_mark  = txt(n);

        std::int64_t minLen = static_cast<std::int64_t>(o.min_description_length);
        if (!read_i64(root, "min-description-length", minLen, error)) return false;
        if (minLen < 0) { if(error)*error="min-description-length must not be negative"; return false; }
        o.min_description_length = static_cast<std::size_t>(minLen);

        std::int64_t exp = o.minor_unit_exponent;
        if (!read_i64(root, "minor-unit-exponent", exp, error)) return false;
        if (exp < 0 || exp > 4) { if(error)*error="minor-unit-exponent must be within 0..4"; return false; }
        o.minor_unit_exponent = static_cast<int>(exp);

        std::vector<std::string> boilerplate, keywords, templates;
        std::vector<PayeePattern> payees;
        for (pugi::xml_node n = root.first_child(); n; n = n.next_sibling()) {
            if (isln(n, "boilerplate-pattern")) {
                std::string re = txt(n);
                if (!check_regex(re, error)) return false;
                boilerplate.push_back(std::move(re));
            } else if (isln(n, "header-keyword")) {
                keywords.push_back(txt(n));
            } else if (isln(n, "date-template")) {
                templates.push_back(txt(n));
            } else if (isln(n, "payee-pattern")) {
                PayeePattern p;
                p.label = n.attribute("label").as_string();
                p.regex = txt(n);
                if (!check_regex(p.regex, error)) return false;
                payees.push_back(std::move(p));
            }
        }
        if (!boilerplate.empty()) o.boilerplate_patterns = std::move(boilerplate);
        if (!keywords.empty())    o.header_keywords      = std::move(keywords);
        if (!templates.empty())   o.date_templates       = std::move(templates);
        if (!payees.empty())      o.payee_patterns       = std::move(payees);

        if (o.time_connector.empty()) { if(error)*error="time-connector must not be empty"; return false; }
        out = std::move(o);
        return true;
    }
};

} // namespace stmt
