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
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace stmt {

// ---------- Segmentation states ----------
//
//   AnchorMatch -> PostAnchorWindow -> WindowScan -> ExtractedFields -> validated
//
// Every arrow that can fail yields a Failure instead of the next state.

struct FieldMatch {
    TextSpan span;
    std::string text;
};

// "27.07.2025 в 08:16"
struct AnchorMatch {
    TextSpan span;
    std::string date;     // "27.07.2025"
    std::string time;     // "08:16"
    std::string dateTime; // date + connector + time
};

// Text after an anchor up to the next anchor (or the end of the document)
struct PostAnchorWindow {
    TextSpan span;
};

// Whatever the window offered; members stay empty when not found
struct WindowScan {
    std::optional<FieldMatch> processingDate;
    std::optional<FieldMatch> card;
    std::vector<FieldMatch> amounts;     // at most two, in document order
    std::size_t consumedEnd{0};          // end of the last amount found (>= window begin)
};

struct ExtractedFields {
    FieldMatch processingDate;
    std::optional<FieldMatch> card;
    FieldMatch transactionAmount;
    FieldMatch accountAmount;
    std::size_t consumedEnd{0};
};

class Segmenter {
public:
    explicit Segmenter(const ParserOptions& opt = {})
        : opt_(opt)
        , anchor_("(\\d{2}\\.\\d{2}\\.\\d{4})\\s+" + regex_escape(opt.time_connector) + "\\s+(\\d{2}:\\d{2})")
        , date_("\\d{2}\\.\\d{2}\\.\\d{4}")
        , card_("\\*(\\d{4,5})")
        , amount_("(?:\\+|-|–|—|−)\\s*\\d+(?:\\s+\\d{3})*(?:,\\d{1,2})?\\s*" + regex_escape(opt.currency_mark))
        , trailingAmount_("(?:\\+|-|–|—|−)\\s*\\d.*?" + regex_escape(opt.currency_mark) + "\\s*$")
    {
    }

    // All anchors, left to right; matches are disjoint by construction
    std::vector<AnchorMatch> find_anchors(std::string_view text) const {
        std::vector<AnchorMatch> out;
        const char* base = text.data();
        for (std::cregex_iterator it(base, base + text.size(), anchor_), end; it != end; ++it) {
            const std::cmatch& m = *it;
            AnchorMatch a;
            a.span.begin = static_cast<std::size_t>(m.position(0));
            a.span.end   = a.span.begin + static_cast<std::size_t>(m.length(0));
            a.date = m.str(1);
            a.time = m.str(2);
            a.dateTime = a.date + " " + opt_.time_connector + " " + a.time;
            out.push_back(std::move(a));
        }
        return out;
    }

    static PostAnchorWindow window_after(const AnchorMatch& a, const AnchorMatch* next, std::size_t textSize) {
        PostAnchorWindow w;
        w.span.begin = a.span.end;
        w.span.end   = next ? next->span.begin : textSize;
        return w;
    }

    // First two amounts of the window; the processing date and the masked card
    // only count in front of the last of them
    WindowScan scan_window(std::string_view text, const PostAnchorWindow& w) const {
        WindowScan scan;
        scan.consumedEnd = w.span.begin;

        const char* first = text.data() + w.span.begin;
        const char* last  = text.data() + w.span.end;

        auto to_field = [&](const std::cmatch& m, int group) {
            FieldMatch f;
            f.span.begin = w.span.begin + static_cast<std::size_t>(m.position(group));
            f.span.end   = f.span.begin + static_cast<std::size_t>(m.length(group));
            f.text = m.str(group);
            return f;
        };
        auto consume = [&](const FieldMatch& f) {
            scan.consumedEnd = std::max(scan.consumedEnd, f.span.end);
        };

        for (std::cregex_iterator it(first, last, amount_), end; it != end && scan.amounts.size() < 2; ++it) {
            FieldMatch f = to_field(*it, 0);
            f.text = trim(f.text);
            consume(f);
            scan.amounts.push_back(std::move(f));
        }

        // the last amount closes this transaction; whatever follows it already
        // belongs to the next description
        const char* fieldsLast = scan.amounts.empty() ? first : text.data() + scan.amounts.back().span.end;

        std::cmatch m;
        if (std::regex_search(first, fieldsLast, m, date_)) {
            scan.processingDate = to_field(m, 0);
            consume(*scan.processingDate);
        }
        if (std::regex_search(first, fieldsLast, m, card_)) {
            scan.card = to_field(m, 0);
            consume(*scan.card);
        }
        return scan;
    }

    static Outcome<ExtractedFields> extract_fields(const WindowScan& scan, std::string_view windowText) {
        if (!scan.processingDate) {
            return Failure{ SkipKind::SegmentationSkip, trim(windowText), "no processing date after the anchor" };
        }
        if (scan.amounts.size() < 2) {
            return Failure{ SkipKind::SegmentationSkip, trim(windowText),
                            "fewer than two amounts after the anchor (found " + std::to_string(scan.amounts.size()) + ")" };
        }
        ExtractedFields f;
        f.processingDate    = *scan.processingDate;
        f.card              = scan.card;
        f.transactionAmount = scan.amounts[0];
        f.accountAmount     = scan.amounts[1];
        f.consumedEnd       = scan.consumedEnd;
        return f;
    }

    // Region text with amount-like line endings removed, whitespace collapsed
    std::string extract_description(std::string_view text, TextSpan region) const {
        if (region.end <= region.begin) return std::string();
        std::string_view raw = text.substr(region.begin, region.end - region.begin);

        std::string kept;
        kept.reserve(raw.size());
        size_t start = 0;
        while (start <= raw.size()) {
            size_t nl = raw.find('\n', start);
            std::string line(raw.substr(start, nl == std::string_view::npos ? std::string_view::npos : nl - start));
            kept += std::regex_replace(line, trailingAmount_, "");
            if (nl == std::string_view::npos) break;
            kept.push_back('\n');
            start = nl + 1;
        }
        return collapse_whitespace(kept);
    }

    std::optional<Failure> validate_description(const std::string& description) const {
        for (const auto& kw : opt_.header_keywords) {
            if (!kw.empty() && description.find(kw) != std::string::npos) {
                return Failure{ SkipKind::ValidationSkip, description, "header keyword '" + kw + "'" };
            }
        }
        const std::size_t len = codepoint_length(description);
        if (len < opt_.min_description_length) {
            return Failure{ SkipKind::ValidationSkip, description,
                            "description shorter than " + std::to_string(opt_.min_description_length) +
                            " characters (" + std::to_string(len) + ")" };
        }
        return std::nullopt;
    }

    // Sanitized text -> IntermediateTransactions in document order.
    // Spans are [description start, last consumed field) and never overlap.
    std::vector<IntermediateTransaction> segment(std::string_view text, ConversionReport* report = nullptr) const {
        std::vector<IntermediateTransaction> out;
        const std::vector<AnchorMatch> anchors = find_anchors(text);
        if (report) report->anchors += anchors.size();

        std::size_t cursor = 0; // end of what the previous segment consumed
        for (size_t i = 0; i < anchors.size(); ++i) {
            const AnchorMatch& a = anchors[i];
            const AnchorMatch* next = (i + 1 < anchors.size()) ? &anchors[i + 1] : nullptr;

            const PostAnchorWindow w = window_after(a, next, text.size());
            const WindowScan scan = scan_window(text, w);
            const TextSpan descRegion{ cursor, a.span.begin };
            cursor = scan.consumedEnd;

            Outcome<ExtractedFields> fields = extract_fields(scan, text.substr(w.span.begin, w.span.end - w.span.begin));
            if (const Failure* f = std::get_if<Failure>(&fields)) {
                report_skip(report, *f, a.span.begin);
                continue;
            }
            const ExtractedFields& ef = std::get<ExtractedFields>(fields);

            std::string description = extract_description(text, descRegion);
            if (auto f = validate_description(description)) {
                report_skip(report, *f, a.span.begin);
                continue;
            }

            IntermediateTransaction t;
            t.description         = std::move(description);
            t.transactionDateTime = a.dateTime;
            t.processingDate      = ef.processingDate.text;
            if (ef.card) t.cardSuffix = ef.card->text;
            t.transactionAmount   = ef.transactionAmount.text;
            t.accountAmount       = ef.accountAmount.text;
            t.span                = TextSpan{ descRegion.begin, ef.consumedEnd };
            t.importOrdinal       = static_cast<int>(i);
            out.push_back(std::move(t));
        }
        if (report) report->intermediates += out.size();
        return out;
    }

private:
    ParserOptions opt_;
    std::regex anchor_;
    std::regex date_;
    std::regex card_;
    std::regex amount_;
    std::regex trailingAmount_;
};

} // namespace stmt
