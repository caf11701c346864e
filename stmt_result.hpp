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
#include <array>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace stmt {

// Reasons a segment or a transaction is dropped. All of them are non-fatal.
enum class SkipKind {
    SegmentationSkip,   // window lacks a processing date or two amounts
    ValidationSkip,     // description too short or table-heading artifact
    DateParseError,
    AmountParseError,
    ZeroAmountSkip,
    Count // Array size
};

constexpr std::size_t to_index(SkipKind k) noexcept {
    return static_cast<std::size_t>(k);
}

inline const char* to_string(SkipKind k) {
    switch (k) {
    case SkipKind::SegmentationSkip: return "SegmentationSkip";
    case SkipKind::ValidationSkip:   return "ValidationSkip";
    case SkipKind::DateParseError:   return "DateParseError";
    case SkipKind::AmountParseError: return "AmountParseError";
    case SkipKind::ZeroAmountSkip:   return "ZeroAmountSkip";
    case SkipKind::Count:            break;
    }
    return "Unknown";
}

struct Failure {
    SkipKind kind{SkipKind::SegmentationSkip};
    std::string raw;      // offending input, verbatim
    std::string reason;
};

// Result of a single parse attempt: the value or the reason it failed
template <class T>
using Outcome = std::variant<T, Failure>;

template <class T>
inline bool succeeded(const Outcome<T>& o) noexcept {
    return std::holds_alternative<T>(o);
}

// --- Batch summary ---
struct Diagnostic {
    SkipKind kind{SkipKind::SegmentationSkip};
    std::size_t position{0};  // byte offset in the sanitized text
    std::string raw;
    std::string reason;
};

struct ConversionReport {
    std::size_t anchors{0};         // date-time anchors found
    std::size_t intermediates{0};   // IntermediateTransactions produced
    std::size_t assembled{0};       // CanonicalTransactions produced
    std::array<std::size_t, to_index(SkipKind::Count)> skipped{};
    std::vector<Diagnostic> diagnostics;
};

inline void report_skip(ConversionReport* report, const Failure& f, std::size_t position) {
    if (!report) return;
    report->skipped[to_index(f.kind)] += 1;
    report->diagnostics.push_back(Diagnostic{ f.kind, position, f.raw, f.reason });
}

inline std::size_t count(const ConversionReport& r, SkipKind k) {
    return k == SkipKind::Count ? 0 : r.skipped[to_index(k)];
}

inline std::size_t total_skipped(const ConversionReport& r) {
    std::size_t n = 0;
    for (std::size_t c : r.skipped) n += c;
    return n;
}

// --- Batch-level (fatal) errors ---
enum class ResolutionErrorKind {
    None,
    AccountNotFound,    // AccountResolutionError
    CurrencyNotFound    // CurrencyResolutionError
};

struct ResolutionError {
    ResolutionErrorKind kind{ResolutionErrorKind::None};
    std::string message;
};

} // namespace stmt
