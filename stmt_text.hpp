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
#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>
#include <utf8proc.h>

namespace stmt {

// RAII deleter for buffers allocated by utf8proc_map (uses malloc internally)
struct Utf8ProcDeleter {
    void operator()(utf8proc_uint8_t* p) const noexcept { if (p) std::free(p); }
};

// Unicode space/line/paragraph separators and ASCII control whitespace, except '\n'
inline bool is_inline_space(utf8proc_int32_t cp) {
    const int cat = utf8proc_category(cp);
    if (cat == UTF8PROC_CATEGORY_ZS ||
        cat == UTF8PROC_CATEGORY_ZL ||
        cat == UTF8PROC_CATEGORY_ZP) {
        return true;
    }
    switch (cp) {
    case 0x09: // \t
    case 0x0B: // \v
    case 0x0C: // \f
    case 0x0D: // \r
        return true;
    default:
        return false;
    }
}

inline bool is_zero_width(utf8proc_int32_t cp) {
    switch (cp) {
    case 0x00AD: // SOFT HYPHEN
    case 0x200B: // ZERO WIDTH SPACE
    case 0x200C: // ZERO WIDTH NON-JOINER
    case 0x200D: // ZERO WIDTH JOINER
    case 0x2060: // WORD JOINER
    case 0xFEFF: // BOM / ZERO WIDTH NO-BREAK SPACE
        return true;
    default:
        return false;
    }
}

inline void append_codepoint(std::string& out, utf8proc_int32_t cp) {
    utf8proc_uint8_t buf[4];
    const utf8proc_ssize_t w = utf8proc_encode_char(cp, buf);
    if (w > 0) {
        out.append(reinterpret_cast<char*>(buf), static_cast<size_t>(w));
    }
}

// Calls fn(codepoint) for every valid code point; invalid bytes are skipped
template <class Fn>
inline void for_each_codepoint(std::string_view in, Fn fn) {
    const utf8proc_uint8_t* p   = reinterpret_cast<const utf8proc_uint8_t*>(in.data());
    const utf8proc_uint8_t* end = p + in.size();
    while (p < end) {
        utf8proc_int32_t cp = 0;
        const utf8proc_ssize_t adv = utf8proc_iterate(p, static_cast<utf8proc_ssize_t>(end - p), &cp);
        if (adv <= 0) {
            ++p;
            continue;
        }
        p += adv;
        fn(cp);
    }
}

// NFC; every inline space (NBSP, narrow NBSP, tab, ...) becomes ' ',
// zero-width characters vanish, line breaks are kept.
inline std::string normalize_spaces(std::string_view in) {
    utf8proc_uint8_t* raw = nullptr;
    const utf8proc_ssize_t nlen = utf8proc_map(
        reinterpret_cast<const utf8proc_uint8_t*>(in.data()),
        static_cast<utf8proc_ssize_t>(in.size()),
        &raw, UTF8PROC_COMPOSE
    );
    std::unique_ptr<utf8proc_uint8_t, Utf8ProcDeleter> norm(raw);
    std::string_view src = in;
    if (nlen >= 0 && norm) {
        src = std::string_view(reinterpret_cast<const char*>(norm.get()), static_cast<size_t>(nlen));
    }

    std::string out;
    out.reserve(src.size());
    for_each_codepoint(src, [&](utf8proc_int32_t cp) {
        if (is_zero_width(cp)) return;
        if (cp == 0x0A || cp == 0x2028 || cp == 0x2029) { out.push_back('\n'); return; }
        if (is_inline_space(cp)) { out.push_back(' '); return; }
        append_codepoint(out, cp);
    });
    return out;
}

// Removes every kind of whitespace ("1 200,50" with NBSP -> "1200,50")
inline std::string strip_all_spaces(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for_each_codepoint(in, [&](utf8proc_int32_t cp) {
        if (cp == 0x0A || is_inline_space(cp) || is_zero_width(cp)) return;
        append_codepoint(out, cp);
    });
    return out;
}

// Runs of whitespace (line breaks included) become one blank; result is trimmed
inline std::string collapse_whitespace(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    bool pending = false;
    for_each_codepoint(in, [&](utf8proc_int32_t cp) {
        if (cp == 0x0A || is_inline_space(cp)) {
            pending = !out.empty();
            return;
        }
        if (is_zero_width(cp)) return;
        if (pending) {
            out.push_back(' ');
            pending = false;
        }
        append_codepoint(out, cp);
    });
    return out;
}

inline std::string trim(std::string_view s) {
    size_t b = 0, e = s.size();
    while (b < e && (s[b]==' '||s[b]=='\t'||s[b]=='\n'||s[b]=='\r'||s[b]=='\f'||s[b]=='\v')) ++b;
    while (e > b && (s[e-1]==' '||s[e-1]=='\t'||s[e-1]=='\n'||s[e-1]=='\r'||s[e-1]=='\f'||s[e-1]=='\v')) --e;
    return std::string(s.substr(b, e-b));
}

inline std::size_t codepoint_length(std::string_view s) {
    std::size_t n = 0;
    for_each_codepoint(s, [&](utf8proc_int32_t) { ++n; });
    return n;
}

// Free text key for comparisons: NFC + casefold, all whitespace removed
inline std::string normalize_freetext(std::string_view in) {
    utf8proc_uint8_t* raw = nullptr;
    const utf8proc_ssize_t nlen = utf8proc_map(
        reinterpret_cast<const utf8proc_uint8_t*>(in.data()),
        static_cast<utf8proc_ssize_t>(in.size()),
        &raw, static_cast<utf8proc_option_t>(UTF8PROC_COMPOSE | UTF8PROC_CASEFOLD)
    );
    if (nlen < 0 || !raw) {
        return strip_all_spaces(in);
    }
    std::unique_ptr<utf8proc_uint8_t, Utf8ProcDeleter> norm(raw);
    return strip_all_spaces(std::string_view(reinterpret_cast<const char*>(norm.get()), static_cast<size_t>(nlen)));
}

inline bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Escapes ECMAScript metacharacters so `s` matches literally
inline std::string regex_escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() * 2);
    for (char c : s) {
        switch (c) {
        case '\\': case '^': case '$': case '.': case '|': case '?': case '*':
        case '+': case '(': case ')': case '[': case ']': case '{': case '}':
            out.push_back('\\');
            break;
        default:
            break;
        }
        out.push_back(c);
    }
    return out;
}

} // namespace stmt
