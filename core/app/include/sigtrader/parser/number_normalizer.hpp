#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sigtrader {

// Regular expression (ECMAScript, no capture groups) for one numeric token as
// it appears in channel messages: digits with optional '.', ',' or '\''
// separators, e.g. "1.0850", "2,350", "1'234.5".
extern const char* const kNumberTokenPattern;

// -----------------------------------------------------------------------------
// normalizeDigits(text)
// -----------------------------------------------------------------------------
// Rewrites Persian (U+06F0..06F9) and Arabic-Indic (U+0660..0669) digits to
// ASCII and the Arabic decimal/thousands separators (U+066B / U+066C) to '.'
// and ','. Everything else is copied unchanged. Input and output are UTF-8.
// -----------------------------------------------------------------------------
std::string normalizeDigits(const std::string& text);

// -----------------------------------------------------------------------------
// parseNumber(token, decimal_comma)
// -----------------------------------------------------------------------------
// Converts one numeric token to a double.
//   - '\'' is always a thousands separator and is dropped.
//   - With both '.' and ',' present, whichever comes last is the decimal
//     separator and the other is a thousands separator.
//   - A lone ',' is decimal when `decimal_comma` is set; otherwise it must
//     separate groups of exactly three digits ("2,350").
//   - Several '.' are only accepted as thousands separators when
//     `decimal_comma` is set.
// Returns std::nullopt for anything else.
// -----------------------------------------------------------------------------
std::optional<double> parseNumber(const std::string& token, bool decimal_comma);

// Every number in `text`, in order. A token that is not a valid number but
// contains ',' is split on ',' ("4220,4230" -> 4220, 4230).
std::vector<double> parseNumberList(const std::string& text,
                                    bool decimal_comma);

}  // namespace sigtrader
