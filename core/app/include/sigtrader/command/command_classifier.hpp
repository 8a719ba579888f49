#pragma once

#include "sigtrader/config/engine_config.hpp"
#include "sigtrader/domain/command.hpp"
#include "sigtrader/parser/signal_parser.hpp"

#include <string>
#include <variant>
#include <vector>

namespace sigtrader {

struct NotACommand {
  std::string reason;  // "no_keyword", "edit_without_values", "empty_text"
};

using ClassifyOutcome = std::variant<domain::Command, NotACommand>;

// -----------------------------------------------------------------------------
// CommandClassifier
// -----------------------------------------------------------------------------
//
// @brief  Decides which follow-up instruction a reply message carries.
//
// @details
// Each command kind owns a keyword list. A keyword matches when it occurs in
// the lower-cased text and is not glued to an ASCII letter or digit on either
// side, so "tp" matches "TP hit" but not "stop". When several kinds match
// the fixed priority decides:
//
//     Delete > RiskFree > HalfClose > TakeProfitNow > Edit
//
// With `half_modifier_overrides_delete`, a Delete match whose text also
// holds a half-close keyword ("close half") becomes HalfClose.
//
// Edit commands carry the values found by SignalParser::extractLevels().
// The returned Command has no target; the ingestion pipeline binds it.
//
// Thread-safety: Immutable after construction.
// Ownership: Holds a reference to the parser, which must outlive it.
// -----------------------------------------------------------------------------
class CommandClassifier {
 public:
  CommandClassifier(const CommandConfig& config, const SignalParser& parser);

  ClassifyOutcome classify(const std::string& reply_text) const;

  // True if any keyword of `kind` occurs in `text`.
  bool mentions(domain::CommandKind kind, const std::string& text) const;

 private:
  struct KeywordSet {
    domain::CommandKind kind;
    std::vector<std::string> keywords;  // lower-cased
  };

  static bool containsKeyword(const std::string& lowered,
                              const std::vector<std::string>& keywords);
  const KeywordSet& setFor(domain::CommandKind kind) const;

  const SignalParser& parser_;
  bool half_modifier_overrides_delete_;
  std::vector<KeywordSet> sets_;  // in priority order
};

// ASCII lower-casing; UTF-8 multi-byte sequences are left unchanged.
std::string asciiLower(std::string text);

}  // namespace sigtrader
