#pragma once

#include "sigtrader/config/engine_config.hpp"

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace sigtrader {

// -----------------------------------------------------------------------------
// expandPlaceholders(pattern)
// -----------------------------------------------------------------------------
// Replaces the table placeholders with their regular expressions:
//   {NUM}     one numeric token (non-capturing)
//   {NUMLIST} numeric tokens separated by blanks, ',', '/', '|' or U+060C;
//             never starts with a single digit followed by ')' or the end of
//             a line
//   {IDX}     optional one-digit level index ("TP1", "TP 2:", "TP3. ")
// -----------------------------------------------------------------------------
std::string expandPlaceholders(const std::string& pattern);

// -----------------------------------------------------------------------------
// CompiledPattern
// -----------------------------------------------------------------------------
// One PatternEntry compiled to std::regex (ECMAScript | icase).
// Construction throws ConfigError if the expression does not compile or the
// capture group does not exist.
// -----------------------------------------------------------------------------
class CompiledPattern {
 public:
  explicit CompiledPattern(const PatternEntry& entry);

  // Capture of the first match in `text`, if any.
  std::optional<std::string> match(const std::string& text) const;

  // Appends the capture of every match in `text` to `out`.
  void matchAll(const std::string& text, std::vector<std::string>& out) const;

  const std::string& value() const { return value_; }
  const std::string& source() const { return source_; }

 private:
  std::string source_;
  std::regex regex_;
  int group_;
  std::string value_;
};

// -----------------------------------------------------------------------------
// FieldMatcher
// -----------------------------------------------------------------------------
// Ordered list of CompiledPatterns for one field. Immutable after
// construction, so one instance is shared freely between threads.
// -----------------------------------------------------------------------------
class FieldMatcher {
 public:
  struct Match {
    std::string text;
    const CompiledPattern* pattern{nullptr};
  };

  FieldMatcher() = default;
  explicit FieldMatcher(const std::vector<PatternEntry>& entries);

  // First pattern (in priority order) that matches wins.
  std::optional<Match> first(const std::string& text) const;

  // Captures of every match of every pattern, in table order.
  std::vector<std::string> all(const std::string& text) const;

  bool empty() const { return patterns_.empty(); }
  std::size_t size() const { return patterns_.size(); }

 private:
  std::vector<CompiledPattern> patterns_;
};

}  // namespace sigtrader
