#include "sigtrader/parser/signal_parser.hpp"
#include "sigtrader/parser/level_rules.hpp"
#include "sigtrader/parser/number_normalizer.hpp"

#include <algorithm>
#include <cmath>

namespace sigtrader {

namespace {

std::string escapeRegex(const std::string& s) {
  static const std::string kSpecial = R"(\^$.|?*+()[]{}/-)";
  std::string out;
  for (char c : s) {
    if (kSpecial.find(c) != std::string::npos) {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  return out;
}

bool isAscii(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](char c) {
    return static_cast<unsigned char>(c) < 0x80;
  });
}

// Alias spellings become the highest priority symbol patterns. Word
// boundaries only work for ASCII, so non-ASCII aliases get their own entry.
std::vector<PatternEntry> aliasPatterns(std::vector<std::string> aliases) {
  std::sort(aliases.begin(), aliases.end(),
            [](const std::string& a, const std::string& b) {
              return a.size() > b.size();
            });
  std::string ascii;
  std::string other;
  for (const auto& alias : aliases) {
    if (alias.empty()) {
      continue;
    }
    std::string& target = isAscii(alias) ? ascii : other;
    if (!target.empty()) {
      target += "|";
    }
    target += escapeRegex(alias);
  }
  std::vector<PatternEntry> entries;
  if (!ascii.empty()) {
    entries.push_back({"\\b(" + ascii + ")\\b", 1, ""});
  }
  if (!other.empty()) {
    entries.push_back({"(" + other + ")", 1, ""});
  }
  return entries;
}

std::vector<double> dedupe(std::vector<double> values) {
  std::vector<double> out;
  for (double v : values) {
    if (!(v > 0.0)) {
      continue;
    }
    const bool seen = std::any_of(out.begin(), out.end(), [v](double o) {
      return std::fabs(o - v) < 1e-9;
    });
    if (!seen) {
      out.push_back(v);
    }
  }
  return out;
}

}  // namespace

SignalParser::SignalParser(const ParserConfig& config,
                           const ISymbolResolver& resolver)
    : resolver_(resolver),
      require_stop_loss_(config.require_stop_loss),
      decimal_comma_(config.decimal_comma),
      dual_entry_enabled_(config.dual_entry_enabled),
      direction_(config.patterns.direction),
      alias_(aliasPatterns(resolver.aliases())),
      symbol_(config.patterns.symbol),
      first_price_(config.patterns.first_price),
      second_price_(config.patterns.second_price),
      stop_loss_(config.patterns.stop_loss),
      take_profit_(config.patterns.take_profit) {}

ParseOutcome SignalParser::parse(const std::string& raw_text) const {
  const std::string text = normalizeDigits(raw_text);

  auto direction = extractDirection(text);
  if (!direction) {
    return domain::ParseRejected{"missing_field(direction)"};
  }

  auto symbol = extractSymbol(text);
  if (!symbol) {
    return domain::ParseRejected{"missing_field(symbol)"};
  }

  auto first = extractPrice(first_price_, text);
  if (!first) {
    return domain::ParseRejected{"missing_field(entry)"};
  }

  domain::Signal signal;
  signal.symbol = *symbol;
  signal.direction = *direction;
  signal.entries.push_back(*first);

  if (dual_entry_enabled_) {
    auto second = extractPrice(second_price_, text);
    if (second && std::fabs(*second - *first) > 1e-9) {
      signal.entries.push_back(*second);
    }
  }

  signal.stop_loss = extractPrice(stop_loss_, text);
  if (!signal.stop_loss && require_stop_loss_) {
    return domain::ParseRejected{"missing_field(stop_loss)"};
  }

  signal.take_profits =
      canonicalTakeProfits(signal.direction, extractTakeProfits(text));

  if (auto violation = validateLevels(signal.direction, signal.entries,
                                      signal.stop_loss, signal.take_profits)) {
    return domain::ParseRejected{"invalid_levels(" + *violation + ")"};
  }
  return signal;
}

LevelUpdate SignalParser::extractLevels(const std::string& raw_text) const {
  const std::string text = normalizeDigits(raw_text);

  LevelUpdate update;
  update.stop_loss = extractPrice(stop_loss_, text);
  update.take_profits = extractTakeProfits(text);
  if (update.empty()) {
    const auto numbers = parseNumberList(text, decimal_comma_);
    auto it = std::find_if(numbers.begin(), numbers.end(),
                           [](double v) { return v > 0.0; });
    if (it != numbers.end()) {
      update.stop_loss = *it;
    }
  }
  return update;
}

std::optional<domain::Direction> SignalParser::extractDirection(
    const std::string& text) const {
  auto match = direction_.first(text);
  if (!match) {
    return std::nullopt;
  }
  if (!match->pattern->value().empty()) {
    return domain::parseDirection(match->pattern->value());
  }
  return domain::parseDirection(match->text);
}

std::optional<std::string> SignalParser::extractSymbol(
    const std::string& text) const {
  auto match = alias_.first(text);
  if (!match) {
    match = symbol_.first(text);
  }
  if (!match) {
    return std::nullopt;
  }
  std::string symbol = resolver_.resolve(match->text);
  if (symbol.empty()) {
    return std::nullopt;
  }
  return symbol;
}

std::optional<double> SignalParser::extractPrice(const FieldMatcher& matcher,
                                                 const std::string& text) const {
  auto match = matcher.first(text);
  if (!match) {
    return std::nullopt;
  }
  auto value = parseNumber(match->text, decimal_comma_);
  if (!value || !(*value > 0.0)) {
    return std::nullopt;
  }
  return value;
}

std::vector<double> SignalParser::extractTakeProfits(
    const std::string& text) const {
  std::vector<double> values;
  for (const auto& captured : take_profit_.all(text)) {
    for (double v : parseNumberList(captured, decimal_comma_)) {
      values.push_back(v);
    }
  }
  return dedupe(std::move(values));
}

}  // namespace sigtrader
