#include "sigtrader/command/command_classifier.hpp"

#include <algorithm>
#include <cctype>

namespace sigtrader {

namespace {

bool isAsciiWordChar(unsigned char c) {
  return c < 0x80 && std::isalnum(c) != 0;
}

std::vector<std::string> lowered(const std::vector<std::string>& words) {
  std::vector<std::string> out;
  out.reserve(words.size());
  for (const auto& w : words) {
    if (!w.empty()) {
      out.push_back(asciiLower(w));
    }
  }
  return out;
}

}  // namespace

std::string asciiLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](char ch) {
    const auto c = static_cast<unsigned char>(ch);
    return c < 0x80 ? static_cast<char>(std::tolower(c)) : ch;
  });
  return text;
}

CommandClassifier::CommandClassifier(const CommandConfig& config,
                                     const SignalParser& parser)
    : parser_(parser),
      half_modifier_overrides_delete_(config.half_modifier_overrides_delete) {
  using domain::CommandKind;
  const KeywordTables& k = config.keywords;
  sets_ = {
      {CommandKind::Delete, lowered(k.delete_keywords)},
      {CommandKind::RiskFree, lowered(k.risk_free)},
      {CommandKind::HalfClose, lowered(k.half_close)},
      {CommandKind::TakeProfitNow, lowered(k.take_profit)},
      {CommandKind::Edit, lowered(k.edit)},
  };
}

ClassifyOutcome CommandClassifier::classify(const std::string& reply_text) const {
  if (reply_text.find_first_not_of(" \t\r\n") == std::string::npos) {
    return NotACommand{"empty_text"};
  }
  const std::string text = asciiLower(reply_text);

  // A half modifier demotes Delete; the rest of the order still applies,
  // so "risk free and close half" stays RiskFree.
  const bool delete_demoted =
      half_modifier_overrides_delete_ &&
      containsKeyword(text, setFor(domain::CommandKind::HalfClose).keywords);

  for (const auto& set : sets_) {
    if (set.kind == domain::CommandKind::Delete && delete_demoted) {
      continue;
    }
    if (!containsKeyword(text, set.keywords)) {
      continue;
    }

    domain::Command command;
    command.kind = set.kind;
    command.origin = domain::CommandOrigin::Reply;

    if (command.kind == domain::CommandKind::Edit) {
      LevelUpdate levels = parser_.extractLevels(reply_text);
      if (levels.empty()) {
        return NotACommand{"edit_without_values"};
      }
      command.new_stop_loss = levels.stop_loss;
      command.new_take_profits = std::move(levels.take_profits);
    }
    return command;
  }
  return NotACommand{"no_keyword"};
}

bool CommandClassifier::mentions(domain::CommandKind kind,
                                 const std::string& text) const {
  return containsKeyword(asciiLower(text), setFor(kind).keywords);
}

bool CommandClassifier::containsKeyword(const std::string& text,
                                        const std::vector<std::string>& keywords) {
  for (const auto& keyword : keywords) {
    std::size_t pos = text.find(keyword);
    while (pos != std::string::npos) {
      const std::size_t end = pos + keyword.size();
      const bool left_ok =
          pos == 0 || !isAsciiWordChar(static_cast<unsigned char>(text[pos - 1]));
      const bool right_ok =
          end >= text.size() ||
          !isAsciiWordChar(static_cast<unsigned char>(text[end]));
      if (left_ok && right_ok) {
        return true;
      }
      pos = text.find(keyword, pos + 1);
    }
  }
  return false;
}

const CommandClassifier::KeywordSet& CommandClassifier::setFor(
    domain::CommandKind kind) const {
  // sets_ is built from every CommandKind in the constructor.
  return *std::find_if(sets_.begin(), sets_.end(),
                       [kind](const KeywordSet& s) { return s.kind == kind; });
}

}  // namespace sigtrader
