#include "sigtrader/parser/pattern_matcher.hpp"
#include "sigtrader/parser/number_normalizer.hpp"

namespace sigtrader {

namespace {

void replaceAll(std::string& s, const std::string& from, const std::string& to) {
  std::size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
}

}  // namespace

std::string expandPlaceholders(const std::string& pattern) {
  const std::string num = std::string("(?:") + kNumberTokenPattern + ")";
  // A lone digit closing a parenthesis or the text is a level index
  // ("(target 2)"), never a value.
  const std::string bare_index = "(?![0-9]\\s*(?:\\)|$|\\n))";
  const std::string list = bare_index + num +
                           "(?:(?:[ \\t]|,|/|\\||\xD8\x8C)+" + num + ")*";
  const std::string index = "(?:[0-9](?=\\s|[:@=\\-)]|\\.\\s))?";

  std::string out = pattern;
  replaceAll(out, "{NUMLIST}", list);
  replaceAll(out, "{NUM}", num);
  replaceAll(out, "{IDX}", index);
  return out;
}

CompiledPattern::CompiledPattern(const PatternEntry& entry)
    : source_(entry.pattern), group_(entry.group), value_(entry.value) {
  try {
    regex_ = std::regex(expandPlaceholders(entry.pattern),
                        std::regex::ECMAScript | std::regex::icase);
  } catch (const std::regex_error& e) {
    throw ConfigError("invalid pattern '" + entry.pattern + "': " + e.what());
  }
  if (group_ < 0 || static_cast<unsigned>(group_) > regex_.mark_count()) {
    throw ConfigError("pattern '" + entry.pattern + "' has no capture group " +
                      std::to_string(group_));
  }
}

std::optional<std::string> CompiledPattern::match(const std::string& text) const {
  std::smatch m;
  if (!std::regex_search(text, m, regex_) || !m[group_].matched) {
    return std::nullopt;
  }
  return m[group_].str();
}

void CompiledPattern::matchAll(const std::string& text,
                               std::vector<std::string>& out) const {
  for (auto it = std::sregex_iterator(text.begin(), text.end(), regex_);
       it != std::sregex_iterator(); ++it) {
    const auto& sub = (*it)[group_];
    if (sub.matched) {
      out.push_back(sub.str());
    }
  }
}

FieldMatcher::FieldMatcher(const std::vector<PatternEntry>& entries) {
  patterns_.reserve(entries.size());
  for (const auto& entry : entries) {
    patterns_.emplace_back(entry);
  }
}

std::optional<FieldMatcher::Match> FieldMatcher::first(
    const std::string& text) const {
  for (const auto& pattern : patterns_) {
    if (auto captured = pattern.match(text)) {
      return Match{std::move(*captured), &pattern};
    }
  }
  return std::nullopt;
}

std::vector<std::string> FieldMatcher::all(const std::string& text) const {
  std::vector<std::string> out;
  for (const auto& pattern : patterns_) {
    pattern.matchAll(text, out);
  }
  return out;
}

}  // namespace sigtrader
