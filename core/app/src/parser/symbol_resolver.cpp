#include "sigtrader/parser/symbol_resolver.hpp"

#include <cctype>

namespace sigtrader {

AliasSymbolResolver::AliasSymbolResolver(
    const std::map<std::string, std::string>& aliases) {
  for (const auto& [alias, symbol] : aliases) {
    aliases_[normalizeToken(alias)] = normalizeToken(symbol);
    spellings_.push_back(alias);
  }
}

std::string AliasSymbolResolver::resolve(const std::string& raw) const {
  const std::string token = normalizeToken(raw);
  auto it = aliases_.find(token);
  return it == aliases_.end() ? token : it->second;
}

std::vector<std::string> AliasSymbolResolver::aliases() const {
  return spellings_;
}

std::string AliasSymbolResolver::normalizeToken(const std::string& raw) {
  std::string out;
  out.reserve(raw.size());
  for (char ch : raw) {
    const auto c = static_cast<unsigned char>(ch);
    if (c == '/' || c == '-' || c == '.' || std::isspace(c)) {
      continue;
    }
    // Only ASCII is case-folded; UTF-8 continuation bytes pass through.
    out.push_back(c < 0x80 ? static_cast<char>(std::toupper(c)) : ch);
  }
  return out;
}

}  // namespace sigtrader
