#pragma once

#include <map>
#include <string>
#include <vector>

namespace sigtrader {

// -----------------------------------------------------------------------------
// ISymbolResolver
// -----------------------------------------------------------------------------
// Maps the instrument token found in a message ("gold", "EUR/USD", "US30")
// to the venue's canonical symbol. Lookups must be pure and thread-safe.
// -----------------------------------------------------------------------------
class ISymbolResolver {
 public:
  virtual ~ISymbolResolver() = default;

  virtual std::string resolve(const std::string& raw) const = 0;

  // Alias spellings the resolver knows. The parser tries them before its
  // symbol patterns so that e.g. "GOLD" is recognized as an instrument.
  virtual std::vector<std::string> aliases() const { return {}; }
};

// -----------------------------------------------------------------------------
// AliasSymbolResolver
// -----------------------------------------------------------------------------
// Table driven resolver: normalizes the token (ASCII upper-case, '/', '-',
// '.' and blanks removed) and maps it through the alias table; unknown
// tokens resolve to their normalized form.
// -----------------------------------------------------------------------------
class AliasSymbolResolver final : public ISymbolResolver {
 public:
  explicit AliasSymbolResolver(const std::map<std::string, std::string>& aliases);

  std::string resolve(const std::string& raw) const override;
  std::vector<std::string> aliases() const override;

  static std::string normalizeToken(const std::string& raw);

 private:
  std::map<std::string, std::string> aliases_;  // normalized alias -> symbol
  std::vector<std::string> spellings_;          // aliases as configured
};

}  // namespace sigtrader
