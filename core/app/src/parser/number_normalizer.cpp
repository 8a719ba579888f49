#include "sigtrader/parser/number_normalizer.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <regex>

namespace sigtrader {

const char* const kNumberTokenPattern = "[0-9]+(?:[.,'][0-9]+)*";

namespace {

// UTF-8 lead bytes of the two-byte sequences we rewrite.
constexpr unsigned char kLeadArabic = 0xD9;   // U+0640..U+067F
constexpr unsigned char kLeadPersian = 0xDB;  // U+06C0..U+06FF

bool allDigits(const std::string& s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
}

// "1,234,567" style: first group 1-3 digits, every later group exactly 3.
bool isGrouped(const std::string& s, char sep) {
  std::size_t start = 0;
  bool first = true;
  while (true) {
    const std::size_t pos = s.find(sep, start);
    const std::string group =
        s.substr(start, pos == std::string::npos ? std::string::npos
                                                 : pos - start);
    if (!allDigits(group)) {
      return false;
    }
    if (first ? group.size() > 3 : group.size() != 3) {
      return false;
    }
    if (pos == std::string::npos) {
      return true;
    }
    first = false;
    start = pos + 1;
  }
}

std::optional<double> toDouble(const std::string& plain) {
  if (plain.empty() || !std::isdigit(static_cast<unsigned char>(plain[0]))) {
    return std::nullopt;
  }
  char* end = nullptr;
  const double v = std::strtod(plain.c_str(), &end);
  if (end == nullptr || *end != '\0') {
    return std::nullopt;
  }
  return v;
}

std::string without(std::string s, char c) {
  s.erase(std::remove(s.begin(), s.end(), c), s.end());
  return s;
}

}  // namespace

std::string normalizeDigits(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    const auto c = static_cast<unsigned char>(text[i]);
    if ((c == kLeadArabic || c == kLeadPersian) && i + 1 < text.size()) {
      const auto next = static_cast<unsigned char>(text[i + 1]);
      if (c == kLeadPersian && next >= 0xB0 && next <= 0xB9) {
        out.push_back(static_cast<char>('0' + (next - 0xB0)));
        ++i;
        continue;
      }
      if (c == kLeadArabic && next >= 0xA0 && next <= 0xA9) {
        out.push_back(static_cast<char>('0' + (next - 0xA0)));
        ++i;
        continue;
      }
      if (c == kLeadArabic && next == 0xAB) {
        out.push_back('.');
        ++i;
        continue;
      }
      if (c == kLeadArabic && next == 0xAC) {
        out.push_back(',');
        ++i;
        continue;
      }
    }
    out.push_back(text[i]);
  }
  return out;
}

std::optional<double> parseNumber(const std::string& token,
                                  bool decimal_comma) {
  std::string s = without(without(token, '\''), ' ');
  if (s.empty()) {
    return std::nullopt;
  }

  const auto dots = std::count(s.begin(), s.end(), '.');
  const auto commas = std::count(s.begin(), s.end(), ',');

  if (dots > 0 && commas > 0) {
    const std::size_t last = std::max(s.rfind('.'), s.rfind(','));
    const char decimal = s[last];
    const char thousands = decimal == '.' ? ',' : '.';
    if (std::count(s.begin(), s.end(), decimal) != 1) {
      return std::nullopt;
    }
    if (!isGrouped(s.substr(0, last), thousands)) {
      return std::nullopt;
    }
    std::string plain = without(s, thousands);
    std::replace(plain.begin(), plain.end(), decimal, '.');
    return toDouble(plain);
  }

  if (commas > 0) {
    if (decimal_comma && commas == 1) {
      std::replace(s.begin(), s.end(), ',', '.');
      return toDouble(s);
    }
    if (isGrouped(s, ',')) {
      return toDouble(without(s, ','));
    }
    return std::nullopt;
  }

  if (dots > 1) {
    if (decimal_comma && isGrouped(s, '.')) {
      return toDouble(without(s, '.'));
    }
    return std::nullopt;
  }

  return toDouble(s);
}

std::vector<double> parseNumberList(const std::string& text,
                                    bool decimal_comma) {
  static const std::regex kToken(kNumberTokenPattern);

  std::vector<double> values;
  for (auto it = std::sregex_iterator(text.begin(), text.end(), kToken);
       it != std::sregex_iterator(); ++it) {
    const std::string token = it->str();
    if (auto v = parseNumber(token, decimal_comma)) {
      values.push_back(*v);
      continue;
    }
    if (token.find(',') == std::string::npos) {
      continue;
    }
    std::size_t start = 0;
    while (start <= token.size()) {
      const std::size_t pos = token.find(',', start);
      const std::string part = token.substr(
          start, pos == std::string::npos ? std::string::npos : pos - start);
      if (auto v = parseNumber(part, decimal_comma)) {
        values.push_back(*v);
      }
      if (pos == std::string::npos) {
        break;
      }
      start = pos + 1;
    }
  }
  return values;
}

}  // namespace sigtrader
