#include "lb/scale/IngredientScaler.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <utility>

namespace lb {

namespace {

bool isAsciiSpace(unsigned char c) {
  // \x1c-\x1f are the information separators, which count as whitespace too
  return c == ' ' || (c >= '\t' && c <= '\r') || (c >= 0x1c && c <= 0x1f);
}

// Byte length of the whitespace character starting at s[i], 0 if none.
// Multi-byte forms are the UTF-8 encodings of U+0085, U+00A0, U+1680,
// U+2000..U+200A, U+2028, U+2029, U+202F, U+205F and U+3000.
std::size_t spaceWidthAt(const std::string& s, std::size_t i) {
  const std::size_t n = s.size() - i;
  if (n == 0) return 0;
  auto b = [&s, i](std::size_t k) { return static_cast<unsigned char>(s[i + k]); };

  if (isAsciiSpace(b(0))) return 1;
  if (n >= 2 && b(0) == 0xC2 && (b(1) == 0x85 || b(1) == 0xA0)) return 2;
  if (n < 3) return 0;
  if (b(0) == 0xE1 && b(1) == 0x9A && b(2) == 0x80) return 3;
  if (b(0) == 0xE2 && b(1) == 0x80) {
    const unsigned char c = b(2);
    if ((c >= 0x80 && c <= 0x8A) || c == 0xA8 || c == 0xA9 || c == 0xAF) return 3;
  }
  if (b(0) == 0xE2 && b(1) == 0x81 && b(2) == 0x9F) return 3;
  if (b(0) == 0xE3 && b(1) == 0x80 && b(2) == 0x80) return 3;
  return 0;
}

// Byte length of the whitespace character ending just before s[e], 0 if none.
std::size_t spaceWidthBefore(const std::string& s, std::size_t e) {
  for (std::size_t w = 1; w <= 3 && w <= e; ++w) {
    if (spaceWidthAt(s, e - w) == w) return w;
  }
  return 0;
}

bool isDigit(char c) {
  return c >= '0' && c <= '9';
}

std::string trim(const std::string& s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  std::size_t w;
  while (b < e && (w = spaceWidthAt(s, b)) != 0) b += w;
  while (e > b && (w = spaceWidthBefore(s, e)) != 0) e -= w;
  return s.substr(b, e - b);
}

std::vector<std::string> splitTokens(const std::string& s) {
  std::vector<std::string> out;
  std::size_t i = 0;
  std::size_t w;
  while (i < s.size()) {
    while (i < s.size() && (w = spaceWidthAt(s, i)) != 0) i += w;
    std::size_t start = i;
    while (i < s.size() && spaceWidthAt(s, i) == 0) ++i;
    if (i > start) out.push_back(s.substr(start, i - start));
  }
  return out;
}

// Shape test on the token with '.' and ',' removed: digits, or '-' then digits.
bool looksNumeric(const std::string& token) {
  std::string bare;
  for (char c : token) {
    if (c != '.' && c != ',') bare += c;
  }
  std::size_t i = (!bare.empty() && bare[0] == '-') ? 1 : 0;
  if (i >= bare.size()) return false;
  for (; i < bare.size(); ++i) {
    if (!isDigit(bare[i])) return false;
  }
  return true;
}

// Parse with ',' dropped as a thousands separator. The whole string must be consumed.
bool parseAmount(const std::string& token, double& out) {
  std::string s;
  for (char c : token) {
    if (c != ',') s += c;
  }
  if (s.empty()) return false;

  errno = 0;
  char* end = nullptr;
  double v = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size()) return false;
  if (errno == ERANGE) return false;
  out = v;
  return true;
}

} // anonymous namespace

std::vector<std::string> splitIngredientLines(const std::string& ingredients) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start <= ingredients.size()) {
    std::size_t nl = ingredients.find('\n', start);
    if (nl == std::string::npos) nl = ingredients.size();
    std::string line = trim(ingredients.substr(start, nl - start));
    if (!line.empty()) lines.push_back(std::move(line));
    start = nl + 1;
  }
  return lines;
}

IngredientLine parseIngredientLine(const std::string& line) {
  IngredientLine result;
  result.text = trim(line);

  auto tokens = splitTokens(result.text);
  if (tokens.empty() || !looksNumeric(tokens[0])) return result;

  double amount = 0.0;
  if (!parseAmount(tokens[0], amount)) return result;  // e.g. "1.2.3"

  result.kind = LineKind::Quantity;
  result.amount = amount;
  for (std::size_t i = 1; i < tokens.size(); ++i) {
    if (i > 1) result.remainder += ' ';
    result.remainder += tokens[i];
  }
  return result;
}

std::string formatIngredientLine(const IngredientLine& line, double factor) {
  if (line.kind != LineKind::Quantity) return line.text;

  const double scaled = line.amount * factor;
  int n = std::snprintf(nullptr, 0, "%.2f", scaled);
  if (n < 0) return line.text;

  std::string out(static_cast<std::size_t>(n), '\0');
  std::snprintf(&out[0], out.size() + 1, "%.2f", scaled);
  out += ' ';
  out += line.remainder;
  return out;
}

std::string scaleIngredients(const std::string& ingredients, double factor) {
  std::string out;
  bool first = true;
  for (const auto& l : splitIngredientLines(ingredients)) {
    if (!first) out += '\n';
    first = false;
    out += formatIngredientLine(parseIngredientLine(l), factor);
  }
  return out;
}

} // namespace lb
