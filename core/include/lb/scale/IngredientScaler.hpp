#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace lb {

enum class LineKind : std::uint8_t {
  Quantity = 1,  // leading number followed by free text ("2 cups flour")
  Text = 2       // anything else, passed through untouched
};

struct IngredientLine {
  LineKind kind{LineKind::Text};
  double amount{0.0};     // Quantity only
  std::string remainder;  // Quantity only: tokens after the number, single-spaced
  std::string text;       // the trimmed source line
};

// Classify one ingredient line. Only plain decimals are quantities:
// "2", "1.5", "1,000", "-3". Fractions ("1/2") and words are Text.
IngredientLine parseIngredientLine(const std::string& line);

// "<amount with two decimals> <remainder>" for Quantity, the line as-is for Text.
std::string formatIngredientLine(const IngredientLine& line, double factor);

// Scale every quantity line by factor. Blank lines are dropped.
std::string scaleIngredients(const std::string& ingredients, double factor);

// Split on '\n', trim each line, drop the empty ones.
std::vector<std::string> splitIngredientLines(const std::string& ingredients);

} // namespace lb
