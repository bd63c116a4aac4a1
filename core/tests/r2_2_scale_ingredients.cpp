// R2.2: scaleIngredients over a whole ingredient block

#include "lb/scale/IngredientScaler.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
  // ---- Test 1: Every leading number scales ----
  {
    std::string out = lb::scaleIngredients("2 cups flour\n1 tsp salt", 2.0);
    requireTrue(out == "4.00 cups flour\n2.00 tsp salt", "both quantities doubled");
    std::printf("  Test 1 (basic): PASS\n");
  }

  // ---- Test 2: Negative, text and fraction lines ----
  {
    requireTrue(lb::scaleIngredients("-3 eggs", 2.0) == "-6.00 eggs", "negative scales");
    requireTrue(lb::scaleIngredients("a pinch of salt", 2.0) == "a pinch of salt",
                "text passes through");
    requireTrue(lb::scaleIngredients("1/2 cup sugar", 2.0) == "1/2 cup sugar",
                "fraction passes through");
    std::printf("  Test 2 (pass-through): PASS\n");
  }

  // ---- Test 3: Mixed block, blank lines dropped ----
  {
    std::string in = "\n  2 cups flour  \n\n   \na pinch of salt\n1/2 cup sugar\n3 eggs\n";
    std::string out = lb::scaleIngredients(in, 0.5);
    requireTrue(out == "1.00 cups flour\na pinch of salt\n1/2 cup sugar\n1.50 eggs",
                "mixed block");
    std::printf("  Test 3 (mixed block): PASS\n");
  }

  // ---- Test 4: Factor 1 only normalizes numbers ----
  {
    std::string in = "2 cups flour\nsalt\n1,000 g water\n0.333 cup milk";
    std::string out = lb::scaleIngredients(in, 1.0);
    requireTrue(out == "2.00 cups flour\nsalt\n1000.00 g water\n0.33 cup milk",
                "identity factor formats quantities");
    requireTrue(lb::scaleIngredients(out, 1.0) == out, "second pass is a no-op");
    std::printf("  Test 4 (identity): PASS\n");
  }

  // ---- Test 5: Degenerate input ----
  {
    requireTrue(lb::scaleIngredients("", 2.0).empty(), "empty in, empty out");
    requireTrue(lb::scaleIngredients("\n\n  \n", 2.0).empty(), "blank lines only");
    requireTrue(lb::scaleIngredients("1.2.3 widgets\n2 x", 3.0) == "1.2.3 widgets\n6.00 x",
                "bad number line kept, rest scaled");
    requireTrue(lb::scaleIngredients("4 cups\r\n2 eggs\r\n", 0.25) == "1.00 cups\n0.50 eggs",
                "CRLF input");
    requireTrue(lb::scaleIngredients("2\xc2\xa0" "cups flour", 2.0) == "4.00 cups flour",
                "NBSP after the amount");
    requireTrue(lb::scaleIngredients("\xc2\xa0" "3 eggs\n\xc2\xa0\n1 tsp salt", 2.0) ==
                    "6.00 eggs\n2.00 tsp salt",
                "leading NBSP, NBSP-only line dropped");
    std::printf("  Test 5 (degenerate): PASS\n");
  }

  // ---- Test 6: splitIngredientLines ----
  {
    auto lines = lb::splitIngredientLines("  a \n\n b\n");
    requireTrue(lines.size() == 2, "2 lines");
    requireTrue(lines[0] == "a" && lines[1] == "b", "trimmed");
    std::printf("  Test 6 (split): PASS\n");
  }

  std::printf("R2.2 scale_ingredients: ALL PASS\n");
  return 0;
}
