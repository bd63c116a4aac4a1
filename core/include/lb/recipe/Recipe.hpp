#pragma once
#include "lb/ids/Id.hpp"

#include <string>

namespace lb {

// User-editable part of a recipe.
struct RecipeFields {
  std::string name;
  std::string ingredients;   // one ingredient per line, free text
  std::string instructions;
  int servings{1};
};

struct Recipe {
  RecipeId id{kInvalidRecipeId};

  std::string name;          // display name and lookup key (case-sensitive)
  std::string ingredients;
  std::string instructions;
  int servings{1};

  RecipeFields fields() const {
    return RecipeFields{name, ingredients, instructions, servings};
  }
};

} // namespace lb
