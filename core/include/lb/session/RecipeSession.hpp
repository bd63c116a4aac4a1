#pragma once
#include "lb/errors/OpResult.hpp"
#include "lb/recipe/RecipeStore.hpp"
#include "lb/storage/RecipeFile.hpp"

#include <string>
#include <vector>

namespace lb {

struct RecipeSummary {
  RecipeId id{kInvalidRecipeId};
  std::string name;
  int servings{1};
};

struct ScaleResult {
  bool ok{true};
  OpError err{};
  RecipeId id{kInvalidRecipeId};
  double factor{1.0};
  int servings{0};          // serving count now stored on the recipe
  std::string ingredients;  // scaled text, also stored on the recipe
};

// What the presentation layer talks to. Owns the recipe collection and the
// "currently selected recipe". Confirmed edits (create, update, delete) are
// written to the file straight away; scaling is not.
class RecipeSession {
public:
  explicit RecipeSession(RecipeFile file);

  // Loads the file into the store and clears the selection. A missing file
  // is an empty collection; a bad file is an empty collection plus an error.
  LoadResult open();

  std::vector<RecipeSummary> listRecipes() const;
  const Recipe* getRecipe(const std::string& name) const;

  // Selection drives createOrUpdateRecipe: with a selection it edits that
  // recipe, without one it creates a new recipe.
  bool selectRecipe(const std::string& name);
  void newRecipe();
  const Recipe* selected() const;

  // Trims text fields, validates, then creates or updates and saves.
  // A failed save keeps the change in memory and sets OpResult::warning.
  OpResult createOrUpdateRecipe(const RecipeFields& fields);

  OpResult deleteRecipe(const std::string& name);

  // factor = newServings / stored servings. Rewrites the recipe's
  // ingredients and servings in memory only; call saveAll() to keep them.
  ScaleResult scaleRecipe(const std::string& name, int newServings);

  OpResult saveAll();

  const RecipeStore& store() const { return store_; }
  const RecipeFile& file() const { return file_; }

private:
  static OpResult validate(const RecipeFields& fields);
  void persist(OpResult& r);

  RecipeFile file_;
  RecipeStore store_;
  RecipeId selected_{kInvalidRecipeId};
};

} // namespace lb
