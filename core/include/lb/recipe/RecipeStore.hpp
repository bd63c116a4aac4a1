#pragma once
#include "lb/errors/OpResult.hpp"
#include "lb/recipe/Recipe.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace lb {

// Insertion-ordered recipe collection. Does not persist by itself;
// see RecipeFile for the on-disk side.
class RecipeStore {
public:
  // Appends a recipe. Fails with DuplicateName if the name is taken.
  OpResult add(const RecipeFields& fields);

  // Overwrites all fields of an existing recipe in place. The new name is
  // not checked against the other recipes.
  OpResult update(RecipeId id, const RecipeFields& fields);

  OpResult remove(RecipeId id);
  void clear();

  const Recipe* get(RecipeId id) const;
  // First recipe with exactly this name, or nullptr.
  const Recipe* findByName(const std::string& name) const;

  const std::vector<Recipe>& recipes() const { return recipes_; }
  std::size_t count() const { return recipes_.size(); }

  // True if renames left two recipes sharing a name.
  bool hasDuplicateNames() const;

  // Serialization: a JSON array of {name, ingredients, instructions, servings}.
  std::string toJSON() const;
  // Replaces the contents on success. On failure returns false, leaves the
  // store untouched and, if given, fills *error.
  bool loadJSON(const std::string& json, std::string* error = nullptr);

private:
  Recipe* find(RecipeId id);

  std::vector<Recipe> recipes_;
  RecipeId nextId_{1};
};

} // namespace lb
