#pragma once
#include "lb/errors/OpResult.hpp"
#include "lb/recipe/RecipeStore.hpp"

#include <string>

namespace lb {

struct LoadResult {
  bool ok{true};
  OpError err{};
  bool existed{false};     // false: no file yet, store left empty
  std::size_t loaded{0};
};

// The recipes.json file. Reads and writes the whole collection at once.
class RecipeFile {
public:
  explicit RecipeFile(std::string path);

  const std::string& path() const { return path_; }
  bool exists() const;

  // Replaces the store's contents with the file's. A missing file gives an
  // empty store. Unreadable or malformed data also gives an empty store and
  // a StorageRead error.
  LoadResult load(RecipeStore& store) const;

  // Writes the whole store, replacing the file. StorageWrite on failure;
  // the store itself is never touched.
  OpResult save(const RecipeStore& store) const;

private:
  std::string path_;
};

} // namespace lb
