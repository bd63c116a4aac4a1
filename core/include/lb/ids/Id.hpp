#pragma once
#include <cstdint>

namespace lb {

// Store-local handle for a recipe. Assigned on add/load, never persisted.
using RecipeId = std::uint32_t;

inline constexpr RecipeId kInvalidRecipeId = 0;

} // namespace lb
