#pragma once
#include <string>

namespace lb {

inline constexpr const char* kAppDirName = "LunarBatch";
inline constexpr const char* kRecipesFileName = "recipes.json";

// Per-user data directory:
//   Windows: %APPDATA%\LunarBatch
//   others:  $XDG_DATA_HOME/LunarBatch, else $HOME/.local/share/LunarBatch
// Returns an empty string when no base directory can be determined.
std::string defaultAppDataDir();

// Creates dir (and parents) if missing. False on failure.
bool ensureDirectory(const std::string& dir);

// dir + separator + file
std::string joinPath(const std::string& dir, const std::string& file);

} // namespace lb
