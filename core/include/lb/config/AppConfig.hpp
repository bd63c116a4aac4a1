#pragma once
#include "lb/storage/AppDataDir.hpp"

#include <string>

namespace lb {

inline constexpr const char* kAppVersion = "1.0.0";
inline constexpr const char* kReleaseRepo = "CireWire/symmetrical-doodle";
inline constexpr const char* kConfigFileName = "lunarbatch.json";

struct UpdateCheckConfig {
  bool enabled{true};
  std::string currentVersion{kAppVersion};
  std::string repository{kReleaseRepo};   // owner/name, used for the release page URL
  std::string feedPath;                   // release document on disk; empty = no feed
};

struct AppConfig {
  std::string dataDir;                    // empty = defaultAppDataDir()
  std::string recipesFile{kRecipesFileName};
  UpdateCheckConfig updates;
};

// Overlay keys from a JSON object onto out. Unknown keys are ignored, keys
// of the wrong type keep their current value. Returns false (out unchanged)
// if json is not an object.
//
//   {"dataDir": "...", "recipesFile": "...",
//    "updates": {"enabled": true, "currentVersion": "1.0.0",
//                "repository": "owner/name", "feedPath": "..."}}
bool parseAppConfig(const std::string& json, AppConfig& out);

// Reads parseAppConfig() input from a file. A missing file is not an error.
// A malformed file is logged and ignored.
bool loadAppConfigFile(const std::string& path, AppConfig& out);

// LUNARBATCH_DATA_DIR overrides dataDir.
void applyEnvironment(AppConfig& cfg);

// dataDir if set, else the per-user default.
std::string resolveDataDir(const AppConfig& cfg);

// Startup configuration, later sources winning:
//   1. defaults
//   2. the config file: $LUNARBATCH_CONFIG, else <data dir>/lunarbatch.json,
//      where the data dir already honours LUNARBATCH_DATA_DIR
//   3. the environment
// On return out.dataDir is resolved (empty if no base directory exists).
// False if the config file was unreadable or malformed; out then holds
// everything but the file's values.
bool resolveConfig(AppConfig& out);

} // namespace lb
