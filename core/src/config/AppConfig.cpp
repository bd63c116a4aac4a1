#include "lb/config/AppConfig.hpp"
#include "lb/storage/AppDataDir.hpp"

#include <rapidjson/document.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace lb {

namespace {

void readString(const rapidjson::Value& obj, const char* key, std::string& out) {
  auto it = obj.FindMember(key);
  if (it != obj.MemberEnd() && it->value.IsString())
    out.assign(it->value.GetString(), it->value.GetStringLength());
}

void readBool(const rapidjson::Value& obj, const char* key, bool& out) {
  auto it = obj.FindMember(key);
  if (it != obj.MemberEnd() && it->value.IsBool())
    out = it->value.GetBool();
}

} // anonymous namespace

bool parseAppConfig(const std::string& json, AppConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  readString(doc, "dataDir", out.dataDir);
  readString(doc, "recipesFile", out.recipesFile);

  if (doc.HasMember("updates") && doc["updates"].IsObject()) {
    const auto& u = doc["updates"];
    readBool(u, "enabled", out.updates.enabled);
    readString(u, "currentVersion", out.updates.currentVersion);
    readString(u, "repository", out.updates.repository);
    readString(u, "feedPath", out.updates.feedPath);
  }

  return true;
}

bool loadAppConfigFile(const std::string& path, AppConfig& out) {
  std::error_code ec;
  if (path.empty() || !std::filesystem::exists(path, ec)) return true;

  std::ifstream f(path, std::ios::binary);
  if (!f) {
    std::fprintf(stderr, "[AppConfig] cannot open %s, using defaults\n", path.c_str());
    return false;
  }
  std::ostringstream ss;
  ss << f.rdbuf();

  if (!parseAppConfig(ss.str(), out)) {
    std::fprintf(stderr, "[AppConfig] %s is not a JSON object, using defaults\n",
                 path.c_str());
    return false;
  }
  return true;
}

void applyEnvironment(AppConfig& cfg) {
  const char* dir = std::getenv("LUNARBATCH_DATA_DIR");
  if (dir && *dir) cfg.dataDir = dir;
}

std::string resolveDataDir(const AppConfig& cfg) {
  if (!cfg.dataDir.empty()) return cfg.dataDir;
  return defaultAppDataDir();
}

bool resolveConfig(AppConfig& out) {
  AppConfig cfg;
  applyEnvironment(cfg);

  bool fileOk = true;
  const char* cfgPath = std::getenv("LUNARBATCH_CONFIG");
  if (cfgPath && *cfgPath) {
    fileOk = loadAppConfigFile(cfgPath, cfg);
  } else {
    const std::string dir = resolveDataDir(cfg);
    if (!dir.empty()) fileOk = loadAppConfigFile(joinPath(dir, kConfigFileName), cfg);
  }

  applyEnvironment(cfg);
  cfg.dataDir = resolveDataDir(cfg);
  out = std::move(cfg);
  return fileOk;
}

} // namespace lb
