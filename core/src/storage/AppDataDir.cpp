#include "lb/storage/AppDataDir.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace lb {

namespace {

std::string envOrEmpty(const char* name) {
  const char* v = std::getenv(name);
  return (v && *v) ? std::string(v) : std::string();
}

} // anonymous namespace

std::string defaultAppDataDir() {
  std::filesystem::path base;
#ifdef _WIN32
  base = envOrEmpty("APPDATA");
#else
  std::string xdg = envOrEmpty("XDG_DATA_HOME");
  if (!xdg.empty()) {
    base = xdg;
  } else {
    std::string home = envOrEmpty("HOME");
    if (!home.empty()) base = std::filesystem::path(home) / ".local" / "share";
  }
#endif
  if (base.empty()) return {};
  return (base / kAppDirName).string();
}

bool ensureDirectory(const std::string& dir) {
  if (dir.empty()) return false;
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    std::fprintf(stderr, "[AppDataDir] cannot create %s: %s\n",
                 dir.c_str(), ec.message().c_str());
    return false;
  }
  return std::filesystem::is_directory(dir, ec);
}

std::string joinPath(const std::string& dir, const std::string& file) {
  if (dir.empty()) return file;
  return (std::filesystem::path(dir) / file).string();
}

} // namespace lb
