// LunarBatch host process for a presentation layer.
// Protocol:
//   stdin:  newline-delimited JSON commands (see lb/commands/CommandProcessor.hpp)
//   stdout: one JSON reply per command, newline-terminated
//   stderr: diagnostics
//
// Startup: config -> data dir -> recipes.json -> update check -> command loop.

#include "lb/commands/CommandProcessor.hpp"
#include "lb/config/AppConfig.hpp"
#include "lb/session/RecipeSession.hpp"
#include "lb/storage/AppDataDir.hpp"
#include "lb/storage/RecipeFile.hpp"
#include "lb/update/ReleaseFeed.hpp"
#include "lb/update/UpdateChecker.hpp"

#include <cstdio>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

// False at EOF with nothing read.
static bool readLine(std::string& line) {
  line.clear();
  int c;
  while ((c = std::fgetc(stdin)) != EOF && c != '\n') {
    line += static_cast<char>(c);
  }
  return !(c == EOF && line.empty());
}

static void writeReply(const std::string& json) {
  std::fwrite(json.data(), 1, json.size(), stdout);
  std::fputc('\n', stdout);
  std::fflush(stdout);
}

static bool isBlank(const std::string& s) {
  for (char c : s) {
    if (c != ' ' && c != '\t' && c != '\r') return false;
  }
  return true;
}

int main() {
  // ---- 1. Configuration ----
  lb::AppConfig cfg;
  const bool configOk = lb::resolveConfig(cfg);
  const std::string& dataDir = cfg.dataDir;

  if (dataDir.empty()) {
    std::fprintf(stderr, "[host] no data directory (set HOME or LUNARBATCH_DATA_DIR)\n");
    return 1;
  }
  if (!lb::ensureDirectory(dataDir)) {
    // Keep going: load falls back to an empty collection, saves report errors.
    std::fprintf(stderr, "[host] data directory %s unavailable\n", dataDir.c_str());
  }

  // ---- 2. Session ----
  lb::RecipeSession session{lb::RecipeFile(lb::joinPath(dataDir, cfg.recipesFile))};
  lb::LoadResult loaded = session.open();
  if (loaded.ok) {
    std::fprintf(stderr, "[host] %zu recipes from %s\n",
                 loaded.loaded, session.file().path().c_str());
  }

  lb::CommandProcessor cp(session);

  // ---- 3. Update check (advisory, after the core is ready) ----
  lb::UpdateChecker checker(cfg.updates);
  std::unique_ptr<lb::ReleaseFeed> feed;
  if (!cfg.updates.feedPath.empty()) {
    feed = std::make_unique<lb::FileReleaseFeed>(cfg.updates.feedPath);
  }
  cp.setUpdateCheck(&checker, feed.get());

  // First reply line: config/load problems and update status for the UI.
  writeReply(cp.readyEvent(loaded, configOk, cfg.updates.enabled));

  // ---- 4. Command loop ----
  std::string line;
  while (readLine(line)) {
    if (isBlank(line)) continue;
    lb::CmdResult r = cp.applyJsonText(line);
    writeReply(r.response);
  }

  return 0;
}
