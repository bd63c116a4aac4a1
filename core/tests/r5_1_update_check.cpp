// R5.1: UpdateChecker: version compare, tag parsing, feeds

#include "lb/update/UpdateChecker.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
  // ---- Test 1: compareVersions ----
  {
    requireTrue(lb::compareVersions("1.0.0", "1.0.0") == 0, "equal");
    requireTrue(lb::compareVersions("1.0.1", "1.0.0") > 0, "patch newer");
    requireTrue(lb::compareVersions("1.2.0", "1.10.0") < 0, "numeric, not text");
    requireTrue(lb::compareVersions("2.0", "1.9.9") > 0, "major wins");
    requireTrue(lb::compareVersions("1.0", "1.0.0") == 0, "missing segment is 0");
    requireTrue(lb::compareVersions("1.0.0", "1.0.0.1") < 0, "extra segment");
    requireTrue(lb::compareVersions("01.0", "1.0") == 0, "leading zeros");
    requireTrue(lb::compareVersions("1.0.0-rc1", "1.0.0-beta") > 0, "text segment compare");
    requireTrue(lb::compareVersions("99999999999999999999.0", "1.0") > 0, "no overflow");
    std::printf("  Test 1 (compareVersions): PASS\n");
  }

  // ---- Test 2: parseReleaseTag ----
  {
    std::string v;
    requireTrue(lb::parseReleaseTag(R"({"tag_name":"v1.2.0","name":"x"})", v), "tag parsed");
    requireTrue(v == "1.2.0", "leading v stripped");
    requireTrue(lb::parseReleaseTag(R"({"tag_name":"1.3"})", v) && v == "1.3", "no v");
    requireTrue(!lb::parseReleaseTag(R"({"name":"x"})", v), "missing tag_name");
    requireTrue(!lb::parseReleaseTag(R"({"tag_name":3})", v), "non-string tag");
    requireTrue(!lb::parseReleaseTag(R"({"tag_name":"v"})", v), "empty version");
    requireTrue(!lb::parseReleaseTag("<html>rate limited</html>", v), "not JSON");
    std::printf("  Test 2 (parseReleaseTag): PASS\n");
  }

  lb::UpdateCheckConfig cfg;
  cfg.currentVersion = "1.0.0";
  cfg.repository = "owner/repo";
  lb::UpdateChecker checker(cfg);

  // ---- Test 3: Newer release ----
  {
    lb::StaticReleaseFeed feed(R"({"tag_name":"v1.1.0"})");
    auto info = checker.check(feed);
    requireTrue(info.status == lb::UpdateStatus::UpdateAvailable, "update available");
    requireTrue(info.latestVersion == "1.1.0", "latest version");
    requireTrue(info.currentVersion == "1.0.0", "current version");
    requireTrue(info.releaseUrl == "https://github.com/owner/repo/releases/latest", "url");
    std::printf("  Test 3 (newer): PASS\n");
  }

  // ---- Test 4: Same or older release ----
  {
    lb::StaticReleaseFeed same(R"({"tag_name":"v1.0.0"})");
    requireTrue(checker.check(same).status == lb::UpdateStatus::UpToDate, "same is up to date");

    lb::StaticReleaseFeed older(R"({"tag_name":"v0.9.5"})");
    auto info = checker.check(older);
    requireTrue(info.status == lb::UpdateStatus::UpToDate, "older is up to date");
    requireTrue(info.releaseUrl.empty(), "no url when up to date");
    std::printf("  Test 4 (not newer): PASS\n");
  }

  // ---- Test 5: Failures are Unavailable ----
  {
    lb::StaticReleaseFeed down("", false);
    requireTrue(checker.check(down).status == lb::UpdateStatus::Unavailable, "unreachable");

    lb::StaticReleaseFeed junk("{}");
    requireTrue(checker.check(junk).status == lb::UpdateStatus::Unavailable, "no tag");

    lb::FileReleaseFeed missing("r5_1_no_such_file.json");
    requireTrue(checker.check(missing).status == lb::UpdateStatus::Unavailable, "missing file");
    std::printf("  Test 5 (unavailable): PASS\n");
  }

  // ---- Test 6: File feed ----
  {
    const std::string path = "r5_1_latest.json";
    { std::ofstream f(path); f << R"({"tag_name":"v2.0.0","html_url":"x"})"; }
    lb::FileReleaseFeed feed(path);
    auto info = checker.check(feed);
    requireTrue(info.status == lb::UpdateStatus::UpdateAvailable, "file feed newer");
    requireTrue(info.latestVersion == "2.0.0", "file feed version");
    std::filesystem::remove(path);
    std::printf("  Test 6 (file feed): PASS\n");
  }

  std::printf("R5.1 update_check: ALL PASS\n");
  return 0;
}
