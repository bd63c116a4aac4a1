#pragma once
#include "lb/config/AppConfig.hpp"
#include "lb/update/ReleaseFeed.hpp"

#include <cstdint>
#include <string>

namespace lb {

enum class UpdateStatus : std::uint8_t {
  UpToDate = 1,
  UpdateAvailable = 2,
  Unavailable = 3   // feed missing, unreachable or unparseable
};

struct UpdateInfo {
  UpdateStatus status{UpdateStatus::Unavailable};
  std::string currentVersion;
  std::string latestVersion;   // tag without the leading 'v'
  std::string releaseUrl;      // page to open if the user wants the update
};

// <0, 0, >0 like strcmp. Dot-separated segments; two numeric segments
// compare as numbers, anything else compares as text. Missing segments
// count as "0" ("1.0" == "1.0.0").
int compareVersions(const std::string& a, const std::string& b);

// Pulls "tag_name" out of a release document and strips leading 'v's.
bool parseReleaseTag(const std::string& body, std::string& version);

// Advisory only: never throws, never touches recipe state. Failures are
// logged and reported as Unavailable.
class UpdateChecker {
public:
  explicit UpdateChecker(const UpdateCheckConfig& config);

  UpdateInfo check(ReleaseFeed& feed) const;

  std::string releasePageUrl() const;

private:
  UpdateCheckConfig config_;
};

} // namespace lb
