#include "lb/update/UpdateChecker.hpp"

#include <rapidjson/document.h>

#include <cstdio>
#include <vector>

namespace lb {

namespace {

std::vector<std::string> splitDots(const std::string& s) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (true) {
    std::size_t dot = s.find('.', start);
    if (dot == std::string::npos) {
      out.push_back(s.substr(start));
      break;
    }
    out.push_back(s.substr(start, dot - start));
    start = dot + 1;
  }
  return out;
}

bool allDigits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

// Numeric compare without overflow: strip leading zeros, then length, then text.
int compareDigits(const std::string& a, const std::string& b) {
  auto na = a.find_first_not_of('0');
  auto nb = b.find_first_not_of('0');
  std::string ta = (na == std::string::npos) ? "" : a.substr(na);
  std::string tb = (nb == std::string::npos) ? "" : b.substr(nb);
  if (ta.size() != tb.size()) return ta.size() < tb.size() ? -1 : 1;
  int c = ta.compare(tb);
  return (c < 0) ? -1 : (c > 0 ? 1 : 0);
}

} // anonymous namespace

int compareVersions(const std::string& a, const std::string& b) {
  auto sa = splitDots(a);
  auto sb = splitDots(b);
  std::size_t n = sa.size() > sb.size() ? sa.size() : sb.size();
  for (std::size_t i = 0; i < n; ++i) {
    const std::string x = i < sa.size() ? sa[i] : "0";
    const std::string y = i < sb.size() ? sb[i] : "0";
    int c;
    if (allDigits(x) && allDigits(y)) {
      c = compareDigits(x, y);
    } else {
      int t = x.compare(y);
      c = (t < 0) ? -1 : (t > 0 ? 1 : 0);
    }
    if (c != 0) return c;
  }
  return 0;
}

bool parseReleaseTag(const std::string& body, std::string& version) {
  rapidjson::Document doc;
  doc.Parse(body.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  auto it = doc.FindMember("tag_name");
  if (it == doc.MemberEnd() || !it->value.IsString()) return false;

  std::string tag(it->value.GetString(), it->value.GetStringLength());
  auto first = tag.find_first_not_of('v');
  if (first == std::string::npos) return false;
  version = tag.substr(first);
  return true;
}

UpdateChecker::UpdateChecker(const UpdateCheckConfig& config) : config_(config) {}

std::string UpdateChecker::releasePageUrl() const {
  return "https://github.com/" + config_.repository + "/releases/latest";
}

UpdateInfo UpdateChecker::check(ReleaseFeed& feed) const {
  UpdateInfo info;
  info.currentVersion = config_.currentVersion;

  std::string body;
  if (!feed.fetchLatest(body)) {
    std::fprintf(stderr, "[UpdateChecker] Error checking for updates: feed unavailable\n");
    return info;
  }

  std::string latest;
  if (!parseReleaseTag(body, latest)) {
    std::fprintf(stderr, "[UpdateChecker] Error checking for updates: no tag_name\n");
    return info;
  }

  info.latestVersion = latest;
  if (compareVersions(latest, config_.currentVersion) > 0) {
    info.status = UpdateStatus::UpdateAvailable;
    info.releaseUrl = releasePageUrl();
    std::fprintf(stderr, "[UpdateChecker] new version %s available (running %s)\n",
                 latest.c_str(), config_.currentVersion.c_str());
  } else {
    info.status = UpdateStatus::UpToDate;
  }
  return info;
}

} // namespace lb
