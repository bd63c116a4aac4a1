#pragma once
#include <string>
#include <utility>

namespace lb {

// Source of the "latest release" document, e.g. {"tag_name": "v1.2.0", ...}.
class ReleaseFeed {
public:
  virtual ~ReleaseFeed() = default;
  // Fills body and returns true on success. False on any failure.
  virtual bool fetchLatest(std::string& body) = 0;
};

// Fixed document; also used to simulate an unreachable feed.
class StaticReleaseFeed : public ReleaseFeed {
public:
  explicit StaticReleaseFeed(std::string body, bool reachable = true)
    : body_(std::move(body)), reachable_(reachable) {}

  bool fetchLatest(std::string& body) override;

private:
  std::string body_;
  bool reachable_;
};

// Release document cached on disk by some other process.
class FileReleaseFeed : public ReleaseFeed {
public:
  explicit FileReleaseFeed(std::string path) : path_(std::move(path)) {}

  bool fetchLatest(std::string& body) override;

private:
  std::string path_;
};

} // namespace lb
