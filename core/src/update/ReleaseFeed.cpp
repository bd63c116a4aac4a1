#include "lb/update/ReleaseFeed.hpp"

#include <fstream>
#include <sstream>

namespace lb {

bool StaticReleaseFeed::fetchLatest(std::string& body) {
  if (!reachable_) return false;
  body = body_;
  return true;
}

bool FileReleaseFeed::fetchLatest(std::string& body) {
  std::ifstream f(path_, std::ios::binary);
  if (!f) return false;
  std::ostringstream ss;
  ss << f.rdbuf();
  if (f.bad()) return false;
  body = ss.str();
  return true;
}

} // namespace lb
