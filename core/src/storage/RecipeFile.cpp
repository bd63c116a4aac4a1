#include "lb/storage/RecipeFile.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace lb {

RecipeFile::RecipeFile(std::string path) : path_(std::move(path)) {}

bool RecipeFile::exists() const {
  std::error_code ec;
  return std::filesystem::is_regular_file(path_, ec);
}

LoadResult RecipeFile::load(RecipeStore& store) const {
  LoadResult result;

  auto fail = [&](const std::string& why) {
    std::fprintf(stderr, "[RecipeFile] load %s: %s\n", path_.c_str(), why.c_str());
    store.clear();
    result.ok = false;
    result.err.kind = ErrorKind::StorageRead;
    result.err.code = errorCode(ErrorKind::StorageRead);
    result.err.message = "Error loading recipes: " + why;
    result.loaded = 0;
    return result;
  };

  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    if (ec) return fail(ec.message());
    store.clear();
    return result;
  }
  result.existed = true;

  std::ifstream f(path_, std::ios::binary);
  if (!f) return fail("cannot open file");
  std::ostringstream ss;
  ss << f.rdbuf();
  if (f.bad()) return fail("read error");

  std::string why;
  if (!store.loadJSON(ss.str(), &why)) return fail(why);

  result.loaded = store.count();
  return result;
}

OpResult RecipeFile::save(const RecipeStore& store) const {
  const std::string json = store.toJSON();

  std::error_code ec;
  auto parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent, ec);
  if (ec) {
    std::fprintf(stderr, "[RecipeFile] save %s: %s\n", path_.c_str(),
                 ec.message().c_str());
    return opFail(ErrorKind::StorageWrite, "Error saving recipes: " + ec.message());
  }

  FILE* f = std::fopen(path_.c_str(), "wb");
  if (!f) {
    std::fprintf(stderr, "[RecipeFile] save %s: cannot open for writing\n",
                 path_.c_str());
    return opFail(ErrorKind::StorageWrite,
                  "Error saving recipes: cannot open " + path_);
  }
  std::size_t written = std::fwrite(json.data(), 1, json.size(), f);
  int closed = std::fclose(f);
  if (written != json.size() || closed != 0) {
    std::fprintf(stderr, "[RecipeFile] save %s: short write\n", path_.c_str());
    return opFail(ErrorKind::StorageWrite, "Error saving recipes: write failed");
  }
  return opOk();
}

} // namespace lb
