#include "lb/recipe/RecipeStore.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <unordered_set>
#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace lb {

namespace {

// Integral numbers in int range, including ones written as 4.0.
bool readServings(const rapidjson::Value& v, int& out) {
  if (v.IsInt()) {
    out = v.GetInt();
    return true;
  }
  if (!v.IsNumber()) return false;
  const double d = v.GetDouble();
  if (!(d >= std::numeric_limits<int>::min() && d <= std::numeric_limits<int>::max()))
    return false;
  if (std::floor(d) != d) return false;
  out = static_cast<int>(d);
  return true;
}

} // anonymous namespace

OpResult RecipeStore::add(const RecipeFields& fields) {
  if (findByName(fields.name)) {
    return opFail(ErrorKind::DuplicateName,
                  "A recipe with this name already exists!");
  }

  Recipe r;
  r.id = nextId_++;
  r.name = fields.name;
  r.ingredients = fields.ingredients;
  r.instructions = fields.instructions;
  r.servings = fields.servings;
  recipes_.push_back(r);
  return opOk(r.id);
}

OpResult RecipeStore::update(RecipeId id, const RecipeFields& fields) {
  Recipe* r = find(id);
  if (!r) return opFail(ErrorKind::NotFound, "Recipe not found");

  r->name = fields.name;
  r->ingredients = fields.ingredients;
  r->instructions = fields.instructions;
  r->servings = fields.servings;
  return opOk(id);
}

OpResult RecipeStore::remove(RecipeId id) {
  auto it = std::find_if(recipes_.begin(), recipes_.end(),
    [id](const Recipe& r) { return r.id == id; });
  if (it == recipes_.end()) return opFail(ErrorKind::NotFound, "Recipe not found");
  recipes_.erase(it);
  return opOk(id);
}

void RecipeStore::clear() {
  recipes_.clear();
}

Recipe* RecipeStore::find(RecipeId id) {
  for (auto& r : recipes_) {
    if (r.id == id) return &r;
  }
  return nullptr;
}

const Recipe* RecipeStore::get(RecipeId id) const {
  for (const auto& r : recipes_) {
    if (r.id == id) return &r;
  }
  return nullptr;
}

const Recipe* RecipeStore::findByName(const std::string& name) const {
  for (const auto& r : recipes_) {
    if (r.name == name) return &r;
  }
  return nullptr;
}

bool RecipeStore::hasDuplicateNames() const {
  std::unordered_set<std::string> seen;
  for (const auto& r : recipes_) {
    if (!seen.insert(r.name).second) return true;
  }
  return false;
}

// Serialization

std::string RecipeStore::toJSON() const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  auto str = [&w](const std::string& s) {
    w.String(s.c_str(), static_cast<rapidjson::SizeType>(s.size()));
  };

  w.StartArray();
  for (const auto& r : recipes_) {
    w.StartObject();
    w.Key("name");         str(r.name);
    w.Key("ingredients");  str(r.ingredients);
    w.Key("instructions"); str(r.instructions);
    w.Key("servings");     w.Int(r.servings);
    w.EndObject();
  }
  w.EndArray();

  return sb.GetString();
}

bool RecipeStore::loadJSON(const std::string& json, std::string* error) {
  auto reject = [error](const char* why) {
    if (error) *error = why;
    return false;
  };

  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) return reject("not valid JSON");
  if (!doc.IsArray()) return reject("expected a list of recipes");

  const auto& arr = doc.GetArray();

  std::vector<Recipe> loaded;
  loaded.reserve(arr.Size());
  RecipeId id = nextId_;

  for (const auto& v : arr) {
    if (!v.IsObject()) return reject("recipe entry is not an object");
    Recipe r;
    r.id = id++;

    if (v.HasMember("name") && v["name"].IsString())
      r.name.assign(v["name"].GetString(), v["name"].GetStringLength());
    if (v.HasMember("ingredients") && v["ingredients"].IsString())
      r.ingredients.assign(v["ingredients"].GetString(),
                           v["ingredients"].GetStringLength());
    if (v.HasMember("instructions") && v["instructions"].IsString())
      r.instructions.assign(v["instructions"].GetString(),
                            v["instructions"].GetStringLength());
    if (v.HasMember("servings") && !readServings(v["servings"], r.servings)) {
      std::fprintf(stderr, "[RecipeStore] recipe '%s': servings is not a whole number, using 1\n",
                   r.name.c_str());
    }

    loaded.push_back(std::move(r));
  }

  recipes_ = std::move(loaded);
  nextId_ = id;
  if (error) error->clear();
  return true;
}

} // namespace lb
