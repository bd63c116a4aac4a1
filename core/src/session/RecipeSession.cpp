#include "lb/session/RecipeSession.hpp"
#include "lb/scale/IngredientScaler.hpp"

#include <cctype>
#include <cstdio>

namespace lb {

namespace {

std::string trimmed(const std::string& s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

ScaleResult scaleFail(ErrorKind kind, const std::string& message) {
  ScaleResult r;
  r.ok = false;
  r.err.kind = kind;
  r.err.code = errorCode(kind);
  r.err.message = message;
  return r;
}

} // anonymous namespace

RecipeSession::RecipeSession(RecipeFile file) : file_(std::move(file)) {}

LoadResult RecipeSession::open() {
  selected_ = kInvalidRecipeId;
  LoadResult r = file_.load(store_);
  if (r.ok && store_.hasDuplicateNames()) {
    std::fprintf(stderr, "[RecipeSession] %s contains duplicate recipe names\n",
                 file_.path().c_str());
  }
  return r;
}

std::vector<RecipeSummary> RecipeSession::listRecipes() const {
  std::vector<RecipeSummary> out;
  out.reserve(store_.count());
  for (const auto& r : store_.recipes()) {
    out.push_back(RecipeSummary{r.id, r.name, r.servings});
  }
  return out;
}

const Recipe* RecipeSession::getRecipe(const std::string& name) const {
  return store_.findByName(name);
}

bool RecipeSession::selectRecipe(const std::string& name) {
  const Recipe* r = store_.findByName(name);
  if (!r) return false;
  selected_ = r->id;
  return true;
}

void RecipeSession::newRecipe() {
  selected_ = kInvalidRecipeId;
}

const Recipe* RecipeSession::selected() const {
  return store_.get(selected_);
}

OpResult RecipeSession::validate(const RecipeFields& f) {
  if (f.name.empty())
    return opFail(ErrorKind::Validation, "Recipe name cannot be empty!");
  if (f.ingredients.empty())
    return opFail(ErrorKind::Validation, "Ingredients cannot be empty!");
  if (f.instructions.empty())
    return opFail(ErrorKind::Validation, "Instructions cannot be empty!");
  if (f.servings <= 0)
    return opFail(ErrorKind::Validation, "Servings must be greater than 0!");
  return opOk();
}

void RecipeSession::persist(OpResult& r) {
  OpResult saved = file_.save(store_);
  if (!saved.ok) r.warning = saved.err.message;
}

OpResult RecipeSession::createOrUpdateRecipe(const RecipeFields& fields) {
  RecipeFields f;
  f.name = trimmed(fields.name);
  f.ingredients = trimmed(fields.ingredients);
  f.instructions = trimmed(fields.instructions);
  f.servings = fields.servings;

  OpResult v = validate(f);
  if (!v.ok) return v;

  OpResult r;
  if (const Recipe* current = selected()) {
    const Recipe* other = store_.findByName(f.name);
    if (other && other->id != current->id) {
      // Accepted as an edit; the collection now holds two recipes with this name.
      std::fprintf(stderr, "[RecipeSession] rename to '%s' duplicates an existing recipe\n",
                   f.name.c_str());
    }
    r = store_.update(current->id, f);
  } else {
    r = store_.add(f);
    if (r.ok) selected_ = r.id;
  }
  if (!r.ok) return r;

  persist(r);
  return r;
}

OpResult RecipeSession::deleteRecipe(const std::string& name) {
  const Recipe* r = store_.findByName(name);
  if (!r) return opFail(ErrorKind::NotFound, "No recipe named '" + name + "'");

  const RecipeId id = r->id;
  OpResult result = store_.remove(id);
  if (!result.ok) return result;
  if (selected_ == id) selected_ = kInvalidRecipeId;

  persist(result);
  return result;
}

ScaleResult RecipeSession::scaleRecipe(const std::string& name, int newServings) {
  const Recipe* r = store_.findByName(name);
  if (!r) return scaleFail(ErrorKind::NotFound, "No recipe named '" + name + "'");

  if (r->servings <= 0) {
    return scaleFail(ErrorKind::InvalidServings,
                     "Original recipe must have at least 1 serving!");
  }
  if (newServings <= 0) {
    return scaleFail(ErrorKind::Validation, "Servings must be greater than 0!");
  }

  ScaleResult out;
  out.id = r->id;
  out.factor = static_cast<double>(newServings) / static_cast<double>(r->servings);
  out.servings = newServings;
  out.ingredients = scaleIngredients(r->ingredients, out.factor);

  RecipeFields f = r->fields();
  f.ingredients = out.ingredients;
  f.servings = newServings;
  OpResult u = store_.update(out.id, f);
  if (!u.ok) return scaleFail(u.err.kind, u.err.message);
  return out;
}

OpResult RecipeSession::saveAll() {
  return file_.save(store_);
}

} // namespace lb
