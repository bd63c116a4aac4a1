// R1.2: RecipeStore serialization: toJSON / loadJSON

#include "lb/recipe/RecipeStore.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static lb::RecipeFields fields(const std::string& name, const std::string& ingredients,
                               const std::string& instructions, int servings) {
  lb::RecipeFields f;
  f.name = name;
  f.ingredients = ingredients;
  f.instructions = instructions;
  f.servings = servings;
  return f;
}

int main() {
  // ---- Test 1: toJSON produces a list of flat records ----
  {
    lb::RecipeStore store;
    store.add(fields("Pancakes", "2 cups flour", "Fry.", 4));

    std::string json = store.toJSON();
    requireTrue(json.front() == '[' && json.back() == ']', "root is an array");
    requireTrue(json.find("\"name\":\"Pancakes\"") != std::string::npos, "has name");
    requireTrue(json.find("\"ingredients\":\"2 cups flour\"") != std::string::npos,
                "has ingredients");
    requireTrue(json.find("\"instructions\":\"Fry.\"") != std::string::npos,
                "has instructions");
    requireTrue(json.find("\"servings\":4") != std::string::npos, "has servings");
    requireTrue(json.find("\"id\"") == std::string::npos, "id is not persisted");
    std::printf("  Test 1 (toJSON structure): PASS\n");
  }

  // ---- Test 2: loadJSON restores recipes in file order ----
  {
    const char* json = R"([
      {"name":"Bread","ingredients":"500 g flour\n10 g salt","instructions":"Knead.","servings":8},
      {"name":"Salad","ingredients":"1 lettuce","instructions":"Toss.","servings":2}
    ])";

    lb::RecipeStore store;
    requireTrue(store.loadJSON(json), "loadJSON succeeds");
    requireTrue(store.count() == 2, "2 recipes loaded");

    const auto& all = store.recipes();
    requireTrue(all[0].name == "Bread", "first is Bread");
    requireTrue(all[0].ingredients == "500 g flour\n10 g salt", "newline preserved");
    requireTrue(all[0].servings == 8, "servings");
    requireTrue(all[1].name == "Salad", "second is Salad");
    requireTrue(all[0].id != all[1].id, "distinct ids");

    // Duplicate check applies to loaded recipes too
    auto dup = store.add(fields("Salad", "x", "y", 1));
    requireTrue(!dup.ok, "cannot add duplicate of loaded recipe");
    std::printf("  Test 2 (loadJSON restores): PASS\n");
  }

  // ---- Test 3: round-trip keeps order and field values ----
  {
    lb::RecipeStore original;
    original.add(fields("Chili", "1 kg beans\n2 onions", "Cook \"slowly\".\nServe.", 6));
    original.add(fields("Tea", "1 bag", "Steep\t3 min", 1));
    original.add(fields("Crêpes", "250 g farine", "Mélanger.", 4));

    std::string json = original.toJSON();

    lb::RecipeStore restored;
    requireTrue(restored.loadJSON(json), "round-trip loadJSON succeeds");
    requireTrue(restored.count() == original.count(), "same count");

    const auto& a = original.recipes();
    const auto& b = restored.recipes();
    for (std::size_t i = 0; i < a.size(); ++i) {
      requireTrue(a[i].name == b[i].name, "name match");
      requireTrue(a[i].ingredients == b[i].ingredients, "ingredients match");
      requireTrue(a[i].instructions == b[i].instructions, "instructions match");
      requireTrue(a[i].servings == b[i].servings, "servings match");
    }
    requireTrue(restored.toJSON() == json, "re-serialized text identical");
    std::printf("  Test 3 (round-trip): PASS\n");
  }

  // ---- Test 4: invalid documents are rejected and leave the store alone ----
  {
    lb::RecipeStore store;
    store.add(fields("Keep", "1 x", "y", 1));

    std::string why;
    requireTrue(!store.loadJSON("", &why), "empty string fails");
    requireTrue(!why.empty(), "reason reported");
    requireTrue(!store.loadJSON("[", &why), "truncated JSON fails");
    requireTrue(!store.loadJSON("null"), "null fails");
    requireTrue(!store.loadJSON("{}"), "object at root fails");
    requireTrue(!store.loadJSON("[1,2]"), "non-object entries fail");
    requireTrue(!store.loadJSON(R"([{"name":"ok"}, "bad"])"), "one bad entry fails all");

    requireTrue(store.count() == 1, "data unchanged on parse failure");
    requireTrue(store.recipes()[0].name == "Keep", "original recipe intact");
    std::printf("  Test 4 (invalid JSON): PASS\n");
  }

  // ---- Test 5: missing fields take defaults ----
  {
    lb::RecipeStore store;
    requireTrue(store.loadJSON(R"([{"name":"Bare"},{"name":"Odd","servings":"four"}])"),
                "partial records load");
    requireTrue(store.recipes()[0].ingredients.empty(), "ingredients default empty");
    requireTrue(store.recipes()[0].servings == 1, "servings default 1");
    requireTrue(store.recipes()[1].servings == 1, "non-integer servings default 1");

    requireTrue(store.loadJSON(R"([{"name":"A","servings":4.0},{"name":"B","servings":-2.0},)"
                               R"({"name":"C","servings":2.5},{"name":"D","servings":5000000000}])"),
                "numeric servings load");
    requireTrue(store.recipes()[0].servings == 4, "4.0 read as 4");
    requireTrue(store.recipes()[1].servings == -2, "-2.0 read as -2");
    requireTrue(store.recipes()[2].servings == 1, "fractional servings default 1");
    requireTrue(store.recipes()[3].servings == 1, "out of range servings default 1");
    requireTrue(store.toJSON().find("\"servings\":4}") != std::string::npos,
                "4.0 written back as 4");
    std::printf("  Test 5 (defaults): PASS\n");
  }

  // ---- Test 6: empty collection ----
  {
    lb::RecipeStore store;
    requireTrue(store.toJSON() == "[]", "empty store is []");

    lb::RecipeStore loaded;
    requireTrue(loaded.loadJSON("[]"), "loadJSON of [] succeeds");
    requireTrue(loaded.count() == 0, "0 recipes after load");
    std::printf("  Test 6 (empty): PASS\n");
  }

  std::printf("R1.2 recipe_serial: ALL PASS\n");
  return 0;
}
