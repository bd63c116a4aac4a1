#pragma once
#include "lb/errors/OpResult.hpp"
#include "lb/session/RecipeSession.hpp"
#include "lb/update/UpdateChecker.hpp"

#include <string>

#include <rapidjson/document.h>

namespace lb {

struct CmdResult {
  bool ok{true};
  OpError err{};
  std::string response;  // one-line JSON reply, always set
};

// JSON command front end for a presentation layer. Every command is an
// object with a string "cmd" field:
//
//   {"cmd":"listRecipes"}
//   {"cmd":"getRecipe","name":"Pancakes"}
//   {"cmd":"selectRecipe","name":"Pancakes"}
//   {"cmd":"newRecipe"}
//   {"cmd":"saveRecipe","name":"...","ingredients":"...","instructions":"...","servings":4}
//   {"cmd":"deleteRecipe","name":"Pancakes"}
//   {"cmd":"scaleRecipe","name":"Pancakes","servings":8}
//   {"cmd":"saveAll"}
//   {"cmd":"checkUpdate"}
//
// Replies are {"ok":true,...} or {"ok":false,"error":{"code":"...","message":"..."}}.
class CommandProcessor {
public:
  explicit CommandProcessor(RecipeSession& session);

  // Optional; without it checkUpdate replies with status "unavailable".
  void setUpdateCheck(const UpdateChecker* checker, ReleaseFeed* feed);

  CmdResult applyJson(const rapidjson::Value& obj);
  CmdResult applyJsonText(const std::string& jsonText);

  // First line written to a presentation layer after startup:
  //   {"event":"ready","configOk":true,"loadError":null|{...},"update":null|{...}}
  // "update" is the checkUpdate reply when checkUpdates is set.
  std::string readyEvent(const LoadResult& loaded, bool configOk, bool checkUpdates);

  // {"code":"...","message":"..."}
  static std::string errorJson(const OpError& err);

private:
  RecipeSession& session_;
  const UpdateChecker* checker_{nullptr};
  ReleaseFeed* feed_{nullptr};

  // ---- handlers ----
  CmdResult cmdListRecipes(const rapidjson::Value& obj);
  CmdResult cmdGetRecipe(const rapidjson::Value& obj);
  CmdResult cmdSelectRecipe(const rapidjson::Value& obj);
  CmdResult cmdNewRecipe(const rapidjson::Value& obj);
  CmdResult cmdSaveRecipe(const rapidjson::Value& obj);
  CmdResult cmdDeleteRecipe(const rapidjson::Value& obj);
  CmdResult cmdScaleRecipe(const rapidjson::Value& obj);
  CmdResult cmdSaveAll(const rapidjson::Value& obj);
  CmdResult cmdCheckUpdate(const rapidjson::Value& obj);

  // helpers
  static const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key);
  static std::string getStringOrEmpty(const rapidjson::Value& obj, const char* key);
  static CmdResult fail(ErrorKind kind, const std::string& message);
  static CmdResult fromOp(const OpResult& r);
};

} // namespace lb
