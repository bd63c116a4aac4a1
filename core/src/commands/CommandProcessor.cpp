#include "lb/commands/CommandProcessor.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <string>

namespace lb {

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void writeString(JsonWriter& w, const std::string& s) {
  w.String(s.c_str(), static_cast<rapidjson::SizeType>(s.size()));
}

void writeRecipe(JsonWriter& w, const Recipe& r) {
  w.StartObject();
  w.Key("name");         writeString(w, r.name);
  w.Key("ingredients");  writeString(w, r.ingredients);
  w.Key("instructions"); writeString(w, r.instructions);
  w.Key("servings");     w.Int(r.servings);
  w.EndObject();
}

const char* statusName(UpdateStatus s) {
  switch (s) {
    case UpdateStatus::UpToDate:        return "upToDate";
    case UpdateStatus::UpdateAvailable: return "updateAvailable";
    case UpdateStatus::Unavailable:     return "unavailable";
  }
  return "unavailable";
}

// {"ok":true, <body>}
template <typename Body>
CmdResult okReply(Body body) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  w.Key("ok"); w.Bool(true);
  body(w);
  w.EndObject();

  CmdResult r;
  r.ok = true;
  r.response = sb.GetString();
  return r;
}

} // anonymous namespace

CommandProcessor::CommandProcessor(RecipeSession& session) : session_(session) {}

void CommandProcessor::setUpdateCheck(const UpdateChecker* checker, ReleaseFeed* feed) {
  checker_ = checker;
  feed_ = feed;
}

CmdResult CommandProcessor::fail(ErrorKind kind, const std::string& message) {
  CmdResult r;
  r.ok = false;
  r.err.kind = kind;
  r.err.code = errorCode(kind);
  r.err.message = message;

  r.response = R"({"ok":false,"error":)" + errorJson(r.err) + "}";
  return r;
}

std::string CommandProcessor::readyEvent(const LoadResult& loaded, bool configOk,
                                         bool checkUpdates) {
  std::string line = R"({"event":"ready","configOk":)";
  line += configOk ? "true" : "false";
  line += R"(,"loadError":)";
  line += loaded.ok ? std::string("null") : errorJson(loaded.err);
  line += R"(,"update":)";
  line += checkUpdates ? cmdCheckUpdate(rapidjson::Value()).response : std::string("null");
  line += "}";
  return line;
}

std::string CommandProcessor::errorJson(const OpError& err) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  w.Key("code");    writeString(w, err.code);
  w.Key("message"); writeString(w, err.message);
  w.EndObject();
  return sb.GetString();
}

CmdResult CommandProcessor::fromOp(const OpResult& op) {
  if (!op.ok) return fail(op.err.kind, op.err.message);
  return okReply([&](JsonWriter& w) {
    if (!op.warning.empty()) {
      w.Key("warning"); writeString(w, op.warning);
    }
  });
}

const rapidjson::Value* CommandProcessor::getMember(const rapidjson::Value& obj, const char* key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return nullptr;
  return &it->value;
}

std::string CommandProcessor::getStringOrEmpty(const rapidjson::Value& obj, const char* key) {
  const auto* v = getMember(obj, key);
  if (!v) return {};
  if (v->IsString()) return std::string(v->GetString(), v->GetStringLength());
  return {};
}

CmdResult CommandProcessor::applyJsonText(const std::string& jsonText) {
  rapidjson::Document d;
  d.Parse(jsonText.c_str());

  if (d.HasParseError() || !d.IsObject()) {
    return fail(ErrorKind::BadCommand, "CommandProcessor: invalid JSON object");
  }

  return applyJson(d);
}

CmdResult CommandProcessor::applyJson(const rapidjson::Value& obj) {
  const auto* cmdV = getMember(obj, "cmd");
  if (!cmdV || !cmdV->IsString()) {
    return fail(ErrorKind::BadCommand, "Missing string field: cmd");
  }

  const std::string cmd = cmdV->GetString();

  if (cmd == "listRecipes") return cmdListRecipes(obj);
  if (cmd == "getRecipe") return cmdGetRecipe(obj);
  if (cmd == "selectRecipe") return cmdSelectRecipe(obj);
  if (cmd == "newRecipe") return cmdNewRecipe(obj);
  if (cmd == "saveRecipe") return cmdSaveRecipe(obj);
  if (cmd == "deleteRecipe") return cmdDeleteRecipe(obj);
  if (cmd == "scaleRecipe") return cmdScaleRecipe(obj);
  if (cmd == "saveAll") return cmdSaveAll(obj);
  if (cmd == "checkUpdate") return cmdCheckUpdate(obj);

  return fail(ErrorKind::UnknownCommand, "Unknown cmd: " + cmd);
}

// -------------------- handlers --------------------

CmdResult CommandProcessor::cmdListRecipes(const rapidjson::Value&) {
  auto list = session_.listRecipes();
  const Recipe* sel = session_.selected();
  return okReply([&](JsonWriter& w) {
    w.Key("recipes");
    w.StartArray();
    for (const auto& s : list) {
      w.StartObject();
      w.Key("name");     writeString(w, s.name);
      w.Key("servings"); w.Int(s.servings);
      w.EndObject();
    }
    w.EndArray();
    w.Key("selected");
    if (sel) writeString(w, sel->name);
    else w.Null();
  });
}

CmdResult CommandProcessor::cmdGetRecipe(const rapidjson::Value& obj) {
  const std::string name = getStringOrEmpty(obj, "name");
  const Recipe* r = session_.getRecipe(name);
  if (!r) return fail(ErrorKind::NotFound, "No recipe named '" + name + "'");
  return okReply([&](JsonWriter& w) {
    w.Key("recipe");
    writeRecipe(w, *r);
  });
}

CmdResult CommandProcessor::cmdSelectRecipe(const rapidjson::Value& obj) {
  const std::string name = getStringOrEmpty(obj, "name");
  if (!session_.selectRecipe(name))
    return fail(ErrorKind::NotFound, "No recipe named '" + name + "'");
  const Recipe* r = session_.selected();
  return okReply([&](JsonWriter& w) {
    w.Key("recipe");
    writeRecipe(w, *r);
  });
}

CmdResult CommandProcessor::cmdNewRecipe(const rapidjson::Value&) {
  session_.newRecipe();
  return okReply([](JsonWriter&) {});
}

CmdResult CommandProcessor::cmdSaveRecipe(const rapidjson::Value& obj) {
  RecipeFields f;
  f.name = getStringOrEmpty(obj, "name");
  f.ingredients = getStringOrEmpty(obj, "ingredients");
  f.instructions = getStringOrEmpty(obj, "instructions");

  if (const auto* s = getMember(obj, "servings")) {
    if (!s->IsInt()) return fail(ErrorKind::BadCommand, "saveRecipe: servings must be an integer");
    f.servings = s->GetInt();
  }

  OpResult op = session_.createOrUpdateRecipe(f);
  if (!op.ok) return fail(op.err.kind, op.err.message);

  const Recipe* r = session_.selected();
  return okReply([&](JsonWriter& w) {
    w.Key("message"); w.String("Recipe saved successfully!");
    if (r) {
      w.Key("recipe");
      writeRecipe(w, *r);
    }
    if (!op.warning.empty()) {
      w.Key("warning"); writeString(w, op.warning);
    }
  });
}

CmdResult CommandProcessor::cmdDeleteRecipe(const rapidjson::Value& obj) {
  return fromOp(session_.deleteRecipe(getStringOrEmpty(obj, "name")));
}

CmdResult CommandProcessor::cmdScaleRecipe(const rapidjson::Value& obj) {
  const auto* s = getMember(obj, "servings");
  if (!s || !s->IsInt()) {
    return fail(ErrorKind::BadCommand, "scaleRecipe: missing integer field: servings");
  }

  ScaleResult sr = session_.scaleRecipe(getStringOrEmpty(obj, "name"), s->GetInt());
  if (!sr.ok) return fail(sr.err.kind, sr.err.message);

  return okReply([&](JsonWriter& w) {
    w.Key("ingredients"); writeString(w, sr.ingredients);
    w.Key("servings");    w.Int(sr.servings);
    w.Key("factor");      w.Double(sr.factor);
  });
}

CmdResult CommandProcessor::cmdSaveAll(const rapidjson::Value&) {
  return fromOp(session_.saveAll());
}

CmdResult CommandProcessor::cmdCheckUpdate(const rapidjson::Value&) {
  UpdateInfo info;
  if (checker_ && feed_) info = checker_->check(*feed_);

  return okReply([&](JsonWriter& w) {
    w.Key("status"); w.String(statusName(info.status));
    if (!info.latestVersion.empty()) {
      w.Key("latest"); writeString(w, info.latestVersion);
    }
    if (!info.releaseUrl.empty()) {
      w.Key("url"); writeString(w, info.releaseUrl);
    }
  });
}

} // namespace lb
