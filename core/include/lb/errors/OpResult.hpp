#pragma once
#include "lb/ids/Id.hpp"

#include <cstdint>
#include <string>

namespace lb {

enum class ErrorKind : std::uint8_t {
  None = 0,
  Validation,
  DuplicateName,
  NotFound,
  StorageRead,
  StorageWrite,
  InvalidServings,
  BadCommand,
  UnknownCommand
};

// Stable upper-case code for an error kind, e.g. "DUPLICATE_NAME".
const char* errorCode(ErrorKind kind);

struct OpError {
  ErrorKind kind{ErrorKind::None};
  std::string code;     // errorCode(kind)
  std::string message;  // human text, shown to the user as-is
};

struct OpResult {
  bool ok{true};
  OpError err{};
  RecipeId id{kInvalidRecipeId};  // recipe created or touched, if any
  std::string warning;            // non-fatal follow-up problem (e.g. save failed)
};

OpResult opOk(RecipeId id = kInvalidRecipeId);
OpResult opFail(ErrorKind kind, const std::string& message);

} // namespace lb
