#include "lb/errors/OpResult.hpp"

namespace lb {

const char* errorCode(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:            return "OK";
    case ErrorKind::Validation:      return "VALIDATION_ERROR";
    case ErrorKind::DuplicateName:   return "DUPLICATE_NAME";
    case ErrorKind::NotFound:        return "NOT_FOUND";
    case ErrorKind::StorageRead:     return "STORAGE_READ_ERROR";
    case ErrorKind::StorageWrite:    return "STORAGE_WRITE_ERROR";
    case ErrorKind::InvalidServings: return "INVALID_SERVINGS";
    case ErrorKind::BadCommand:      return "BAD_COMMAND";
    case ErrorKind::UnknownCommand:  return "UNKNOWN_COMMAND";
  }
  return "UNKNOWN";
}

OpResult opOk(RecipeId id) {
  OpResult r;
  r.ok = true;
  r.id = id;
  return r;
}

OpResult opFail(ErrorKind kind, const std::string& message) {
  OpResult r;
  r.ok = false;
  r.err.kind = kind;
  r.err.code = errorCode(kind);
  r.err.message = message;
  return r;
}

} // namespace lb
