#include "uuidres/Result.hpp"

namespace uuidres {

const char* errorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::BadlyFormatted:    return "badly_formatted";
    case ErrorCode::UnexistingIndex:   return "unexisting_index";
    case ErrorCode::NameAlreadyExists: return "name_already_exists";
    case ErrorCode::Storage:           return "storage";
    case ErrorCode::Decoding:          return "decoding";
    case ErrorCode::TaskFailed:        return "task_failed";
    case ErrorCode::BadDump:           return "bad_dump";
  }
  return "unknown";
}

} // namespace uuidres
