#pragma once

#include "uuidres/IndexUid.hpp"
#include "uuidres/Result.hpp"

#include <future>
#include <string>
#include <variant>
#include <vector>

namespace uuidres::resolver {

// Requests accepted by the resolver actor. Each carries the promise its
// single reply is delivered through.

struct GetMsg {
  std::string                uid;
  std::promise<Result<Uuid>> ret;
};

struct CreateMsg {
  std::string                uid;
  std::promise<Result<Uuid>> ret;
};

struct DeleteMsg {
  std::string                uid;
  std::promise<Result<Uuid>> ret;
};

struct ListMsg {
  std::promise<Result<std::vector<IndexEntry>>> ret;
};

struct InsertMsg {
  std::string                uid;
  Uuid                       uuid;
  std::promise<Result<void>> ret;
};

using ResolverMsg = std::variant<GetMsg, CreateMsg, DeleteMsg, ListMsg, InsertMsg>;

} // namespace uuidres::resolver
