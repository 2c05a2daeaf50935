#pragma once

#include "uuidres/resolver/ResolverMsg.hpp"
#include "uuidres/rt/BoundedQueue.hpp"
#include "uuidres/store/UuidStore.hpp"

#include <memory>
#include <string>
#include <vector>

namespace uuidres::resolver {

using Inbox = rt::BoundedQueue<ResolverMsg>;

/// Sole owner of the uuid store. Handles one message at a time, in arrival
/// order, so no two store operations ever overlap.
class UuidResolverActor {
public:
  UuidResolverActor(std::shared_ptr<Inbox> inbox, std::unique_ptr<store::IUuidStore> store);

  /// Runs until the inbox is closed and drained.
  void run();

private:
  void dispatch(ResolverMsg& msg);

  Result<Uuid> handleCreate(const std::string& uid);
  Result<Uuid> handleGet(const std::string& uid);
  Result<Uuid> handleDelete(const std::string& uid);
  Result<std::vector<IndexEntry>> handleList();
  Result<void> handleInsert(const std::string& uid, const Uuid& uuid);

  template <typename T>
  void reply(const char* op, std::promise<Result<T>>& ret, Result<T> result);

private:
  std::shared_ptr<Inbox>             inbox_;
  std::unique_ptr<store::IUuidStore> store_;
};

} // namespace uuidres::resolver
