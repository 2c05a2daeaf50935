#include "uuidres/resolver/UuidResolverActor.hpp"
#include "uuidres/util/Logger.hpp"
#include "uuidres/util/Metrics.hpp"

#include <type_traits>
#include <utility>
#include <vector>

namespace uuidres::resolver {

using util::LogLevel;
using util::logger;

UuidResolverActor::UuidResolverActor(std::shared_ptr<Inbox> inbox,
                                     std::unique_ptr<store::IUuidStore> store)
  : inbox_(std::move(inbox)), store_(std::move(store)) {}

void UuidResolverActor::run() {
  util::Logger::Scoped ctx(std::vector<util::Field>{{"component", "uuid-resolver"}});
  logger().log(LogLevel::Info, "uuid resolver started");

  // pop() yields nothing once every handle is gone and the backlog is served
  while (auto msg = inbox_->pop()) {
    UUIDRES_METRIC_SET("uuid_resolver.inbox_depth", static_cast<double>(inbox_->size()));
    dispatch(*msg);
  }

  logger().log(LogLevel::Warn, "exiting uuid resolver loop");
}

void UuidResolverActor::dispatch(ResolverMsg& msg) {
  std::visit([this](auto& m) {
    using M = std::decay_t<decltype(m)>;
    if constexpr (std::is_same_v<M, CreateMsg>) {
      reply("create", m.ret, handleCreate(m.uid));
    } else if constexpr (std::is_same_v<M, GetMsg>) {
      reply("get", m.ret, handleGet(m.uid));
    } else if constexpr (std::is_same_v<M, DeleteMsg>) {
      reply("delete", m.ret, handleDelete(m.uid));
    } else if constexpr (std::is_same_v<M, ListMsg>) {
      reply("list", m.ret, handleList());
    } else if constexpr (std::is_same_v<M, InsertMsg>) {
      reply("insert", m.ret, handleInsert(m.uid, m.uuid));
    }
  }, msg);
}

template <typename T>
void UuidResolverActor::reply(const char* op, std::promise<Result<T>>& ret, Result<T> result) {
  UUIDRES_METRIC_HIT(std::string("uuid_resolver.") + op);
  if (!result) {
    const auto& err = result.error();
    UUIDRES_METRIC_HIT(std::string("uuid_resolver.error.") + errorCodeName(err.code));
    // caller mistakes are routine; store trouble is not
    auto lvl = (err.code == ErrorCode::Storage || err.code == ErrorCode::Decoding ||
                err.code == ErrorCode::TaskFailed) ? LogLevel::Error : LogLevel::Debug;
    logger().log(lvl, "uuid resolver request failed",
                 {{"op", op}, {"code", errorCodeName(err.code)}, {"err", err.message}});
  }
  // A caller that stopped waiting still leaves the shared state alive; the
  // value is simply never read.
  ret.set_value(std::move(result));
}

Result<Uuid> UuidResolverActor::handleCreate(const std::string& uid) {
  if (!isIndexUidValid(uid)) {
    return badlyFormatted(uid);
  }
  return store::awaitStore(store_->createUuid(uid, true));
}

Result<Uuid> UuidResolverActor::handleGet(const std::string& uid) {
  auto found = store::awaitStore(store_->getUuid(uid));
  if (!found) return found.error();
  if (!*found) return unexistingIndex(uid);
  return **found;
}

Result<Uuid> UuidResolverActor::handleDelete(const std::string& uid) {
  auto removed = store::awaitStore(store_->remove(uid));
  if (!removed) return removed.error();
  if (!*removed) return unexistingIndex(uid);
  return **removed;
}

Result<std::vector<IndexEntry>> UuidResolverActor::handleList() {
  return store::awaitStore(store_->list());
}

Result<void> UuidResolverActor::handleInsert(const std::string& uid, const Uuid& uuid) {
  if (!isIndexUidValid(uid)) {
    return badlyFormatted(uid);
  }
  return store::awaitStore(store_->insert(uid, uuid));
}

} // namespace uuidres::resolver
