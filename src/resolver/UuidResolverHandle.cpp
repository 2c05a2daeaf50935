#include "uuidres/resolver/UuidResolverHandle.hpp"
#include "uuidres/resolver/UuidResolverActor.hpp"
#include "uuidres/rt/ThreadPool.hpp"
#include "uuidres/store/SqliteUuidStore.hpp"
#include "uuidres/util/Config.hpp"
#include "uuidres/util/Logger.hpp"

#include <exception>
#include <thread>
#include <utility>

namespace uuidres::resolver {

// Inbox plus the thread running the actor. Destroying it closes the inbox
// and joins the thread, which serves the backlog first.
struct UuidResolverHandle::Runtime {
  std::shared_ptr<Inbox>             inbox;
  std::unique_ptr<UuidResolverActor> actor;
  std::thread                        thread;

  Runtime(std::unique_ptr<store::IUuidStore> store, std::size_t capacity)
    : inbox(std::make_shared<Inbox>(capacity))
    , actor(std::make_unique<UuidResolverActor>(inbox, std::move(store)))
  {
    thread = std::thread([this] { loop(); });
  }

  ~Runtime() {
    inbox->close();
    if (thread.joinable()) thread.join();
  }

  Runtime(const Runtime&)            = delete;
  Runtime& operator=(const Runtime&) = delete;

  void loop() {
    try {
      actor->run();
    } catch (const std::exception& e) {
      util::logger().log(util::LogLevel::Error, "uuid resolver actor died", {{"what", e.what()}});
    }
    // Refuse new work and drop the backlog so every waiter sees a broken
    // promise instead of hanging.
    inbox->close();
    while (inbox->pop()) {}
  }
};

namespace {

template <typename T>
Result<T> awaitReply(std::future<Result<T>> fut) {
  try {
    return fut.get();
  } catch (const std::future_error& e) {
    throw ResolverTerminated(std::string("Uuid resolver actor has been killed: ") + e.what());
  }
}

} // namespace

UuidResolverHandle UuidResolverHandle::open(const util::Config& cfg) {
  auto pool  = std::make_shared<rt::ThreadPool>(cfg.storeThreads);
  auto store = std::make_unique<store::SqliteUuidStore>(cfg.dataDir, cfg.mapSize, std::move(pool));
  return UuidResolverHandle(std::move(store), cfg.inboxCapacity);
}

UuidResolverHandle::UuidResolverHandle(std::unique_ptr<store::IUuidStore> store,
                                       std::size_t inboxCapacity)
  : rt_(std::make_shared<Runtime>(std::move(store), inboxCapacity)) {}

void UuidResolverHandle::enqueue(ResolverMsg msg) const {
  if (!rt_ || !rt_->inbox->push(std::move(msg))) {
    throw ResolverTerminated("Uuid resolver actor has been killed: inbox closed");
  }
}

std::future<Result<Uuid>> UuidResolverHandle::createAsync(std::string uid) const {
  CreateMsg msg{std::move(uid), {}};
  auto fut = msg.ret.get_future();
  enqueue(std::move(msg));
  return fut;
}

std::future<Result<Uuid>> UuidResolverHandle::getAsync(std::string uid) const {
  GetMsg msg{std::move(uid), {}};
  auto fut = msg.ret.get_future();
  enqueue(std::move(msg));
  return fut;
}

std::future<Result<Uuid>> UuidResolverHandle::removeAsync(std::string uid) const {
  DeleteMsg msg{std::move(uid), {}};
  auto fut = msg.ret.get_future();
  enqueue(std::move(msg));
  return fut;
}

std::future<Result<std::vector<IndexEntry>>> UuidResolverHandle::listAsync() const {
  ListMsg msg{};
  auto fut = msg.ret.get_future();
  enqueue(std::move(msg));
  return fut;
}

std::future<Result<void>> UuidResolverHandle::insertAsync(std::string uid, Uuid uuid) const {
  InsertMsg msg{std::move(uid), uuid, {}};
  auto fut = msg.ret.get_future();
  enqueue(std::move(msg));
  return fut;
}

Result<Uuid> UuidResolverHandle::create(std::string uid) const {
  return awaitReply(createAsync(std::move(uid)));
}

Result<Uuid> UuidResolverHandle::get(std::string uid) const {
  return awaitReply(getAsync(std::move(uid)));
}

Result<Uuid> UuidResolverHandle::remove(std::string uid) const {
  return awaitReply(removeAsync(std::move(uid)));
}

Result<std::vector<IndexEntry>> UuidResolverHandle::list() const {
  return awaitReply(listAsync());
}

Result<void> UuidResolverHandle::insert(std::string uid, Uuid uuid) const {
  return awaitReply(insertAsync(std::move(uid), uuid));
}

} // namespace uuidres::resolver
