#pragma once

#include "uuidres/IndexUid.hpp"
#include "uuidres/Result.hpp"
#include "uuidres/resolver/ResolverMsg.hpp"
#include "uuidres/store/UuidStore.hpp"

#include <cstddef>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace uuidres::util { class Config; }

namespace uuidres::resolver {

// The resolver actor is gone (inbox closed or a reply was dropped). Not a
// domain error: callers are not expected to recover from it.
class ResolverTerminated : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

/// Cloneable, thread-safe client of the resolver actor. Copies share one
/// actor; the actor stops once the last copy is destroyed, after serving
/// every request already queued.
class UuidResolverHandle {
public:
  /// Open the SQLite store under cfg.dataDir and start an actor over it.
  /// Throws store::StoreError if the store cannot be opened.
  static UuidResolverHandle open(const util::Config& cfg);

  /// Start an actor over an already-built store.
  explicit UuidResolverHandle(std::unique_ptr<store::IUuidStore> store,
                              std::size_t inboxCapacity = 100);

  /// Register a new index uid and return its fresh uuid.
  /// BadlyFormatted for an invalid uid, NameAlreadyExists if already registered.
  Result<Uuid> create(std::string uid) const;

  /// UnexistingIndex if the uid is unknown.
  Result<Uuid> get(std::string uid) const;

  /// Drop the mapping, returning the uuid it held. UnexistingIndex if absent.
  Result<Uuid> remove(std::string uid) const;

  Result<std::vector<IndexEntry>> list() const;

  /// Write `uid -> uuid` as is, replacing any previous mapping.
  Result<void> insert(std::string uid, Uuid uuid) const;

  // Same requests without waiting. Abandoning the future does not cancel the
  // request; a broken future means the actor died.
  std::future<Result<Uuid>> createAsync(std::string uid) const;
  std::future<Result<Uuid>> getAsync(std::string uid) const;
  std::future<Result<Uuid>> removeAsync(std::string uid) const;
  std::future<Result<std::vector<IndexEntry>>> listAsync() const;
  std::future<Result<void>> insertAsync(std::string uid, Uuid uuid) const;

private:
  struct Runtime;

  void enqueue(ResolverMsg msg) const;

  std::shared_ptr<Runtime> rt_;
};

} // namespace uuidres::resolver
