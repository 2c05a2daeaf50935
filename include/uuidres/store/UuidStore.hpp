#pragma once

#include "uuidres/IndexUid.hpp"
#include "uuidres/Result.hpp"

#include <exception>
#include <future>
#include <optional>
#include <string>
#include <vector>

namespace uuidres::store {

/// Transactional name -> uuid table. Every call runs in its own transaction
/// and completes asynchronously; the returned future carries the outcome.
/// Absence is reported as an empty optional, never as an error.
class IUuidStore {
public:
  virtual ~IUuidStore() = default;

  /// Mint and persist a fresh uuid for `name`. If the name is already mapped,
  /// fails with NameAlreadyExists when `rejectIfExists`, otherwise returns the
  /// stored uuid without writing.
  virtual std::future<Result<Uuid>> createUuid(std::string name, bool rejectIfExists) = 0;

  virtual std::future<Result<std::optional<Uuid>>> getUuid(std::string name) = 0;

  /// Remove the mapping and hand back the uuid it held.
  virtual std::future<Result<std::optional<Uuid>>> remove(std::string name) = 0;

  virtual std::future<Result<std::vector<IndexEntry>>> list() = 0;

  /// Unconditional upsert.
  virtual std::future<Result<void>> insert(std::string name, Uuid uuid) = 0;
};

// Wait for a store call. A job the worker pool dropped or that threw outside
// the store's own error handling is reported as TaskFailed.
template <typename T>
Result<T> awaitStore(std::future<Result<T>> fut) {
  try {
    return fut.get();
  } catch (const std::future_error& e) {
    return Error{ErrorCode::TaskFailed, std::string("store task abandoned: ") + e.what()};
  } catch (const std::exception& e) {
    return Error{ErrorCode::TaskFailed, std::string("store task failed: ") + e.what()};
  }
}

} // namespace uuidres::store
