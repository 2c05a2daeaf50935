#pragma once

#include "uuidres/store/UuidStore.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace uuidres::rt { class ThreadPool; }

namespace uuidres::store {

class SqliteDb;

/// IUuidStore backed by an SQLite table under <dataDir>/index_uuids.
/// Transactions run on the given worker pool, never on the caller's thread.
class SqliteUuidStore final : public IUuidStore {
public:
  static constexpr const char* kDirName  = "index_uuids";
  static constexpr const char* kFileName = "data.sqlite";

  /// Creates the sub-directory and table if missing. Throws StoreError.
  SqliteUuidStore(const std::filesystem::path& dataDir,
                  std::uint64_t mapSize,
                  std::shared_ptr<rt::ThreadPool> pool);
  ~SqliteUuidStore() override;

  std::future<Result<Uuid>> createUuid(std::string name, bool rejectIfExists) override;
  std::future<Result<std::optional<Uuid>>> getUuid(std::string name) override;
  std::future<Result<std::optional<Uuid>>> remove(std::string name) override;
  std::future<Result<std::vector<IndexEntry>>> list() override;
  std::future<Result<void>> insert(std::string name, Uuid uuid) override;

  /// Full path of the database file.
  static std::filesystem::path dbPath(const std::filesystem::path& dataDir);

private:
  std::shared_ptr<SqliteDb>       db_;
  std::shared_ptr<rt::ThreadPool> pool_;
};

} // namespace uuidres::store
