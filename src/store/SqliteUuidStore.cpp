#include "uuidres/store/SqliteUuidStore.hpp"
#include "uuidres/store/SqliteDb.hpp"
#include "uuidres/rt/ThreadPool.hpp"
#include "uuidres/util/Logger.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <system_error>
#include <utility>

namespace uuidres::store {

namespace {

Error storageError(const StoreError& e) {
  return Error{ErrorCode::Storage, std::string("Database error: ") + e.what()};
}

Result<Uuid> decodeStored(const std::string& name, const std::string& bytes) {
  auto uuid = uuidFromBytes(bytes.data(), bytes.size());
  if (!uuid) {
    return Error{ErrorCode::Decoding,
                 "stored uuid for \"" + name + "\" has " + std::to_string(bytes.size()) + " bytes"};
  }
  return *uuid;
}

std::optional<std::string> selectRaw(SqliteDb& db, const std::string& name) {
  Statement st(db, "SELECT uuid FROM index_uuids WHERE name = ?1;");
  st.bindText(1, name);
  if (!st.step()) return std::nullopt;
  return st.columnBytes(0);
}

void put(SqliteDb& db, const std::string& name, const Uuid& uuid) {
  Statement st(db, "INSERT OR REPLACE INTO index_uuids (name, uuid) VALUES (?1, ?2);");
  st.bindText(1, name);
  st.bindBlob(2, uuid.begin(), uuid.size());
  st.step();
}

} // namespace

std::filesystem::path SqliteUuidStore::dbPath(const std::filesystem::path& dataDir) {
  return dataDir / kDirName / kFileName;
}

SqliteUuidStore::SqliteUuidStore(const std::filesystem::path& dataDir,
                                 std::uint64_t mapSize,
                                 std::shared_ptr<rt::ThreadPool> pool)
  : pool_(std::move(pool))
{
  if (!pool_) throw std::invalid_argument("SqliteUuidStore: worker pool is required");

  auto dir = dataDir / kDirName;
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw StoreError(SQLITE_CANTOPEN, "cannot create " + dir.string() + ": " + ec.message());
  }

  db_ = std::make_shared<SqliteDb>(dbPath(dataDir).string(), mapSize);
  db_->exec(
    "CREATE TABLE IF NOT EXISTS index_uuids ("
    "    name TEXT PRIMARY KEY NOT NULL,"
    "    uuid BLOB NOT NULL"
    ") WITHOUT ROWID;");

  util::logger().log(util::LogLevel::Info, "uuid store opened",
                     {{"path", db_->file()}, {"mapSize", std::to_string(mapSize)}});
}

SqliteUuidStore::~SqliteUuidStore() = default;

std::future<Result<Uuid>> SqliteUuidStore::createUuid(std::string name, bool rejectIfExists) {
  auto db = db_;
  return pool_->submit([db, name = std::move(name), rejectIfExists]() -> Result<Uuid> {
    try {
      Transaction txn(*db, TxnMode::Write);
      if (auto raw = selectRaw(*db, name)) {
        if (rejectIfExists) return nameAlreadyExists(name);
        return decodeStored(name, *raw);
      }
      Uuid uuid = newUuidV4();
      put(*db, name, uuid);
      txn.commit();
      return uuid;
    } catch (const StoreError& e) {
      return storageError(e);
    }
  });
}

std::future<Result<std::optional<Uuid>>> SqliteUuidStore::getUuid(std::string name) {
  auto db = db_;
  return pool_->submit([db, name = std::move(name)]() -> Result<std::optional<Uuid>> {
    try {
      Transaction txn(*db, TxnMode::Read);
      auto raw = selectRaw(*db, name);
      if (!raw) return std::optional<Uuid>{};
      auto uuid = decodeStored(name, *raw);
      if (!uuid) return uuid.error();
      return std::optional<Uuid>{*uuid};
    } catch (const StoreError& e) {
      return storageError(e);
    }
  });
}

std::future<Result<std::optional<Uuid>>> SqliteUuidStore::remove(std::string name) {
  auto db = db_;
  return pool_->submit([db, name = std::move(name)]() -> Result<std::optional<Uuid>> {
    try {
      Transaction txn(*db, TxnMode::Write);
      auto raw = selectRaw(*db, name);
      if (!raw) return std::optional<Uuid>{};
      auto uuid = decodeStored(name, *raw);
      if (!uuid) return uuid.error();

      Statement del(*db, "DELETE FROM index_uuids WHERE name = ?1;");
      del.bindText(1, name);
      del.step();
      txn.commit();
      return std::optional<Uuid>{*uuid};
    } catch (const StoreError& e) {
      return storageError(e);
    }
  });
}

std::future<Result<std::vector<IndexEntry>>> SqliteUuidStore::list() {
  auto db = db_;
  return pool_->submit([db]() -> Result<std::vector<IndexEntry>> {
    try {
      Transaction txn(*db, TxnMode::Read);
      std::vector<IndexEntry> entries;
      Statement st(*db, "SELECT name, uuid FROM index_uuids;");
      while (st.step()) {
        std::string name = st.columnText(0);
        auto uuid = decodeStored(name, st.columnBytes(1));
        if (!uuid) return uuid.error();
        entries.push_back(IndexEntry{std::move(name), *uuid});
      }
      return entries;
    } catch (const StoreError& e) {
      return storageError(e);
    }
  });
}

std::future<Result<void>> SqliteUuidStore::insert(std::string name, Uuid uuid) {
  auto db = db_;
  return pool_->submit([db, name = std::move(name), uuid]() -> Result<void> {
    try {
      Transaction txn(*db, TxnMode::Write);
      put(*db, name, uuid);
      txn.commit();
      return {};
    } catch (const StoreError& e) {
      return storageError(e);
    }
  });
}

} // namespace uuidres::store
