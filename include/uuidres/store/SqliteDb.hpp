#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace uuidres::store {

// Failure reported by SQLite; carries the primary result code.
class StoreError : public std::runtime_error {
public:
  StoreError(int rc, const std::string& what)
    : std::runtime_error(what), rc_(rc) {}

  int code() const noexcept { return rc_; }

private:
  int rc_;
};

// One SQLite connection. Opened in serialized mode so any worker thread may
// use it; txnMutex() admits a single transaction at a time.
class SqliteDb {
public:
  // Opens (creating if needed) `file`, caps its size at `mapSize` bytes.
  SqliteDb(const std::string& file, std::uint64_t mapSize);
  ~SqliteDb();

  SqliteDb(const SqliteDb&)            = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;

  void exec(const char* sql);

  sqlite3* raw() const { return db_; }
  std::mutex& txnMutex() { return txnMx_; }
  const std::string& file() const { return file_; }

  [[noreturn]] void fail(int rc, const std::string& context) const;

private:
  std::string file_;
  sqlite3*    db_ = nullptr;
  std::mutex  txnMx_;
};

class Statement {
public:
  Statement(SqliteDb& db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  void bindText(int idx, const std::string& s);
  void bindBlob(int idx, const void* data, std::size_t size);

  // true while a row is available, false once done.
  bool step();

  std::string columnText(int col) const;
  // Copy of the column bytes (blob or text).
  std::string columnBytes(int col) const;
  std::int64_t columnInt(int col) const;

private:
  SqliteDb&     db_;
  sqlite3_stmt* stmt_ = nullptr;
};

enum class TxnMode { Read, Write };

// Scoped transaction: rolled back unless commit() succeeds.
class Transaction {
public:
  Transaction(SqliteDb& db, TxnMode mode);
  ~Transaction();

  Transaction(const Transaction&)            = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit();

private:
  SqliteDb&                    db_;
  std::unique_lock<std::mutex> lock_;
  bool                         open_ = false;
};

} // namespace uuidres::store
