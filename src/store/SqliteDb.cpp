#include "uuidres/store/SqliteDb.hpp"
#include "uuidres/util/Logger.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <string>

namespace uuidres::store {

SqliteDb::SqliteDb(const std::string& file, std::uint64_t mapSize)
  : file_(file)
{
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  int rc = sqlite3_open_v2(file_.c_str(), &db_, flags, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    if (db_) {
      sqlite3_close(db_);
      db_ = nullptr;
    }
    throw StoreError(rc, "cannot open " + file_ + ": " + msg);
  }

  sqlite3_extended_result_codes(db_, 0);
  sqlite3_busy_timeout(db_, 5000);

  try {
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=FULL;");

    std::int64_t pageSize = 4096;
    {
      Statement st(*this, "PRAGMA page_size;");
      if (st.step()) pageSize = std::max<std::int64_t>(512, st.columnInt(0));
    }
    auto maxPages = std::max<std::uint64_t>(1, mapSize / static_cast<std::uint64_t>(pageSize));
    exec(("PRAGMA max_page_count=" + std::to_string(maxPages) + ";").c_str());
  } catch (const StoreError&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDb::~SqliteDb() {
  if (db_) {
    int rc = sqlite3_close(db_);
    if (rc != SQLITE_OK) {
      util::logger().log(util::LogLevel::Warn, "sqlite close failed",
                         {{"file", file_}, {"rc", std::to_string(rc)}});
    }
    db_ = nullptr;
  }
}

void SqliteDb::fail(int rc, const std::string& context) const {
  throw StoreError(rc, context + ": " + sqlite3_errmsg(db_));
}

void SqliteDb::exec(const char* sql) {
  char* errMsg = nullptr;
  int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errMsg);
  if (rc != SQLITE_OK) {
    std::string msg = errMsg ? errMsg : sqlite3_errstr(rc);
    if (errMsg) sqlite3_free(errMsg);
    throw StoreError(rc, std::string("'") + sql + "' failed: " + msg);
  }
}

// ---------------------------------------------------------------------------

Statement::Statement(SqliteDb& db, const char* sql)
  : db_(db)
{
  int rc = sqlite3_prepare_v2(db_.raw(), sql, -1, &stmt_, nullptr);
  if (rc != SQLITE_OK) db_.fail(rc, std::string("prepare '") + sql + "'");
}

Statement::~Statement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

void Statement::bindText(int idx, const std::string& s) {
  int rc = sqlite3_bind_text(stmt_, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
  if (rc != SQLITE_OK) db_.fail(rc, "bind text");
}

void Statement::bindBlob(int idx, const void* data, std::size_t size) {
  int rc = sqlite3_bind_blob(stmt_, idx, data, static_cast<int>(size), SQLITE_TRANSIENT);
  if (rc != SQLITE_OK) db_.fail(rc, "bind blob");
}

bool Statement::step() {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW)  return true;
  if (rc == SQLITE_DONE) return false;
  db_.fail(rc, "step");
}

std::string Statement::columnText(int col) const {
  const auto* p = sqlite3_column_text(stmt_, col);
  int n = sqlite3_column_bytes(stmt_, col);
  if (!p) return {};
  return std::string(reinterpret_cast<const char*>(p), static_cast<std::size_t>(n));
}

std::string Statement::columnBytes(int col) const {
  const void* p = sqlite3_column_blob(stmt_, col);
  int n = sqlite3_column_bytes(stmt_, col);
  if (!p || n <= 0) return {};
  return std::string(static_cast<const char*>(p), static_cast<std::size_t>(n));
}

std::int64_t Statement::columnInt(int col) const {
  return sqlite3_column_int64(stmt_, col);
}

// ---------------------------------------------------------------------------

Transaction::Transaction(SqliteDb& db, TxnMode mode)
  : db_(db), lock_(db.txnMutex())
{
  db_.exec(mode == TxnMode::Write ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
  open_ = true;
}

Transaction::~Transaction() {
  if (!open_) return;
  // SQLite already rolled back on its own (e.g. SQLITE_FULL during commit)
  if (sqlite3_get_autocommit(db_.raw())) return;
  char* errMsg = nullptr;
  int rc = sqlite3_exec(db_.raw(), "ROLLBACK;", nullptr, nullptr, &errMsg);
  if (rc != SQLITE_OK) {
    util::logger().log(util::LogLevel::Warn, "rollback failed",
                       {{"file", db_.file()}, {"err", errMsg ? errMsg : sqlite3_errstr(rc)}});
  }
  if (errMsg) sqlite3_free(errMsg);
}

void Transaction::commit() {
  db_.exec("COMMIT;");
  open_ = false;
}

} // namespace uuidres::store
