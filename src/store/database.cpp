// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#include "store/database.hpp"
#include "util/logging.hpp"
#include <sqlite3.h>

namespace anchorsync {
namespace store {

// ============================================================================
// Statement
// ============================================================================

Statement::~Statement() {
  if (stmt_) {
    sqlite3_finalize(stmt_);
  }
}

Statement::Statement(Statement &&other) noexcept
    : db_(other.db_), stmt_(other.stmt_) {
  other.stmt_ = nullptr;
}

Statement &Statement::operator=(Statement &&other) noexcept {
  if (this != &other) {
    if (stmt_) {
      sqlite3_finalize(stmt_);
    }
    db_ = other.db_;
    stmt_ = other.stmt_;
    other.stmt_ = nullptr;
  }
  return *this;
}

Statement &Statement::Bind(int index, int64_t value) {
  if (sqlite3_bind_int64(stmt_, index, value) != SQLITE_OK) {
    throw DatabaseError(sqlite3_errmsg(db_));
  }
  return *this;
}

Statement &Statement::Bind(int index, const std::string &value) {
  if (sqlite3_bind_text(stmt_, index, value.c_str(),
                        static_cast<int>(value.size()),
                        SQLITE_TRANSIENT) != SQLITE_OK) {
    throw DatabaseError(sqlite3_errmsg(db_));
  }
  return *this;
}

Statement &Statement::Bind(int index, const std::optional<int64_t> &value) {
  return value ? Bind(index, *value) : BindNull(index);
}

Statement &Statement::Bind(int index, const std::optional<std::string> &value) {
  return value ? Bind(index, *value) : BindNull(index);
}

Statement &Statement::BindNull(int index) {
  if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) {
    throw DatabaseError(sqlite3_errmsg(db_));
  }
  return *this;
}

bool Statement::Step() {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  throw DatabaseError(sqlite3_errmsg(db_));
}

void Statement::Run() {
  int rc = sqlite3_step(stmt_);
  if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
    throw DatabaseError(sqlite3_errmsg(db_));
  }
}

bool Statement::IsNull(int column) const {
  return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

int64_t Statement::ColumnInt64(int column) const {
  return sqlite3_column_int64(stmt_, column);
}

std::string Statement::ColumnText(int column) const {
  const unsigned char *text = sqlite3_column_text(stmt_, column);
  if (!text) {
    return {};
  }
  return std::string(reinterpret_cast<const char *>(text),
                     static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::optional<int64_t> Statement::ColumnOptionalInt64(int column) const {
  if (IsNull(column)) {
    return std::nullopt;
  }
  return ColumnInt64(column);
}

std::optional<std::string> Statement::ColumnOptionalText(int column) const {
  if (IsNull(column)) {
    return std::nullopt;
  }
  return ColumnText(column);
}

// ============================================================================
// Database
// ============================================================================

Database::Database(const std::string &path) : path_(path) {
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    if (db_) {
      sqlite3_close(db_);
      db_ = nullptr;
    }
    throw DatabaseError("Failed to open database " + path + ": " + msg);
  }

  sqlite3_busy_timeout(db_, 5000);
  if (path != ":memory:") {
    Exec("PRAGMA journal_mode=WAL");
  }
  LOG_DEBUG("Opened database {}", path);
}

Database::~Database() {
  if (db_) {
    sqlite3_close(db_);
  }
}

void Database::Exec(const std::string &sql) {
  char *err = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw DatabaseError(msg);
  }
}

Statement Database::Prepare(const std::string &sql) {
  sqlite3_stmt *stmt = nullptr;
  int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    throw DatabaseError(sqlite3_errmsg(db_));
  }
  return Statement(db_, stmt);
}

int64_t Database::LastInsertRowId() const {
  return sqlite3_last_insert_rowid(db_);
}

int Database::Changes() const { return sqlite3_changes(db_); }

// ============================================================================
// Transaction
// ============================================================================

Transaction::Transaction(Database &db) : db_(db) {
  db_.Exec("BEGIN IMMEDIATE");
}

Transaction::~Transaction() {
  if (done_) {
    return;
  }
  try {
    db_.Exec("ROLLBACK");
  } catch (const DatabaseError &e) {
    LOG_ERROR("Rollback failed on {}: {}", db_.path(), e.what());
  }
}

void Transaction::Commit() {
  db_.Exec("COMMIT");
  done_ = true;
}

} // namespace store
} // namespace anchorsync
