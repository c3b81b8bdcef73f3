// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#ifndef ANCHORSYNC_STORE_DATABASE_HPP
#define ANCHORSYNC_STORE_DATABASE_HPP

#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace anchorsync {
namespace store {

/**
 * Raised for any SQLite failure (open, prepare, step, bind)
 */
class DatabaseError : public std::runtime_error {
public:
  explicit DatabaseError(const std::string &msg) : std::runtime_error(msg) {}
};

/**
 * RAII wrapper for sqlite3_stmt*
 *
 * Bind indices are 1-based as in the SQLite C API. Column indices are
 * 0-based.
 */
class Statement {
public:
  Statement(sqlite3 *db, sqlite3_stmt *stmt) : db_(db), stmt_(stmt) {}
  ~Statement();

  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;
  Statement(Statement &&other) noexcept;
  Statement &operator=(Statement &&other) noexcept;

  Statement &Bind(int index, int64_t value);
  Statement &Bind(int index, const std::string &value);
  Statement &Bind(int index, const std::optional<int64_t> &value);
  Statement &Bind(int index, const std::optional<std::string> &value);
  Statement &BindNull(int index);

  // Returns true while a row is available, false when done
  bool Step();

  // Step expecting no result rows
  void Run();

  bool IsNull(int column) const;
  int64_t ColumnInt64(int column) const;
  std::string ColumnText(int column) const;
  std::optional<int64_t> ColumnOptionalInt64(int column) const;
  std::optional<std::string> ColumnOptionalText(int column) const;

private:
  sqlite3 *db_ = nullptr;
  sqlite3_stmt *stmt_ = nullptr;
};

/**
 * Owning SQLite connection
 *
 * Opened in serialized (full mutex) mode. Components that run several
 * statements as one logical step lock mutex() around them.
 */
class Database {
public:
  // path may be ":memory:" for a private in-memory database
  explicit Database(const std::string &path);
  ~Database();

  Database(const Database &) = delete;
  Database &operator=(const Database &) = delete;

  void Exec(const std::string &sql);
  Statement Prepare(const std::string &sql);

  int64_t LastInsertRowId() const;
  int Changes() const;

  const std::string &path() const { return path_; }
  std::recursive_mutex &mutex() { return mutex_; }

private:
  std::string path_;
  sqlite3 *db_ = nullptr;
  std::recursive_mutex mutex_;
};

/**
 * Scoped BEGIN IMMEDIATE / COMMIT; rolls back if not committed
 */
class Transaction {
public:
  explicit Transaction(Database &db);
  ~Transaction();

  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  void Commit();

private:
  Database &db_;
  bool done_ = false;
};

} // namespace store
} // namespace anchorsync

#endif // ANCHORSYNC_STORE_DATABASE_HPP
