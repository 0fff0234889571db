// Copyright (c) 2024 liudegui. MIT License.
//
// anydb::SqliteHandle -- the live sqlite3 connection with RAII.
//
// Design:
//   - Wraps sqlite3* with RAII
//   - Move-only (no copy)
//   - Error reporting via Error return / Error* output parameter
//   - Owned by exactly one SqliteWorker thread; never shared

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

#include "sqlite3.h"

#include "anydb/error.hpp"
#include "anydb/sqlite_error.hpp"
#include "anydb/sqlite_statement.hpp"

namespace anydb {

// ---------------------------------------------------------------------------
// SqliteHandle
// ---------------------------------------------------------------------------

class SqliteHandle {
 public:
  SqliteHandle() = default;

  ~SqliteHandle() { CloseHard(); }

  // Move
  SqliteHandle(SqliteHandle&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
  }

  SqliteHandle& operator=(SqliteHandle&& other) noexcept {
    if (this != &other) {
      CloseHard();
      db_ = other.db_;
      other.db_ = nullptr;
    }
    return *this;
  }

  // No copy
  SqliteHandle(const SqliteHandle&) = delete;
  SqliteHandle& operator=(const SqliteHandle&) = delete;

  // --- Open / Close ---

  Error Open(const char* filename, int32_t flags) {
    if (filename == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "filename is null");
    }
    CloseHard();
    int32_t rc = sqlite3_open_v2(filename, &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
      Error err = (db_ != nullptr)
                      ? MakeSqliteError(db_, rc)
                      : Error::Make(ErrorCode::kError, "sqlite3_open_v2 failed");
      if (db_ != nullptr) {
        sqlite3_close(db_);
        db_ = nullptr;
      }
      return err;
    }
    sqlite3_extended_result_codes(db_, 1);
    return Error::Ok();
  }

  /// Graceful close. Fails (and keeps the handle) while statements are open.
  Error Close() {
    if (db_ == nullptr) { return Error::Ok(); }
    int32_t rc = sqlite3_close(db_);
    if (rc != SQLITE_OK) { return MakeSqliteError(db_, rc); }
    db_ = nullptr;
    return Error::Ok();
  }

  /// Deferred close: the handle is released once its statements are gone.
  void CloseHard() {
    if (db_ != nullptr) {
      sqlite3_close_v2(db_);
      db_ = nullptr;
    }
  }

  bool IsOpen() const { return db_ != nullptr; }

  // --- Exec ---

  /// Execute SQL without result rows (transaction control, pragmas).
  Error Exec(const char* sql) {
    if (db_ == nullptr) {
      return Error::Make(ErrorCode::kNotOpen, "Database not open");
    }
    if (sql == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "sql is null");
    }

    char* errmsg = nullptr;
    int32_t rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
    if (rc == SQLITE_OK) { return Error::Ok(); }

    ErrorCode code = SqliteErrorCode(rc);
    Error err = Error::Make(code == ErrorCode::kOk ? ErrorCode::kError : code,
                            errmsg ? errmsg : sqlite3_errmsg(db_));
    if (errmsg != nullptr) { sqlite3_free(errmsg); }
    return err;
  }

  // --- Prepare ---

  /// Compile the statement of `sql` that starts at *offset and advance
  /// *offset past it. Whitespace and comments are skipped; when nothing is
  /// left, `out` is left invalid and *offset is set to the end.
  Error PrepareNext(const std::string& sql, size_t* offset, bool persistent,
                    SqliteStatementHandle* out) {
    if (db_ == nullptr) {
      return Error::Make(ErrorCode::kNotOpen, "Database not open");
    }
    *out = SqliteStatementHandle();
    const char* begin = sql.c_str();
    const char* end = begin + sql.size();
    const char* cursor = begin + *offset;
    uint32_t flags = persistent ? SQLITE_PREPARE_PERSISTENT : 0;
    while (cursor < end) {
      sqlite3_stmt* stmt = nullptr;
      const char* tail = nullptr;
      int32_t rc = sqlite3_prepare_v3(db_, cursor,
                                      static_cast<int32_t>(end - cursor),
                                      flags, &stmt, &tail);
      if (rc != SQLITE_OK) { return MakeSqliteError(db_, rc); }
      cursor = (tail != nullptr && tail > cursor) ? tail : end;
      if (stmt != nullptr) {
        *offset = static_cast<size_t>(cursor - begin);
        *out = SqliteStatementHandle(db_, stmt);
        return Error::Ok();
      }
    }
    *offset = sql.size();
    return Error::Ok();
  }

  // --- Info ---

  int64_t TotalChanges() const {
    return (db_ != nullptr) ? sqlite3_total_changes64(db_) : 0;
  }

  /// Rows changed directly by the most recent INSERT/UPDATE/DELETE; rows
  /// touched by triggers and foreign-key actions are not counted.
  int64_t Changes() const {
    return (db_ != nullptr) ? sqlite3_changes64(db_) : 0;
  }

  int64_t LastInsertRowid() const {
    return (db_ != nullptr) ? sqlite3_last_insert_rowid(db_) : 0;
  }

  bool InTransaction() const {
    if (db_ == nullptr) { return false; }
    return sqlite3_get_autocommit(db_) == 0;
  }

  void SetBusyTimeout(int32_t ms) {
    if (db_ != nullptr) { sqlite3_busy_timeout(db_, ms); }
  }

  sqlite3* Handle() const { return db_; }

 private:
  sqlite3* db_ = nullptr;
};

}  // namespace anydb
