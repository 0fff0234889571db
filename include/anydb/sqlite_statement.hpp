// Copyright (c) 2024 liudegui. MIT License.
//
// anydb::SqliteStatementHandle -- one prepared sqlite3_stmt with RAII.
//
// Design:
//   - Wraps sqlite3_stmt* with RAII
//   - Move-only (no copy)
//   - 1-based parameter binding (matches SQLite3 convention)
//   - Column metadata is read once at prepare time and shared by every row
//   - Only ever touched by the connection's worker thread

#pragma once

#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "sqlite3.h"

#include "anydb/column_names.hpp"
#include "anydb/error.hpp"
#include "anydb/sqlite_error.hpp"
#include "anydb/sqlite_value.hpp"

namespace anydb {

enum class StepResult : uint8_t {
  kRow,
  kDone,
  kError,
};

// ---------------------------------------------------------------------------
// SqliteStatementHandle
// ---------------------------------------------------------------------------

class SqliteStatementHandle {
 public:
  SqliteStatementHandle() = default;

  SqliteStatementHandle(sqlite3* db, sqlite3_stmt* stmt)
      : db_(db), stmt_(stmt) {
    columns_ = DescribeColumns(stmt_);
    column_names_ = IndexColumnNames(columns_);
  }

  ~SqliteStatementHandle() { Finalize(); }

  // Move
  SqliteStatementHandle(SqliteStatementHandle&& other) noexcept
      : db_(other.db_),
        stmt_(other.stmt_),
        columns_(std::move(other.columns_)),
        column_names_(std::move(other.column_names_)),
        described_(other.described_) {
    other.db_ = nullptr;
    other.stmt_ = nullptr;
  }

  SqliteStatementHandle& operator=(SqliteStatementHandle&& other) noexcept {
    if (this != &other) {
      Finalize();
      db_ = other.db_;
      stmt_ = other.stmt_;
      columns_ = std::move(other.columns_);
      column_names_ = std::move(other.column_names_);
      described_ = other.described_;
      other.db_ = nullptr;
      other.stmt_ = nullptr;
    }
    return *this;
  }

  // No copy
  SqliteStatementHandle(const SqliteStatementHandle&) = delete;
  SqliteStatementHandle& operator=(const SqliteStatementHandle&) = delete;

  // --- Execute ---

  StepResult Step(Error* out_error = nullptr) {
    if (stmt_ == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kMisuse, "Statement not initialized");
      }
      return StepResult::kError;
    }
    int32_t rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW || rc == SQLITE_DONE) {
      if (!described_) { RefreshColumns(); }
      return (rc == SQLITE_ROW) ? StepResult::kRow : StepResult::kDone;
    }
    if (out_error != nullptr) { *out_error = MakeSqliteError(db_, rc); }
    return StepResult::kError;
  }

  /// Copy of the current row (valid after Step() returned kRow).
  SqliteRow CurrentRow() const {
    return SqliteRow::Current(stmt_, columns_, column_names_);
  }

  // --- Bind (1-based index) ---

  Error Bind(int32_t param, int32_t value) {
    if (stmt_ == nullptr) { return NotInitialized(); }
    return Check(sqlite3_bind_int(stmt_, param, value));
  }

  Error Bind(int32_t param, int64_t value) {
    if (stmt_ == nullptr) { return NotInitialized(); }
    return Check(sqlite3_bind_int64(stmt_, param, value));
  }

  Error Bind(int32_t param, double value) {
    if (stmt_ == nullptr) { return NotInitialized(); }
    return Check(sqlite3_bind_double(stmt_, param, value));
  }

  /// `copy` false binds with SQLITE_STATIC: the bytes must outlive the
  /// current execution of the statement.
  Error BindText(int32_t param, const char* text, int32_t len, bool copy) {
    if (stmt_ == nullptr) { return NotInitialized(); }
    return Check(sqlite3_bind_text(stmt_, param, text != nullptr ? text : "",
                                   len,
                                   copy ? SQLITE_TRANSIENT : SQLITE_STATIC));
  }

  Error BindBlob(int32_t param, const uint8_t* blob, int32_t len, bool copy) {
    if (stmt_ == nullptr) { return NotInitialized(); }
    if (blob == nullptr || len == 0) {
      return Check(sqlite3_bind_zeroblob(stmt_, param, 0));
    }
    return Check(sqlite3_bind_blob(stmt_, param, blob, len,
                                   copy ? SQLITE_TRANSIENT : SQLITE_STATIC));
  }

  Error BindNull(int32_t param) {
    if (stmt_ == nullptr) { return NotInitialized(); }
    return Check(sqlite3_bind_null(stmt_, param));
  }

  int32_t BindParameterCount() const {
    return (stmt_ != nullptr) ? sqlite3_bind_parameter_count(stmt_) : 0;
  }

  // --- Reset ---

  /// Reset to the start and drop every binding.
  Error Reset() {
    if (stmt_ == nullptr) { return NotInitialized(); }
    int32_t rc = sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
    described_ = false;
    if (rc != SQLITE_OK) { return MakeSqliteError(db_, rc); }
    return Error::Ok();
  }

  void Finalize() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
      stmt_ = nullptr;
    }
  }

  // --- Metadata ---

  int32_t ColumnCount() const {
    return (columns_ != nullptr) ? static_cast<int32_t>(columns_->size()) : 0;
  }
  const SharedSqliteColumns& Columns() const { return columns_; }
  const SharedColumnNames& ColumnNames() const { return column_names_; }

  bool ReadOnly() const {
    return stmt_ != nullptr && sqlite3_stmt_readonly(stmt_) != 0;
  }

  bool Valid() const { return stmt_ != nullptr; }
  sqlite3_stmt* Handle() const { return stmt_; }

 private:
  /// SQLite recompiles a statement after a schema change on its next step,
  /// which can change its result columns. Rebuild the shared metadata when
  /// it no longer matches.
  void RefreshColumns() {
    described_ = true;
    int32_t count = sqlite3_column_count(stmt_);
    bool stale = (columns_ == nullptr ||
                  static_cast<size_t>(count) != columns_->size());
    for (int32_t i = 0; !stale && i < count; ++i) {
      const char* name = sqlite3_column_name(stmt_, i);
      stale = ((*columns_)[static_cast<size_t>(i)].name !=
               (name != nullptr ? name : ""));
    }
    if (!stale) { return; }
    columns_ = DescribeColumns(stmt_);
    column_names_ = IndexColumnNames(columns_);
  }

  Error Check(int32_t rc) const {
    if (rc != SQLITE_OK) { return MakeSqliteError(db_, rc); }
    return Error::Ok();
  }

  static Error NotInitialized() {
    return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
  }

  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
  SharedSqliteColumns columns_ = std::make_shared<std::vector<SqliteColumn>>();
  SharedColumnNames column_names_ = std::make_shared<ColumnNameMap>();
  bool described_ = true;
};

}  // namespace anydb
