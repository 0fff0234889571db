// Copyright (c) 2024 liudegui. MIT License.
//
// anydb::SqliteValue / SqliteColumn / SqliteRow / SqliteQueryResult --
// materialized SQLite data.
//
// Design:
//   - A row copies every cell out of the statement when it is stepped, so it
//     stays valid after the statement moves on or is reset
//   - Column list and column-name index are built once per prepared
//     statement and shared by every row it produces
//   - A value's type is its storage class; NULL cells report kNull

#pragma once

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "sqlite3.h"

#include "anydb/column_names.hpp"
#include "anydb/sqlite_type_info.hpp"

namespace anydb {

// ---------------------------------------------------------------------------
// SqliteValue
// ---------------------------------------------------------------------------

class SqliteValue {
 public:
  SqliteValue() = default;

  /// Copy column `col` of the current row of `stmt`.
  static SqliteValue FromColumn(sqlite3_stmt* stmt, int32_t col) {
    SqliteValue v;
    int32_t code = sqlite3_column_type(stmt, col);
    v.type_info_ = SqliteTypeInfo::FromCode(code);
    switch (code) {
      case SQLITE_INTEGER:
        v.int_ = sqlite3_column_int64(stmt, col);
        break;
      case SQLITE_FLOAT:
        v.double_ = sqlite3_column_double(stmt, col);
        break;
      case SQLITE_TEXT: {
        const unsigned char* text = sqlite3_column_text(stmt, col);
        int32_t len = sqlite3_column_bytes(stmt, col);
        if (text != nullptr && len > 0) { v.bytes_.assign(text, text + len); }
        break;
      }
      case SQLITE_BLOB: {
        const uint8_t* blob =
            static_cast<const uint8_t*>(sqlite3_column_blob(stmt, col));
        int32_t len = sqlite3_column_bytes(stmt, col);
        if (blob != nullptr && len > 0) { v.bytes_.assign(blob, blob + len); }
        break;
      }
      default:
        break;
    }
    return v;
  }

  static SqliteValue Integer(int64_t value) {
    SqliteValue v;
    v.type_info_ = SqliteTypeInfo(SqliteDataType::kInt64);
    v.int_ = value;
    return v;
  }

  static SqliteValue Float(double value) {
    SqliteValue v;
    v.type_info_ = SqliteTypeInfo(SqliteDataType::kFloat);
    v.double_ = value;
    return v;
  }

  static SqliteValue Text(const std::string& value) {
    SqliteValue v;
    v.type_info_ = SqliteTypeInfo(SqliteDataType::kText);
    v.bytes_.assign(value.begin(), value.end());
    return v;
  }

  static SqliteValue Blob(std::vector<uint8_t> value) {
    SqliteValue v;
    v.type_info_ = SqliteTypeInfo(SqliteDataType::kBlob);
    v.bytes_ = std::move(value);
    return v;
  }

  bool IsNull() const { return type_info_.IsNull(); }
  const SqliteTypeInfo& TypeInfo() const { return type_info_; }

  // --- Decoding (SQLite's own conversions between storage classes) ---

  int64_t Int64() const {
    switch (type_info_.type) {
      case SqliteDataType::kFloat: return static_cast<int64_t>(double_);
      case SqliteDataType::kText: return std::strtoll(TextString().c_str(), nullptr, 10);
      default: return int_;
    }
  }

  double Double() const {
    switch (type_info_.type) {
      case SqliteDataType::kInt64: return static_cast<double>(int_);
      case SqliteDataType::kText: return std::strtod(TextString().c_str(), nullptr);
      default: return double_;
    }
  }

  std::string TextString() const {
    if (type_info_.type == SqliteDataType::kInt64) {
      return std::to_string(int_);
    }
    if (type_info_.type == SqliteDataType::kFloat) {
      char buf[32];
      std::snprintf(buf, sizeof(buf), "%.15g", double_);
      return std::string(buf);
    }
    return std::string(bytes_.begin(), bytes_.end());
  }

  const std::vector<uint8_t>& Bytes() const { return bytes_; }

 private:
  SqliteTypeInfo type_info_;
  int64_t int_ = 0;
  double double_ = 0.0;
  std::vector<uint8_t> bytes_;
};

// ---------------------------------------------------------------------------
// SqliteColumn
// ---------------------------------------------------------------------------

struct SqliteColumn {
  size_t ordinal = 0;
  std::string name;
  SqliteTypeInfo type_info;
};

using SharedSqliteColumns = std::shared_ptr<const std::vector<SqliteColumn>>;

/// Column metadata of a prepared statement, as reported by SQLite.
inline SharedSqliteColumns DescribeColumns(sqlite3_stmt* stmt) {
  auto columns = std::make_shared<std::vector<SqliteColumn>>();
  int32_t count = (stmt != nullptr) ? sqlite3_column_count(stmt) : 0;
  columns->reserve(static_cast<size_t>(count));
  for (int32_t i = 0; i < count; ++i) {
    SqliteColumn col;
    col.ordinal = static_cast<size_t>(i);
    const char* name = sqlite3_column_name(stmt, i);
    col.name = (name != nullptr) ? name : "";
    col.type_info = SqliteTypeInfo::FromDeclType(sqlite3_column_decltype(stmt, i));
    columns->push_back(std::move(col));
  }
  return columns;
}

inline SharedColumnNames IndexColumnNames(const SharedSqliteColumns& columns) {
  auto names = std::make_shared<ColumnNameMap>();
  if (columns != nullptr) {
    for (const SqliteColumn& col : *columns) {
      names->emplace(col.name, col.ordinal);
    }
  }
  return names;
}

// ---------------------------------------------------------------------------
// SqliteRow
// ---------------------------------------------------------------------------

class SqliteRow {
 public:
  SqliteRow() = default;

  SqliteRow(std::vector<SqliteValue> values, SharedSqliteColumns columns,
            SharedColumnNames column_names)
      : values_(std::move(values)),
        columns_(std::move(columns)),
        column_names_(std::move(column_names)) {}

  /// Copy the current row of `stmt`.
  static SqliteRow Current(sqlite3_stmt* stmt, const SharedSqliteColumns& columns,
                           const SharedColumnNames& column_names) {
    std::vector<SqliteValue> values;
    int32_t count = sqlite3_column_count(stmt);
    values.reserve(static_cast<size_t>(count));
    for (int32_t i = 0; i < count; ++i) {
      values.push_back(SqliteValue::FromColumn(stmt, i));
    }
    return SqliteRow(std::move(values), columns, column_names);
  }

  int32_t NumFields() const { return static_cast<int32_t>(values_.size()); }

  int32_t FieldIndex(const char* name) const {
    return LookupColumn(column_names_, name);
  }

  const SqliteValue* Value(int32_t col) const {
    if (col < 0 || col >= NumFields()) { return nullptr; }
    return &values_[static_cast<size_t>(col)];
  }

  const SqliteColumn* Column(int32_t col) const {
    if (columns_ == nullptr || col < 0 ||
        col >= static_cast<int32_t>(columns_->size())) {
      return nullptr;
    }
    return &(*columns_)[static_cast<size_t>(col)];
  }

  const SharedSqliteColumns& Columns() const { return columns_; }
  const SharedColumnNames& ColumnNames() const { return column_names_; }

 private:
  std::vector<SqliteValue> values_;
  SharedSqliteColumns columns_;
  SharedColumnNames column_names_;
};

// ---------------------------------------------------------------------------
// SqliteQueryResult
// ---------------------------------------------------------------------------

struct SqliteQueryResult {
  uint64_t changes = 0;
  int64_t last_insert_rowid = 0;

  uint64_t RowsAffected() const { return changes; }
  int64_t LastInsertRowid() const { return last_insert_rowid; }
};

}  // namespace anydb
