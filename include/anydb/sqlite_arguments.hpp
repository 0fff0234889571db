// Copyright (c) 2024 liudegui. MIT License.
//
// anydb::SqliteArgumentValue / SqliteArguments -- SQLite-native bound values.
//
// Design:
//   - One variant per sqlite3_bind_* family
//   - Text and blob are owned (bound with SQLITE_TRANSIENT) or borrowed
//     (bound with SQLITE_STATIC). A borrowed value points into a buffer the
//     caller keeps alive until the statement has finished executing
//   - Arguments are consumed positionally across the statements of a batch

#pragma once

#include <climits>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "anydb/error.hpp"
#include "anydb/ownership.hpp"
#include "anydb/sqlite_statement.hpp"

namespace anydb {

// ---------------------------------------------------------------------------
// SqliteArgumentValue
// ---------------------------------------------------------------------------

class SqliteArgumentValue {
 public:
  enum class Type : uint8_t { kNull, kInt, kInt64, kDouble, kText, kBlob };

  SqliteArgumentValue() = default;

  static SqliteArgumentValue Null() { return SqliteArgumentValue{}; }

  static SqliteArgumentValue Int(int32_t value) {
    SqliteArgumentValue v(Type::kInt);
    v.int_ = value;
    return v;
  }

  static SqliteArgumentValue Int64(int64_t value) {
    SqliteArgumentValue v(Type::kInt64);
    v.int_ = value;
    return v;
  }

  static SqliteArgumentValue Double(double value) {
    SqliteArgumentValue v(Type::kDouble);
    v.double_ = value;
    return v;
  }

  static SqliteArgumentValue Text(std::string value) {
    SqliteArgumentValue v(Type::kText);
    v.bytes_.assign(value.begin(), value.end());
    return v;
  }

  static SqliteArgumentValue TextRef(const char* data, size_t len) {
    SqliteArgumentValue v(Type::kText);
    v.ownership_ = Ownership::kBorrowed;
    v.ref_ = reinterpret_cast<const uint8_t*>(data);
    v.ref_len_ = len;
    return v;
  }

  static SqliteArgumentValue Blob(std::vector<uint8_t> value) {
    SqliteArgumentValue v(Type::kBlob);
    v.bytes_ = std::move(value);
    return v;
  }

  static SqliteArgumentValue BlobRef(const uint8_t* data, size_t len) {
    SqliteArgumentValue v(Type::kBlob);
    v.ownership_ = Ownership::kBorrowed;
    v.ref_ = data;
    v.ref_len_ = len;
    return v;
  }

  Type GetType() const { return type_; }
  Ownership GetOwnership() const { return ownership_; }
  bool IsBorrowed() const { return ownership_ == Ownership::kBorrowed; }

  int64_t IntValue() const { return int_; }
  double DoubleValue() const { return double_; }

  const uint8_t* Data() const {
    if (ownership_ == Ownership::kBorrowed) { return ref_; }
    return bytes_.empty() ? nullptr : bytes_.data();
  }

  size_t Size() const {
    return (ownership_ == Ownership::kBorrowed) ? ref_len_ : bytes_.size();
  }

  Error BindTo(SqliteStatementHandle& stmt, int32_t param) const {
    switch (type_) {
      case Type::kNull:
        return stmt.BindNull(param);
      case Type::kInt:
        return stmt.Bind(param, static_cast<int32_t>(int_));
      case Type::kInt64:
        return stmt.Bind(param, int_);
      case Type::kDouble:
        return stmt.Bind(param, double_);
      case Type::kText:
      case Type::kBlob: {
        if (Size() > static_cast<size_t>(INT_MAX)) {
          Error err;
          err.SetFormat(ErrorCode::kRange,
                        "argument %d is too large to bind (%zu bytes)", param,
                        Size());
          return err;
        }
        bool copy = !IsBorrowed();
        if (type_ == Type::kText) {
          return stmt.BindText(param, reinterpret_cast<const char*>(Data()),
                               static_cast<int32_t>(Size()), copy);
        }
        return stmt.BindBlob(param, Data(), static_cast<int32_t>(Size()), copy);
      }
    }
    return Error::Make(ErrorCode::kMisuse, "unknown argument type");
  }

 private:
  explicit SqliteArgumentValue(Type type) : type_(type) {}

  Type type_ = Type::kNull;
  Ownership ownership_ = Ownership::kOwned;
  int64_t int_ = 0;
  double double_ = 0.0;
  std::vector<uint8_t> bytes_;
  const uint8_t* ref_ = nullptr;
  size_t ref_len_ = 0;
};

// ---------------------------------------------------------------------------
// SqliteArguments
// ---------------------------------------------------------------------------

class SqliteArguments {
 public:
  SqliteArguments() = default;

  void Add(SqliteArgumentValue value) { values_.push_back(std::move(value)); }
  void Reserve(size_t n) { values_.reserve(n); }

  size_t Len() const { return values_.size(); }
  bool Empty() const { return values_.empty(); }
  const std::vector<SqliteArgumentValue>& Values() const { return values_; }

  /// Bind the next `stmt.BindParameterCount()` values starting at *offset.
  Error BindTo(SqliteStatementHandle& stmt, size_t* offset) const {
    int32_t count = stmt.BindParameterCount();
    for (int32_t param = 1; param <= count; ++param) {
      if (*offset >= values_.size()) {
        Error err;
        err.SetFormat(ErrorCode::kRange,
                      "statement expects more arguments than the %zu given",
                      values_.size());
        return err;
      }
      Error err = values_[*offset].BindTo(stmt, param);
      if (!err.ok()) { return err; }
      ++*offset;
    }
    return Error::Ok();
  }

 private:
  std::vector<SqliteArgumentValue> values_;
};

}  // namespace anydb
