// Copyright (c) 2024 liudegui. MIT License.
//
// anydb::AnyRow -- one erased record.
//
// Design:
//   - Column list and column-name index are shared with every other row of
//     the same result set
//   - Values are owned and immutable once the row is built
//   - Typed accessors mirror the concrete query API: out-of-range columns and
//     NULL cells return the caller's null value

#pragma once

#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "anydb/any_column.hpp"
#include "anydb/any_value.hpp"
#include "anydb/column_names.hpp"

namespace anydb {

class AnyRow {
 public:
  AnyRow() = default;

  AnyRow(SharedAnyColumns columns, SharedColumnNames column_names,
         std::vector<AnyValueKind> values)
      : columns_(std::move(columns)),
        column_names_(std::move(column_names)),
        values_(std::move(values)) {}

  // --- Field info ---

  int32_t NumFields() const { return static_cast<int32_t>(values_.size()); }

  int32_t FieldIndex(const char* name) const {
    return LookupColumn(column_names_, name);
  }

  const char* FieldName(int32_t col) const {
    const AnyColumn* column = Column(col);
    return (column != nullptr) ? column->name.c_str() : nullptr;
  }

  const AnyColumn* Column(int32_t col) const {
    if (columns_ == nullptr || col < 0 ||
        col >= static_cast<int32_t>(columns_->size())) {
      return nullptr;
    }
    return &(*columns_)[static_cast<size_t>(col)];
  }

  // --- Field values ---

  const AnyValueKind* Value(int32_t col) const {
    if (col < 0 || col >= NumFields()) { return nullptr; }
    return &values_[static_cast<size_t>(col)];
  }

  const AnyValueKind* Value(const char* name) const {
    return Value(FieldIndex(name));
  }

  bool FieldIsNull(int32_t col) const {
    const AnyValueKind* v = Value(col);
    return v == nullptr || v->IsNull();
  }

  // --- Typed accessors ---

  int32_t GetInt(int32_t col, int32_t null_value = 0) const {
    return static_cast<int32_t>(GetInt64(col, null_value));
  }

  int32_t GetInt(const char* name, int32_t null_value = 0) const {
    return GetInt(FieldIndex(name), null_value);
  }

  int64_t GetInt64(int32_t col, int64_t null_value = 0) const {
    const AnyValueKind* v = Value(col);
    if (v == nullptr) { return null_value; }
    if (IsIntegerKind(v->Kind())) { return v->IntValue(); }
    if (v->Kind() == AnyTypeInfoKind::kReal ||
        v->Kind() == AnyTypeInfoKind::kDouble) {
      return static_cast<int64_t>(v->FloatValue());
    }
    return null_value;
  }

  int64_t GetInt64(const char* name, int64_t null_value = 0) const {
    return GetInt64(FieldIndex(name), null_value);
  }

  double GetDouble(int32_t col, double null_value = 0.0) const {
    const AnyValueKind* v = Value(col);
    if (v == nullptr) { return null_value; }
    if (v->Kind() == AnyTypeInfoKind::kReal ||
        v->Kind() == AnyTypeInfoKind::kDouble) {
      return v->FloatValue();
    }
    if (IsIntegerKind(v->Kind())) {
      return static_cast<double>(v->IntValue());
    }
    return null_value;
  }

  double GetDouble(const char* name, double null_value = 0.0) const {
    return GetDouble(FieldIndex(name), null_value);
  }

  std::string GetString(int32_t col, const char* null_value = "") const {
    const AnyValueKind* v = Value(col);
    if (v == nullptr || v->Kind() != AnyTypeInfoKind::kText) {
      return std::string(null_value != nullptr ? null_value : "");
    }
    return v->TextString();
  }

  std::string GetString(const char* name, const char* null_value = "") const {
    return GetString(FieldIndex(name), null_value);
  }

  const uint8_t* GetBlob(int32_t col, int32_t& out_len) const {
    out_len = 0;
    const AnyValueKind* v = Value(col);
    if (v == nullptr || (v->Kind() != AnyTypeInfoKind::kBlob &&
                         v->Kind() != AnyTypeInfoKind::kText)) {
      return nullptr;
    }
    out_len = static_cast<int32_t>(v->Size());
    return v->Data();
  }

  // --- Shared metadata ---

  const SharedAnyColumns& Columns() const { return columns_; }
  const SharedColumnNames& ColumnNames() const { return column_names_; }
  const std::vector<AnyValueKind>& Values() const { return values_; }

 private:
  SharedAnyColumns columns_;
  SharedColumnNames column_names_;
  std::vector<AnyValueKind> values_;
};

}  // namespace anydb
