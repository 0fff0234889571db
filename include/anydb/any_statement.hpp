// Copyright (c) 2024 liudegui. MIT License.
//
// anydb::AnyStatement -- erased prepared-statement handle.
//
// Carries the statement text, its parameter count and the result columns
// as reported by the backend at prepare time. Column metadata is shared
// with the concrete statement it was built from.

#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "anydb/any_column.hpp"
#include "anydb/column_names.hpp"

namespace anydb {

class AnyStatement {
 public:
  AnyStatement() = default;

  AnyStatement(std::string sql, int32_t num_params, SharedAnyColumns columns,
               SharedColumnNames column_names)
      : sql_(std::move(sql)),
        num_params_(num_params),
        columns_(std::move(columns)),
        column_names_(std::move(column_names)) {}

  const std::string& Sql() const { return sql_; }
  int32_t NumParams() const { return num_params_; }

  int32_t NumFields() const {
    return (columns_ != nullptr) ? static_cast<int32_t>(columns_->size()) : 0;
  }

  const AnyColumn* Column(int32_t col) const {
    if (col < 0 || col >= NumFields()) { return nullptr; }
    return &(*columns_)[static_cast<size_t>(col)];
  }

  int32_t FieldIndex(const char* name) const {
    return LookupColumn(column_names_, name);
  }

  bool Valid() const { return !sql_.empty(); }

  const SharedAnyColumns& Columns() const { return columns_; }
  const SharedColumnNames& ColumnNames() const { return column_names_; }

 private:
  std::string sql_;
  int32_t num_params_ = 0;
  SharedAnyColumns columns_;
  SharedColumnNames column_names_;
};

}  // namespace anydb
