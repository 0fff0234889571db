// Copyright (c) 2024 liudegui. MIT License.
//
// anydb::AnyDescribe -- erased static description of a statement.

#pragma once

#include <cstdint>
#include <vector>

#include "anydb/any_column.hpp"
#include "anydb/any_type_info.hpp"

namespace anydb {

enum class Nullability : uint8_t {
  kUnknown,
  kNullable,
  kNotNull,
};

struct AnyDescribe {
  std::vector<AnyColumn> columns;

  // Backends that infer parameter types fill `parameter_types`; the others
  // only know how many parameters there are.
  bool has_parameter_types = false;
  std::vector<AnyTypeInfo> parameter_types;
  int32_t parameter_count = 0;

  // One entry per column.
  std::vector<Nullability> nullable;

  int32_t NumParams() const {
    return has_parameter_types ? static_cast<int32_t>(parameter_types.size())
                               : parameter_count;
  }

  int32_t NumFields() const { return static_cast<int32_t>(columns.size()); }
};

}  // namespace anydb
