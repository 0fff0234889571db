// Copyright (c) 2024 liudegui. MIT License.
//
// anydb::ColumnNameMap -- column-name to ordinal index of one result set.
//
// Built once per statement and shared (never copied) by every row of the
// result set, on both sides of the bridge.

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

namespace anydb {

using ColumnNameMap = std::unordered_map<std::string, size_t>;
using SharedColumnNames = std::shared_ptr<const ColumnNameMap>;

/// Ordinal of `name`, or -1. Duplicate names keep the first ordinal.
inline int32_t LookupColumn(const SharedColumnNames& names, const char* name) {
  if (names == nullptr || name == nullptr) { return -1; }
  ColumnNameMap::const_iterator it = names->find(name);
  if (it == names->end()) { return -1; }
  return static_cast<int32_t>(it->second);
}

}  // namespace anydb
