// Copyright (c) 2024 liudegui. MIT License.
//
// anydb::AnyColumn -- one erased result-set field.

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "anydb/any_type_info.hpp"

namespace anydb {

struct AnyColumn {
  size_t ordinal = 0;
  std::string name;
  AnyTypeInfo type_info;
};

using SharedAnyColumns = std::shared_ptr<const std::vector<AnyColumn>>;

}  // namespace anydb
