// Copyright (c) 2024 liudegui. MIT License.
//
// anydb::Ownership -- who owns the bytes of a text/blob value.

#pragma once

#include <cstdint>

namespace anydb {

enum class Ownership : uint8_t {
  kOwned,     ///< bytes are stored in the value
  kBorrowed,  ///< bytes live in a caller buffer that must outlive the value
};

}  // namespace anydb
