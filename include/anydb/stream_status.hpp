// Copyright (c) 2024 liudegui. MIT License.
//
// anydb::StreamStatus -- outcome of pulling one item from a result stream.

#pragma once

#include <cstdint>

namespace anydb {

enum class StreamStatus : uint8_t {
  kItem,   ///< an item was produced
  kEnd,    ///< the sequence completed
  kError,  ///< the sequence failed; no further items follow
};

}  // namespace anydb
