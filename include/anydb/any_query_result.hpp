// Copyright (c) 2024 liudegui. MIT License.
//
// anydb::AnyQueryResult -- erased outcome of one executed statement.

#pragma once

#include <cstdint>

namespace anydb {

struct AnyQueryResult {
  uint64_t rows_affected = 0;
  bool has_last_insert_id = false;
  int64_t last_insert_id = 0;

  uint64_t RowsAffected() const { return rows_affected; }

  /// False when the backend gave no insert identifier.
  bool LastInsertId(int64_t* out) const {
    if (!has_last_insert_id) { return false; }
    if (out != nullptr) { *out = last_insert_id; }
    return true;
  }

  /// Fold another statement's outcome into this one.
  void Extend(const AnyQueryResult& other) {
    rows_affected += other.rows_affected;
    if (other.has_last_insert_id) {
      has_last_insert_id = true;
      last_insert_id = other.last_insert_id;
    }
  }
};

}  // namespace anydb
