// Copyright (c) 2024 liudegui. MIT License.
//
// anydb::AnyTypeInfo -- backend-neutral type descriptor.
//
// Design:
//   - AnyTypeInfoKind is the erased kind taxonomy shared by every backend
//   - The taxonomy is open: newer producers may hand out tags this build
//     does not know. Every switch over a kind keeps a default arm that
//     reports the unknown tag instead of assuming exhaustiveness

#pragma once

#include <cstdint>

namespace anydb {

enum class AnyTypeInfoKind : uint8_t {
  kNull = 0,
  kSmallInt = 1,
  kInteger = 2,
  kBigInt = 3,
  kReal = 4,
  kDouble = 5,
  kText = 6,
  kBlob = 7,
};

/// SQL-ish name of a kind, or nullptr for a tag this build does not know.
inline const char* AnyTypeInfoKindName(AnyTypeInfoKind kind) {
  switch (kind) {
    case AnyTypeInfoKind::kNull: return "NULL";
    case AnyTypeInfoKind::kSmallInt: return "SMALLINT";
    case AnyTypeInfoKind::kInteger: return "INTEGER";
    case AnyTypeInfoKind::kBigInt: return "BIGINT";
    case AnyTypeInfoKind::kReal: return "REAL";
    case AnyTypeInfoKind::kDouble: return "DOUBLE";
    case AnyTypeInfoKind::kText: return "TEXT";
    case AnyTypeInfoKind::kBlob: return "BLOB";
    default: return nullptr;
  }
}

inline bool IsKnownKind(AnyTypeInfoKind kind) {
  return AnyTypeInfoKindName(kind) != nullptr;
}

inline bool IsIntegerKind(AnyTypeInfoKind kind) {
  return kind == AnyTypeInfoKind::kSmallInt ||
         kind == AnyTypeInfoKind::kInteger ||
         kind == AnyTypeInfoKind::kBigInt;
}

// ---------------------------------------------------------------------------
// AnyTypeInfo
// ---------------------------------------------------------------------------

struct AnyTypeInfo {
  AnyTypeInfoKind kind = AnyTypeInfoKind::kNull;

  bool IsNull() const { return kind == AnyTypeInfoKind::kNull; }

  const char* Name() const {
    const char* name = AnyTypeInfoKindName(kind);
    return (name != nullptr) ? name : "UNKNOWN";
  }

  bool operator==(const AnyTypeInfo& other) const {
    return kind == other.kind;
  }
  bool operator!=(const AnyTypeInfo& other) const { return !(*this == other); }
};

}  // namespace anydb
