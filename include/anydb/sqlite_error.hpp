// Copyright (c) 2024 liudegui. MIT License.
//
// SQLite result codes -> anydb::ErrorCode.

#pragma once

#include <cstdint>

#include "sqlite3.h"

#include "anydb/error.hpp"

namespace anydb {

inline ErrorCode SqliteErrorCode(int32_t rc) {
  switch (rc & 0xff) {
    case SQLITE_OK:
    case SQLITE_ROW:
    case SQLITE_DONE: return ErrorCode::kOk;
    case SQLITE_BUSY:
    case SQLITE_LOCKED: return ErrorCode::kBusy;
    case SQLITE_NOTFOUND: return ErrorCode::kNotFound;
    case SQLITE_CONSTRAINT: return ErrorCode::kConstraint;
    case SQLITE_MISMATCH: return ErrorCode::kMismatch;
    case SQLITE_MISUSE: return ErrorCode::kMisuse;
    case SQLITE_RANGE: return ErrorCode::kRange;
    case SQLITE_IOERR: return ErrorCode::kIoError;
    case SQLITE_FULL: return ErrorCode::kFull;
    case SQLITE_CANTOPEN: return ErrorCode::kNotOpen;
    default: return ErrorCode::kError;
  }
}

/// Error for `rc` carrying SQLite's own message verbatim.
inline Error MakeSqliteError(sqlite3* db, int32_t rc) {
  const char* msg = (db != nullptr) ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
  ErrorCode code = SqliteErrorCode(rc);
  return Error::Make(code == ErrorCode::kOk ? ErrorCode::kError : code, msg);
}

}  // namespace anydb
