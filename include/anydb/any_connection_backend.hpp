// Copyright (c) 2024 liudegui. MIT License.
//
// anydb::AnyConnectionBackend -- the backend-agnostic connection contract.
//
// Design:
//   - Every driver exposes one implementation of this interface; callers
//     reach it only through AnyConnection
//   - Single owner: one caller drives a backend at a time, and must drain or
//     abandon a stream before issuing the next statement
//   - Backend errors are surfaced unmodified; the bridge adds only
//     kUnsupportedType, kUnsupportedArgumentKind and kColumnDecode
//   - Borrowed argument buffers must outlive the returned stream

#pragma once

#include <vector>

#include "anydb/any_describe.hpp"
#include "anydb/any_row.hpp"
#include "anydb/any_statement.hpp"
#include "anydb/any_stream.hpp"
#include "anydb/any_type_info.hpp"
#include "anydb/any_value.hpp"
#include "anydb/error.hpp"

namespace anydb {

class AnyConnectionBackend {
 public:
  virtual ~AnyConnectionBackend() = default;

  /// Backend name, e.g. "SQLite".
  virtual const char* Name() const = 0;

  // --- Lifecycle ---

  /// Graceful close: pending work finishes first.
  virtual Error Close() = 0;
  /// Forced close: pending work is discarded.
  virtual Error CloseHard() = 0;
  virtual Error Ping() = 0;

  // --- Transactions ---

  virtual Error Begin() = 0;
  virtual Error Commit() = 0;
  virtual Error Rollback() = 0;
  /// Queue a rollback without waiting for it.
  virtual void StartRollback() = 0;

  // --- Flush ---

  virtual Error Flush() = 0;
  virtual bool ShouldFlush() const = 0;

  // --- Execution ---

  /// Arguments present: the statement is persistent (cached for reuse).
  virtual AnyStream FetchMany(const char* sql,
                              const AnyArguments* arguments) = 0;

  /// First row of the execution, if its first item is a row.
  /// Returns false with out_error ok() when there was no row.
  virtual bool FetchOptional(const char* sql, const AnyArguments* arguments,
                             AnyRow* out_row, Error* out_error) = 0;

  virtual AnyStatement PrepareWith(const char* sql,
                                   const std::vector<AnyTypeInfo>& parameters,
                                   Error* out_error) = 0;

  virtual AnyDescribe Describe(const char* sql, Error* out_error) = 0;
};

}  // namespace anydb
