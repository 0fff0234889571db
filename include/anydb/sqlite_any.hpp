// Copyright (c) 2024 liudegui. MIT License.
//
// anydb::SqliteAnyConnection -- the SQLite driver seen through AnyConnection.
//
// Design:
//   - Type bridge, argument mapping, row projection and summary mapping are
//     free functions; SqliteAnyConnection only composes them
//   - Every switch over a kind or data type keeps a default arm that
//     reports the unknown tag as a structured error
//   - Rows are projected lazily, one item at a time, as the worker produces
//     them. The erased column table of a result set is built once and
//     shared by all its rows; the column-name index is shared with the
//     concrete rows it came from
//   - Backend errors pass through unchanged

#pragma once

#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "anydb/any_column.hpp"
#include "anydb/any_connect_options.hpp"
#include "anydb/any_connection_backend.hpp"
#include "anydb/any_describe.hpp"
#include "anydb/any_driver.hpp"
#include "anydb/any_query_result.hpp"
#include "anydb/any_row.hpp"
#include "anydb/any_statement.hpp"
#include "anydb/any_stream.hpp"
#include "anydb/any_type_info.hpp"
#include "anydb/any_value.hpp"
#include "anydb/error.hpp"
#include "anydb/sqlite_arguments.hpp"
#include "anydb/sqlite_connect_options.hpp"
#include "anydb/sqlite_connection.hpp"
#include "anydb/sqlite_type_info.hpp"
#include "anydb/sqlite_value.hpp"

namespace anydb {

inline constexpr const char* kSqliteBackendName = "SQLite";

// ---------------------------------------------------------------------------
// Type bridge
// ---------------------------------------------------------------------------

inline Error ToAnyTypeInfo(const SqliteTypeInfo& sqlite_type, AnyTypeInfo* out) {
  switch (sqlite_type.type) {
    case SqliteDataType::kNull: out->kind = AnyTypeInfoKind::kNull; break;
    case SqliteDataType::kInt: out->kind = AnyTypeInfoKind::kInteger; break;
    case SqliteDataType::kInt64: out->kind = AnyTypeInfoKind::kBigInt; break;
    case SqliteDataType::kFloat: out->kind = AnyTypeInfoKind::kDouble; break;
    case SqliteDataType::kBlob: out->kind = AnyTypeInfoKind::kBlob; break;
    case SqliteDataType::kText: out->kind = AnyTypeInfoKind::kText; break;
    default: {
      Error err;
      err.SetFormat(ErrorCode::kUnsupportedType,
                    "Any driver does not support the SQLite type %s",
                    sqlite_type.DebugString().c_str());
      return err;
    }
  }
  return Error::Ok();
}

// ---------------------------------------------------------------------------
// Argument mapping
// ---------------------------------------------------------------------------

/// Borrowed text/blob stays borrowed: the SQLite arguments then point into
/// the same caller buffers as `args` and must not outlive them.
inline Error MapArguments(const AnyArguments& args, SqliteArguments* out) {
  SqliteArguments mapped;
  mapped.Reserve(args.Len());
  const std::vector<AnyValueKind>& values = args.Values();
  for (size_t i = 0; i < values.size(); ++i) {
    const AnyValueKind& v = values[i];
    switch (v.Kind()) {
      case AnyTypeInfoKind::kNull:
        mapped.Add(SqliteArgumentValue::Null());
        break;
      case AnyTypeInfoKind::kSmallInt:
      case AnyTypeInfoKind::kInteger:
        mapped.Add(SqliteArgumentValue::Int(static_cast<int32_t>(v.IntValue())));
        break;
      case AnyTypeInfoKind::kBigInt:
        mapped.Add(SqliteArgumentValue::Int64(v.IntValue()));
        break;
      case AnyTypeInfoKind::kReal:
      case AnyTypeInfoKind::kDouble:
        mapped.Add(SqliteArgumentValue::Double(v.FloatValue()));
        break;
      case AnyTypeInfoKind::kText:
        if (v.IsBorrowed()) {
          mapped.Add(SqliteArgumentValue::TextRef(
              reinterpret_cast<const char*>(v.Data()), v.Size()));
        } else {
          mapped.Add(SqliteArgumentValue::Text(v.TextString()));
        }
        break;
      case AnyTypeInfoKind::kBlob:
        if (v.IsBorrowed()) {
          mapped.Add(SqliteArgumentValue::BlobRef(v.Data(), v.Size()));
        } else {
          mapped.Add(SqliteArgumentValue::Blob(v.BlobBytes()));
        }
        break;
      default: {
        Error err;
        err.SetFormat(ErrorCode::kUnsupportedArgumentKind,
                      "argument %zu has kind tag %u, which has no SQLite "
                      "mapping",
                      i, static_cast<unsigned>(v.Kind()));
        return err;
      }
    }
  }
  *out = std::move(mapped);
  return Error::Ok();
}

// ---------------------------------------------------------------------------
// Row projection
// ---------------------------------------------------------------------------

inline Error ColumnDecodeError(const std::string& column, const Error& source) {
  Error err;
  err.SetFormat(ErrorCode::kColumnDecode,
                "error occurred while decoding column \"%s\": %s",
                column.c_str(), source.message);
  return err;
}

inline Error ToAnyColumn(const SqliteColumn& column, AnyColumn* out) {
  AnyTypeInfo type_info;
  Error err = ToAnyTypeInfo(column.type_info, &type_info);
  if (!err.ok()) { return ColumnDecodeError(column.name, err); }
  out->ordinal = column.ordinal;
  out->name = column.name;
  out->type_info = type_info;
  return Error::Ok();
}

/// Erased column table of the result set a projection is currently reading.
struct AnyRowProjection {
  SharedSqliteColumns source;
  SharedAnyColumns columns;
};

/// Columns without a declared type (expressions) take the type of the first
/// row's value.
inline Error ToAnyColumns(const SqliteRow& row, SharedAnyColumns* out) {
  auto columns = std::make_shared<std::vector<AnyColumn>>();
  if (row.Columns() != nullptr) {
    columns->reserve(row.Columns()->size());
    for (const SqliteColumn& column : *row.Columns()) {
      SqliteColumn resolved = column;
      const SqliteValue* value = row.Value(static_cast<int32_t>(column.ordinal));
      if (resolved.type_info.IsNull() && value != nullptr) {
        resolved.type_info = value->TypeInfo();
      }
      AnyColumn any_column;
      Error err = ToAnyColumn(resolved, &any_column);
      if (!err.ok()) { return err; }
      columns->push_back(std::move(any_column));
    }
  }
  *out = std::move(columns);
  return Error::Ok();
}

inline Error DecodeAnyValue(const SqliteValue& value, AnyValueKind* out) {
  if (value.IsNull()) {
    *out = AnyValueKind::Null();
    return Error::Ok();
  }
  AnyTypeInfo type_info;
  Error err = ToAnyTypeInfo(value.TypeInfo(), &type_info);
  if (!err.ok()) { return err; }

  switch (type_info.kind) {
    case AnyTypeInfoKind::kNull:
      *out = AnyValueKind::Null();
      break;
    case AnyTypeInfoKind::kInteger: {
      int64_t v = value.Int64();
      if (v < std::numeric_limits<int32_t>::min() ||
          v > std::numeric_limits<int32_t>::max()) {
        Error range;
        range.SetFormat(ErrorCode::kRange,
                        "value %lld out of range for INTEGER",
                        static_cast<long long>(v));
        return range;
      }
      *out = AnyValueKind::Integer(static_cast<int32_t>(v));
      break;
    }
    case AnyTypeInfoKind::kBigInt:
      *out = AnyValueKind::BigInt(value.Int64());
      break;
    case AnyTypeInfoKind::kDouble:
      *out = AnyValueKind::Double(value.Double());
      break;
    case AnyTypeInfoKind::kText:
      *out = AnyValueKind::Text(value.TextString());
      break;
    case AnyTypeInfoKind::kBlob:
      *out = AnyValueKind::Blob(value.Bytes());
      break;
    default: {
      Error unsupported;
      unsupported.SetFormat(ErrorCode::kUnsupportedType,
                            "no decoder for %s values",
                            type_info.Name());
      return unsupported;
    }
  }
  return Error::Ok();
}

/// Project `row`. With `projection`, the erased column table is reused for
/// every row of the same result set.
inline Error ToAnyRow(const SqliteRow& row, AnyRowProjection* projection,
                      AnyRow* out) {
  SharedAnyColumns columns;
  if (projection != nullptr && projection->columns != nullptr &&
      projection->source == row.Columns()) {
    columns = projection->columns;
  } else {
    Error err = ToAnyColumns(row, &columns);
    if (!err.ok()) { return err; }
    if (projection != nullptr) {
      projection->source = row.Columns();
      projection->columns = columns;
    }
  }

  std::vector<AnyValueKind> values;
  values.reserve(static_cast<size_t>(row.NumFields()));
  for (int32_t i = 0; i < row.NumFields(); ++i) {
    AnyValueKind value;
    Error err = DecodeAnyValue(*row.Value(i), &value);
    if (!err.ok()) {
      const SqliteColumn* column = row.Column(i);
      return ColumnDecodeError(column != nullptr ? column->name : std::to_string(i),
                               err);
    }
    values.push_back(std::move(value));
  }
  *out = AnyRow(std::move(columns), row.ColumnNames(), std::move(values));
  return Error::Ok();
}

inline Error ToAnyRow(const SqliteRow& row, AnyRow* out) {
  return ToAnyRow(row, nullptr, out);
}

// ---------------------------------------------------------------------------
// Result mapping
// ---------------------------------------------------------------------------

/// SQLite's last_insert_rowid has no stable erased meaning and is dropped.
inline AnyQueryResult MapResult(const SqliteQueryResult& result) {
  AnyQueryResult out;
  out.rows_affected = result.RowsAffected();
  out.has_last_insert_id = false;
  return out;
}

// ---------------------------------------------------------------------------
// Connect options
// ---------------------------------------------------------------------------

inline Error ToSqliteConnectOptions(const AnyConnectOptions& options,
                                    SqliteConnectOptions* out) {
  SqliteConnectOptions sqlite_options;
  Error err = SqliteConnectOptions::FromUrl(options.database_url.c_str(),
                                            &sqlite_options);
  if (!err.ok()) { return err; }
  sqlite_options.log_settings = options.log_settings;
  *out = sqlite_options;
  return Error::Ok();
}

// ---------------------------------------------------------------------------
// SqliteAnyStreamSource
// ---------------------------------------------------------------------------

class SqliteAnyStreamSource : public AnyStreamSource {
 public:
  explicit SqliteAnyStreamSource(SqliteStream stream)
      : stream_(std::move(stream)) {}

  StreamStatus Next(AnyItem* out, Error* out_error) override {
    SqliteItem item;
    Error err;
    StreamStatus status = stream_.Next(&item, &err);
    if (status == StreamStatus::kError) { AssignError(out_error, err); }
    if (status != StreamStatus::kItem) { return status; }

    if (item.kind == SqliteItem::Kind::kResult) {
      *out = AnyItem::FromResult(MapResult(item.result));
      return StreamStatus::kItem;
    }

    AnyRow row;
    err = ToAnyRow(item.row, &projection_, &row);
    if (!err.ok()) {
      stream_.Abandon();
      AssignError(out_error, err);
      return StreamStatus::kError;
    }
    *out = AnyItem::FromRow(std::move(row));
    return StreamStatus::kItem;
  }

 private:
  SqliteStream stream_;
  AnyRowProjection projection_;
};

// ---------------------------------------------------------------------------
// SqliteAnyConnection
// ---------------------------------------------------------------------------

class SqliteAnyConnection : public AnyConnectionBackend {
 public:
  explicit SqliteAnyConnection(SqliteConnection connection)
      : connection_(std::move(connection)) {}

  /// AnyDriver::ConnectFn for the "sqlite" scheme.
  static std::unique_ptr<AnyConnectionBackend> Connect(
      const AnyConnectOptions& options, Error* out_error) {
    SqliteConnectOptions sqlite_options;
    Error err = ToSqliteConnectOptions(options, &sqlite_options);
    if (!err.ok()) {
      AssignError(out_error, err);
      return nullptr;
    }
    SqliteConnection connection;
    err = connection.Open(sqlite_options);
    if (!err.ok()) {
      AssignError(out_error, err);
      return nullptr;
    }
    return std::make_unique<SqliteAnyConnection>(std::move(connection));
  }

  const char* Name() const override { return kSqliteBackendName; }

  Error Close() override { return connection_.Close(); }

  Error CloseHard() override { return connection_.CloseHard(); }

  Error Ping() override { return connection_.Ping(); }

  Error Begin() override { return connection_.Begin(); }
  Error Commit() override { return connection_.Commit(); }
  Error Rollback() override { return connection_.Rollback(); }
  void StartRollback() override { connection_.StartRollback(); }

  Error Flush() override { return connection_.Flush(); }
  bool ShouldFlush() const override { return connection_.ShouldFlush(); }

  AnyStream FetchMany(const char* sql, const AnyArguments* arguments) override {
    bool persistent = (arguments != nullptr);
    SqliteArguments mapped;
    if (arguments != nullptr) {
      Error err = MapArguments(*arguments, &mapped);
      if (!err.ok()) { return AnyStream::Failed(err); }
    }
    SqliteStream stream = connection_.Execute(
        sql, persistent, arguments != nullptr ? &mapped : nullptr);
    return AnyStream(std::make_unique<SqliteAnyStreamSource>(std::move(stream)));
  }

  bool FetchOptional(const char* sql, const AnyArguments* arguments,
                     AnyRow* out_row, Error* out_error) override {
    AnyStream stream = FetchMany(sql, arguments);
    AnyItem item;
    Error err;
    StreamStatus status = stream.Next(&item, &err);
    AssignError(out_error, err);
    if (status == StreamStatus::kItem && item.IsRow()) {
      *out_row = std::move(item.row);
      return true;
    }
    return false;
  }

  /// Parameter type hints are ignored; SQLite infers its own.
  AnyStatement PrepareWith(const char* sql,
                           const std::vector<AnyTypeInfo>& /*parameters*/,
                           Error* out_error) override {
    Error err;
    SqliteStatement statement = connection_.Prepare(sql, &err);
    if (!err.ok()) {
      AssignError(out_error, err);
      return AnyStatement();
    }
    auto columns = std::make_shared<std::vector<AnyColumn>>();
    if (statement.columns != nullptr) {
      for (const SqliteColumn& column : *statement.columns) {
        AnyColumn any_column;
        err = ToAnyColumn(column, &any_column);
        if (!err.ok()) {
          AssignError(out_error, err);
          return AnyStatement();
        }
        columns->push_back(std::move(any_column));
      }
    }
    AssignError(out_error, Error::Ok());
    return AnyStatement(statement.sql, statement.num_params,
                        std::move(columns), statement.column_names);
  }

  AnyDescribe Describe(const char* sql, Error* out_error) override {
    Error err;
    SqliteDescribe describe = connection_.Describe(sql, &err);
    if (!err.ok()) {
      AssignError(out_error, err);
      return AnyDescribe();
    }
    AnyDescribe out;
    out.parameter_count = describe.parameter_count;
    for (const SqliteColumn& column : describe.columns) {
      AnyColumn any_column;
      any_column.ordinal = column.ordinal;
      any_column.name = column.name;
      err = ToAnyTypeInfo(column.type_info, &any_column.type_info);
      if (!err.ok()) {
        Error named;
        named.SetFormat(ErrorCode::kUnsupportedType, "column \"%s\": %s",
                        column.name.c_str(), err.message);
        AssignError(out_error, named);
        return AnyDescribe();
      }
      out.columns.push_back(std::move(any_column));
      out.nullable.push_back(Nullability::kUnknown);
    }
    AssignError(out_error, Error::Ok());
    return out;
  }

  /// The native connection underneath.
  SqliteConnection& Concrete() { return connection_; }

 private:
  SqliteConnection connection_;
};

// ---------------------------------------------------------------------------
// Driver
// ---------------------------------------------------------------------------

inline const AnyDriver& SqliteDriver() {
  static const AnyDriver driver{kSqliteBackendName, {"sqlite"},
                                &SqliteAnyConnection::Connect};
  return driver;
}

}  // namespace anydb
