// Copyright (c) 2024 liudegui. MIT License.
//
// anydb::SqliteTypeInfo -- SQLite-native type descriptor.
//
// Design:
//   - SqliteDataType is richer than SQLite's five storage classes: declared
//     column types (BOOLEAN, DATETIME, ...) keep their own discriminant
//   - Runtime values report their storage class; columns report the type
//     parsed from their declaration (sqlite3_column_decltype)

#pragma once

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <string>

#include "sqlite3.h"

namespace anydb {

enum class SqliteDataType : uint8_t {
  kNull,
  kInt,
  kFloat,
  kText,
  kBlob,
  kNumeric,
  kBool,
  kInt64,
  kDate,
  kTime,
  kDatetime,
};

// ---------------------------------------------------------------------------
// SqliteTypeInfo
// ---------------------------------------------------------------------------

struct SqliteTypeInfo {
  SqliteDataType type = SqliteDataType::kNull;

  SqliteTypeInfo() = default;
  explicit SqliteTypeInfo(SqliteDataType t) : type(t) {}

  bool IsNull() const { return type == SqliteDataType::kNull; }

  /// From a runtime storage class (SQLITE_INTEGER, ...).
  static SqliteTypeInfo FromCode(int32_t code) {
    switch (code) {
      case SQLITE_INTEGER: return SqliteTypeInfo(SqliteDataType::kInt64);
      case SQLITE_FLOAT: return SqliteTypeInfo(SqliteDataType::kFloat);
      case SQLITE_BLOB: return SqliteTypeInfo(SqliteDataType::kBlob);
      case SQLITE_TEXT: return SqliteTypeInfo(SqliteDataType::kText);
      default: return SqliteTypeInfo(SqliteDataType::kNull);
    }
  }

  /// From a declared column type. Unrecognized declarations fall back to
  /// NUMERIC, the affinity SQLite itself gives them.
  static SqliteTypeInfo FromDeclType(const char* decltype_str) {
    if (decltype_str == nullptr || decltype_str[0] == '\0') {
      return SqliteTypeInfo(SqliteDataType::kNull);
    }
    std::string s(decltype_str);
    for (char& c : s) {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (s == "int4") { return SqliteTypeInfo(SqliteDataType::kInt); }
    if (s == "int8") { return SqliteTypeInfo(SqliteDataType::kInt64); }
    if (s == "boolean" || s == "bool") {
      return SqliteTypeInfo(SqliteDataType::kBool);
    }
    if (s == "date") { return SqliteTypeInfo(SqliteDataType::kDate); }
    if (s == "time") { return SqliteTypeInfo(SqliteDataType::kTime); }
    if (s == "datetime" || s == "timestamp") {
      return SqliteTypeInfo(SqliteDataType::kDatetime);
    }
    if (s.find("int") != std::string::npos) {
      return SqliteTypeInfo(SqliteDataType::kInt64);
    }
    if (s.find("char") != std::string::npos ||
        s.find("clob") != std::string::npos ||
        s.find("text") != std::string::npos) {
      return SqliteTypeInfo(SqliteDataType::kText);
    }
    if (s.find("blob") != std::string::npos) {
      return SqliteTypeInfo(SqliteDataType::kBlob);
    }
    if (s.find("real") != std::string::npos ||
        s.find("floa") != std::string::npos ||
        s.find("doub") != std::string::npos) {
      return SqliteTypeInfo(SqliteDataType::kFloat);
    }
    return SqliteTypeInfo(SqliteDataType::kNumeric);
  }

  const char* Name() const {
    switch (type) {
      case SqliteDataType::kNull: return "NULL";
      case SqliteDataType::kInt: return "INTEGER";
      case SqliteDataType::kFloat: return "REAL";
      case SqliteDataType::kText: return "TEXT";
      case SqliteDataType::kBlob: return "BLOB";
      case SqliteDataType::kNumeric: return "NUMERIC";
      case SqliteDataType::kBool: return "BOOLEAN";
      case SqliteDataType::kInt64: return "BIGINT";
      case SqliteDataType::kDate: return "DATE";
      case SqliteDataType::kTime: return "TIME";
      case SqliteDataType::kDatetime: return "DATETIME";
    }
    return "UNKNOWN";
  }

  /// Debug description used in diagnostics, e.g. "SqliteTypeInfo(Datetime)".
  std::string DebugString() const {
    const char* name = "Unknown";
    switch (type) {
      case SqliteDataType::kNull: name = "Null"; break;
      case SqliteDataType::kInt: name = "Int"; break;
      case SqliteDataType::kFloat: name = "Float"; break;
      case SqliteDataType::kText: name = "Text"; break;
      case SqliteDataType::kBlob: name = "Blob"; break;
      case SqliteDataType::kNumeric: name = "Numeric"; break;
      case SqliteDataType::kBool: name = "Bool"; break;
      case SqliteDataType::kInt64: name = "Int64"; break;
      case SqliteDataType::kDate: name = "Date"; break;
      case SqliteDataType::kTime: name = "Time"; break;
      case SqliteDataType::kDatetime: name = "Datetime"; break;
      default: {
        char buf[48];
        std::snprintf(buf, sizeof(buf), "SqliteTypeInfo(<tag %u>)",
                      static_cast<unsigned>(type));
        return std::string(buf);
      }
    }
    return std::string("SqliteTypeInfo(") + name + ")";
  }

  bool operator==(const SqliteTypeInfo& other) const {
    return type == other.type;
  }
  bool operator!=(const SqliteTypeInfo& other) const {
    return !(*this == other);
  }
};

}  // namespace anydb
