// Copyright (c) 2024 liudegui. MIT License.
// Tests for anydb::Error.

#include <catch2/catch_test_macros.hpp>
#include <cstring>

#include "anydb/error.hpp"
#include "anydb/sqlite_error.hpp"

using namespace anydb;

TEST_CASE("Error: default is ok", "[error]") {
  Error err;
  REQUIRE(err.ok());
  REQUIRE(static_cast<bool>(err));
  REQUIRE(err.code == ErrorCode::kOk);
}

TEST_CASE("Error: Make() factory", "[error]") {
  Error err = Error::Make(ErrorCode::kError, "something failed");
  REQUIRE_FALSE(err.ok());
  REQUIRE(err.code == ErrorCode::kError);
  REQUIRE(std::strstr(err.message, "something failed") != nullptr);
}

TEST_CASE("Error: Make() without message", "[error]") {
  Error err = Error::Make(ErrorCode::kNotOpen);
  REQUIRE(err.code == ErrorCode::kNotOpen);
  REQUIRE(err.message[0] == '\0');
}

TEST_CASE("Error: SetFormat()", "[error]") {
  Error err;
  err.SetFormat(ErrorCode::kRange, "expected %d arguments, got %zu", 2,
                static_cast<size_t>(3));
  REQUIRE(err.code == ErrorCode::kRange);
  REQUIRE(std::strcmp(err.message, "expected 2 arguments, got 3") == 0);
}

TEST_CASE("Error: Clear()", "[error]") {
  Error err = Error::Make(ErrorCode::kError, "fail");
  err.Clear();
  REQUIRE(err.ok());
  REQUIRE(err.message[0] == '\0');
}

TEST_CASE("Error: message truncation", "[error]") {
  char long_msg[512];
  std::memset(long_msg, 'x', sizeof(long_msg) - 1);
  long_msg[sizeof(long_msg) - 1] = '\0';

  Error err;
  err.Set(ErrorCode::kError, long_msg);
  REQUIRE(std::strlen(err.message) < Error::kMaxMessageLen);
  REQUIRE(err.message[Error::kMaxMessageLen - 1] == '\0');
}

TEST_CASE("Error: bridge codes are distinct from backend codes", "[error]") {
  REQUIRE(Error::Make(ErrorCode::kUnsupportedType).IsBridgeError());
  REQUIRE(Error::Make(ErrorCode::kUnsupportedArgumentKind).IsBridgeError());
  REQUIRE(Error::Make(ErrorCode::kColumnDecode).IsBridgeError());
  REQUIRE_FALSE(Error::Make(ErrorCode::kConstraint).IsBridgeError());
  REQUIRE_FALSE(Error::Make(ErrorCode::kWorkerCrashed).IsBridgeError());
}

TEST_CASE("Error: code names", "[error]") {
  REQUIRE(std::strcmp(ErrorCodeName(ErrorCode::kOk), "Ok") == 0);
  REQUIRE(std::strcmp(ErrorCodeName(ErrorCode::kColumnDecode),
                      "ColumnDecode") == 0);
  REQUIRE(std::strcmp(ErrorCodeName(static_cast<ErrorCode>(-99)),
                      "Unknown") == 0);
}

TEST_CASE("Error: AssignError() tolerates null", "[error]") {
  AssignError(nullptr, Error::Make(ErrorCode::kError, "ignored"));
  Error out;
  AssignError(&out, Error::Make(ErrorCode::kBusy, "busy"));
  REQUIRE(out.code == ErrorCode::kBusy);
}

TEST_CASE("Error: SQLite result codes", "[error]") {
  REQUIRE(SqliteErrorCode(SQLITE_BUSY) == ErrorCode::kBusy);
  REQUIRE(SqliteErrorCode(SQLITE_LOCKED) == ErrorCode::kBusy);
  REQUIRE(SqliteErrorCode(SQLITE_CONSTRAINT) == ErrorCode::kConstraint);
  REQUIRE(SqliteErrorCode(SQLITE_CONSTRAINT_UNIQUE) == ErrorCode::kConstraint);
  REQUIRE(SqliteErrorCode(SQLITE_CANTOPEN) == ErrorCode::kNotOpen);
  REQUIRE(SqliteErrorCode(SQLITE_ERROR) == ErrorCode::kError);
}
