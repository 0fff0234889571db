// Copyright (c) 2024 liudegui. MIT License.
// Tests for anydb::SqliteConnection and its worker.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <chrono>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

#include "anydb/sqlite_connection.hpp"

using namespace anydb;

namespace {

const char* const kCountTo100 =
    "WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c "
    "WHERE x < 100) SELECT x FROM c;";

SqliteConnection OpenTestDb(uint32_t row_channel_size = 50) {
  SqliteConnectOptions opts;
  opts.RowChannelSize(row_channel_size);
  SqliteConnection conn;
  conn.Open(opts);
  return conn;
}

// Drains `stream` into `items`; returns the terminal error (ok at the end).
Error Collect(SqliteStream& stream, std::vector<SqliteItem>* items) {
  SqliteItem item;
  Error err;
  while (stream.Next(&item, &err) == StreamStatus::kItem) {
    items->push_back(item);
  }
  return err;
}

Error Run(SqliteConnection& conn, const char* sql) {
  SqliteStream stream = conn.Execute(sql, false);
  std::vector<SqliteItem> items;
  return Collect(stream, &items);
}

int64_t Scalar(SqliteConnection& conn, const char* sql) {
  SqliteStream stream = conn.Execute(sql, false);
  SqliteItem item;
  if (stream.Next(&item) != StreamStatus::kItem ||
      item.kind != SqliteItem::Kind::kRow) {
    return -1;
  }
  return item.row.Value(0)->Int64();
}

}  // namespace

TEST_CASE("SqliteConnection: open, ping, close", "[sqlite_connection]") {
  SqliteConnection conn;
  REQUIRE_FALSE(conn.IsOpen());
  REQUIRE(conn.Open("sqlite::memory:").ok());
  REQUIRE(conn.IsOpen());
  REQUIRE(conn.Ping().ok());
  REQUIRE(conn.Close().ok());
  REQUIRE_FALSE(conn.IsOpen());
  REQUIRE(conn.Ping().code == ErrorCode::kNotOpen);
}

TEST_CASE("SqliteConnection: open failure", "[sqlite_connection]") {
  SqliteConnection conn;
  Error err = conn.Open("sqlite:/nonexistent-dir/anydb/test.db?mode=ro");
  REQUIRE_FALSE(err.ok());
  REQUIRE_FALSE(conn.IsOpen());

  err = conn.Open("sqlite::memory:?bogus=1");
  REQUIRE(err.code == ErrorCode::kConfiguration);
}

TEST_CASE("SqliteConnection: batch streams summaries and rows in order",
          "[sqlite_connection]") {
  auto conn = OpenTestDb();
  SqliteStream stream = conn.Execute(
      "CREATE TABLE emp(empno INTEGER, empname TEXT);"
      "INSERT INTO emp VALUES(1, 'Alice'), (2, 'Bob');"
      "SELECT empno, empname FROM emp ORDER BY empno;",
      false);

  std::vector<SqliteItem> items;
  REQUIRE(Collect(stream, &items).ok());
  REQUIRE(items.size() == 5);

  REQUIRE(items[0].kind == SqliteItem::Kind::kResult);
  REQUIRE(items[0].result.RowsAffected() == 0);
  REQUIRE(items[1].kind == SqliteItem::Kind::kResult);
  REQUIRE(items[1].result.RowsAffected() == 2);
  REQUIRE(items[1].result.LastInsertRowid() == 2);

  REQUIRE(items[2].kind == SqliteItem::Kind::kRow);
  REQUIRE(items[2].row.Value(0)->Int64() == 1);
  REQUIRE(items[2].row.Value(1)->TextString() == "Alice");
  REQUIRE(items[3].row.Value(0)->Int64() == 2);
  REQUIRE(items[3].row.FieldIndex("empname") == 1);
  REQUIRE(items[4].kind == SqliteItem::Kind::kResult);

  // Rows of one result set share their column metadata.
  REQUIRE(items[2].row.Columns() == items[3].row.Columns());
  REQUIRE(items[2].row.ColumnNames() == items[3].row.ColumnNames());
  REQUIRE(items[2].row.Column(0)->type_info.type == SqliteDataType::kInt64);
  REQUIRE(stream.Done());
}

TEST_CASE("SqliteConnection: arguments bind positionally", "[sqlite_connection]") {
  auto conn = OpenTestDb();
  REQUIRE(Run(conn, "CREATE TABLE t(i INTEGER, r REAL, s TEXT, b BLOB, n);").ok());

  const char borrowed[] = "borrowed";
  SqliteArguments args;
  args.Add(SqliteArgumentValue::Int(7));
  args.Add(SqliteArgumentValue::Double(1.5));
  args.Add(SqliteArgumentValue::TextRef(borrowed, std::strlen(borrowed)));
  args.Add(SqliteArgumentValue::Blob({0x00, 0xff}));
  args.Add(SqliteArgumentValue::Null());

  SqliteStream insert = conn.Execute("INSERT INTO t VALUES(?, ?, ?, ?, ?);", true, &args);
  std::vector<SqliteItem> items;
  REQUIRE(Collect(insert, &items).ok());
  REQUIRE(items.size() == 1);
  REQUIRE(items[0].result.RowsAffected() == 1);

  SqliteStream select = conn.Execute("SELECT i, r, s, b, n FROM t;", false);
  items.clear();
  REQUIRE(Collect(select, &items).ok());
  REQUIRE(items.size() == 2);
  const SqliteRow& row = items[0].row;
  REQUIRE(row.Value(0)->Int64() == 7);
  REQUIRE(row.Value(1)->Double() == Catch::Approx(1.5));
  REQUIRE(row.Value(2)->TextString() == "borrowed");
  REQUIRE(row.Value(3)->Bytes() == std::vector<uint8_t>{0x00, 0xff});
  REQUIRE(row.Value(4)->IsNull());
}

TEST_CASE("SqliteConnection: arguments span the statements of a batch",
          "[sqlite_connection]") {
  auto conn = OpenTestDb();
  REQUIRE(Run(conn, "CREATE TABLE t(x INTEGER);").ok());

  SqliteArguments args;
  args.Add(SqliteArgumentValue::Int(1));
  args.Add(SqliteArgumentValue::Int(2));
  SqliteStream stream = conn.Execute(
      "INSERT INTO t VALUES(?); INSERT INTO t VALUES(?);", true, &args);
  std::vector<SqliteItem> items;
  REQUIRE(Collect(stream, &items).ok());
  REQUIRE(Scalar(conn, "SELECT sum(x) FROM t;") == 3);
}

TEST_CASE("SqliteConnection: too few arguments", "[sqlite_connection]") {
  auto conn = OpenTestDb();
  SqliteArguments args;
  args.Add(SqliteArgumentValue::Int(1));
  SqliteStream stream = conn.Execute("SELECT ?, ?;", true, &args);
  std::vector<SqliteItem> items;
  Error err = Collect(stream, &items);
  REQUIRE(err.code == ErrorCode::kRange);
  REQUIRE(items.empty());
}

TEST_CASE("SqliteConnection: SQL errors pass through", "[sqlite_connection]") {
  auto conn = OpenTestDb();
  Error err = Run(conn, "SELECT * FROM nope;");
  REQUIRE(err.code == ErrorCode::kError);
  REQUIRE(std::strstr(err.message, "no such table: nope") != nullptr);

  REQUIRE(Run(conn, "CREATE TABLE u(x INTEGER UNIQUE); INSERT INTO u VALUES(1);").ok());
  err = Run(conn, "INSERT INTO u VALUES(1);");
  REQUIRE(err.code == ErrorCode::kConstraint);

  // The connection is still usable.
  REQUIRE(Scalar(conn, "SELECT count(*) FROM u;") == 1);
}

TEST_CASE("SqliteConnection: error ends the stream after earlier items",
          "[sqlite_connection]") {
  auto conn = OpenTestDb();
  SqliteStream stream = conn.Execute("SELECT 1; SELECT * FROM nope;", false);
  std::vector<SqliteItem> items;
  Error err = Collect(stream, &items);
  REQUIRE_FALSE(err.ok());
  REQUIRE(items.size() == 2);
  REQUIRE(items[0].kind == SqliteItem::Kind::kRow);
  REQUIRE(items[1].kind == SqliteItem::Kind::kResult);
  SqliteItem item;
  REQUIRE(stream.Next(&item) == StreamStatus::kEnd);
}

TEST_CASE("SqliteConnection: persistent statements are cached", "[sqlite_connection]") {
  SqliteConnectOptions opts;
  opts.StatementCacheCapacity(2);
  SqliteConnection conn;
  REQUIRE(conn.Open(opts).ok());

  REQUIRE(Run(conn, "SELECT 1;").ok());
  REQUIRE(conn.CachedStatementsSize() == 0);

  const char* queries[] = {"SELECT ?;", "SELECT ? + 1;", "SELECT ? + 2;"};
  for (int round = 0; round < 2; ++round) {
    for (const char* sql : queries) {
      SqliteArguments args;
      args.Add(SqliteArgumentValue::Int(round));
      SqliteStream stream = conn.Execute(sql, true, &args);
      std::vector<SqliteItem> items;
      REQUIRE(Collect(stream, &items).ok());
      REQUIRE(conn.CachedStatementsSize() <= 2);
    }
  }
  REQUIRE(conn.CachedStatementsSize() == 2);
  REQUIRE(conn.ClearCachedStatements().ok());
  REQUIRE(conn.CachedStatementsSize() == 0);
}

TEST_CASE("SqliteConnection: rows affected ignores trigger writes",
          "[sqlite_connection]") {
  auto conn = OpenTestDb();
  REQUIRE(Run(conn, "CREATE TABLE t(x INTEGER);"
                    "CREATE TABLE audit(x INTEGER);"
                    "CREATE TRIGGER t_audit AFTER INSERT ON t BEGIN "
                    "INSERT INTO audit VALUES(new.x); INSERT INTO audit VALUES(new.x); "
                    "END;").ok());

  SqliteStream stream = conn.Execute(
      "INSERT INTO t VALUES(1), (2);"
      "CREATE TABLE other(y INTEGER);"
      "SELECT count(*) FROM audit;",
      false);
  std::vector<SqliteItem> items;
  REQUIRE(Collect(stream, &items).ok());
  REQUIRE(items.size() == 4);
  REQUIRE(items[0].kind == SqliteItem::Kind::kResult);
  REQUIRE(items[0].result.RowsAffected() == 2);
  // DDL after DML does not inherit the previous count.
  REQUIRE(items[1].kind == SqliteItem::Kind::kResult);
  REQUIRE(items[1].result.RowsAffected() == 0);
  REQUIRE(items[2].row.Value(0)->Int64() == 4);
  REQUIRE(items[3].result.RowsAffected() == 0);

  stream = conn.Execute("UPDATE t SET x = x WHERE x > 10;", false);
  items.clear();
  REQUIRE(Collect(stream, &items).ok());
  REQUIRE(items.size() == 1);
  REQUIRE(items[0].result.RowsAffected() == 0);
}

TEST_CASE("SqliteConnection: cached statement picks up schema changes",
          "[sqlite_connection]") {
  auto conn = OpenTestDb();
  REQUIRE(Run(conn, "CREATE TABLE t(x INTEGER); INSERT INTO t VALUES(5);").ok());
  const char* sql = "SELECT * FROM t WHERE x > ?;";

  SqliteArguments args;
  args.Add(SqliteArgumentValue::Int(0));
  SqliteStream stream = conn.Execute(sql, true, &args);
  std::vector<SqliteItem> items;
  REQUIRE(Collect(stream, &items).ok());
  REQUIRE(items[0].row.Columns()->size() == 1);

  REQUIRE(Run(conn, "ALTER TABLE t ADD COLUMN y TEXT DEFAULT 'hi';").ok());

  SqliteArguments again;
  again.Add(SqliteArgumentValue::Int(0));
  stream = conn.Execute(sql, true, &again);
  items.clear();
  REQUIRE(Collect(stream, &items).ok());
  REQUIRE(items.size() == 2);
  const SqliteRow& row = items[0].row;
  REQUIRE(row.NumFields() == 2);
  REQUIRE(row.Columns()->size() == 2);
  REQUIRE(row.FieldIndex("y") == 1);
  REQUIRE(row.Value(1)->TextString() == "hi");
}

TEST_CASE("SqliteConnection: abandoned stream leaves the connection usable",
          "[sqlite_connection]") {
  auto conn = OpenTestDb(4);
  SqliteArguments args;
  args.Add(SqliteArgumentValue::Int(100));
  const char* sql =
      "WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c "
      "WHERE x < ?) SELECT x FROM c;";
  {
    SqliteStream stream = conn.Execute(sql, true, &args);
    SqliteItem item;
    REQUIRE(stream.Next(&item) == StreamStatus::kItem);
    REQUIRE(item.row.Value(0)->Int64() == 1);
    stream.Abandon();
    REQUIRE(stream.Done());
  }
  REQUIRE(conn.Ping().ok());

  // The cached statement was reset and runs from the start again.
  SqliteArguments again;
  again.Add(SqliteArgumentValue::Int(3));
  SqliteStream stream = conn.Execute(sql, true, &again);
  std::vector<SqliteItem> items;
  REQUIRE(Collect(stream, &items).ok());
  REQUIRE(items.size() == 4);
  REQUIRE(items[0].row.Value(0)->Int64() == 1);
  REQUIRE(items[2].row.Value(0)->Int64() == 3);
}

TEST_CASE("SqliteConnection: bounded lookahead", "[sqlite_connection]") {
  const uint32_t kCapacity = 2;
  auto conn = OpenTestDb(kCapacity);
  uint64_t baseline = conn.ItemsSent();

  SqliteStream stream = conn.Execute(kCountTo100, false);
  SqliteItem item;
  for (uint32_t i = 0; i < kCapacity; ++i) {
    REQUIRE(stream.Next(&item) == StreamStatus::kItem);
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  uint64_t produced = conn.ItemsSent() - baseline;
  REQUIRE(produced <= kCapacity + kCapacity + 1);
  REQUIRE(stream.Buffered() <= kCapacity);

  std::vector<SqliteItem> rest;
  REQUIRE(Collect(stream, &rest).ok());
  REQUIRE(rest.size() == 100 - kCapacity + 1);
}

TEST_CASE("SqliteConnection: hard close breaks an open stream", "[sqlite_connection]") {
  auto conn = OpenTestDb(2);
  SqliteStream stream = conn.Execute(kCountTo100, false);
  SqliteItem item;
  REQUIRE(stream.Next(&item) == StreamStatus::kItem);

  REQUIRE(conn.CloseHard().ok());
  REQUIRE_FALSE(conn.IsOpen());
  REQUIRE(conn.CloseHard().ok());

  Error err;
  StreamStatus status;
  int more = 0;
  while ((status = stream.Next(&item, &err)) == StreamStatus::kItem) { ++more; }
  REQUIRE(status == StreamStatus::kError);
  REQUIRE(err.code == ErrorCode::kWorkerCrashed);
  REQUIRE(more <= 2);
}

TEST_CASE("SqliteConnection: execute after close", "[sqlite_connection]") {
  auto conn = OpenTestDb();
  REQUIRE(conn.Close().ok());
  SqliteStream stream = conn.Execute("SELECT 1;", false);
  SqliteItem item;
  Error err;
  REQUIRE(stream.Next(&item, &err) == StreamStatus::kError);
  REQUIRE(err.code == ErrorCode::kNotOpen);
}

TEST_CASE("SqliteConnection: prepare reports parameters and columns",
          "[sqlite_connection]") {
  auto conn = OpenTestDb();
  REQUIRE(Run(conn, "CREATE TABLE emp(empno INTEGER, empname TEXT);").ok());

  Error err;
  SqliteStatement stmt =
      conn.Prepare("SELECT empno, empname FROM emp WHERE empno = ?;", &err);
  REQUIRE(err.ok());
  REQUIRE(stmt.num_params == 1);
  REQUIRE(stmt.columns->size() == 2);
  REQUIRE((*stmt.columns)[1].name == "empname");
  REQUIRE((*stmt.columns)[1].type_info.type == SqliteDataType::kText);
  REQUIRE(stmt.column_names->at("empno") == 0);
  REQUIRE(conn.CachedStatementsSize() == 1);

  conn.Prepare("SELECT * FROM nope;", &err);
  REQUIRE(err.code == ErrorCode::kError);
  REQUIRE(conn.CachedStatementsSize() == 1);
}

TEST_CASE("SqliteConnection: describe uses declared types", "[sqlite_connection]") {
  auto conn = OpenTestDb();
  REQUIRE(Run(conn, "CREATE TABLE ev(id INTEGER, at DATETIME);").ok());

  Error err;
  SqliteDescribe d = conn.Describe("SELECT id, at, id + 1 AS next FROM ev WHERE id > ?;", &err);
  REQUIRE(err.ok());
  REQUIRE(d.parameter_count == 1);
  REQUIRE(d.columns.size() == 3);
  REQUIRE(d.columns[0].type_info.type == SqliteDataType::kInt64);
  REQUIRE(d.columns[1].type_info.type == SqliteDataType::kDatetime);
  REQUIRE(d.columns[2].type_info.IsNull());
  REQUIRE(d.columns[2].name == "next");
}

TEST_CASE("SqliteConnection: transactions nest with savepoints", "[sqlite_connection]") {
  auto conn = OpenTestDb();
  REQUIRE(Run(conn, "CREATE TABLE t(x INTEGER);").ok());

  REQUIRE(conn.Begin().ok());
  REQUIRE(Run(conn, "INSERT INTO t VALUES(1);").ok());
  REQUIRE(conn.Begin().ok());
  REQUIRE(Run(conn, "INSERT INTO t VALUES(2);").ok());
  REQUIRE(conn.Rollback().ok());
  REQUIRE(conn.Commit().ok());
  REQUIRE(Scalar(conn, "SELECT count(*) FROM t;") == 1);

  REQUIRE(conn.Begin().ok());
  REQUIRE(Run(conn, "INSERT INTO t VALUES(3);").ok());
  REQUIRE(conn.Rollback().ok());
  REQUIRE(Scalar(conn, "SELECT count(*) FROM t;") == 1);

  // Commit and rollback outside a transaction are no-ops.
  REQUIRE(conn.Commit().ok());
  REQUIRE(conn.Rollback().ok());
}

TEST_CASE("SqliteConnection: start_rollback is observed by the next command",
          "[sqlite_connection]") {
  auto conn = OpenTestDb();
  REQUIRE(Run(conn, "CREATE TABLE t(x INTEGER);").ok());
  REQUIRE(conn.Begin().ok());
  REQUIRE(Run(conn, "INSERT INTO t VALUES(1);").ok());

  REQUIRE_FALSE(conn.ShouldFlush());
  conn.StartRollback();
  REQUIRE(Scalar(conn, "SELECT count(*) FROM t;") == 0);
  REQUIRE(conn.Flush().ok());
  REQUIRE_FALSE(conn.ShouldFlush());

  // The next Begin opens a fresh transaction, not a savepoint.
  REQUIRE(conn.Begin().ok());
  REQUIRE(Run(conn, "INSERT INTO t VALUES(2);").ok());
  REQUIRE(conn.Commit().ok());
  REQUIRE(Scalar(conn, "SELECT count(*) FROM t;") == 1);
}

TEST_CASE("SqliteConnection: start_rollback waits for a full command queue",
          "[sqlite_connection]") {
  SqliteConnectOptions opts;
  opts.RowChannelSize(1);
  opts.command_channel_size = 1;
  SqliteConnection conn;
  REQUIRE(conn.Open(opts).ok());
  REQUIRE(Run(conn, "CREATE TABLE t(x INTEGER);").ok());
  REQUIRE(conn.Begin().ok());
  REQUIRE(Run(conn, "INSERT INTO t VALUES(1);").ok());

  // The worker blocks on the first stream and the second fills the queue.
  SqliteStream busy = conn.Execute(kCountTo100, false);
  SqliteItem item;
  REQUIRE(busy.Next(&item) == StreamStatus::kItem);
  SqliteStream queued = conn.Execute("SELECT 1;", false);

  std::thread rollback([&conn] { conn.StartRollback(); });
  std::vector<SqliteItem> items;
  REQUIRE(Collect(busy, &items).ok());
  items.clear();
  REQUIRE(Collect(queued, &items).ok());
  rollback.join();

  REQUIRE(conn.Flush().ok());
  REQUIRE_FALSE(conn.ShouldFlush());
  REQUIRE(Scalar(conn, "SELECT count(*) FROM t;") == 0);
}

TEST_CASE("SqliteConnection: move transfers the worker", "[sqlite_connection]") {
  auto conn = OpenTestDb();
  SqliteConnection moved(std::move(conn));
  REQUIRE(moved.IsOpen());
  REQUIRE(moved.Ping().ok());
  REQUIRE(conn.Ping().code == ErrorCode::kNotOpen);
}
