// Copyright (c) 2024 liudegui. MIT License.
//
// anydb SQLite demo -- CRUD through the backend-agnostic connection.
//
// Usage:
//   ./anydb_sqlite_demo [database-url]      (default: sqlite::memory:)

#include <cstdio>
#include <string>

#include <spdlog/spdlog.h>

#include "anydb/anydb.hpp"

int main(int argc, char** argv) {
  const char* url = (argc > 1) ? argv[1] : "sqlite::memory:";
  spdlog::set_level(spdlog::level::info);

  anydb::Error err = anydb::InstallDefaultDrivers();
  if (!err.ok()) {
    std::fprintf(stderr, "InstallDefaultDrivers failed: %s\n", err.message);
    return 1;
  }

  anydb::AnyConnection conn;
  err = conn.Connect(url);
  if (!err.ok()) {
    std::fprintf(stderr, "Connect failed: %s\n", err.message);
    return 1;
  }
  std::printf("Connected to %s (%s)\n", url, conn.BackendName());

  // Create table
  conn.Execute("CREATE TABLE emp(empno INTEGER, empname TEXT);", nullptr, &err);
  if (!err.ok()) {
    std::fprintf(stderr, "CREATE failed: %s\n", err.message);
    return 1;
  }

  // Batch insert inside a transaction
  err = conn.Begin();
  if (!err.ok()) {
    std::fprintf(stderr, "BEGIN failed: %s\n", err.message);
    return 1;
  }
  for (int32_t i = 0; i < 10; ++i) {
    char name[32];
    std::snprintf(name, sizeof(name), "Employee%02d", i);
    anydb::AnyArguments args;
    args.Add(i);
    args.Add(std::string(name));
    conn.Execute("INSERT INTO emp VALUES(?, ?);", &args, &err);
    if (!err.ok()) {
      std::fprintf(stderr, "INSERT failed: %s\n", err.message);
      anydb::Error rollback_err = conn.Rollback();
      if (!rollback_err.ok()) {
        std::fprintf(stderr, "ROLLBACK failed: %s\n", rollback_err.message);
      }
      return 1;
    }
  }
  err = conn.Commit();
  std::printf("Inserted 10 rows: %s\n", err.ok() ? "ok" : err.message);

  // Streamed query
  std::printf("\n--- Query ---\n");
  anydb::AnyStream stream =
      conn.FetchMany("SELECT empno, empname FROM emp ORDER BY empno;");
  anydb::AnyItem item;
  while (stream.Next(&item, &err) == anydb::StreamStatus::kItem) {
    if (item.IsRow()) {
      std::printf("  empno=%d  empname=%s\n", item.row.GetInt("empno"),
                  item.row.GetString("empname").c_str());
    } else {
      std::printf("  (statement done, %llu row(s) affected)\n",
                  static_cast<unsigned long long>(item.result.RowsAffected()));
    }
  }
  if (!err.ok()) { std::fprintf(stderr, "Query failed: %s\n", err.message); }

  // Single row
  anydb::AnyRow row;
  if (conn.FetchOptional("SELECT count(*) AS n FROM emp;", nullptr, &row, &err)) {
    std::printf("\nRow count: %lld\n", static_cast<long long>(row.GetInt64("n")));
  }

  // Update / delete
  anydb::AnyQueryResult updated =
      conn.Execute("UPDATE emp SET empname = 'Boss' WHERE empno = 0;");
  std::printf("Updated %llu row(s)\n",
              static_cast<unsigned long long>(updated.RowsAffected()));
  anydb::AnyQueryResult deleted =
      conn.Execute("DELETE FROM emp WHERE empno > 5;");
  std::printf("Deleted %llu row(s)\n",
              static_cast<unsigned long long>(deleted.RowsAffected()));

  // Describe
  anydb::AnyDescribe desc = conn.Describe("SELECT * FROM emp WHERE empno = ?;", &err);
  if (err.ok()) {
    std::printf("\n--- Describe ---\n  parameters: %d\n", desc.NumParams());
    for (const anydb::AnyColumn& col : desc.columns) {
      std::printf("  %s %s\n", col.name.c_str(), col.type_info.Name());
    }
  }

  err = conn.Close();
  std::printf("\nDone: %s\n", err.ok() ? "ok" : err.message);
  return err.ok() ? 0 : 1;
}
