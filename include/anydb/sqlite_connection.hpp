// Copyright (c) 2024 liudegui. MIT License.
//
// anydb::SqliteConnection / anydb::SqliteStream -- the native SQLite driver.
//
// Design:
//   - SqliteConnection is the caller-side handle of one SqliteWorker; every
//     operation is a message to the worker thread
//   - Execute() returns immediately with a SqliteStream; rows are produced
//     on the worker while the caller consumes them
//   - Move-only (no copy)
//   - Destruction hard-closes; call Close() for a checked shutdown
//
// Usage:
//   SqliteConnection conn;
//   Error err = conn.Open("sqlite::memory:");
//   SqliteStream stream = conn.Execute("SELECT 1", false);
//   SqliteItem item;
//   while (stream.Next(&item, &err) == StreamStatus::kItem) { ... }

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "anydb/bounded_channel.hpp"
#include "anydb/error.hpp"
#include "anydb/log_settings.hpp"
#include "anydb/sqlite_arguments.hpp"
#include "anydb/sqlite_connect_options.hpp"
#include "anydb/sqlite_worker.hpp"
#include "anydb/stream_status.hpp"

namespace anydb {

// ---------------------------------------------------------------------------
// SqliteStream
// ---------------------------------------------------------------------------

class SqliteStream {
 public:
  SqliteStream() = default;

  explicit SqliteStream(ChannelReceiver<SqliteItem> receiver)
      : receiver_(std::move(receiver)), done_(false) {}

  /// A stream whose only item is `err`.
  static SqliteStream Failed(const Error& err) {
    SqliteStream stream;
    stream.pending_error_ = err;
    stream.done_ = false;
    return stream;
  }

  SqliteStream(SqliteStream&&) noexcept = default;
  SqliteStream& operator=(SqliteStream&&) noexcept = default;

  SqliteStream(const SqliteStream&) = delete;
  SqliteStream& operator=(const SqliteStream&) = delete;

  /// Pull the next row or summary. Error items end the stream with kError.
  StreamStatus Next(SqliteItem* out, Error* out_error = nullptr) {
    if (done_) { return StreamStatus::kEnd; }
    if (!pending_error_.ok()) {
      AssignError(out_error, pending_error_);
      pending_error_.Clear();
      Abandon();
      return StreamStatus::kError;
    }

    RecvStatus status = receiver_.Recv(out);
    if (status == RecvStatus::kEnd) {
      Abandon();
      return StreamStatus::kEnd;
    }
    if (status == RecvStatus::kBroken) {
      AssignError(out_error,
                  Error::Make(ErrorCode::kWorkerCrashed,
                              "connection worker stopped before the "
                              "statement finished"));
      Abandon();
      return StreamStatus::kError;
    }
    if (out->kind == SqliteItem::Kind::kError) {
      AssignError(out_error, out->error);
      Abandon();
      return StreamStatus::kError;
    }
    return StreamStatus::kItem;
  }

  /// Items produced but not yet pulled.
  size_t Buffered() const { return receiver_.Buffered(); }

  /// Stop consuming. The worker resets the statement before this returns.
  void Abandon() {
    receiver_.Close();
    done_ = true;
  }

  bool Done() const { return done_; }

 private:
  ChannelReceiver<SqliteItem> receiver_;
  Error pending_error_;
  bool done_ = true;
};

// ---------------------------------------------------------------------------
// SqliteConnection
// ---------------------------------------------------------------------------

class SqliteConnection {
 public:
  SqliteConnection() = default;

  ~SqliteConnection() { ReleaseWorker(); }

  // Move
  SqliteConnection(SqliteConnection&& other) noexcept
      : worker_(std::move(other.worker_)), options_(other.options_) {}

  SqliteConnection& operator=(SqliteConnection&& other) noexcept {
    if (this != &other) {
      ReleaseWorker();
      worker_ = std::move(other.worker_);
      options_ = other.options_;
    }
    return *this;
  }

  // No copy
  SqliteConnection(const SqliteConnection&) = delete;
  SqliteConnection& operator=(const SqliteConnection&) = delete;

  // --- Open / Close ---

  Error Open(const SqliteConnectOptions& options) {
    ReleaseWorker();
    std::unique_ptr<SqliteWorker> worker = std::make_unique<SqliteWorker>();
    Error err = worker->Start(options);
    if (!err.ok()) { return err; }
    worker_ = std::move(worker);
    options_ = options;
    return Error::Ok();
  }

  Error Open(const char* url) {
    SqliteConnectOptions options;
    Error err = SqliteConnectOptions::FromUrl(url, &options);
    if (!err.ok()) { return err; }
    return Open(options);
  }

  /// Finish queued work, finalize every statement and close the database.
  Error Close() {
    if (worker_ == nullptr) { return Error::Ok(); }
    Error err = worker_->Shutdown(false);
    worker_.reset();
    return err;
  }

  /// Drop queued work and the active stream, then release the database.
  Error CloseHard() {
    if (worker_ == nullptr) { return Error::Ok(); }
    Error err = worker_->Shutdown(true);
    worker_.reset();
    return err;
  }

  bool IsOpen() const { return worker_ != nullptr && worker_->Running(); }

  Error Ping() { return Simple(WorkerCommand::Kind::kPing); }

  // --- Transactions ---

  /// BEGIN, or a savepoint when a transaction is already open.
  Error Begin() { return Simple(WorkerCommand::Kind::kBegin); }
  Error Commit() { return Simple(WorkerCommand::Kind::kCommit); }
  Error Rollback() { return Simple(WorkerCommand::Kind::kRollback); }

  /// Queue a rollback without waiting for it.
  void StartRollback() {
    if (worker_ != nullptr) { worker_->StartRollback(); }
  }

  Error Flush() {
    if (worker_ == nullptr) { return Error::Ok(); }
    return worker_->Flush();
  }

  bool ShouldFlush() const {
    return worker_ != nullptr && worker_->HasPendingWork();
  }

  // --- Execute ---

  /// Run every statement of `sql` in order. With `arguments`, each statement
  /// takes the next values in order and running short fails with kRange;
  /// the arguments are consumed. Borrowed
  /// argument buffers must stay alive until the stream is done or destroyed.
  SqliteStream Execute(const char* sql, bool persistent,
                       SqliteArguments* arguments = nullptr) {
    if (sql == nullptr) {
      return SqliteStream::Failed(
          Error::Make(ErrorCode::kNullParam, "sql is null"));
    }
    if (worker_ == nullptr) {
      return SqliteStream::Failed(
          Error::Make(ErrorCode::kNotOpen, "Connection not open"));
    }
    return SqliteStream(worker_->Execute(sql, arguments, persistent,
                                         options_.row_channel_size));
  }

  // --- Prepare / Describe ---

  SqliteStatement Prepare(const char* sql, Error* out_error = nullptr) {
    WorkerReply reply = CallWithSql(WorkerCommand::Kind::kPrepare, sql);
    AssignError(out_error, reply.error);
    return reply.statement;
  }

  SqliteDescribe Describe(const char* sql, Error* out_error = nullptr) {
    WorkerReply reply = CallWithSql(WorkerCommand::Kind::kDescribe, sql);
    AssignError(out_error, reply.error);
    return reply.describe;
  }

  // --- Statement cache ---

  size_t CachedStatementsSize(Error* out_error = nullptr) {
    WorkerCommand cmd;
    cmd.kind = WorkerCommand::Kind::kCacheSize;
    WorkerReply reply = Call(std::move(cmd));
    AssignError(out_error, reply.error);
    return static_cast<size_t>(reply.count);
  }

  Error ClearCachedStatements() {
    return Simple(WorkerCommand::Kind::kClearCache);
  }

  // --- Info ---

  /// Rows and summaries the worker has handed to streams so far.
  uint64_t ItemsSent() const {
    return worker_ != nullptr ? worker_->ItemsSent() : 0;
  }

  uint32_t RowChannelSize() const { return options_.row_channel_size; }
  const SqliteConnectOptions& Options() const { return options_; }
  const LogSettings& GetLogSettings() const { return options_.log_settings; }

 private:
  // Hard close where no caller can receive the error.
  void ReleaseWorker() {
    Error err = CloseHard();
    if (!err.ok()) { Logger()->warn("hard close failed: {}", err.message); }
  }

  WorkerReply Call(WorkerCommand cmd) {
    if (worker_ == nullptr) {
      WorkerReply reply;
      reply.error.Set(ErrorCode::kNotOpen, "Connection not open");
      return reply;
    }
    return worker_->Call(std::move(cmd));
  }

  WorkerReply CallWithSql(WorkerCommand::Kind kind, const char* sql) {
    if (sql == nullptr) {
      WorkerReply reply;
      reply.error.Set(ErrorCode::kNullParam, "sql is null");
      return reply;
    }
    WorkerCommand cmd;
    cmd.kind = kind;
    cmd.sql = sql;
    return Call(std::move(cmd));
  }

  Error Simple(WorkerCommand::Kind kind) {
    WorkerCommand cmd;
    cmd.kind = kind;
    return Call(std::move(cmd)).error;
  }

  std::unique_ptr<SqliteWorker> worker_;
  SqliteConnectOptions options_;
};

}  // namespace anydb
