// Copyright (c) 2024 liudegui. MIT License.
//
// anydb::SqliteWorker -- the thread that owns a live SQLite connection.
//
// Design:
//   - One std::thread per connection owns the sqlite3* and every statement;
//     nothing else touches them, so no lock guards the database
//   - Callers talk to it through a bounded command channel. Commands that
//     need an answer carry a one-slot reply channel; StartRollback does not
//   - Execute streams items through a per-statement bounded channel: each
//     row as it is stepped, then one summary per statement in the batch.
//     A full channel blocks the worker (backpressure); a closed one makes it
//     stop stepping and reset the statement
//   - Hard shutdown aborts the active row channel and discards queued
//     commands; their streams then end as broken, not as finished

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "anydb/bounded_channel.hpp"
#include "anydb/error.hpp"
#include "anydb/log_settings.hpp"
#include "anydb/sqlite_arguments.hpp"
#include "anydb/sqlite_connect_options.hpp"
#include "anydb/sqlite_handle.hpp"
#include "anydb/sqlite_statement.hpp"
#include "anydb/sqlite_statement_cache.hpp"
#include "anydb/sqlite_value.hpp"

namespace anydb {

// ---------------------------------------------------------------------------
// Messages
// ---------------------------------------------------------------------------

/// One element of an execution stream.
struct SqliteItem {
  enum class Kind : uint8_t { kResult, kRow, kError };

  Kind kind = Kind::kResult;
  SqliteQueryResult result;
  SqliteRow row;
  Error error;
};

/// Prepared statement metadata handed back to the caller.
struct SqliteStatement {
  std::string sql;
  int32_t num_params = 0;
  SharedSqliteColumns columns;
  SharedColumnNames column_names;
};

struct SqliteDescribe {
  std::vector<SqliteColumn> columns;
  int32_t parameter_count = 0;
};

struct WorkerReply {
  Error error;
  SqliteStatement statement;
  SqliteDescribe describe;
  uint64_t count = 0;
};

struct WorkerCommand {
  enum class Kind : uint8_t {
    kPrepare,
    kDescribe,
    kExecute,
    kBegin,
    kCommit,
    kRollback,
    kStartRollback,
    kPing,
    kClearCache,
    kCacheSize,
    kShutdown,
  };

  Kind kind = Kind::kPing;
  std::string sql;
  SqliteArguments arguments;
  bool has_arguments = false;
  bool persistent = false;
  ChannelSender<SqliteItem> rows;
  ChannelSender<WorkerReply> reply;
};

// ---------------------------------------------------------------------------
// SqliteWorker
// ---------------------------------------------------------------------------

class SqliteWorker {
 public:
  SqliteWorker() = default;

  ~SqliteWorker() { Shutdown(true); }

  SqliteWorker(const SqliteWorker&) = delete;
  SqliteWorker& operator=(const SqliteWorker&) = delete;

  /// Spawn the thread and open the database on it.
  Error Start(const SqliteConnectOptions& options) {
    if (thread_.joinable()) {
      return Error::Make(ErrorCode::kMisuse, "worker already started");
    }
    hard_stop_.store(false);
    commands_ = std::make_shared<BoundedChannel<WorkerCommand>>(
        options.command_channel_size);

    std::pair<ChannelSender<WorkerReply>, ChannelReceiver<WorkerReply>> ready =
        MakeChannel<WorkerReply>(1);
    thread_ = std::thread(&SqliteWorker::Run, this, options,
                          std::move(ready.first));

    WorkerReply reply;
    if (ready.second.Recv(&reply) != RecvStatus::kItem) {
      reply.error.Set(ErrorCode::kWorkerCrashed,
                      "worker exited before opening the database");
    }
    if (!reply.error.ok()) {
      thread_.join();
      commands_.reset();
    }
    return reply.error;
  }

  bool Running() const { return thread_.joinable(); }

  /// Send `cmd` and wait for its reply.
  WorkerReply Call(WorkerCommand cmd) {
    WorkerReply reply;
    if (!Running()) {
      reply.error.Set(ErrorCode::kNotOpen, "Connection not open");
      return reply;
    }
    std::pair<ChannelSender<WorkerReply>, ChannelReceiver<WorkerReply>> ch =
        MakeChannel<WorkerReply>(1);
    cmd.reply = std::move(ch.first);
    if (!commands_->Send(std::move(cmd))) {
      reply.error.Set(ErrorCode::kWorkerCrashed,
                      "connection worker is no longer accepting commands");
      return reply;
    }
    if (ch.second.Recv(&reply) != RecvStatus::kItem) {
      reply.error.Set(ErrorCode::kWorkerCrashed,
                      "connection worker dropped the reply channel");
    }
    return reply;
  }

  /// Queue an execution; items arrive on the returned receiver.
  ChannelReceiver<SqliteItem> Execute(const std::string& sql,
                                      SqliteArguments* arguments,
                                      bool persistent, size_t channel_size) {
    std::pair<ChannelSender<SqliteItem>, ChannelReceiver<SqliteItem>> ch =
        MakeChannel<SqliteItem>(channel_size);
    if (!Running()) {
      SqliteItem item;
      item.kind = SqliteItem::Kind::kError;
      item.error.Set(ErrorCode::kNotOpen, "Connection not open");
      ch.first.Send(std::move(item));
      ch.first.Finish();
      return std::move(ch.second);
    }

    WorkerCommand cmd;
    cmd.kind = WorkerCommand::Kind::kExecute;
    cmd.sql = sql;
    if (arguments != nullptr) {
      cmd.arguments = std::move(*arguments);
      cmd.has_arguments = true;
    }
    cmd.persistent = persistent;
    cmd.rows = std::move(ch.first);
    if (!commands_->Send(std::move(cmd))) {
      // The sender went down with the command; the stream reads as broken.
      Logger()->warn("connection worker rejected statement: {}", sql);
    }
    return std::move(ch.second);
  }

  /// Fire-and-forget rollback: waits only for a free slot in the command
  /// queue, never for the rollback itself. A failure surfaces on the next
  /// Flush().
  void StartRollback() {
    if (!Running()) { return; }
    WorkerCommand cmd;
    cmd.kind = WorkerCommand::Kind::kStartRollback;
    pending_.fetch_add(1);
    if (!commands_->Send(std::move(cmd))) {
      pending_.fetch_sub(1);
      SetDeferredError(Error::Make(ErrorCode::kWorkerCrashed,
                                   "failed to queue rollback"));
    }
  }

  /// True while fire-and-forget work is queued or its failure is unreported.
  bool HasPendingWork() const {
    std::lock_guard<std::mutex> lock(deferred_mutex_);
    return pending_.load() > 0 || !deferred_error_.ok();
  }

  /// Wait for queued fire-and-forget work and report its first failure.
  Error Flush() {
    if (pending_.load() > 0) {
      WorkerCommand cmd;
      cmd.kind = WorkerCommand::Kind::kPing;
      WorkerReply reply = Call(std::move(cmd));
      if (!reply.error.ok()) { return reply.error; }
    }
    std::lock_guard<std::mutex> lock(deferred_mutex_);
    Error err = deferred_error_;
    deferred_error_.Clear();
    return err;
  }

  /// Stop the thread. Graceful: queued commands run first and the database
  /// is closed with sqlite3_close, whose result is returned. Hard: queued
  /// commands and the active stream are dropped.
  Error Shutdown(bool hard) {
    if (!thread_.joinable()) { return Error::Ok(); }
    Error err;
    if (hard) {
      hard_stop_.store(true);
      {
        std::lock_guard<std::mutex> lock(active_mutex_);
        if (active_rows_ != nullptr) { active_rows_->Abort(); }
      }
      commands_->Abort();
      commands_->TakeAll();
    } else {
      std::pair<ChannelSender<WorkerReply>, ChannelReceiver<WorkerReply>> ch =
          MakeChannel<WorkerReply>(1);
      WorkerCommand cmd;
      cmd.kind = WorkerCommand::Kind::kShutdown;
      cmd.reply = std::move(ch.first);
      if (commands_->Send(std::move(cmd))) {
        WorkerReply reply;
        if (ch.second.Recv(&reply) == RecvStatus::kItem) {
          err = reply.error;
        } else {
          err.Set(ErrorCode::kWorkerCrashed,
                  "connection worker exited during close");
        }
      } else {
        err.Set(ErrorCode::kWorkerCrashed,
                "connection worker is no longer accepting commands");
      }
    }
    thread_.join();
    commands_.reset();
    return err;
  }

  /// Items handed to row channels so far (rows and summaries).
  uint64_t ItemsSent() const { return items_sent_.load(); }

 private:
  // --- Worker thread ---

  void Run(SqliteConnectOptions options, ChannelSender<WorkerReply> ready) {
    WorkerReply opened;
    opened.error = handle_.Open(options.OpenFilename().c_str(),
                                options.OpenFlags());
    if (!opened.error.ok()) {
      Logger()->debug("failed to open sqlite database {}: {}",
                      options.filename, opened.error.message);
      ready.Send(opened);
      ready.Finish();
      return;
    }
    handle_.SetBusyTimeout(static_cast<int32_t>(options.busy_timeout_ms));
    cache_ = std::make_unique<SqliteStatementCache>(options.statement_cache_capacity);
    log_settings_ = options.log_settings;
    depth_ = 0;
    ready.Send(opened);
    ready.Finish();
    Logger()->debug("opened sqlite database {}", options.filename);

    ChannelSender<WorkerReply> shutdown_reply;
    for (;;) {
      WorkerCommand cmd;
      if (commands_->Recv(&cmd) != RecvStatus::kItem) { break; }
      if (hard_stop_.load()) { break; }
      if (cmd.kind == WorkerCommand::Kind::kShutdown) {
        shutdown_reply = std::move(cmd.reply);
        break;
      }
      Dispatch(cmd);
    }

    cache_->Clear();
    WorkerReply closed;
    if (shutdown_reply.Valid() && !hard_stop_.load()) {
      closed.error = handle_.Close();
      if (!closed.error.ok()) {
        Logger()->error("sqlite close failed: {}", closed.error.message);
        handle_.CloseHard();
      }
    } else {
      handle_.CloseHard();
    }
    Logger()->debug("closed sqlite database {}", options.filename);
    if (shutdown_reply.Valid()) {
      shutdown_reply.Send(closed);
      shutdown_reply.Finish();
    }
  }

  void Dispatch(WorkerCommand& cmd) {
    WorkerReply reply;
    switch (cmd.kind) {
      case WorkerCommand::Kind::kExecute:
        HandleExecute(cmd);
        return;
      case WorkerCommand::Kind::kStartRollback: {
        Error err = RollbackTransaction();
        if (!err.ok()) {
          Logger()->warn("queued rollback failed: {}", err.message);
          SetDeferredError(err);
        }
        pending_.fetch_sub(1);
        return;
      }
      case WorkerCommand::Kind::kPrepare:
        reply.error = PrepareStatement(cmd.sql, &reply.statement);
        break;
      case WorkerCommand::Kind::kDescribe:
        reply.error = DescribeStatement(cmd.sql, &reply.describe);
        break;
      case WorkerCommand::Kind::kBegin:
        reply.error = BeginTransaction();
        break;
      case WorkerCommand::Kind::kCommit:
        reply.error = CommitTransaction();
        break;
      case WorkerCommand::Kind::kRollback:
        reply.error = RollbackTransaction();
        break;
      case WorkerCommand::Kind::kPing:
        break;
      case WorkerCommand::Kind::kClearCache:
        cache_->Clear();
        break;
      case WorkerCommand::Kind::kCacheSize:
        reply.count = cache_->Len();
        break;
      case WorkerCommand::Kind::kShutdown:
        break;
    }
    cmd.reply.Send(std::move(reply));
    cmd.reply.Finish();
  }

  void HandleExecute(WorkerCommand& cmd) {
    ChannelSender<SqliteItem>& tx = cmd.rows;
    ActiveStream active(this, tx.Channel());
    if (!tx.BeginProducing()) { return; }

    QueryLogger logger(cmd.sql, log_settings_);

    std::unique_ptr<SqliteVirtualStatement> owned;
    SqliteVirtualStatement* stmt = AcquireStatement(cmd.sql, cmd.persistent, &owned);

    size_t offset = 0;
    for (size_t index = 0;; ++index) {
      SqliteStatementHandle* h = nullptr;
      Error err = stmt->Statement(handle_, index, &h);
      if (!err.ok()) {
        stmt->Reset();
        if (cmd.persistent) { cache_->Remove(cmd.sql); }
        SendError(tx, err);
        return;
      }
      if (h == nullptr) { break; }

      if (cmd.has_arguments) {
        err = cmd.arguments.BindTo(*h, &offset);
        if (!err.ok()) {
          stmt->Reset();
          SendError(tx, err);
          return;
        }
      }

      int64_t changes_before = handle_.TotalChanges();
      for (;;) {
        if (hard_stop_.load()) {
          stmt->Reset();
          return;
        }
        StepResult step = h->Step(&err);
        if (step == StepResult::kError) {
          stmt->Reset();
          SendError(tx, err);
          return;
        }

        SqliteItem item;
        if (step == StepResult::kRow) {
          logger.IncrementRowsReturned();
          item.kind = SqliteItem::Kind::kRow;
          item.row = h->CurrentRow();
        } else {
          item.kind = SqliteItem::Kind::kResult;
          // sqlite3_changes keeps the count of the last DML statement, so it
          // only belongs to this one if this one changed anything.
          bool changed = !h->ReadOnly() && handle_.TotalChanges() != changes_before;
          item.result.changes =
              changed ? static_cast<uint64_t>(handle_.Changes()) : 0;
          item.result.last_insert_rowid = handle_.LastInsertRowid();
          logger.IncreaseRowsAffected(item.result.changes);
        }
        if (!tx.Send(std::move(item))) {
          // Abandoned by the consumer, or aborted by a hard close.
          stmt->Reset();
          return;
        }
        items_sent_.fetch_add(1);
        if (step == StepResult::kDone) { break; }
      }

      err = h->Reset();
      if (!err.ok()) {
        stmt->Reset();
        SendError(tx, err);
        return;
      }
    }
    tx.Finish();
  }

  /// Cached statement for a persistent execution, else a one-shot one held
  /// in `owned` (also used when caching is disabled).
  SqliteVirtualStatement* AcquireStatement(
      const std::string& sql, bool persistent,
      std::unique_ptr<SqliteVirtualStatement>* owned) {
    if (persistent) {
      SqliteVirtualStatement* cached = cache_->Get(sql);
      if (cached != nullptr) { return cached; }
    }
    *owned = std::make_unique<SqliteVirtualStatement>();
    (*owned)->sql = sql;
    (*owned)->persistent = persistent;
    if (persistent) {
      SqliteVirtualStatement* cached = cache_->Insert(*owned);
      if (cached != nullptr) { return cached; }
    }
    return owned->get();
  }

  Error PrepareStatement(const std::string& sql, SqliteStatement* out) {
    std::unique_ptr<SqliteVirtualStatement> owned;
    SqliteVirtualStatement* stmt = AcquireStatement(sql, true, &owned);
    Error err = stmt->CompileAll(handle_);
    if (!err.ok()) {
      cache_->Remove(sql);
      return err;
    }

    out->sql = sql;
    out->num_params = stmt->NumParams();
    out->columns = std::make_shared<std::vector<SqliteColumn>>();
    out->column_names = std::make_shared<ColumnNameMap>();
    for (const SqliteStatementHandle& h : stmt->handles) {
      if (h.ColumnCount() > 0) {
        out->columns = h.Columns();
        out->column_names = h.ColumnNames();
      }
    }
    return Error::Ok();
  }

  /// Describes the first statement of `sql`.
  Error DescribeStatement(const std::string& sql, SqliteDescribe* out) {
    size_t offset = 0;
    SqliteStatementHandle first;
    Error err = handle_.PrepareNext(sql, &offset, false, &first);
    if (!err.ok() || !first.Valid()) { return err; }
    out->columns = *first.Columns();
    out->parameter_count = first.BindParameterCount();
    return Error::Ok();
  }

  // --- Transactions (nested via savepoints) ---

  static std::string SavepointName(int32_t depth) {
    return "_anydb_savepoint_" + std::to_string(depth);
  }

  Error BeginTransaction() {
    std::string sql =
        (depth_ == 0) ? std::string("BEGIN") : "SAVEPOINT " + SavepointName(depth_);
    Error err = handle_.Exec(sql.c_str());
    if (err.ok()) { ++depth_; }
    return err;
  }

  Error CommitTransaction() {
    if (depth_ == 0) { return Error::Ok(); }
    std::string sql = (depth_ == 1)
                          ? std::string("COMMIT")
                          : "RELEASE SAVEPOINT " + SavepointName(depth_ - 1);
    Error err = handle_.Exec(sql.c_str());
    if (err.ok()) { --depth_; }
    return err;
  }

  Error RollbackTransaction() {
    if (depth_ == 0) { return Error::Ok(); }
    if (!handle_.InTransaction()) {
      // SQLite already rolled back (e.g. after a failed COMMIT).
      depth_ = 0;
      return Error::Ok();
    }
    std::string sql;
    if (depth_ == 1) {
      sql = "ROLLBACK";
    } else {
      std::string name = SavepointName(depth_ - 1);
      sql = "ROLLBACK TO SAVEPOINT " + name + "; RELEASE SAVEPOINT " + name;
    }
    Error err = handle_.Exec(sql.c_str());
    if (err.ok()) { --depth_; }
    return err;
  }

  // --- Helpers ---

  void SendError(ChannelSender<SqliteItem>& tx, const Error& err) {
    SqliteItem item;
    item.kind = SqliteItem::Kind::kError;
    item.error = err;
    if (tx.Send(std::move(item))) {
      items_sent_.fetch_add(1);
      tx.Finish();
    }
  }

  void SetDeferredError(const Error& err) {
    std::lock_guard<std::mutex> lock(deferred_mutex_);
    if (deferred_error_.ok()) { deferred_error_ = err; }
  }

  /// Publishes the channel being written so a hard close can abort it.
  class ActiveStream {
   public:
    ActiveStream(SqliteWorker* worker,
                 std::shared_ptr<BoundedChannel<SqliteItem>> channel)
        : worker_(worker) {
      std::lock_guard<std::mutex> lock(worker_->active_mutex_);
      worker_->active_rows_ = std::move(channel);
      if (worker_->hard_stop_.load() && worker_->active_rows_ != nullptr) {
        worker_->active_rows_->Abort();
      }
    }
    ~ActiveStream() {
      std::lock_guard<std::mutex> lock(worker_->active_mutex_);
      worker_->active_rows_.reset();
    }
    ActiveStream(const ActiveStream&) = delete;
    ActiveStream& operator=(const ActiveStream&) = delete;

   private:
    SqliteWorker* worker_;
  };

  // Shared with callers.
  std::shared_ptr<BoundedChannel<WorkerCommand>> commands_;
  std::thread thread_;
  std::atomic<bool> hard_stop_{false};
  std::atomic<uint64_t> items_sent_{0};
  std::atomic<uint32_t> pending_{0};
  std::mutex active_mutex_;
  std::shared_ptr<BoundedChannel<SqliteItem>> active_rows_;
  mutable std::mutex deferred_mutex_;
  Error deferred_error_;

  // Worker thread only.
  SqliteHandle handle_;
  std::unique_ptr<SqliteStatementCache> cache_;
  LogSettings log_settings_;
  int32_t depth_ = 0;
};

}  // namespace anydb
