// Copyright (c) 2024 liudegui. MIT License.
//
// anydb::LogSettings / anydb::QueryLogger -- statement logging.
//
// Design:
//   - LogSettings is plain data shared by erased and concrete connect
//     options; the bridge copies it verbatim
//   - All library output goes through one spdlog logger named "anydb";
//     applications may register their own logger under that name
//   - QueryLogger records one line per executed statement when it is
//     finished or destroyed, promoted to the slow level past the threshold

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace anydb {

inline constexpr const char* kLoggerName = "anydb";

/// Returns the library logger, creating a stderr logger on first use.
inline std::shared_ptr<spdlog::logger> Logger() {
  static std::mutex mutex;
  std::lock_guard<std::mutex> lock(mutex);
  std::shared_ptr<spdlog::logger> logger = spdlog::get(kLoggerName);
  if (logger == nullptr) {
    logger = spdlog::stderr_color_mt(kLoggerName);
  }
  return logger;
}

// ---------------------------------------------------------------------------
// LogSettings
// ---------------------------------------------------------------------------

struct LogSettings {
  spdlog::level::level_enum statements_level = spdlog::level::debug;
  spdlog::level::level_enum slow_statements_level = spdlog::level::warn;
  std::chrono::milliseconds slow_statements_duration{1000};

  void LogStatements(spdlog::level::level_enum level) {
    statements_level = level;
  }

  void LogSlowStatements(spdlog::level::level_enum level,
                         std::chrono::milliseconds duration) {
    slow_statements_level = level;
    slow_statements_duration = duration;
  }

  bool operator==(const LogSettings& other) const {
    return statements_level == other.statements_level &&
           slow_statements_level == other.slow_statements_level &&
           slow_statements_duration == other.slow_statements_duration;
  }
  bool operator!=(const LogSettings& other) const { return !(*this == other); }
};

// ---------------------------------------------------------------------------
// QueryLogger
// ---------------------------------------------------------------------------

class QueryLogger {
 public:
  QueryLogger(const std::string& sql, const LogSettings& settings)
      : sql_(sql),
        settings_(settings),
        start_(std::chrono::steady_clock::now()) {}

  ~QueryLogger() { Finish(); }

  QueryLogger(const QueryLogger&) = delete;
  QueryLogger& operator=(const QueryLogger&) = delete;

  void IncrementRowsReturned() { ++rows_returned_; }
  void IncreaseRowsAffected(uint64_t n) { rows_affected_ += n; }

  uint64_t RowsReturned() const { return rows_returned_; }
  uint64_t RowsAffected() const { return rows_affected_; }

  /// Emit the log line once; later calls are no-ops.
  void Finish() {
    if (finished_) { return; }
    finished_ = true;

    auto elapsed = std::chrono::steady_clock::now() - start_;
    bool slow = elapsed >= settings_.slow_statements_duration;
    spdlog::level::level_enum level =
        slow ? settings_.slow_statements_level : settings_.statements_level;
    if (level == spdlog::level::off) { return; }

    std::shared_ptr<spdlog::logger> logger = Logger();
    if (!logger->should_log(level)) { return; }

    double elapsed_ms =
        std::chrono::duration<double, std::milli>(elapsed).count();
    if (slow) {
      logger->log(level,
                  "slow statement: execution time exceeded alert threshold "
                  "({}ms); {}; rows returned: {}, rows affected: {}, "
                  "elapsed: {:.3f}ms",
                  settings_.slow_statements_duration.count(), Summary(),
                  rows_returned_, rows_affected_, elapsed_ms);
    } else {
      logger->log(level,
                  "{}; rows returned: {}, rows affected: {}, elapsed: "
                  "{:.3f}ms",
                  Summary(), rows_returned_, rows_affected_, elapsed_ms);
    }
  }

  /// First line of the statement, trimmed, at most 100 characters.
  std::string Summary() const {
    std::string::size_type begin = sql_.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) { return std::string(); }
    std::string::size_type end = sql_.find('\n', begin);
    std::string line = sql_.substr(
        begin, end == std::string::npos ? std::string::npos : end - begin);
    while (!line.empty() &&
           (line.back() == ' ' || line.back() == '\t' || line.back() == '\r')) {
      line.pop_back();
    }
    if (line.size() > kMaxSummaryLen) {
      line.resize(kMaxSummaryLen);
      line += " ...";
    } else if (end != std::string::npos &&
               sql_.find_first_not_of(" \t\r\n", end) != std::string::npos) {
      line += " ...";
    }
    return line;
  }

 private:
  static constexpr std::string::size_type kMaxSummaryLen = 100;

  std::string sql_;
  LogSettings settings_;
  std::chrono::steady_clock::time_point start_;
  uint64_t rows_returned_ = 0;
  uint64_t rows_affected_ = 0;
  bool finished_ = false;
};

}  // namespace anydb
