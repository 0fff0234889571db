// Copyright (c) 2024 liudegui. MIT License.
//
// anydb::AnyStream -- lazy, one-pass sequence of erased query items.
//
// Design:
//   - Each item is either a statement summary or a row, in execution order
//   - Next() pulls one item from the live execution; nothing is buffered
//     beyond what the backend's bounded channel holds
//   - The sequence ends with kEnd, or with exactly one kError; after either,
//     Next() keeps returning kEnd. Items already delivered stay valid
//   - Destroying (or Abandon()ing) the stream before the end cancels the
//     execution; the backend stops producing and releases the statement

#pragma once

#include <cstdint>
#include <memory>
#include <utility>

#include "anydb/any_query_result.hpp"
#include "anydb/any_row.hpp"
#include "anydb/error.hpp"
#include "anydb/stream_status.hpp"

namespace anydb {

// ---------------------------------------------------------------------------
// AnyItem
// ---------------------------------------------------------------------------

struct AnyItem {
  enum class Kind : uint8_t { kResult, kRow };

  Kind kind = Kind::kResult;
  AnyQueryResult result;
  AnyRow row;

  bool IsRow() const { return kind == Kind::kRow; }
  bool IsResult() const { return kind == Kind::kResult; }

  static AnyItem FromResult(const AnyQueryResult& result) {
    AnyItem item;
    item.kind = Kind::kResult;
    item.result = result;
    return item;
  }

  static AnyItem FromRow(AnyRow row) {
    AnyItem item;
    item.kind = Kind::kRow;
    item.row = std::move(row);
    return item;
  }
};

// ---------------------------------------------------------------------------
// AnyStreamSource -- implemented by each backend
// ---------------------------------------------------------------------------

class AnyStreamSource {
 public:
  virtual ~AnyStreamSource() = default;

  /// Produce the next item, or report the end / a terminal error.
  virtual StreamStatus Next(AnyItem* out, Error* out_error) = 0;
};

// ---------------------------------------------------------------------------
// AnyStream
// ---------------------------------------------------------------------------

class AnyStream {
 public:
  AnyStream() = default;

  explicit AnyStream(std::unique_ptr<AnyStreamSource> source)
      : source_(std::move(source)) {}

  /// A stream whose only item is `err`.
  static AnyStream Failed(const Error& err) {
    AnyStream stream;
    stream.pending_error_ = err;
    stream.has_pending_error_ = true;
    return stream;
  }

  AnyStream(AnyStream&& other) noexcept = default;
  AnyStream& operator=(AnyStream&& other) noexcept = default;

  AnyStream(const AnyStream&) = delete;
  AnyStream& operator=(const AnyStream&) = delete;

  StreamStatus Next(AnyItem* out, Error* out_error = nullptr) {
    if (has_pending_error_) {
      has_pending_error_ = false;
      AssignError(out_error, pending_error_);
      return StreamStatus::kError;
    }
    if (source_ == nullptr) { return StreamStatus::kEnd; }

    Error err;
    StreamStatus status = source_->Next(out, &err);
    if (status != StreamStatus::kItem) {
      source_.reset();
      if (status == StreamStatus::kError) { AssignError(out_error, err); }
    }
    return status;
  }

  /// Drain the remaining items, keeping only the summaries.
  Error Drain(AnyQueryResult* out_result = nullptr) {
    AnyItem item;
    Error err;
    for (;;) {
      StreamStatus status = Next(&item, &err);
      if (status == StreamStatus::kEnd) { return Error::Ok(); }
      if (status == StreamStatus::kError) { return err; }
      if (item.IsResult() && out_result != nullptr) {
        out_result->Extend(item.result);
      }
    }
  }

  /// Stop consuming. Safe to call at any point, including after the end.
  void Abandon() {
    source_.reset();
    has_pending_error_ = false;
  }

  bool Done() const { return source_ == nullptr && !has_pending_error_; }

 private:
  std::unique_ptr<AnyStreamSource> source_;
  Error pending_error_;
  bool has_pending_error_ = false;
};

}  // namespace anydb
