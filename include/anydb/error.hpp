// Copyright (c) 2024 liudegui. MIT License.
//
// anydb::Error -- error handling without exceptions.
//
// Design:
//   - ErrorCode enum class with fixed-width underlying type
//   - Error struct: code + fixed-size message buffer
//   - Compatible with -fno-exceptions
//   - Backend codes (kError..kFull) carry the driver's message verbatim;
//     bridge codes (kUnsupportedType..kColumnDecode) are raised only by the
//     erased/concrete translation layer

#pragma once

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>

namespace anydb {

// ---------------------------------------------------------------------------
// ErrorCode
// ---------------------------------------------------------------------------

enum class ErrorCode : int32_t {
  kOk = 0,
  kError = -1,
  kNotOpen = -2,
  kBusy = -3,
  kNotFound = -4,
  kConstraint = -5,
  kMismatch = -6,
  kMisuse = -7,
  kRange = -8,
  kNullParam = -9,
  kIoError = -10,
  kFull = -11,

  // Raised by the bridge, never by a backend.
  kUnsupportedType = -20,
  kUnsupportedArgumentKind = -21,
  kColumnDecode = -22,

  // Worker/channel broke before the sequence completed.
  kWorkerCrashed = -30,
  kConfiguration = -31,
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk: return "Ok";
    case ErrorCode::kError: return "Error";
    case ErrorCode::kNotOpen: return "NotOpen";
    case ErrorCode::kBusy: return "Busy";
    case ErrorCode::kNotFound: return "NotFound";
    case ErrorCode::kConstraint: return "Constraint";
    case ErrorCode::kMismatch: return "Mismatch";
    case ErrorCode::kMisuse: return "Misuse";
    case ErrorCode::kRange: return "Range";
    case ErrorCode::kNullParam: return "NullParam";
    case ErrorCode::kIoError: return "IoError";
    case ErrorCode::kFull: return "Full";
    case ErrorCode::kUnsupportedType: return "UnsupportedType";
    case ErrorCode::kUnsupportedArgumentKind: return "UnsupportedArgumentKind";
    case ErrorCode::kColumnDecode: return "ColumnDecode";
    case ErrorCode::kWorkerCrashed: return "WorkerCrashed";
    case ErrorCode::kConfiguration: return "Configuration";
  }
  return "Unknown";
}

// ---------------------------------------------------------------------------
// Error
// ---------------------------------------------------------------------------

struct Error {
  static constexpr uint32_t kMaxMessageLen = 256;

  ErrorCode code = ErrorCode::kOk;
  char message[kMaxMessageLen] = {};

  bool ok() const { return code == ErrorCode::kOk; }
  explicit operator bool() const { return ok(); }

  /// True for the failures introduced by the erased/concrete translation.
  bool IsBridgeError() const {
    return code == ErrorCode::kUnsupportedType ||
           code == ErrorCode::kUnsupportedArgumentKind ||
           code == ErrorCode::kColumnDecode;
  }

  void Set(ErrorCode c, const char* msg) {
    code = c;
    if (msg != nullptr) {
      std::strncpy(message, msg, kMaxMessageLen - 1);
      message[kMaxMessageLen - 1] = '\0';
    } else {
      message[0] = '\0';
    }
  }

  void SetFormat(ErrorCode c, const char* fmt, ...) {
    code = c;
    if (fmt != nullptr) {
      va_list ap;
      va_start(ap, fmt);
      std::vsnprintf(message, kMaxMessageLen, fmt, ap);
      va_end(ap);
    } else {
      message[0] = '\0';
    }
  }

  void Clear() {
    code = ErrorCode::kOk;
    message[0] = '\0';
  }

  static Error Ok() { return Error{}; }

  static Error Make(ErrorCode c, const char* msg = nullptr) {
    Error e;
    e.Set(c, msg);
    return e;
  }
};

/// Copy `err` into `out_error` when the caller asked for it.
inline void AssignError(Error* out_error, const Error& err) {
  if (out_error != nullptr) { *out_error = err; }
}

}  // namespace anydb
