// Copyright (c) 2024 liudegui. MIT License.
//
// anydb::AnyConnection -- backend-agnostic connection handle.
//
// Design:
//   - Owns one AnyConnectionBackend chosen by URL scheme at Connect()
//   - Every method delegates directly to the backend
//   - Move-only, RAII: destruction force-closes an open backend
//
// Usage:
//   #include "anydb/anydb.hpp"
//   anydb::InstallDefaultDrivers();
//   anydb::AnyConnection conn;
//   conn.Connect("sqlite::memory:");
//   anydb::AnyStream s = conn.FetchMany("SELECT 1;");

#pragma once

#include <memory>
#include <utility>
#include <vector>

#include "anydb/any_connect_options.hpp"
#include "anydb/any_connection_backend.hpp"
#include "anydb/any_driver.hpp"
#include "anydb/error.hpp"

namespace anydb {

class AnyConnection {
 public:
  AnyConnection() = default;

  explicit AnyConnection(std::unique_ptr<AnyConnectionBackend> backend)
      : backend_(std::move(backend)) {}

  ~AnyConnection() {
    if (backend_ != nullptr) { backend_->CloseHard(); }
  }

  // Move
  AnyConnection(AnyConnection&& other) noexcept
      : backend_(std::move(other.backend_)) {}

  AnyConnection& operator=(AnyConnection&& other) noexcept {
    if (this != &other) {
      if (backend_ != nullptr) { backend_->CloseHard(); }
      backend_ = std::move(other.backend_);
    }
    return *this;
  }

  // No copy
  AnyConnection(const AnyConnection&) = delete;
  AnyConnection& operator=(const AnyConnection&) = delete;

  // --- Connect / Close ---

  Error Connect(const char* url) {
    AnyConnectOptions options;
    Error err = AnyConnectOptions::FromUrl(url, &options);
    if (!err.ok()) { return err; }
    return ConnectWith(options);
  }

  Error ConnectWith(const AnyConnectOptions& options) {
    const AnyDriver* driver = FindDriver(options.Scheme());
    if (driver == nullptr || driver->connect == nullptr) {
      Error err;
      err.SetFormat(ErrorCode::kConfiguration,
                    "no driver found for URL scheme \"%s\"",
                    options.Scheme().c_str());
      return err;
    }
    Error err;
    std::unique_ptr<AnyConnectionBackend> backend =
        driver->connect(options, &err);
    if (backend == nullptr) {
      if (err.ok()) { err.Set(ErrorCode::kError, "driver connect failed"); }
      return err;
    }
    if (backend_ != nullptr) { backend_->CloseHard(); }
    backend_ = std::move(backend);
    return Error::Ok();
  }

  Error Close() {
    if (backend_ == nullptr) { return Error::Ok(); }
    Error err = backend_->Close();
    backend_.reset();
    return err;
  }

  Error CloseHard() {
    if (backend_ == nullptr) { return Error::Ok(); }
    Error err = backend_->CloseHard();
    backend_.reset();
    return err;
  }

  bool IsOpen() const { return backend_ != nullptr; }

  const char* BackendName() const {
    return (backend_ != nullptr) ? backend_->Name() : "";
  }

  Error Ping() {
    if (backend_ == nullptr) { return NotOpen(); }
    return backend_->Ping();
  }

  // --- Transaction ---

  Error Begin() {
    if (backend_ == nullptr) { return NotOpen(); }
    return backend_->Begin();
  }

  Error Commit() {
    if (backend_ == nullptr) { return NotOpen(); }
    return backend_->Commit();
  }

  Error Rollback() {
    if (backend_ == nullptr) { return NotOpen(); }
    return backend_->Rollback();
  }

  void StartRollback() {
    if (backend_ != nullptr) { backend_->StartRollback(); }
  }

  // --- Flush ---

  Error Flush() {
    if (backend_ == nullptr) { return NotOpen(); }
    return backend_->Flush();
  }

  bool ShouldFlush() const {
    return backend_ != nullptr && backend_->ShouldFlush();
  }

  // --- Query ---

  AnyStream FetchMany(const char* sql,
                      const AnyArguments* arguments = nullptr) {
    if (backend_ == nullptr) { return AnyStream::Failed(NotOpen()); }
    return backend_->FetchMany(sql, arguments);
  }

  bool FetchOptional(const char* sql, const AnyArguments* arguments,
                     AnyRow* out_row, Error* out_error = nullptr) {
    if (backend_ == nullptr) {
      AssignError(out_error, NotOpen());
      return false;
    }
    return backend_->FetchOptional(sql, arguments, out_row, out_error);
  }

  /// Run `sql` to completion and return the folded summary.
  AnyQueryResult Execute(const char* sql,
                         const AnyArguments* arguments = nullptr,
                         Error* out_error = nullptr) {
    AnyQueryResult result;
    Error err = FetchMany(sql, arguments).Drain(&result);
    AssignError(out_error, err);
    return result;
  }

  AnyStatement Prepare(const char* sql, Error* out_error = nullptr) {
    return PrepareWith(sql, std::vector<AnyTypeInfo>(), out_error);
  }

  AnyStatement PrepareWith(const char* sql,
                           const std::vector<AnyTypeInfo>& parameters,
                           Error* out_error = nullptr) {
    if (backend_ == nullptr) {
      AssignError(out_error, NotOpen());
      return AnyStatement{};
    }
    return backend_->PrepareWith(sql, parameters, out_error);
  }

  AnyDescribe Describe(const char* sql, Error* out_error = nullptr) {
    if (backend_ == nullptr) {
      AssignError(out_error, NotOpen());
      return AnyDescribe{};
    }
    return backend_->Describe(sql, out_error);
  }

  /// Access the underlying backend implementation.
  AnyConnectionBackend* Backend() { return backend_.get(); }
  const AnyConnectionBackend* Backend() const { return backend_.get(); }

 private:
  static Error NotOpen() {
    return Error::Make(ErrorCode::kNotOpen, "Connection not open");
  }

  std::unique_ptr<AnyConnectionBackend> backend_;
};

}  // namespace anydb
