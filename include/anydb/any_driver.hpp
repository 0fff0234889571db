// Copyright (c) 2024 liudegui. MIT License.
//
// anydb::AnyDriver -- driver declaration and process-wide driver table.
//
// Design:
//   - A driver is a static record: name, URL schemes, connect function
//   - The table is installed once per process; lookups are by URL scheme
//   - Installing a second, different table is a misuse and is rejected

#pragma once

#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "anydb/any_connect_options.hpp"
#include "anydb/any_connection_backend.hpp"
#include "anydb/error.hpp"

namespace anydb {

struct AnyDriver {
  using ConnectFn = std::unique_ptr<AnyConnectionBackend> (*)(
      const AnyConnectOptions& options, Error* out_error);

  const char* name = nullptr;
  std::vector<std::string> url_schemes;
  ConnectFn connect = nullptr;

  bool HandlesScheme(const std::string& scheme) const {
    for (const std::string& s : url_schemes) {
      if (s == scheme) { return true; }
    }
    return false;
  }
};

namespace detail {

struct DriverTable {
  std::mutex mutex;
  bool installed = false;
  std::vector<const AnyDriver*> drivers;
};

inline DriverTable& Drivers() {
  static DriverTable table;
  return table;
}

}  // namespace detail

inline Error InstallDrivers(const std::vector<const AnyDriver*>& drivers) {
  detail::DriverTable& table = detail::Drivers();
  std::lock_guard<std::mutex> lock(table.mutex);
  if (table.installed) {
    if (table.drivers == drivers) { return Error::Ok(); }
    return Error::Make(ErrorCode::kMisuse, "drivers already installed");
  }
  table.drivers = drivers;
  table.installed = true;
  return Error::Ok();
}

inline const AnyDriver* FindDriver(const std::string& scheme) {
  detail::DriverTable& table = detail::Drivers();
  std::lock_guard<std::mutex> lock(table.mutex);
  for (const AnyDriver* driver : table.drivers) {
    if (driver != nullptr && driver->HandlesScheme(scheme)) { return driver; }
  }
  return nullptr;
}

inline bool DriversInstalled() {
  detail::DriverTable& table = detail::Drivers();
  std::lock_guard<std::mutex> lock(table.mutex);
  return table.installed;
}

}  // namespace anydb
