// Copyright (c) 2024 liudegui. MIT License.
//
// anydb -- backend-agnostic database access over native drivers.
//
// Umbrella header. Include this and call InstallDefaultDrivers() once before
// connecting through AnyConnection.

#pragma once

#include <vector>

#include "anydb/any_connection.hpp"
#include "anydb/any_driver.hpp"
#include "anydb/error.hpp"
#include "anydb/log_settings.hpp"
#include "anydb/sqlite_any.hpp"
#include "anydb/sqlite_connection.hpp"

namespace anydb {

/// Install every driver built into this library. Repeated calls are no-ops.
inline Error InstallDefaultDrivers() {
  return InstallDrivers(std::vector<const AnyDriver*>{&SqliteDriver()});
}

}  // namespace anydb
