// Copyright (c) 2024 liudegui. MIT License.
//
// anydb::AnyConnectOptions -- erased connection configuration.
//
// Only the URL and the shared log settings are backend-neutral; each driver
// derives its own options from them.

#pragma once

#include <string>

#include "anydb/error.hpp"
#include "anydb/log_settings.hpp"

namespace anydb {

struct AnyConnectOptions {
  std::string database_url;
  LogSettings log_settings;

  /// Scheme part of the URL ("sqlite" for "sqlite::memory:"), or "".
  std::string Scheme() const {
    std::string::size_type colon = database_url.find(':');
    if (colon == std::string::npos) { return std::string(); }
    return database_url.substr(0, colon);
  }

  static Error FromUrl(const char* url, AnyConnectOptions* out) {
    if (url == nullptr || out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "url is null");
    }
    AnyConnectOptions opts;
    opts.database_url = url;
    if (opts.Scheme().empty()) {
      Error err;
      err.SetFormat(ErrorCode::kConfiguration,
                    "database URL has no scheme: %s", url);
      return err;
    }
    *out = opts;
    return Error::Ok();
  }
};

}  // namespace anydb
