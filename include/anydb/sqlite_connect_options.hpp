// Copyright (c) 2024 liudegui. MIT License.
//
// anydb::SqliteConnectOptions -- SQLite connection configuration.
//
// URL format:
//   sqlite::memory:                      private in-memory database
//   sqlite:data.db / sqlite://data.db    file relative to the working dir
//   sqlite:///tmp/data.db                absolute path
//   ...?mode=ro|rw|rwc|memory&cache=shared|private&immutable=true
//      &busy_timeout=<ms>&statement_cache_capacity=<n>
//      &row_channel_size=<n>&command_channel_size=<n>
//
// Unknown parameters and malformed values are rejected with kConfiguration.

#pragma once

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <string>

#include "sqlite3.h"

#include "anydb/error.hpp"
#include "anydb/log_settings.hpp"

namespace anydb {

struct SqliteConnectOptions {
  std::string filename = ":memory:";
  bool in_memory = true;
  bool read_only = false;
  bool create_if_missing = false;
  bool shared_cache = false;
  bool immutable = false;
  uint32_t busy_timeout_ms = 5000;
  uint32_t statement_cache_capacity = 100;
  uint32_t row_channel_size = 50;
  uint32_t command_channel_size = 50;
  LogSettings log_settings;

  // --- Builders ---

  SqliteConnectOptions& Filename(const std::string& path) {
    filename = path;
    in_memory = (path.empty() || path == ":memory:");
    if (in_memory) { filename = ":memory:"; }
    return *this;
  }

  SqliteConnectOptions& ReadOnly(bool value) {
    read_only = value;
    return *this;
  }

  SqliteConnectOptions& CreateIfMissing(bool value) {
    create_if_missing = value;
    return *this;
  }

  SqliteConnectOptions& StatementCacheCapacity(uint32_t value) {
    statement_cache_capacity = value;
    return *this;
  }

  SqliteConnectOptions& RowChannelSize(uint32_t value) {
    row_channel_size = value;
    return *this;
  }

  // --- URL parsing ---

  static Error FromUrl(const char* url, SqliteConnectOptions* out) {
    if (url == nullptr || out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "url is null");
    }
    std::string s(url);
    static const char kScheme[] = "sqlite:";
    if (s.compare(0, sizeof(kScheme) - 1, kScheme) != 0) {
      return ConfigError("not a sqlite URL", url);
    }
    std::string rest = s.substr(sizeof(kScheme) - 1);
    if (rest.compare(0, 2, "//") == 0) { rest = rest.substr(2); }

    std::string query;
    std::string::size_type q = rest.find('?');
    if (q != std::string::npos) {
      query = rest.substr(q + 1);
      rest = rest.substr(0, q);
    }

    SqliteConnectOptions opts;
    std::string path;
    if (!PercentDecode(rest, &path)) {
      return ConfigError("invalid percent-encoding in path", url);
    }
    opts.Filename(path);

    std::string::size_type pos = 0;
    while (pos <= query.size() && !query.empty()) {
      std::string::size_type amp = query.find('&', pos);
      std::string pair = query.substr(
          pos, amp == std::string::npos ? std::string::npos : amp - pos);
      if (!pair.empty()) {
        std::string::size_type eq = pair.find('=');
        std::string key = pair.substr(0, eq);
        std::string value;
        if (eq == std::string::npos ||
            !PercentDecode(pair.substr(eq + 1), &value)) {
          return ConfigError("malformed query parameter", pair.c_str());
        }
        Error err = opts.ApplyParameter(key, value);
        if (!err.ok()) { return err; }
      }
      if (amp == std::string::npos) { break; }
      pos = amp + 1;
    }

    *out = opts;
    return Error::Ok();
  }

  // --- sqlite3_open_v2 arguments ---

  std::string OpenFilename() const {
    if (immutable && !in_memory) { return "file:" + filename + "?immutable=1"; }
    return filename;
  }

  int32_t OpenFlags() const {
    int32_t flags = read_only ? SQLITE_OPEN_READONLY : SQLITE_OPEN_READWRITE;
    if (!read_only && (create_if_missing || in_memory)) {
      flags |= SQLITE_OPEN_CREATE;
    }
    if (in_memory) { flags |= SQLITE_OPEN_MEMORY; }
    if (immutable) { flags |= SQLITE_OPEN_URI; }
    flags |= shared_cache ? SQLITE_OPEN_SHAREDCACHE : SQLITE_OPEN_PRIVATECACHE;
    return flags;
  }

 private:
  Error ApplyParameter(const std::string& key, const std::string& value) {
    if (key == "mode") {
      if (value == "ro") {
        read_only = true;
        create_if_missing = false;
      } else if (value == "rw") {
        read_only = false;
        create_if_missing = false;
      } else if (value == "rwc") {
        read_only = false;
        create_if_missing = true;
      } else if (value == "memory") {
        in_memory = true;
        filename = ":memory:";
      } else {
        return ConfigError("unknown value for `mode`", value.c_str());
      }
      return Error::Ok();
    }
    if (key == "cache") {
      if (value == "shared") {
        shared_cache = true;
      } else if (value == "private") {
        shared_cache = false;
      } else {
        return ConfigError("unknown value for `cache`", value.c_str());
      }
      return Error::Ok();
    }
    if (key == "immutable") {
      if (value == "true" || value == "1") {
        immutable = true;
      } else if (value == "false" || value == "0") {
        immutable = false;
      } else {
        return ConfigError("unknown value for `immutable`", value.c_str());
      }
      return Error::Ok();
    }
    uint32_t* target = nullptr;
    if (key == "busy_timeout") {
      target = &busy_timeout_ms;
    } else if (key == "statement_cache_capacity") {
      target = &statement_cache_capacity;
    } else if (key == "row_channel_size") {
      target = &row_channel_size;
    } else if (key == "command_channel_size") {
      target = &command_channel_size;
    }
    if (target == nullptr) {
      return ConfigError("unknown query parameter", key.c_str());
    }
    if (!ParseUint(value, target)) {
      return ConfigError("expected an unsigned integer for", key.c_str());
    }
    if ((target == &row_channel_size || target == &command_channel_size) &&
        *target == 0) {
      return ConfigError("channel size must be at least 1:", key.c_str());
    }
    return Error::Ok();
  }

  static bool ParseUint(const std::string& s, uint32_t* out) {
    if (s.empty() || s.size() > 9) { return false; }
    for (char c : s) {
      if (!std::isdigit(static_cast<unsigned char>(c))) { return false; }
    }
    *out = static_cast<uint32_t>(std::strtoul(s.c_str(), nullptr, 10));
    return true;
  }

  static bool PercentDecode(const std::string& in, std::string* out) {
    out->clear();
    for (std::string::size_type i = 0; i < in.size(); ++i) {
      if (in[i] != '%') {
        out->push_back(in[i]);
        continue;
      }
      if (i + 2 >= in.size() ||
          !std::isxdigit(static_cast<unsigned char>(in[i + 1])) ||
          !std::isxdigit(static_cast<unsigned char>(in[i + 2]))) {
        return false;
      }
      char hex[3] = {in[i + 1], in[i + 2], '\0'};
      out->push_back(static_cast<char>(std::strtoul(hex, nullptr, 16)));
      i += 2;
    }
    return true;
  }

  static Error ConfigError(const char* what, const char* detail) {
    Error err;
    err.SetFormat(ErrorCode::kConfiguration, "%s %s", what,
                  detail != nullptr ? detail : "");
    return err;
  }
};

}  // namespace anydb
