// Copyright (c) 2024 liudegui. MIT License.
//
// anydb::SqliteStatementCache -- LRU cache of persistent statements.
//
// Design:
//   - Keyed by the full SQL text; a value holds the compiled statements of
//     the batch (a "virtual statement")
//   - Capacity 0 disables caching; persistent statements are then compiled
//     per execution like one-shot ones
//   - Evicted and cleared statements are finalized immediately

#pragma once

#include <cstddef>
#include <list>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "anydb/error.hpp"
#include "anydb/sqlite_handle.hpp"
#include "anydb/sqlite_statement.hpp"

namespace anydb {

/// Every statement of one SQL batch. Statements are compiled only when
/// execution reaches them, so a batch may use tables it creates itself.
struct SqliteVirtualStatement {
  std::string sql;
  bool persistent = false;
  std::vector<SqliteStatementHandle> handles;
  size_t compiled_upto = 0;
  bool complete = false;

  /// Statement `index` of the batch, compiling it on first use. *out is set
  /// to nullptr past the last statement.
  Error Statement(SqliteHandle& db, size_t index, SqliteStatementHandle** out) {
    while (index >= handles.size() && !complete) {
      SqliteStatementHandle next;
      Error err = db.PrepareNext(sql, &compiled_upto, persistent, &next);
      if (!err.ok()) { return err; }
      if (!next.Valid()) {
        complete = true;
        break;
      }
      handles.push_back(std::move(next));
    }
    *out = (index < handles.size()) ? &handles[index] : nullptr;
    return Error::Ok();
  }

  Error CompileAll(SqliteHandle& db) {
    SqliteStatementHandle* last = nullptr;
    for (size_t i = 0;; ++i) {
      Error err = Statement(db, i, &last);
      if (!err.ok()) { return err; }
      if (last == nullptr) { return Error::Ok(); }
    }
  }

  /// Sum of the parameters of the compiled statements.
  int32_t NumParams() const {
    int32_t n = 0;
    for (const SqliteStatementHandle& h : handles) { n += h.BindParameterCount(); }
    return n;
  }

  void Reset() {
    for (SqliteStatementHandle& h : handles) {
      // Result is the last step's error, already reported by Step().
      Error ignored = h.Reset();
      (void)ignored;
    }
  }
};

// ---------------------------------------------------------------------------
// SqliteStatementCache
// ---------------------------------------------------------------------------

class SqliteStatementCache {
 public:
  explicit SqliteStatementCache(size_t capacity) : capacity_(capacity) {}

  SqliteStatementCache(const SqliteStatementCache&) = delete;
  SqliteStatementCache& operator=(const SqliteStatementCache&) = delete;

  /// Cached statement for `sql`, marked most recently used; or nullptr.
  SqliteVirtualStatement* Get(const std::string& sql) {
    auto it = index_.find(sql);
    if (it == index_.end()) { return nullptr; }
    entries_.splice(entries_.begin(), entries_, it->second);
    return entries_.front().get();
  }

  /// Take ownership of `stmt`, evicting the least recently used entry when
  /// full. Returns the cached pointer, or nullptr when caching is disabled
  /// (`stmt` is then left untouched for the caller to use once).
  SqliteVirtualStatement* Insert(std::unique_ptr<SqliteVirtualStatement>& stmt) {
    if (capacity_ == 0 || stmt == nullptr) { return nullptr; }
    auto existing = index_.find(stmt->sql);
    if (existing != index_.end()) {
      entries_.erase(existing->second);
      index_.erase(existing);
    }
    while (entries_.size() >= capacity_) {
      index_.erase(entries_.back()->sql);
      entries_.pop_back();
    }
    entries_.push_front(std::move(stmt));
    index_[entries_.front()->sql] = entries_.begin();
    return entries_.front().get();
  }

  void Remove(const std::string& sql) {
    auto it = index_.find(sql);
    if (it == index_.end()) { return; }
    entries_.erase(it->second);
    index_.erase(it);
  }

  size_t Len() const { return entries_.size(); }

  void Clear() {
    index_.clear();
    entries_.clear();
  }

 private:
  using EntryList = std::list<std::unique_ptr<SqliteVirtualStatement>>;

  size_t capacity_;
  EntryList entries_;
  std::unordered_map<std::string, EntryList::iterator> index_;
};

}  // namespace anydb
