// Copyright (c) 2024 liudegui. MIT License.
//
// anydb::AnyValueKind -- one erased argument or cell value.
//
// Design:
//   - Tagged value over AnyTypeInfoKind; the tag may be one this build does
//     not know (see Tagged()), which conversions must reject explicitly
//   - Text and blob payloads are either owned (copied into the value) or
//     borrowed (pointer + length into a caller buffer). A borrowed value
//     must not outlive the buffer it points into
//   - Copyable; copying a borrowed value copies the reference, not the bytes

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "anydb/any_type_info.hpp"
#include "anydb/ownership.hpp"

namespace anydb {

// ---------------------------------------------------------------------------
// AnyValueKind
// ---------------------------------------------------------------------------

class AnyValueKind {
 public:
  AnyValueKind() = default;

  // --- Factories ---

  static AnyValueKind Null() { return AnyValueKind{}; }

  static AnyValueKind SmallInt(int16_t value) {
    AnyValueKind v(AnyTypeInfoKind::kSmallInt);
    v.int_ = value;
    return v;
  }

  static AnyValueKind Integer(int32_t value) {
    AnyValueKind v(AnyTypeInfoKind::kInteger);
    v.int_ = value;
    return v;
  }

  static AnyValueKind BigInt(int64_t value) {
    AnyValueKind v(AnyTypeInfoKind::kBigInt);
    v.int_ = value;
    return v;
  }

  static AnyValueKind Real(float value) {
    AnyValueKind v(AnyTypeInfoKind::kReal);
    v.float_ = value;
    return v;
  }

  static AnyValueKind Double(double value) {
    AnyValueKind v(AnyTypeInfoKind::kDouble);
    v.float_ = value;
    return v;
  }

  static AnyValueKind Text(std::string value) {
    AnyValueKind v(AnyTypeInfoKind::kText);
    v.bytes_.assign(value.begin(), value.end());
    return v;
  }

  /// Borrows `len` bytes at `data`; the caller keeps them alive.
  static AnyValueKind TextRef(const char* data, size_t len) {
    AnyValueKind v(AnyTypeInfoKind::kText);
    v.ownership_ = Ownership::kBorrowed;
    v.ref_ = reinterpret_cast<const uint8_t*>(data);
    v.ref_len_ = len;
    return v;
  }

  static AnyValueKind Blob(std::vector<uint8_t> value) {
    AnyValueKind v(AnyTypeInfoKind::kBlob);
    v.bytes_ = std::move(value);
    return v;
  }

  /// Borrows `len` bytes at `data`; the caller keeps them alive.
  static AnyValueKind BlobRef(const uint8_t* data, size_t len) {
    AnyValueKind v(AnyTypeInfoKind::kBlob);
    v.ownership_ = Ownership::kBorrowed;
    v.ref_ = data;
    v.ref_len_ = len;
    return v;
  }

  /// A payload-less value carrying only its tag. Used for kinds added by
  /// newer producers; known kinds should use the typed factories.
  static AnyValueKind Tagged(AnyTypeInfoKind kind) { return AnyValueKind(kind); }

  // --- Inspection ---

  AnyTypeInfoKind Kind() const { return kind_; }
  AnyTypeInfo TypeInfo() const { return AnyTypeInfo{kind_}; }
  bool IsNull() const { return kind_ == AnyTypeInfoKind::kNull; }
  Ownership GetOwnership() const { return ownership_; }
  bool IsBorrowed() const { return ownership_ == Ownership::kBorrowed; }

  /// Integer payload (SmallInt/Integer/BigInt).
  int64_t IntValue() const { return int_; }

  /// Floating payload (Real/Double).
  double FloatValue() const { return float_; }

  /// Text/blob payload, owned or borrowed.
  const uint8_t* Data() const {
    if (ownership_ == Ownership::kBorrowed) { return ref_; }
    return bytes_.empty() ? nullptr : bytes_.data();
  }

  size_t Size() const {
    return (ownership_ == Ownership::kBorrowed) ? ref_len_ : bytes_.size();
  }

  std::string TextString() const {
    const uint8_t* data = Data();
    if (data == nullptr) { return std::string(); }
    return std::string(reinterpret_cast<const char*>(data), Size());
  }

  std::vector<uint8_t> BlobBytes() const {
    const uint8_t* data = Data();
    if (data == nullptr) { return std::vector<uint8_t>(); }
    return std::vector<uint8_t>(data, data + Size());
  }

  /// Copy a borrowed payload into the value so it no longer references
  /// the caller's buffer.
  void MakeOwned() {
    if (ownership_ == Ownership::kBorrowed) {
      if (ref_ != nullptr) {
        bytes_.assign(ref_, ref_ + ref_len_);
      } else {
        bytes_.clear();
      }
      ref_ = nullptr;
      ref_len_ = 0;
      ownership_ = Ownership::kOwned;
    }
  }

 private:
  explicit AnyValueKind(AnyTypeInfoKind kind) : kind_(kind) {}

  AnyTypeInfoKind kind_ = AnyTypeInfoKind::kNull;
  Ownership ownership_ = Ownership::kOwned;
  int64_t int_ = 0;
  double float_ = 0.0;
  std::vector<uint8_t> bytes_;
  const uint8_t* ref_ = nullptr;
  size_t ref_len_ = 0;
};

// ---------------------------------------------------------------------------
// AnyArguments
// ---------------------------------------------------------------------------

/// Ordered erased arguments for one statement, bound positionally.
class AnyArguments {
 public:
  AnyArguments() = default;

  void AddNull() { values_.push_back(AnyValueKind::Null()); }
  void Add(int16_t value) { values_.push_back(AnyValueKind::SmallInt(value)); }
  void Add(int32_t value) { values_.push_back(AnyValueKind::Integer(value)); }
  void Add(int64_t value) { values_.push_back(AnyValueKind::BigInt(value)); }
  void Add(float value) { values_.push_back(AnyValueKind::Real(value)); }
  void Add(double value) { values_.push_back(AnyValueKind::Double(value)); }

  /// Borrowed: `text` must stay alive until the statement has finished.
  void Add(const char* text) {
    if (text == nullptr) {
      AddNull();
      return;
    }
    values_.push_back(AnyValueKind::TextRef(text, std::char_traits<char>::length(text)));
  }

  void Add(std::string text) {
    values_.push_back(AnyValueKind::Text(std::move(text)));
  }

  /// Borrowed: `data` must stay alive until the statement has finished.
  void Add(const uint8_t* data, size_t len) {
    values_.push_back(AnyValueKind::BlobRef(data, len));
  }

  void Add(std::vector<uint8_t> blob) {
    values_.push_back(AnyValueKind::Blob(std::move(blob)));
  }

  void AddValue(AnyValueKind value) { values_.push_back(std::move(value)); }

  size_t Len() const { return values_.size(); }
  bool Empty() const { return values_.empty(); }
  const std::vector<AnyValueKind>& Values() const { return values_; }
  void Clear() { values_.clear(); }

 private:
  std::vector<AnyValueKind> values_;
};

}  // namespace anydb
