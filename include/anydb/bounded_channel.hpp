// Copyright (c) 2024 liudegui. MIT License.
//
// anydb::BoundedChannel -- fixed-capacity single-producer channel.
//
// Design:
//   - Mutex + two condition variables around a std::deque
//   - Send() blocks while the channel is full (backpressure)
//   - The producer ends the sequence explicitly with Finish(); a producer
//     released without Finish() leaves the channel broken, which the
//     consumer sees as kBroken once the buffered items are drained
//   - The consumer may close its side at any time; pending and later
//     Send() calls then return false
//   - A producer that called BeginProducing() is waited for when the
//     consumer closes; one that never started is not
//   - ChannelSender / ChannelReceiver are the move-only RAII endpoints

#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>

namespace anydb {

enum class RecvStatus : uint8_t {
  kItem,    ///< an item was received
  kEnd,     ///< producer finished and all items were consumed
  kBroken,  ///< producer went away without finishing
};

// ---------------------------------------------------------------------------
// BoundedChannel
// ---------------------------------------------------------------------------

template <typename T>
class BoundedChannel {
 public:
  explicit BoundedChannel(size_t capacity)
      : capacity_(capacity == 0 ? 1 : capacity) {}

  BoundedChannel(const BoundedChannel&) = delete;
  BoundedChannel& operator=(const BoundedChannel&) = delete;

  // --- Producer side ---

  /// Blocks while full. Returns false if the item can no longer be delivered.
  bool Send(T item) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this] {
      return items_.size() < capacity_ || receiver_closed_ || aborted_;
    });
    if (receiver_closed_ || aborted_ || finished_) { return false; }
    items_.push_back(std::move(item));
    not_empty_.notify_one();
    return true;
  }

  /// Non-blocking Send(). Returns false when full or closed.
  bool TrySend(T item) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (receiver_closed_ || aborted_ || finished_ ||
        items_.size() >= capacity_) {
      return false;
    }
    items_.push_back(std::move(item));
    not_empty_.notify_one();
    return true;
  }

  void Finish() {
    std::lock_guard<std::mutex> lock(mutex_);
    finished_ = true;
    not_empty_.notify_all();
  }

  /// Claim the channel before touching anything the consumer lends.
  /// Returns false if the consumer is already gone.
  bool BeginProducing() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (receiver_closed_ || aborted_) { return false; }
    producing_ = true;
    return true;
  }

  void ReleaseSender() {
    std::lock_guard<std::mutex> lock(mutex_);
    sender_released_ = true;
    not_empty_.notify_all();
    released_.notify_all();
  }

  bool ReceiverClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return receiver_closed_ || aborted_;
  }

  // --- Consumer side ---

  RecvStatus Recv(T* out) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] {
      return !items_.empty() || finished_ || sender_released_ || aborted_;
    });
    if (!items_.empty()) {
      *out = std::move(items_.front());
      items_.pop_front();
      not_full_.notify_one();
      return RecvStatus::kItem;
    }
    if (finished_ && !aborted_) { return RecvStatus::kEnd; }
    return RecvStatus::kBroken;
  }

  void CloseReceiver() {
    std::lock_guard<std::mutex> lock(mutex_);
    receiver_closed_ = true;
    items_.clear();
    not_full_.notify_all();
  }

  /// Blocks until a started producer has released its endpoint.
  void WaitSenderReleased() {
    std::unique_lock<std::mutex> lock(mutex_);
    released_.wait(lock, [this] { return sender_released_ || !producing_; });
  }

  // --- Either side ---

  /// Breaks the channel for both ends. Buffered items stay receivable.
  void Abort() {
    std::lock_guard<std::mutex> lock(mutex_);
    aborted_ = true;
    not_full_.notify_all();
    not_empty_.notify_all();
  }

  /// Drop every buffered item (used when a command queue is discarded).
  std::deque<T> TakeAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::deque<T> out;
    out.swap(items_);
    not_full_.notify_all();
    return out;
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

  size_t Capacity() const { return capacity_; }

 private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_full_;
  std::condition_variable not_empty_;
  std::condition_variable released_;
  std::deque<T> items_;
  bool finished_ = false;
  bool sender_released_ = false;
  bool producing_ = false;
  bool receiver_closed_ = false;
  bool aborted_ = false;
};

// ---------------------------------------------------------------------------
// ChannelSender
// ---------------------------------------------------------------------------

template <typename T>
class ChannelSender {
 public:
  ChannelSender() = default;
  explicit ChannelSender(std::shared_ptr<BoundedChannel<T>> channel)
      : channel_(std::move(channel)) {}

  ~ChannelSender() { Release(); }

  ChannelSender(ChannelSender&& other) noexcept
      : channel_(std::move(other.channel_)) {}

  ChannelSender& operator=(ChannelSender&& other) noexcept {
    if (this != &other) {
      Release();
      channel_ = std::move(other.channel_);
    }
    return *this;
  }

  ChannelSender(const ChannelSender&) = delete;
  ChannelSender& operator=(const ChannelSender&) = delete;

  bool Send(T item) {
    return channel_ != nullptr && channel_->Send(std::move(item));
  }

  bool TrySend(T item) {
    return channel_ != nullptr && channel_->TrySend(std::move(item));
  }

  bool BeginProducing() {
    return channel_ != nullptr && channel_->BeginProducing();
  }

  /// Ends the sequence normally and releases the endpoint.
  void Finish() {
    if (channel_ != nullptr) {
      channel_->Finish();
      Release();
    }
  }

  bool Closed() const {
    return channel_ == nullptr || channel_->ReceiverClosed();
  }

  bool Valid() const { return channel_ != nullptr; }

  const std::shared_ptr<BoundedChannel<T>>& Channel() const {
    return channel_;
  }

 private:
  void Release() {
    if (channel_ != nullptr) {
      channel_->ReleaseSender();
      channel_.reset();
    }
  }

  std::shared_ptr<BoundedChannel<T>> channel_;
};

// ---------------------------------------------------------------------------
// ChannelReceiver
// ---------------------------------------------------------------------------

template <typename T>
class ChannelReceiver {
 public:
  ChannelReceiver() = default;
  explicit ChannelReceiver(std::shared_ptr<BoundedChannel<T>> channel)
      : channel_(std::move(channel)) {}

  ~ChannelReceiver() { Close(); }

  ChannelReceiver(ChannelReceiver&& other) noexcept
      : channel_(std::move(other.channel_)) {}

  ChannelReceiver& operator=(ChannelReceiver&& other) noexcept {
    if (this != &other) {
      Close();
      channel_ = std::move(other.channel_);
    }
    return *this;
  }

  ChannelReceiver(const ChannelReceiver&) = delete;
  ChannelReceiver& operator=(const ChannelReceiver&) = delete;

  RecvStatus Recv(T* out) {
    if (channel_ == nullptr) { return RecvStatus::kBroken; }
    return channel_->Recv(out);
  }

  /// Stop receiving; if the producer has started, wait until it lets go.
  void Close() {
    if (channel_ != nullptr) {
      channel_->CloseReceiver();
      channel_->WaitSenderReleased();
      channel_.reset();
    }
  }

  size_t Buffered() const {
    return channel_ != nullptr ? channel_->Size() : 0;
  }

  bool Valid() const { return channel_ != nullptr; }

 private:
  std::shared_ptr<BoundedChannel<T>> channel_;
};

template <typename T>
std::pair<ChannelSender<T>, ChannelReceiver<T>> MakeChannel(size_t capacity) {
  auto channel = std::make_shared<BoundedChannel<T>>(capacity);
  return std::make_pair(ChannelSender<T>(channel), ChannelReceiver<T>(channel));
}

}  // namespace anydb
