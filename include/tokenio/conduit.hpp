#pragma once
#include "tokenio/cancel_token.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <system_error>

namespace tio {

// Bounded hand-off between one producer and its consumers.
// capacity 0 is a rendezvous: send() returns only once a receiver took the
// value. capacity N lets up to N values wait in the queue.
template <class T>
class Conduit {
public:
  explicit Conduit(std::size_t capacity = 0) : cap_(capacity) {}
  Conduit(const Conduit&) = delete;
  Conduit& operator=(const Conduit&) = delete;

  // Delivers `v` or gives up when `cancel` fires first. The return value is
  // empty on delivery, the cancellation error, or broken_pipe once closed.
  // A value not yet taken when cancellation wins is withdrawn.
  std::error_code send(T v, const CancelToken& cancel) {
    std::unique_lock<std::mutex> lk(mu_);
    const std::size_t room = cap_ ? cap_ : 1;

    while (!closed_ && q_.size() >= room) {
      if (cancel.fired()) return cancel.error();
      cv_.wait_for(lk, kPollSlice);
    }
    if (closed_) return std::make_error_code(std::errc::broken_pipe);
    if (cancel.fired()) return cancel.error();

    q_.push_back(std::move(v));
    const std::uint64_t ticket = ++pushed_;
    cv_.notify_all();
    if (cap_) return {};

    while (taken_ < ticket) {
      if (closed_ || cancel.fired()) {
        q_.pop_back();
        --pushed_;
        return closed_ ? std::make_error_code(std::errc::broken_pipe) : cancel.error();
      }
      cv_.wait_for(lk, kPollSlice);
    }
    return {};
  }

  // Blocks until a value arrives; nullopt once closed and drained.
  std::optional<T> receive() {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [&] { return !q_.empty() || closed_; });
    return take_locked();
  }

  std::optional<T> try_receive() {
    std::lock_guard<std::mutex> lk(mu_);
    return take_locked();
  }

  // Wakes every waiter; pending values can still be received.
  void close() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
  }

  std::size_t capacity() const noexcept { return cap_; }

private:
  static constexpr std::chrono::milliseconds kPollSlice{5};

  std::optional<T> take_locked() {
    if (q_.empty()) return std::nullopt;
    T v = std::move(q_.front());
    q_.pop_front();
    ++taken_;
    cv_.notify_all();
    return v;
  }

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<T> q_;
  std::size_t cap_;
  bool closed_{false};
  std::uint64_t pushed_{0};
  std::uint64_t taken_{0};
};

}
