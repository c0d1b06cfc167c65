#include "tokenio/cancel_token.hpp"
#include <condition_variable>
#include <mutex>
#include <optional>

namespace tio {

struct CancelToken::State {
  std::mutex mu;
  std::condition_variable cv;
  bool cancelled{false};
  std::optional<clock::time_point> deadline;

  bool expired_locked() const { return deadline && clock::now() >= *deadline; }
};

CancelToken::CancelToken() : st_(std::make_shared<State>()) {}

CancelToken CancelToken::with_deadline(clock::time_point deadline) {
  CancelToken t;
  t.st_->deadline = deadline;
  return t;
}

CancelToken CancelToken::with_timeout(clock::duration timeout) {
  return with_deadline(clock::now() + timeout);
}

void CancelToken::cancel() const {
  {
    std::lock_guard<std::mutex> lk(st_->mu);
    st_->cancelled = true;
  }
  st_->cv.notify_all();
}

bool CancelToken::fired() const {
  std::lock_guard<std::mutex> lk(st_->mu);
  return st_->cancelled || st_->expired_locked();
}

std::error_code CancelToken::error() const {
  std::lock_guard<std::mutex> lk(st_->mu);
  if (st_->cancelled) return std::make_error_code(std::errc::operation_canceled);
  if (st_->expired_locked()) return std::make_error_code(std::errc::timed_out);
  return {};
}

bool CancelToken::wait_for(clock::duration d) const {
  std::unique_lock<std::mutex> lk(st_->mu);
  auto until = clock::now() + d;
  if (st_->deadline && *st_->deadline < until) until = *st_->deadline;
  st_->cv.wait_until(lk, until, [&] { return st_->cancelled; });
  return st_->cancelled || st_->expired_locked();
}

}
