#pragma once
#include <chrono>
#include <memory>
#include <system_error>

namespace tio {

// Shared cancellation flag with an optional deadline. Copies observe the
// same state, so one side can cancel() while another polls fired().
class CancelToken {
public:
  using clock = std::chrono::steady_clock;

  CancelToken();

  static CancelToken with_deadline(clock::time_point deadline);
  static CancelToken with_timeout(clock::duration timeout);

  void cancel() const;

  // True once cancel() was called or the deadline passed.
  bool fired() const;

  // operation_canceled, timed_out, or empty while not fired.
  std::error_code error() const;

  // Blocks up to `d`; returns fired().
  bool wait_for(clock::duration d) const;

private:
  struct State;
  std::shared_ptr<State> st_;
};

}
