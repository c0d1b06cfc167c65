#pragma once
#include "tokenio/delimiter.hpp"
#include <cstddef>
#include <string_view>

namespace tio {

struct ScanStep {
  enum class Action {
    Emit,      // token ready, keep scanning
    EmitFinal, // token ready, scan is over
    Stop,      // scan is over, nothing to emit
    NeedMore,  // feed more bytes and call again
  };

  Action action = Action::NeedMore;
  std::size_t advance = 0;  // bytes of the buffer consumed by this step
  std::string_view token;   // view into the caller's buffer (Emit/EmitFinal)
};

// Boundary state machine over a growing buffer. The host owns the buffer,
// drops `advance` bytes after each step and calls again; once a step ends the
// scan every later call returns Stop.
class SplitScanner {
public:
  explicit SplitScanner(Delimiter d) : delim_(std::move(d)) {}

  ScanStep step(std::string_view buf, bool at_eof);

  bool terminated() const noexcept { return terminated_; }
  const Delimiter& delimiter() const noexcept { return delim_; }

private:
  Delimiter delim_;
  bool terminated_ = false;
};

}
