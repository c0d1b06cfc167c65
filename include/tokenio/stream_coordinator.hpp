#pragma once
#include "tokenio/cancel_token.hpp"
#include "tokenio/conduit.hpp"
#include <cstdint>
#include <string>
#include <system_error>

namespace tio {

// Hands accepted tokens to the caller's conduit, racing each hand-off
// against the caller's cancel token. Never closes the conduit.
class StreamCoordinator {
public:
  StreamCoordinator(Conduit<std::string>& out, CancelToken cancel)
    : out_(out), cancel_(std::move(cancel)) {}

  // Empty on delivery; otherwise the error that ended the stream.
  std::error_code deliver(std::string token);

  std::uint64_t delivered() const noexcept { return delivered_; }

private:
  Conduit<std::string>& out_;
  CancelToken cancel_;
  std::uint64_t delivered_{0};
};

}
