#include "tokenio/stream_coordinator.hpp"

namespace tio {

std::error_code StreamCoordinator::deliver(std::string token) {
  std::error_code ec = out_.send(std::move(token), cancel_);
  if (!ec) ++delivered_;
  return ec;
}

}
