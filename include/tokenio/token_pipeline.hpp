#pragma once
#include "tokenio/reader_config.hpp"
#include "tokenio/reader_error.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace tio {

struct Processed {
  enum class Outcome { Accepted, Skipped, Rejected };

  Outcome outcome = Outcome::Accepted;
  std::string text;                  // normalized token
  std::optional<ReaderError> error;  // set when Rejected
};

// Normalize, then filter, one raw token at a time. Keeps the running offset
// (bytes of accepted and skipped tokens) reported with Invalid errors.
class TokenPipeline {
public:
  explicit TokenPipeline(const ReaderConfig& cfg) : cfg_(cfg) {}

  Processed process(std::string raw, const CallSite& caller);

  std::int64_t offset() const noexcept { return offset_; }
  std::uint64_t accepted() const noexcept { return accepted_; }
  std::uint64_t skipped() const noexcept { return skipped_; }

private:
  const ReaderConfig& cfg_;
  std::int64_t offset_{0};
  std::uint64_t accepted_{0};
  std::uint64_t skipped_{0};
};

}
