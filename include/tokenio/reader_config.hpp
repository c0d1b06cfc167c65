#pragma once
#include "tokenio/delimiter.hpp"
#include "tokenio/hooks.hpp"
#include <any>
#include <cstddef>
#include <memory>

namespace tio {

// Everything one scan needs. Immutable value; with_* returns a changed copy.
// Copies share the user context object, so hooks mutating it are visible
// through every copy.
class ReaderConfig {
public:
  ReaderConfig();

  const Delimiter& delimiter() const noexcept { return delim_; }
  const NormalizeFn& normalizer() const noexcept { return normalize_; }
  const FilterFn& filter() const noexcept { return filter_; }
  bool fail_on_error() const noexcept { return fail_on_error_; }
  bool fail_on_invalid() const noexcept { return fail_on_invalid_; }
  std::size_t chunk_bytes() const noexcept { return chunk_bytes_; }
  std::size_t max_token_bytes() const noexcept { return max_token_bytes_; }
  std::any& user_context() const noexcept { return *ctx_; }

  ReaderConfig with_delimiter(Delimiter d) const;
  ReaderConfig with_normalizer(NormalizeFn f) const;  // empty function disables
  ReaderConfig with_filter(FilterFn f) const;         // empty function disables
  ReaderConfig with_fail_on_error(bool v) const;
  ReaderConfig with_fail_on_invalid(bool v) const;
  ReaderConfig with_user_context(std::any ctx) const;
  ReaderConfig with_chunk_bytes(std::size_t n) const;     // 0 keeps the current value
  ReaderConfig with_max_token_bytes(std::size_t n) const; // 0 means unlimited

private:
  Delimiter delim_;
  NormalizeFn normalize_;
  FilterFn filter_;
  bool fail_on_error_ = true;
  bool fail_on_invalid_ = false;
  std::size_t chunk_bytes_ = 64 * 1024;
  std::size_t max_token_bytes_ = 8 * 1024 * 1024;
  std::shared_ptr<std::any> ctx_;
};

}
