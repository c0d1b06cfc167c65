#include "tokenio/reader_config.hpp"

namespace tio {

ReaderConfig::ReaderConfig()
  : delim_(), normalize_(normalize::trim_space), filter_(),
    ctx_(std::make_shared<std::any>()) {}

ReaderConfig ReaderConfig::with_delimiter(Delimiter d) const {
  ReaderConfig c = *this; c.delim_ = std::move(d); return c;
}

ReaderConfig ReaderConfig::with_normalizer(NormalizeFn f) const {
  ReaderConfig c = *this; c.normalize_ = std::move(f); return c;
}

ReaderConfig ReaderConfig::with_filter(FilterFn f) const {
  ReaderConfig c = *this; c.filter_ = std::move(f); return c;
}

ReaderConfig ReaderConfig::with_fail_on_error(bool v) const {
  ReaderConfig c = *this; c.fail_on_error_ = v; return c;
}

ReaderConfig ReaderConfig::with_fail_on_invalid(bool v) const {
  ReaderConfig c = *this; c.fail_on_invalid_ = v; return c;
}

ReaderConfig ReaderConfig::with_user_context(std::any ctx) const {
  ReaderConfig c = *this;
  c.ctx_ = std::make_shared<std::any>(std::move(ctx));
  return c;
}

ReaderConfig ReaderConfig::with_chunk_bytes(std::size_t n) const {
  ReaderConfig c = *this; if (n) c.chunk_bytes_ = n; return c;
}

ReaderConfig ReaderConfig::with_max_token_bytes(std::size_t n) const {
  ReaderConfig c = *this; c.max_token_bytes_ = n; return c;
}

}
