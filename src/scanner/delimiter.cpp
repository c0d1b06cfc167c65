#include "tokenio/delimiter.hpp"

namespace tio {

Delimiter::Delimiter() : token_(Pattern::literal("\n")), stop_() {}

Delimiter Delimiter::with_token(Pattern p) const {
  Delimiter d = *this;
  d.token_ = p.enabled() ? std::move(p) : Pattern::literal("\n");
  return d;
}

Delimiter Delimiter::with_token_str(std::string s) const {
  return with_token(Pattern::literal(std::move(s)));
}

Delimiter Delimiter::with_token_regex(std::string_view expr, std::string* err_out) const {
  auto p = Pattern::compile(expr, err_out);
  if (!p) return *this;
  return with_token(std::move(*p));
}

Delimiter Delimiter::with_stop(Pattern p) const {
  Delimiter d = *this;
  d.stop_ = std::move(p);
  return d;
}

Delimiter Delimiter::with_stop_str(std::string s) const {
  return with_stop(Pattern::literal(std::move(s)));
}

Delimiter Delimiter::with_stop_regex(std::string_view expr, std::string* err_out) const {
  auto p = Pattern::compile(expr, err_out);
  if (!p) return *this;
  return with_stop(std::move(*p));
}

Delimiter Delimiter::without_stop() const {
  return with_stop(Pattern{});
}

}
