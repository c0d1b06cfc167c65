#include "tokenio/hooks.hpp"
#include <re2/re2.h>
#include <system_error>
#include <fast_float/fast_float.h>

namespace tio {
namespace filter {

bool non_empty(std::string_view s, std::any& ctx) {
  return !normalize::trim_space(s, ctx).empty();
}

// Full-token check only; the value itself is thrown away.
bool numeric(std::string_view s, std::any&) {
  if (s.empty()) return false;
  double out;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

FilterFn min_length(std::size_t n) {
  return [n](std::string_view s, std::any&) { return s.size() >= n; };
}

FilterFn max_length(std::size_t n) {
  return [n](std::string_view s, std::any&) { return s.size() <= n; };
}

FilterFn matches(std::shared_ptr<const re2::RE2> re) {
  return [re = std::move(re)](std::string_view s, std::any&) {
    return re && RE2::PartialMatch(re2::StringPiece(s.data(), s.size()), *re);
  };
}

FilterFn all_of(FilterFn a, FilterFn b) {
  return [a = std::move(a), b = std::move(b)](std::string_view s, std::any& ctx) {
    return a(s, ctx) && b(s, ctx);
  };
}

FilterFn any_of(FilterFn a, FilterFn b) {
  return [a = std::move(a), b = std::move(b)](std::string_view s, std::any& ctx) {
    return a(s, ctx) || b(s, ctx);
  };
}

FilterFn negate(FilterFn f) {
  return [f = std::move(f)](std::string_view s, std::any& ctx) { return !f(s, ctx); };
}

}
}
