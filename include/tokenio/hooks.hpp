#pragma once
#include <any>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace re2 { class RE2; }

namespace tio {

// Per-token hooks. `ctx` is the reader's user context, handed over as is.
using NormalizeFn = std::function<std::string(std::string_view, std::any& ctx)>;
using FilterFn    = std::function<bool(std::string_view, std::any& ctx)>;

// Adapters for hooks written against a concrete context type. The reader's
// std::any must hold a Ctx or a Ctx*; anything else throws std::bad_any_cast.
template <class Ctx>
Ctx& context_as(std::any& ctx) {
  if (auto p = std::any_cast<Ctx*>(&ctx)) return **p;
  return std::any_cast<Ctx&>(ctx);
}

template <class Ctx>
NormalizeFn normalize_with(std::function<std::string(std::string_view, Ctx&)> fn) {
  return [fn = std::move(fn)](std::string_view s, std::any& ctx) { return fn(s, context_as<Ctx>(ctx)); };
}

template <class Ctx>
FilterFn filter_with(std::function<bool(std::string_view, Ctx&)> fn) {
  return [fn = std::move(fn)](std::string_view s, std::any& ctx) { return fn(s, context_as<Ctx>(ctx)); };
}

namespace normalize {

// Strips leading/trailing ASCII whitespace. Default normalizer.
std::string trim_space(std::string_view s, std::any& ctx);
std::string to_upper(std::string_view s, std::any& ctx);
std::string to_lower(std::string_view s, std::any& ctx);

// Applies `steps` left to right.
NormalizeFn chain(std::vector<NormalizeFn> steps);

}

namespace filter {

// Rejects empty or whitespace-only tokens.
bool non_empty(std::string_view s, std::any& ctx);

// Accepts tokens that are a complete decimal floating point number.
bool numeric(std::string_view s, std::any& ctx);

FilterFn min_length(std::size_t n);
FilterFn max_length(std::size_t n);

// Unanchored search, like a partial match.
FilterFn matches(std::shared_ptr<const re2::RE2> re);

FilterFn all_of(FilterFn a, FilterFn b);
FilterFn any_of(FilterFn a, FilterFn b);
FilterFn negate(FilterFn f);

}

}
