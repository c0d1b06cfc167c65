#include "tokenio/pattern.hpp"
#include <re2/re2.h>
#include <algorithm>

namespace tio {

Pattern Pattern::literal(std::string s) {
  Pattern p;
  p.v_ = std::move(s);
  return p;
}

Pattern Pattern::regex(Regex re) {
  Pattern p;
  p.v_ = std::move(re);
  return p;
}

std::optional<Pattern> Pattern::compile(std::string_view expr, std::string* err_out) {
  if (expr.empty()) {
    if (err_out) *err_out = "empty regexp is not allowed";
    return std::nullopt;
  }
  RE2::Options opts;
  opts.set_log_errors(false);
  auto re = std::make_shared<const RE2>(re2::StringPiece(expr.data(), expr.size()), opts);
  if (!re->ok()) {
    if (err_out) *err_out = "bad regexp '" + std::string(expr) + "': " + re->error();
    return std::nullopt;
  }
  return regex(std::move(re));
}

bool Pattern::enabled() const noexcept {
  if (auto s = std::get_if<std::string>(&v_)) return !s->empty();
  return std::get<Regex>(v_) != nullptr;
}

std::optional<Match> Pattern::find(std::string_view buf) const {
  if (auto s = std::get_if<std::string>(&v_)) {
    if (s->empty()) return std::nullopt;
    auto pos = buf.find(*s);
    if (pos == std::string_view::npos) return std::nullopt;
    return Match{pos, s->size()};
  }

  const Regex& re = std::get<Regex>(v_);
  if (!re) return std::nullopt;

  re2::StringPiece text(buf.data(), buf.size());
  re2::StringPiece m;
  std::size_t from = 0;
  while (from <= buf.size()) {
    if (!re->Match(text, from, buf.size(), RE2::UNANCHORED, &m, 1)) return std::nullopt;
    const std::size_t start = static_cast<std::size_t>(m.data() - buf.data());
    if (!m.empty()) return Match{start, static_cast<std::size_t>(m.size())};
    from = start + 1; // empty boundary would never consume input
  }
  return std::nullopt;
}

bool Pattern::partial_at_tail(std::string_view buf, std::size_t last_start) const {
  auto s = std::get_if<std::string>(&v_);
  if (!s || s->size() < 2 || buf.empty()) return false;

  const std::size_t n = buf.size();
  const std::size_t first = (n >= s->size() - 1) ? n - (s->size() - 1) : 0;
  const std::size_t last  = std::min(last_start, n - 1);
  for (std::size_t p = first; p <= last; ++p) {
    std::string_view tail = buf.substr(p);
    if (std::string_view(*s).substr(0, tail.size()) == tail) return true;
  }
  return false;
}

std::string Pattern::describe() const {
  if (auto s = std::get_if<std::string>(&v_)) return *s;
  const Regex& re = std::get<Regex>(v_);
  return re ? "/" + re->pattern() + "/" : std::string();
}

}
