#include "tokenio/hooks.hpp"
#include <cctype>

namespace tio {
namespace normalize {

static bool is_space(unsigned char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

std::string trim_space(std::string_view s, std::any&) {
  std::size_t b = 0, e = s.size();
  while (b < e && is_space(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && is_space(static_cast<unsigned char>(s[e - 1]))) --e;
  return std::string(s.substr(b, e - b));
}

std::string to_upper(std::string_view s, std::any&) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return out;
}

std::string to_lower(std::string_view s, std::any&) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

NormalizeFn chain(std::vector<NormalizeFn> steps) {
  return [steps = std::move(steps)](std::string_view s, std::any& ctx) {
    std::string cur(s);
    for (const auto& f : steps) {
      if (f) cur = f(cur, ctx);
    }
    return cur;
  };
}

}
}
