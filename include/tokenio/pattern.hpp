#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace re2 { class RE2; }

namespace tio {

struct Match {
  std::size_t start = 0;
  std::size_t width = 0;
  std::size_t end() const noexcept { return start + width; }
};

// One boundary recognizer: a literal string or a compiled RE2 expression.
// A default-constructed Pattern is disabled.
class Pattern {
public:
  using Regex = std::shared_ptr<const re2::RE2>;

  Pattern() = default;

  static Pattern literal(std::string s);
  static Pattern regex(Regex re);

  // Compiles `expr` with RE2. Empty or invalid expressions yield nullopt
  // and a message in `err_out`.
  static std::optional<Pattern> compile(std::string_view expr, std::string* err_out = nullptr);

  bool enabled() const noexcept;
  bool is_literal() const noexcept { return std::holds_alternative<std::string>(v_); }
  bool is_regex() const noexcept   { return std::holds_alternative<Regex>(v_); }

  // Leftmost match. Zero-width regex matches are skipped.
  std::optional<Match> find(std::string_view buf) const;

  // True when a literal could still complete at some start <= last_start
  // once more bytes arrive (the buffer ends inside it). Always false for regex.
  bool partial_at_tail(std::string_view buf, std::size_t last_start) const;

  // Literal text or regex source, for diagnostics.
  std::string describe() const;

private:
  std::variant<std::string, Regex> v_;
};

}
