#include "tokenio/split_scanner.hpp"
#include <optional>

namespace tio {

namespace {

ScanStep need_more() { return ScanStep{}; }

// Bytes a regex stop may span past a token start before the token is
// committed without seeing the rest of the input.
constexpr std::size_t kRegexStopLookahead = 256;

// A regex match touching the end of an unfinished buffer may still grow.
bool may_extend(const Pattern& p, const Match& m, std::string_view buf, bool at_eof) {
  return !at_eof && p.is_regex() && m.end() == buf.size();
}

}

ScanStep SplitScanner::step(std::string_view buf, bool at_eof) {
  using A = ScanStep::Action;
  if (terminated_) return ScanStep{A::Stop, 0, {}};

  if (buf.empty() && at_eof) {
    terminated_ = true;
    return ScanStep{A::Stop, 0, {}};
  }

  const Pattern& tok_p  = delim_.token();
  const Pattern& stop_p = delim_.stop();

  std::optional<Match> tok = tok_p.find(buf);
  std::optional<Match> stop;
  if (stop_p.enabled()) stop = stop_p.find(buf);

  // Stop wins ties: termination beats continuation.
  if (stop && (!tok || stop->start <= tok->start)) {
    if (may_extend(stop_p, *stop, buf, at_eof)) return need_more();
    if (!at_eof && stop->start > 0 && tok_p.partial_at_tail(buf, stop->start - 1)) return need_more();

    terminated_ = true;
    if (stop->start > 0) return ScanStep{A::EmitFinal, stop->start, buf.substr(0, stop->start)};
    return ScanStep{A::Stop, stop->width, {}};
  }

  if (tok) {
    if (may_extend(tok_p, *tok, buf, at_eof)) return need_more();
    if (!at_eof && stop_p.enabled() && stop_p.partial_at_tail(buf, tok->start)) return need_more();
    if (!at_eof && stop_p.is_regex() && stop_p.enabled() &&
        buf.size() - tok->start < kRegexStopLookahead) return need_more();
    return ScanStep{A::Emit, tok->end(), buf.substr(0, tok->start)};
  }

  if (!at_eof) return need_more();

  // Remainder with no boundary left; non-empty here by the first check.
  terminated_ = true;
  return ScanStep{A::EmitFinal, buf.size(), buf};
}

}
