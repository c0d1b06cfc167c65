#include "tokenio/split_scanner.hpp"
#include <iostream>
#include <string>
#include <vector>

static int fails = 0;

static void expect(bool ok, const std::string& what) {
  if (ok) std::cout << "[PASS] " << what << "\n";
  else  { std::cerr << "[FAIL] " << what << "\n"; ++fails; }
}

// Whole input at once, at EOF.
static std::vector<std::string> split_all(tio::Delimiter d, const std::string& in) {
  tio::SplitScanner sc(std::move(d));
  std::vector<std::string> out;
  std::string_view buf(in);
  while (true) {
    tio::ScanStep s = sc.step(buf, true);
    using A = tio::ScanStep::Action;
    if (s.action == A::Emit || s.action == A::EmitFinal) out.emplace_back(s.token);
    buf.remove_prefix(s.advance);
    if (s.action != A::Emit) break;
  }
  return out;
}

// Bytes arrive one at a time; EOF only after the last one.
static std::vector<std::string> split_trickle(tio::Delimiter d, const std::string& in) {
  tio::SplitScanner sc(std::move(d));
  std::vector<std::string> out;
  std::string buf;
  std::size_t fed = 0;
  while (true) {
    const bool eof = fed == in.size();
    tio::ScanStep s = sc.step(buf, eof);
    using A = tio::ScanStep::Action;
    if (s.action == A::NeedMore) {
      if (eof) break;  // never expected at EOF
      buf.push_back(in[fed++]);
      continue;
    }
    if (s.action == A::Emit || s.action == A::EmitFinal) out.emplace_back(s.token);
    buf.erase(0, s.advance);
    if (s.action != A::Emit) break;
  }
  return out;
}

using V = std::vector<std::string>;

int main() {
  tio::Delimiter nl;
  tio::Delimiter stop_end = nl.with_stop_str("end");

  expect(split_all(nl, "a\nb\nc") == V{"a", "b", "c"}, "plain split with remainder");
  expect(split_all(nl, "a\nb\n") == V{"a", "b"}, "empty trailing remainder not emitted");
  expect(split_all(nl, "a\n\nb") == V{"a", "", "b"}, "interior empty token emitted");
  expect(split_all(nl, "").empty(), "empty input");
  expect(split_all(nl, "x") == V{"x"}, "non-empty remainder is a final token");

  expect(split_all(stop_end, "hello\nworld\nend") == V{"hello", "world"}, "stop precedence");
  expect(split_all(stop_end, "end").empty(), "stop at zero emits nothing");
  expect(split_all(stop_end, "a\nbend\nc") == V{"a", "b"}, "stop inside a token ends it");
  expect(split_all(nl.with_stop_str("\n"), "a\nb") == V{"a"}, "tie goes to stop");

  {
    tio::SplitScanner sc(stop_end);
    auto s = sc.step("end", true);
    expect(s.action == tio::ScanStep::Action::Stop && s.advance == 3, "stop at zero consumes the stop");
    expect(sc.terminated(), "terminated after stop");
    auto again = sc.step("more\n", false);
    expect(again.action == tio::ScanStep::Action::Stop && again.advance == 0, "terminated scanner is idempotent");
  }
  {
    tio::SplitScanner sc(nl);
    auto s = sc.step("", true);
    expect(s.action == tio::ScanStep::Action::Stop, "consumed buffer at EOF stops");
    auto again = sc.step("", true);
    expect(again.action == tio::ScanStep::Action::Stop && again.token.empty(), "second call yields nothing");
  }
  {
    tio::SplitScanner sc(nl);
    auto s = sc.step("abc", false);
    expect(s.action == tio::ScanStep::Action::NeedMore, "no boundary before EOF asks for more");
  }

  std::string err;
  tio::Delimiter ws = nl.with_token_regex("\\s+", &err);
  expect(split_all(ws, "one  two   three") == V{"one", "two", "three"}, "regex boundary");
  expect(split_trickle(ws, "one  two   three") == V{"one", "two", "three"}, "regex boundary one byte at a time");

  tio::Delimiter crlf = nl.with_token_str("\r\n");
  expect(split_trickle(crlf, "a\r\nb\r\nc") == V{"a", "b", "c"}, "multi-byte literal straddle");

  tio::Delimiter long_stop = nl.with_stop_str("--end--");
  expect(split_trickle(long_stop, "a\nb--end--\nc") == V{"a", "b"}, "stop straddling chunk ends");
  expect(split_trickle(long_stop, "a\nb--en\nc") == V{"a", "b--en", "c"}, "partial stop prefix is data");

  tio::Delimiter stop_over_tok = nl.with_token_str("ab").with_stop_str("xa");
  expect(split_trickle(stop_over_tok, "1xab2") == V{"1"}, "stop starting before the token wins");

  // "bc" at the tail could still become "bcd", which starts before "c".
  tio::Delimiter overlap = nl.with_token_str("c").with_stop_str("bcd");
  expect(split_trickle(overlap, "abcd") == V{"a"}, "token waits for an overlapping stop");
  expect(split_trickle(overlap, "abce") == V{"ab", "e"}, "overlapping stop prefix that never completes");

  // "x\ny" spans the first newline; it must win even when bytes trickle in.
  err.clear();
  tio::Delimiter re_stop = nl.with_stop_regex("x\ny", &err);
  expect(err.empty() && split_all(re_stop, "ax\ny\nz") == V{"a"}, "regex stop across a token boundary");
  expect(split_trickle(re_stop, "ax\ny\nz") == V{"a"}, "regex stop across a token boundary one byte at a time");
  expect(split_trickle(re_stop, "a\nb\nc") == V{"a", "b", "c"}, "regex stop that never matches");

  return fails ? 1 : 0;
}
