#include "tokenio/reader.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

static int fails = 0;

static void expect(bool ok, const std::string& what) {
  if (ok) std::cout << "[PASS] " << what << "\n";
  else  { std::cerr << "[FAIL] " << what << "\n"; ++fails; }
}

using namespace std::chrono_literals;
using V = std::vector<std::string>;

int main() {
  const tio::Reader base;

  {
    tio::Conduit<std::string> out(0);
    tio::CancelToken never;
    V got;
    std::thread consumer([&] { while (auto t = out.receive()) got.push_back(*t); });
    auto st = base.from_string("a\nb\nc\n").stream_tokens(out, never);
    out.close();
    consumer.join();
    expect(st.ok() && got == V{"a", "b", "c"}, "stream delivers every token in order");
    expect(st.stats.accepted == 3, "stream stats");
  }

  // Consumer takes two tokens, then cancels and stops receiving.
  {
    tio::Conduit<std::string> out(0);
    tio::CancelToken tok;
    V got;
    std::thread consumer([&] {
      for (int i = 0; i < 2; ++i) {
        if (auto t = out.receive()) got.push_back(*t);
      }
      tok.cancel();
    });
    tio::Reader r = base.from_string("t1\nt2\nt3\nt4\nt5\n");
    auto st = r.stream_tokens(out, tok);
    consumer.join();
    expect(st.cancelled == std::errc::operation_canceled && !st.error, "stream returns the cancellation");
    expect(got == V{"t1", "t2"}, "tokens before cancellation were observed");
    expect(!out.try_receive(), "nothing delivered after cancellation");
    expect(st.stats.accepted == 3, "third token accepted but withdrawn");
  }

  {
    tio::Conduit<std::string> out(0);
    auto tok = tio::CancelToken::with_timeout(30ms);
    auto st = base.from_string("x\ny\n").stream_tokens(out, tok);
    expect(st.cancelled == std::errc::timed_out, "deadline without a consumer");
  }

  {
    tio::Conduit<std::string> out(8);
    tio::CancelToken never;
    auto st = base.from_string("hello\nhi\nworld")
                  .with_filter(tio::filter::min_length(3))
                  .with_fail_on_invalid(true)
                  .stream_tokens(out, never);
    expect(st.error && st.error->is(tio::ErrorKind::Invalid) && !st.cancelled, "stream reports invalid tokens");
    expect(out.try_receive() == std::optional<std::string>("hello") && !out.try_receive(),
           "stream stops at the invalid token");
  }

  {
    tio::Conduit<std::string> out(0);
    out.close();
    tio::CancelToken never;
    auto st = base.from_string("a\n").stream_tokens(out, never);
    expect(st.cancelled == std::errc::broken_pipe, "closed conduit ends the stream");
  }

  return fails ? 1 : 0;
}
