#include "tokenio/conduit.hpp"
#include "tokenio/cancel_token.hpp"
#include <atomic>
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

int main() {
  {
    tio::Conduit<int> c(2);
    tio::CancelToken never;
    expect(!c.send(1, never) && !c.send(2, never), "buffered sends do not block");
    expect(c.try_receive() == 1 && c.try_receive() == 2, "fifo order");
    expect(!c.try_receive(), "empty after drain");
  }

  {
    tio::Conduit<int> c(0);
    tio::CancelToken never;
    std::atomic<bool> taken{false};
    std::thread consumer([&] {
      std::this_thread::sleep_for(20ms);
      auto v = c.receive();
      taken = v && *v == 7;
    });
    auto ec = c.send(7, never);
    expect(!ec && taken.load(), "rendezvous send returns after the receive");
    consumer.join();
  }

  {
    tio::Conduit<int> c(0);
    tio::CancelToken tok;
    std::thread canceller([&] { std::this_thread::sleep_for(20ms); tok.cancel(); });
    auto ec = c.send(1, tok);
    canceller.join();
    expect(ec == std::errc::operation_canceled, "cancel wins an untaken rendezvous");
    expect(!c.try_receive(), "withdrawn value is not delivered later");
  }

  {
    tio::Conduit<int> c(1);
    auto tok = tio::CancelToken::with_timeout(30ms);
    tio::CancelToken never;
    expect(!c.send(1, never), "first buffered send fits");
    auto ec = c.send(2, tok);
    expect(ec == std::errc::timed_out, "deadline ends a blocked send");
    expect(tok.error() == std::errc::timed_out && tok.fired(), "token reports timeout");
  }

  {
    tio::Conduit<int> c(0);
    tio::CancelToken tok;
    tok.cancel();
    expect(c.send(1, tok) == std::errc::operation_canceled, "pre-cancelled send never pushes");
  }

  {
    tio::Conduit<std::string> c(0);
    tio::CancelToken never;
    std::thread closer([&] { std::this_thread::sleep_for(20ms); c.close(); });
    auto ec = c.send("x", never);
    closer.join();
    expect(ec == std::errc::broken_pipe, "closing the conduit breaks a pending send");
    expect(c.closed() && !c.receive(), "closed and drained receive ends");
  }

  {
    tio::Conduit<int> c(4);
    tio::CancelToken never;
    std::vector<int> got;
    std::thread consumer([&] { while (auto v = c.receive()) got.push_back(*v); });
    for (int i = 0; i < 100; ++i) c.send(i, never);
    c.close();
    consumer.join();
    bool ordered = got.size() == 100;
    for (int i = 0; ordered && i < 100; ++i) ordered = got[i] == i;
    expect(ordered, "pending values are received after close");
  }

  {
    tio::CancelToken tok;
    tio::CancelToken copy = tok;
    expect(!copy.wait_for(5ms), "wait_for times out quietly");
    tok.cancel();
    expect(copy.fired() && copy.wait_for(1s), "copies share state");
  }

  return fails ? 1 : 0;
}
