#include "tokenio/chunk_scanner.hpp"
#include "tokenio/split_scanner.hpp"
#include <vector>

namespace tio {

struct ChunkScanner::Impl {
  ByteSource& src;
  SplitScanner split;
  Config cfg;
  std::vector<char> chunk;
  std::string carry;        // unread bytes start at `head`
  std::size_t head{0};
  bool at_eof{false};
  std::error_code err;
  std::uint64_t bytes{0};

  Impl(ByteSource& s, Delimiter d, Config c)
    : src(s), split(std::move(d)), cfg(c), chunk(c.chunk_bytes ? c.chunk_bytes : 1) {}

  void compact() {
    if (head == 0) return;
    carry.erase(0, head);
    head = 0;
  }

  // A failure either aborts the scan or, when tolerated, ends the input.
  bool fail(std::error_code ec) {
    if (cfg.fail_on_error) { err = ec; return false; }
    at_eof = true;
    return true;
  }

  bool fill() {
    compact();
    if (cfg.max_token_bytes && carry.size() > cfg.max_token_bytes)
      return fail(std::make_error_code(std::errc::value_too_large));

    std::error_code ec;
    std::size_t n = src.read(chunk.data(), chunk.size(), ec);
    if (n > 0) {
      carry.append(chunk.data(), n);
      bytes += n;
    }
    if (ec) return fail(ec);
    if (n == 0) at_eof = true;
    return true;
  }

  Pull next(std::string& out) {
    using A = ScanStep::Action;
    if (err) return Pull::Failed;

    while (true) {
      std::string_view view(carry.data() + head, carry.size() - head);
      ScanStep s = split.step(view, at_eof);
      switch (s.action) {
        case A::Emit:
        case A::EmitFinal:
          out.assign(s.token.data(), s.token.size());
          head += s.advance;
          return Pull::Token;
        case A::Stop:
          head += s.advance;
          return Pull::Finished;
        case A::NeedMore:
          break;
      }
      if (!fill()) return Pull::Failed;
    }
  }
};

ChunkScanner::ChunkScanner(ByteSource& src, Delimiter delim)
  : ChunkScanner(src, std::move(delim), Config{}) {}

ChunkScanner::ChunkScanner(ByteSource& src, Delimiter delim, Config cfg)
  : p_(new Impl(src, std::move(delim), cfg)) {}

ChunkScanner::~ChunkScanner() { delete p_; }

ChunkScanner::Pull ChunkScanner::next(std::string& out) { return p_->next(out); }
const std::error_code& ChunkScanner::error() const noexcept { return p_->err; }
std::uint64_t ChunkScanner::bytes_read() const noexcept { return p_->bytes; }

}
