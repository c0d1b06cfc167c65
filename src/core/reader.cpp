#include "tokenio/reader.hpp"
#include "tokenio/chunk_scanner.hpp"
#include "tokenio/stream_coordinator.hpp"
#include "tokenio/token_pipeline.hpp"
#include <cstdio>

namespace tio {

Reader::Reader() : Reader(ReaderConfig{}) {}

Reader::Reader(ReaderConfig cfg) : Reader(std::move(cfg), FileSource::borrow(stdin)) {}

Reader::Reader(ReaderConfig cfg, SourcePtr src) : cfg_(std::move(cfg)), src_(std::move(src)) {}

Reader Reader::with_config(ReaderConfig cfg) const {
  Reader r = *this; r.cfg_ = std::move(cfg); return r;
}

Reader Reader::with_delimiter(Delimiter d) const { return with_config(cfg_.with_delimiter(std::move(d))); }
Reader Reader::with_normalizer(NormalizeFn f) const { return with_config(cfg_.with_normalizer(std::move(f))); }
Reader Reader::with_filter(FilterFn f) const { return with_config(cfg_.with_filter(std::move(f))); }
Reader Reader::with_fail_on_error(bool v) const { return with_config(cfg_.with_fail_on_error(v)); }
Reader Reader::with_fail_on_invalid(bool v) const { return with_config(cfg_.with_fail_on_invalid(v)); }
Reader Reader::with_user_context(std::any ctx) const { return with_config(cfg_.with_user_context(std::move(ctx))); }

Reader Reader::with_sources(std::vector<SourcePtr> parts) const {
  Reader r = *this;
  r.src_ = concat_sources(std::move(parts));
  r.owned_.clear();
  return r;
}

Reader Reader::add_sources(std::vector<SourcePtr> parts) const {
  Reader r = *this;
  parts.insert(parts.begin(), src_);
  r.src_ = concat_sources(std::move(parts));
  return r;
}

Reader Reader::from_string(std::string data) const {
  return with_sources({make_string_source(std::move(data))});
}

std::optional<Reader> Reader::from_file(const std::string& path, std::optional<ReaderError>* err_out,
                                        CallSite caller) const {
  return from_files({path}, err_out, caller);
}

std::optional<Reader> Reader::from_files(const std::vector<std::string>& paths,
                                         std::optional<ReaderError>* err_out, CallSite caller) const {
  std::vector<SourcePtr> files;
  files.reserve(paths.size());
  for (const auto& p : paths) {
    std::error_code ec;
    auto f = FileSource::open(p, ec);
    if (!f) {
      if (err_out) *err_out = ReaderError::open(ec, p, caller);
      return std::nullopt; // already opened files close with their last owner
    }
    files.push_back(std::move(f));
  }

  Reader r = with_sources(files);
  r.owned_ = std::move(files);
  return r;
}

std::optional<ReaderError> Reader::drive(const Sink& sink, std::error_code& sink_err,
                                         ScanStats& stats, const CallSite& caller) {
  ChunkScanner::Config scfg;
  scfg.chunk_bytes = cfg_.chunk_bytes();
  scfg.max_token_bytes = cfg_.max_token_bytes();
  scfg.fail_on_error = cfg_.fail_on_error();

  ChunkScanner scanner(*src_, cfg_.delimiter(), scfg);
  TokenPipeline pipe(cfg_);
  std::optional<ReaderError> err;

  std::string raw;
  bool done = false;
  while (!done) {
    switch (scanner.next(raw)) {
      case ChunkScanner::Pull::Finished:
        done = true;
        break;
      case ChunkScanner::Pull::Failed:
        err = ReaderError::read(scanner.error(), caller);
        done = true;
        break;
      case ChunkScanner::Pull::Token: {
        Processed p = pipe.process(std::move(raw), caller);
        if (p.outcome == Processed::Outcome::Rejected) {
          err = std::move(p.error);
          done = true;
        } else if (p.outcome == Processed::Outcome::Accepted) {
          sink_err = sink(std::move(p.text));
          if (sink_err) done = true;
        }
        raw.clear();
        break;
      }
    }
  }

  stats.accepted = pipe.accepted();
  stats.skipped = pipe.skipped();
  stats.bytes_read = scanner.bytes_read();
  return err;
}

ReadResult Reader::read_tokens(CallSite caller) {
  ReadResult res;
  std::error_code unused;
  res.error = drive([&](std::string tok) {
                      res.tokens.push_back(std::move(tok));
                      return std::error_code{};
                    },
                    unused, res.stats, caller);
  return res;
}

StreamStatus Reader::stream_tokens(Conduit<std::string>& out, const CancelToken& cancel,
                                   CallSite caller) {
  StreamStatus st;
  StreamCoordinator coord(out, cancel);
  st.error = drive([&](std::string tok) { return coord.deliver(std::move(tok)); },
                   st.cancelled, st.stats, caller);
  return st;
}

std::size_t Reader::read(char* dst, std::size_t n, std::optional<ReaderError>& err,
                         CallSite caller) {
  err.reset();
  std::error_code ec;
  std::size_t got = src_->read(dst, n, ec);
  if (ec) err = ReaderError::read(ec, caller);
  return got;
}

std::optional<ReaderError> Reader::close(CallSite caller) {
  std::optional<ReaderError> first;
  for (auto& s : owned_) {
    std::error_code ec = s->close();
    if (ec && !first) first = ReaderError::close(ec, caller);
  }
  owned_.clear();
  return first;
}

}
