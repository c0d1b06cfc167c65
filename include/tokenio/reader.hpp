#pragma once
#include "tokenio/byte_source.hpp"
#include "tokenio/cancel_token.hpp"
#include "tokenio/conduit.hpp"
#include "tokenio/reader_config.hpp"
#include "tokenio/reader_error.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace tio {

struct ScanStats {
  std::uint64_t accepted = 0;
  std::uint64_t skipped = 0;
  std::uint64_t bytes_read = 0;
};

struct ReadResult {
  std::vector<std::string> tokens;   // accepted tokens, also on failure
  std::optional<ReaderError> error;
  ScanStats stats;

  bool ok() const noexcept { return !error; }
};

struct StreamStatus {
  std::optional<ReaderError> error;  // Invalid or Read
  std::error_code cancelled;         // the cancel token's error, or conduit closed
  ScanStats stats;

  bool ok() const noexcept { return !error && !cancelled; }
};

// Splits one logical byte stream into tokens and runs each through the
// normalize/filter pipeline.
//
// A Reader is a value: with_* and from_* return a configured copy and leave
// the original as it was. Copies share the underlying source, so reading
// through one consumes it for all. One Reader must not be used from several
// threads at once.
class Reader {
public:
  Reader();  // standard input, default ReaderConfig
  explicit Reader(ReaderConfig cfg);
  Reader(ReaderConfig cfg, SourcePtr src);

  const ReaderConfig& config() const noexcept { return cfg_; }
  const SourcePtr& source() const noexcept { return src_; }
  std::size_t tracked() const noexcept { return owned_.size(); }

  Reader with_config(ReaderConfig cfg) const;
  Reader with_delimiter(Delimiter d) const;
  Reader with_normalizer(NormalizeFn f) const;
  Reader with_filter(FilterFn f) const;
  Reader with_fail_on_error(bool v) const;
  Reader with_fail_on_invalid(bool v) const;
  Reader with_user_context(std::any ctx) const;

  // Replaces the input with `parts` read in order. Drops resource tracking
  // for the copy.
  Reader with_sources(std::vector<SourcePtr> parts) const;
  // Appends `parts` after the current input.
  Reader add_sources(std::vector<SourcePtr> parts) const;
  Reader from_string(std::string data) const;

  // Opens the files, concatenated in order, and tracks them for close().
  // On failure nothing stays open and `err_out` holds an Open error.
  std::optional<Reader> from_file(const std::string& path,
                                  std::optional<ReaderError>* err_out = nullptr,
                                  CallSite caller = CallSite::current()) const;
  std::optional<Reader> from_files(const std::vector<std::string>& paths,
                                   std::optional<ReaderError>* err_out = nullptr,
                                   CallSite caller = CallSite::current()) const;

  // Collects every accepted token. On failure the tokens accepted so far are
  // returned alongside the error.
  ReadResult read_tokens(CallSite caller = CallSite::current());

  // Delivers accepted tokens one by one through `out`. Returns once the input
  // ends, on Invalid/Read errors, or when `cancel` fires during a hand-off.
  StreamStatus stream_tokens(Conduit<std::string>& out, const CancelToken& cancel,
                             CallSite caller = CallSite::current());

  // Raw pass-through read from the source; failures come back as Read errors.
  std::size_t read(char* dst, std::size_t n, std::optional<ReaderError>& err,
                   CallSite caller = CallSite::current());

  // Closes every tracked resource in the order it was opened. All are
  // attempted; the first failure is returned as a Close error.
  std::optional<ReaderError> close(CallSite caller = CallSite::current());

private:
  using Sink = std::function<std::error_code(std::string)>;

  std::optional<ReaderError> drive(const Sink& sink, std::error_code& sink_err,
                                   ScanStats& stats, const CallSite& caller);

  ReaderConfig cfg_;
  SourcePtr src_;
  std::vector<SourcePtr> owned_;
};

}
