#include "tokenio/config_json.hpp"
#include "tokenio/conduit.hpp"
#include "tokenio/cancel_token.hpp"
#include "tokenio/hooks.hpp"
#include "tokenio/reader.hpp"
#include "tokenio/run_summary.hpp"

#include <re2/re2.h>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

enum Exit { kOk = 0, kUsage = 1, kOpen = 2, kScan = 3, kCancelled = 4 };

struct Cli {
  std::string config_path;
  std::string delim, delim_regex;
  std::string stop, stop_regex;
  std::vector<std::string> normalizers;  // applied in order
  std::vector<std::string> filters;      // AND-ed
  bool fail_on_invalid = false;
  bool no_fail_on_error = false;
  bool stream = false;
  std::size_t buffer = 0;                // conduit capacity in --stream mode
  long timeout_ms = 0;                   // 0 = no deadline
  std::string report_path;
  std::vector<std::string> inputs;       // empty or "-" = stdin
  bool bad = false;
};

void usage(std::ostream& os) {
  os <<
    "Usage: tokenio [--config=FILE] [--delim=STR|--delim-regex=RE]\n"
    "               [--stop=STR|--stop-regex=RE] [--normalize=trim|upper|lower|none]...\n"
    "               [--filter=non-empty|numeric|min-len=N|max-len=N|regex=RE]...\n"
    "               [--fail-on-invalid] [--no-fail-on-error]\n"
    "               [--stream] [--buffer=N] [--timeout-ms=N]\n"
    "               [--report=PATH] [FILE...]\n";
}

// "\n", "\t", "\r", "\0" and "\\" in delimiter flags.
std::string unescape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] != '\\' || i + 1 == s.size()) { out.push_back(s[i]); continue; }
    switch (s[++i]) {
      case 'n':  out.push_back('\n'); break;
      case 't':  out.push_back('\t'); break;
      case 'r':  out.push_back('\r'); break;
      case '0':  out.push_back('\0'); break;
      case '\\': out.push_back('\\'); break;
      default:   out.push_back('\\'); out.push_back(s[i]); break;
    }
  }
  return out;
}

Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_n = [&](const char* pfx, long* out){
      if (a.rfind(pfx, 0) != 0) return false;
      try { *out = std::stol(a.substr(std::string(pfx).size())); }
      catch (const std::exception&) { std::cerr << "[tokenio] bad number in " << a << "\n"; c.bad = true; }
      return true;
    };
    std::string v;
    long n = 0;
    if (eat("--config=", &c.config_path)) continue;
    if (eat("--delim=", &v))        { c.delim = unescape(v); continue; }
    if (eat("--delim-regex=", &c.delim_regex)) continue;
    if (eat("--stop=", &v))         { c.stop = unescape(v); continue; }
    if (eat("--stop-regex=", &c.stop_regex)) continue;
    if (eat("--normalize=", &v))    { c.normalizers.push_back(v); continue; }
    if (eat("--filter=", &v))       { c.filters.push_back(v); continue; }
    if (eat("--report=", &c.report_path)) continue;
    if (eat_n("--buffer=", &n))     { c.buffer = n > 0 ? static_cast<std::size_t>(n) : 0; continue; }
    if (eat_n("--timeout-ms=", &c.timeout_ms)) continue;
    if (a == "--fail-on-invalid")   { c.fail_on_invalid = true; continue; }
    if (a == "--no-fail-on-error")  { c.no_fail_on_error = true; continue; }
    if (a == "--stream")            { c.stream = true; continue; }
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(kOk); }
    if (a.rfind("--", 0) == 0) {
      std::cerr << "[tokenio] unknown option " << a << "\n";
      c.bad = true;
      continue;
    }
    c.inputs.push_back(a);
  }
  return c;
}

std::optional<tio::FilterFn> filter_from_flag(const std::string& f) {
  if (f == "non-empty") return tio::FilterFn(tio::filter::non_empty);
  if (f == "numeric")   return tio::FilterFn(tio::filter::numeric);
  try {
    if (f.rfind("min-len=", 0) == 0) return tio::filter::min_length(std::stoul(f.substr(8)));
    if (f.rfind("max-len=", 0) == 0) return tio::filter::max_length(std::stoul(f.substr(8)));
  } catch (const std::exception&) {
    return std::nullopt;
  }
  if (f.rfind("regex=", 0) == 0) {
    RE2::Options opts;
    opts.set_log_errors(false);
    auto re = std::make_shared<const RE2>(f.substr(6), opts);
    if (!re->ok()) return std::nullopt;
    return tio::filter::matches(std::move(re));
  }
  return std::nullopt;
}

// Flags win over --config.
bool build_config(const Cli& cli, tio::ReaderConfig& cfg) {
  if (!cli.config_path.empty()) {
    std::string err;
    auto loaded = tio::load_reader_config(cli.config_path, &err, cfg);
    if (!loaded) { std::cerr << "[config] " << err << "\n"; return false; }
    cfg = *loaded;
  }

  tio::Delimiter d = cfg.delimiter();
  std::string err;
  if (!cli.delim.empty()) d = d.with_token_str(cli.delim);
  if (!cli.delim_regex.empty()) {
    d = d.with_token_regex(cli.delim_regex, &err);
    if (!err.empty()) { std::cerr << "[config] --delim-regex: " << err << "\n"; return false; }
  }
  if (!cli.stop.empty()) d = d.with_stop_str(cli.stop);
  if (!cli.stop_regex.empty()) {
    d = d.with_stop_regex(cli.stop_regex, &err);
    if (!err.empty()) { std::cerr << "[config] --stop-regex: " << err << "\n"; return false; }
  }
  cfg = cfg.with_delimiter(d);

  if (!cli.normalizers.empty()) {
    std::vector<tio::NormalizeFn> steps;
    for (const auto& name : cli.normalizers) {
      auto n = tio::normalizer_by_name(name);
      if (!n) { std::cerr << "[config] unknown normalizer " << name << "\n"; return false; }
      if (*n) steps.push_back(*n);
    }
    cfg = cfg.with_normalizer(steps.empty() ? tio::NormalizeFn{} : tio::normalize::chain(std::move(steps)));
  }

  if (!cli.filters.empty()) {
    tio::FilterFn all;
    for (const auto& f : cli.filters) {
      auto fn = filter_from_flag(f);
      if (!fn) { std::cerr << "[config] bad filter " << f << "\n"; return false; }
      all = all ? tio::filter::all_of(std::move(all), std::move(*fn)) : std::move(*fn);
    }
    cfg = cfg.with_filter(std::move(all));
  }

  if (cli.fail_on_invalid)  cfg = cfg.with_fail_on_invalid(true);
  if (cli.no_fail_on_error) cfg = cfg.with_fail_on_error(false);
  return true;
}

int exit_for(const tio::ReaderError& e) {
  return e.is(tio::ErrorKind::Open) ? kOpen : kScan;
}

void record_error(tio::RunSummary& s, const tio::ReaderError& e) {
  s.error_kind = tio::to_string(e.kind());
  s.error_message = e.message();
  std::cerr << "[tokenio] " << e.message()
            << " (" << e.where().file_name() << ":" << e.where().line << ")\n";
}

int run_batch(tio::Reader& reader, tio::RunSummary& s) {
  tio::ReadResult res = reader.read_tokens();
  for (const auto& t : res.tokens) std::cout << t << "\n";
  s.tokens = res.stats.accepted;
  s.skipped = res.stats.skipped;
  s.bytes = res.stats.bytes_read;
  if (res.error) { record_error(s, *res.error); return exit_for(*res.error); }
  return kOk;
}

int run_stream(tio::Reader& reader, const Cli& cli, tio::RunSummary& s) {
  tio::Conduit<std::string> out(cli.buffer);
  tio::CancelToken cancel = cli.timeout_ms > 0
      ? tio::CancelToken::with_timeout(std::chrono::milliseconds(cli.timeout_ms))
      : tio::CancelToken{};

  std::thread printer([&]{
    while (auto t = out.receive()) std::cout << *t << "\n";
  });

  tio::StreamStatus st = reader.stream_tokens(out, cancel);
  out.close();
  printer.join();

  s.tokens = st.stats.accepted;
  s.skipped = st.stats.skipped;
  s.bytes = st.stats.bytes_read;
  if (st.error) { record_error(s, *st.error); return exit_for(*st.error); }
  if (st.cancelled) {
    s.error_kind = "cancelled";
    s.error_message = st.cancelled.message();
    std::cerr << "[tokenio] stream stopped: " << st.cancelled.message() << "\n";
    return kCancelled;
  }
  return kOk;
}

}

int main(int argc, char** argv) {
  auto cli = parse_cli(argc, argv);
  if (cli.bad) { usage(std::cerr); return kUsage; }

  tio::ReaderConfig cfg;
  if (!build_config(cli, cfg)) return kUsage;

  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  tio::RunSummary summary;
  summary.mode = cli.stream ? "stream" : "batch";
  summary.token_pattern = cfg.delimiter().token().describe();
  summary.stop_pattern = cfg.delimiter().stop().describe();

  tio::Reader reader(cfg);
  bool from_stdin = cli.inputs.empty() || (cli.inputs.size() == 1 && cli.inputs[0] == "-");
  if (from_stdin) {
    summary.inputs.push_back("<stdin>");
  } else {
    std::optional<tio::ReaderError> err;
    auto opened = reader.from_files(cli.inputs, &err);
    if (!opened) {
      record_error(summary, *err);
      return kOpen;
    }
    reader = std::move(*opened);
    summary.inputs = cli.inputs;
  }

  int rc = cli.stream ? run_stream(reader, cli, summary) : run_batch(reader, summary);

  if (auto cerr = reader.close()) {
    std::cerr << "[tokenio] " << cerr->message() << "\n";
    if (rc == kOk) rc = kScan;
  }

  const auto t1 = ch::steady_clock::now();
  summary.wall_time_ms = ch::duration<double, std::milli>(t1 - t0).count();
  const double sec = summary.wall_time_ms / 1000.0;
  summary.throughput_mb_s = sec > 0.0 ? (summary.bytes / (1024.0 * 1024.0)) / sec : 0.0;
  summary.tokens_per_sec = sec > 0.0 ? summary.tokens / sec : 0.0;

  if (!cli.report_path.empty()) {
    std::string err;
    if (!tio::RunSummaryWriter::write_file(cli.report_path, summary, &err)) {
      std::cerr << "[tokenio] report: " << err << "\n";
      if (rc == kOk) rc = kUsage;
    }
  }
  return rc;
}
