#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "tokenio/chunk_scanner.hpp"
#include "tokenio/reader.hpp"

namespace fs = std::filesystem;
using clk = std::chrono::steady_clock;

static std::string make_synth_lines(std::size_t lines, std::size_t words) {
  fs::path p = fs::temp_directory_path() / "tio_bench_synth.txt";
  std::ofstream out(p, std::ios::binary);
  for (size_t r = 0; r < lines; ++r) {
    for (size_t w = 0; w < words; ++w) {
      out << "w" << (r % 97) << "_" << (w * 37 % 1000);
      if (w + 1 < words) out << ((w % 3) ? "  " : " ");
    }
    out << "\n";
  }
  out.flush();
  return p.string();
}

struct Args {
  std::string path;            // if empty -> synth
  std::size_t lines = 200'000; // for synth
  std::size_t words = 8;       // for synth
  std::size_t chunk = 64 * 1024;
  int iters = 3;
};

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i=1;i<argc;++i){
    std::string s(argv[i]);
    auto eq = s.find('=');
    auto key = s.substr(0, eq);
    auto val = (eq==std::string::npos) ? "" : s.substr(eq+1);
    if (key=="--input") a.path = val;
    else if (key=="--lines") a.lines = std::stoull(val);
    else if (key=="--words") a.words = std::stoull(val);
    else if (key=="--chunk") a.chunk = std::stoull(val);
    else if (key=="--iters") a.iters = std::stoi(val);
    else if (key=="--help" || key=="-h") {
      std::cout <<
        "Usage: split_bench [--input=path] [--lines=N] [--words=M] [--chunk=BYTES] [--iters=K]\n"
        "If the input is omitted, a synthetic text file is generated.\n";
      std::exit(0);
    }
  }
  return a;
}

static void report(int k, std::uint64_t ntok, std::uint64_t bytes, double sec) {
  const double mib = bytes / (1024.0*1024.0);
  std::cout << "  iter " << k
            << ": tokens=" << ntok
            << " bytes=" << bytes
            << " time=" << sec << "s"
            << "  throughput=" << (mib/sec) << " MiB/s"
            << "  tokens/s=" << (ntok/sec) << "\n";
}

// Raw splitting, no normalize/filter.
static void bench_scanner(const std::string& label, const std::string& path,
                          const tio::Delimiter& d, const Args& a) {
  std::cout << "\n[" << label << "] file=" << path << " chunk=" << a.chunk << " iters=" << a.iters << "\n";
  for (int k=1;k<=a.iters;++k) {
    std::error_code ec;
    auto src = tio::FileSource::open(path, ec);
    if (!src) { std::cerr << "[ERR] " << path << ": " << ec.message() << "\n"; return; }

    tio::ChunkScanner::Config cfg;
    cfg.chunk_bytes = a.chunk;
    tio::ChunkScanner sc(*src, d, cfg);
    std::uint64_t ntok = 0;
    std::string tok;

    auto t0 = clk::now();
    tio::ChunkScanner::Pull p;
    while ((p = sc.next(tok)) == tio::ChunkScanner::Pull::Token) ++ntok;
    auto t1 = clk::now();

    if (p == tio::ChunkScanner::Pull::Failed) {
      std::cerr << "[ERR] scan failed: " << sc.error().message() << "\n";
      return;
    }
    report(k, ntok, sc.bytes_read(), std::chrono::duration<double>(t1-t0).count());
  }
}

// Full reader: split, trim, non-empty filter.
static void bench_reader(const std::string& path, const Args& a) {
  std::cout << "\n[reader] file=" << path << " iters=" << a.iters << "\n";
  const tio::Reader base = tio::Reader(tio::ReaderConfig{}.with_chunk_bytes(a.chunk))
                               .with_filter(tio::filter::non_empty);
  for (int k=1;k<=a.iters;++k) {
    std::optional<tio::ReaderError> err;
    auto r = base.from_file(path, &err);
    if (!r) { std::cerr << "[ERR] " << err->message() << "\n"; return; }

    auto t0 = clk::now();
    tio::ReadResult res = r->read_tokens();
    auto t1 = clk::now();

    if (auto cerr = r->close()) std::cerr << "[WARN] " << cerr->message() << "\n";
    if (res.error) { std::cerr << "[ERR] " << res.error->message() << "\n"; return; }
    report(k, res.stats.accepted, res.stats.bytes_read, std::chrono::duration<double>(t1-t0).count());
  }
}

int main(int argc, char** argv){
  Args a = parse_args(argc, argv);

  std::string path = a.path;
  if (path.empty() || !fs::exists(path)) path = make_synth_lines(a.lines, a.words);

  tio::Delimiter lines;
  bench_scanner("literal \\n", path, lines, a);

  std::string err;
  tio::Delimiter ws = lines.with_token_regex("\\s+", &err);
  if (!err.empty()) { std::cerr << "[ERR] " << err << "\n"; return 1; }
  bench_scanner("regex \\s+", path, ws, a);

  bench_reader(path, a);
  return 0;
}
