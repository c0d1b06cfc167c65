#include "tokenio/run_summary.hpp"
#include <cmath> // std::isfinite
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace tio {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          o << buf;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string RunSummaryWriter::to_json(const RunSummary& s) {
  std::ostringstream o;
  o << "{";
  o << "\"tokens\":" << s.tokens << ",";
  o << "\"skipped\":" << s.skipped << ",";
  o << "\"bytes\":" << s.bytes << ",";
  o << "\"wall_time_ms\":" << safe_num(s.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(s.throughput_mb_s) << ",";
  o << "\"tokens_per_sec\":" << safe_num(s.tokens_per_sec) << ",";

  o << "\"mode\":"; esc(o, s.mode); o << ",";
  o << "\"inputs\":[";
  for (size_t i=0;i<s.inputs.size();++i){
    if (i) o << ",";
    esc(o, s.inputs[i]);
  }
  o << "],";
  o << "\"token_pattern\":"; esc(o, s.token_pattern); o << ",";
  o << "\"stop_pattern\":";  esc(o, s.stop_pattern);  o << ",";

  o << "\"error_kind\":";    esc(o, s.error_kind);    o << ",";
  o << "\"error_message\":"; esc(o, s.error_message);

  o << "}";
  return o.str();
}

bool RunSummaryWriter::write_file(const std::string& path, const RunSummary& s, std::string* err_out) {
  const std::filesystem::path p(path);
  std::error_code ec;
  if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);
  if (ec) {
    if (err_out) *err_out = "cannot create " + p.parent_path().string() + ": " + ec.message();
    return false;
  }

  std::ofstream out(p, std::ios::binary);
  if (!out) {
    if (err_out) *err_out = "failed to write " + path;
    return false;
  }
  const std::string json = to_json(s);
  out.write(json.data(), static_cast<std::streamsize>(json.size()));
  if (!out) {
    if (err_out) *err_out = "short write to " + path;
    return false;
  }
  return true;
}

}
