#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace tio {

struct RunSummary {
  // Counters
  std::uint64_t tokens = 0;
  std::uint64_t skipped = 0;
  std::uint64_t bytes = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  double tokens_per_sec = 0.0;

  // Run description
  std::string mode;            // "batch" | "stream"
  std::vector<std::string> inputs;
  std::string token_pattern;
  std::string stop_pattern;

  // Outcome; empty when the run ended cleanly
  std::string error_kind;      // "invalid token" | "read error" | ... | "cancelled"
  std::string error_message;
};

class RunSummaryWriter {
public:
  // Serialize summary to a compact JSON object.
  static std::string to_json(const RunSummary& s);

  // Writes to_json(s) to `path`, creating parent directories.
  static bool write_file(const std::string& path, const RunSummary& s, std::string* err_out = nullptr);
};

}
