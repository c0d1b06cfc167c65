#pragma once
#include "tokenio/byte_source.hpp"
#include "tokenio/delimiter.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>

namespace tio {

// Pulls fixed-size chunks from a ByteSource into a carry buffer and runs the
// SplitScanner over it until a token, the end of the scan, or a failure.
class ChunkScanner {
public:
  struct Config {
    std::size_t chunk_bytes     = 64 * 1024;       // 64 KiB per read
    std::size_t max_token_bytes = 8 * 1024 * 1024; // 8 MiB guard, 0 = none
    bool        fail_on_error   = true;            // false: failures end the input
  };

  enum class Pull { Token, Finished, Failed };

  ChunkScanner(ByteSource& src, Delimiter delim);  // uses default Config{}
  ChunkScanner(ByteSource& src, Delimiter delim, Config cfg);
  ~ChunkScanner();
  ChunkScanner(const ChunkScanner&) = delete;
  ChunkScanner& operator=(const ChunkScanner&) = delete;

  // Token: `out` holds the next raw token. Failed: see error().
  Pull next(std::string& out);

  const std::error_code& error() const noexcept;
  std::uint64_t bytes_read() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
