#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace tio {

enum class ErrorKind { Invalid, Read, Close, Open };

const char* to_string(ErrorKind k) noexcept;

// Where a failing call came from. current() captures the caller's location
// when used as a default argument.
struct CallSite {
  const char* file = "";
  int line = 0;
  const char* function = "";

  static CallSite current(const char* file = __builtin_FILE(),
                          int line = __builtin_LINE(),
                          const char* function = __builtin_FUNCTION()) noexcept {
    return CallSite{file, line, function};
  }

  // File name without directories.
  std::string_view file_name() const noexcept;
};

class ReaderError {
public:
  static ReaderError invalid(std::string token, std::int64_t offset, CallSite where);
  static ReaderError read(std::error_code cause, CallSite where);
  static ReaderError close(std::error_code cause, CallSite where);
  static ReaderError open(std::error_code cause, std::string path, CallSite where);

  ErrorKind kind() const noexcept { return kind_; }
  const std::error_code& cause() const noexcept { return cause_; }
  const std::string& token() const noexcept { return token_; }
  // Running byte offset of accepted+skipped tokens; -1 unless Invalid.
  std::int64_t offset() const noexcept { return offset_; }
  const std::string& path() const noexcept { return path_; }
  const CallSite& where() const noexcept { return where_; }

  bool is(ErrorKind k) const noexcept { return kind_ == k; }
  bool is(const std::error_code& ec) const noexcept { return cause_ && cause_ == ec; }
  bool is(std::errc e) const noexcept { return cause_ && cause_ == e; }

  // "tokenio: read error: Input/output error"
  std::string message() const;

private:
  ReaderError(ErrorKind kind, CallSite where) : kind_(kind), where_(where) {}

  ErrorKind kind_;
  std::error_code cause_;
  std::string token_;
  std::int64_t offset_ = -1;
  std::string path_;
  CallSite where_;
};

}
