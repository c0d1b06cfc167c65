#include "tokenio/reader_error.hpp"
#include <sstream>

namespace tio {

const char* to_string(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::Invalid: return "invalid token";
    case ErrorKind::Read:    return "read error";
    case ErrorKind::Close:   return "close error";
    case ErrorKind::Open:    return "open error";
  }
  return "unknown error";
}

std::string_view CallSite::file_name() const noexcept {
  std::string_view f(file ? file : "");
  auto slash = f.find_last_of("/\\");
  return slash == std::string_view::npos ? f : f.substr(slash + 1);
}

ReaderError ReaderError::invalid(std::string token, std::int64_t offset, CallSite where) {
  ReaderError e(ErrorKind::Invalid, where);
  e.token_ = std::move(token);
  e.offset_ = offset;
  return e;
}

ReaderError ReaderError::read(std::error_code cause, CallSite where) {
  ReaderError e(ErrorKind::Read, where);
  e.cause_ = cause;
  return e;
}

ReaderError ReaderError::close(std::error_code cause, CallSite where) {
  ReaderError e(ErrorKind::Close, where);
  e.cause_ = cause;
  return e;
}

ReaderError ReaderError::open(std::error_code cause, std::string path, CallSite where) {
  ReaderError e(ErrorKind::Open, where);
  e.cause_ = cause;
  e.path_ = std::move(path);
  return e;
}

std::string ReaderError::message() const {
  std::ostringstream o;
  o << "tokenio: " << to_string(kind_);
  if (kind_ == ErrorKind::Invalid) {
    o << " '" << token_ << "' at offset " << offset_;
  }
  if (!path_.empty()) o << " '" << path_ << "'";
  if (cause_) o << ": " << cause_.message();
  return o.str();
}

}
