#include "tokenio/byte_source.hpp"
#include <cerrno>
#include <cstring>

namespace tio {

std::size_t StringSource::read(char* dst, std::size_t n, std::error_code& ec) {
  ec.clear();
  const std::size_t left = data_.size() - pos_;
  const std::size_t k = (n < left) ? n : left;
  if (k) std::memcpy(dst, data_.data() + pos_, k);
  pos_ += k;
  return k;
}

std::shared_ptr<FileSource> FileSource::open(const std::string& path, std::error_code& ec) {
  std::FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) {
    ec = std::error_code(errno, std::generic_category());
    return nullptr;
  }
  ec.clear();
  return std::shared_ptr<FileSource>(new FileSource(f, path, true));
}

std::shared_ptr<FileSource> FileSource::borrow(std::FILE* f) {
  return std::shared_ptr<FileSource>(new FileSource(f, "<stdin>", false));
}

FileSource::~FileSource() {
  if (owned_ && f_) std::fclose(f_);
}

std::size_t FileSource::read(char* dst, std::size_t n, std::error_code& ec) {
  ec.clear();
  if (!f_) { ec = std::make_error_code(std::errc::bad_file_descriptor); return 0; }
  std::size_t got = std::fread(dst, 1, n, f_);
  if (got < n && std::ferror(f_)) {
    ec = std::error_code(errno ? errno : EIO, std::generic_category());
    std::clearerr(f_);
  }
  return got;
}

std::error_code FileSource::close() {
  if (!owned_) return {};
  if (!f_) return std::make_error_code(std::errc::bad_file_descriptor); // already closed
  std::FILE* f = f_;
  f_ = nullptr;
  if (std::fclose(f) != 0) return std::error_code(errno, std::generic_category());
  return {};
}

std::size_t MultiSource::read(char* dst, std::size_t n, std::error_code& ec) {
  ec.clear();
  while (cur_ < parts_.size()) {
    std::size_t got = parts_[cur_]->read(dst, n, ec);
    if (got > 0 || ec) return got;
    ++cur_;
  }
  return 0;
}

SourcePtr make_string_source(std::string data) {
  return std::make_shared<StringSource>(std::move(data));
}

SourcePtr concat_sources(std::vector<SourcePtr> parts) {
  if (parts.size() == 1) return parts.front();
  return std::make_shared<MultiSource>(std::move(parts));
}

}
