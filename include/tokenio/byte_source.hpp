#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace tio {

// Ordered byte producer. read() returns the number of bytes written to
// `dst`; 0 with no error means the source is exhausted.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  virtual std::size_t read(char* dst, std::size_t n, std::error_code& ec) = 0;

  // Sources holding an OS resource report closable() and release it in close().
  virtual bool closable() const noexcept { return false; }
  virtual std::error_code close() { return {}; }
};

using SourcePtr = std::shared_ptr<ByteSource>;

class StringSource : public ByteSource {
public:
  explicit StringSource(std::string data) : data_(std::move(data)) {}
  std::size_t read(char* dst, std::size_t n, std::error_code& ec) override;

private:
  std::string data_;
  std::size_t pos_{0};
};

class FileSource : public ByteSource {
public:
  // Opens `path` for binary reading; nullptr and `ec` set on failure.
  static std::shared_ptr<FileSource> open(const std::string& path, std::error_code& ec);

  // Borrows an already open stream (stdin); never closed by this object.
  static std::shared_ptr<FileSource> borrow(std::FILE* f);

  ~FileSource() override;
  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;

  std::size_t read(char* dst, std::size_t n, std::error_code& ec) override;
  bool closable() const noexcept override { return owned_; }
  std::error_code close() override;

  const std::string& path() const noexcept { return path_; }

private:
  FileSource(std::FILE* f, std::string path, bool owned)
    : f_(f), path_(std::move(path)), owned_(owned) {}

  std::FILE* f_;
  std::string path_;
  bool owned_;
};

// Concatenates sources in order into one logical stream. A failing part
// reports its error and stays current, so the failure is not skipped over.
class MultiSource : public ByteSource {
public:
  explicit MultiSource(std::vector<SourcePtr> parts) : parts_(std::move(parts)) {}
  std::size_t read(char* dst, std::size_t n, std::error_code& ec) override;

  const std::vector<SourcePtr>& parts() const noexcept { return parts_; }

private:
  std::vector<SourcePtr> parts_;
  std::size_t cur_{0};
};

SourcePtr make_string_source(std::string data);
SourcePtr concat_sources(std::vector<SourcePtr> parts);

}
