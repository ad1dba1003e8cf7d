#include "conduit/temp-file.hpp"

#include <stdlib.h>  // mkdtemp, mkstemp
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "conduit/base-fd.hpp"
#include "conduit/file.hpp"
#include "conduit/log.hpp"

namespace conduit::test {

ScopedTempDir::ScopedTempDir(std::string_view prefix) {
  std::string tmpl = (std::filesystem::temp_directory_path() / std::string(prefix)).string() + "XXXXXX";
  if (::mkdtemp(tmpl.data()) == nullptr) {
    throw std::system_error(errno, std::generic_category(), "ScopedTempDir: mkdtemp failed");
  }
  _dir = std::filesystem::path(tmpl);
}

ScopedTempDir::ScopedTempDir(ScopedTempDir&& other) noexcept : _dir(std::move(other._dir)) { other._dir.clear(); }

ScopedTempDir& ScopedTempDir::operator=(ScopedTempDir&& other) noexcept {
  if (this != &other) {
    cleanup();
    _dir = std::move(other._dir);
    other._dir.clear();
  }
  return *this;
}

ScopedTempDir::~ScopedTempDir() { cleanup(); }

void ScopedTempDir::cleanup() noexcept {
  if (!_dir.empty()) {
    std::error_code ec;
    std::filesystem::remove_all(_dir, ec);
    if (ec) {
      log::error("ScopedTempDir::cleanup: remove_all({}) failed: {}", _dir.string(), ec.message());
    }
    _dir.clear();
  }
}

ScopedTempFile::ScopedTempFile(const ScopedTempDir& dir, std::span<const std::byte> content)
    : _content(content.begin(), content.end()) {
  // mkstemp creates and opens atomically.
  std::string tmpl = (dir.dirPath() / "conduit_temp_XXXXXX").string();
  BaseFd fd(::mkstemp(tmpl.data()));
  if (!fd) {
    throw std::system_error(errno, std::generic_category(), "ScopedTempFile: mkstemp failed");
  }
  _path = std::filesystem::path(tmpl);

  std::span<const std::byte> remaining = content;
  while (!remaining.empty()) {
    const ssize_t written = ::write(fd.fd(), remaining.data(), remaining.size());
    if (written == -1 && errno == EINTR) {
      continue;
    }
    if (written <= 0) {
      cleanup();
      throw std::runtime_error("ScopedTempFile: write failed");
    }
    remaining = remaining.subspan(static_cast<std::size_t>(written));
  }
}

ScopedTempFile::ScopedTempFile(const ScopedTempDir& dir, std::string_view content)
    : ScopedTempFile(dir, std::as_bytes(std::span<const char>(content))) {}

ScopedTempFile::ScopedTempFile(ScopedTempFile&& other) noexcept
    : _path(std::move(other._path)), _content(std::move(other._content)) {
  other._path.clear();
}

ScopedTempFile& ScopedTempFile::operator=(ScopedTempFile&& other) noexcept {
  if (this != &other) {
    cleanup();
    _path = std::move(other._path);
    _content = std::move(other._content);
    other._path.clear();
  }
  return *this;
}

ScopedTempFile::~ScopedTempFile() { cleanup(); }

void ScopedTempFile::cleanup() noexcept {
  if (!_path.empty()) {
    std::error_code ec;
    if (!std::filesystem::remove(_path, ec) || ec) {
      log::error("ScopedTempFile::cleanup: remove({}) failed: {}", _path.string(), ec.message());
    }
    _path.clear();
  }
}

std::vector<std::byte> ReadFileBytes(const std::filesystem::path& path) {
  File file(path.string());
  if (!file) {
    throw std::runtime_error("ReadFileBytes: cannot open " + path.string());
  }
  const std::string content = file.loadAllContent();
  const auto bytes = std::as_bytes(std::span<const char>(content));
  return {bytes.begin(), bytes.end()};
}

}  // namespace conduit::test
