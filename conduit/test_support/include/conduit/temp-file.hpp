#pragma once

#include <cstddef>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace conduit::test {

// ScopedTempDir: creates a unique temporary directory under the system temp
// directory and removes it (with its content) on destruction.
class ScopedTempDir {
 public:
  explicit ScopedTempDir(std::string_view prefix = "conduit-temp-dir-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;
  ScopedTempDir(ScopedTempDir&& other) noexcept;
  ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

 private:
  void cleanup() noexcept;

  std::filesystem::path _dir;
};

// ScopedTempFile: a uniquely-named file created inside an existing ScopedTempDir
// and removed on destruction. The directory stays owned by the ScopedTempDir.
class ScopedTempFile {
 public:
  ScopedTempFile(const ScopedTempDir& dir, std::span<const std::byte> content);

  ScopedTempFile(const ScopedTempDir& dir, std::string_view content);

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;
  ScopedTempFile(ScopedTempFile&& other) noexcept;
  ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;

  ~ScopedTempFile();

  // Full path to the file
  [[nodiscard]] const std::filesystem::path& filePath() const noexcept { return _path; }

  // Content written at creation.
  [[nodiscard]] const std::vector<std::byte>& content() const noexcept { return _content; }

 private:
  void cleanup() noexcept;

  std::filesystem::path _path;
  std::vector<std::byte> _content;
};

// Reads back the whole content of the file at path. Throws std::runtime_error on failure.
std::vector<std::byte> ReadFileBytes(const std::filesystem::path& path);

}  // namespace conduit::test
