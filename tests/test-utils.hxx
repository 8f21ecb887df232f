#pragma once

#include <sarfile/pack.hxx>

#include <filesystem>
#include <istream>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sarfile::test {
/**
 * @brief Directory under the system temp directory, removed with its
 * contents on destruction.
 */
class TempDir {
public:
  TempDir();
  ~TempDir();
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const std::filesystem::path &path() const { return path_; }
  std::filesystem::path operator/(const std::filesystem::path &p) const {
    return path_ / p;
  }

private:
  std::filesystem::path path_;
};

/// @brief Write @p content to @p path, creating parent directories.
void write_file(const std::filesystem::path &path, std::string_view content);

std::string read_file(const std::filesystem::path &path);

/// @brief Binary input stream over a copy of @p content.
std::unique_ptr<std::istream> memory_stream(std::string content);

/// @brief ByteSource serving members from an in-memory map.
ByteSource memory_source(std::map<std::string, std::string> contents);

/**
 * @brief Compute the SHA-256 digest of data read from a stream.
 *
 * Reads from the current stream position until EOF.
 *
 * @return std::string Hex-encoded SHA-256 digest.
 */
std::string sha256sum(std::istream &stream);
std::string sha256sum(std::string_view data);

/**
 * @brief One entry of a tar archive built by make_tar().
 */
struct TarFile {
  std::string name;
  std::string content;
  char type = '0';
  std::string prefix;        /**< @brief ustar prefix field. */
  bool base256_size = false; /**< @brief Store the size GNU base-256 style. */
  bool bad_checksum = false;
};

/**
 * @brief Serialise @p files as a ustar archive, terminated by two zero
 * blocks unless @p terminate is false.
 */
std::string make_tar(const std::vector<TarFile> &files, bool terminate = true);

/// @brief One pax extended header record, "<len> <key>=<value>\n".
std::string pax_record(std::string_view key, std::string_view value);
} // namespace sarfile::test
