/**
 * @file archive.hxx
 * @brief Random-access reader for SAR archives.
 */

#pragma once

#include <sarfile/header.hxx>
#include <sarfile/member-source.hxx>
#include <sarfile/storage.hxx>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace sarfile {
/**
 * @brief An opened SAR archive.
 *
 * Opening reads and validates the preamble and the header once; the member
 * table and the offsets derived from it never change afterwards. Every
 * member lookup opens a fresh stream through the Storage, so member views
 * obtained from one Archive are independent and may be read from different
 * threads.
 */
class Archive {
public:
  /**
   * @brief Open the archive at @p path.
   *
   * @throws StorageError when @p path cannot be opened.
   * @throws BadMagic when the file does not start with the SAR magic.
   * @throws MalformedHeader when the header cannot be read or decoded.
   */
  static Archive open(const std::string &path,
                      std::shared_ptr<Storage> storage = default_storage());

  /// @brief Number of members.
  std::size_t size() const { return header_.members.size(); }

  /// @brief Member names, in archive order.
  const std::vector<std::string> &names() const { return names_; }

  /**
   * @brief Index of the member named @p name.
   *
   * When a name occurs more than once the first occurrence wins.
   *
   * @throws NotFound when no member has that name.
   */
  std::size_t index_of(const std::string &name) const;

  bool contains(const std::string &name) const;

  /**
   * @brief Bounded, read-only view of member @p index.
   * @throws NotFound when @p index is not below size().
   */
  MemberSource get(std::size_t index) const;

  /// @copydoc index_of
  MemberSource get(const std::string &name) const;

  /// @brief Every byte of member @p index.
  std::string read(std::size_t index) const;
  /// @brief Every byte of the member named @p name.
  std::string read(const std::string &name) const;

  /**
   * @brief Archive restricted to one contiguous block of members.
   *
   * The shard reads the same physical file; see Header::shard().
   */
  Archive shard(std::size_t shard_id, std::size_t total_shards) const;

  const Header &header() const { return header_; }
  const std::vector<std::uint64_t> &offsets() const { return offsets_; }

  /// @brief Size of the preamble plus the encoded header.
  std::uint64_t data_offset() const { return data_offset_; }

  const std::string &path() const { return path_; }

private:
  Archive(std::string path, std::shared_ptr<Storage> storage, Header header,
          std::uint64_t data_offset);

  std::string path_;
  std::shared_ptr<Storage> storage_;
  Header header_;
  std::uint64_t data_offset_;
  std::vector<std::uint64_t> offsets_;
  std::vector<std::string> names_;
  std::unordered_map<std::string, std::size_t> index_;
};
} // namespace sarfile
