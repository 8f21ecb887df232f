/**
 * @file member-source.hxx
 * @brief Read-only, seek-bounded Boost.Iostreams device over one archive
 * member.
 */

#pragma once

#include <boost/iostreams/categories.hpp>
#include <boost/iostreams/positioning.hpp>

#include <cstdint>
#include <ios>
#include <istream>
#include <memory>
#include <string>

namespace sarfile {
/**
 * @brief View of the byte range [start, start + size) of a larger stream.
 *
 * MemberSource models a Boost.Iostreams input-seekable, closable Device, so
 * it can be used directly or wrapped to get a std::istream:
 *
 * @code{.cpp}
 * namespace io = boost::iostreams;
 *
 * auto archive = sarfile::Archive::open("assets.sar");
 * io::stream<sarfile::MemberSource> in(archive.get("textures/grass.png"));
 * std::string bytes((std::istreambuf_iterator<char>(in)),
 *                   std::istreambuf_iterator<char>());
 * @endcode
 *
 * Positions are member-local: tell() is always within [0, size()].
 *
 * Boundary contract:
 *  - reads stop at the end of the member and return fewer bytes than
 *    requested; at the end, the device read returns -1 and the string read
 *    returns an empty string. Bytes of the following member are never
 *    returned.
 *  - seeks from the beginning, the current position or the end that compute
 *    a position outside [0, size()] throw OutOfRange and leave the position
 *    unchanged.
 *
 * Copies share the underlying stream, as Boost.Iostreams copies devices into
 * its stream buffers. Closing any copy closes the underlying stream for all
 * of them, so concurrent readers must each obtain their own MemberSource
 * from Archive::get().
 */
class MemberSource {
public:
  using char_type = char;
  struct category : boost::iostreams::input_seekable,
                    boost::iostreams::device_tag,
                    boost::iostreams::closable_tag {};

  /**
   * @brief Bound @p stream to [start, start + size) and position it at
   * @p start.
   *
   * @param stream Binary, seekable stream. Ownership moves to the view.
   * @param name Member name, used in error messages.
   * @param start Absolute offset of the member's first byte in @p stream.
   * @param size Number of bytes in the member.
   * @throws StorageError when @p stream is null or cannot be positioned.
   */
  MemberSource(std::unique_ptr<std::istream> stream, std::string name,
               std::uint64_t start, std::uint64_t size);

  /**
   * @brief Device read: copy up to @p n bytes into @p s.
   * @return std::streamsize Bytes read, or -1 at the end of the member.
   * A non-positive @p n reads nothing and returns 0.
   */
  std::streamsize read(char *s, std::streamsize n);

  /**
   * @brief Read up to @p n bytes, or everything left when @p n is negative.
   */
  std::string read(std::streamsize n = -1);

  /**
   * @brief Move the member-local position.
   * @return std::streampos The new member-local position.
   * @throws OutOfRange when the target lies outside [0, size()].
   */
  std::streampos seek(boost::iostreams::stream_offset off,
                      std::ios_base::seekdir way = std::ios_base::beg);

  /// @brief Member-local position, in [0, size()].
  std::uint64_t tell() const;

  /// @brief Close the underlying stream, for this view and all its copies.
  void close();

  bool is_open() const;

  /// @throws Unsupported always; members are read-only.
  std::streamsize write(const char *s, std::streamsize n);
  /// @throws Unsupported always; members are read-only.
  void truncate(std::uint64_t size);
  /// @throws Unsupported always; members are binary blobs.
  std::string read_line();

  const std::string &name() const { return name_; }
  std::uint64_t size() const { return size_; }

private:
  struct Handle {
    std::unique_ptr<std::istream> stream;
  };

  std::istream &stream() const;

  std::shared_ptr<Handle> handle_;
  std::string name_;
  std::uint64_t start_;
  std::uint64_t size_;
};
} // namespace sarfile
