/**
 * @file header.hxx
 * @brief The SAR archive header: member table codec, offsets and sharding.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sarfile {
/// Magic constant opening every SAR archive.
inline constexpr std::string_view magic{"SAR\n", 4};

/// Size of the preamble: the magic followed by the 8-byte header length.
inline constexpr std::size_t preamble_size = magic.size() + 8;

/**
 * @brief One archived file: its name and its length in bytes.
 */
struct MemberEntry {
  std::string name;   /**< @brief Relative path, UTF-8. */
  std::uint64_t size; /**< @brief Number of payload bytes. */

  bool operator==(const MemberEntry &) const = default;
};

/**
 * @brief Decoded description of an archive's members.
 *
 * The encoded form is laid out as follows (integers little-endian):
 *
 * - 1 byte: width of the size table (1, 2, 4 or 8)
 * - 1 byte: width of the name-length table (1, 2, 4 or 8)
 * - 8 bytes: member count N
 * - N sizes at the size table width
 * - N name byte lengths at the name-length table width
 * - the UTF-8 names, back to back
 *
 * Each table uses the smallest width able to hold its largest value.
 *
 * Member order is significant: it is the physical order of the payloads in
 * the archive. @c init_offset is never encoded; it is non-zero only for a
 * shard and holds the payload bytes of the members dropped in front of it.
 */
struct Header {
  std::vector<MemberEntry> members;
  std::uint64_t init_offset = 0;

  /**
   * @brief Encode the member table.
   *
   * Deterministic: equal member lists yield equal bytes.
   *
   * @return std::string The encoded header bytes.
   * @throws EmptyArchive when there are no members.
   * @throws MalformedHeader when a name is not valid UTF-8.
   */
  std::string encode() const;

  /**
   * @brief Decode a header produced by encode().
   *
   * @param bytes Exactly the encoded header, nothing before or after it.
   * @return Header The decoded header, with @c init_offset of zero.
   * @throws MalformedHeader when the bytes do not decode cleanly.
   */
  static Header decode(std::string_view bytes);

  /**
   * @brief Absolute offset of every member's payload.
   *
   * @param data_start Size of the preamble plus the encoded header of the
   * physical archive this header (or the header it was sharded from) belongs
   * to.
   * @return std::vector<std::uint64_t> One offset per member, in order.
   */
  std::vector<std::uint64_t> offsets(std::uint64_t data_start) const;

  /**
   * @brief Contiguous block @p shard_id out of @p total_shards.
   *
   * Members are split into blocks of ceil(N / total_shards). A shard past the
   * last member is empty. The returned @c init_offset is adjusted so that
   * offsets() on the shard agree with offsets() on this header.
   *
   * Any @p shard_id is accepted, so a shard id past the last block also
   * yields an empty shard whose @c init_offset covers every member.
   *
   * @throws std::invalid_argument when @p total_shards is zero.
   */
  Header shard(std::size_t shard_id, std::size_t total_shards) const;

  bool operator==(const Header &) const = default;
};
} // namespace sarfile
