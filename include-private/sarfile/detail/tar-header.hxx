#pragma once

#include <cstddef>

namespace sarfile::detail {
/// Size of every tar header and of the blocks payloads are padded to.
inline constexpr std::size_t tar_block_size = 512;

/**
 * @struct TarHeader
 * @brief On-disk layout of a POSIX ustar / GNU tar header block.
 *
 * All fields are fixed-size character arrays. Text fields are NUL-terminated
 * only when shorter than the field; numeric fields are octal ASCII, or GNU
 * base-256 binary when the high bit of the first byte is set.
 */
struct __attribute__((packed)) TarHeader {
  char name[100];     /**< @brief Entry name, or its last part with prefix. */
  char mode[8];       /**< @brief Permission bits (octal). */
  char uid[8];        /**< @brief Owner user ID (octal). */
  char gid[8];        /**< @brief Owner group ID (octal). */
  char size[12];      /**< @brief Payload size (octal or base-256). */
  char mtime[12];     /**< @brief Modification time (octal). */
  char chksum[8];     /**< @brief Header checksum (octal). */
  char typeflag[1];   /**< @brief Entry type, see the tar_type_* constants. */
  char linkname[100]; /**< @brief Link target for hard and symbolic links. */
  char magic[6];      /**< @brief "ustar\0" (POSIX) or "ustar " (GNU). */
  char version[2];    /**< @brief "00" (POSIX) or " \0" (GNU). */
  char uname[32];     /**< @brief Owner user name. */
  char gname[32];     /**< @brief Owner group name. */
  char devmajor[8];   /**< @brief Device major number. */
  char devminor[8];   /**< @brief Device minor number. */
  char prefix[155];   /**< @brief ustar directory prefix of @c name. */
  char padding[12];   /**< @brief Unused, pads the block to 512 bytes. */
};

static_assert(sizeof(TarHeader) == tar_block_size,
              "TarHeader must be 512 bytes");

inline constexpr char tar_type_regular = '0';
inline constexpr char tar_type_regular_old = '\0';
inline constexpr char tar_type_directory = '5';
inline constexpr char tar_type_contiguous = '7';
inline constexpr char tar_type_gnu_long_name = 'L';
inline constexpr char tar_type_pax_extended = 'x';
inline constexpr char tar_type_pax_global = 'g';
} // namespace sarfile::detail
