/**
 * @file tar-source.hxx
 * @brief Build a PackSource from the regular files of a tar archive.
 */

#pragma once

#include <sarfile/pack.hxx>
#include <sarfile/storage.hxx>

#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace sarfile {
/**
 * @brief A regular file found in a tar archive.
 */
struct TarEntry {
  std::string name;     /**< @brief Full entry name, without leading "./". */
  std::uint64_t offset; /**< @brief Offset of the payload in the tar file. */
  std::uint64_t size;   /**< @brief Payload size in bytes. */

  bool operator==(const TarEntry &) const = default;
};

/**
 * @brief List the regular files of the tar archive read from @p in.
 *
 * Understands POSIX ustar headers (with the name prefix field), GNU
 * long-name records and base-256 sizes, and pax extended headers carrying
 * @c path or @c size. Directories, links and other special entries are
 * skipped. Indexing stops at the first all-zero block or at a clean end of
 * file on a block boundary. A name appearing more than once keeps only its
 * last entry, as extracting the archive would.
 *
 * @param in Binary, seekable stream positioned at the start of the archive.
 * @return std::vector<TarEntry> Regular files in archive order.
 * @throws MalformedHeader on a bad header checksum, a truncated header or a
 * payload that runs past the end of the stream.
 */
std::vector<TarEntry> index_tar(std::istream &in);

/**
 * @brief Index @p tar_path and serve each member's bytes straight out of it.
 *
 * Each call of the returned ByteSource opens @p tar_path anew through
 * @p storage and bounds it to the member's payload with a MemberSource.
 */
PackSource from_tar(const std::string &tar_path,
                    std::shared_ptr<Storage> storage = default_storage());
} // namespace sarfile
