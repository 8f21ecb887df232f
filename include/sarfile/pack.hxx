/**
 * @file pack.hxx
 * @brief Writing SAR archives.
 */

#pragma once

#include <sarfile/header.hxx>
#include <sarfile/storage.hxx>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace sarfile {
/**
 * @brief Opens the payload of a member by name.
 *
 * The returned stream must yield at least as many bytes as the member's
 * declared size; bytes past that size are ignored.
 */
using ByteSource =
    std::function<std::unique_ptr<std::istream>(const std::string &name)>;

/// @brief Called with (completed, total) after each member is written.
using ProgressCallback =
    std::function<void(std::size_t completed, std::size_t total)>;

struct PackOptions {
  ProgressCallback progress; /**< @brief Optional; empty means no reports. */
};

/**
 * @brief The input of pack(): the ordered member table and where to read
 * each member's bytes.
 *
 * Produced by the directory, file-list and tar adapters.
 */
struct PackSource {
  std::vector<MemberEntry> members;
  ByteSource source;
};

/**
 * @brief Write an archive to @p out.
 *
 * Writes the magic, the header length, the encoded header and then every
 * member's payload in order. A failure leaves @p out incomplete.
 *
 * @param out Destination stream, positioned where the archive starts.
 * @param members Ordered member table without duplicate names.
 * @param source Opens each member's payload.
 * @param options Progress reporting.
 * @return std::uint64_t Total bytes written.
 * @throws EmptyArchive when @p members is empty; nothing is written.
 * @throws SourceReadFailure when a member's source cannot be opened or
 * yields fewer bytes than declared.
 * @throws StorageError when writing to @p out fails.
 */
std::uint64_t pack(std::ostream &out, const std::vector<MemberEntry> &members,
                   const ByteSource &source, const PackOptions &options = {});

/**
 * @brief Write an archive to @p out_path through @p storage.
 *
 * The output is opened only after @p input is known to be non-empty, so an
 * EmptyArchive failure creates no file.
 */
std::uint64_t pack_to_path(const std::string &out_path,
                           const PackSource &input,
                           const PackOptions &options = {},
                           std::shared_ptr<Storage> storage = default_storage());
} // namespace sarfile
