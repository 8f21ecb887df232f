#include <sarfile/detail/tar-header.hxx>
#include <sarfile/errors.hxx>
#include <sarfile/member-source.hxx>
#include <sarfile/tar-source.hxx>

#include <boost/iostreams/stream.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace io = boost::iostreams;

namespace sarfile {
namespace {

using detail::tar_block_size;
using detail::TarHeader;

/**
 * @brief Check whether a 512-byte tar block is entirely zeros.
 *
 * Tar archives are terminated by two consecutive zero blocks; the first one
 * is enough to know that no further entries follow.
 *
 * @param block Pointer to a 512-byte memory region to inspect.
 * @return true when every byte in the block is '\0'.
 */
bool is_zero_block_impl(const char *block) {
  return std::all_of(block, block + tar_block_size,
                     [](char c) { return c == '\0'; });
}

/**
 * @brief Decode a GNU base-256 number field.
 *
 * GNU tar stores numbers too large for the octal field, such as sizes of
 * 8 GiB and more, as big-endian two's complement with the high bit of the
 * first byte set as a marker.
 *
 * @param field First byte of the field.
 * @param size Field width in bytes.
 * @return std::optional<std::int64_t> The value, or nothing when it does not
 * fit in 64 bits.
 */
std::optional<std::int64_t> parse_base256_impl(const char *field,
                                               std::size_t size) {
  const auto bytes = reinterpret_cast<const unsigned char *>(field);
  // Bit 6 of the first byte is the sign once the marker bit is dropped.
  const bool negative = (bytes[0] & 0x40) != 0;
  const unsigned char fill = negative ? 0xff : 0x00;
  const auto first = static_cast<unsigned char>(
      negative ? (bytes[0] | 0x80) : (bytes[0] & 0x7f));

  // Leading bytes beyond the last eight may only repeat the sign.
  const std::size_t skip =
      size > sizeof(std::int64_t) ? size - sizeof(std::int64_t) : 0;
  for (std::size_t i = 0; i < skip; ++i)
    if ((i == 0 ? first : bytes[i]) != fill)
      return std::nullopt;

  const auto lead = skip == 0 ? first : bytes[skip];
  if (((lead ^ fill) & 0x80) != 0)
    return std::nullopt;

  std::uint64_t value = negative ? ~std::uint64_t{0} : 0;
  for (std::size_t i = skip; i < size; ++i)
    value = (value << 8) | (i == 0 ? first : bytes[i]);
  return static_cast<std::int64_t>(value);
}

/**
 * @brief Parse an octal ASCII number, stopping at the first NUL or after
 * @p n bytes. Leading spaces and other padding are skipped.
 */
std::uint64_t parse_octal_impl(const char *p, std::size_t n) {
  std::uint64_t result = 0;
  for (std::size_t i = 0; i < n && p[i]; ++i)
    if (p[i] >= '0' && p[i] <= '7')
      result = (result << 3) + static_cast<std::uint64_t>(p[i] - '0');
  return result;
}

/**
 * @brief Extract the payload size from a header, octal or base-256.
 */
std::uint64_t parse_file_size_impl(const TarHeader *tar,
                                   std::uint64_t header_offset) {
  if (static_cast<unsigned char>(tar->size[0]) & 0x80) {
    const auto size = parse_base256_impl(tar->size, sizeof(tar->size));
    if (!size || *size < 0)
      throw MalformedHeader(fmt::format(
          "tar header at offset {} has an invalid size", header_offset));
    return static_cast<std::uint64_t>(*size);
  }
  return parse_octal_impl(tar->size, sizeof(tar->size));
}

/**
 * @brief Text of a possibly non-NUL-terminated header field.
 */
std::string extract_field_impl(const char *field, std::size_t size) {
  return std::string(field, strnlen(field, size));
}

/**
 * @brief Full entry name: the ustar prefix joined to the name field.
 */
std::string extract_file_name_impl(const TarHeader *tar) {
  auto name = extract_field_impl(tar->name, sizeof(tar->name));
  if (std::memcmp(tar->magic, "ustar", 5) == 0 && tar->prefix[0] != '\0')
    name = extract_field_impl(tar->prefix, sizeof(tar->prefix)) + "/" + name;
  return name;
}

/**
 * @brief Header checksum check.
 *
 * The checksum is the sum of all header bytes with the checksum field read
 * as spaces. Historic writers summed signed chars, so both sums are
 * accepted.
 */
bool has_valid_checksum_impl(const TarHeader *tar) {
  const auto bytes = reinterpret_cast<const unsigned char *>(tar);
  const auto field_begin = offsetof(TarHeader, chksum);
  const auto field_end = field_begin + sizeof(tar->chksum);

  std::uint64_t unsigned_sum = 0;
  std::int64_t signed_sum = 0;
  for (std::size_t i = 0; i < tar_block_size; ++i) {
    const auto byte = (i >= field_begin && i < field_end) ? ' ' : bytes[i];
    unsigned_sum += static_cast<unsigned char>(byte);
    signed_sum += static_cast<signed char>(byte);
  }

  const auto expected = parse_octal_impl(tar->chksum, sizeof(tar->chksum));
  return expected == unsigned_sum ||
         static_cast<std::int64_t>(expected) == signed_sum;
}

/**
 * @brief Check whether a header entry represents a regular file.
 *
 * A typeflag of '0' or NUL marks a regular file; '7' (contiguous file) is
 * read as one too. Other typeflags are directories, links and devices.
 */
inline bool is_regular_file(const TarHeader *tar) {
  return tar->typeflag[0] == detail::tar_type_regular ||
         tar->typeflag[0] == detail::tar_type_regular_old ||
         tar->typeflag[0] == detail::tar_type_contiguous;
}

/**
 * @brief Drop leading "/" and "./" components, which carry no meaning
 * inside an archive.
 */
std::string normalise_name_impl(std::string name) {
  for (;;) {
    if (name.rfind("./", 0) == 0)
      name.erase(0, 2);
    else if (!name.empty() && name.front() == '/')
      name.erase(0, 1);
    else
      return name;
  }
}

/**
 * @brief Extended attributes of the next entry, from pax or GNU records.
 */
struct PendingAttributes {
  std::optional<std::string> path;
  std::optional<std::uint64_t> size;
};

/**
 * @brief Parse pax records of the form "<length> <key>=<value>\n".
 */
void parse_pax_records_impl(std::string_view data, PendingAttributes &out,
                            std::uint64_t header_offset) {
  while (!data.empty()) {
    const auto space = data.find(' ');
    if (space == std::string_view::npos || space == 0)
      break;

    std::size_t length = 0;
    for (auto c : data.substr(0, space)) {
      if (c < '0' || c > '9')
        throw MalformedHeader(fmt::format(
            "bad pax record length in tar entry at offset {}", header_offset));
      length = length * 10 + static_cast<std::size_t>(c - '0');
    }
    if (length <= space + 1 || length > data.size())
      throw MalformedHeader(fmt::format(
          "bad pax record length in tar entry at offset {}", header_offset));

    // Record body without the length prefix and the trailing newline.
    auto record = data.substr(space + 1, length - space - 2);
    data.remove_prefix(length);

    const auto eq = record.find('=');
    if (eq == std::string_view::npos)
      continue;
    const auto key = record.substr(0, eq);
    const auto value = record.substr(eq + 1);
    if (key == "path") {
      out.path = std::string(value);
    } else if (key == "size") {
      std::uint64_t size = 0;
      for (auto c : value)
        if (c >= '0' && c <= '9')
          size = size * 10 + static_cast<std::uint64_t>(c - '0');
      out.size = size;
    }
  }
}

/**
 * @brief Read the whole payload of a metadata entry (pax or GNU long name).
 */
std::string read_payload_impl(std::istream &in, std::uint64_t size,
                              std::uint64_t header_offset) {
  std::string data(static_cast<std::size_t>(size), '\0');
  in.read(data.data(), static_cast<std::streamsize>(size));
  if (static_cast<std::uint64_t>(in.gcount()) != size)
    throw MalformedHeader(fmt::format(
        "tar entry at offset {} is truncated", header_offset));
  return data;
}

std::uint64_t stream_size_impl(std::istream &in) {
  const auto start = in.tellg();
  in.seekg(0, std::ios_base::end);
  const auto end = in.tellg();
  in.seekg(start);
  if (start == std::streampos(-1) || end == std::streampos(-1) || !in)
    throw StorageError("tar stream is not seekable");
  return static_cast<std::uint64_t>(static_cast<std::streamoff>(end));
}

} // unnamed namespace

std::vector<TarEntry> index_tar(std::istream &in) {
  const auto total = stream_size_impl(in);
  std::uint64_t position =
      static_cast<std::uint64_t>(static_cast<std::streamoff>(in.tellg()));

  std::vector<TarEntry> entries;
  std::unordered_map<std::string, std::size_t> seen;
  PendingAttributes pending;
  char block[tar_block_size];

  while (position < total) {
    const auto header_offset = position;
    in.read(block, sizeof(block));
    if (static_cast<std::size_t>(in.gcount()) != sizeof(block))
      throw MalformedHeader(fmt::format(
          "tar header at offset {} is truncated", header_offset));
    position += tar_block_size;

    if (is_zero_block_impl(block))
      break;

    auto tar = reinterpret_cast<const TarHeader *>(block);
    if (!has_valid_checksum_impl(tar))
      throw MalformedHeader(fmt::format(
          "tar header at offset {} has a bad checksum", header_offset));

    auto size = parse_file_size_impl(tar, header_offset);
    const auto type = tar->typeflag[0];
    if (type != detail::tar_type_pax_extended &&
        type != detail::tar_type_pax_global && pending.size)
      size = *pending.size;

    if (size > total - position)
      throw MalformedHeader(fmt::format(
          "payload of tar entry at offset {} runs past the end of the archive",
          header_offset));
    const auto padded = (size + tar_block_size - 1) / tar_block_size *
                        tar_block_size;

    if (type == detail::tar_type_gnu_long_name) {
      auto name = read_payload_impl(in, size, header_offset);
      pending.path = extract_field_impl(name.data(), name.size());
    } else if (type == detail::tar_type_pax_extended) {
      parse_pax_records_impl(read_payload_impl(in, size, header_offset),
                             pending, header_offset);
    } else if (type == detail::tar_type_pax_global) {
      // Global records apply to the whole archive; none of them matter here.
    } else {
      auto name = normalise_name_impl(pending.path ? *pending.path
                                                   : extract_file_name_impl(tar));
      pending = {};

      if (!is_regular_file(tar)) {
        if (type != detail::tar_type_directory)
          spdlog::warn("skipping tar entry '{}' of type '{}'", name, type);
      } else if (name.empty()) {
        spdlog::warn("skipping unnamed tar entry at offset {}", header_offset);
      } else {
        TarEntry entry{name, position, size};
        auto [it, inserted] = seen.emplace(name, entries.size());
        if (inserted) {
          entries.push_back(std::move(entry));
        } else {
          spdlog::warn("tar entry '{}' appears more than once, keeping the "
                       "last one",
                       name);
          entries[it->second] = std::move(entry);
        }
        spdlog::debug("indexed tar entry '{}' ({} bytes at offset {})", name,
                      size, position);
      }
    }

    position += padded;
    in.clear();
    in.seekg(static_cast<std::streamoff>(position));
    if (!in)
      throw StorageError(
          fmt::format("cannot seek to tar offset {}", position));
  }

  return entries;
}

PackSource from_tar(const std::string &tar_path,
                    std::shared_ptr<Storage> storage) {
  auto entries = [&] {
    auto in = storage->open_for_read(tar_path);
    return index_tar(*in);
  }();

  auto locations =
      std::make_shared<std::unordered_map<std::string, TarEntry>>();
  PackSource out;
  out.members.reserve(entries.size());
  for (auto &entry : entries) {
    out.members.push_back({entry.name, entry.size});
    locations->emplace(entry.name, std::move(entry));
  }

  out.source = [tar_path, storage = std::move(storage),
                locations](const std::string &name)
      -> std::unique_ptr<std::istream> {
    auto it = locations->find(name);
    if (it == locations->end())
      throw NotFound(
          fmt::format("no regular file named '{}' in '{}'", name, tar_path));
    const auto &entry = it->second;
    return std::make_unique<io::stream<MemberSource>>(MemberSource(
        storage->open_for_read(tar_path), name, entry.offset, entry.size));
  };
  return out;
}
} // namespace sarfile
