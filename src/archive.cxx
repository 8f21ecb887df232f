#include <sarfile/archive.hxx>
#include <sarfile/detail/little-endian.hxx>
#include <sarfile/errors.hxx>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <string_view>
#include <utility>

namespace sarfile {
namespace {

/**
 * @brief Read exactly @p n bytes, or fewer if the stream ends first.
 */
std::string read_up_to_impl(std::istream &in, std::uint64_t n) {
  std::string out;
  std::array<char, 64 * 1024> buffer;
  while (out.size() < n) {
    auto chunk = std::min<std::uint64_t>(buffer.size(), n - out.size());
    in.read(buffer.data(), static_cast<std::streamsize>(chunk));
    auto got = in.gcount();
    if (got <= 0)
      break;
    out.append(buffer.data(), static_cast<std::size_t>(got));
  }
  return out;
}

} // unnamed namespace

Archive::Archive(std::string path, std::shared_ptr<Storage> storage,
                 Header header, std::uint64_t data_offset)
    : path_(std::move(path)), storage_(std::move(storage)),
      header_(std::move(header)), data_offset_(data_offset),
      offsets_(header_.offsets(data_offset_)) {
  names_.reserve(header_.members.size());
  for (std::size_t i = 0; i < header_.members.size(); ++i) {
    const auto &name = header_.members[i].name;
    names_.push_back(name);
    if (!index_.emplace(name, i).second)
      spdlog::warn("{}: duplicate member name '{}' at index {}, lookups by "
                   "name resolve to index {}",
                   path_, name, i, index_.at(name));
  }
}

Archive Archive::open(const std::string &path,
                      std::shared_ptr<Storage> storage) {
  auto in = storage->open_for_read(path);

  const auto preamble = read_up_to_impl(*in, preamble_size);
  if (preamble.size() < magic.size() ||
      std::string_view(preamble).substr(0, magic.size()) != magic)
    throw BadMagic(fmt::format("'{}' is not a SAR archive", path));
  if (preamble.size() < preamble_size)
    throw MalformedHeader(
        fmt::format("'{}' ends inside the archive preamble", path));

  const auto header_size =
      detail::get_le(preamble.data() + magic.size(), preamble_size - magic.size());
  const auto encoded = read_up_to_impl(*in, header_size);
  if (encoded.size() != header_size)
    throw MalformedHeader(
        fmt::format("'{}' declares a {} byte header but only {} bytes follow",
                    path, header_size, encoded.size()));

  auto header = Header::decode(encoded);
  spdlog::debug("opened '{}': {} members, {} header bytes", path,
                header.members.size(), header_size);
  return Archive(path, std::move(storage), std::move(header),
                 preamble_size + header_size);
}

std::size_t Archive::index_of(const std::string &name) const {
  auto it = index_.find(name);
  if (it == index_.end())
    throw NotFound(fmt::format("no member named '{}' in '{}'", name, path_));
  return it->second;
}

bool Archive::contains(const std::string &name) const {
  return index_.find(name) != index_.end();
}

MemberSource Archive::get(std::size_t index) const {
  if (index >= size())
    throw NotFound(fmt::format("no member at index {} in '{}' ({} members)",
                               index, path_, size()));
  const auto &member = header_.members[index];
  return MemberSource(storage_->open_for_read(path_), member.name,
                      offsets_[index], member.size);
}

MemberSource Archive::get(const std::string &name) const {
  return get(index_of(name));
}

std::string Archive::read(std::size_t index) const {
  auto member = get(index);
  auto bytes = member.read();
  member.close();
  return bytes;
}

std::string Archive::read(const std::string &name) const {
  return read(index_of(name));
}

Archive Archive::shard(std::size_t shard_id, std::size_t total_shards) const {
  // Sharding an opened archive keeps the physical data offset: the shard's
  // init_offset accounts for the members in front of it.
  return Archive(path_, storage_, header_.shard(shard_id, total_shards),
                 data_offset_);
}
} // namespace sarfile
