#include <sarfile/detail/little-endian.hxx>
#include <sarfile/errors.hxx>
#include <sarfile/header.hxx>

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace sarfile {
namespace {

/**
 * @brief Smallest table width, in bytes, able to represent @p max_value.
 */
std::size_t width_for_impl(std::uint64_t max_value) {
  if (max_value < (std::uint64_t{1} << 8))
    return 1;
  if (max_value < (std::uint64_t{1} << 16))
    return 2;
  if (max_value < (std::uint64_t{1} << 32))
    return 4;
  return 8;
}

bool is_valid_width_impl(std::size_t width) {
  return width == 1 || width == 2 || width == 4 || width == 8;
}

/**
 * @brief Check that @p s is well-formed UTF-8.
 *
 * Rejects overlong encodings, UTF-16 surrogates and code points above
 * U+10FFFF, matching what a strict decoder accepts.
 */
bool is_valid_utf8_impl(std::string_view s) {
  auto p = reinterpret_cast<const unsigned char *>(s.data());
  auto end = p + s.size();
  while (p < end) {
    auto c = *p;
    std::size_t extra;
    std::uint32_t cp;
    if (c < 0x80) {
      ++p;
      continue;
    } else if ((c & 0xe0) == 0xc0) {
      extra = 1;
      cp = c & 0x1f;
    } else if ((c & 0xf0) == 0xe0) {
      extra = 2;
      cp = c & 0x0f;
    } else if ((c & 0xf8) == 0xf0) {
      extra = 3;
      cp = c & 0x07;
    } else {
      return false;
    }

    if (static_cast<std::size_t>(end - p) <= extra)
      return false;
    for (std::size_t i = 1; i <= extra; ++i) {
      if ((p[i] & 0xc0) != 0x80)
        return false;
      cp = (cp << 6) | (p[i] & 0x3f);
    }

    static constexpr std::uint32_t min_for_length[] = {0, 0x80, 0x800,
                                                       0x10000};
    if (cp < min_for_length[extra] || cp > 0x10ffff ||
        (cp >= 0xd800 && cp <= 0xdfff))
      return false;
    p += extra + 1;
  }
  return true;
}

/**
 * @brief Sequential reader over the encoded header bytes.
 *
 * Every take fails with MalformedHeader instead of reading past the end.
 */
class Cursor {
public:
  explicit Cursor(std::string_view bytes) : bytes_(bytes) {}

  std::string_view take(std::uint64_t n, const char *what) {
    if (n > bytes_.size() - pos_)
      throw MalformedHeader(
          fmt::format("header truncated while reading {}: need {} bytes, "
                      "{} left",
                      what, n, bytes_.size() - pos_));
    auto out = bytes_.substr(pos_, static_cast<std::size_t>(n));
    pos_ += static_cast<std::size_t>(n);
    return out;
  }

  std::uint64_t take_le(std::size_t width, const char *what) {
    return detail::get_le(take(width, what).data(), width);
  }

  std::size_t remaining() const { return bytes_.size() - pos_; }

private:
  std::string_view bytes_;
  std::size_t pos_ = 0;
};

std::size_t take_width_impl(Cursor &cursor, const char *table) {
  auto width = static_cast<std::size_t>(cursor.take_le(1, "width selector"));
  if (!is_valid_width_impl(width))
    throw MalformedHeader(
        fmt::format("invalid {} width selector: {}", table, width));
  return width;
}

} // unnamed namespace

std::string Header::encode() const {
  if (members.empty())
    throw EmptyArchive("cannot encode a header without members");

  std::uint64_t max_size = 0;
  std::uint64_t max_name = 0;
  for (const auto &member : members) {
    if (!is_valid_utf8_impl(member.name))
      throw MalformedHeader(
          fmt::format("member name is not valid UTF-8: '{}'", member.name));
    max_size = std::max(max_size, member.size);
    max_name = std::max<std::uint64_t>(max_name, member.name.size());
  }

  const auto size_width = width_for_impl(max_size);
  const auto name_width = width_for_impl(max_name);

  std::string out;
  detail::put_le(out, size_width, 1);
  detail::put_le(out, name_width, 1);
  detail::put_le(out, members.size(), 8);
  for (const auto &member : members)
    detail::put_le(out, member.size, size_width);
  for (const auto &member : members)
    detail::put_le(out, member.name.size(), name_width);
  for (const auto &member : members)
    out += member.name;
  return out;
}

Header Header::decode(std::string_view bytes) {
  Cursor cursor(bytes);
  const auto size_width = take_width_impl(cursor, "size table");
  const auto name_width = take_width_impl(cursor, "name-length table");
  const auto count = cursor.take_le(8, "member count");

  // Both tables must fit in what is left, checked before any allocation.
  const auto per_member = static_cast<std::uint64_t>(size_width + name_width);
  if (count > cursor.remaining() / per_member)
    throw MalformedHeader(fmt::format(
        "header declares {} members but only {} bytes follow", count,
        cursor.remaining()));

  Header header;
  header.members.resize(static_cast<std::size_t>(count));
  for (auto &member : header.members)
    member.size = cursor.take_le(size_width, "size table");

  std::vector<std::uint64_t> name_lengths(header.members.size());
  for (auto &length : name_lengths)
    length = cursor.take_le(name_width, "name-length table");

  for (std::size_t i = 0; i < header.members.size(); ++i) {
    auto name = cursor.take(name_lengths[i], "member names");
    if (!is_valid_utf8_impl(name))
      throw MalformedHeader(
          fmt::format("name of member {} is not valid UTF-8", i));
    header.members[i].name.assign(name);
  }

  if (cursor.remaining() != 0)
    throw MalformedHeader(fmt::format("{} bytes left over after the last name",
                                      cursor.remaining()));
  return header;
}

std::vector<std::uint64_t> Header::offsets(std::uint64_t data_start) const {
  std::vector<std::uint64_t> out;
  out.reserve(members.size());
  auto offset = data_start + init_offset;
  for (const auto &member : members) {
    out.push_back(offset);
    offset += member.size;
  }
  return out;
}

Header Header::shard(std::size_t shard_id, std::size_t total_shards) const {
  if (total_shards == 0)
    throw std::invalid_argument("total_shards must be at least 1");

  const auto count = members.size();
  const auto block = (count + total_shards - 1) / total_shards;
  // Shards past the last member are empty.
  const auto start = (block == 0 || shard_id > count / block)
                         ? count
                         : shard_id * block;
  const auto end = std::min(start + block, count);

  Header out;
  out.init_offset = init_offset;
  for (std::size_t i = 0; i < start; ++i)
    out.init_offset += members[i].size;
  out.members.assign(members.begin() + start, members.begin() + end);
  return out;
}
} // namespace sarfile
