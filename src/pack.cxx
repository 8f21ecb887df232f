#include <sarfile/detail/little-endian.hxx>
#include <sarfile/errors.hxx>
#include <sarfile/pack.hxx>

#include <boost/iostreams/constants.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <ios>
#include <vector>

namespace sarfile {
namespace {

void write_impl(std::ostream &out, const char *data, std::size_t n) {
  out.write(data, static_cast<std::streamsize>(n));
  if (!out)
    throw StorageError("failed writing archive output");
}

/**
 * @brief Copy exactly @p member.size bytes from its source into @p out.
 *
 * Failures opening or reading the source are reported as SourceReadFailure
 * for @p member; failures writing @p out are not.
 */
void copy_member_impl(std::ostream &out, const MemberEntry &member,
                      const ByteSource &source, std::vector<char> &buffer) {
  std::unique_ptr<std::istream> in;
  try {
    in = source(member.name);
  } catch (const Error &e) {
    throw SourceReadFailure(member.name, e.what());
  } catch (const std::ios_base::failure &e) {
    throw SourceReadFailure(member.name, e.what());
  }
  if (!in)
    throw SourceReadFailure(member.name, "source could not be opened");

  std::uint64_t copied = 0;
  while (copied < member.size) {
    const auto chunk =
        std::min<std::uint64_t>(buffer.size(), member.size - copied);
    std::streamsize got = 0;
    try {
      in->read(buffer.data(), static_cast<std::streamsize>(chunk));
      got = in->gcount();
    } catch (const std::ios_base::failure &e) {
      throw SourceReadFailure(member.name, e.what());
    } catch (const Error &e) {
      throw SourceReadFailure(member.name, e.what());
    }
    if (got <= 0)
      throw SourceReadFailure(
          member.name, fmt::format("expected {} bytes, source ended after {}",
                                   member.size, copied));
    write_impl(out, buffer.data(), static_cast<std::size_t>(got));
    copied += static_cast<std::uint64_t>(got);
  }
}

} // unnamed namespace

std::uint64_t pack(std::ostream &out, const std::vector<MemberEntry> &members,
                   const ByteSource &source, const PackOptions &options) {
  if (members.empty())
    throw EmptyArchive("cannot pack an archive without members");

  const Header header{members};
  const auto encoded = header.encode();

  std::string preamble(magic);
  detail::put_le(preamble, encoded.size(), 8);
  write_impl(out, preamble.data(), preamble.size());
  write_impl(out, encoded.data(), encoded.size());

  std::uint64_t written = preamble.size() + encoded.size();
  std::vector<char> buffer(boost::iostreams::default_device_buffer_size);
  for (std::size_t i = 0; i < members.size(); ++i) {
    copy_member_impl(out, members[i], source, buffer);
    written += members[i].size;
    spdlog::debug("packed member {}/{} '{}' ({} bytes)", i + 1,
                  members.size(), members[i].name, members[i].size);
    if (options.progress)
      options.progress(i + 1, members.size());
  }

  out.flush();
  if (!out)
    throw StorageError("failed flushing archive output");
  return written;
}

std::uint64_t pack_to_path(const std::string &out_path,
                           const PackSource &input, const PackOptions &options,
                           std::shared_ptr<Storage> storage) {
  if (input.members.empty())
    throw EmptyArchive(
        fmt::format("no members to pack into '{}'", out_path));

  auto out = storage->open_for_write(out_path);
  const auto written = pack(*out, input.members, input.source, options);
  out.reset();
  spdlog::info("packed {} members into '{}' ({} bytes)", input.members.size(),
               out_path, written);
  return written;
}
} // namespace sarfile
