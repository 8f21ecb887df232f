#include <sarfile/errors.hxx>
#include <sarfile/member-source.hxx>

#include <fmt/format.h>

#include <algorithm>
#include <utility>

namespace sarfile {
MemberSource::MemberSource(std::unique_ptr<std::istream> stream,
                           std::string name, std::uint64_t start,
                           std::uint64_t size)
    : handle_(std::make_shared<Handle>()), name_(std::move(name)),
      start_(start), size_(size) {
  if (!stream)
    throw StorageError(
        fmt::format("member '{}' has no underlying stream", name_));
  handle_->stream = std::move(stream);
  auto &in = this->stream();
  in.clear();
  in.seekg(static_cast<std::streamoff>(start_));
  if (!in)
    throw StorageError(fmt::format("cannot seek to member '{}' at offset {}",
                                   name_, start_));
}

std::istream &MemberSource::stream() const {
  if (!handle_->stream)
    throw StorageError(fmt::format("member '{}' is closed", name_));
  return *handle_->stream;
}

std::uint64_t MemberSource::tell() const {
  auto &in = stream();
  in.clear();
  auto pos = in.tellg();
  if (pos == std::streampos(-1))
    throw StorageError(
        fmt::format("cannot query position in member '{}'", name_));
  return static_cast<std::uint64_t>(static_cast<std::streamoff>(pos)) -
         start_;
}

std::streamsize MemberSource::read(char *s, std::streamsize n) {
  if (n <= 0)
    return 0;
  const auto remaining = size_ - tell();
  if (remaining == 0)
    return -1;

  const auto count = static_cast<std::streamsize>(
      std::min<std::uint64_t>(static_cast<std::uint64_t>(n), remaining));
  auto &in = stream();
  in.read(s, count);
  const auto got = in.gcount();
  if (got != count)
    throw StorageError(
        fmt::format("archive ends inside member '{}': {} of {} bytes read",
                    name_, got, count));
  return got;
}

std::string MemberSource::read(std::streamsize n) {
  const auto remaining = size_ - tell();
  const auto wanted =
      n < 0 ? remaining
            : std::min<std::uint64_t>(static_cast<std::uint64_t>(n), remaining);

  std::string out(static_cast<std::size_t>(wanted), '\0');
  std::size_t filled = 0;
  while (filled < out.size()) {
    auto got = read(out.data() + filled,
                    static_cast<std::streamsize>(out.size() - filled));
    if (got <= 0)
      break;
    filled += static_cast<std::size_t>(got);
  }
  out.resize(filled);
  return out;
}

std::streampos MemberSource::seek(boost::iostreams::stream_offset off,
                                  std::ios_base::seekdir way) {
  boost::iostreams::stream_offset base;
  switch (way) {
  case std::ios_base::beg:
    base = 0;
    break;
  case std::ios_base::cur:
    base = static_cast<boost::iostreams::stream_offset>(tell());
    break;
  case std::ios_base::end:
    base = static_cast<boost::iostreams::stream_offset>(size_);
    break;
  default:
    throw Unsupported(fmt::format("unknown seek direction in member '{}'",
                                  name_));
  }

  // base lies in [0, size_], so comparing before adding cannot overflow.
  const auto limit = static_cast<boost::iostreams::stream_offset>(size_);
  if (off < -base || off > limit - base)
    throw OutOfRange(fmt::format(
        "seek by {} from {} is outside member '{}' of {} bytes", off, base,
        name_, size_));
  const auto target = base + off;

  auto &in = stream();
  in.clear();
  in.seekg(static_cast<std::streamoff>(start_) +
           static_cast<std::streamoff>(target));
  if (!in)
    throw StorageError(fmt::format("cannot seek in member '{}'", name_));
  return boost::iostreams::offset_to_position(target);
}

void MemberSource::close() { handle_->stream.reset(); }

bool MemberSource::is_open() const { return handle_->stream != nullptr; }

std::streamsize MemberSource::write(const char *, std::streamsize) {
  throw Unsupported(
      fmt::format("member '{}' is read-only; writing is not supported", name_));
}

void MemberSource::truncate(std::uint64_t) {
  throw Unsupported(fmt::format(
      "member '{}' is read-only; truncating is not supported", name_));
}

std::string MemberSource::read_line() {
  throw Unsupported(fmt::format(
      "reading lines is not supported for member '{}'", name_));
}
} // namespace sarfile
