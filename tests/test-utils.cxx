#include "test-utils.hxx"

#include <sarfile/detail/tar-header.hxx>

#include <fmt/format.h>
#include <picosha2.h>

#include <atomic>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iterator>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace sarfile::test {
namespace {

std::atomic<unsigned> temp_dir_counter{0};

void put_octal(char *field, std::size_t size, std::uint64_t value) {
  // size - 1 digits followed by a NUL.
  auto text = fmt::format("{:0{}o}", value, size - 1);
  std::memcpy(field, text.data(), size - 1);
  field[size - 1] = '\0';
}

void put_text(char *field, std::size_t size, const std::string &text) {
  if (text.size() > size)
    throw std::invalid_argument("tar field too long: " + text);
  std::memcpy(field, text.data(), text.size());
}

} // namespace

TempDir::TempDir() {
  std::random_device rd;
  path_ = fs::temp_directory_path() /
          fmt::format("sarfile-test-{:08x}-{}", rd(), temp_dir_counter++);
  fs::create_directories(path_);
}

TempDir::~TempDir() {
  std::error_code ec;
  fs::remove_all(path_, ec);
}

void write_file(const fs::path &path, std::string_view content) {
  if (path.has_parent_path())
    fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!out)
    throw std::runtime_error("cannot write " + path.string());
}

std::string read_file(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    throw std::runtime_error("cannot read " + path.string());
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>{});
}

std::unique_ptr<std::istream> memory_stream(std::string content) {
  return std::make_unique<std::istringstream>(
      std::move(content), std::ios::in | std::ios::binary);
}

ByteSource memory_source(std::map<std::string, std::string> contents) {
  return [contents = std::move(contents)](const std::string &name) {
    return memory_stream(contents.at(name));
  };
}

std::string sha256sum(std::istream &stream) {
  std::vector<std::uint8_t> hash(picosha2::k_digest_size);
  picosha2::hash256(std::istreambuf_iterator<char>(stream),
                    std::istreambuf_iterator<char>{}, hash.begin(), hash.end());
  return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

std::string sha256sum(std::string_view data) {
  return picosha2::hash256_hex_string(data.begin(), data.end());
}

std::string make_tar(const std::vector<TarFile> &files, bool terminate) {
  constexpr auto block = detail::tar_block_size;
  std::string out;
  for (const auto &file : files) {
    detail::TarHeader header;
    std::memset(&header, 0, sizeof(header));
    put_text(header.name, sizeof(header.name), file.name);
    put_octal(header.mode, sizeof(header.mode), 0644);
    put_octal(header.uid, sizeof(header.uid), 1000);
    put_octal(header.gid, sizeof(header.gid), 1000);
    if (file.base256_size) {
      auto size = static_cast<std::uint64_t>(file.content.size());
      header.size[0] = static_cast<char>(0x80);
      for (std::size_t i = sizeof(header.size) - 1; i > 0; --i) {
        header.size[i] = static_cast<char>(size & 0xff);
        size >>= 8;
      }
    } else {
      put_octal(header.size, sizeof(header.size), file.content.size());
    }
    put_octal(header.mtime, sizeof(header.mtime), 1700000000);
    header.typeflag[0] = file.type;
    std::memcpy(header.magic, "ustar", 6);
    std::memcpy(header.version, "00", 2);
    put_text(header.prefix, sizeof(header.prefix), file.prefix);

    std::memset(header.chksum, ' ', sizeof(header.chksum));
    std::uint64_t sum = 0;
    auto bytes = reinterpret_cast<const unsigned char *>(&header);
    for (std::size_t i = 0; i < sizeof(header); ++i)
      sum += bytes[i];
    if (file.bad_checksum)
      sum += 1;
    auto chksum = fmt::format("{:06o}", sum);
    std::memcpy(header.chksum, chksum.data(), 6);
    header.chksum[6] = '\0';

    out.append(reinterpret_cast<const char *>(&header), sizeof(header));
    out += file.content;
    out.append((block - file.content.size() % block) % block, '\0');
  }
  if (terminate)
    out.append(2 * block, '\0');
  return out;
}

std::string pax_record(std::string_view key, std::string_view value) {
  // The length prefix counts its own digits.
  const auto body = key.size() + value.size() + 3; // ' ', '=', '\n'
  auto length = body + 1;
  while (std::to_string(length).size() + body != length)
    ++length;
  return fmt::format("{} {}={}\n", length, key, value);
}
} // namespace sarfile::test
