#include <sarfile/errors.hxx>
#include <sarfile/storage.hxx>

#include <boost/iostreams/device/file_descriptor.hpp>
#include <boost/iostreams/stream.hpp>

#include <fmt/format.h>

#include <ios>

namespace io = boost::iostreams;

namespace sarfile {
std::unique_ptr<std::istream>
LocalStorage::open_for_read(const std::string &path) {
  try {
    auto in = std::make_unique<io::stream<io::file_descriptor_source>>(
        path, std::ios::in | std::ios::binary);
    if (!in->is_open())
      throw StorageError(fmt::format("cannot open '{}' for reading", path));
    return in;
  } catch (const std::ios_base::failure &e) {
    throw StorageError(
        fmt::format("cannot open '{}' for reading: {}", path, e.what()));
  }
}

std::unique_ptr<std::ostream>
LocalStorage::open_for_write(const std::string &path) {
  try {
    auto out = std::make_unique<io::stream<io::file_descriptor_sink>>(
        path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out->is_open())
      throw StorageError(fmt::format("cannot open '{}' for writing", path));
    return out;
  } catch (const std::ios_base::failure &e) {
    throw StorageError(
        fmt::format("cannot open '{}' for writing: {}", path, e.what()));
  }
}

std::shared_ptr<Storage> default_storage() {
  static auto storage = std::make_shared<LocalStorage>();
  return storage;
}
} // namespace sarfile
