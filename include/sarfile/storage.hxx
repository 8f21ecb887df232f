/**
 * @file storage.hxx
 * @brief Byte source/sink capability through which archives are opened and
 * written.
 */

#pragma once

#include <istream>
#include <memory>
#include <ostream>
#include <string>

namespace sarfile {
/**
 * @brief Opens streams for reading and writing by path.
 *
 * The library never names a concrete storage backend; callers that keep
 * archives somewhere other than the local filesystem supply their own
 * implementation. Every call returns a new, independently positioned stream.
 */
class Storage {
public:
  virtual ~Storage() = default;

  /**
   * @brief Open @p path for binary, seekable reading.
   * @throws StorageError when the path cannot be opened.
   */
  virtual std::unique_ptr<std::istream>
  open_for_read(const std::string &path) = 0;

  /**
   * @brief Create or truncate @p path for binary writing.
   * @throws StorageError when the path cannot be opened.
   */
  virtual std::unique_ptr<std::ostream>
  open_for_write(const std::string &path) = 0;
};

/**
 * @brief Storage over the local filesystem, backed by Boost.Iostreams file
 * descriptor devices.
 */
class LocalStorage : public Storage {
public:
  std::unique_ptr<std::istream> open_for_read(const std::string &path) override;
  std::unique_ptr<std::ostream>
  open_for_write(const std::string &path) override;
};

/// @brief Shared LocalStorage used when a caller passes no storage.
std::shared_ptr<Storage> default_storage();
} // namespace sarfile
