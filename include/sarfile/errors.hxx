/**
 * @file errors.hxx
 * @brief Exception types raised by the sarfile library.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace sarfile {
/**
 * @brief Base class of every error raised by the library.
 *
 * None of these errors is retried by the library itself; retry policy, if
 * any, belongs to the Storage implementation supplied by the caller.
 */
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// The preamble does not start with the SAR magic constant.
class BadMagic : public Error {
public:
  using Error::Error;
};

/**
 * @brief The encoded header does not decode cleanly.
 *
 * Raised for a bad width selector, truncated integer tables or name bytes,
 * leftover bytes after the last name, or a name that is not valid UTF-8.
 */
class MalformedHeader : public Error {
public:
  using Error::Error;
};

/// Lookup of a member name or index that the archive does not contain.
class NotFound : public Error {
public:
  using Error::Error;
};

/// A seek request falls outside the bounds of a member.
class OutOfRange : public Error {
public:
  using Error::Error;
};

/// Write, truncate or line-oriented access on a read-only member view.
class Unsupported : public Error {
public:
  using Error::Error;
};

/// Packing was requested with zero members.
class EmptyArchive : public Error {
public:
  using Error::Error;
};

/// A path could not be opened, written, or a closed member view was used.
class StorageError : public Error {
public:
  using Error::Error;
};

/**
 * @brief A member's byte source failed while packing.
 *
 * Wraps the underlying failure and names the member whose bytes could not be
 * read in full.
 */
class SourceReadFailure : public Error {
public:
  SourceReadFailure(std::string member, const std::string &what);

  /// @brief Name of the member whose source failed.
  const std::string &member() const noexcept { return member_; }

private:
  std::string member_;
};
} // namespace sarfile
