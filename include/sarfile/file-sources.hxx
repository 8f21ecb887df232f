/**
 * @file file-sources.hxx
 * @brief Build a PackSource from files on disk.
 */

#pragma once

#include <sarfile/pack.hxx>
#include <sarfile/storage.hxx>

#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sarfile {
/**
 * @brief Allow-list and deny-list of file extensions.
 *
 * Extensions include the leading dot ("txt" is treated as ".txt"). A file
 * whose name has no extension, such as ".bashrc", has the empty extension.
 * The two lists are independent: a file is kept only when it passes both.
 */
struct ExtensionFilter {
  std::optional<std::set<std::string>> only;
  std::optional<std::set<std::string>> exclude;

  bool accepts(const std::filesystem::path &file) const;
};

/**
 * @brief Every regular file under @p root that passes @p filter.
 *
 * Members are named by their '/'-separated path relative to @p root and
 * sorted lexicographically by that name, so equal trees pack to equal
 * archives.
 *
 * @throws StorageError when @p root is not a directory.
 */
PackSource from_directory(const std::filesystem::path &root,
                          const ExtensionFilter &filter = {},
                          std::shared_ptr<Storage> storage = default_storage());

/**
 * @brief The regular files among @p files that pass @p filter.
 *
 * Members are named relative to the deepest directory containing all kept
 * files and keep the order of @p files.
 */
PackSource from_files(const std::vector<std::filesystem::path> &files,
                      const ExtensionFilter &filter = {},
                      std::shared_ptr<Storage> storage = default_storage());
} // namespace sarfile
