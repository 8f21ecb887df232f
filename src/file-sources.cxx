#include <sarfile/errors.hxx>
#include <sarfile/file-sources.hxx>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace sarfile {
namespace {

std::string normalise_extension_impl(const std::string &ext) {
  if (ext.empty() || ext.front() == '.')
    return ext;
  return "." + ext;
}

bool matches_impl(const std::set<std::string> &extensions,
                  const std::string &ext) {
  return std::any_of(extensions.begin(), extensions.end(),
                     [&](const std::string &candidate) {
                       return normalise_extension_impl(candidate) == ext;
                     });
}

/**
 * @brief ByteSource opening members as paths relative to @p base.
 */
ByteSource relative_source_impl(fs::path base,
                                std::shared_ptr<Storage> storage) {
  return [base = std::move(base),
          storage = std::move(storage)](const std::string &name) {
    return storage->open_for_read((base / fs::path(name)).string());
  };
}

std::uint64_t file_size_impl(const fs::path &file) {
  std::error_code ec;
  auto size = fs::file_size(file, ec);
  if (ec)
    throw StorageError(fmt::format("cannot stat '{}': {}", file.string(),
                                   ec.message()));
  return size;
}

/**
 * @brief Longest leading run of path components shared by @p a and @p b.
 */
fs::path common_parent_impl(const fs::path &a, const fs::path &b) {
  fs::path out;
  auto ia = a.begin();
  auto ib = b.begin();
  for (; ia != a.end() && ib != b.end() && *ia == *ib; ++ia, ++ib)
    out /= *ia;
  return out;
}

} // unnamed namespace

bool ExtensionFilter::accepts(const fs::path &file) const {
  const auto ext = file.extension().string();
  if (only && !matches_impl(*only, ext))
    return false;
  if (exclude && matches_impl(*exclude, ext))
    return false;
  return true;
}

PackSource from_directory(const fs::path &root, const ExtensionFilter &filter,
                          std::shared_ptr<Storage> storage) {
  std::error_code ec;
  if (!fs::is_directory(root, ec))
    throw StorageError(
        fmt::format("'{}' is not a directory", root.string()));

  PackSource out;
  try {
    for (const auto &entry : fs::recursive_directory_iterator(root)) {
      if (!entry.is_regular_file() || !filter.accepts(entry.path()))
        continue;
      auto name = entry.path().lexically_relative(root).generic_string();
      out.members.push_back({std::move(name), entry.file_size()});
    }
  } catch (const fs::filesystem_error &e) {
    throw StorageError(
        fmt::format("cannot walk '{}': {}", root.string(), e.what()));
  }

  std::sort(out.members.begin(), out.members.end(),
            [](const MemberEntry &a, const MemberEntry &b) {
              return a.name < b.name;
            });
  spdlog::debug("found {} files to pack under '{}'", out.members.size(),
                root.string());
  out.source = relative_source_impl(root, std::move(storage));
  return out;
}

PackSource from_files(const std::vector<fs::path> &files,
                      const ExtensionFilter &filter,
                      std::shared_ptr<Storage> storage) {
  std::vector<fs::path> kept;
  for (const auto &file : files) {
    std::error_code ec;
    if (!fs::is_regular_file(file, ec) || !filter.accepts(file))
      continue;
    kept.push_back(fs::absolute(file).lexically_normal());
  }

  fs::path base;
  if (!kept.empty()) {
    base = kept.front().parent_path();
    for (const auto &file : kept)
      base = common_parent_impl(base, file.parent_path());
  }

  PackSource out;
  out.members.reserve(kept.size());
  for (const auto &file : kept)
    out.members.push_back({file.lexically_relative(base).generic_string(),
                           file_size_impl(file)});
  out.source = relative_source_impl(base, std::move(storage));
  return out;
}
} // namespace sarfile
