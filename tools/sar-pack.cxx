#include "get-option.hxx"

#include <sarfile/archive.hxx>
#include <sarfile/errors.hxx>
#include <sarfile/file-sources.hxx>
#include <sarfile/pack.hxx>
#include <sarfile/tar-source.hxx>

#include <fmt/format.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <string>

namespace fs = std::filesystem;

namespace {

constexpr const char *usage =
    "usage: {} OUT_PATH IN_PATH [--only EXT]... [--exclude EXT]...\n"
    "Pack the files under the directory IN_PATH, or the regular files of\n"
    "IN_PATH when it is a .tar file, into the SAR archive OUT_PATH.";

void setup_logger() {
  auto term = std::make_shared<spdlog::sinks::stderr_color_sink_mt>(
      spdlog::color_mode::automatic);
  spdlog::default_logger()->sinks() = {term};
  spdlog::cfg::load_env_levels();
}

std::optional<std::set<std::string>> collect_option(std::span<char *> &args,
                                                    std::string_view option) {
  std::optional<std::set<std::string>> out;
  while (const char *value = sarfile::tools::get_option(args, option)) {
    if (!out)
      out.emplace();
    out->insert(value);
  }
  return out;
}

std::string lowercase_extension(const fs::path &path) {
  auto ext = path.extension().string();
  for (auto &c : ext)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return ext;
}

} // namespace

int main(int argc, char **argv) {
  setup_logger();

  std::span<char *> args{argv, argv + argc};
  const auto prog = fs::path{argv[0]}.filename().string();

  if (sarfile::tools::get_flag(args, "--help") ||
      sarfile::tools::get_flag(args, "-h")) {
    spdlog::info(fmt::runtime(usage), prog);
    return 0;
  }

  sarfile::ExtensionFilter filter;
  filter.only = collect_option(args, "--only");
  filter.exclude = collect_option(args, "--exclude");

  if (args.size() != 3) {
    spdlog::error(fmt::runtime(usage), prog);
    return 2;
  }
  const fs::path out_path{args[1]};
  const fs::path in_path{args[2]};

  if (lowercase_extension(in_path) == ".sar") {
    spdlog::error("cannot pack a SAR file; are the input and output paths "
                  "swapped?");
    return 2;
  }

  try {
    const auto input = lowercase_extension(in_path) == ".tar"
                           ? sarfile::from_tar(in_path.string())
                           : sarfile::from_directory(in_path, filter);

    sarfile::PackOptions options;
    options.progress = [](std::size_t completed, std::size_t total) {
      spdlog::debug("packed {}/{}", completed, total);
    };
    sarfile::pack_to_path(out_path.string(), input, options);
    spdlog::info("done packing '{}' to '{}'", in_path.string(),
                 out_path.string());

    // Reopen the result to make sure it reads back.
    const auto archive = sarfile::Archive::open(out_path.string());
    spdlog::info("packed file has {} member(s)", archive.size());
  } catch (const sarfile::Error &e) {
    spdlog::error("{}", e.what());
    return 1;
  }
  return 0;
}
