#include "smoke/runner/staged_suite.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace smoke::runner {

namespace fs = std::filesystem;

StagedSuite::StagedSuite(const fs::path& spec, fs::path dest)
    : dest_(std::move(dest)) {
  fs::path source = fs::is_directory(spec) ? spec : spec.parent_path();

  // Leftover from an interrupted run
  fs::remove_all(dest_);
  try {
    fs::create_directories(dest_);
    fs::copy(
        source, dest_,
        fs::copy_options::recursive | fs::copy_options::overwrite_existing);
  } catch (const fs::filesystem_error&) {
    std::error_code ec;
    fs::remove_all(dest_, ec);
    throw;
  }
  spdlog::debug("staged {} -> {}", source.string(), dest_.string());
}

StagedSuite::~StagedSuite() {
  std::error_code ec;
  fs::remove_all(dest_, ec);
  if (ec) {
    spdlog::warn(
        "could not remove staged suite {}: {}", dest_.string(), ec.message());
  }
}

auto IsWithin(const fs::path& path, const fs::path& dir) -> bool {
  auto rel = path.lexically_normal().lexically_relative(dir.lexically_normal());
  return !rel.empty() && *rel.begin() != "..";
}

}  // namespace smoke::runner
