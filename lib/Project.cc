#include "Project.hpp"

#include "Config.hpp"
#include "Index.hpp"
#include "Lockfile.hpp"
#include "Metadata.hpp"

#include <filesystem>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <utility>

namespace cargoidx {

rs::Result<Project> Project::init(const fs::path& configPath,
                                  const DiagSink& sink) {
  Config config = rs_try(Config::tryParse(configPath));
  rs_try(config.applyLogLevel());
  return fromConfig(std::move(config), sink);
}

rs::Result<Project> Project::fromConfig(Config config, const DiagSink& sink) {
  spdlog::debug("Loading metadata: {}", config.metadataPath.string());
  Metadata metadata = rs_try(Metadata::tryParse(config.metadataPath));
  Index index =
      rs_try(Index::create(std::move(metadata), config.visibilityOptions()));

  std::optional<Lockfile> lockfile;
  if (config.lockfilePath.has_value()) {
    spdlog::debug("Loading lockfile: {}", config.lockfilePath->string());
    lockfile = rs_try(Lockfile::load(*config.lockfilePath, sink));
  }
  return rs::Ok(
      Project(std::move(config), std::move(index), std::move(lockfile)));
}

const LockfilePackage* Project::lockfileEntry(const PackageIdx pkg) const {
  if (!lockfile_.has_value()) {
    return nullptr;
  }
  return lockfile_->find(index_.package(pkg));
}

} // namespace cargoidx
