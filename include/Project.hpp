#pragma once

#include "Catalog.hpp"
#include "Config.hpp"
#include "Diag.hpp"
#include "ExtraMetadata.hpp"
#include "Index.hpp"
#include "Lockfile.hpp"

#include <filesystem>
#include <optional>
#include <rs/result.hpp>
#include <utility>

namespace cargoidx {

namespace fs = std::filesystem;

// A config file together with the snapshot and lockfile it points to.
class Project {
public:
  static rs::Result<Project> init(const fs::path& configPath,
                                  const DiagSink& sink = logDiag);
  static rs::Result<Project> fromConfig(Config config,
                                        const DiagSink& sink = logDiag);

  const Config& config() const noexcept { return config_; }
  const Index& index() const noexcept { return index_; }
  const std::optional<Lockfile>& lockfile() const noexcept {
    return lockfile_;
  }

  // nullptr when no lockfile is configured or it has no exact entry.
  const LockfilePackage* lockfileEntry(PackageIdx pkg) const;

  // Ownership table under the configured `extra-metadata-key`.
  rs::Result<ExtraMetadataMap, ExtraMetadataError> extraMetadata() const {
    return index_.extraMetadata(config_.extraMetadataKey);
  }

private:
  Project(Config config, Index index, std::optional<Lockfile> lockfile)
      : config_(std::move(config)), index_(std::move(index)),
        lockfile_(std::move(lockfile)) {}

  Config config_;
  Index index_;
  std::optional<Lockfile> lockfile_;
};

} // namespace cargoidx
