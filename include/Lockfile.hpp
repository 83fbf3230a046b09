#pragma once

#include "Diag.hpp"
#include "Metadata.hpp"
#include "Semver.hpp"
#include "Source.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <toml.hpp>
#include <vector>

namespace cargoidx {

namespace fs = std::filesystem;

inline constexpr std::int64_t LOCKFILE_VERSION = 3;

struct LockfilePackage {
  std::string name;
  Version version;
  std::optional<Source> source;
  std::optional<std::string> checksum;
};

// Cargo.lock, with packages sorted by (name, version, source).
class Lockfile {
public:
  static rs::Result<Lockfile> load(const fs::path& path,
                                   const DiagSink& sink = logDiag);
  static rs::Result<Lockfile> tryFromToml(const toml::value& data,
                                          const DiagSink& sink = logDiag);

  // Exact match on (name, version, source); nullptr when absent.
  const LockfilePackage* find(const Manifest& manifest) const;

  std::int64_t version() const noexcept { return version_; }
  const std::vector<LockfilePackage>& packages() const noexcept {
    return packages_;
  }

private:
  Lockfile(std::int64_t version, std::vector<LockfilePackage> packages);

  std::int64_t version_;
  std::vector<LockfilePackage> packages_;
};

} // namespace cargoidx
