#include "Lockfile.hpp"

#include "Diag.hpp"
#include "Metadata.hpp"
#include "Semver.hpp"
#include "Source.hpp"
#include "TomlTry.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <toml.hpp>
#include <tuple>
#include <utility>
#include <vector>

namespace cargoidx {

static auto sortKey(const LockfilePackage& pkg) {
  return std::tie(pkg.name, pkg.version, pkg.source);
}

static auto sortKey(const Manifest& manifest) {
  return std::tie(manifest.name, manifest.version, manifest.source);
}

Lockfile::Lockfile(const std::int64_t version,
                   std::vector<LockfilePackage> packages)
    : version_(version), packages_(std::move(packages)) {
  std::ranges::sort(packages_, [](const LockfilePackage& lhs,
                                  const LockfilePackage& rhs) {
    return sortKey(lhs) < sortKey(rhs);
  });
}

static rs::Result<std::optional<std::string>>
findOptString(const toml::value& pkg, const char* key) {
  if (!pkg.contains(key)) {
    return rs::Ok(std::optional<std::string>());
  }
  return rs::Ok(
      std::optional<std::string>(rs_try(toml::try_find<std::string>(pkg, key))));
}

static rs::Result<LockfilePackage> parsePackage(const toml::value& pkg) {
  rs_ensure(pkg.is_table(), "[[package]] entries must be tables");

  LockfilePackage parsed;
  parsed.name = rs_try(toml::try_find<std::string>(pkg, "name"));
  parsed.version = rs_try(
      Version::parse(rs_try(toml::try_find<std::string>(pkg, "version"))));
  if (auto source = rs_try(findOptString(pkg, "source"))) {
    parsed.source = Source::parse(std::move(*source));
  }
  parsed.checksum = rs_try(findOptString(pkg, "checksum"));
  return rs::Ok(std::move(parsed));
}

rs::Result<Lockfile> Lockfile::tryFromToml(const toml::value& data,
                                           const DiagSink& sink) {
  const auto version = rs_try(toml::try_find<std::int64_t>(data, "version"));
  if (version != LOCKFILE_VERSION) {
    warn(sink, "Unrecognized Cargo.lock format version: {}", version);
  }

  std::vector<LockfilePackage> packages;
  if (data.contains("package")) {
    const auto entries =
        rs_try(toml::try_find<std::vector<toml::value>>(data, "package"));
    packages.reserve(entries.size());
    for (const toml::value& entry : entries) {
      packages.push_back(rs_try(parsePackage(entry)));
    }
  }

  spdlog::debug("loaded {} lockfile packages", packages.size());
  return rs::Ok(Lockfile(version, std::move(packages)));
}

rs::Result<Lockfile> Lockfile::load(const fs::path& path,
                                    const DiagSink& sink) {
  rs_ensure(fs::exists(path), "Failed to load {}", path.string());

  toml::value data;
  try {
    data = toml::parse(path);
  } catch (const std::exception& e) {
    rs_bail("Failed to parse {}: {}", path.string(), e.what());
  }

  auto lockfile = tryFromToml(data, sink);
  if (lockfile.is_err()) {
    rs_bail("Failed to parse {}: {}", path.string(),
            lockfile.unwrap_err()->what());
  }
  return lockfile;
}

const LockfilePackage* Lockfile::find(const Manifest& manifest) const {
  const auto key = sortKey(manifest);
  const auto found = std::lower_bound(
      packages_.begin(), packages_.end(), key,
      [](const LockfilePackage& pkg, const auto& wanted) {
        return sortKey(pkg) < wanted;
      });
  if (found == packages_.end() || sortKey(*found) != key) {
    return nullptr;
  }
  return &*found;
}

} // namespace cargoidx
