#include "Visibility.hpp"

#include "Catalog.hpp"
#include "Metadata.hpp"
#include "Resolver.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cargoidx {

static std::string describeRename(const std::optional<std::string>& rename) {
  return rename.has_value() ? fmt::format("`{}`", *rename) : "no rename";
}

rs::Result<Visibility> Visibility::compute(const ManifestCatalog& catalog,
                                           const ResolutionGraph& graph,
                                           const PackageIdx root,
                                           const VisibilityOptions& options) {
  const Manifest& rootPkg = catalog.get(root);

  // Renamed dependencies of the root, keyed by the name cargo resolves them
  // under (`-` normalized to `_`).
  std::unordered_map<std::string, std::string> renamed;
  for (const ManifestDep& dep : rootPkg.dependencies) {
    if (!dep.rename.has_value()) {
      continue;
    }
    std::string normalized = *dep.rename;
    std::ranges::replace(normalized, '-', '_');
    renamed.insert_or_assign(std::move(normalized), *dep.rename);
  }

  Visibility vis;
  const auto record = [&](const TargetKey& key,
                          std::optional<std::string> rename) -> rs::Result<void> {
    const auto [it, inserted] = vis.publicTargets_.try_emplace(key, rename);
    if (inserted) {
      return rs::Ok();
    }
    if (options.strict && it->second != rename) {
      rs_bail("public {} target of `{}` is reachable with {} and {}",
              key.second, catalog.get(key.first), describeRename(it->second),
              describeRename(rename));
    }
    it->second = std::move(rename);
    return rs::Ok();
  };

  const DependencyResolver resolver(catalog, graph);
  const std::vector<ResolvedDepRef> deps = rs_try(resolver.resolvedDeps(root));
  for (const ResolvedDepRef& dep : deps) {
    std::optional<std::string> rename;
    if (const auto found = renamed.find(dep.name); found != renamed.end()) {
      rename = found->second;
    }
    rs_try(record({ dep.package, dep.depKind.targetReq() }, std::move(rename)));
  }

  if (options.rootIsReal) {
    rs_try(record({ root, TargetReq::Lib }, std::nullopt));
    rs_try(record({ root, TargetReq::EveryBin }, std::nullopt));
  }

  for (const auto& [key, rename] : vis.publicTargets_) {
    vis.publicPackages_.insert(key.first);
  }

  spdlog::debug("{} public packages, {} public targets",
                vis.publicPackages_.size(), vis.publicTargets_.size());
  return rs::Ok(std::move(vis));
}

std::optional<std::string> Visibility::libRename(const PackageIdx pkg) const {
  const auto found = publicTargets_.find({ pkg, TargetReq::Lib });
  if (found == publicTargets_.end()) {
    return std::nullopt;
  }
  return found->second;
}

} // namespace cargoidx
