#pragma once

#include "Catalog.hpp"
#include "Diag.hpp"
#include "ExtraMetadata.hpp"
#include "Metadata.hpp"
#include "Resolver.hpp"
#include "Visibility.hpp"

#include <cstddef>
#include <optional>
#include <rs/result.hpp>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cargoidx {

// Immutable, queryable view of one metadata snapshot.
class Index {
public:
  static rs::Result<Index> create(Metadata metadata,
                                  const VisibilityOptions& options = {});

  PackageIdx root() const noexcept { return root_; }
  const Manifest& rootPackage() const { return catalog.get(root_); }
  const Manifest& package(PackageIdx pkg) const { return catalog.get(pkg); }
  std::optional<PackageIdx> findPackage(const PkgId& id) const {
    return catalog.find(id);
  }
  std::vector<PackageIdx> allPackages() const { return catalog.indices(); }

  bool isRootPackage(PackageIdx pkg) const noexcept { return pkg == root_; }
  bool isPublicPackage(PackageIdx pkg) const {
    return visibility.isPublicPackage(pkg);
  }
  bool isPublicTarget(PackageIdx pkg, TargetReq req) const {
    return visibility.isPublicTarget(pkg, req);
  }
  const Visibility& publicSurface() const noexcept { return visibility; }

  // Rename of the public library target, else the package name.
  std::string publicRuleName(PackageIdx pkg) const;
  // `name-version`, suffixed with `-rename` for a renamed public library.
  std::string privateRuleName(PackageIdx pkg) const;

  rs::Result<std::span<const std::string>>
  resolvedFeatures(PackageIdx pkg) const;

  DependencyResolver resolver() const { return { catalog, graph }; }

  rs::Result<std::vector<ResolvedDepRef>> resolvedDeps(PackageIdx pkg) const {
    return resolver().resolvedDeps(pkg);
  }
  rs::Result<std::vector<const ManifestDep*>>
  depsForTarget(PackageIdx pkg, std::size_t targetIdx) const {
    return resolver().depsForTarget(pkg, targetIdx);
  }
  rs::Result<std::vector<ResolvedDep>>
  resolvedDepsForTarget(PackageIdx pkg, std::size_t targetIdx,
                        const DiagSink& sink = logDiag) const {
    return resolver().resolvedDepsForTarget(pkg, targetIdx, sink);
  }

  rs::Result<ExtraMetadataMap, ExtraMetadataError>
  extraMetadata(std::string_view key = DEFAULT_EXTRA_METADATA_KEY) const {
    return loadExtraMetadata(rootPackage(), key);
  }

private:
  Index(ManifestCatalog catalog, ResolutionGraph graph, PackageIdx root,
        Visibility visibility);

  ManifestCatalog catalog;
  ResolutionGraph graph;
  PackageIdx root_;
  Visibility visibility;
};

} // namespace cargoidx
