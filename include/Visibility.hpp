#pragma once

#include "Catalog.hpp"
#include "Metadata.hpp"

#include <map>
#include <optional>
#include <rs/result.hpp>
#include <set>
#include <string>
#include <utility>

namespace cargoidx {

struct VisibilityOptions {
  // Whether the root package has real targets of its own, as opposed to
  // being a pseudo package that only gathers dependencies.
  bool rootIsReal = false;
  // Reject a public target recorded twice with different renames instead
  // of letting the later one win.
  bool strict = false;
};

// The public surface of a snapshot: the root package when real, and the
// first-order dependencies of the root.
class Visibility {
public:
  using TargetKey = std::pair<PackageIdx, TargetReq>;

  static rs::Result<Visibility> compute(const ManifestCatalog& catalog,
                                        const ResolutionGraph& graph,
                                        PackageIdx root,
                                        const VisibilityOptions& options);

  bool isPublicPackage(PackageIdx pkg) const {
    return publicPackages_.contains(pkg);
  }
  bool isPublicTarget(PackageIdx pkg, TargetReq req) const {
    return publicTargets_.contains({ pkg, req });
  }

  // Rename of the package's library target if it is public under one.
  std::optional<std::string> libRename(PackageIdx pkg) const;

  const std::set<PackageIdx>& publicPackages() const noexcept {
    return publicPackages_;
  }
  const std::map<TargetKey, std::optional<std::string>>&
  publicTargets() const noexcept {
    return publicTargets_;
  }

private:
  std::set<PackageIdx> publicPackages_;
  std::map<TargetKey, std::optional<std::string>> publicTargets_;
};

} // namespace cargoidx
