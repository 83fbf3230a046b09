#pragma once

#include "Catalog.hpp"
#include "Diag.hpp"
#include "Metadata.hpp"
#include "Platform.hpp"

#include <cstddef>
#include <optional>
#include <rs/result.hpp>
#include <span>
#include <string>
#include <vector>

namespace cargoidx {

// One flattened resolved edge: a single dependency-kind record of an edge.
struct ResolvedDepRef {
  std::string name;
  NodeDepKind depKind;
  PackageIdx package;
};

// A resolved dependency of one build target.
struct ResolvedDep {
  PackageIdx package;
  // Union of the declared platform conditions; none is unconditional.
  std::optional<PlatformExpr> platform;
  // Name the dependent uses to refer to the dependency.
  std::string rename;
  // Passed through as resolved; its own `target` is not merged into
  // `platform`.
  NodeDepKind depKind;
};

// Target kinds that a dependency of the given kind can supply.
std::span<const TargetKind> applicableKinds(DepKind kind);
bool isApplicable(DepKind kind, const ManifestTarget& target);

class DependencyResolver {
public:
  DependencyResolver(const ManifestCatalog& catalog,
                     const ResolutionGraph& graph)
      : catalog(catalog), graph(graph) {}

  rs::Result<std::vector<ResolvedDepRef>> resolvedDeps(PackageIdx pkg) const;

  // Declared dependencies of `pkg` applicable to its `targetIdx`-th target.
  rs::Result<std::vector<const ManifestDep*>>
  depsForTarget(PackageIdx pkg, std::size_t targetIdx) const;

  rs::Result<std::vector<ResolvedDep>>
  resolvedDepsForTarget(PackageIdx pkg, std::size_t targetIdx,
                        const DiagSink& sink = logDiag) const;

private:
  const ManifestCatalog& catalog;
  const ResolutionGraph& graph;
};

} // namespace cargoidx
