#include "Index.hpp"

#include "Catalog.hpp"
#include "Metadata.hpp"
#include "Visibility.hpp"

#include <fmt/format.h>
#include <rs/result.hpp>
#include <span>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

namespace cargoidx {

Index::Index(ManifestCatalog catalog, ResolutionGraph graph,
             const PackageIdx root, Visibility visibility)
    : catalog(std::move(catalog)), graph(std::move(graph)), root_(root),
      visibility(std::move(visibility)) {}

rs::Result<Index> Index::create(Metadata metadata,
                                const VisibilityOptions& options) {
  rs_ensure(metadata.root.has_value(), "missing root package");

  ManifestCatalog catalog = ManifestCatalog::build(std::move(metadata.packages));
  const auto root = catalog.find(*metadata.root);
  rs_ensure(root.has_value(),
            "couldn't identify unambiguous top-level package");
  spdlog::debug("top-level package: {}", catalog.get(*root));

  ResolutionGraph graph =
      rs_try(ResolutionGraph::build(catalog, std::move(metadata.nodes)));
  rs_try(graph.lookup(catalog, *root));

  Visibility visibility =
      rs_try(Visibility::compute(catalog, graph, *root, options));
  return rs::Ok(Index(std::move(catalog), std::move(graph), *root,
                      std::move(visibility)));
}

std::string Index::publicRuleName(const PackageIdx pkg) const {
  if (auto rename = visibility.libRename(pkg)) {
    return std::move(*rename);
  }
  return package(pkg).name;
}

std::string Index::privateRuleName(const PackageIdx pkg) const {
  const Manifest& manifest = package(pkg);
  if (const auto rename = visibility.libRename(pkg)) {
    return fmt::format("{}-{}", manifest, *rename);
  }
  return manifest.toString();
}

rs::Result<std::span<const std::string>>
Index::resolvedFeatures(const PackageIdx pkg) const {
  const ResolvedNode* node = rs_try(graph.lookup(catalog, pkg));
  return rs::Ok(std::span<const std::string>(node->features));
}

} // namespace cargoidx
