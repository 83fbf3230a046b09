#include "Catalog.hpp"

#include "Metadata.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <vector>

namespace cargoidx {

ManifestCatalog ManifestCatalog::build(std::vector<Manifest> packages) {
  ManifestCatalog catalog;
  catalog.manifests.reserve(packages.size());
  for (Manifest& manifest : packages) {
    const auto found = catalog.byId.find(manifest.id);
    if (found != catalog.byId.end()) {
      spdlog::debug("duplicate package id `{}`; keeping the later manifest",
                    manifest.id);
      catalog.manifests[found->second.value] = std::move(manifest);
      continue;
    }

    const PackageIdx idx{ static_cast<std::uint32_t>(
        catalog.manifests.size()) };
    catalog.byId.emplace(manifest.id, idx);
    catalog.manifests.push_back(std::move(manifest));
  }
  return catalog;
}

std::optional<PackageIdx> ManifestCatalog::find(const PkgId& id) const {
  const auto found = byId.find(id);
  if (found == byId.end()) {
    return std::nullopt;
  }
  return found->second;
}

rs::Result<PackageIdx> ManifestCatalog::lookup(const PkgId& id) const {
  const auto idx = find(id);
  rs_ensure(idx.has_value(), "unknown package id `{}`", id);
  return rs::Ok(*idx);
}

std::vector<PackageIdx> ManifestCatalog::indices() const {
  std::vector<PackageIdx> all;
  all.reserve(manifests.size());
  for (std::size_t i = 0; i < manifests.size(); ++i) {
    all.push_back(PackageIdx{ static_cast<std::uint32_t>(i) });
  }
  return all;
}

const std::string&
ResolvedEdge::effectiveName(const NodeDepKind& depKind) const {
  if (name.has_value()) {
    return *name;
  }
  // Checked by ResolutionGraph::build.
  return *depKind.externName;
}

rs::Result<ResolutionGraph>
ResolutionGraph::build(const ManifestCatalog& catalog, std::vector<Node> nodes) {
  ResolutionGraph graph;
  graph.nodes.resize(catalog.size());

  for (Node& node : nodes) {
    const auto idx = catalog.find(node.id);
    rs_ensure(idx.has_value(), "resolve node `{}` has no package in metadata",
              node.id);

    ResolvedNode resolved;
    resolved.features = std::move(node.features);
    for (NodeDep& dep : node.deps) {
      const auto depIdx = catalog.find(dep.pkg);
      rs_ensure(depIdx.has_value(),
                "dependency `{}` of `{}` has no package in metadata", dep.pkg,
                node.id);
      for (const NodeDepKind& depKind : dep.depKinds) {
        rs_ensure(dep.name.has_value() || depKind.externName.has_value(),
                  "dependency `{}` of `{}` has neither a name nor an extern "
                  "name",
                  dep.pkg, node.id);
      }
      resolved.deps.push_back(ResolvedEdge{ .pkg = *depIdx,
                                            .name = std::move(dep.name),
                                            .depKinds =
                                                std::move(dep.depKinds) });
    }

    if (!graph.nodes[idx->value].has_value()) {
      ++graph.nodeCount;
    }
    graph.nodes[idx->value] = std::move(resolved);
  }

  // Every package reachable through an edge must itself be resolved.
  for (const auto& node : graph.nodes) {
    if (!node.has_value()) {
      continue;
    }
    for (const ResolvedEdge& edge : node->deps) {
      rs_ensure(graph.nodes[edge.pkg.value].has_value(),
                "dependency `{}` has no resolved node", catalog.get(edge.pkg));
    }
  }

  spdlog::trace("resolution graph: {} of {} packages resolved",
                graph.nodeCount, catalog.size());
  return rs::Ok(std::move(graph));
}

const ResolvedNode* ResolutionGraph::find(const PackageIdx idx) const {
  if (idx.value >= nodes.size() || !nodes[idx.value].has_value()) {
    return nullptr;
  }
  return &*nodes[idx.value];
}

rs::Result<const ResolvedNode*>
ResolutionGraph::lookup(const ManifestCatalog& catalog,
                        const PackageIdx idx) const {
  const ResolvedNode* node = find(idx);
  rs_ensure(node != nullptr, "package `{}` has no resolved node",
            catalog.get(idx));
  return rs::Ok(node);
}

} // namespace cargoidx
