#pragma once

#include "Metadata.hpp"

#include <compare>
#include <cstddef>
#include <cstdint>
#include <fmt/format.h>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace cargoidx {

// Stable handle of a package within one catalog.
struct PackageIdx {
  std::uint32_t value{};

  bool operator==(const PackageIdx&) const = default;
  auto operator<=>(const PackageIdx&) const = default;
};

// Owns every manifest of a snapshot and maps package ids to handles.
class ManifestCatalog {
public:
  // A package id seen twice keeps the slot of its first occurrence, but the
  // later manifest replaces the earlier one.
  static ManifestCatalog build(std::vector<Manifest> packages);

  std::optional<PackageIdx> find(const PkgId& id) const;
  rs::Result<PackageIdx> lookup(const PkgId& id) const;

  const Manifest& get(PackageIdx idx) const { return manifests.at(idx.value); }
  std::size_t size() const noexcept { return manifests.size(); }
  std::vector<PackageIdx> indices() const;

private:
  std::vector<Manifest> manifests;
  std::unordered_map<PkgId, PackageIdx> byId;
};

struct ResolvedEdge {
  PackageIdx pkg;
  std::optional<std::string> name;
  std::vector<NodeDepKind> depKinds;

  // Edge name if present, else the extern name of the given kind record.
  const std::string& effectiveName(const NodeDepKind& depKind) const;
};

struct ResolvedNode {
  std::vector<std::string> features;
  std::vector<ResolvedEdge> deps;
};

// Resolved dependency graph keyed by package handle.
class ResolutionGraph {
public:
  // Fails when a node or edge names a package missing from the catalog, or
  // when an edge has no name through which it can be referenced.
  static rs::Result<ResolutionGraph> build(const ManifestCatalog& catalog,
                                           std::vector<Node> nodes);

  const ResolvedNode* find(PackageIdx idx) const;
  rs::Result<const ResolvedNode*> lookup(const ManifestCatalog& catalog,
                                         PackageIdx idx) const;

  std::size_t size() const noexcept { return nodeCount; }

private:
  std::vector<std::optional<ResolvedNode>> nodes;
  std::size_t nodeCount = 0;
};

} // namespace cargoidx

template <>
struct std::hash<cargoidx::PackageIdx> {
  std::size_t operator()(const cargoidx::PackageIdx& idx) const noexcept {
    return std::hash<std::uint32_t>{}(idx.value);
  }
};

template <>
struct fmt::formatter<cargoidx::PackageIdx> : fmt::formatter<std::uint32_t> {
  template <typename FormatContext>
  auto format(const cargoidx::PackageIdx& idx, FormatContext& ctx) const {
    return fmt::formatter<std::uint32_t>::format(idx.value, ctx);
  }
};
