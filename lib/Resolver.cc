#include "Resolver.hpp"

#include "Catalog.hpp"
#include "Diag.hpp"
#include "Metadata.hpp"
#include "Platform.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <optional>
#include <rs/result.hpp>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cargoidx {

static constexpr std::array NORMAL_KINDS = {
  TargetKind::Lib,       TargetKind::Rlib,      TargetKind::Dylib,
  TargetKind::Staticlib, TargetKind::ProcMacro, TargetKind::Bin,
  TargetKind::Cdylib,
};
static constexpr std::array DEV_KINDS = {
  TargetKind::Bench,
  TargetKind::Test,
  TargetKind::Example,
};
static constexpr std::array BUILD_KINDS = {
  TargetKind::CustomBuild,
};

std::span<const TargetKind> applicableKinds(const DepKind kind) {
  switch (kind) {
  case DepKind::Normal:
    return NORMAL_KINDS;
  case DepKind::Dev:
    return DEV_KINDS;
  case DepKind::Build:
    return BUILD_KINDS;
  }
  __builtin_unreachable();
}

bool isApplicable(const DepKind kind, const ManifestTarget& target) {
  return std::ranges::any_of(applicableKinds(kind), [&](const TargetKind k) {
    return target.hasKind(k);
  });
}

rs::Result<std::vector<ResolvedDepRef>>
DependencyResolver::resolvedDeps(const PackageIdx pkg) const {
  const ResolvedNode* node = rs_try(graph.lookup(catalog, pkg));

  std::vector<ResolvedDepRef> deps;
  for (const ResolvedEdge& edge : node->deps) {
    for (const NodeDepKind& depKind : edge.depKinds) {
      deps.push_back(ResolvedDepRef{ .name = edge.effectiveName(depKind),
                                     .depKind = depKind,
                                     .package = edge.pkg });
    }
  }
  return rs::Ok(std::move(deps));
}

rs::Result<std::vector<const ManifestDep*>>
DependencyResolver::depsForTarget(const PackageIdx pkg,
                                  const std::size_t targetIdx) const {
  const Manifest& manifest = catalog.get(pkg);
  rs_ensure(targetIdx < manifest.targets.size(),
            "target #{} does not belong to package `{}`", targetIdx, manifest);

  const ManifestTarget& target = manifest.targets[targetIdx];
  std::vector<const ManifestDep*> deps;
  for (const ManifestDep& dep : manifest.dependencies) {
    if (isApplicable(dep.kind, target)) {
      deps.push_back(&dep);
    }
  }
  return rs::Ok(std::move(deps));
}

// Merges the platform conditions of every declaration of one dependency.
static std::optional<PlatformExpr>
combinePlatforms(const Manifest& pkg, const Manifest& dep,
                 const std::vector<const ManifestDep*>& decls,
                 const DiagSink& sink) {
  const DepKind firstKind = decls.front()->kind;
  if (std::ranges::any_of(decls, [&](const ManifestDep* decl) {
        return decl->kind != firstKind;
      })) {
    std::vector<std::string_view> kinds;
    for (const ManifestDep* decl : decls) {
      kinds.push_back(toString(decl->kind));
    }
    warn(sink,
         "{}: declarations of `{}` with different kinds ({}) share one "
         "platform guard",
         pkg, dep.name, fmt::join(kinds, ", "));
  }

  // An unconditional declaration wins over any platform condition.
  if (std::ranges::any_of(decls, [](const ManifestDep* decl) {
        return !decl->target.has_value();
      })) {
    return std::nullopt;
  }

  std::vector<PlatformPredicate> preds;
  for (const ManifestDep* decl : decls) {
    auto pred = PlatformPredicate::parse(*decl->target);
    if (pred.is_err()) {
      error(sink, "Failed to parse predicate for {}: {}", dep,
            pred.unwrap_err()->what());
      continue;
    }
    PlatformPredicate parsed = std::move(pred).unwrap();
    if (std::ranges::find(preds, parsed) == preds.end()) {
      preds.push_back(std::move(parsed));
    }
  }

  if (preds.empty()) {
    return std::nullopt;
  }
  if (preds.size() == 1) {
    return preds.front().toExpr();
  }
  return PlatformPredicate::any(std::move(preds)).toExpr();
}

rs::Result<std::vector<ResolvedDep>>
DependencyResolver::resolvedDepsForTarget(const PackageIdx pkg,
                                          const std::size_t targetIdx,
                                          const DiagSink& sink) const {
  const Manifest& manifest = catalog.get(pkg);

  // Dependencies can be declared repeatedly with different platforms.
  std::unordered_map<std::string_view, std::vector<const ManifestDep*>> decls;
  const std::vector<const ManifestDep*> applicable =
      rs_try(depsForTarget(pkg, targetIdx));
  for (const ManifestDep* dep : applicable) {
    decls[dep->name].push_back(dep);
  }

  std::unordered_map<std::string_view, std::optional<PlatformExpr>> platforms;
  std::vector<ResolvedDep> resolved;
  std::vector<ResolvedDepRef> refs = rs_try(resolvedDeps(pkg));
  for (ResolvedDepRef& ref : refs) {
    const Manifest& dep = catalog.get(ref.package);
    const auto group = decls.find(dep.name);
    if (group == decls.end()) {
      continue;
    }

    auto platform = platforms.find(dep.name);
    if (platform == platforms.end()) {
      platform =
          platforms
              .emplace(dep.name,
                       combinePlatforms(manifest, dep, group->second, sink))
              .first;
    }
    resolved.push_back(ResolvedDep{ .package = ref.package,
                                    .platform = platform->second,
                                    .rename = std::move(ref.name),
                                    .depKind = std::move(ref.depKind) });
  }
  return rs::Ok(std::move(resolved));
}

} // namespace cargoidx
