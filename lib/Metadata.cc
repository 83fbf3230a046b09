#include "Metadata.hpp"

#include "Semver.hpp"
#include "Source.hpp"

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cargoidx {

using nlohmann::json;

static std::string joinPath(const std::string_view path,
                            const std::string_view key) {
  if (path.empty()) {
    return std::string(key);
  }
  return fmt::format("{}.{}", path, key);
}

// Drops the `[json.exception.type_error.302] ` prefix of nlohmann messages.
static std::string_view stripJsonPrefix(std::string_view what) {
  if (what.starts_with("[json.exception.")) {
    const std::size_t end = what.find("] ");
    if (end != std::string_view::npos) {
      what.remove_prefix(end + 2);
    }
  }
  return what;
}

template <typename T>
static rs::Result<T> tryGet(const json& val, const std::string& path) noexcept {
  try {
    return rs::Ok(val.get<T>());
  } catch (const json::exception& e) {
    rs_bail("{}: {}", path, stripJsonPrefix(e.what()));
  }
}

template <typename T>
static rs::Result<T> tryFind(const json& obj, const std::string& path,
                             const char* key) noexcept {
  rs_ensure(obj.is_object(), "{}: expected object, found {}", path,
            obj.type_name());
  const auto it = obj.find(key);
  rs_ensure(it != obj.end(), "{}: missing field `{}`", path, key);
  return tryGet<T>(*it, joinPath(path, key));
}

// Missing and null fields both decode to `std::nullopt`.
template <typename T>
static rs::Result<std::optional<T>>
tryFindOpt(const json& obj, const std::string& path, const char* key) noexcept {
  rs_ensure(obj.is_object(), "{}: expected object, found {}", path,
            obj.type_name());
  const auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return rs::Ok(std::optional<T>());
  }
  return rs::Ok(std::optional<T>(rs_try(tryGet<T>(*it, joinPath(path, key)))));
}

// Returns the array stored under `key`, or nullptr when it is absent or null.
static rs::Result<const json*> tryFindArray(const json& obj,
                                            const std::string& path,
                                            const char* key) noexcept {
  rs_ensure(obj.is_object(), "{}: expected object, found {}", path,
            obj.type_name());
  const auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return rs::Ok(static_cast<const json*>(nullptr));
  }
  rs_ensure(it->is_array(), "{}: expected array, found {}",
            joinPath(path, key), it->type_name());
  return rs::Ok(&*it);
}

rs::Result<DepKind> parseDepKind(const std::optional<std::string>& kind) {
  if (!kind.has_value() || *kind == "normal") {
    return rs::Ok(DepKind::Normal);
  } else if (*kind == "dev") {
    return rs::Ok(DepKind::Dev);
  } else if (*kind == "build") {
    return rs::Ok(DepKind::Build);
  }
  rs_bail("unknown dependency kind `{}`", *kind);
}

std::string_view toString(const DepKind kind) {
  switch (kind) {
  case DepKind::Normal:
    return "normal";
  case DepKind::Dev:
    return "dev";
  case DepKind::Build:
    return "build";
  }
  __builtin_unreachable();
}

static constexpr std::pair<std::string_view, TargetKind> TARGET_KINDS[] = {
  { "lib", TargetKind::Lib },
  { "rlib", TargetKind::Rlib },
  { "dylib", TargetKind::Dylib },
  { "staticlib", TargetKind::Staticlib },
  { "cdylib", TargetKind::Cdylib },
  { "proc-macro", TargetKind::ProcMacro },
  { "bin", TargetKind::Bin },
  { "example", TargetKind::Example },
  { "test", TargetKind::Test },
  { "bench", TargetKind::Bench },
  { "custom-build", TargetKind::CustomBuild },
};

rs::Result<TargetKind> parseTargetKind(const std::string_view kind) {
  for (const auto& [name, targetKind] : TARGET_KINDS) {
    if (name == kind) {
      return rs::Ok(targetKind);
    }
  }
  rs_bail("unknown target kind `{}`", kind);
}

std::string_view toString(const TargetKind kind) {
  for (const auto& [name, targetKind] : TARGET_KINDS) {
    if (targetKind == kind) {
      return name;
    }
  }
  __builtin_unreachable();
}

std::string_view toString(const TargetReq req) {
  switch (req) {
  case TargetReq::Lib:
    return "lib";
  case TargetReq::EveryBin:
    return "bin";
  case TargetReq::Staticlib:
    return "staticlib";
  case TargetReq::Cdylib:
    return "cdylib";
  }
  __builtin_unreachable();
}

bool ManifestTarget::hasKind(const TargetKind kind) const {
  return std::ranges::find(kinds, kind) != kinds.end();
}

std::string Manifest::toString() const {
  return fmt::format("{}-{}", name, version);
}

TargetReq NodeDepKind::targetReq() const {
  if (!artifact.has_value()) {
    return TargetReq::Lib;
  }
  switch (*artifact) {
  case ArtifactKind::Bin:
    return TargetReq::EveryBin;
  case ArtifactKind::Staticlib:
    return TargetReq::Staticlib;
  case ArtifactKind::Cdylib:
    return TargetReq::Cdylib;
  }
  __builtin_unreachable();
}

static rs::Result<ManifestDep> parseManifestDep(const json& val,
                                                const std::string& path) {
  ManifestDep dep;
  dep.name = rs_try(tryFind<std::string>(val, path, "name"));
  dep.rename = rs_try(tryFindOpt<std::string>(val, path, "rename"));
  const auto kind = rs_try(tryFindOpt<std::string>(val, path, "kind"));
  auto depKind = parseDepKind(kind);
  if (depKind.is_err()) {
    rs_bail("{}: {}", joinPath(path, "kind"), depKind.unwrap_err()->what());
  }
  dep.kind = depKind.unwrap();
  dep.target = rs_try(tryFindOpt<std::string>(val, path, "target"));
  dep.optional =
      rs_try(tryFindOpt<bool>(val, path, "optional")).value_or(false);
  return rs::Ok(std::move(dep));
}

static rs::Result<ManifestTarget> parseManifestTarget(const json& val,
                                                      const std::string& path) {
  ManifestTarget target;
  target.name = rs_try(tryFind<std::string>(val, path, "name"));
  const auto kinds = rs_try(tryFind<std::vector<std::string>>(val, path, "kind"));
  for (const std::string& kind : kinds) {
    auto targetKind = parseTargetKind(kind);
    if (targetKind.is_err()) {
      rs_bail("{}: {}", joinPath(path, "kind"),
              targetKind.unwrap_err()->what());
    }
    target.kinds.push_back(targetKind.unwrap());
  }
  if (const auto srcPath =
          rs_try(tryFindOpt<std::string>(val, path, "src_path"))) {
    target.srcPath = *srcPath;
  }
  return rs::Ok(std::move(target));
}

static rs::Result<Manifest> parseManifest(const json& val,
                                          const std::string& path) {
  Manifest manifest;
  manifest.id.repr = rs_try(tryFind<std::string>(val, path, "id"));
  manifest.name = rs_try(tryFind<std::string>(val, path, "name"));

  const auto version = rs_try(tryFind<std::string>(val, path, "version"));
  auto parsed = Version::parse(version);
  if (parsed.is_err()) {
    rs_bail("{}: {}", joinPath(path, "version"), parsed.unwrap_err()->what());
  }
  manifest.version = std::move(parsed).unwrap();

  if (auto source = rs_try(tryFindOpt<std::string>(val, path, "source"))) {
    manifest.source = Source::parse(std::move(*source));
  }

  if (const json* deps = rs_try(tryFindArray(val, path, "dependencies"))) {
    for (std::size_t i = 0; i < deps->size(); ++i) {
      manifest.dependencies.push_back(rs_try(parseManifestDep(
          (*deps)[i], fmt::format("{}.dependencies[{}]", path, i))));
    }
  }
  if (const json* targets = rs_try(tryFindArray(val, path, "targets"))) {
    for (std::size_t i = 0; i < targets->size(); ++i) {
      manifest.targets.push_back(rs_try(parseManifestTarget(
          (*targets)[i], fmt::format("{}.targets[{}]", path, i))));
    }
  }

  if (const auto it = val.find("metadata"); it != val.end()) {
    manifest.metadata = *it;
  }
  if (const auto manifestPath =
          rs_try(tryFindOpt<std::string>(val, path, "manifest_path"))) {
    manifest.manifestPath = *manifestPath;
  }
  return rs::Ok(std::move(manifest));
}

static rs::Result<ArtifactKind> parseArtifactKind(const std::string_view kind) {
  if (kind == "bin") {
    return rs::Ok(ArtifactKind::Bin);
  } else if (kind == "staticlib") {
    return rs::Ok(ArtifactKind::Staticlib);
  } else if (kind == "cdylib") {
    return rs::Ok(ArtifactKind::Cdylib);
  }
  rs_bail("unknown artifact kind `{}`", kind);
}

static rs::Result<NodeDepKind> parseNodeDepKind(const json& val,
                                                const std::string& path) {
  NodeDepKind depKind;
  const auto kind = rs_try(tryFindOpt<std::string>(val, path, "kind"));
  auto parsedKind = parseDepKind(kind);
  if (parsedKind.is_err()) {
    rs_bail("{}: {}", joinPath(path, "kind"),
            parsedKind.unwrap_err()->what());
  }
  depKind.kind = parsedKind.unwrap();
  depKind.target = rs_try(tryFindOpt<std::string>(val, path, "target"));
  depKind.externName =
      rs_try(tryFindOpt<std::string>(val, path, "extern_name"));

  if (const auto artifact =
          rs_try(tryFindOpt<std::string>(val, path, "artifact"))) {
    auto parsedArtifact = parseArtifactKind(*artifact);
    if (parsedArtifact.is_err()) {
      rs_bail("{}: {}", joinPath(path, "artifact"),
              parsedArtifact.unwrap_err()->what());
    }
    depKind.artifact = parsedArtifact.unwrap();
  }
  return rs::Ok(std::move(depKind));
}

static rs::Result<NodeDep> parseNodeDep(const json& val,
                                        const std::string& path) {
  NodeDep dep;
  dep.pkg.repr = rs_try(tryFind<std::string>(val, path, "pkg"));
  dep.name = rs_try(tryFindOpt<std::string>(val, path, "name"));
  if (dep.name.has_value() && dep.name->empty()) {
    // cargo writes an empty name for edges that only carry artifacts.
    dep.name.reset();
  }
  if (const json* kinds = rs_try(tryFindArray(val, path, "dep_kinds"))) {
    for (std::size_t i = 0; i < kinds->size(); ++i) {
      dep.depKinds.push_back(rs_try(parseNodeDepKind(
          (*kinds)[i], fmt::format("{}.dep_kinds[{}]", path, i))));
    }
  }
  return rs::Ok(std::move(dep));
}

static rs::Result<Node> parseNode(const json& val, const std::string& path) {
  Node node;
  node.id.repr = rs_try(tryFind<std::string>(val, path, "id"));
  if (const json* deps = rs_try(tryFindArray(val, path, "deps"))) {
    for (std::size_t i = 0; i < deps->size(); ++i) {
      node.deps.push_back(rs_try(
          parseNodeDep((*deps)[i], fmt::format("{}.deps[{}]", path, i))));
    }
  }
  node.features = rs_try(tryFindOpt<std::vector<std::string>>(val, path,
                                                              "features"))
                      .value_or(std::vector<std::string>{});
  return rs::Ok(std::move(node));
}

rs::Result<Metadata> Metadata::tryFromJson(const json& data) {
  rs_ensure(data.is_object(), "metadata must be a JSON object, found {}",
            data.type_name());

  Metadata metadata;
  const json* packages = rs_try(tryFindArray(data, "", "packages"));
  rs_ensure(packages != nullptr, "missing field `packages`");
  for (std::size_t i = 0; i < packages->size(); ++i) {
    metadata.packages.push_back(rs_try(
        parseManifest((*packages)[i], fmt::format("packages[{}]", i))));
  }

  const auto resolve = data.find("resolve");
  if (resolve == data.end() || resolve->is_null()) {
    spdlog::debug("metadata has no resolve section");
    return rs::Ok(std::move(metadata));
  }

  if (const json* nodes =
          rs_try(tryFindArray(*resolve, "resolve", "nodes"))) {
    for (std::size_t i = 0; i < nodes->size(); ++i) {
      metadata.nodes.push_back(rs_try(
          parseNode((*nodes)[i], fmt::format("resolve.nodes[{}]", i))));
    }
  }
  if (auto root = rs_try(tryFindOpt<std::string>(*resolve, "resolve", "root"))) {
    metadata.root = PkgId{ std::move(*root) };
  }

  spdlog::debug("decoded metadata: {} packages, {} nodes",
                metadata.packages.size(), metadata.nodes.size());
  return rs::Ok(std::move(metadata));
}

rs::Result<Metadata> Metadata::tryParse(const fs::path& path) {
  std::ifstream ifs(path);
  rs_ensure(ifs.is_open(), "failed to read `{}`", path.string());

  json data;
  try {
    data = json::parse(ifs);
  } catch (const json::parse_error& e) {
    rs_bail("failed to parse `{}`: {}", path.string(),
            stripJsonPrefix(e.what()));
  }

  auto metadata = tryFromJson(data);
  if (metadata.is_err()) {
    rs_bail("invalid metadata in `{}`: {}", path.string(),
            metadata.unwrap_err()->what());
  }
  return metadata;
}

} // namespace cargoidx
