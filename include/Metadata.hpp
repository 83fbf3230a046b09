#pragma once

#include "Semver.hpp"
#include "Source.hpp"

#include <compare>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fmt/format.h>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace cargoidx {

namespace fs = std::filesystem;

// Opaque cargo package id, e.g.
// `registry+https://github.com/rust-lang/crates.io-index#serde@1.0.197`.
struct PkgId {
  std::string repr;

  bool operator==(const PkgId&) const = default;
  auto operator<=>(const PkgId&) const = default;
};

enum class DepKind : std::uint8_t {
  Normal,
  Dev,
  Build,
};

rs::Result<DepKind> parseDepKind(const std::optional<std::string>& kind);
std::string_view toString(DepKind kind);

enum class TargetKind : std::uint8_t {
  Lib,
  Rlib,
  Dylib,
  Staticlib,
  Cdylib,
  ProcMacro,
  Bin,
  Example,
  Test,
  Bench,
  CustomBuild,
};

rs::Result<TargetKind> parseTargetKind(std::string_view kind);
std::string_view toString(TargetKind kind);

// Dependency as declared in a package's Cargo.toml.
struct ManifestDep {
  std::string name;
  std::optional<std::string> rename;
  DepKind kind = DepKind::Normal;
  // Platform condition; absent means unconditional.
  std::optional<std::string> target;
  bool optional = false;
};

struct ManifestTarget {
  std::string name;
  std::vector<TargetKind> kinds;
  std::optional<fs::path> srcPath;

  bool hasKind(TargetKind kind) const;
};

struct Manifest {
  PkgId id;
  std::string name;
  Version version;
  std::optional<Source> source;
  std::vector<ManifestDep> dependencies;
  std::vector<ManifestTarget> targets;
  // Free-form `[package.metadata]` table; null when absent.
  nlohmann::json metadata;
  std::optional<fs::path> manifestPath;

  // `<name>-<version>`
  std::string toString() const;
};

// Which target of a dependency an edge refers to.
enum class TargetReq : std::uint8_t {
  Lib,
  EveryBin,
  Staticlib,
  Cdylib,
};

std::string_view toString(TargetReq req);

enum class ArtifactKind : std::uint8_t {
  Bin,
  Staticlib,
  Cdylib,
};

// One way a resolved edge is used (normal/dev/build, possibly per platform).
struct NodeDepKind {
  DepKind kind = DepKind::Normal;
  std::optional<std::string> target;
  std::optional<std::string> externName;
  std::optional<ArtifactKind> artifact;

  TargetReq targetReq() const;

  bool operator==(const NodeDepKind&) const = default;
};

struct NodeDep {
  PkgId pkg;
  std::optional<std::string> name;
  std::vector<NodeDepKind> depKinds;
};

struct Node {
  PkgId id;
  std::vector<NodeDep> deps;
  std::vector<std::string> features;
};

// `cargo metadata --format-version=1` output.
struct Metadata {
  std::vector<Manifest> packages;
  std::vector<Node> nodes;
  std::optional<PkgId> root;

  static rs::Result<Metadata> tryFromJson(const nlohmann::json& data);
  static rs::Result<Metadata> tryParse(const fs::path& path);
};

} // namespace cargoidx

template <>
struct std::hash<cargoidx::PkgId> {
  std::size_t operator()(const cargoidx::PkgId& id) const noexcept {
    return std::hash<std::string>{}(id.repr);
  }
};

template <>
struct fmt::formatter<cargoidx::PkgId> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const cargoidx::PkgId& id, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(id.repr, ctx);
  }
};

template <>
struct fmt::formatter<cargoidx::Manifest> : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(const cargoidx::Manifest& manifest, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(manifest.toString(), ctx);
  }
};

template <>
struct fmt::formatter<cargoidx::TargetReq> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const cargoidx::TargetReq& req, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(cargoidx::toString(req),
                                                    ctx);
  }
};
