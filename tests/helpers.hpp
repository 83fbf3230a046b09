#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <nlohmann/json.hpp>
#include <random>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace tests {

namespace fs = std::filesystem;
using json = nlohmann::json;

inline constexpr const char* CRATES_IO =
    "registry+https://github.com/rust-lang/crates.io-index";

struct TempDir {
  fs::path path;

  TempDir()
      : path([] {
          const auto epoch =
              std::chrono::steady_clock::now().time_since_epoch();
          const auto ticks =
              std::chrono::duration_cast<std::chrono::nanoseconds>(epoch)
                  .count();
          const auto random =
              static_cast<std::uint64_t>(std::random_device{}());
          std::ostringstream oss;
          oss << "cargoidx-test-" << random << '-' << ticks;
          return fs::temp_directory_path() / oss.str();
        }()) {
    fs::create_directories(path);
  }

  ~TempDir() {
    if (path.empty()) {
      return;
    }
    std::error_code ec;
    fs::remove_all(path, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  TempDir(TempDir&& other) noexcept : path(std::move(other.path)) {
    other.path.clear();
  }

  TempDir& operator=(TempDir&& other) noexcept {
    if (this != &other) {
      path = std::move(other.path);
      other.path.clear();
    }
    return *this;
  }

  [[nodiscard]] fs::path operator/(const fs::path& relative) const {
    return path / relative;
  }
};

inline std::string readFile(const fs::path& file) {
  std::ifstream ifs(file);
  return std::string(std::istreambuf_iterator<char>(ifs), {});
}

inline void writeFile(const fs::path& file, const std::string& content) {
  std::ofstream ofs(file);
  ofs << content;
}

// Snapshot builders producing `cargo metadata --format-version=1` JSON.

inline std::string registryId(std::string_view name, std::string_view version) {
  return std::string(CRATES_IO) + "#" + std::string(name) + "@"
         + std::string(version);
}

inline std::string pathId(std::string_view name, std::string_view version) {
  return "path+file:///work/" + std::string(name) + "#" + std::string(version);
}

inline json target(std::string_view name,
                   std::initializer_list<std::string_view> kinds) {
  json kindArr = json::array();
  for (const std::string_view kind : kinds) {
    kindArr.push_back(std::string(kind));
  }
  return json{ { "name", std::string(name) },
               { "kind", std::move(kindArr) },
               { "crate_types", json::array() },
               { "src_path", "/work/src/" + std::string(name) + ".rs" } };
}

struct DepDecl {
  std::string name;
  json kind = nullptr;
  json target = nullptr;
  json rename = nullptr;
};

inline json dep(const DepDecl& decl) {
  return json{ { "name", decl.name },
               { "source", CRATES_IO },
               { "req", "*" },
               { "kind", decl.kind },
               { "rename", decl.rename },
               { "optional", false },
               { "uses_default_features", true },
               { "features", json::array() },
               { "target", decl.target } };
}

struct PackageDecl {
  std::string id;
  std::string name;
  std::string version = "1.0.0";
  json source = CRATES_IO;
  std::vector<DepDecl> deps;
  json targets = json::array();
  json metadata = nullptr;
};

inline json package(const PackageDecl& decl) {
  json deps = json::array();
  for (const DepDecl& d : decl.deps) {
    deps.push_back(dep(d));
  }
  json targets = decl.targets;
  if (targets.empty()) {
    targets.push_back(target(decl.name, { "lib" }));
  }
  return json{ { "id", decl.id },
               { "name", decl.name },
               { "version", decl.version },
               { "source", decl.source },
               { "dependencies", std::move(deps) },
               { "targets", std::move(targets) },
               { "features", json::object() },
               { "metadata", decl.metadata },
               { "manifest_path", "/work/" + decl.name + "/Cargo.toml" } };
}

inline json depKind(json kind = nullptr, json target = nullptr,
                    json externName = nullptr, json artifact = nullptr) {
  json record{ { "kind", std::move(kind) }, { "target", std::move(target) } };
  if (!externName.is_null()) {
    record["extern_name"] = std::move(externName);
  }
  if (!artifact.is_null()) {
    record["artifact"] = std::move(artifact);
  }
  return record;
}

inline json nodeDep(std::string_view pkg, std::string_view name,
                    json depKinds = json::array({ depKind() })) {
  return json{ { "pkg", std::string(pkg) },
               { "name", std::string(name) },
               { "dep_kinds", std::move(depKinds) } };
}

inline json node(std::string_view id, json deps = json::array(),
                 json features = json::array()) {
  json depIds = json::array();
  for (const json& d : deps) {
    depIds.push_back(d.at("pkg"));
  }
  return json{ { "id", std::string(id) },
               { "dependencies", std::move(depIds) },
               { "deps", std::move(deps) },
               { "features", std::move(features) } };
}

inline json snapshot(json packages, json nodes, json root) {
  return json{ { "packages", std::move(packages) },
               { "workspace_members", json::array() },
               { "resolve",
                 json{ { "nodes", std::move(nodes) }, { "root", root } } },
               { "version", 1 } };
}

} // namespace tests
