#include "helpers.hpp"

#include "Diag.hpp"
#include "Index.hpp"
#include "Metadata.hpp"
#include "Resolver.hpp"

#include <algorithm>
#include <boost/ut.hpp>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <utility>
#include <vector>

namespace {

using tests::json;

const std::string ROOT = tests::pathId("r", "0.1.0");
const std::string DEP_A = tests::registryId("a", "1.0.0");
const std::string DEP_B = tests::registryId("b", "1.0.0");

constexpr std::size_t LIB_TARGET = 0;
constexpr std::size_t TEST_TARGET = 1;

// R: a (normal), b (normal, cfg(windows)), a (dev, cfg(unix))
json exampleSnapshot(std::vector<tests::DepDecl> decls) {
  return tests::snapshot(
      json::array({
          tests::package({ .id = ROOT,
                           .name = "r",
                           .version = "0.1.0",
                           .source = nullptr,
                           .deps = std::move(decls),
                           .targets = json::array(
                               { tests::target("r", { "lib" }),
                                 tests::target("it", { "test" }) }) }),
          tests::package({ .id = DEP_A, .name = "a" }),
          tests::package({ .id = DEP_B, .name = "b" }),
      }),
      json::array({
          tests::node(
              ROOT,
              json::array({
                  tests::nodeDep(DEP_A, "a",
                                 json::array({ tests::depKind(),
                                               tests::depKind("dev") })),
                  tests::nodeDep(
                      DEP_B, "b",
                      json::array({ tests::depKind(nullptr, "cfg(windows)") })),
              })),
          tests::node(DEP_A),
          tests::node(DEP_B),
      }),
      ROOT);
}

std::vector<tests::DepDecl> exampleDecls() {
  return {
    { .name = "a" },
    { .name = "b", .target = "cfg(windows)" },
    { .name = "a", .kind = "dev", .target = "cfg(unix)" },
  };
}

cargoidx::Index buildIndex(const json& data) {
  return cargoidx::Index::create(
             cargoidx::Metadata::tryFromJson(data).unwrap())
      .unwrap();
}

std::vector<const cargoidx::ResolvedDep*>
depsOn(const std::vector<cargoidx::ResolvedDep>& deps,
       const cargoidx::Index& index, const std::string& name) {
  std::vector<const cargoidx::ResolvedDep*> found;
  for (const auto& dep : deps) {
    if (index.package(dep.package).name == name) {
      found.push_back(&dep);
    }
  }
  return found;
}

} // namespace

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;
  using cargoidx::DepKind;
  using cargoidx::Diagnostic;
  using cargoidx::TargetKind;

  "library target merges normal declarations only"_test = [] {
    const auto index = buildIndex(exampleSnapshot(exampleDecls()));
    cargoidx::DiagCollector diags;
    const auto deps =
        index.resolvedDepsForTarget(index.root(), LIB_TARGET, diags.sink())
            .unwrap();

    const auto a = depsOn(deps, index, "a");
    expect(!a.empty());
    for (const auto* dep : a) {
      expect(!dep->platform.has_value());
      expect(dep->rename == "a");
    }
    const auto b = depsOn(deps, index, "b");
    expect(b.size() == 1);
    expect(b[0]->platform == std::optional<std::string>("cfg(windows)"));
    expect(b[0]->depKind.target == std::optional<std::string>("cfg(windows)"));
    expect(diags.all().empty());
  };

  "test target sees dev declarations and never b"_test = [] {
    const auto index = buildIndex(exampleSnapshot(exampleDecls()));
    const auto deps =
        index.resolvedDepsForTarget(index.root(), TEST_TARGET).unwrap();

    const auto a = depsOn(deps, index, "a");
    expect(!a.empty());
    for (const auto* dep : a) {
      expect(dep->platform == std::optional<std::string>("cfg(unix)"));
    }
    expect(depsOn(deps, index, "b").empty());
  };

  "test target without dev declaration yields nothing"_test = [] {
    auto decls = exampleDecls();
    decls.pop_back();
    const auto index = buildIndex(exampleSnapshot(std::move(decls)));
    const auto deps =
        index.resolvedDepsForTarget(index.root(), TEST_TARGET).unwrap();
    expect(deps.empty());
  };

  "platform guards are unioned"_test = [] {
    const auto index = buildIndex(exampleSnapshot({
        { .name = "a", .target = "cfg(windows)" },
        { .name = "a", .target = "cfg(unix)" },
        { .name = "a", .target = "cfg(windows)" },
    }));
    const auto deps =
        index.resolvedDepsForTarget(index.root(), LIB_TARGET).unwrap();
    const auto a = depsOn(deps, index, "a");
    expect(!a.empty());
    expect(a[0]->platform
           == std::optional<std::string>("cfg(any(windows, unix))"));
  };

  "unconditional declaration absorbs guards in any order"_test = [] {
    for (const bool unconditionalFirst : { true, false }) {
      std::vector<tests::DepDecl> decls{
        { .name = "a", .target = "cfg(windows)" },
        { .name = "a" },
      };
      if (unconditionalFirst) {
        std::ranges::reverse(decls);
      }
      const auto index = buildIndex(exampleSnapshot(std::move(decls)));
      const auto deps =
          index.resolvedDepsForTarget(index.root(), LIB_TARGET).unwrap();
      for (const auto* dep : depsOn(deps, index, "a")) {
        expect(!dep->platform.has_value());
      }
    }
  };

  "bare triples become target predicates"_test = [] {
    const auto index = buildIndex(exampleSnapshot({
        { .name = "a", .target = "x86_64-unknown-linux-gnu" },
    }));
    const auto deps =
        index.resolvedDepsForTarget(index.root(), LIB_TARGET).unwrap();
    const auto a = depsOn(deps, index, "a");
    expect(!a.empty());
    expect(a[0]->platform
           == std::optional<std::string>(
               "cfg(target = \"x86_64-unknown-linux-gnu\")"));
  };

  "unparsable guards are reported and dropped"_test = [] {
    const auto index = buildIndex(exampleSnapshot({
        { .name = "a", .target = "cfg(all(unix" },
        { .name = "a", .target = "cfg(unix)" },
    }));
    cargoidx::DiagCollector diags;
    const auto deps =
        index.resolvedDepsForTarget(index.root(), LIB_TARGET, diags.sink())
            .unwrap();
    const auto a = depsOn(deps, index, "a");
    expect(!a.empty());
    expect(a[0]->platform == std::optional<std::string>("cfg(unix)"));
    expect(diags.count(Diagnostic::Level::Error) == 1);
    expect(diags.all().front().message.starts_with(
        "Failed to parse predicate for a-1.0.0: "));
  };

  "only unparsable guards leave the dependency unconditional"_test = [] {
    const auto index = buildIndex(exampleSnapshot({
        { .name = "a", .target = "cfg(" },
    }));
    cargoidx::DiagCollector diags;
    const auto deps =
        index.resolvedDepsForTarget(index.root(), LIB_TARGET, diags.sink())
            .unwrap();
    const auto a = depsOn(deps, index, "a");
    expect(!a.empty());
    expect(!a[0]->platform.has_value());
    expect(diags.count(Diagnostic::Level::Error) == 1);
  };

  "mixed kinds in one group are flagged"_test = [] {
    json data = exampleSnapshot({
        { .name = "a", .target = "cfg(unix)" },
        { .name = "a", .kind = "dev", .target = "cfg(windows)" },
    });
    // A target of both lib and test kind sees normal and dev declarations.
    data["packages"][0]["targets"].push_back(
        tests::target("both", { "lib", "test" }));
    const auto index = buildIndex(data);

    cargoidx::DiagCollector diags;
    const auto deps =
        index.resolvedDepsForTarget(index.root(), 2, diags.sink()).unwrap();
    const auto a = depsOn(deps, index, "a");
    expect(a.size() == 2);
    for (const auto* dep : a) {
      expect(dep->platform
             == std::optional<std::string>("cfg(any(unix, windows))"));
    }
    expect(diags.count(Diagnostic::Level::Warning) == 1);
    expect(diags.all().front().message
           == "r-0.1.0: declarations of `a` with different kinds (normal, "
              "dev) share one platform guard");
  };

  "deps for target follow the applicability table"_test = [] {
    const auto index = buildIndex(exampleSnapshot(exampleDecls()));
    const auto lib = index.depsForTarget(index.root(), LIB_TARGET).unwrap();
    expect(lib.size() == 2);
    for (const auto* dep : lib) {
      expect(dep->kind == DepKind::Normal);
    }
    const auto test = index.depsForTarget(index.root(), TEST_TARGET).unwrap();
    expect(test.size() == 1);
    expect(test[0]->kind == DepKind::Dev);

    const auto dev = cargoidx::applicableKinds(DepKind::Dev);
    expect(std::ranges::find(dev, TargetKind::Lib) == dev.end());
    const auto normal = cargoidx::applicableKinds(DepKind::Normal);
    expect(std::ranges::find(normal, TargetKind::Test) == normal.end());
    expect(std::ranges::find(normal, TargetKind::ProcMacro) != normal.end());
    const auto build = cargoidx::applicableKinds(DepKind::Build);
    expect(build.size() == 1);
    expect(build[0] == TargetKind::CustomBuild);
  };

  "foreign target indices are rejected"_test = [] {
    const auto index = buildIndex(exampleSnapshot(exampleDecls()));
    const auto deps = index.resolvedDepsForTarget(index.root(), 7);
    expect(deps.is_err());
    expect(rs::errMsg(deps) == "target #7 does not belong to package `r-0.1.0`");
  };

  "resolved deps flatten every kind record"_test = [] {
    const auto index = buildIndex(exampleSnapshot(exampleDecls()));
    const auto deps = index.resolvedDeps(index.root()).unwrap();
    expect(deps.size() == 3);
    expect(deps[0].name == "a");
    expect(deps[0].depKind.kind == DepKind::Normal);
    expect(deps[1].name == "a");
    expect(deps[1].depKind.kind == DepKind::Dev);
    expect(deps[2].name == "b");
  };
}
