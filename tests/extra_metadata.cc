#include "helpers.hpp"

#include "ExtraMetadata.hpp"
#include "Index.hpp"
#include "Metadata.hpp"

#include <boost/ut.hpp>
#include <fmt/format.h>
#include <string>
#include <vector>

namespace {

using tests::json;

cargoidx::Index indexWithOwners(json metadata) {
  const std::string root = tests::pathId("root", "0.1.0");
  const std::string log = tests::registryId("log", "0.4.21");
  const std::string cc = tests::registryId("cc", "1.0.90");
  const json data = tests::snapshot(
      json::array({
          tests::package({ .id = root,
                           .name = "root",
                           .version = "0.1.0",
                           .source = nullptr,
                           .deps = { { .name = "log" },
                                     { .name = "cc", .kind = "build" } },
                           .metadata = std::move(metadata) }),
          tests::package({ .id = log, .name = "log", .version = "0.4.21" }),
          tests::package({ .id = cc, .name = "cc", .version = "1.0.90" }),
      }),
      json::array({
          tests::node(root,
                      json::array({ tests::nodeDep(log, "log"),
                                    tests::nodeDep(
                                        cc, "cc",
                                        json::array(
                                            { tests::depKind("build") })) })),
          tests::node(log),
          tests::node(cc),
      }),
      root);
  return cargoidx::Index::create(
             cargoidx::Metadata::tryFromJson(data).unwrap())
      .unwrap();
}

} // namespace

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "absent table yields an empty mapping"_test = [] {
    expect(indexWithOwners(nullptr).extraMetadata().unwrap().empty());
    expect(indexWithOwners(json::object()).extraMetadata().unwrap().empty());
  };

  "owners of direct dependencies"_test = [] {
    const auto index = indexWithOwners(json{
        { "third-party",
          { { "log", { { "oncall", "logging" } } },
            { "cc", { { "oncall", "toolchain" } } } } } });
    const auto extra = index.extraMetadata().unwrap();
    expect(extra.size() == 2);
    expect(extra.at("log").oncall == "logging");
    expect(extra.at("cc").oncall == "toolchain");
  };

  "custom table key"_test = [] {
    const auto index = indexWithOwners(
        json{ { "owners", { { "log", { { "oncall", "logging" } } } } } });
    expect(index.extraMetadata().unwrap().empty());
    expect(index.extraMetadata("owners").unwrap().size() == 1);
  };

  "unknown keys are reported together"_test = [] {
    const auto index = indexWithOwners(json{
        { "third-party",
          { { "serde", { { "oncall", "a" } } },
            { "log", { { "oncall", "b" } } },
            { "anyhow", { { "oncall", "c" } } } } } });
    const auto extra = index.extraMetadata();
    expect(extra.is_err());

    const auto err = extra.unwrap_err();
    expect(!err.malformed.has_value());
    expect(err.unknownPackages
           == std::vector<std::string>{ "anyhow", "serde" });
    expect(fmt::format("{}", err)
           == "Extra metadata for package(s): anyhow serde");
  };

  "a single unknown key is named exactly"_test = [] {
    const auto index = indexWithOwners(json{
        { "third-party", { { "rand", { { "oncall", "x" } } } } } });
    const auto err = index.extraMetadata().unwrap_err();
    expect(err.unknownPackages == std::vector<std::string>{ "rand" });
  };

  "malformed entries are reported"_test = [] {
    const auto index = indexWithOwners(
        json{ { "third-party", { { "log", { { "team", "x" } } } } } });
    const auto err = index.extraMetadata().unwrap_err();
    expect(err.malformed.has_value());
    expect(err.toString()
           == "Malformed package metadata: `log`: missing field `oncall`");

    const auto notTable =
        indexWithOwners(json{ { "third-party", 42 } }).extraMetadata();
    expect(notTable.is_err());
    expect(notTable.unwrap_err().malformed.has_value());
  };
}
