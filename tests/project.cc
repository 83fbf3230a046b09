#include "helpers.hpp"

#include "Config.hpp"
#include "Project.hpp"

#include <boost/ut.hpp>
#include <cstdlib>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

namespace {

using tests::json;

const std::string ROOT = tests::pathId("root", "0.1.0");
const std::string SERDE = tests::registryId("serde", "1.0.200");

json projectSnapshot(json metadata = nullptr) {
  return tests::snapshot(
      json::array({
          tests::package({ .id = ROOT,
                           .name = "root",
                           .version = "0.1.0",
                           .source = nullptr,
                           .deps = { { .name = "serde" } },
                           .metadata = std::move(metadata) }),
          tests::package({ .id = SERDE, .name = "serde", .version = "1.0.200" }),
      }),
      json::array({ tests::node(ROOT,
                                json::array({ tests::nodeDep(SERDE, "serde") })),
                    tests::node(SERDE) }),
      ROOT);
}

constexpr const char* LOCKFILE = R"(version = 3

[[package]]
name = "root"
version = "0.1.0"

[[package]]
name = "serde"
version = "1.0.200"
source = "registry+https://github.com/rust-lang/crates.io-index"
)";

} // namespace

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;
  using cargoidx::Config;
  using cargoidx::Project;

  "config defaults"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / Config::FILE_NAME, "");
    const auto config = Config::tryParse(tmp / Config::FILE_NAME).unwrap();
    expect(!config.includeTopLevel);
    expect(!config.strictPublicTargets);
    expect(config.extraMetadataKey == "third-party");
    expect(config.metadataPath == tmp / "metadata.json");
    expect(!config.lockfilePath.has_value());
    expect(config.logLevel == spdlog::level::info);
  };

  "config values"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / Config::FILE_NAME, R"(
[index]
include-top-level = true
strict-public-targets = true
extra-metadata-key = "owners"

[paths]
metadata = "out/metadata.json"
lockfile = "/abs/Cargo.lock"

[log]
level = "debug"
)");
    const auto config = Config::tryParse(tmp / Config::FILE_NAME).unwrap();
    expect(config.includeTopLevel);
    expect(config.strictPublicTargets);
    expect(config.extraMetadataKey == "owners");
    expect(config.metadataPath == tmp / "out" / "metadata.json");
    expect(config.lockfilePath == cargoidx::fs::path("/abs/Cargo.lock"));
    expect(config.logLevel == spdlog::level::debug);

    const auto options = config.visibilityOptions();
    expect(options.rootIsReal);
    expect(options.strict);
  };

  "config errors"_test = [] {
    const tests::TempDir tmp;
    const auto path = tmp / Config::FILE_NAME;
    expect(rs::errMsg(Config::tryParse(path)) == "Failed to load " + path.string());

    tests::writeFile(path, "[log]\nlevel = \"loud\"\n");
    expect(rs::errMsg(Config::tryParse(path))
           == "Failed to parse " + path.string() + ": unknown log level: `loud`");

    tests::writeFile(path, "[index]\ninclude-top-level = \"yes\"\n");
    expect(Config::tryParse(path).is_err());

    tests::writeFile(path, "index = 1\n");
    expect(Config::tryParse(path).is_err());
  };

  "log level from the environment wins"_test = [] {
    Config config;
    config.logLevel = spdlog::level::warn;

    ::setenv(Config::LOG_ENV, "trace", 1);
    expect(config.applyLogLevel().is_ok());
    expect(spdlog::get_level() == spdlog::level::trace);

    ::setenv(Config::LOG_ENV, "bogus", 1);
    expect(config.applyLogLevel().is_err());

    ::unsetenv(Config::LOG_ENV);
    expect(config.applyLogLevel().is_ok());
    expect(spdlog::get_level() == spdlog::level::warn);
  };

  "project loads snapshot and lockfile"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "metadata.json", projectSnapshot().dump());
    tests::writeFile(tmp / "Cargo.lock", LOCKFILE);
    tests::writeFile(tmp / Config::FILE_NAME,
                     "[paths]\nlockfile = \"Cargo.lock\"\n"
                     "[log]\nlevel = \"warn\"\n");

    const auto project = Project::init(tmp / Config::FILE_NAME).unwrap();
    const auto& index = project.index();
    expect(index.rootPackage().name == "root");
    expect(project.lockfile().has_value());

    const auto serde = index.findPackage(cargoidx::PkgId{ SERDE }).value();
    expect(index.isPublicPackage(serde));
    const auto* entry = project.lockfileEntry(serde);
    expect(entry != nullptr);
    expect(entry->name == "serde");
    expect(project.lockfileEntry(index.root()) != nullptr);
  };

  "project without lockfile"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "metadata.json", projectSnapshot().dump());
    tests::writeFile(tmp / Config::FILE_NAME, "[index]\ninclude-top-level = true\n");

    const auto project = Project::init(tmp / Config::FILE_NAME).unwrap();
    expect(!project.lockfile().has_value());
    expect(project.lockfileEntry(project.index().root()) == nullptr);
    expect(project.index().isPublicPackage(project.index().root()));
  };

  "project reads the configured ownership table"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(
        tmp / "metadata.json",
        projectSnapshot(
            json{ { "owners", { { "serde", { { "oncall", "serde-team" } } } } },
                  { "third-party", { { "ghost", { { "oncall", "x" } } } } } })
            .dump());
    tests::writeFile(tmp / Config::FILE_NAME,
                     "[index]\nextra-metadata-key = \"owners\"\n");

    const auto project = Project::init(tmp / Config::FILE_NAME).unwrap();
    const auto extra = project.extraMetadata();
    expect(extra.is_ok());
    const auto owners = extra.unwrap();
    expect(owners.size() == 1);
    expect(owners.at("serde").oncall == "serde-team");

    // The default key still sees the other table.
    expect(project.index().extraMetadata().is_err());
  };

  "project reports a missing snapshot"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / Config::FILE_NAME, "");
    const auto project = Project::init(tmp / Config::FILE_NAME);
    expect(project.is_err());
    expect(rs::errMsg(project).starts_with("failed to read `"));
  };
}
