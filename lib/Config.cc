#include "Config.hpp"

#include "TomlTry.hpp"

#include <array>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <toml.hpp>
#include <utility>

namespace cargoidx {

// Values of a key that is absent fall back to the default; a key of the
// wrong type is an error.
template <typename T>
static rs::Result<T> findOr(const toml::value& data, const char* table,
                            const char* key, T defaultValue) {
  if (!data.contains(table)) {
    return rs::Ok(std::move(defaultValue));
  }
  const toml::value& section = data.at(table);
  rs_ensure(section.is_table(), "`{}` must be a table", table);
  if (!section.contains(key)) {
    return rs::Ok(std::move(defaultValue));
  }
  return toml::try_find<T>(data, table, key);
}

static fs::path resolvePath(const fs::path& baseDir, const fs::path& path) {
  if (path.is_absolute() || baseDir.empty()) {
    return path;
  }
  return (baseDir / path).lexically_normal();
}

rs::Result<spdlog::level::level_enum> parseLogLevel(const std::string& level) {
  using spdlog::level::level_enum;
  static constexpr std::array<std::pair<std::string_view, level_enum>, 7>
      levels{ {
          { "trace", level_enum::trace },
          { "debug", level_enum::debug },
          { "info", level_enum::info },
          { "warn", level_enum::warn },
          { "error", level_enum::err },
          { "critical", level_enum::critical },
          { "off", level_enum::off },
      } };

  for (const auto& [name, value] : levels) {
    if (name == level) {
      return rs::Ok(value);
    }
  }
  rs_bail("unknown log level: `{}`", level);
}

rs::Result<Config> Config::tryFromToml(const toml::value& data,
                                       const fs::path& baseDir) noexcept {
  rs_ensure(data.is_table(), "config must be a table");

  Config config;
  config.includeTopLevel =
      rs_try(findOr<bool>(data, "index", "include-top-level", false));
  config.strictPublicTargets =
      rs_try(findOr<bool>(data, "index", "strict-public-targets", false));
  config.extraMetadataKey = rs_try(findOr<std::string>(
      data, "index", "extra-metadata-key", config.extraMetadataKey));
  rs_ensure(!config.extraMetadataKey.empty(),
            "`index.extra-metadata-key` must not be empty");

  config.metadataPath = resolvePath(
      baseDir, rs_try(findOr<std::string>(data, "paths", "metadata",
                                          config.metadataPath.string())));
  const auto lockfile =
      rs_try(findOr<std::string>(data, "paths", "lockfile", ""));
  if (!lockfile.empty()) {
    config.lockfilePath = resolvePath(baseDir, lockfile);
  }

  config.logLevel = rs_try(
      parseLogLevel(rs_try(findOr<std::string>(data, "log", "level", "info"))));
  return rs::Ok(std::move(config));
}

rs::Result<Config> Config::tryParse(const fs::path& path) noexcept {
  rs_ensure(fs::exists(path), "Failed to load {}", path.string());
  spdlog::trace("Loading config: {}", path.string());

  toml::value data;
  try {
    data = toml::parse(path);
  } catch (const std::exception& e) {
    rs_bail("Failed to parse {}: {}", path.string(), e.what());
  }

  auto config = tryFromToml(data, path.parent_path());
  if (config.is_err()) {
    rs_bail("Failed to parse {}: {}", path.string(),
            config.unwrap_err()->what());
  }
  return config;
}

rs::Result<void> Config::applyLogLevel() const {
  auto level = logLevel;
  if (const char* env = std::getenv(LOG_ENV); env && *env != '\0') {
    level = rs_try(parseLogLevel(env));
  }
  spdlog::set_level(level);
  return rs::Ok();
}

} // namespace cargoidx
