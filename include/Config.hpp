#pragma once

#include "ExtraMetadata.hpp"
#include "Visibility.hpp"

#include <filesystem>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <toml.hpp>

namespace cargoidx {

namespace fs = std::filesystem;

struct Config {
  static constexpr const char* FILE_NAME = "cargoidx.toml";
  static constexpr const char* LOG_ENV = "CARGOIDX_LOG";

  bool includeTopLevel = false;
  bool strictPublicTargets = false;
  std::string extraMetadataKey{ DEFAULT_EXTRA_METADATA_KEY };
  // Absolute once loaded from a file; relative paths are resolved against
  // the directory of the config file.
  fs::path metadataPath = "metadata.json";
  std::optional<fs::path> lockfilePath;
  spdlog::level::level_enum logLevel = spdlog::level::info;

  static rs::Result<Config> tryParse(const fs::path& path) noexcept;
  static rs::Result<Config> tryFromToml(const toml::value& data,
                                        const fs::path& baseDir) noexcept;

  VisibilityOptions visibilityOptions() const noexcept {
    return { .rootIsReal = includeTopLevel, .strict = strictPublicTargets };
  }

  // Applies `logLevel`. CARGOIDX_LOG, when set, takes precedence.
  rs::Result<void> applyLogLevel() const;
};

rs::Result<spdlog::level::level_enum> parseLogLevel(const std::string& level);

} // namespace cargoidx
