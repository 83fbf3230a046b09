#pragma once

#include "Metadata.hpp"

#include <fmt/format.h>
#include <map>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace cargoidx {

inline constexpr std::string_view DEFAULT_EXTRA_METADATA_KEY = "third-party";

// Ownership record kept next to each third-party package.
struct ExtraMetadata {
  // Oncall shortname used as maintainer.
  std::string oncall;

  bool operator==(const ExtraMetadata&) const = default;
};

// Keyed by the name of the root's direct dependency.
using ExtraMetadataMap = std::map<std::string, ExtraMetadata>;

struct ExtraMetadataError {
  // Set when the table could not be decoded at all.
  std::optional<std::string> malformed;
  // Keys without a matching direct dependency, sorted and unique.
  std::vector<std::string> unknownPackages;

  std::string toString() const;
};

// Reads `[package.metadata.<key>]` of the root manifest and checks every
// entry against the root's direct dependencies. All unknown entries are
// reported together.
rs::Result<ExtraMetadataMap, ExtraMetadataError>
loadExtraMetadata(const Manifest& root,
                  std::string_view key = DEFAULT_EXTRA_METADATA_KEY);

} // namespace cargoidx

template <>
struct fmt::formatter<cargoidx::ExtraMetadataError>
    : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(const cargoidx::ExtraMetadataError& err,
              FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(err.toString(), ctx);
  }
};
