#pragma once

#include <compare>
#include <cstdint>
#include <fmt/format.h>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cargoidx {

// One dot-separated identifier of a pre-release or build section.
struct VersionIdent {
  std::variant<std::uint64_t, std::string> ident;

  bool isNumeric() const { return ident.index() == 0; }
  std::string toString() const;

  bool operator==(const VersionIdent&) const = default;
  std::strong_ordering operator<=>(const VersionIdent& other) const;
};

struct Prerelease {
  std::vector<VersionIdent> ident;

  bool empty() const noexcept { return ident.empty(); }
  std::string toString() const;

  bool operator==(const Prerelease&) const = default;
  // A version without pre-release outranks one with it.
  std::strong_ordering operator<=>(const Prerelease& other) const;
};

struct BuildMetadata {
  std::vector<VersionIdent> ident;

  bool empty() const noexcept { return ident.empty(); }
  std::string toString() const;

  bool operator==(const BuildMetadata&) const = default;
  std::strong_ordering operator<=>(const BuildMetadata& other) const;
};

struct Version {
  std::uint64_t major{};
  std::uint64_t minor{};
  std::uint64_t patch{};
  Prerelease pre;
  BuildMetadata build;

  static rs::Result<Version> parse(std::string_view str);
  std::string toString() const;

  bool operator==(const Version&) const = default;
  // Semver precedence, with build metadata compared last so that the order
  // is total and consistent with equality.
  std::strong_ordering operator<=>(const Version& other) const;
};

} // namespace cargoidx

template <>
struct fmt::formatter<cargoidx::Version> : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(const cargoidx::Version& version, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(version.toString(), ctx);
  }
};
