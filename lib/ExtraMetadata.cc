#include "ExtraMetadata.hpp"

#include "Metadata.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>
#include <rs/result.hpp>
#include <set>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace cargoidx {

std::string ExtraMetadataError::toString() const {
  if (malformed.has_value()) {
    return fmt::format("Malformed package metadata: {}", *malformed);
  }
  return fmt::format("Extra metadata for package(s): {}",
                     fmt::join(unknownPackages, " "));
}

static rs::Result<ExtraMetadata> decodeEntry(const std::string& name,
                                             const nlohmann::json& val) {
  rs_ensure(val.is_object(), "`{}`: expected table, found {}", name,
            val.type_name());
  const auto oncall = val.find("oncall");
  rs_ensure(oncall != val.end(), "`{}`: missing field `oncall`", name);
  rs_ensure(oncall->is_string(), "`{}`: `oncall` must be a string, found {}",
            name, oncall->type_name());
  return rs::Ok(ExtraMetadata{ .oncall = oncall->get<std::string>() });
}

rs::Result<ExtraMetadataMap, ExtraMetadataError>
loadExtraMetadata(const Manifest& root, const std::string_view key) {
  const auto malformed = [](std::string msg) {
    return rs::Err(ExtraMetadataError{ .malformed = std::move(msg),
                                       .unknownPackages = {} });
  };

  if (!root.metadata.is_object()) {
    return rs::Ok(ExtraMetadataMap{});
  }
  const auto table = root.metadata.find(std::string(key));
  if (table == root.metadata.end() || table->is_null()) {
    spdlog::debug("{}: no [package.metadata.{}] table", root, key);
    return rs::Ok(ExtraMetadataMap{});
  }
  if (!table->is_object()) {
    return malformed(fmt::format("`{}` must be a table, found {}", key,
                                 table->type_name()));
  }

  std::unordered_set<std::string_view> directDeps;
  for (const ManifestDep& dep : root.dependencies) {
    directDeps.insert(dep.name);
  }

  ExtraMetadataMap extra;
  std::set<std::string> unknown;
  for (const auto& [name, val] : table->items()) {
    auto entry = decodeEntry(name, val);
    if (entry.is_err()) {
      return malformed(entry.unwrap_err()->what());
    }

    const auto dep = directDeps.find(name);
    if (dep == directDeps.end()) {
      unknown.insert(name);
      continue;
    }
    extra.insert_or_assign(std::string(*dep), std::move(entry).unwrap());
  }

  if (!unknown.empty()) {
    return rs::Err(ExtraMetadataError{
        .malformed = std::nullopt,
        .unknownPackages =
            std::vector<std::string>(unknown.begin(), unknown.end()) });
  }
  return rs::Ok(std::move(extra));
}

} // namespace cargoidx
