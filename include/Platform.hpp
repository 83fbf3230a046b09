#pragma once

#include <cstdint>
#include <fmt/format.h>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cargoidx {

// A rendered platform guard, always of the form `cfg(<predicate>)`.
using PlatformExpr = std::string;

// Boolean expression over cfg flags, cfg key/value pairs and target triples.
//
//   windows                   Bool
//   target_os = "linux"       Value
//   not(unix)                 Not
//   all(unix, target_env = "gnu")
//   any(windows, unix)
//
// A bare target triple (`x86_64-pc-windows-msvc`) is represented as the
// value predicate `target = "<triple>"`.
class PlatformPredicate {
public:
  enum class Kind : std::uint8_t {
    Bool,
    Value,
    Not,
    All,
    Any,
  };

  // Accepts either `cfg(<expr>)` or a target triple.
  static rs::Result<PlatformPredicate> parse(std::string_view input);

  static PlatformPredicate flag(std::string key);
  static PlatformPredicate value(std::string key, std::string value);
  static PlatformPredicate negate(PlatformPredicate pred);
  static PlatformPredicate all(std::vector<PlatformPredicate> preds);
  static PlatformPredicate any(std::vector<PlatformPredicate> preds);

  Kind kind() const noexcept { return kind_; }
  const std::string& key() const noexcept { return key_; }
  const std::vector<PlatformPredicate>& children() const noexcept {
    return children_;
  }

  std::string toString() const;
  PlatformExpr toExpr() const;

  bool operator==(const PlatformPredicate&) const = default;

private:
  PlatformPredicate(Kind kind, std::string key, std::string value,
                    std::vector<PlatformPredicate> children)
      : kind_(kind), key_(std::move(key)), value_(std::move(value)),
        children_(std::move(children)) {}

  Kind kind_;
  std::string key_;
  std::string value_;
  std::vector<PlatformPredicate> children_;
};

} // namespace cargoidx

template <>
struct fmt::formatter<cargoidx::PlatformPredicate>
    : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(const cargoidx::PlatformPredicate& pred,
              FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(pred.toString(), ctx);
  }
};
