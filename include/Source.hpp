#pragma once

#include <compare>
#include <cstdint>
#include <fmt/format.h>
#include <string>
#include <string_view>
#include <utility>

namespace cargoidx {

// Where a package comes from, as written by cargo (`registry+<url>`,
// `sparse+<url>`, `git+<url>#<commit>`, `path+<url>`).
class Source {
public:
  enum class Kind : std::uint8_t {
    CratesIo,
    Registry,
    Git,
    Local,
    Unrecognized,
  };

  static Source parse(std::string repr);

  Kind kind() const noexcept { return kind_; }
  const std::string& repr() const noexcept { return repr_; }

  // Sources compare by their textual form so lockfile and metadata entries
  // written by the same cargo agree.
  bool operator==(const Source& other) const { return repr_ == other.repr_; }
  std::strong_ordering operator<=>(const Source& other) const {
    return repr_.compare(other.repr_) <=> 0;
  }

private:
  Source(Kind kind, std::string repr)
      : kind_(kind), repr_(std::move(repr)) {}

  Kind kind_;
  std::string repr_;
};

} // namespace cargoidx

template <>
struct fmt::formatter<cargoidx::Source> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const cargoidx::Source& source, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(source.repr(), ctx);
  }
};
