#pragma once

#include <exception>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <toml.hpp>

namespace toml {

template <typename T, typename... U>
// NOLINTNEXTLINE(readability-identifier-naming)
inline rs::Result<T> try_find(const toml::value& v, const U&... u) noexcept {
  using std::string_view_literals::operator""sv;

  try {
    return rs::Ok(toml::find<T>(v, u...));
  } catch (const std::exception& e) {
    std::string what = e.what();

    static constexpr std::string_view errorPrefix = "[error] "sv;
    if (what.starts_with(errorPrefix)) {
      what.erase(0, errorPrefix.size());
    }
    if (!what.empty() && what.back() == '\n') {
      what.pop_back();
    }
    rs_bail("{}", what);
  }
}

} // namespace toml
