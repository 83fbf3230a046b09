#include "Diag.hpp"

#include <algorithm>
#include <cstddef>
#include <spdlog/spdlog.h>

namespace cargoidx {

void logDiag(const Diagnostic& diag) {
  switch (diag.level) {
  case Diagnostic::Level::Warning:
    spdlog::warn("{}", diag.message);
    return;
  case Diagnostic::Level::Error:
    spdlog::error("{}", diag.message);
    return;
  }
  __builtin_unreachable();
}

std::size_t DiagCollector::count(const Diagnostic::Level level) const {
  return static_cast<std::size_t>(std::ranges::count_if(
      diags, [level](const Diagnostic& diag) { return diag.level == level; }));
}

} // namespace cargoidx
