#pragma once

#include <cstddef>
#include <cstdint>
#include <fmt/format.h>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cargoidx {

struct Diagnostic {
  enum class Level : std::uint8_t {
    Warning,
    Error,
  };

  Level level;
  std::string message;
};

// Receives problems that are reported but do not abort the operation.
using DiagSink = std::function<void(const Diagnostic&)>;

// Default sink: forwards to the spdlog default logger.
void logDiag(const Diagnostic& diag);

// Collects diagnostics in memory, e.g. to inspect them after a query.
class DiagCollector {
public:
  DiagSink sink() {
    return [this](const Diagnostic& diag) { diags.push_back(diag); };
  }

  const std::vector<Diagnostic>& all() const noexcept { return diags; }
  std::size_t count(Diagnostic::Level level) const;

private:
  std::vector<Diagnostic> diags;
};

template <typename... Args>
inline void warn(const DiagSink& sink, fmt::format_string<Args...> fmtStr,
                 Args&&... args) {
  sink(Diagnostic{ Diagnostic::Level::Warning,
                   fmt::format(fmtStr, std::forward<Args>(args)...) });
}

template <typename... Args>
inline void error(const DiagSink& sink, fmt::format_string<Args...> fmtStr,
                  Args&&... args) {
  sink(Diagnostic{ Diagnostic::Level::Error,
                   fmt::format(fmtStr, std::forward<Args>(args)...) });
}

} // namespace cargoidx
