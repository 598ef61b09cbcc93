#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "pxu/common/diagnostic/diagnostic.hpp"

namespace pxu {

// Collects problems during a load pass. Not thread-safe.
// Diagnostics are stored in order of reporting; callers may rely on this.
class DiagnosticSink {
 public:
  void Report(Diagnostic diag) {
    if (diag.primary.kind != DiagKind::kWarning &&
        diag.primary.kind != DiagKind::kNote) {
      has_errors_ = true;
    }
    diagnostics_.push_back(std::move(diag));
  }

  [[nodiscard]] auto HasErrors() const -> bool {
    return has_errors_;
  }

  [[nodiscard]] auto GetDiagnostics() const -> const std::vector<Diagnostic>& {
    return diagnostics_;
  }

  [[nodiscard]] auto Size() const -> size_t {
    return diagnostics_.size();
  }

  void Clear() {
    diagnostics_.clear();
    has_errors_ = false;
  }

 private:
  std::vector<Diagnostic> diagnostics_;
  bool has_errors_ = false;
};

}  // namespace pxu
