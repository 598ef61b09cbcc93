#include "pxu/common/diagnostic/diagnostic.hpp"

#include <string>
#include <variant>

#include <fmt/core.h>

#include "pxu/common/overloaded.hpp"

namespace pxu {

namespace {

void AppendItem(std::string& out, const DiagItem& item, bool is_primary) {
  std::string location = std::visit(
      common::Overloaded{
          [](const Origin& origin) { return origin.ToString(); },
          [](UnknownSpan) { return std::string("pxu"); },
      },
      item.span);
  out += fmt::format(
      "{}{}: {}: {}\n", is_primary ? "" : "  ", location, ToString(item.kind),
      item.message);
}

}  // namespace

auto ToString(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kSyntaxError:
      return "syntax error";
    case DiagKind::kClassificationError:
      return "classification error";
    case DiagKind::kLoadError:
      return "error";
    case DiagKind::kHostError:
      return "error";
    case DiagKind::kWarning:
      return "warning";
    case DiagKind::kNote:
      return "note";
  }
  return "error";
}

auto ToString(LoadFailure failure) -> const char* {
  switch (failure) {
    case LoadFailure::kRead:
      return "read";
    case LoadFailure::kSyntax:
      return "syntax";
    case LoadFailure::kUnknownUnitKind:
      return "unknown-unit-kind";
    case LoadFailure::kUnitDefinition:
      return "unit-definition";
    case LoadFailure::kCheck:
      return "check";
    case LoadFailure::kValidation:
      return "validation";
    case LoadFailure::kSelectionList:
      return "selection-list";
  }
  return "unknown";
}

auto FormatDiagnostic(const Diagnostic& diag) -> std::string {
  std::string out;
  AppendItem(out, diag.primary, true);
  for (const auto& note : diag.notes) {
    AppendItem(out, note, false);
  }
  return out;
}

}  // namespace pxu
