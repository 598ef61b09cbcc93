#pragma once

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "pxu/common/origin.hpp"

namespace pxu {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kSyntaxError,          // Malformed record text
  kClassificationError,  // Path unrelated to the provider
  kLoadError,            // One file could not be loaded
  kHostError,            // I/O, malformed external input (configuration)
  kWarning,              // Non-fatal
  kNote,                 // Auxiliary message
};

// What went wrong while loading one file (only valid when kind ==
// kLoadError)
enum class LoadFailure : uint8_t {
  kRead,             // File text could not be read
  kSyntax,           // Record grammar violation
  kUnknownUnitKind,  // `unit` field names no registered kind
  kUnitDefinition,   // Record fields cannot form a unit
  kCheck,            // Live check reported an error
  kValidation,       // Static validator rejected a field
  kSelectionList,    // Legacy selection list could not be parsed
};

// Represents missing origin (for host errors or when origin unavailable)
struct UnknownSpan {
  auto operator==(const UnknownSpan&) const -> bool = default;
};

using DiagSpan = std::variant<Origin, UnknownSpan>;

// Single diagnostic item (primary or note)
struct DiagItem {
  DiagKind kind;
  DiagSpan span;
  std::string message;
  std::optional<LoadFailure> failure;  // has_value() iff kind == kLoadError

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  // Factory: record grammar violation at one line
  static auto SyntaxError(Origin origin, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kSyntaxError,
             .span = std::move(origin),
             .message = std::move(msg),
             .failure = std::nullopt},
        .notes = {},
    };
  }

  // Factory: path that no classification rule accepts
  static auto ClassificationError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kClassificationError,
             .span = UnknownSpan{},
             .message = std::move(msg),
             .failure = std::nullopt},
        .notes = {},
    };
  }

  // Factory: failure attributable to one provider file
  static auto LoadError(Origin origin, std::string msg, LoadFailure failure)
      -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kLoadError,
             .span = std::move(origin),
             .message = std::move(msg),
             .failure = failure},
        .notes = {},
    };
  }

  // Factory: host error without source location
  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .span = UnknownSpan{},
             .message = std::move(msg),
             .failure = std::nullopt},
        .notes = {},
    };
  }

  // Factory: host error with source location
  static auto HostError(Origin origin, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .span = std::move(origin),
             .message = std::move(msg),
             .failure = std::nullopt},
        .notes = {},
    };
  }

  // Factory: warning
  static auto Warning(Origin origin, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kWarning,
             .span = std::move(origin),
             .message = std::move(msg),
             .failure = std::nullopt},
        .notes = {},
    };
  }

  // Add a note with source location
  auto WithNote(Origin origin, std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .span = std::move(origin),
            .message = std::move(msg),
            .failure = std::nullopt,
        });
    return std::move(*this);
  }

  // Add a note without source location
  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .span = UnknownSpan{},
            .message = std::move(msg),
            .failure = std::nullopt,
        });
    return std::move(*this);
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

class DiagnosticException : public std::exception {
 public:
  explicit DiagnosticException(Diagnostic diag) : diag_(std::move(diag)) {
  }

  [[nodiscard]] auto GetDiagnostic() const -> const Diagnostic& {
    return diag_;
  }
  [[nodiscard]] auto what() const noexcept -> const char* override {
    return diag_.primary.message.c_str();
  }

 private:
  Diagnostic diag_;
};

auto ToString(DiagKind kind) -> const char*;
auto ToString(LoadFailure failure) -> const char*;

// Plain-text rendering: "origin: kind: message", one line per item.
auto FormatDiagnostic(const Diagnostic& diag) -> std::string;

}  // namespace pxu
