#include "pxu/unit/job.hpp"

#include <algorithm>
#include <array>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "pxu/record/record.hpp"
#include "pxu/unit/field_parsing.hpp"
#include "pxu/unit/unit.hpp"
#include "pxu/unit/validation.hpp"

namespace pxu::unit {

namespace {

// Fields shown to the operator that should be marked translatable.
constexpr std::array<std::string_view, 5> kTranslatableJobFields = {
    "summary", "description", "purpose", "steps", "verification"};

auto IsKnownPlugin(std::string_view plugin) -> bool {
  return std::ranges::find(kJobPlugins, plugin) != kJobPlugins.end();
}

auto RunsCommand(std::string_view plugin) -> bool {
  return std::ranges::find(kCommandPlugins, plugin) != kCommandPlugins.end();
}

auto Fail(std::string field, Problem problem) -> ValidationResult {
  return std::unexpected(
      ValidationError{.field = std::move(field), .problem = problem});
}

}  // namespace

auto JobData::FromRecord(const record::FieldMap& data)
    -> std::expected<JobData, std::string> {
  JobData job;
  job.id = GetField(data, "id");
  if (!job.id) {
    job.id = GetField(data, "name");
    job.uses_legacy_name = job.id.has_value();
  }
  job.summary = GetField(data, "summary");
  job.plugin = GetField(data, "plugin");
  job.command = GetField(data, "command");
  job.description = GetField(data, "description");
  job.purpose = GetField(data, "purpose");
  job.steps = GetField(data, "steps");
  job.verification = GetField(data, "verification");
  job.user = GetField(data, "user");
  job.environ = GetField(data, "environ");
  job.depends = GetField(data, "depends");
  job.after = GetField(data, "after");
  job.requires_expr = GetField(data, "requires");
  job.category_id = GetField(data, "category_id");
  job.flags = GetField(data, "flags");
  job.imports = GetField(data, "imports");

  if (auto duration = GetField(data, "estimated_duration")) {
    auto parsed = ParseEstimatedDuration(*duration);
    if (!parsed) {
      return std::unexpected(std::move(parsed.error()));
    }
    job.estimated_duration = *parsed;
  }
  return job;
}

auto JobData::DependencyIds() const -> std::vector<std::string> {
  if (!depends) {
    return {};
  }
  return SplitWords(*depends);
}

auto JobData::HasFlag(std::string_view flag) const -> bool {
  if (!flags) {
    return false;
  }
  auto words = SplitWords(*flags);
  return std::ranges::find(words, flag) != words.end();
}

auto ValidateJob(
    const Unit& /*unit*/, const JobData& job, const ValidationOptions& options)
    -> ValidationResult {
  if (auto result = ValidateId(job.id, options); !result) {
    // A job named through the legacy field reports problems against it.
    if (job.uses_legacy_name) {
      return Fail("name", result.error().problem);
    }
    return result;
  }
  if (options.deprecated && job.uses_legacy_name) {
    return Fail("name", Problem::kDeprecated);
  }

  if (!job.plugin) {
    return Fail("plugin", Problem::kMissing);
  }
  if (!IsKnownPlugin(*job.plugin)) {
    return Fail("plugin", Problem::kWrong);
  }

  if (RunsCommand(*job.plugin) && !job.command) {
    return Fail("command", Problem::kMissing);
  }
  if (*job.plugin == "manual" && job.command) {
    return Fail("command", Problem::kUseless);
  }
  return {};
}

auto CheckJob(const Unit& unit, const JobData& job) -> std::vector<Issue> {
  std::vector<Issue> issues;

  if (!job.summary) {
    issues.push_back(
        Issue{
            .severity = Severity::kAdvice,
            .field = "summary",
            .message = "summary should be provided",
            .origin = unit.origin(),
        });
  } else if (CountCodePoints(*job.summary) > kMaxSummaryLength) {
    issues.push_back(
        Issue{
            .severity = Severity::kWarning,
            .field = "summary",
            .message = fmt::format(
                "summary should be shorter than {} characters",
                kMaxSummaryLength),
            .origin = unit.FieldOrigin("summary"),
        });
  }

  for (std::string_view field : kTranslatableJobFields) {
    const auto& raw = unit.record().raw_data;
    if (raw.contains(field)) {
      issues.push_back(
          Issue{
              .severity = Severity::kAdvice,
              .field = std::string(field),
              .message = fmt::format(
                  "please use '{}{}' to mark the field as translatable",
                  record::kTranslatableMarker, field),
              .origin = unit.FieldOrigin(field),
          });
    }
  }

  if (job.user && *job.user != "root") {
    issues.push_back(
        Issue{
            .severity = Severity::kError,
            .field = "user",
            .message = "only root is allowed",
            .origin = unit.FieldOrigin("user"),
        });
  }

  if (job.category_id) {
    auto separator = job.category_id->find(kNamespaceSeparator);
    auto ns = unit.ProviderNamespace();
    if (separator != std::string::npos && ns &&
        job.category_id->substr(0, separator) != *ns) {
      issues.push_back(
          Issue{
              .severity = Severity::kAdvice,
              .field = "category_id",
              .message = fmt::format(
                  "category '{}' belongs to another provider",
                  *job.category_id),
              .origin = unit.FieldOrigin("category_id"),
          });
    }
  }
  return issues;
}

}  // namespace pxu::unit
