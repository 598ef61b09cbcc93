#pragma once

#include <filesystem>
#include <string_view>
#include <vector>

#include "pxu/common/diagnostic/diagnostic.hpp"
#include "pxu/common/origin.hpp"
#include "pxu/record/record.hpp"

namespace pxu::record {

// Messages carried by kSyntaxError diagnostics.
inline constexpr std::string_view kUnexpectedMultiLineValue =
    "Unexpected multi-line value";
inline constexpr std::string_view kUnexpectedNonEmptyLine =
    "Unexpected non-empty line";

// Parse PXU record text.
//
// Grammar, line by line:
//   - blank lines separate records (runs of blank lines collapse)
//   - "key: value" starts a field; a key may appear once per record
//   - " text" (leading space) continues the last field on a new line
//   - inside continuations " ." is an empty line and " .." a single period
//
// Every record origin uses `source` and spans the lines of the record.
// Stops at the first syntax error; no partial result is returned.
auto ParseRecords(
    std::string_view text, const TextSource& source = UnknownTextSource{})
    -> Result<std::vector<Record>>;

// Read and parse one file; record origins name the file.
auto ParseRecordsFromFile(const std::filesystem::path& path)
    -> Result<std::vector<Record>>;

}  // namespace pxu::record
