#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "pxu/record/record.hpp"

namespace pxu::record {

// Write fields so that ParseRecords() reads them back unchanged.
// Multi-line values go to continuation lines; empty continuation lines are
// written as " ." and lines made only of periods get one extra period.
// The record is terminated by a blank line.
void WriteRecord(const FieldMap& fields, std::ostream& out);

// Writes the raw (as written) fields of the record.
void WriteRecord(const Record& record, std::ostream& out);

auto FormatRecord(const FieldMap& fields) -> std::string;

auto FormatRecords(const std::vector<Record>& records) -> std::string;

}  // namespace pxu::record
