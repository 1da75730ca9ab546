// diagnostics_json.hpp - JSON serialization for check reports
#pragma once
#include "glot/checker.hpp"
#include <string>

namespace glot {

// Serialize a report to a compact JSON string.
std::string findings_to_json(const CheckReport& r);

// If GLOT_DIAG_JSON=1 in the environment, print the report JSON to stderr.
void maybe_print_json(const CheckReport& r);

} // namespace glot
