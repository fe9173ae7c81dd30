// lsconf/ast/json_reader.hpp - Read the external parser's outcome from JSON
//
// Wire shape:
//   {"ok": true,  "config": {"input": [{"blocks": [BLOCK...]}], "filter": [...], "output": [...]}}
//   {"ok": false, "error": "<report>", "farthest": "<report>"?}
//
//   BLOCK = {"plugin": {"name", "offset", "attributes": [ATTR...]}}
//         | {"branch": {"if": [BLOCK...], "elseIf": [[BLOCK...]...], "else": [BLOCK...]}}
//   ATTR  = {"name", "offset", "kind", "value", "valueOffset"?}
//
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <utility>

#include "lsconf/ast/config_ast.hpp"

namespace lsconf::ast
{

/**
 * Result of reading a parse outcome.
 */
struct OutcomeReadResult
{
  /// Decoded outcome (only valid if success == true)
  ParseOutcome outcome;

  bool success = false;

  /// Error message if the JSON does not have the expected shape
  std::string error;

  static OutcomeReadResult ok(ParseOutcome o)
  {
    OutcomeReadResult r;
    r.outcome = std::move(o);
    r.success = true;
    return r;
  }

  static OutcomeReadResult fail(std::string msg)
  {
    OutcomeReadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/// Read an outcome from JSON text.
[[nodiscard]] OutcomeReadResult read_parse_outcome(std::string_view json_text);

/// Read an outcome from an already parsed JSON value.
[[nodiscard]] OutcomeReadResult read_parse_outcome(const nlohmann::json & j);

}  // namespace lsconf::ast
