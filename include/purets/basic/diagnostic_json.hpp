// purets/basic/diagnostic_json.hpp - JSON serialization for diagnostics
//
// Machine-readable report format used by `purets --format json`.
//
#pragma once

#include <nlohmann/json.hpp>

#include "purets/basic/diagnostic.hpp"
#include "purets/basic/source_manager.hpp"

namespace purets
{

/**
 * Serialize one diagnostic.
 *
 * The object carries `file`, `line`, `column`, `rule`, `message`, `start`
 * and `end` keys; line and column are 1-indexed.
 */
[[nodiscard]] nlohmann::json to_json(const Diagnostic & diag, const SourceFile & source);

/// Serialize every diagnostic of a file as a JSON array, in emission order.
[[nodiscard]] nlohmann::json to_json(const DiagnosticBag & diags, const SourceFile & source);

}  // namespace purets
