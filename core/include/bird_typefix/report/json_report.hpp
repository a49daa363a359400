// bird_typefix/report/json_report.hpp - Machine-readable scan results
#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "bird_typefix/basic/source_manager.hpp"
#include "bird_typefix/engine.hpp"

namespace bird_typefix
{

/**
 * JSON form of one file's report.
 *
 * {
 *   "functions": [{"name", "line", "decision", "type"?, "reason"?}],
 *   "errors":    [{"kind", "code", "line", "column", "message", "function"?}]
 * }
 *
 * Lines and columns are 1-based.
 */
[[nodiscard]] nlohmann::json report_to_json(const ScanReport & report, const SourceFile & source);

/// Pretty-printed text; invalid UTF-8 (e.g. latin-1 file names) becomes U+FFFD.
[[nodiscard]] std::string dump_json(const nlohmann::json & j);

}  // namespace bird_typefix
