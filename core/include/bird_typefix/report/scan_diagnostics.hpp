// bird_typefix/report/scan_diagnostics.hpp - ScanReport -> diagnostics
#pragma once

#include <string_view>

#include "bird_typefix/basic/diagnostic.hpp"
#include "bird_typefix/engine.hpp"

namespace bird_typefix
{

namespace diag_code
{
inline constexpr std::string_view k_unbalanced_delimiter = "E001";
inline constexpr std::string_view k_malformed_declaration = "E002";
inline constexpr std::string_view k_malformed_return = "E003";
inline constexpr std::string_view k_ambiguous_returns = "W001";
inline constexpr std::string_view k_unrecognized_return = "W002";
inline constexpr std::string_view k_inferred_type = "I001";
}  // namespace diag_code

[[nodiscard]] std::string_view code_for(ErrorKind kind) noexcept;

/**
 * Render every error and skip of a report as a diagnostic.
 *
 * Errors become E-codes and skipped functions W-codes. With `verbose`, each
 * planned insertion is also reported as I001 with a fix-it.
 */
[[nodiscard]] DiagnosticBag to_diagnostics(const ScanReport & report, bool verbose);

}  // namespace bird_typefix
