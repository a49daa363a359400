// bird_typefix/engine.hpp - Per-file return-type inference entry point
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "bird_typefix/rewrite/edit_planner.hpp"
#include "bird_typefix/syntax/scan_error.hpp"

namespace bird_typefix
{

/**
 * Everything learned about one file in a single scan pass.
 *
 * Ranges in `decisions` and `errors` refer to the buffer given to
 * scan_file(), which must outlive any use of them.
 */
struct ScanReport
{
  std::vector<FunctionTypeDecision> decisions;  ///< in source order
  std::vector<ScanError> errors;                ///< in source order

  /// Any error other than MalformedReturn (those only force a Skip).
  [[nodiscard]] bool has_failures() const noexcept;

  [[nodiscard]] bool has_skips() const noexcept;

  [[nodiscard]] size_t count(DecisionKind kind) const noexcept;
};

/**
 * Locate, extract, classify and reconcile every function in `buffer`.
 *
 * Never throws on malformed input; problems end up in ScanReport::errors.
 */
[[nodiscard]] ScanReport scan_file(std::string_view buffer);

/// plan_edits() + apply_edits() for a finished report.
[[nodiscard]] std::string rewrite_buffer(std::string_view buffer, const ScanReport & report);

}  // namespace bird_typefix
