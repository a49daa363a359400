// bird_typefix/rewrite/edit_planner.hpp - Decisions -> text insertions
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "bird_typefix/infer/type_reconciler.hpp"
#include "bird_typefix/syntax/function_locator.hpp"

namespace bird_typefix
{

/**
 * Final per-function outcome of a scan.
 */
struct FunctionTypeDecision
{
  FunctionDefinition function;
  DecisionKind kind = DecisionKind::Keep;
  InferredType type = InferredType::Unclassified;  ///< valid for Insert
  std::string reason;
  std::vector<ClassifiedReturn> returns;
};

/// Insert `text` at `insertion_point` of the original buffer.
struct RewriteEdit
{
  uint32_t insertion_point = 0;
  std::string text;
};

/**
 * Turn a reconciliation into the function's decision.
 *
 * An annotated function is always Keep, whatever its returns say, so
 * re-running over rewritten output changes nothing.
 */
[[nodiscard]] FunctionTypeDecision decide(
  FunctionDefinition function, std::vector<ClassifiedReturn> returns,
  const Reconciliation & reconciliation);

/// One edit per Insert decision, in source order.
[[nodiscard]] std::vector<RewriteEdit> plan_edits(
  const std::vector<FunctionTypeDecision> & decisions);

/// Apply edits to the buffer they were planned against.
[[nodiscard]] std::string apply_edits(std::string_view buffer, std::vector<RewriteEdit> edits);

}  // namespace bird_typefix
