// bird_typefix/infer/type_reconciler.hpp - One type per function
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "bird_typefix/infer/inferred_type.hpp"
#include "bird_typefix/syntax/return_extractor.hpp"

namespace bird_typefix
{

enum class DecisionKind : uint8_t {
  Keep,    ///< annotated or void; left unchanged
  Insert,  ///< all typed returns agree; an annotation is planned
  Skip,    ///< conflicting/unrecognized/malformed; left unchanged, reported
};

[[nodiscard]] constexpr std::string_view to_string(DecisionKind k) noexcept
{
  switch (k) {
    case DecisionKind::Keep:
      return "keep";
    case DecisionKind::Insert:
      return "insert";
    case DecisionKind::Skip:
      return "skip";
  }
  return "";
}

inline constexpr std::string_view k_reason_annotated = "already annotated";
inline constexpr std::string_view k_reason_void = "void function";
inline constexpr std::string_view k_reason_ambiguous = "ambiguous";
inline constexpr std::string_view k_reason_unrecognized = "unrecognized expression shape";
inline constexpr std::string_view k_reason_malformed_return = "malformed return";

struct ClassifiedReturn
{
  ReturnStatement statement;
  InferredType type = InferredType::Unclassified;  ///< meaningless for void returns
};

struct Reconciliation
{
  DecisionKind kind = DecisionKind::Keep;
  InferredType type = InferredType::Unclassified;  ///< valid for Insert
  std::string reason;                              ///< set for Keep and Skip
};

/**
 * Combine the classified return sites of one function.
 *
 * Void returns carry no type and are ignored. Never guesses: any
 * disagreement, or any Unclassified site, yields Skip.
 */
[[nodiscard]] Reconciliation reconcile_returns(const std::vector<ClassifiedReturn> & returns);

}  // namespace bird_typefix
