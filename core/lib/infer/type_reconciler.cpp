// bird_typefix/infer/type_reconciler.cpp
#include "bird_typefix/infer/type_reconciler.hpp"

#include <optional>

namespace bird_typefix
{

Reconciliation reconcile_returns(const std::vector<ClassifiedReturn> & returns)
{
  Reconciliation result;

  std::optional<InferredType> agreed;
  bool conflict = false;
  size_t typed = 0;
  size_t unclassified = 0;

  for (const auto & r : returns) {
    if (r.statement.is_void()) {
      continue;
    }
    ++typed;
    if (r.type == InferredType::Unclassified) {
      ++unclassified;
      continue;
    }
    if (agreed && *agreed != r.type) {
      conflict = true;
    }
    agreed = agreed.value_or(r.type);
  }

  if (typed == 0) {
    result.kind = DecisionKind::Keep;
    result.reason = std::string(k_reason_void);
    return result;
  }

  if (unclassified == typed) {
    result.kind = DecisionKind::Skip;
    result.reason = std::string(k_reason_unrecognized);
    return result;
  }

  if (conflict || unclassified > 0) {
    result.kind = DecisionKind::Skip;
    result.reason = std::string(k_reason_ambiguous);
    return result;
  }

  result.kind = DecisionKind::Insert;
  result.type = *agreed;
  return result;
}

}  // namespace bird_typefix
