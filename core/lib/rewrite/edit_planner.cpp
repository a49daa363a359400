// bird_typefix/rewrite/edit_planner.cpp
#include "bird_typefix/rewrite/edit_planner.hpp"

#include <algorithm>
#include <utility>

namespace bird_typefix
{

FunctionTypeDecision decide(
  FunctionDefinition function, std::vector<ClassifiedReturn> returns,
  const Reconciliation & reconciliation)
{
  FunctionTypeDecision d;
  d.function = std::move(function);
  d.returns = std::move(returns);

  if (d.function.is_annotated()) {
    d.kind = DecisionKind::Keep;
    d.reason = std::string(k_reason_annotated);
    return d;
  }

  d.kind = reconciliation.kind;
  d.type = reconciliation.type;
  d.reason = reconciliation.reason;
  return d;
}

std::vector<RewriteEdit> plan_edits(const std::vector<FunctionTypeDecision> & decisions)
{
  std::vector<RewriteEdit> edits;
  for (const auto & d : decisions) {
    if (d.kind != DecisionKind::Insert || d.function.is_annotated()) {
      continue;
    }
    edits.push_back(
      RewriteEdit{d.function.insertion_point, " -> " + std::string(type_name(d.type))});
  }
  std::stable_sort(edits.begin(), edits.end(), [](const RewriteEdit & a, const RewriteEdit & b) {
    return a.insertion_point < b.insertion_point;
  });
  return edits;
}

std::string apply_edits(std::string_view buffer, std::vector<RewriteEdit> edits)
{
  std::string out(buffer);

  // Descending order keeps every earlier offset valid.
  std::stable_sort(edits.begin(), edits.end(), [](const RewriteEdit & a, const RewriteEdit & b) {
    return a.insertion_point > b.insertion_point;
  });
  for (const auto & e : edits) {
    const size_t at = std::min<size_t>(e.insertion_point, out.size());
    out.insert(at, e.text);
  }
  return out;
}

}  // namespace bird_typefix
