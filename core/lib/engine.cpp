// bird_typefix/engine.cpp
#include "bird_typefix/engine.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "bird_typefix/infer/type_classifier.hpp"
#include "bird_typefix/infer/type_reconciler.hpp"
#include "bird_typefix/syntax/function_locator.hpp"
#include "bird_typefix/syntax/return_extractor.hpp"
#include "bird_typefix/syntax/scanner.hpp"

namespace bird_typefix
{

bool ScanReport::has_failures() const noexcept
{
  return std::any_of(errors.begin(), errors.end(), [](const ScanError & e) {
    return e.kind != ErrorKind::MalformedReturn;
  });
}

bool ScanReport::has_skips() const noexcept { return count(DecisionKind::Skip) > 0; }

size_t ScanReport::count(DecisionKind kind) const noexcept
{
  return static_cast<size_t>(
    std::count_if(decisions.begin(), decisions.end(), [kind](const FunctionTypeDecision & d) {
      return d.kind == kind;
    }));
}

ScanReport scan_file(std::string_view buffer)
{
  ScanReport report;
  const syntax::Scanner scanner(buffer);

  LocateResult located = locate_functions(scanner);
  report.errors = std::move(located.errors);

  for (auto & fn : located.functions) {
    ExtractResult extracted = extract_returns(scanner, fn);

    std::vector<ClassifiedReturn> classified;
    classified.reserve(extracted.returns.size());
    for (const auto & stmt : extracted.returns) {
      ClassifiedReturn cr;
      cr.statement = stmt;
      if (!stmt.is_void()) {
        cr.type = classify_expression(scanner.slice(stmt.expr));
      }
      classified.push_back(cr);
    }

    Reconciliation reconciliation;
    if (!extracted.errors.empty()) {
      reconciliation.kind = DecisionKind::Skip;
      reconciliation.reason = std::string(k_reason_malformed_return);
    } else {
      reconciliation = reconcile_returns(classified);
    }

    report.decisions.push_back(decide(std::move(fn), std::move(classified), reconciliation));
    for (auto & e : extracted.errors) {
      report.errors.push_back(std::move(e));
    }
  }

  std::stable_sort(
    report.errors.begin(), report.errors.end(), [](const ScanError & a, const ScanError & b) {
      return a.range.begin_offset() < b.range.begin_offset();
    });
  return report;
}

std::string rewrite_buffer(std::string_view buffer, const ScanReport & report)
{
  return apply_edits(buffer, plan_edits(report.decisions));
}

}  // namespace bird_typefix
