// bird_typefix/report/scan_diagnostics.cpp
#include "bird_typefix/report/scan_diagnostics.hpp"

#include <fmt/core.h>

#include <string>

namespace bird_typefix
{

namespace
{

void add_return_labels(DiagnosticBuilder & builder, const FunctionTypeDecision & d)
{
  for (const auto & r : d.returns) {
    if (r.statement.is_void()) {
      continue;
    }
    builder.with_secondary_label(r.statement.expr, std::string(to_string(r.type)));
  }
}

void report_skip(DiagnosticBag & bag, const FunctionTypeDecision & d)
{
  const SourceRange name = d.function.name_range;

  if (d.reason == k_reason_ambiguous) {
    auto b = bag.report_warning(
      name, fmt::format("conflicting return types in function '{}'", d.function.name),
      "return type left unannotated");
    b.with_code(std::string(diag_code::k_ambiguous_returns));
    add_return_labels(b, d);
    b.with_help("annotate the function by hand");
    return;
  }

  if (d.reason == k_reason_unrecognized) {
    auto b = bag.report_warning(
      name,
      fmt::format("cannot infer the return type of function '{}'", d.function.name),
      "return type left unannotated");
    b.with_code(std::string(diag_code::k_unrecognized_return));
    add_return_labels(b, d);
    b.with_help("no return expression has a recognizable literal shape");
    return;
  }

  // Malformed returns are already reported as E003.
}

}  // namespace

std::string_view code_for(ErrorKind kind) noexcept
{
  switch (kind) {
    case ErrorKind::UnbalancedDelimiter:
      return diag_code::k_unbalanced_delimiter;
    case ErrorKind::MalformedDeclaration:
      return diag_code::k_malformed_declaration;
    case ErrorKind::MalformedReturn:
      return diag_code::k_malformed_return;
  }
  return "";
}

DiagnosticBag to_diagnostics(const ScanReport & report, bool verbose)
{
  DiagnosticBag bag;

  for (const auto & e : report.errors) {
    auto b = bag.report_error(e.range, e.message);
    b.with_code(std::string(code_for(e.kind)));
    if (e.kind == ErrorKind::MalformedReturn) {
      b.with_help("function left unannotated");
    } else if (!e.function_name.empty()) {
      b.with_help(fmt::format("function '{}' skipped", e.function_name));
    }
  }

  for (const auto & d : report.decisions) {
    switch (d.kind) {
      case DecisionKind::Skip:
        report_skip(bag, d);
        break;
      case DecisionKind::Insert:
        if (verbose) {
          const std::string text = fmt::format(" -> {}", type_name(d.type));
          bag
            .report_info(
              d.function.name_range,
              fmt::format("inferred return type '{}' for function '{}'", type_name(d.type),
                          d.function.name))
            .with_code(std::string(diag_code::k_inferred_type))
            .with_fixit(SourceRange(d.function.insertion_point, d.function.insertion_point), text);
        }
        break;
      case DecisionKind::Keep:
        break;
    }
  }

  return bag;
}

}  // namespace bird_typefix
