// bird_typefix/syntax/function_locator.hpp - Top-level function declarations
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "bird_typefix/basic/source_manager.hpp"
#include "bird_typefix/syntax/scan_error.hpp"
#include "bird_typefix/syntax/scanner.hpp"

namespace bird_typefix
{

/**
 * One `function name(params) [-> type] { body }` declaration.
 *
 * All ranges point into the scanned buffer. `insertion_point` is the offset
 * right after the parameter list's `)`: the slot where ` -> <type>` goes.
 */
struct FunctionDefinition
{
  std::string name;
  SourceRange keyword_range;
  SourceRange name_range;
  SourceRange param_list;  ///< including the parentheses
  std::optional<SourceRange> existing_return_type;
  SourceRange body;  ///< from `{` to just past `}`
  uint32_t insertion_point = 0;

  [[nodiscard]] bool is_annotated() const noexcept { return existing_return_type.has_value(); }

  [[nodiscard]] SourceRange body_interior() const noexcept
  {
    return {body.begin_offset() + 1, body.end_offset() - 1};
  }
};

struct LocateResult
{
  std::vector<FunctionDefinition> functions;  ///< in source order
  std::vector<ScanError> errors;
};

/**
 * Find every top-level function declaration in the scanner's buffer.
 *
 * A malformed declaration is reported and skipped; scanning resumes after
 * the point of failure. An unterminated string or block comment ends the
 * scan, since nothing after it can be classified.
 */
[[nodiscard]] LocateResult locate_functions(const syntax::Scanner & scanner);

}  // namespace bird_typefix
