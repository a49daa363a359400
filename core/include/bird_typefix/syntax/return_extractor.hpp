// bird_typefix/syntax/return_extractor.hpp - return statements of one body
#pragma once

#include <vector>

#include "bird_typefix/basic/source_manager.hpp"
#include "bird_typefix/syntax/function_locator.hpp"
#include "bird_typefix/syntax/scan_error.hpp"
#include "bird_typefix/syntax/scanner.hpp"

namespace bird_typefix
{

struct ReturnStatement
{
  SourceRange keyword_range;
  SourceRange expr;  ///< trimmed; empty for a bare `return;`

  [[nodiscard]] bool is_void() const noexcept { return expr.is_empty(); }
};

struct ExtractResult
{
  std::vector<ReturnStatement> returns;  ///< in source order
  std::vector<ScanError> errors;         ///< MalformedReturn only
};

/**
 * Collect every `return` in the function body, at any nesting depth.
 *
 * The expression runs to the first `;` at the return's own depth, so
 * semicolons inside nested groups are not terminators.
 */
[[nodiscard]] ExtractResult extract_returns(
  const syntax::Scanner & scanner, const FunctionDefinition & function);

}  // namespace bird_typefix
