// bird_typefix/syntax/return_extractor.cpp - return statement extraction
#include "bird_typefix/syntax/return_extractor.hpp"

#include <optional>
#include <string>
#include <utility>

#include "bird_typefix/syntax/keywords.hpp"

namespace bird_typefix
{

ExtractResult extract_returns(const syntax::Scanner & scanner, const FunctionDefinition & function)
{
  ExtractResult result;
  const SourceRange interior = function.body_interior();
  const uint32_t limit = interior.end_offset();

  syntax::ScanCursor cur;
  cur.pos = interior.begin_offset();
  while (cur.pos < limit) {
    if (!cur.in_code() || !scanner.keyword_at(cur.pos, syntax::k_return_keyword)) {
      cur = scanner.advance(cur);
      continue;
    }

    const uint32_t kw_start = cur.pos;
    const auto expr_start = static_cast<uint32_t>(kw_start + syntax::k_return_keyword.size());
    const SourceRange kw_range(kw_start, expr_start);

    const std::optional<uint32_t> semi =
      scanner.find_next_top_level_token(expr_start, ";", SourceRange(expr_start, limit));
    if (!semi) {
      ScanError e;
      e.kind = ErrorKind::MalformedReturn;
      e.range = kw_range;
      e.message = "missing ';' after return in function '" + function.name + "'";
      e.function_name = function.name;
      result.errors.push_back(std::move(e));
      cur.pos = expr_start;
      continue;
    }

    ReturnStatement stmt;
    stmt.keyword_range = kw_range;
    stmt.expr = scanner.trim(SourceRange(expr_start, *semi));
    result.returns.push_back(stmt);

    // The terminator sits at the return's own depth, so the cursor state
    // carries over unchanged.
    cur.pos = *semi + 1;
  }

  return result;
}

}  // namespace bird_typefix
