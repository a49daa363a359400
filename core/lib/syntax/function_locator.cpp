// bird_typefix/syntax/function_locator.cpp - Function declaration discovery
#include "bird_typefix/syntax/function_locator.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "bird_typefix/syntax/keywords.hpp"

namespace bird_typefix
{

namespace
{

using syntax::MatchResult;
using syntax::Scanner;
using syntax::ScanCursor;

/// Outcome of parsing a single declaration starting at the keyword.
struct DeclarationParse
{
  std::optional<FunctionDefinition> function;
  std::optional<ScanError> error;
  uint32_t resume = 0;
  bool stop = false;  ///< an unterminated string/comment swallowed the rest
};

ScanError make_error(ErrorKind kind, SourceRange range, std::string message, std::string name)
{
  ScanError e;
  e.kind = kind;
  e.range = range;
  e.message = std::move(message);
  e.function_name = std::move(name);
  return e;
}

/// A group failed to close because of a string/comment, not the group itself.
bool failed_inside(const MatchResult & m, uint32_t open_offset)
{
  return m.error.range.begin_offset() != open_offset;
}

/// Consume a return-type clause: words and parenthesized groups.
/// Returns the offset just past the last consumed element.
uint32_t scan_type_clause(const Scanner & s, uint32_t pos)
{
  uint32_t last_end = pos;
  while (true) {
    const uint32_t p = s.skip_trivia(pos, s.size());
    const char c = s.peek(p);
    if (syntax::is_ident_start(c)) {
      uint32_t e = p + 1;
      while (e < s.size() && syntax::is_ident_continue(s.peek(e))) {
        ++e;
      }
      pos = last_end = e;
      continue;
    }
    if (c == '(') {
      const MatchResult m = s.skip_to_matching_close(p);
      if (!m.success) {
        break;
      }
      pos = last_end = m.end;
      continue;
    }
    break;
  }
  return last_end;
}

DeclarationParse parse_declaration(const Scanner & s, uint32_t keyword_pos)
{
  DeclarationParse out;
  const auto kw_end = static_cast<uint32_t>(keyword_pos + syntax::k_function_keyword.size());
  const SourceRange kw_range(keyword_pos, kw_end);

  auto fail = [&](ErrorKind kind, SourceRange range, std::string msg, std::string name,
                  uint32_t resume) {
    out.error = make_error(kind, range, std::move(msg), std::move(name));
    out.resume = resume;
    return out;
  };

  // Name
  const uint32_t name_start = s.skip_trivia(kw_end, s.size());
  if (!syntax::is_ident_start(s.peek(name_start))) {
    return fail(
      ErrorKind::MalformedDeclaration, kw_range, "expected function name after 'function'", "",
      kw_end);
  }
  uint32_t name_end = name_start + 1;
  while (name_end < s.size() && syntax::is_ident_continue(s.peek(name_end))) {
    ++name_end;
  }
  const SourceRange name_range(name_start, name_end);
  std::string name(s.slice(name_range));

  // Parameter list
  const uint32_t params_open = s.skip_trivia(name_end, s.size());
  if (s.peek(params_open) != '(') {
    return fail(
      ErrorKind::MalformedDeclaration, name_range, "expected '(' after function name '" + name + "'",
      name, name_end);
  }
  const MatchResult params = s.skip_to_matching_close(params_open);
  if (!params.success) {
    if (failed_inside(params, params_open)) {
      out.stop = true;
      return fail(
        ErrorKind::UnbalancedDelimiter, params.error.range, params.error.message, name,
        params_open + 1);
    }
    return fail(
      ErrorKind::MalformedDeclaration, SourceRange(params_open, params_open + 1),
      "unbalanced parameter list in function '" + name + "'", name, params_open + 1);
  }

  FunctionDefinition fn;
  fn.name = name;
  fn.keyword_range = kw_range;
  fn.name_range = name_range;
  fn.param_list = SourceRange(params_open, params.end);
  fn.insertion_point = params.end;

  // Optional `-> type` clause
  uint32_t p = s.skip_trivia(params.end, s.size());
  if (s.starts_with(p, syntax::k_return_arrow)) {
    const auto type_start = static_cast<uint32_t>(p + syntax::k_return_arrow.size());
    const uint32_t type_end = scan_type_clause(s, type_start);
    const SourceRange type_range = s.trim(SourceRange(type_start, type_end));
    if (type_range.is_empty()) {
      return fail(
        ErrorKind::MalformedDeclaration, SourceRange(p, type_start),
        "missing return type after '->' in function '" + name + "'", name, params.end);
    }
    fn.existing_return_type = type_range;
    p = s.skip_trivia(type_end, s.size());
  }

  // Body
  if (s.peek(p) != '{') {
    return fail(
      ErrorKind::MalformedDeclaration, SourceRange(p, std::min(p + 1, s.size())),
      "expected '{' to open the body of function '" + name + "'", name, params.end);
  }
  const MatchResult body = s.skip_to_matching_close(p);
  if (!body.success) {
    if (failed_inside(body, p)) {
      out.stop = true;
      return fail(ErrorKind::UnbalancedDelimiter, body.error.range, body.error.message, name, p + 1);
    }
    return fail(
      ErrorKind::UnbalancedDelimiter, SourceRange(p, p + 1),
      "unclosed '{' in body of function '" + name + "'", name, p + 1);
  }
  fn.body = SourceRange(p, body.end);

  out.function = std::move(fn);
  out.resume = body.end;
  return out;
}

}  // namespace

LocateResult locate_functions(const Scanner & scanner)
{
  LocateResult result;

  ScanCursor cur;
  while (cur.pos < scanner.size()) {
    if (!cur.in_code()) {
      cur = scanner.advance(cur);
      continue;
    }

    const uint32_t pos = cur.pos;
    const char c = scanner.peek(pos);

    if (syntax::is_opener(c)) {
      // Whole top-level groups (filters, protocols, sets) are opaque.
      const MatchResult group = scanner.skip_to_matching_close(pos);
      if (group.success) {
        cur.pos = group.end;
        continue;
      }
      result.errors.push_back(group.error);
      if (failed_inside(group, pos)) {
        return result;
      }
      cur.pos = pos + 1;
      continue;
    }

    if (syntax::is_closer(c)) {
      result.errors.push_back(make_error(
        ErrorKind::UnbalancedDelimiter, SourceRange(pos, pos + 1),
        std::string("unexpected '") + c + "'", ""));
      cur.pos = pos + 1;
      continue;
    }

    if (scanner.keyword_at(pos, syntax::k_function_keyword)) {
      DeclarationParse decl = parse_declaration(scanner, pos);
      if (decl.error) {
        result.errors.push_back(std::move(*decl.error));
      }
      if (decl.function) {
        result.functions.push_back(std::move(*decl.function));
      }
      if (decl.stop) {
        return result;
      }
      cur.pos = decl.resume;
      continue;
    }

    cur = scanner.advance(cur);
  }

  if (!cur.in_code() && cur.comment != syntax::CommentMode::Line) {
    result.errors.push_back(scanner.unterminated_error(cur, cur.region_start));
  }

  return result;
}

}  // namespace bird_typefix
