// bird_typefix/syntax/scanner.cpp - Quote, comment and nesting aware scanning
#include "bird_typefix/syntax/scanner.hpp"

#include <algorithm>
#include <string>

namespace bird_typefix::syntax
{

ScanCursor Scanner::advance(ScanCursor cur) const noexcept
{
  if (cur.pos >= src_.size()) {
    return cur;
  }

  const char c = src_[cur.pos];

  if (cur.comment == CommentMode::Line) {
    if (c == '\n') {
      cur.comment = CommentMode::None;
    }
    ++cur.pos;
    return cur;
  }

  if (cur.comment == CommentMode::Block) {
    if (starts_with(cur.pos, "*/")) {
      cur.comment = CommentMode::None;
      cur.pos += 2;
    } else {
      ++cur.pos;
    }
    return cur;
  }

  if (cur.quote != QuoteMode::None) {
    if (c == '\\') {
      // An escaped character never terminates the string.
      cur.pos = std::min<uint32_t>(cur.pos + 2, size());
      return cur;
    }
    if (
      (cur.quote == QuoteMode::Double && c == '"') ||
      (cur.quote == QuoteMode::Single && c == '\'')) {
      cur.quote = QuoteMode::None;
    }
    ++cur.pos;
    return cur;
  }

  switch (c) {
    case '#':
      cur.comment = CommentMode::Line;
      cur.region_start = cur.pos;
      break;
    case '/':
      if (peek(cur.pos + 1) == '*') {
        cur.comment = CommentMode::Block;
        cur.region_start = cur.pos;
        cur.pos += 2;
        return cur;
      }
      break;
    case '"':
      cur.quote = QuoteMode::Double;
      cur.region_start = cur.pos;
      break;
    case '\'':
      cur.quote = QuoteMode::Single;
      cur.region_start = cur.pos;
      break;
    case '{':
    case '(':
    case '[':
      ++cur.depth;
      break;
    case '}':
    case ')':
    case ']':
      --cur.depth;
      break;
    default:
      break;
  }

  ++cur.pos;
  return cur;
}

MatchResult Scanner::skip_to_matching_close(uint32_t open_offset) const
{
  if (open_offset >= src_.size() || !is_opener(src_[open_offset])) {
    ScanError e;
    e.kind = ErrorKind::UnbalancedDelimiter;
    e.range = SourceRange(open_offset, std::min(open_offset + 1, size()));
    e.message = "expected an opening delimiter";
    return MatchResult::fail(std::move(e));
  }

  ScanCursor cur;
  cur.pos = open_offset;
  while (cur.pos < src_.size()) {
    cur = advance(cur);
    if (cur.depth == 0) {
      return MatchResult::ok(cur.pos);
    }
  }

  return MatchResult::fail(unterminated_error(cur, open_offset));
}

std::optional<uint32_t> Scanner::find_next_top_level_token(
  uint32_t from, std::string_view token, SourceRange within) const
{
  const uint32_t end = std::min(within.end_offset(), size());

  ScanCursor cur;
  cur.pos = from;
  while (cur.pos < end) {
    if (cur.in_code() && cur.depth == 0) {
      if (token_at(cur.pos, token)) {
        return cur.pos;
      }
      if (is_closer(src_[cur.pos])) {
        return std::nullopt;
      }
    }
    cur = advance(cur);
  }
  return std::nullopt;
}

uint32_t Scanner::skip_trivia(uint32_t pos, uint32_t limit) const noexcept
{
  limit = std::min(limit, size());
  while (pos < limit) {
    const char c = src_[pos];
    if (is_space(c)) {
      ++pos;
      continue;
    }
    if (c == '#') {
      while (pos < limit && src_[pos] != '\n') {
        ++pos;
      }
      continue;
    }
    if (starts_with(pos, "/*")) {
      pos += 2;
      while (pos < limit && !starts_with(pos, "*/")) {
        ++pos;
      }
      pos = std::min(pos + 2, limit);
      continue;
    }
    break;
  }
  return std::min(pos, limit);
}

bool Scanner::keyword_at(uint32_t pos, std::string_view keyword) const noexcept
{
  if (!starts_with(pos, keyword)) {
    return false;
  }
  if (pos > 0 && is_ident_continue(src_[pos - 1])) {
    return false;
  }
  const size_t after = pos + keyword.size();
  return after >= src_.size() || !is_ident_continue(src_[after]);
}

bool Scanner::token_at(uint32_t pos, std::string_view token) const noexcept
{
  if (token.empty()) {
    return false;
  }
  if (is_ident_start(token.front())) {
    return keyword_at(pos, token);
  }
  return starts_with(pos, token);
}

SourceRange Scanner::trim(SourceRange range) const noexcept
{
  uint32_t b = range.begin_offset();
  uint32_t e = std::min(range.end_offset(), size());
  while (b < e && is_space(src_[b])) {
    ++b;
  }
  while (e > b && is_space(src_[e - 1])) {
    --e;
  }
  return {b, e};
}

std::string_view Scanner::slice(SourceRange range) const noexcept
{
  if (range.is_invalid() || range.begin_offset() >= src_.size()) {
    return {};
  }
  const uint32_t e = std::min(range.end_offset(), size());
  if (e < range.begin_offset()) {
    return {};
  }
  return src_.substr(range.begin_offset(), e - range.begin_offset());
}

ScanError Scanner::unterminated_error(const ScanCursor & at_end, uint32_t open_offset) const
{
  ScanError e;
  e.kind = ErrorKind::UnbalancedDelimiter;

  if (at_end.quote != QuoteMode::None) {
    e.range = SourceRange(at_end.region_start, at_end.region_start + 1);
    e.message = "unterminated string literal";
  } else if (at_end.comment == CommentMode::Block) {
    e.range = SourceRange(at_end.region_start, at_end.region_start + 2);
    e.message = "unterminated block comment";
  } else {
    e.range = SourceRange(open_offset, open_offset + 1);
    e.message = std::string("unclosed '") + peek(open_offset) + "'";
  }
  return e;
}

}  // namespace bird_typefix::syntax
