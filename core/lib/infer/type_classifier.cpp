// bird_typefix/infer/type_classifier.cpp - Expression shape classification
#include "bird_typefix/infer/type_classifier.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "bird_typefix/syntax/scanner.hpp"

namespace bird_typefix
{

namespace
{

using syntax::ScanCursor;
using syntax::Scanner;

std::string_view trim(std::string_view s)
{
  while (!s.empty() && syntax::is_space(s.front())) {
    s.remove_prefix(1);
  }
  while (!s.empty() && syntax::is_space(s.back())) {
    s.remove_suffix(1);
  }
  return s;
}

bool all_digits(std::string_view s)
{
  if (s.empty()) {
    return false;
  }
  for (const char c : s) {
    if (!syntax::is_digit(c)) {
      return false;
    }
  }
  return true;
}

bool is_hex_digit(char c)
{
  return syntax::is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

/// Call fn(pos) for every code byte at depth 0 (including the closer that
/// returns to depth 0); stop when fn returns true.
template <typename Fn>
bool any_top_level(std::string_view e, Fn && fn)
{
  const Scanner s(e);
  ScanCursor cur;
  while (cur.pos < s.size()) {
    const bool top = cur.depth == 0 || (cur.depth == 1 && syntax::is_closer(e[cur.pos]));
    if (cur.in_code() && top && fn(cur.pos)) {
      return true;
    }
    cur = s.advance(cur);
  }
  return false;
}

std::vector<std::string_view> split_top_level(std::string_view e, char sep)
{
  std::vector<std::string_view> parts;
  uint32_t start = 0;
  any_top_level(e, [&](uint32_t pos) {
    if (e[pos] == sep) {
      parts.push_back(trim(e.substr(start, pos - start)));
      start = pos + 1;
    }
    return false;
  });
  parts.push_back(trim(e.substr(start)));
  return parts;
}

/// True if e starts with `open` and the matching close is its last byte.
bool wraps_whole(std::string_view e, char open)
{
  if (e.size() < 2 || e.front() != open) {
    return false;
  }
  const syntax::MatchResult m = Scanner(e).skip_to_matching_close(0);
  return m.success && m.end == e.size();
}

std::string_view inner_of(std::string_view e) { return trim(e.substr(1, e.size() - 2)); }

/// `(x)` without a top-level comma inside is just x.
std::string_view unwrap_parens(std::string_view e)
{
  while (wraps_whole(e, '(')) {
    const std::string_view inner = inner_of(e);
    if (inner.empty() || split_top_level(inner, ',').size() != 1) {
      break;
    }
    e = inner;
  }
  return e;
}

bool is_int_atom(std::string_view e)
{
  e = trim(e);
  if (!e.empty() && e.front() == '-') {
    return is_int_atom(e.substr(1));
  }
  if (all_digits(e)) {
    return true;
  }
  if (wraps_whole(e, '(')) {
    const std::string_view inner = inner_of(e);
    return split_top_level(inner, ',').size() == 1 && shape::is_int(inner);
  }
  return false;
}

/// Strip a trailing `.mask(<int>)`; returns false if there is none.
bool strip_mask_call(std::string_view e, std::string_view & base)
{
  constexpr std::string_view k_mask = ".mask(";
  if (e.empty() || e.back() != ')') {
    return false;
  }
  const size_t at = e.rfind(k_mask);
  if (at == std::string_view::npos) {
    return false;
  }
  const std::string_view arg = trim(e.substr(at + k_mask.size(), e.size() - at - k_mask.size() - 1));
  if (!all_digits(arg)) {
    return false;
  }
  base = trim(e.substr(0, at));
  return true;
}

/// Parse colon-separated hex groups; an IPv4 tail counts as two groups.
bool count_ipv6_groups(std::string_view part, bool allow_v4_tail, int & groups)
{
  groups = 0;
  if (part.empty()) {
    return true;
  }
  size_t start = 0;
  while (true) {
    const size_t colon = part.find(':', start);
    const std::string_view group =
      part.substr(start, colon == std::string_view::npos ? std::string_view::npos : colon - start);
    const bool last = colon == std::string_view::npos;

    if (last && allow_v4_tail && group.find('.') != std::string_view::npos) {
      if (!shape::is_ipv4_literal(group)) {
        return false;
      }
      groups += 2;
      return true;
    }
    if (group.empty() || group.size() > 4) {
      return false;
    }
    for (const char c : group) {
      if (!is_hex_digit(c)) {
        return false;
      }
    }
    ++groups;
    if (last) {
      return true;
    }
    start = colon + 1;
  }
}

}  // namespace

std::string normalize_expression(std::string_view text)
{
  std::string out;
  out.reserve(text.size());

  const Scanner s(text);
  ScanCursor cur;
  while (cur.pos < s.size()) {
    const char c = text[cur.pos];
    if (cur.in_code()) {
      if (c == '#' || s.starts_with(cur.pos, "/*")) {
        ScanCursor next = s.advance(cur);
        while (next.pos < s.size() && !next.in_code()) {
          next = s.advance(next);
        }
        cur = next;
        if (!out.empty() && out.back() != ' ') {
          out.push_back(' ');
        }
        continue;
      }
      if (syntax::is_space(c)) {
        if (!out.empty() && out.back() != ' ') {
          out.push_back(' ');
        }
        cur = s.advance(cur);
        continue;
      }
    }
    const ScanCursor next = s.advance(cur);
    out.append(text.substr(cur.pos, next.pos - cur.pos));
    cur = next;
  }

  while (!out.empty() && out.back() == ' ') {
    out.pop_back();
  }
  return out;
}

InferredType classify_expression(std::string_view text)
{
  const std::string normalized = normalize_expression(text);
  const std::string_view e = unwrap_parens(normalized);
  if (e.empty()) {
    return InferredType::Unclassified;
  }

  for (const InferredType candidate : k_type_priority) {
    bool matched = false;
    switch (candidate) {
      case InferredType::Int:
        matched = shape::is_int(e);
        break;
      case InferredType::Pair:
        matched = shape::is_pair(e);
        break;
      case InferredType::Ip:
        matched = shape::is_ip(e);
        break;
      case InferredType::Prefix:
        matched = shape::is_prefix(e);
        break;
      case InferredType::String:
        matched = shape::is_string(e);
        break;
      case InferredType::Set:
        matched = shape::is_set(e);
        break;
      case InferredType::Bool:
        matched = shape::is_bool(e);
        break;
      case InferredType::Unclassified:
        break;
    }
    if (matched) {
      return candidate;
    }
  }
  return InferredType::Unclassified;
}

// ============================================================================
// Shape predicates
// ============================================================================

namespace shape
{

bool is_int(std::string_view e)
{
  e = trim(e);
  if (e.empty()) {
    return false;
  }

  // Split on binary arithmetic operators. An operator is binary only when an
  // operand precedes it; otherwise '-' is a unary sign of the next operand.
  std::vector<std::string_view> operands;
  uint32_t start = 0;
  char prev = '\0';
  any_top_level(e, [&](uint32_t pos) {
    const char c = e[pos];
    const bool op = c == '+' || c == '-' || c == '*' || c == '/' || c == '%';
    const bool after_operand = syntax::is_ident_continue(prev) || prev == ')';
    if (op && after_operand) {
      operands.push_back(e.substr(start, pos - start));
      start = pos + 1;
    }
    if (!syntax::is_space(c)) {
      prev = c;
    }
    return false;
  });
  operands.push_back(e.substr(start));

  for (const std::string_view operand : operands) {
    if (!is_int_atom(operand)) {
      return false;
    }
  }
  return true;
}

bool is_pair(std::string_view e)
{
  if (!wraps_whole(e, '(')) {
    return false;
  }
  const auto parts = split_top_level(inner_of(e), ',');
  return parts.size() == 2 && !parts[0].empty() && !parts[1].empty();
}

bool is_ipv4_literal(std::string_view e)
{
  int octets = 0;
  size_t start = 0;
  while (true) {
    const size_t dot = e.find('.', start);
    const std::string_view octet =
      e.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
    if (octet.size() > 3 || !all_digits(octet) || std::stoi(std::string(octet)) > 255) {
      return false;
    }
    ++octets;
    if (dot == std::string_view::npos) {
      break;
    }
    start = dot + 1;
  }
  return octets == 4;
}

bool is_ipv6_literal(std::string_view e)
{
  if (e.find(':') == std::string_view::npos) {
    return false;
  }

  const size_t compressed = e.find("::");
  if (compressed == std::string_view::npos) {
    int groups = 0;
    return count_ipv6_groups(e, true, groups) && groups == 8;
  }
  if (e.find("::", compressed + 1) != std::string_view::npos) {
    return false;
  }

  int head = 0;
  int tail = 0;
  if (
    !count_ipv6_groups(e.substr(0, compressed), false, head) ||
    !count_ipv6_groups(e.substr(compressed + 2), true, tail)) {
    return false;
  }
  return head + tail <= 7;
}

bool is_ip(std::string_view e)
{
  std::string_view base = e;
  strip_mask_call(e, base);
  return is_ipv4_literal(base) || is_ipv6_literal(base);
}

bool is_prefix(std::string_view e)
{
  if (e == "net") {
    return true;
  }

  std::string_view base;
  if (strip_mask_call(e, base)) {
    return base == "net";
  }

  const size_t slash = e.rfind('/');
  if (slash == std::string_view::npos) {
    return false;
  }
  const std::string_view addr = trim(e.substr(0, slash));
  const std::string_view len = trim(e.substr(slash + 1));
  if (len.size() > 3 || !all_digits(len)) {
    return false;
  }
  const int length = std::stoi(std::string(len));
  if (is_ipv4_literal(addr)) {
    return length <= 32;
  }
  if (is_ipv6_literal(addr)) {
    return length <= 128;
  }
  return false;
}

bool is_string_literal(std::string_view e)
{
  if (e.size() < 2 || e.front() != '"') {
    return false;
  }
  const Scanner s(e);
  ScanCursor cur = s.advance(ScanCursor{});
  while (cur.pos < s.size() && !cur.in_code()) {
    cur = s.advance(cur);
  }
  return cur.in_code() && cur.pos == e.size();
}

bool is_string(std::string_view e)
{
  if (is_string_literal(e)) {
    return true;
  }
  const auto parts = split_top_level(e, ',');
  if (parts.size() < 2) {
    return false;
  }
  for (const std::string_view part : parts) {
    if (is_string_literal(part)) {
      return true;
    }
  }
  return false;
}

bool is_set(std::string_view e) { return wraps_whole(e, '{'); }

bool is_bool(std::string_view e)
{
  if (e == "true" || e == "false") {
    return true;
  }
  return any_top_level(e, [&](uint32_t pos) {
    const char c = e[pos];
    if (c == '=' || c == '<' || c == '>' || c == '!' || c == '~') {
      return true;
    }
    const std::string_view rest = e.substr(pos);
    return rest.rfind("&&", 0) == 0 || rest.rfind("||", 0) == 0;
  });
}

}  // namespace shape

}  // namespace bird_typefix
