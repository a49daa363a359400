// bird_typefix/syntax/scanner.hpp - String/comment/nesting aware cursor
//
// The scanner never owns state between calls: every operation takes a
// ScanCursor value (or an offset) and returns a new one, so a single Scanner
// over an immutable buffer can be shared freely.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

#include "bird_typefix/basic/source_manager.hpp"
#include "bird_typefix/syntax/scan_error.hpp"

namespace bird_typefix::syntax
{

// ============================================================================
// Character classes
// ============================================================================

[[nodiscard]] constexpr bool is_ident_start(char c) noexcept
{
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

[[nodiscard]] constexpr bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

[[nodiscard]] constexpr bool is_ident_continue(char c) noexcept
{
  return is_ident_start(c) || is_digit(c);
}

[[nodiscard]] constexpr bool is_space(char c) noexcept
{
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

[[nodiscard]] constexpr bool is_opener(char c) noexcept { return c == '{' || c == '(' || c == '['; }
[[nodiscard]] constexpr bool is_closer(char c) noexcept { return c == '}' || c == ')' || c == ']'; }

// ============================================================================
// ScanCursor
// ============================================================================

enum class QuoteMode : uint8_t {
  None,
  Double,  // "..."
  Single,  // '...' (quoted symbol names)
};

enum class CommentMode : uint8_t {
  None,
  Line,   // # ... end of line
  Block,  // /* ... */
};

struct ScanCursor
{
  uint32_t pos = 0;
  int32_t depth = 0;  ///< relative to where the scan started
  QuoteMode quote = QuoteMode::None;
  CommentMode comment = CommentMode::None;
  uint32_t region_start = 0;  ///< where the current string/comment opened

  [[nodiscard]] constexpr bool in_code() const noexcept
  {
    return quote == QuoteMode::None && comment == CommentMode::None;
  }
};

/**
 * Result of skip_to_matching_close().
 */
struct MatchResult
{
  /// Offset just past the matching close (only valid if success == true)
  uint32_t end = 0;

  bool success = false;

  ScanError error;

  static MatchResult ok(uint32_t end)
  {
    MatchResult r;
    r.end = end;
    r.success = true;
    return r;
  }

  static MatchResult fail(ScanError e)
  {
    MatchResult r;
    r.error = std::move(e);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Scanner
// ============================================================================

class Scanner
{
public:
  explicit Scanner(std::string_view src) noexcept : src_(src) {}

  [[nodiscard]] std::string_view source() const noexcept { return src_; }
  [[nodiscard]] uint32_t size() const noexcept { return static_cast<uint32_t>(src_.size()); }

  [[nodiscard]] char peek(uint32_t pos) const noexcept
  {
    return (pos < src_.size()) ? src_[pos] : '\0';
  }
  [[nodiscard]] bool starts_with(uint32_t pos, std::string_view s) const noexcept
  {
    return src_.size() >= pos + s.size() && src_.substr(pos, s.size()) == s;
  }

  /// Consume one lexical unit (a byte, an escape pair, or a comment marker).
  [[nodiscard]] ScanCursor advance(ScanCursor cur) const noexcept;

  /**
   * Given the offset of `{`, `(` or `[`, return the offset just past its
   * matching close. Nested groups, strings and comments are skipped.
   */
  [[nodiscard]] MatchResult skip_to_matching_close(uint32_t open_offset) const;

  /**
   * Find the next occurrence of `token` outside strings and comments at the
   * same nesting depth as `from`. Returns nullopt when `within` ends or the
   * group enclosing `from` closes first.
   */
  [[nodiscard]] std::optional<uint32_t> find_next_top_level_token(
    uint32_t from, std::string_view token, SourceRange within) const;

  /// Skip whitespace and comments starting at pos, never past limit.
  [[nodiscard]] uint32_t skip_trivia(uint32_t pos, uint32_t limit) const noexcept;

  /// True if `keyword` starts at pos and is not part of a longer identifier.
  [[nodiscard]] bool keyword_at(uint32_t pos, std::string_view keyword) const noexcept;

  /// Shrink a range so it neither starts nor ends with whitespace.
  [[nodiscard]] SourceRange trim(SourceRange range) const noexcept;

  [[nodiscard]] std::string_view slice(SourceRange range) const noexcept;

  /// Describe why a scan that started at open_offset ran off the end.
  [[nodiscard]] ScanError unterminated_error(const ScanCursor & at_end, uint32_t open_offset) const;

private:
  [[nodiscard]] bool token_at(uint32_t pos, std::string_view token) const noexcept;

  std::string_view src_;
};

}  // namespace bird_typefix::syntax
