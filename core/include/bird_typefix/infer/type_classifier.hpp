// bird_typefix/infer/type_classifier.hpp - Return expression shape -> type
//
// Classification looks only at the surface syntax of the expression. Symbol
// types are never resolved, so e.g. `x + 1` stays Unclassified.
//
#pragma once

#include <string>
#include <string_view>

#include "bird_typefix/infer/inferred_type.hpp"

namespace bird_typefix
{

/**
 * Remove comments and collapse whitespace runs outside string literals.
 *
 * "(1,\n   a + b)  # pair" becomes "(1, a + b)".
 */
[[nodiscard]] std::string normalize_expression(std::string_view text);

/**
 * Map a return expression to the first matching entry of the type lattice.
 *
 * The text is normalized first and redundant outer parentheses are removed.
 * Rules are tried strictly in k_type_priority order; anything that matches
 * none of them is InferredType::Unclassified.
 */
[[nodiscard]] InferredType classify_expression(std::string_view text);

// ============================================================================
// Shape predicates (operate on normalized text)
// ============================================================================

namespace shape
{

/// Decimal literal with optional unary '-', or integer arithmetic of such.
[[nodiscard]] bool is_int(std::string_view e);

/// `( A , B )` with exactly one top-level comma.
[[nodiscard]] bool is_pair(std::string_view e);

[[nodiscard]] bool is_ipv4_literal(std::string_view e);
[[nodiscard]] bool is_ipv6_literal(std::string_view e);

/// IP literal, optionally followed by `.mask(<int>)`.
[[nodiscard]] bool is_ip(std::string_view e);

/// IP literal `/` length, `net`, or `net.mask(<int>)`.
[[nodiscard]] bool is_prefix(std::string_view e);

/// One complete double-quoted literal.
[[nodiscard]] bool is_string_literal(std::string_view e);

/// A string literal, or a bare comma list containing one.
[[nodiscard]] bool is_string(std::string_view e);

/// `{ ... }` spanning the whole expression.
[[nodiscard]] bool is_set(std::string_view e);

/// `true`/`false` or a top-level comparison, logical or match operator.
[[nodiscard]] bool is_bool(std::string_view e);

}  // namespace shape

}  // namespace bird_typefix
