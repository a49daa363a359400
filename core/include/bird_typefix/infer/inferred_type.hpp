// bird_typefix/infer/inferred_type.hpp - The return-type lattice
#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace bird_typefix
{

/**
 * Result types the classifier can infer, in priority order (first = highest).
 */
enum class InferredType : uint8_t {
  Int,
  Pair,
  Ip,
  Prefix,
  String,
  Set,
  Bool,
  Unclassified,
};

inline constexpr std::array<InferredType, 7> k_type_priority = {
  InferredType::Int,    InferredType::Pair, InferredType::Ip,   InferredType::Prefix,
  InferredType::String, InferredType::Set,  InferredType::Bool,
};

/// Short name used in reports ("int", "pair", ..., "unclassified").
[[nodiscard]] constexpr std::string_view to_string(InferredType t) noexcept
{
  switch (t) {
    case InferredType::Int:
      return "int";
    case InferredType::Pair:
      return "pair";
    case InferredType::Ip:
      return "ip";
    case InferredType::Prefix:
      return "prefix";
    case InferredType::String:
      return "string";
    case InferredType::Set:
      return "set";
    case InferredType::Bool:
      return "bool";
    case InferredType::Unclassified:
      return "unclassified";
  }
  return "";
}

/// Text written after `->` in a function signature.
/// Pair element types are not inferred and always render as `(int, int)`.
[[nodiscard]] constexpr std::string_view type_name(InferredType t) noexcept
{
  if (t == InferredType::Pair) {
    return "pair (int, int)";
  }
  return to_string(t);
}

}  // namespace bird_typefix
