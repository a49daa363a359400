// bird_typefix/syntax/keywords.hpp - Reserved words of the BIRD filter language
#pragma once

#include <string_view>

namespace bird_typefix::syntax
{

// NOTE: BIRD filter-language words the scanner looks for. Everything else in
// a configuration file is treated as opaque text.

inline constexpr std::string_view k_function_keyword = "function";
inline constexpr std::string_view k_return_keyword = "return";
inline constexpr std::string_view k_return_arrow = "->";

}  // namespace bird_typefix::syntax
