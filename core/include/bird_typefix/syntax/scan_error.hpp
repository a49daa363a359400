// bird_typefix/syntax/scan_error.hpp - Recoverable scanner/locator failures
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "bird_typefix/basic/source_manager.hpp"

namespace bird_typefix
{

enum class ErrorKind : uint8_t {
  UnbalancedDelimiter,   ///< brace/paren/string/comment never closes
  MalformedDeclaration,  ///< function signature does not parse
  MalformedReturn,       ///< return statement without terminating ';'
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind k) noexcept
{
  switch (k) {
    case ErrorKind::UnbalancedDelimiter:
      return "UnbalancedDelimiter";
    case ErrorKind::MalformedDeclaration:
      return "MalformedDeclaration";
    case ErrorKind::MalformedReturn:
      return "MalformedReturn";
  }
  return "";
}

/**
 * One error found while scanning a file.
 *
 * Errors are always local: `function_name` names the enclosing declaration
 * when there is one, and is empty for file-level problems.
 */
struct ScanError
{
  ErrorKind kind = ErrorKind::UnbalancedDelimiter;
  SourceRange range;
  std::string message;
  std::string function_name;
};

}  // namespace bird_typefix
