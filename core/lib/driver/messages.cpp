// bird_typefix/driver/messages.cpp - Message language selection
#include "bird_typefix/driver/messages.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <initializer_list>
#include <string>

namespace bird_typefix
{

namespace
{

bool mentions_chinese(std::string_view value)
{
  std::string lower(value);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lower.find("zh") != std::string::npos || lower.find("cn") != std::string::npos;
}

std::string_view env_or_empty(const char * name)
{
  const char * value = std::getenv(name);
  return value != nullptr ? std::string_view(value) : std::string_view();
}

}  // namespace

Language detect_language(
  std::string_view lang, std::string_view lc_all, std::string_view lc_messages)
{
  for (const std::string_view value : {lang, lc_all, lc_messages}) {
    if (mentions_chinese(value)) {
      return Language::Chinese;
    }
  }
  return Language::English;
}

Language detect_language_from_environment()
{
  return detect_language(env_or_empty("LANG"), env_or_empty("LC_ALL"), env_or_empty("LC_MESSAGES"));
}

std::string Messages::format(const LocalizedText & text, std::string_view arg) const
{
  return fmt::format(fmt::runtime(get(text)), arg);
}

}  // namespace bird_typefix
