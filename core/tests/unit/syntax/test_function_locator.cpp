// tests/syntax/test_function_locator.cpp - Unit tests for function declaration discovery
#include <gtest/gtest.h>

#include <string_view>

#include "bird_typefix/syntax/function_locator.hpp"

using bird_typefix::ErrorKind;
using bird_typefix::locate_functions;
using bird_typefix::LocateResult;
using bird_typefix::syntax::Scanner;

namespace
{

LocateResult locate(const Scanner & s) { return locate_functions(s); }

}  // namespace

TEST(SyntaxFunctionLocator, FindsPlainFunction)
{
  const Scanner s("function f() { return 1; }");
  const auto r = locate(s);
  ASSERT_TRUE(r.errors.empty());
  ASSERT_EQ(r.functions.size(), 1U);

  const auto & fn = r.functions[0];
  EXPECT_EQ(fn.name, "f");
  EXPECT_FALSE(fn.is_annotated());
  EXPECT_EQ(s.slice(fn.param_list), "()");
  EXPECT_EQ(fn.insertion_point, 12U);
  EXPECT_EQ(s.slice(fn.body), "{ return 1; }");
  EXPECT_EQ(s.slice(fn.body_interior()), " return 1; ");
}

TEST(SyntaxFunctionLocator, ParsesParametersAcrossLines)
{
  const Scanner s("function bgp_community(int AS,\n    int REGION)\n{\n  return (AS, REGION);\n}\n");
  const auto r = locate(s);
  ASSERT_TRUE(r.errors.empty());
  ASSERT_EQ(r.functions.size(), 1U);
  EXPECT_EQ(r.functions[0].name, "bgp_community");
  EXPECT_EQ(s.slice(r.functions[0].param_list), "(int AS,\n    int REGION)");
}

TEST(SyntaxFunctionLocator, RecordsExistingReturnTypes)
{
  const Scanner s(
    "function a() -> int { return 1; }\n"
    "function b() -> pair (int, int) { return (1, 2); }\n"
    "function c() -> prefix set\n{ return [1.0.0.0/8]; }\n");
  const auto r = locate(s);
  ASSERT_TRUE(r.errors.empty());
  ASSERT_EQ(r.functions.size(), 3U);

  ASSERT_TRUE(r.functions[0].is_annotated());
  EXPECT_EQ(s.slice(*r.functions[0].existing_return_type), "int");
  ASSERT_TRUE(r.functions[1].is_annotated());
  EXPECT_EQ(s.slice(*r.functions[1].existing_return_type), "pair (int, int)");
  ASSERT_TRUE(r.functions[2].is_annotated());
  EXPECT_EQ(s.slice(*r.functions[2].existing_return_type), "prefix set");
}

TEST(SyntaxFunctionLocator, ReturnsFunctionsInSourceOrder)
{
  const Scanner s("function one() {}\nfunction two() {}\nfunction three() {}\n");
  const auto r = locate(s);
  ASSERT_EQ(r.functions.size(), 3U);
  EXPECT_EQ(r.functions[0].name, "one");
  EXPECT_EQ(r.functions[1].name, "two");
  EXPECT_EQ(r.functions[2].name, "three");
}

TEST(SyntaxFunctionLocator, SkipsTopLevelBlocks)
{
  const Scanner s(
    "protocol bgp peer { import filter { accept; }; }\n"
    "filter x { function inner() { return 1; } }\n"
    "function f() { return 2; }\n");
  const auto r = locate(s);
  ASSERT_TRUE(r.errors.empty());
  ASSERT_EQ(r.functions.size(), 1U);
  EXPECT_EQ(r.functions[0].name, "f");
}

TEST(SyntaxFunctionLocator, IgnoresKeywordInCommentsStringsAndIdentifiers)
{
  const Scanner s(
    "# function a() { return 1; }\n"
    "/* function b() { return 1; } */\n"
    "define S = \"function c() { }\";\n"
    "myfunction = 1;\n"
    "function d() { }\n");
  const auto r = locate(s);
  ASSERT_TRUE(r.errors.empty());
  ASSERT_EQ(r.functions.size(), 1U);
  EXPECT_EQ(r.functions[0].name, "d");
}

TEST(SyntaxFunctionLocator, MissingNameIsMalformedAndScanContinues)
{
  const Scanner s("function (x) { }\nfunction ok() { return 1; }");
  const auto r = locate(s);
  ASSERT_EQ(r.errors.size(), 1U);
  EXPECT_EQ(r.errors[0].kind, ErrorKind::MalformedDeclaration);
  ASSERT_EQ(r.functions.size(), 1U);
  EXPECT_EQ(r.functions[0].name, "ok");
}

TEST(SyntaxFunctionLocator, MissingParameterListIsMalformed)
{
  const Scanner s("function f { return 1; }\nfunction g() { return 2; }");
  const auto r = locate(s);
  ASSERT_EQ(r.errors.size(), 1U);
  EXPECT_EQ(r.errors[0].kind, ErrorKind::MalformedDeclaration);
  EXPECT_EQ(r.errors[0].function_name, "f");
  ASSERT_EQ(r.functions.size(), 1U);
  EXPECT_EQ(r.functions[0].name, "g");
}

TEST(SyntaxFunctionLocator, MissingBodyIsMalformed)
{
  const Scanner s("function f() return 1;\nfunction g() { return 2; }");
  const auto r = locate(s);
  ASSERT_EQ(r.errors.size(), 1U);
  EXPECT_EQ(r.errors[0].kind, ErrorKind::MalformedDeclaration);
  ASSERT_EQ(r.functions.size(), 1U);
  EXPECT_EQ(r.functions[0].name, "g");
}

TEST(SyntaxFunctionLocator, EmptyArrowClauseIsMalformed)
{
  const Scanner s("function f() -> { return 1; }");
  const auto r = locate(s);
  ASSERT_EQ(r.errors.size(), 1U);
  EXPECT_EQ(r.errors[0].kind, ErrorKind::MalformedDeclaration);
  EXPECT_TRUE(r.functions.empty());
}

TEST(SyntaxFunctionLocator, UnclosedBodyIsUnbalanced)
{
  const Scanner s("function f() { if x { return 1; }\n");
  const auto r = locate(s);
  ASSERT_EQ(r.errors.size(), 1U);
  EXPECT_EQ(r.errors[0].kind, ErrorKind::UnbalancedDelimiter);
  EXPECT_EQ(r.errors[0].function_name, "f");
  EXPECT_TRUE(r.functions.empty());
}

TEST(SyntaxFunctionLocator, UnterminatedStringStopsTheScan)
{
  const Scanner s("function f() { return \"abc; }\nfunction g() { return 1; }\n");
  const auto r = locate(s);
  ASSERT_EQ(r.errors.size(), 1U);
  EXPECT_EQ(r.errors[0].kind, ErrorKind::UnbalancedDelimiter);
  EXPECT_EQ(r.errors[0].message, "unterminated string literal");
  EXPECT_TRUE(r.functions.empty());
}

TEST(SyntaxFunctionLocator, StrayCloserIsReportedAndScanContinues)
{
  const Scanner s("}\nfunction f() { return 1; }");
  const auto r = locate(s);
  ASSERT_EQ(r.errors.size(), 1U);
  EXPECT_EQ(r.errors[0].kind, ErrorKind::UnbalancedDelimiter);
  EXPECT_EQ(r.errors[0].message, "unexpected '}'");
  ASSERT_EQ(r.functions.size(), 1U);
}

TEST(SyntaxFunctionLocator, UnterminatedTrailingCommentIsReported)
{
  const Scanner s("function f() { return 1; }\n/* open");
  const auto r = locate(s);
  ASSERT_EQ(r.functions.size(), 1U);
  ASSERT_EQ(r.errors.size(), 1U);
  EXPECT_EQ(r.errors[0].message, "unterminated block comment");
}
