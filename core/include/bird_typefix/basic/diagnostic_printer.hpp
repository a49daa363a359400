// bird_typefix/basic/diagnostic_printer.hpp
//
// Prints scan diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "bird_typefix/basic/diagnostic.hpp"
#include "bird_typefix/basic/source_manager.hpp"

namespace bird_typefix
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   warning[W001]: conflicting return types in function 'pick'
 *     --> filters/bgp.conf:12:1
 *      |
 *   12 | function pick(int x) {
 *      |          ^^^^ return type left unannotated
 *   14 |     return 1;
 *      |            - int
 *      |
 *      = help: annotate the function by hand
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceFile & source);

  /// Print every diagnostic of the bag, ordered by primary location.
  void print_all(const DiagnosticBag & diags, const SourceFile & source);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceFile & source);

  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);

  void print_fixit(const FixIt & fixit, const SourceFile & source);
  void print_help(std::string_view message);

  void print_line_number(uint32_t line_num);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

/// Tabs expanded to four spaces, line breaks dropped.
[[nodiscard]] std::string expand_tabs(std::string_view line);

}  // namespace bird_typefix
