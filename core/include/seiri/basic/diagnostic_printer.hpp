// seiri/basic/diagnostic_printer.hpp
//
// Prints per-file diagnostics with their source line and a position marker
// in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "seiri/basic/diagnostic.hpp"

namespace seiri
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   warning[parse-failure]: syntax error while parsing Python source
 *     --> pkg/broken.py:3:9
 *      |
 *    3 | def run(:
 *      |         ^
 *      |
 *      = help: the file keeps its node but contributes no definitions
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /**
   * Print a single diagnostic.
   */
  void print(const Diagnostic & diag);

  /**
   * Print all diagnostics from a DiagnosticBag, ordered by file then line.
   */
  void print_all(const DiagnosticBag & diags);

  /**
   * Print a one-line count of diagnostics per severity.
   */
  void print_summary(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_source_line(const Diagnostic & diag);
  void print_help(std::string_view message);

  /// Gutter text, bold cyan when colored
  void accent(std::string_view text);

  std::ostream & os_;
  bool use_color_;
};

}  // namespace seiri
