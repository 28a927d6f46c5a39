// tlc/basic/diagnostic_printer.hpp
//
// Prints diagnostics in Rust-style format, pointing at rendered terms.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "tlc/basic/diagnostic.hpp"

namespace tlc
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E001]: Unbound variable: y
 *     --> y
 *         |
 *         | - in (\x: Int. y)
 *         |
 *         = help: bind 'y' in the context before use
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

  /// Print a single diagnostic.
  void print(const Diagnostic & diag);

  /// Print all diagnostics from a DiagnosticBag, in insertion order.
  void print_all(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label(const Label & label);
  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace tlc
