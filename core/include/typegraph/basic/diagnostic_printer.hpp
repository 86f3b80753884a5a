// typegraph/basic/diagnostic_printer.hpp
//
// Prints diagnostics with their symbol-dump location in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "typegraph/basic/diagnostic.hpp"

namespace typegraph
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[L004]: unknown type id 'T:Missing'
 *     --> symbols.json#/types/3/baseType
 *      |
 *      = help: every referenced id must be declared in 'types'
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
   * Print all diagnostics from a DiagnosticBag in report order.
   */
  void print_all(const DiagnosticBag & diags);

private:
  void print_header(const Diagnostic & diag);
  void print_help(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

/**
 * Render a location as "file#/json/pointer" (or just the file).
 */
[[nodiscard]] std::string format_location(const SymbolLocation & location);

}  // namespace typegraph
