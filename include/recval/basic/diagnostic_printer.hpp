// recval/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "recval/basic/diagnostic.hpp"
#include "recval/basic/source_manager.hpp"

namespace recval
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   warning[JSV01]: Member 'int[] Numbers' does not have value semantics
 *     --> Models/A.cs:6:40
 *      |
 *    6 | public record class A(int I, int[] Numbers);
 *      |                              ^^^^^^^^^^^^^
 *      |
 *      = help: declare 'Equals(A)' on the record
 *
 * When the referenced source file is not readable only the header and the
 * location line are printed.
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
  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /**
   * Print all diagnostics from a DiagnosticBag, ordered by location.
   */
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceRegistry & sources);

  void print_source_line(
    std::string_view line, uint32_t line_num, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);

  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace recval
