// dml/basic/diagnostic_printer.hpp
//
// Prints diagnostics with their location, the artifact they are about,
// and an optional source snippet.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "dml/basic/diagnostic.hpp"
#include "dml/basic/source_location.hpp"

namespace dml
{

/**
 * Prints diagnostics in a compiler-style format.
 *
 * Produces output like:
 *   error[ref-undefined-art]: No artifact has been found with name "Bar"
 *     --> model.cds:5:12
 *      |
 *    5 | entity Foo : Bar {}
 *      |            ^
 *      = note: in ns.Foo
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
   *
   * Source lines are shown only for files registered with content.
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
    const SourceFile & source, uint32_t line_index, uint32_t column, LabelStyle style,
    std::string_view label_message);

  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace dml
