// lsconf/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "lsconf/basic/diagnostic.hpp"
#include "lsconf/basic/source_manager.hpp"

namespace lsconf
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   warning[W002]: unknown option "matchh"
 *     --> pipeline.conf:3:5
 *      |
 *    3 |     matchh => { "message" => "%{WORD}" }
 *      |     ^^^^^^
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceManager & source);

  /// Print all diagnostics sorted by start offset (stable).
  void print_all(const DiagnosticBag & diags, const SourceManager & source);

  /// Print the one-line summary ("2 warnings, 1 error").
  void print_summary(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_source_line(
    const SourceManager & source, uint32_t line_index, uint32_t start_col, uint32_t end_col);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace lsconf
