// lsconf/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "lsconf/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace lsconf
{

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  rang::setControlMode(use_color_ ? rang::control::Force : rang::control::Off);
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceManager & source)
{
  std::string filename = "<document>";
  if (source.has_file_path()) {
    std::error_code ec;
    auto rel_path =
      std::filesystem::relative(source.get_file_path(), std::filesystem::current_path(), ec);
    filename = ec ? source.get_file_path().string() : rel_path.string();
  }
  const FullSourceRange fr = source.get_full_range(diag.range);

  // === Header line: warning[CODE]: message ===
  print_severity_header(diag);

  // === Location line: --> file:line:col ===
  if (fr.is_valid()) {
    fmt::print(
      os_, "{} {}\n", gutter_arrow(),
      fmt::format("{}:{}:{}", filename, fr.start_line, fr.start_column));
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
  }

  fmt::print(os_, "{}\n", gutter_pipe());

  if (fr.is_valid()) {
    const uint32_t end_col = (fr.end_line == fr.start_line && fr.end_column > fr.start_column)
                               ? fr.end_column
                               : (fr.start_column + 1);
    print_source_line(source, fr.start_line - 1, fr.start_column, end_col);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceManager & source)
{
  std::vector<Diagnostic> sorted_diags(diags.begin(), diags.end());

  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      return a.range.get_begin() < b.range.get_begin();
    });

  for (const auto & d : sorted_diags) {
    print(d, source);
  }
}

void DiagnosticPrinter::print_summary(const DiagnosticBag & diags)
{
  const size_t n_errors = diags.errors().size();
  const size_t n_warnings = diags.warnings().size();
  if (n_errors == 0 && n_warnings == 0) {
    return;
  }

  std::vector<std::string> parts;
  if (n_errors > 0) {
    parts.push_back(fmt::format("{} error{}", n_errors, n_errors == 1 ? "" : "s"));
  }
  if (n_warnings > 0) {
    parts.push_back(fmt::format("{} warning{}", n_warnings, n_warnings == 1 ? "" : "s"));
  }

  if (use_color_) {
    os_ << rang::style::bold;
  }
  fmt::print(os_, "{}\n", fmt::join(parts, ", "));
  if (use_color_) {
    os_ << rang::style::reset;
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string_view severity_str = severity_to_string(diag.severity);

  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
    }
    os_ << severity_str;
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
    return;
  }

  if (!diag.code.empty()) {
    fmt::print(os_, "{}[{}]: {}\n", severity_str, diag.code, diag.message);
  } else {
    fmt::print(os_, "{}: {}\n", severity_str, diag.message);
  }
}

void DiagnosticPrinter::print_source_line(
  const SourceManager & source, uint32_t line_index, uint32_t start_col, uint32_t end_col)
{
  const std::string_view line = source.get_line(line_index);

  if (line.empty()) {
    return;
  }

  const uint32_t line_num = line_index + 1;

  // Tabs -> 4 spaces
  std::string cleaned_line;
  cleaned_line.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      cleaned_line += "    ";
    } else if (c != '\r' && c != '\n') {
      cleaned_line += c;
    }
  }

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_num);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_num);
  }
  fmt::print(os_, "{}\n", cleaned_line);

  fmt::print(os_, "      {} ", gutter_pipe_only());

  std::string marker_prefix;
  uint32_t visual_col = 1;
  for (size_t char_idx = 0; visual_col < start_col && char_idx < line.size(); ++char_idx) {
    if (line[char_idx] == '\t') {
      marker_prefix += "    ";
    } else {
      marker_prefix += ' ';
    }
    visual_col++;
  }

  const size_t marker_len = (end_col > start_col) ? (end_col - start_col) : 1;

  fmt::print(os_, "{}", marker_prefix);
  if (use_color_) {
    os_ << rang::fg::red << rang::style::bold;
    fmt::print(os_, "{}", std::string(marker_len, '^'));
    os_ << rang::style::reset << rang::fg::reset;
  } else {
    fmt::print(os_, "{}", std::string(marker_len, '^'));
  }
  fmt::print(os_, "\n");
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

std::string DiagnosticPrinter::gutter_pipe_only() const
{
  if (use_color_) {
    return fmt::format("{}|{}", "\033[1;36m", "\033[0m");
  }
  return "|";
}

}  // namespace lsconf
