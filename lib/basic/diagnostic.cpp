// lsconf/basic/diagnostic.cpp - Diagnostic implementation
#include "lsconf/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace lsconf
{

std::string_view severity_to_string(Severity s) noexcept
{
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
  }
  return "error";
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

Diagnostic DiagnosticBag::make(
  Severity severity, uint64_t from, uint64_t to, std::string message) const
{
  const uint32_t clamped_from = clamp_from(from, document_size_);
  const uint32_t clamped_to = clamp_to(std::max<uint64_t>(to, clamped_from), document_size_);

  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  d.range = SourceRange(clamped_from, clamped_to);
  return d;
}

DiagnosticBuilder DiagnosticBag::report_error(uint64_t from, uint64_t to, std::string message)
{
  return {*this, make(Severity::Error, from, to, std::move(message))};
}

DiagnosticBuilder DiagnosticBag::report_warning(uint64_t from, uint64_t to, std::string message)
{
  return {*this, make(Severity::Warning, from, to, std::move(message))};
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

void DiagnosticBag::add(const Diagnostic & diag) { diagnostics_.push_back(diag); }

std::vector<Diagnostic> DiagnosticBag::errors() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Error; });
  return result;
}

std::vector<Diagnostic> DiagnosticBag::warnings() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Warning; });
  return result;
}

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

bool DiagnosticBag::has_warnings() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Warning;
  });
}

bool DiagnosticBag::covers_offset(uint32_t from) const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [from](const Diagnostic & d) {
    return d.from() == from;
  });
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

}  // namespace lsconf
