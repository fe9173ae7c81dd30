// lsconf/basic/diagnostic.hpp - Diagnostic types for decoding/validation
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lsconf/basic/source_manager.hpp"

namespace lsconf
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 *
 * Errors come from the external parser's failure report; warnings come from
 * schema validation and never block the host (e.g. saving).
 */
enum class Severity : uint8_t {
  Error,
  Warning,
};

[[nodiscard]] std::string_view severity_to_string(Severity s) noexcept;

/// Diagnostic codes attached by the decoder and validator.
namespace diag_code
{
inline constexpr const char * k_syntax_error = "E001";
inline constexpr const char * k_unrecognized_report = "E002";
inline constexpr const char * k_unknown_plugin = "W001";
inline constexpr const char * k_unknown_option = "W002";
inline constexpr const char * k_unknown_codec = "W003";
inline constexpr const char * k_farthest_failure = "W004";
}  // namespace diag_code

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  // e.g., "W001"
  std::string message;
  SourceRange range;  // [from, to) in bytes

  [[nodiscard]] uint32_t from() const noexcept { return range.from(); }
  [[nodiscard]] uint32_t to() const noexcept { return range.to(); }

  [[nodiscard]] bool operator==(const Diagnostic & other) const
  {
    return severity == other.severity && code == other.code && message == other.message &&
           range == other.range;
  }
  [[nodiscard]] bool operator!=(const Diagnostic & other) const { return !(*this == other); }
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder that registers its diagnostic with the bag on destruction.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

/**
 * Ordered diagnostic collection bound to one document length.
 *
 * Every range reported through the bag is clamped so that
 * 0 <= from <= to <= document_size holds.
 */
class DiagnosticBag
{
public:
  DiagnosticBag() = default;
  explicit DiagnosticBag(size_t document_size) : document_size_(document_size) {}

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters (offsets are clamped)
  DiagnosticBuilder report_error(uint64_t from, uint64_t to, std::string message);
  DiagnosticBuilder report_warning(uint64_t from, uint64_t to, std::string message);

  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }
  [[nodiscard]] size_t document_size() const noexcept { return document_size_; }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;

  /// True if a diagnostic already starts at `from`.
  [[nodiscard]] bool covers_offset(uint32_t from) const;

  void merge(DiagnosticBag && other);

  [[nodiscard]] std::vector<Diagnostic> take() && { return std::move(diagnostics_); }

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  Diagnostic make(Severity severity, uint64_t from, uint64_t to, std::string message) const;

  size_t document_size_ = 0;
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace lsconf
