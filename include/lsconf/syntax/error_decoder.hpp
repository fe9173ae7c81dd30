// lsconf/syntax/error_decoder.hpp - Turn a parser failure report into diagnostics
//
// The full-grammar parser is an external collaborator that reports failures
// as free text. Decoders translate that text into positioned diagnostics so
// a parser swap only needs a new decoder.
//
#pragma once

#include <optional>
#include <string_view>

#include "lsconf/basic/diagnostic.hpp"

namespace lsconf::syntax
{

/**
 * Narrow seam between the external parser's report format and diagnostics.
 */
class ErrorDecoder
{
public:
  virtual ~ErrorDecoder() = default;

  /**
   * Decode a failure report.
   *
   * Never throws. For any input the result holds at least one Error, and all
   * ranges lie inside `document`.
   *
   * @param report   Multi-line failure text
   * @param farthest Optional farthest-failure report
   * @param document The text the parser failed on
   */
  [[nodiscard]] virtual DiagnosticBag decode(
    std::string_view report, std::optional<std::string_view> farthest,
    std::string_view document) const = 0;
};

/**
 * Decoder for PEG parser reports.
 *
 * Report lines look like
 *   `[tag:]LINE:COL (OFFSET): [rule NAME: ]MESSAGE`
 * and the farthest-failure report like
 *   `at pos LINE:COL [OFFSET] and [POS]`
 * followed by `-> expected ...` lines.
 *
 * - Each report line becomes one Error at [offset, offset + 1).
 * - Only the first message per offset is kept.
 * - Lines that do not match are anchored at offset 0.
 * - The farthest failure adds one Warning if its offset is not covered yet.
 */
class PegReportDecoder : public ErrorDecoder
{
public:
  [[nodiscard]] DiagnosticBag decode(
    std::string_view report, std::optional<std::string_view> farthest,
    std::string_view document) const override;

  /// Message used when the farthest report lists no expectations.
  static constexpr const char * k_farthest_fallback = "parse failed at this position";

private:
  static void decode_farthest(std::string_view farthest, DiagnosticBag & bag);
};

}  // namespace lsconf::syntax
