// lsconf/syntax/error_decoder.cpp - PEG report decoding
//
#include "lsconf/syntax/error_decoder.hpp"

#include <charconv>
#include <limits>
#include <regex>
#include <string>
#include <vector>

#include "lsconf/syntax/keywords.hpp"

namespace lsconf::syntax
{

namespace
{

// [tag:]LINE:COL (OFFSET)[: [rule NAME: ]MESSAGE]
const std::regex & report_line_regex()
{
  static const std::regex re(R"(^(?:\S+:)?(\d+):(\d+)\s+\((\d+)\)(?::\s*(?:rule\s+\S+:\s*)?)(.*))");
  return re;
}

// at pos LINE:COL [OFFSET] and [POS]
const std::regex & farthest_regex()
{
  static const std::regex re(R"(at pos (\d+):(\d+) \[(\d+)\] and \[(\d+)\])");
  return re;
}

/// Digits to offset; values past uint64 saturate and are clamped later.
uint64_t parse_offset(const std::string & digits)
{
  uint64_t value = 0;
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec == std::errc::result_out_of_range) {
    return std::numeric_limits<uint64_t>::max();
  }
  return value;
}

std::vector<std::string_view> split_lines(std::string_view text)
{
  std::vector<std::string_view> lines;
  size_t start = 0;
  while (start <= text.size()) {
    const size_t nl = text.find('\n', start);
    if (nl == std::string_view::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, nl - start));
    start = nl + 1;
  }
  return lines;
}

}  // namespace

DiagnosticBag PegReportDecoder::decode(
  std::string_view report, std::optional<std::string_view> farthest,
  std::string_view document) const
{
  DiagnosticBag bag(document.size());

  for (const std::string_view raw : split_lines(report)) {
    const std::string line(trim(raw));
    if (line.empty()) {
      continue;
    }

    std::smatch m;
    if (!std::regex_search(line, m, report_line_regex())) {
      // Keep unrecognised lines visible at the document start.
      if (!bag.covers_offset(0)) {
        bag.report_error(0, 1, line).with_code(diag_code::k_unrecognized_report);
      }
      continue;
    }

    const uint64_t offset = parse_offset(m[3].str());
    std::string message = m[4].str();
    if (message.empty()) {
      message = line;
    }

    const uint32_t from = clamp_from(offset, document.size());
    if (bag.covers_offset(from)) {
      continue;
    }
    bag.report_error(from, uint64_t{from} + 1, std::move(message))
      .with_code(diag_code::k_syntax_error);
  }

  if (!bag.has_errors()) {
    std::string message(trim(report));
    if (message.empty()) {
      message = "parser reported a failure without details";
    }
    bag.report_error(0, 1, std::move(message)).with_code(diag_code::k_unrecognized_report);
  }

  if (farthest && !trim(*farthest).empty()) {
    decode_farthest(*farthest, bag);
  }

  return bag;
}

void PegReportDecoder::decode_farthest(std::string_view farthest, DiagnosticBag & bag)
{
  const std::string text(farthest);
  std::smatch m;
  if (!std::regex_search(text, m, farthest_regex())) {
    return;
  }

  const uint32_t from = clamp_from(parse_offset(m[3].str()), bag.document_size());
  if (bag.covers_offset(from)) {
    return;
  }

  std::string message;
  for (const std::string_view raw : split_lines(farthest)) {
    std::string_view line = trim(raw);
    if (line.substr(0, 2) != "->") {
      continue;
    }
    line = trim(line.substr(2));
    if (!message.empty()) {
      message += "; ";
    }
    message += line;
  }
  if (message.empty()) {
    message = k_farthest_fallback;
  }

  bag.report_warning(from, uint64_t{from} + 1, std::move(message))
    .with_code(diag_code::k_farthest_failure);
}

}  // namespace lsconf::syntax
