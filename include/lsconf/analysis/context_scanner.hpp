// lsconf/analysis/context_scanner.hpp - Classify the cursor position
//
// A forward scan over the raw text that tracks brace nesting, strings and
// comments. It needs no parse tree, so it keeps working while the document
// is syntactically broken mid-edit.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "lsconf/syntax/keywords.hpp"

namespace lsconf::analysis
{

// ============================================================================
// Scan Frames
// ============================================================================

enum class FrameKind : uint8_t {
  Section,      ///< input { ... }
  Plugin,       ///< grok { ... }
  Conditional,  ///< if ... { ... } and unattributed braces
  HashValue,    ///< match => { ... } and nested hashes
};

/**
 * One entry of the nesting stack.
 */
struct ScanFrame
{
  FrameKind kind = FrameKind::Conditional;
  std::optional<SectionType> section_type;
  std::string plugin_name;  ///< Only for Plugin frames
};

/// Nesting deeper than this degrades the result to ContextKind::None.
inline constexpr size_t k_max_scan_depth = 256;

// ============================================================================
// Context
// ============================================================================

enum class ContextKind : uint8_t {
  Section,  ///< Document top level: section keywords are valid
  Plugin,   ///< Inside a section or conditional: plugin names are valid
  Option,   ///< Inside a plugin block: option names are valid
  Codec,    ///< After `codec =>`: codec names are valid
  None,     ///< Nothing to offer
};

[[nodiscard]] std::string_view context_kind_to_string(ContextKind k) noexcept;

/**
 * Classification of a cursor position.
 *
 * section_type is set for Plugin and Option; plugin_name is set for Option.
 */
struct Context
{
  ContextKind kind = ContextKind::None;
  std::optional<SectionType> section_type;
  std::string plugin_name;

  [[nodiscard]] static Context none() { return {}; }
  [[nodiscard]] static Context top_level() { return {ContextKind::Section, std::nullopt, {}}; }
  [[nodiscard]] static Context codec() { return {ContextKind::Codec, std::nullopt, {}}; }

  [[nodiscard]] bool operator==(const Context & other) const
  {
    return kind == other.kind && section_type == other.section_type &&
           plugin_name == other.plugin_name;
  }
  [[nodiscard]] bool operator!=(const Context & other) const { return !(*this == other); }
};

// ============================================================================
// Scanner API
// ============================================================================

/**
 * Completion variant.
 *
 * Returns None while the cursor is inside a comment or a string, and Codec
 * or None when the cursor is in a value position (after `=>`). Offsets past
 * the end of the text are clamped.
 */
[[nodiscard]] Context detect_context(std::string_view text, uint64_t offset);

/**
 * Help-panel variant.
 *
 * Keeps a best-effort classification inside unterminated strings and
 * comments, ignores value positions, and reports a hash value as an option
 * of its enclosing plugin.
 */
[[nodiscard]] Context detect_structural_context(std::string_view text, uint64_t offset);

/// Start of the identifier that ends at `offset` (replacement start).
[[nodiscard]] uint32_t completion_from(std::string_view text, uint64_t offset);

/// Identifier surrounding `offset`, empty if there is none.
[[nodiscard]] std::string_view word_at(std::string_view text, uint64_t offset);

}  // namespace lsconf::analysis
