// lsconf/basic/source_manager.hpp - Source offsets, ranges and line tables
//
// All positions in lsconf are byte offsets into the document text, the same
// unit the external configuration parser reports.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lsconf
{

// ============================================================================
// SourceLocation - Compact source position
// ============================================================================

/**
 * A byte offset into a document. Line and column information can be computed
 * on demand via SourceManager.
 */
class SourceLocation
{
public:
  /// Invalid/unknown location sentinel
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept : offset_(k_invalid_offset) {}

  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return offset_ != k_invalid_offset; }

  [[nodiscard]] constexpr bool is_invalid() const noexcept { return offset_ == k_invalid_offset; }

  [[nodiscard]] constexpr uint32_t get_offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceLocation other) const noexcept
  {
    return offset_ != other.offset_;
  }
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    return offset_ < other.offset_;
  }
  [[nodiscard]] constexpr bool operator<=(SourceLocation other) const noexcept
  {
    return offset_ <= other.offset_;
  }

private:
  uint32_t offset_;
};

// ============================================================================
// SourceRange - Half-open byte range [begin, end)
// ============================================================================

class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(SourceLocation start, SourceLocation end) noexcept
  : start_(start), end_(end)
  {
  }

  constexpr SourceRange(uint32_t start_offset, uint32_t end_offset) noexcept
  : start_(SourceLocation(start_offset)), end_(SourceLocation(end_offset))
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return start_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr uint32_t from() const noexcept { return start_.get_offset(); }
  [[nodiscard]] constexpr uint32_t to() const noexcept { return end_.get_offset(); }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return start_.is_valid() && end_.is_valid();
  }

  [[nodiscard]] constexpr bool is_invalid() const noexcept
  {
    return start_.is_invalid() || end_.is_invalid();
  }

  [[nodiscard]] constexpr bool contains(SourceLocation loc) const noexcept
  {
    return start_ <= loc && loc < end_;
  }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    if (is_invalid()) return 0;
    return end_.get_offset() - start_.get_offset();
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return start_ == other.start_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  SourceLocation start_;
  SourceLocation end_;
};

/**
 * Clamp a start offset into [0, size-1] (or 0 for an empty document).
 *
 * Parser-reported points and AST offsets may lie past the end of the text the
 * editor currently holds; every diagnostic goes through this clamp.
 */
[[nodiscard]] constexpr uint32_t clamp_from(uint64_t offset, size_t size) noexcept
{
  if (size == 0) {
    return 0;
  }
  if (offset >= size) {
    return static_cast<uint32_t>(size - 1);
  }
  return static_cast<uint32_t>(offset);
}

/// Clamp an end offset into [0, size].
[[nodiscard]] constexpr uint32_t clamp_to(uint64_t offset, size_t size) noexcept
{
  if (offset > size) {
    return static_cast<uint32_t>(size);
  }
  return static_cast<uint32_t>(offset);
}

// ============================================================================
// LineColumn - Human-readable position
// ============================================================================

/**
 * Human-readable line and column position (1-indexed).
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

/**
 * Source range with pre-computed line/column information, used when
 * rendering diagnostics.
 */
struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] SourceRange to_source_range() const noexcept { return {start_byte, end_byte}; }

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

// ============================================================================
// SourceManager - Document text and line table
// ============================================================================

/**
 * Owns a document's text and converts between byte offsets and line/column
 * positions. Line starts are pre-computed once per document.
 */
class SourceManager
{
public:
  SourceManager() = default;

  explicit SourceManager(std::string source) : source_(std::move(source)) { build_line_table(); }

  SourceManager(std::filesystem::path filePath, std::string source)
  : file_path_(std::move(filePath)), source_(std::move(source))
  {
    build_line_table();
  }

  [[nodiscard]] const std::filesystem::path & get_file_path() const noexcept { return file_path_; }

  [[nodiscard]] bool has_file_path() const noexcept { return !file_path_.empty(); }

  void set_source(std::string source)
  {
    source_ = std::move(source);
    build_line_table();
  }

  [[nodiscard]] std::string_view get_source() const noexcept { return source_; }

  [[nodiscard]] size_t size() const noexcept { return source_.size(); }

  [[nodiscard]] size_t get_line_count() const noexcept { return line_offsets_.size(); }

  /// Convert byte offset to line/column (1-indexed)
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Get the content of a specific line (0-indexed), without its newline
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view get_source_slice(SourceRange range) const noexcept;

  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table();

  std::filesystem::path file_path_;
  std::string source_;
  std::vector<uint32_t> line_offsets_;  ///< Offset of each line start
};

}  // namespace lsconf
