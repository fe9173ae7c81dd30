// lsconf/analysis/context_scanner.cpp - Brace-nesting scanner
//
#include "lsconf/analysis/context_scanner.hpp"

#include <iterator>
#include <utility>
#include <vector>

namespace lsconf::analysis
{

using syntax::is_blank;
using syntax::is_ident_char;
using syntax::is_ident_start;

std::string_view context_kind_to_string(ContextKind k) noexcept
{
  switch (k) {
    case ContextKind::Section:
      return "section";
    case ContextKind::Plugin:
      return "plugin";
    case ContextKind::Option:
      return "option";
    case ContextKind::Codec:
      return "codec";
    case ContextKind::None:
      return "none";
  }
  return "none";
}

namespace
{

enum class ScanMode : uint8_t {
  Completion,  ///< Stop at the cursor; bail out inside strings and comments
  Structural,  ///< Look past the cursor; never bail out on literals
};

size_t clamp_offset(uint64_t offset, size_t size)
{
  return offset > size ? size : static_cast<size_t>(offset);
}

// ============================================================================
// FrameStack
// ============================================================================

class FrameStack
{
public:
  /// @return false if the depth cap would be exceeded
  [[nodiscard]] bool push(FrameKind kind, std::optional<SectionType> section_type,
                          std::string plugin_name = {})
  {
    if (frames_.size() >= k_max_scan_depth) {
      return false;
    }
    frames_.push_back(ScanFrame{kind, section_type, std::move(plugin_name)});
    return true;
  }

  /// Pops the top frame; an unmatched close is ignored.
  void pop()
  {
    if (!frames_.empty()) {
      frames_.pop_back();
    }
  }

  [[nodiscard]] bool empty() const noexcept { return frames_.empty(); }
  [[nodiscard]] const ScanFrame & top() const { return frames_.back(); }

  [[nodiscard]] std::optional<FrameKind> top_kind() const
  {
    if (frames_.empty()) {
      return std::nullopt;
    }
    return frames_.back().kind;
  }

  /// Section type of the nearest frame that has one.
  [[nodiscard]] std::optional<SectionType> current_section_type() const
  {
    for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
      if (it->section_type) {
        return it->section_type;
      }
    }
    return std::nullopt;
  }

  /// Nearest Plugin frame below the top, nullptr if none.
  [[nodiscard]] const ScanFrame * enclosing_plugin() const
  {
    if (frames_.size() < 2) {
      return nullptr;
    }
    for (auto it = std::next(frames_.rbegin()); it != frames_.rend(); ++it) {
      if (it->kind == FrameKind::Plugin) {
        return &*it;
      }
    }
    return nullptr;
  }

private:
  std::vector<ScanFrame> frames_;
};

// ============================================================================
// Forward scan
// ============================================================================

/**
 * Runs the forward scan from 0 to `pos`.
 *
 * @return false if the scan must report None (cursor inside a literal in
 *         completion mode, or depth cap exceeded)
 */
bool scan_frames(std::string_view text, size_t pos, ScanMode mode, FrameStack & stack)
{
  const bool completion = mode == ScanMode::Completion;
  // Inner lookahead limit. The structural scan may read past the cursor.
  const size_t lim = completion ? pos : text.size();

  size_t i = 0;
  while (i < pos) {
    const char ch = text[i];

    // Line comment
    if (ch == '#') {
      while (i < lim && text[i] != '\n') {
        ++i;
      }
      if (completion && i >= pos) {
        return false;
      }
      continue;
    }

    // Quoted string, backslash escapes the next character
    if (ch == '"' || ch == '\'') {
      const char quote = ch;
      ++i;
      while (i < lim && text[i] != quote) {
        if (text[i] == '\\') {
          ++i;
        }
        ++i;
      }
      if (completion && i >= pos) {
        return false;
      }
      if (i < lim) {
        ++i;
      }
      continue;
    }

    // Brace not claimed by a keyword or identifier
    if (ch == '{') {
      if (!stack.push(FrameKind::Conditional, stack.current_section_type())) {
        return false;
      }
      ++i;
      continue;
    }

    if (ch == '}') {
      stack.pop();
      ++i;
      continue;
    }

    // `=> {` opens a hash value
    if (ch == '=' && i + 1 < lim && text[i + 1] == '>') {
      i += 2;
      while (i < lim && is_blank(text[i])) {
        ++i;
      }
      if (i < lim && text[i] == '{') {
        if (!stack.push(FrameKind::HashValue, stack.current_section_type())) {
          return false;
        }
        ++i;
      }
      continue;
    }

    if (is_ident_start(ch)) {
      const size_t start = i;
      while (i < lim && is_ident_char(text[i])) {
        ++i;
      }
      const std::string_view ident = text.substr(start, i - start);

      size_t j = i;
      while (j < lim && is_blank(text[j])) {
        ++j;
      }
      if (j >= lim || text[j] != '{') {
        continue;
      }

      bool pushed = false;
      if (const auto section = section_type_from_string(ident)) {
        pushed = stack.push(FrameKind::Section, section);
      } else if (syntax::is_conditional_keyword(ident)) {
        pushed = stack.push(FrameKind::Conditional, stack.current_section_type());
      } else {
        const auto top = stack.top_kind();
        if (top == FrameKind::Section || top == FrameKind::Conditional) {
          pushed =
            stack.push(FrameKind::Plugin, stack.current_section_type(), std::string(ident));
        } else {
          // Nested hash key, or a brace at top level
          pushed = stack.push(FrameKind::HashValue, stack.current_section_type());
        }
      }
      if (!pushed) {
        return false;
      }
      i = j + 1;
      continue;
    }

    ++i;
  }

  return true;
}

Context classify_frame(const ScanFrame & frame)
{
  if (!frame.section_type) {
    return Context::none();
  }
  switch (frame.kind) {
    case FrameKind::Section:
    case FrameKind::Conditional:
      return {ContextKind::Plugin, frame.section_type, {}};
    case FrameKind::Plugin:
      return {ContextKind::Option, frame.section_type, frame.plugin_name};
    case FrameKind::HashValue:
      break;
  }
  return Context::none();
}

/// Value position check: `<name> => <partial>` at the cursor.
/// @return std::nullopt if the cursor is not in a value position
std::optional<Context> classify_value_position(std::string_view text, size_t pos)
{
  size_t p = pos;
  while (p > 0 && is_ident_char(text[p - 1])) {
    --p;
  }
  while (p > 0 && is_blank(text[p - 1])) {
    --p;
  }
  if (p < 2 || text[p - 2] != '=' || text[p - 1] != '>') {
    return std::nullopt;
  }

  size_t ap = p - 2;
  while (ap > 0 && (text[ap - 1] == ' ' || text[ap - 1] == '\t')) {
    --ap;
  }
  const size_t name_end = ap;
  while (ap > 0 && is_ident_char(text[ap - 1])) {
    --ap;
  }
  if (text.substr(ap, name_end - ap) == syntax::k_codec_option) {
    return Context::codec();
  }
  return Context::none();
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

Context detect_context(std::string_view text, uint64_t offset)
{
  const size_t pos = clamp_offset(offset, text.size());

  FrameStack stack;
  if (!scan_frames(text, pos, ScanMode::Completion, stack)) {
    return Context::none();
  }

  if (auto value = classify_value_position(text, pos)) {
    return *value;
  }

  if (stack.empty()) {
    return Context::top_level();
  }
  return classify_frame(stack.top());
}

Context detect_structural_context(std::string_view text, uint64_t offset)
{
  const size_t pos = clamp_offset(offset, text.size());

  FrameStack stack;
  if (!scan_frames(text, pos, ScanMode::Structural, stack)) {
    return Context::none();
  }

  if (stack.empty()) {
    return Context::top_level();
  }

  const ScanFrame & top = stack.top();
  if (top.kind == FrameKind::HashValue) {
    if (const ScanFrame * plugin = stack.enclosing_plugin()) {
      return classify_frame(*plugin);
    }
    return Context::none();
  }
  return classify_frame(top);
}

uint32_t completion_from(std::string_view text, uint64_t offset)
{
  size_t from = clamp_offset(offset, text.size());
  while (from > 0 && is_ident_char(text[from - 1])) {
    --from;
  }
  return static_cast<uint32_t>(from);
}

std::string_view word_at(std::string_view text, uint64_t offset)
{
  const size_t pos = clamp_offset(offset, text.size());

  size_t start = pos;
  while (start > 0 && is_ident_char(text[start - 1])) {
    --start;
  }
  size_t end = pos;
  while (end < text.size() && is_ident_char(text[end])) {
    ++end;
  }
  return text.substr(start, end - start);
}

}  // namespace lsconf::analysis
