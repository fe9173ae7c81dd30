// lsconf/syntax/keywords.hpp - Section keywords and lexical helpers
//
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace lsconf
{

/**
 * Top-level section a plugin lives in.
 */
enum class SectionType : uint8_t {
  Input,
  Filter,
  Output,
};

inline constexpr std::array<SectionType, 3> k_all_section_types = {
  SectionType::Input,
  SectionType::Filter,
  SectionType::Output,
};

[[nodiscard]] constexpr std::string_view section_type_to_string(SectionType t) noexcept
{
  switch (t) {
    case SectionType::Input:
      return "input";
    case SectionType::Filter:
      return "filter";
    case SectionType::Output:
      return "output";
  }
  return "";
}

[[nodiscard]] constexpr std::optional<SectionType> section_type_from_string(
  std::string_view name) noexcept
{
  if (name == "input") return SectionType::Input;
  if (name == "filter") return SectionType::Filter;
  if (name == "output") return SectionType::Output;
  return std::nullopt;
}

}  // namespace lsconf

namespace lsconf::syntax
{

inline constexpr std::array<std::string_view, 3> k_section_keywords = {
  "input",
  "filter",
  "output",
};

// `else if` is seen by the scanner as `else` followed by `if`.
inline constexpr std::array<std::string_view, 2> k_conditional_keywords = {
  "if",
  "else",
};

/// The option whose value names a codec.
inline constexpr std::string_view k_codec_option = "codec";

[[nodiscard]] constexpr bool is_ident_start(char ch) noexcept
{
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || ch == '_';
}

[[nodiscard]] constexpr bool is_ident_char(char ch) noexcept
{
  return is_ident_start(ch) || (ch >= '0' && ch <= '9');
}

[[nodiscard]] constexpr bool is_blank(char ch) noexcept
{
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
}

[[nodiscard]] constexpr std::string_view trim(std::string_view s) noexcept
{
  while (!s.empty() && is_blank(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_blank(s.back())) s.remove_suffix(1);
  return s;
}

[[nodiscard]] constexpr bool is_conditional_keyword(std::string_view ident) noexcept
{
  for (const auto kw : k_conditional_keywords) {
    if (kw == ident) return true;
  }
  return false;
}

}  // namespace lsconf::syntax
