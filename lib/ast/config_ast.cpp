// lsconf/ast/config_ast.cpp
//
#include "lsconf/ast/config_ast.hpp"

namespace lsconf::ast
{

std::string_view value_kind_to_string(ValueKind k) noexcept
{
  switch (k) {
    case ValueKind::String:
      return "string";
    case ValueKind::Number:
      return "number";
    case ValueKind::Bool:
      return "bool";
    case ValueKind::Array:
      return "array";
    case ValueKind::Hash:
      return "hash";
    case ValueKind::Plugin:
      return "plugin";
    case ValueKind::Bareword:
      return "bareword";
  }
  return "bareword";
}

std::optional<ValueKind> value_kind_from_string(std::string_view s) noexcept
{
  if (s == "string") return ValueKind::String;
  if (s == "number") return ValueKind::Number;
  if (s == "bool") return ValueKind::Bool;
  if (s == "array") return ValueKind::Array;
  if (s == "hash") return ValueKind::Hash;
  if (s == "plugin") return ValueKind::Plugin;
  if (s == "bareword") return ValueKind::Bareword;
  return std::nullopt;
}

}  // namespace lsconf::ast
