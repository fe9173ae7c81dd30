// lsconf/lsp/language_service.hpp - Editor-facing language service (serverless)
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "lsconf/ast/config_ast.hpp"
#include "lsconf/basic/diagnostic.hpp"
#include "lsconf/lsp/completion.hpp"
#include "lsconf/lsp/context_info.hpp"
#include "lsconf/schema/schema_registry.hpp"
#include "lsconf/syntax/error_decoder.hpp"

namespace lsconf::lsp
{

/**
 * Serverless language service for pipeline configurations.
 *
 * Provides diagnostics, completion, context info and schema version control
 * for a host (editor, CLI or the stdio server). Every call is a fresh
 * computation over the given text: nothing is cached between calls.
 *
 * Each call takes one snapshot from the registry and uses it throughout, so
 * a concurrent version switch never mixes two schemas in one result.
 *
 * Offsets are byte offsets, the unit the external parser reports.
 */
class LanguageService
{
public:
  /**
   * @param registry Schema registry; must outlive the service
   * @param decoder  Parser report decoder (PegReportDecoder when null)
   */
  explicit LanguageService(
    SchemaRegistry & registry, std::unique_ptr<syntax::ErrorDecoder> decoder = nullptr);
  ~LanguageService();

  LanguageService(const LanguageService &) = delete;
  LanguageService & operator=(const LanguageService &) = delete;

  LanguageService(LanguageService && other) noexcept;
  LanguageService & operator=(LanguageService && other) noexcept;

  // Diagnostics (decoder on failure, schema validation on success)
  [[nodiscard]] DiagnosticBag diagnostics(
    std::string_view text, const ast::ParseOutcome & outcome) const;
  [[nodiscard]] std::string diagnostics_json(
    std::string_view text, const ast::ParseOutcome & outcome) const;

  // Completion
  [[nodiscard]] CompletionResult completion(std::string_view text, uint64_t offset) const;
  [[nodiscard]] std::string completion_json(std::string_view text, uint64_t offset) const;

  // Context info (help panel)
  [[nodiscard]] ContextInfo context_info(std::string_view text, uint64_t offset) const;
  [[nodiscard]] std::string context_info_json(std::string_view text, uint64_t offset) const;

  // Schema versions
  [[nodiscard]] std::string versions_json() const;
  RegistryLoadResult switch_version(const std::string & version);
  std::string switch_version_json(const std::string & version);

private:
  struct Impl;
  Impl * impl_;
};

/// Serialize diagnostics as `{ok, diagnostics:[{from,to,severity,message,code}]}`.
[[nodiscard]] nlohmann::json diagnostics_to_json(bool ok, const DiagnosticBag & diags);

}  // namespace lsconf::lsp
