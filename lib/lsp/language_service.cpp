// lsconf/lsp/language_service.cpp
//
#include "lsconf/lsp/language_service.hpp"

#include <nlohmann/json.hpp>
#include <utility>

#include "lsconf/sema/semantic_validator.hpp"

namespace lsconf::lsp
{

using json = nlohmann::json;

json diagnostics_to_json(bool ok, const DiagnosticBag & diags)
{
  json out;
  out["ok"] = ok;
  out["diagnostics"] = json::array();
  for (const auto & d : diags) {
    json item;
    item["from"] = d.from();
    item["to"] = d.to();
    item["severity"] = std::string(severity_to_string(d.severity));
    item["message"] = d.message;
    if (!d.code.empty()) {
      item["code"] = d.code;
    }
    out["diagnostics"].push_back(std::move(item));
  }
  return out;
}

// ============================================================================
// LanguageService::Impl
// ============================================================================

struct LanguageService::Impl
{
  SchemaRegistry & registry;
  std::unique_ptr<syntax::ErrorDecoder> decoder;

  Impl(SchemaRegistry & reg, std::unique_ptr<syntax::ErrorDecoder> dec)
  : registry(reg), decoder(std::move(dec))
  {
    if (!decoder) {
      decoder = std::make_unique<syntax::PegReportDecoder>();
    }
  }
};

LanguageService::LanguageService(
  SchemaRegistry & registry, std::unique_ptr<syntax::ErrorDecoder> decoder)
: impl_(new Impl(registry, std::move(decoder)))
{
}

LanguageService::~LanguageService() { delete impl_; }

LanguageService::LanguageService(LanguageService && other) noexcept : impl_(other.impl_)
{
  other.impl_ = nullptr;
}

LanguageService & LanguageService::operator=(LanguageService && other) noexcept
{
  if (this != &other) {
    delete impl_;
    impl_ = other.impl_;
    other.impl_ = nullptr;
  }
  return *this;
}

// ============================================================================
// Diagnostics
// ============================================================================

DiagnosticBag LanguageService::diagnostics(
  std::string_view text, const ast::ParseOutcome & outcome) const
{
  if (!outcome.ok) {
    std::optional<std::string_view> farthest;
    if (outcome.farthest) {
      farthest = *outcome.farthest;
    }
    return impl_->decoder->decode(outcome.error, farthest, text);
  }

  const auto snapshot = impl_->registry.snapshot();
  return SemanticValidator(*snapshot).validate(outcome.config, text);
}

std::string LanguageService::diagnostics_json(
  std::string_view text, const ast::ParseOutcome & outcome) const
{
  return diagnostics_to_json(outcome.ok, diagnostics(text, outcome)).dump();
}

// ============================================================================
// Completion / Context info
// ============================================================================

CompletionResult LanguageService::completion(std::string_view text, uint64_t offset) const
{
  const auto snapshot = impl_->registry.snapshot();
  return CompletionEngine(*snapshot).complete(text, offset);
}

std::string LanguageService::completion_json(std::string_view text, uint64_t offset) const
{
  return to_json(completion(text, offset)).dump();
}

ContextInfo LanguageService::context_info(std::string_view text, uint64_t offset) const
{
  const auto snapshot = impl_->registry.snapshot();
  return ContextInfoBuilder(*snapshot).build(text, offset);
}

std::string LanguageService::context_info_json(std::string_view text, uint64_t offset) const
{
  return to_json(context_info(text, offset)).dump();
}

// ============================================================================
// Schema versions
// ============================================================================

std::string LanguageService::versions_json() const
{
  json out;
  out["versions"] = impl_->registry.list_versions();
  out["current"] = impl_->registry.current_version();
  return out.dump();
}

RegistryLoadResult LanguageService::switch_version(const std::string & version)
{
  return impl_->registry.load_version(version);
}

std::string LanguageService::switch_version_json(const std::string & version)
{
  const RegistryLoadResult r = switch_version(version);

  json out;
  out["ok"] = r.success;
  if (r.success) {
    out["version"] = version;
  } else {
    out["error"] = std::string(registry_status_to_string(r.status));
    out["message"] = r.error;
  }
  return out.dump();
}

}  // namespace lsconf::lsp
