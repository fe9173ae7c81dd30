// lsconf/schema/schema_source.cpp - Directory and in-memory schema sources
//
#include "lsconf/schema/schema_source.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace lsconf
{

// ============================================================================
// DirectorySchemaSource
// ============================================================================

DirectorySchemaSource::DirectorySchemaSource(std::filesystem::path directory)
: directory_(std::move(directory))
{
}

std::vector<std::string> DirectorySchemaSource::versions() const
{
  namespace fs = std::filesystem;

  std::vector<std::string> result;
  std::error_code ec;
  for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec) || type_ec) {
      continue;
    }
    const fs::path & p = it->path();
    if (p.extension() != k_extension) {
      continue;
    }
    result.push_back(p.stem().string());
  }

  std::sort(result.begin(), result.end());
  return result;
}

std::optional<std::string> DirectorySchemaSource::read(const std::string & version) const
{
  // Reject anything that could escape the directory.
  if (
    version.empty() || version.find('/') != std::string::npos ||
    version.find('\\') != std::string::npos || version == "." || version == "..") {
    return std::nullopt;
  }

  const std::filesystem::path file = directory_ / (version + k_extension);
  std::ifstream in(file, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }

  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

std::string DirectorySchemaSource::describe() const { return directory_.string(); }

// ============================================================================
// InMemorySchemaSource
// ============================================================================

std::vector<std::string> InMemorySchemaSource::versions() const
{
  std::vector<std::string> result;
  result.reserve(documents_.size());
  for (const auto & [version, text] : documents_) {
    result.push_back(version);
  }
  return result;
}

std::optional<std::string> InMemorySchemaSource::read(const std::string & version) const
{
  const auto it = documents_.find(version);
  if (it == documents_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace lsconf
