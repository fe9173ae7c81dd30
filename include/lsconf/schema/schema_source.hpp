// lsconf/schema/schema_source.hpp - Where versioned schema data comes from
//
#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lsconf
{

/**
 * A set of named schema versions, each stored as JSON text.
 */
class SchemaSource
{
public:
  virtual ~SchemaSource() = default;

  /// Available version names, sorted ascending.
  [[nodiscard]] virtual std::vector<std::string> versions() const = 0;

  /// JSON text of a version, std::nullopt if the version is absent.
  [[nodiscard]] virtual std::optional<std::string> read(const std::string & version) const = 0;

  /// Human-readable origin, used in log lines.
  [[nodiscard]] virtual std::string describe() const = 0;
};

/**
 * One `<version>.json` file per version inside a directory.
 */
class DirectorySchemaSource : public SchemaSource
{
public:
  explicit DirectorySchemaSource(std::filesystem::path directory);

  [[nodiscard]] std::vector<std::string> versions() const override;
  [[nodiscard]] std::optional<std::string> read(const std::string & version) const override;
  [[nodiscard]] std::string describe() const override;

  [[nodiscard]] const std::filesystem::path & directory() const noexcept { return directory_; }

  /// File extension of version files.
  static constexpr const char * k_extension = ".json";

private:
  std::filesystem::path directory_;
};

/**
 * Versions held in memory (tests, embedding hosts).
 */
class InMemorySchemaSource : public SchemaSource
{
public:
  InMemorySchemaSource() = default;
  explicit InMemorySchemaSource(std::map<std::string, std::string> documents)
  : documents_(std::move(documents))
  {
  }

  void add(std::string version, std::string json_text)
  {
    documents_[std::move(version)] = std::move(json_text);
  }

  [[nodiscard]] std::vector<std::string> versions() const override;
  [[nodiscard]] std::optional<std::string> read(const std::string & version) const override;
  [[nodiscard]] std::string describe() const override { return "<memory>"; }

private:
  std::map<std::string, std::string> documents_;
};

}  // namespace lsconf
