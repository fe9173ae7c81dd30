// lsconf_server - Logstash config intelligence server (stdio JSON-RPC)
//
// Thin wrapper around lsconf::lsp::Server. Log lines go to stderr.
//
// Usage:
//   lsconf_server [--registry DIR] [--version V] [-v]
//
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "lsconf/lsp/language_service.hpp"
#include "lsconf/lsp/server.hpp"
#include "lsconf/project/project_config.hpp"
#include "lsconf/schema/schema_registry.hpp"
#include "lsconf/schema/schema_source.hpp"

namespace fs = std::filesystem;

namespace
{

struct ServerArgs
{
  std::string registry_dir;
  std::string version;
  bool verbose = false;
};

ServerArgs parse_args(int argc, char * argv[])
{
  ServerArgs args;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--registry" && i + 1 < argc) {
      args.registry_dir = argv[++i];
    } else if (arg == "--version" && i + 1 < argc) {
      args.version = argv[++i];
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    }
  }
  return args;
}

}  // namespace

int main(int argc, char * argv[])
{
  try {
    const ServerArgs args = parse_args(argc, argv);

    lsconf::ProjectConfig config;
    if (const auto config_path = lsconf::find_project_config(fs::current_path())) {
      auto config_result = lsconf::load_project_config(*config_path);
      if (config_result.success) {
        config = std::move(config_result.config);
      } else {
        // Keep serving with defaults.
        std::cerr << "lsconf_server: " << config_result.error << "\n";
      }
    }

    const fs::path registry_dir =
      args.registry_dir.empty() ? config.registry_directory() : fs::path(args.registry_dir);

    lsconf::SchemaRegistry registry(std::make_unique<lsconf::DirectorySchemaSource>(registry_dir));

    std::string version = args.version;
    if (version.empty() && config.registry.default_version) {
      version = *config.registry.default_version;
    }

    const auto loaded = version.empty() ? registry.load_latest() : registry.load_version(version);
    if (!loaded.success) {
      std::cerr << "lsconf_server: " << lsconf::registry_status_to_string(loaded.status) << ": "
                << loaded.error << "\n";
      if (!version.empty()) {
        const auto fallback = registry.load_latest();
        if (!fallback.success) {
          std::cerr << "lsconf_server: " << fallback.error << "\n";
        }
      }
    }

    if (args.verbose) {
      std::cerr << "lsconf_server: registry " << registry_dir.string() << ", schema version "
                << registry.current_version() << "\n";
    }

    lsconf::lsp::LanguageService service(registry);
    lsconf::lsp::Server server(service, std::cerr);
    return server.run(std::cin, std::cout);
  } catch (const std::exception & e) {
    std::cerr << "lsconf_server: fatal error: " << e.what() << "\n";
    return 1;
  }
}
