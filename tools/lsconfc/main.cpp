// lsconfc - Logstash config intelligence command line interface
//
// Usage:
//   lsconfc versions
//   lsconfc check <file.conf> --outcome <outcome.json>
//   lsconfc complete <file.conf> --offset N
//   lsconfc context <file.conf> --offset N
//
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "lsconf/ast/json_reader.hpp"
#include "lsconf/basic/diagnostic_printer.hpp"
#include "lsconf/lsp/language_service.hpp"
#include "lsconf/project/project_config.hpp"
#include "lsconf/schema/schema_registry.hpp"
#include "lsconf/schema/schema_source.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "lsconfc v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  versions                 List schema versions in the registry\n"
            << "  check <file>             Report diagnostics for a config file\n"
            << "  complete <file>          Completion candidates at --offset\n"
            << "  context <file>           Context information at --offset\n\n"
            << "Options:\n"
            << "  --registry <dir>         Schema registry directory\n"
            << "  --version <v>            Schema version to activate\n"
            << "  --offset <n>             Byte offset of the cursor\n"
            << "  --outcome <file>         Parse outcome JSON produced by the parser\n"
            << "  --no-color               Disable coloured output\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string registry_dir;
  std::string version;
  std::string outcome_file;
  std::optional<uint64_t> offset;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

std::optional<uint64_t> parse_offset(const std::string & s)
{
  if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  try {
    return static_cast<uint64_t>(std::stoull(s));
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;

    if (arg == "--registry") {
      if (has_value) {
        args.registry_dir = argv[++i];
      }
    } else if (arg == "--version") {
      if (has_value) {
        args.version = argv[++i];
      }
    } else if (arg == "--outcome") {
      if (has_value) {
        args.outcome_file = argv[++i];
      }
    } else if (arg == "--offset") {
      if (has_value) {
        const std::string value = argv[++i];
        args.offset = parse_offset(value);
        if (!args.offset) {
          args.error = "invalid --offset value '" + value + "'";
        }
      }
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    }
  }

  return args;
}

std::optional<std::string> read_file_to_string(const fs::path & p)
{
  std::ifstream file(p, std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

// ============================================================================
// Environment
// ============================================================================

struct Environment
{
  lsconf::ProjectConfig config;
  std::unique_ptr<lsconf::SchemaRegistry> registry;
};

/// Load lsconf.yaml (if any) and activate a schema version.
std::optional<Environment> load_environment(const CommandArgs & args)
{
  Environment env;

  if (const auto config_path = lsconf::find_project_config(fs::current_path())) {
    auto config_result = lsconf::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "lsconfc: error: " << config_result.error << "\n";
      return std::nullopt;
    }
    env.config = std::move(config_result.config);
    if (args.verbose) {
      std::cerr << "lsconfc: using " << config_path->string() << "\n";
    }
  }

  const fs::path registry_dir =
    args.registry_dir.empty() ? env.config.registry_directory() : fs::path(args.registry_dir);
  if (args.verbose) {
    std::cerr << "lsconfc: registry " << registry_dir.string() << "\n";
  }

  env.registry = std::make_unique<lsconf::SchemaRegistry>(
    std::make_unique<lsconf::DirectorySchemaSource>(registry_dir));

  std::string version = args.version;
  if (version.empty() && env.config.registry.default_version) {
    version = *env.config.registry.default_version;
  }

  if (version.empty()) {
    const auto r = env.registry->load_latest();
    if (!r.success && args.verbose) {
      std::cerr << "lsconfc: " << r.error << "\n";
    }
  } else {
    const auto r = env.registry->load_version(version);
    if (!r.success) {
      std::cerr << "lsconfc: error: " << lsconf::registry_status_to_string(r.status) << ": "
                << r.error << "\n";
      return std::nullopt;
    }
  }

  if (args.verbose) {
    const auto current = env.registry->current_version();
    std::cerr << "lsconfc: schema version " << (current.empty() ? "<none>" : current) << "\n";
  }
  return env;
}

bool use_color(const CommandArgs & args, const lsconf::ProjectConfig & config)
{
  if (args.no_color) {
    return false;
  }
  switch (config.diagnostics.color) {
    case lsconf::ColorMode::Always:
      return true;
    case lsconf::ColorMode::Never:
      return false;
    case lsconf::ColorMode::Auto:
      break;
  }
  return isatty(fileno(stderr)) != 0;
}

std::optional<std::string> read_input(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "lsconfc: error: input file required\n";
    return std::nullopt;
  }
  const fs::path input_path = fs::absolute(args.input_file);
  auto text = read_file_to_string(input_path);
  if (!text) {
    std::cerr << "lsconfc: error: file not found: " << input_path.string() << "\n";
  }
  return text;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_versions(const CommandArgs & args)
{
  const auto env = load_environment(args);
  if (!env) {
    return 1;
  }

  const auto current = env->registry->current_version();
  for (const auto & v : env->registry->list_versions()) {
    std::cout << (v == current ? "* " : "  ") << v << "\n";
  }
  return 0;
}

int cmd_check(const CommandArgs & args)
{
  const auto text = read_input(args);
  if (!text) {
    return 1;
  }
  if (args.outcome_file.empty()) {
    std::cerr << "lsconfc: error: --outcome <file> required\n";
    return 1;
  }
  const auto outcome_text = read_file_to_string(args.outcome_file);
  if (!outcome_text) {
    std::cerr << "lsconfc: error: file not found: " << args.outcome_file << "\n";
    return 1;
  }
  const auto read = lsconf::ast::read_parse_outcome(std::string_view{*outcome_text});
  if (!read.success) {
    std::cerr << "lsconfc: error: " << args.outcome_file << ": " << read.error << "\n";
    return 1;
  }

  const auto env = load_environment(args);
  if (!env) {
    return 1;
  }

  if (args.verbose) {
    std::cerr << "lsconfc: checking " << args.input_file << "\n";
  }

  lsconf::lsp::LanguageService service(*env->registry);
  const lsconf::DiagnosticBag diags = service.diagnostics(*text, read.outcome);

  const lsconf::SourceManager source(fs::absolute(args.input_file), *text);
  lsconf::DiagnosticPrinter printer(std::cerr, use_color(args, env->config));
  printer.print_all(diags, source);
  if (!diags.empty()) {
    printer.print_summary(diags);
  }

  if (diags.has_errors()) {
    return 1;
  }
  std::cout << args.input_file << ": OK\n";
  return 0;
}

int cmd_complete(const CommandArgs & args)
{
  const auto text = read_input(args);
  if (!text) {
    return 1;
  }
  if (!args.offset) {
    std::cerr << "lsconfc: error: --offset <n> required\n";
    return 1;
  }
  const auto env = load_environment(args);
  if (!env) {
    return 1;
  }

  const lsconf::lsp::LanguageService service(*env->registry);
  std::cout << service.completion_json(*text, *args.offset) << "\n";
  return 0;
}

int cmd_context(const CommandArgs & args)
{
  const auto text = read_input(args);
  if (!text) {
    return 1;
  }
  if (!args.offset) {
    std::cerr << "lsconfc: error: --offset <n> required\n";
    return 1;
  }
  const auto env = load_environment(args);
  if (!env) {
    return 1;
  }

  const lsconf::lsp::LanguageService service(*env->registry);
  std::cout << service.context_info_json(*text, *args.offset) << "\n";
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.error.empty()) {
    std::cerr << "lsconfc: error: " << args.error << "\n";
    return 1;
  }

  if (args.command == "versions") {
    return cmd_versions(args);
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "complete") {
    return cmd_complete(args);
  }

  if (args.command == "context") {
    return cmd_context(args);
  }

  std::cerr << "lsconfc: error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
