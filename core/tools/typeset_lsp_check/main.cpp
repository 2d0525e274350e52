// typeset_lsp_check - Run the language server's diagnostics pass from the command line
//
// Usage:
//   typeset_lsp_check [--config typeset-lsp.yaml] [--compile] file...
//
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "typeset_lsp/basic/log.hpp"
#include "typeset_lsp/config/server_config.hpp"
#include "typeset_lsp/engine/directive_engine.hpp"
#include "typeset_lsp/lsp/client.hpp"
#include "typeset_lsp/server/compiler_invocation.hpp"
#include "typeset_lsp/workspace/diagnostic_printer.hpp"
#include "typeset_lsp/workspace/file_system.hpp"
#include "typeset_lsp/workspace/workspace.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "typeset-lsp check v0.1.0\n\n"
            << "Usage: " << program_name << " [options] file...\n\n"
            << "Options:\n"
            << "  --config <path>          Configuration file (default: search upward for "
            << typeset_lsp::k_server_config_file_name << ")\n"
            << "  --compile                Run a full compilation instead of evaluation\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

/// Routes out-of-band messages to the log; diagnostics are printed by main()
class LogClient final : public typeset_lsp::lsp::Client
{
public:
  void log_message(typeset_lsp::lsp::MessageType type, std::string message) override
  {
    typeset_lsp::log::logger()->info("[{}] {}", typeset_lsp::lsp::to_string(type), message);
  }

  void publish_diagnostics(const typeset_lsp::Uri &, std::vector<typeset_lsp::Diagnostic>) override
  {
  }
};

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::vector<std::string> input_files;
  std::string config_path;
  bool compile = false;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      }
    } else if (arg == "--compile") {
      args.compile = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] != '-') {
      args.input_files.push_back(arg);
    }
  }

  if (args.input_files.empty()) {
    args.show_help = true;
  }
  return args;
}

typeset_lsp::ConfigLoadResult load_config(const CommandArgs & args)
{
  if (!args.config_path.empty()) {
    return typeset_lsp::load_server_config(args.config_path);
  }
  if (auto found = typeset_lsp::find_server_config(fs::current_path())) {
    return typeset_lsp::load_server_config(*found);
  }
  return typeset_lsp::ConfigLoadResult::ok(typeset_lsp::ServerConfig{});
}

// ============================================================================
// Command
// ============================================================================

int run_check(const CommandArgs & args)
{
  using namespace typeset_lsp;

  const auto config_result = load_config(args);
  if (!config_result.success) {
    std::cerr << "error: " << config_result.error << "\n";
    return 1;
  }
  ServerConfig config = config_result.config;
  if (args.compile) {
    config.diagnostic_pass = DiagnosticPass::Compile;
  }
  log::set_level(args.verbose ? "debug" : config.log_level);

  auto fonts = workspace::FontManager::builder().with_font_paths(config.font_paths).build();
  workspace::Workspace ws(
    std::make_shared<workspace::LocalFileSystem>(), std::move(fonts), std::make_shared<LogClient>());
  engine::DirectiveEngine engine;
  server::CompilerInvocation invocation(
    ws, engine, config.memo_max_age, config.position_encoding);

  const bool use_color = isatty(fileno(stderr)) != 0;
  workspace::DiagnosticPrinter printer(std::cerr, config.position_encoding, use_color);

  bool failed = false;
  for (const auto & input : args.input_files) {
    const fs::path input_path = fs::absolute(input).lexically_normal();
    auto id = ws.sources().register_or_lookup(Uri::from_path(input_path));
    if (!id) {
      std::cerr << "error: " << id.error().message() << "\n";
      failed = true;
      continue;
    }

    if (args.verbose) {
      std::cerr << "Checking: " << input_path.string() << "\n";
    }

    const DiagnosticsByUri diagnostics = config.diagnostic_pass == DiagnosticPass::Compile
                                           ? invocation.compile(id.value()).diagnostics
                                           : invocation.evaluate(id.value()).diagnostics;
    printer.print_all(diagnostics, ws.sources());

    if (has_errors(diagnostics)) {
      failed = true;
    } else {
      std::cout << input << ": OK\n";
    }
  }

  return failed ? 1 : 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  return run_check(args);
}
