// typeset_lsp/config/server_config.hpp - Server configuration (typeset-lsp.yaml)
//
// Parses and validates the server configuration file. Used by the language
// server and the check tool.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "typeset_lsp/basic/position.hpp"

namespace typeset_lsp
{

// ============================================================================
// Configuration Structures
// ============================================================================

/// Which engine entry point produces diagnostics
enum class DiagnosticPass : uint8_t {
  Evaluate,
  Compile,
};

[[nodiscard]] const char * to_string(DiagnosticPass pass) noexcept;

/**
 * Complete server configuration.
 */
struct ServerConfig
{
  /// Code units used by editor positions
  PositionEncoding position_encoding = PositionEncoding::Utf16;

  DiagnosticPass diagnostic_pass = DiagnosticPass::Evaluate;

  /// Memo entries unused for more than this many passes are evicted
  uint32_t memo_max_age = 30;

  /// Threads of the blocking executor running passes
  uint32_t compile_threads = 1;

  /// Font files and directories (absolute, resolved against the config file)
  std::vector<std::filesystem::path> font_paths;

  /// trace | debug | info | warn | error | off
  std::string log_level = "info";
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ServerConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ServerConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Parse configuration text. Relative font paths are resolved against
 * `base_dir`; missing keys keep their defaults.
 */
[[nodiscard]] ConfigLoadResult parse_server_config(
  std::string_view yaml, const std::filesystem::path & base_dir);

/**
 * Load a configuration file.
 *
 * @param config_path Path to typeset-lsp.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_server_config(const std::filesystem::path & config_path);

/**
 * Find typeset-lsp.yaml by searching upward from start_dir to the root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_server_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_server_config_file_name = "typeset-lsp.yaml";

}  // namespace typeset_lsp
