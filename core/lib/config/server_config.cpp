// typeset_lsp/config/server_config.cpp - Server configuration implementation
//
#include "typeset_lsp/config/server_config.hpp"

#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

#include "typeset_lsp/basic/log.hpp"

namespace typeset_lsp
{

namespace
{

/// Parse a positive integer field, reporting `name` on failure
bool parse_positive(const YAML::Node & node, const char * name, uint32_t & out, std::string & error)
{
  const auto value = node.as<int64_t>();
  if (value <= 0 || value > UINT32_MAX) {
    error = std::string(name) + " must be a positive integer";
    return false;
  }
  out = static_cast<uint32_t>(value);
  return true;
}

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & base_dir)
{
  ServerConfig config;
  std::string error;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  if (root["position_encoding"]) {
    const auto name = root["position_encoding"].as<std::string>();
    const auto encoding = parse_position_encoding(name);
    if (!encoding) {
      return ConfigLoadResult::fail(
        "invalid position_encoding: '" + name + "' (must be 'utf-8', 'utf-16' or 'utf-32')");
    }
    config.position_encoding = *encoding;
  }

  // Parse 'diagnostics' section
  if (root["diagnostics"]) {
    const auto & diag = root["diagnostics"];
    if (diag["pass"]) {
      const auto pass = diag["pass"].as<std::string>();
      if (pass == "evaluate") {
        config.diagnostic_pass = DiagnosticPass::Evaluate;
      } else if (pass == "compile") {
        config.diagnostic_pass = DiagnosticPass::Compile;
      } else {
        return ConfigLoadResult::fail(
          "invalid diagnostics.pass: '" + pass + "' (must be 'evaluate' or 'compile')");
      }
    }
  }

  // Parse 'memo' section
  if (root["memo"] && root["memo"]["max_age"]) {
    if (!parse_positive(root["memo"]["max_age"], "memo.max_age", config.memo_max_age, error)) {
      return ConfigLoadResult::fail(error);
    }
  }

  // Parse 'executor' section
  if (root["executor"] && root["executor"]["threads"]) {
    if (!parse_positive(
          root["executor"]["threads"], "executor.threads", config.compile_threads, error)) {
      return ConfigLoadResult::fail(error);
    }
  }

  // Parse 'fonts' list
  if (root["fonts"]) {
    if (!root["fonts"].IsSequence()) {
      return ConfigLoadResult::fail("fonts must be a list");
    }
    for (const auto & entry : root["fonts"]) {
      std::filesystem::path path = entry.as<std::string>();
      if (path.is_relative()) {
        path = base_dir / path;
      }
      config.font_paths.push_back(path.lexically_normal());
    }
  }

  if (root["log_level"]) {
    config.log_level = root["log_level"].as<std::string>();
    if (spdlog::level::from_str(config.log_level) == spdlog::level::off &&
        config.log_level != "off") {
      return ConfigLoadResult::fail("invalid log_level: '" + config.log_level + "'");
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

const char * to_string(DiagnosticPass pass) noexcept
{
  switch (pass) {
    case DiagnosticPass::Evaluate:
      return "evaluate";
    case DiagnosticPass::Compile:
      return "compile";
  }
  return "evaluate";
}

ConfigLoadResult parse_server_config(std::string_view yaml, const std::filesystem::path & base_dir)
{
  try {
    return parse_root(YAML::Load(std::string(yaml)), base_dir);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_server_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  std::ifstream in(config_path);
  if (!in) {
    return ConfigLoadResult::fail("failed to open configuration file: " + config_path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  auto result = parse_server_config(buffer.str(), fs::absolute(config_path).parent_path());
  if (result.success) {
    log::logger()->debug("loaded configuration from {}", config_path.string());
  }
  return result;
}

std::optional<std::filesystem::path> find_server_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_server_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace typeset_lsp
