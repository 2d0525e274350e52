// typeset_lsp/basic/log.hpp - Process-wide logger
//
// stdout carries the protocol, so everything is logged to stderr.
//
#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace typeset_lsp::log
{

inline constexpr const char * k_logger_name = "typeset_lsp";

/// The shared logger, created on first use
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/// Set the level from a configuration string (trace|debug|info|warn|error|off).
/// Returns false and leaves the level unchanged for unknown names.
bool set_level(std::string_view level);

}  // namespace typeset_lsp::log
