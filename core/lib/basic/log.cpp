// typeset_lsp/basic/log.cpp
#include "typeset_lsp/basic/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <string>

namespace typeset_lsp::log
{

std::shared_ptr<spdlog::logger> logger()
{
  static std::once_flag once;
  static std::shared_ptr<spdlog::logger> instance;
  std::call_once(once, [] {
    instance = spdlog::get(k_logger_name);
    if (!instance) {
      instance = spdlog::stderr_color_mt(k_logger_name);
      instance->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%t] %v");
    }
  });
  return instance;
}

bool set_level(std::string_view level)
{
  const auto parsed = spdlog::level::from_str(std::string(level));
  // from_str falls back to `off` for unknown names.
  if (parsed == spdlog::level::off && level != "off") {
    return false;
  }
  logger()->set_level(parsed);
  return true;
}

}  // namespace typeset_lsp::log
