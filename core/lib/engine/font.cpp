// typeset_lsp/engine/font.cpp
#include "typeset_lsp/engine/font.hpp"

#include <cctype>

namespace typeset_lsp::engine
{

namespace
{

bool iequals(std::string_view a, std::string_view b)
{
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (
      std::tolower(static_cast<unsigned char>(a[i])) !=
      std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

}  // namespace

std::optional<size_t> FontBook::select_family(std::string_view family) const
{
  for (size_t i = 0; i < infos_.size(); ++i) {
    if (iequals(infos_[i].family, family)) {
      return i;
    }
  }
  return std::nullopt;
}

}  // namespace typeset_lsp::engine
