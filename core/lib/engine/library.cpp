// typeset_lsp/engine/library.cpp
#include "typeset_lsp/engine/library.hpp"

#include <iterator>

#include "typeset_lsp/engine/source_file.hpp"

namespace typeset_lsp::engine
{

Library::Library(std::vector<std::string> functions)
: functions_(std::make_move_iterator(functions.begin()), std::make_move_iterator(functions.end()))
{
  uint64_t h = 0;
  for (const auto & f : functions_) {
    h = fingerprint_bytes(f, h);
  }
  fingerprint_ = h;
}

Library Library::standard()
{
  return Library({
    "import",
    "include",
    "image",
    "font",
    "pagebreak",
    "heading",
    "emph",
    "strong",
    "link",
    "set",
  });
}

bool Library::has_function(std::string_view name) const
{
  return functions_.find(name) != functions_.end();
}

}  // namespace typeset_lsp::engine
