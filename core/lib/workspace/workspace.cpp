// typeset_lsp/workspace/workspace.cpp - Everything the server knows about the user's files
#include "typeset_lsp/workspace/workspace.hpp"

namespace typeset_lsp::workspace
{

Workspace::Workspace(
  std::shared_ptr<FileSystem> fs, FontManager fonts, std::shared_ptr<lsp::Client> client)
: sources_(fs),
  resources_(fs),
  fonts_(std::move(fonts)),
  library_(engine::Library::standard()),
  detached_(engine::SourceFile::detached("")),
  client_(std::move(client))
{
}

}  // namespace typeset_lsp::workspace
