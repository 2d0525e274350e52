// typeset_lsp/workspace/source.cpp - One editor document and its compiler view
#include "typeset_lsp/workspace/source.hpp"

#include "typeset_lsp/basic/utf8.hpp"

namespace typeset_lsp::workspace
{

Source::Source(SourceId id, Uri uri, std::string text) : uri_(std::move(uri))
{
  auto path = uri_.to_path().value_or(std::filesystem::path{});
  file_ = std::make_shared<const engine::SourceFile>(id, std::move(path), std::move(text));
}

FileResult<std::string> Source::read(const Uri & uri, FileSystem & fs)
{
  const auto path = uri.to_path();
  if (!path) {
    return FileResult<std::string>::fail(FileError::other("not a local file URI: " + uri.str()));
  }

  auto text = fs.read_to_string(*path);
  if (!text) {
    return text;
  }
  if (!utf8::is_valid(text.value())) {
    return FileResult<std::string>::fail(FileError::other("file is not valid UTF-8", *path));
  }
  return text;
}

FileResult<Source> Source::load(SourceId id, const Uri & uri, FileSystem & fs)
{
  auto text = read(uri, fs);
  if (!text) {
    return FileResult<Source>::fail(text.error());
  }
  return FileResult<Source>::ok(Source(id, uri, std::move(text).value()));
}

void Source::edit(const LspRange & range, std::string_view with, PositionEncoding encoding)
{
  const auto bytes = to_byte_range(file_->text(), file_->line_offsets(), range, encoding);
  auto next = std::make_shared<engine::SourceFile>(*file_);
  next->edit(bytes, with);
  file_ = std::move(next);
}

void Source::replace(std::string text)
{
  auto next = std::make_shared<engine::SourceFile>(*file_);
  next->replace(std::move(text));
  file_ = std::move(next);
}

}  // namespace typeset_lsp::workspace
