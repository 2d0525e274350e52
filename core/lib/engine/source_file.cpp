// typeset_lsp/engine/source_file.cpp - Compiler-facing source file
#include "typeset_lsp/engine/source_file.hpp"

#include <algorithm>

namespace typeset_lsp::engine
{

namespace
{

constexpr uint64_t k_fnv_offset_basis = 0xcbf29ce484222325ULL;
constexpr uint64_t k_fnv_prime = 0x100000001b3ULL;

}  // namespace

uint64_t fingerprint_bytes(std::string_view bytes, uint64_t seed) noexcept
{
  uint64_t h = k_fnv_offset_basis ^ seed;
  for (const char c : bytes) {
    h ^= static_cast<unsigned char>(c);
    h *= k_fnv_prime;
  }
  return h;
}

SourceFile::SourceFile(SourceId id, std::filesystem::path path, std::string text)
: id_(id), path_(std::move(path)), text_(std::move(text))
{
  build_line_table();
  update_fingerprint();
}

SourceFile SourceFile::detached(std::string text)
{
  return SourceFile(SourceId::detached(), std::filesystem::path{}, std::move(text));
}

LineColumn SourceFile::get_line_column(uint32_t offset) const noexcept
{
  if (line_offsets_.empty()) {
    return {};
  }

  if (offset > text_.size()) {
    offset = static_cast<uint32_t>(text_.size());
  }

  auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
  if (it == line_offsets_.begin()) {
    return {1, offset + 1};
  }
  --it;

  const uint32_t line = static_cast<uint32_t>(it - line_offsets_.begin()) + 1;
  const uint32_t column = offset - *it + 1;
  return {line, column};
}

std::string_view SourceFile::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }

  const uint32_t start = line_offsets_[line_index];
  auto end = static_cast<uint32_t>(text_.size());
  if (line_index + 1 < line_offsets_.size()) {
    end = line_offsets_[line_index + 1];
    if (end > start && text_[end - 1] == '\n') {
      --end;
    }
  }
  if (end > start && text_[end - 1] == '\r') {
    --end;
  }

  return std::string_view(text_).substr(start, end - start);
}

std::string_view SourceFile::get_slice(ByteRange range) const noexcept
{
  const uint32_t start = range.start;
  uint32_t end = range.end;
  if (start >= text_.size() || end <= start) {
    return {};
  }
  if (end > text_.size()) {
    end = static_cast<uint32_t>(text_.size());
  }
  return std::string_view(text_).substr(start, end - start);
}

void SourceFile::edit(ByteRange range, std::string_view with)
{
  const auto size = static_cast<uint32_t>(text_.size());
  const uint32_t start = std::min(range.start, size);
  const uint32_t end = std::min(std::max(range.end, start), size);

  text_.replace(start, end - start, with);
  build_line_table();
  update_fingerprint();
}

void SourceFile::replace(std::string text)
{
  text_ = std::move(text);
  build_line_table();
  update_fingerprint();
}

void SourceFile::build_line_table()
{
  line_offsets_.clear();
  line_offsets_.push_back(0);

  for (size_t i = 0; i < text_.size(); ++i) {
    if (text_[i] == '\n') {
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

void SourceFile::update_fingerprint() noexcept
{
  fingerprint_ = fingerprint_bytes(text_, id_.value);
}

}  // namespace typeset_lsp::engine
