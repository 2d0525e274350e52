// typeset_lsp/basic/uri.hpp - Document URIs as sent by the editor
#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace typeset_lsp
{

/**
 * An editor document URI.
 *
 * Only `file:` URIs map onto the local file system; other schemes
 * (e.g. `untitled:`) are valid keys but cannot be loaded from disk.
 *
 * Local `file:` URIs are stored in the form from_path() produces, so every
 * spelling of one file (escaped `:`, lowercase hex, `localhost`, dot
 * segments) compares and hashes equal.
 */
class Uri
{
public:
  Uri() = default;
  explicit Uri(std::string text);

  /// Build a `file://` URI from an absolute local path (percent-encoding as needed)
  [[nodiscard]] static Uri from_path(const std::filesystem::path & path);

  [[nodiscard]] const std::string & str() const noexcept { return text_; }
  [[nodiscard]] bool empty() const noexcept { return text_.empty(); }
  [[nodiscard]] bool is_file() const noexcept;

  /// Decode a `file:` URI to a local path. Returns nullopt for other schemes
  /// and for `file://host/...` URIs naming a remote host.
  [[nodiscard]] std::optional<std::filesystem::path> to_path() const;

  [[nodiscard]] bool operator==(const Uri & other) const noexcept { return text_ == other.text_; }
  [[nodiscard]] bool operator!=(const Uri & other) const noexcept { return text_ != other.text_; }
  [[nodiscard]] bool operator<(const Uri & other) const noexcept { return text_ < other.text_; }

private:
  struct Canonical
  {
  };
  Uri(Canonical, std::string text) : text_(std::move(text)) {}

  std::string text_;
};

/// Percent-decode a URI component
[[nodiscard]] std::string url_decode(std::string_view s);

}  // namespace typeset_lsp

template <>
struct std::hash<typeset_lsp::Uri>
{
  size_t operator()(const typeset_lsp::Uri & uri) const noexcept
  {
    return std::hash<std::string>{}(uri.str());
  }
};
