// typeset_lsp/basic/uri.cpp - file: URI <-> path conversion
#include "typeset_lsp/basic/uri.hpp"

#include <cctype>

namespace typeset_lsp
{

namespace
{

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

int hex_to_int(char c)
{
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

bool is_unreserved_path_char(unsigned char c)
{
  return std::isalnum(c) != 0 || c == '/' || c == '-' || c == '_' || c == '.' || c == '~' ||
         c == ':';
}

}  // namespace

std::string url_decode(std::string_view s)
{
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '%' && i + 2 < s.size()) {
      const int hi = hex_to_int(s[i + 1]);
      const int lo = hex_to_int(s[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(c);
  }
  return out;
}

Uri Uri::from_path(const std::filesystem::path & path)
{
  static constexpr char k_hex[] = "0123456789ABCDEF";

  const std::string generic = path.lexically_normal().generic_string();
  std::string out = "file://";
  if (generic.empty() || generic[0] != '/') {
    out.push_back('/');
  }
  for (const char c : generic) {
    const auto uc = static_cast<unsigned char>(c);
    if (is_unreserved_path_char(uc)) {
      out.push_back(c);
    } else {
      out.push_back('%');
      out.push_back(k_hex[uc >> 4]);
      out.push_back(k_hex[uc & 0x0F]);
    }
  }
  return Uri(Canonical{}, std::move(out));
}

Uri::Uri(std::string text) : text_(std::move(text))
{
  if (const auto path = to_path()) {
    text_ = from_path(*path).text_;
  }
}

bool Uri::is_file() const noexcept { return starts_with(text_, "file:"); }

std::optional<std::filesystem::path> Uri::to_path() const
{
  // Accepted forms:
  //   file:///home/user/a.typ
  //   file://localhost/home/user/a.typ
  //   file:/home/user/a.typ
  if (!is_file()) {
    return std::nullopt;
  }

  std::string_view rest = std::string_view(text_).substr(std::string_view("file:").size());
  if (starts_with(rest, "///")) {
    rest = rest.substr(2);
  } else if (starts_with(rest, "//localhost/")) {
    rest = rest.substr(std::string_view("//localhost").size());
  } else if (starts_with(rest, "//")) {
    return std::nullopt;
  }

  if (rest.empty() || rest[0] != '/') {
    return std::nullopt;
  }

  const auto query = rest.find_first_of("?#");
  if (query != std::string_view::npos) {
    rest = rest.substr(0, query);
  }

  return std::filesystem::path(url_decode(rest)).lexically_normal();
}

}  // namespace typeset_lsp
